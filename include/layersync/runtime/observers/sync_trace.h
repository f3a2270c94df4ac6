#pragma once

#include <layersync/runtime/observers/sync_life_cycle_observer.h>

#include <optional>
#include <string>

namespace layersync {

    /**
     * @brief Logs out the steps taken by a synchronizer.
     *
     * This is voluminous but helpful when tracking down a layer that never shows up, shows up twice, or ends up
     * in the wrong stacking order. Each line is prefixed with a per-trace sequence number.
     */
    class LAYERSYNC_EXPORT SyncTrace : public SyncLifeCycleObserver {
    public:
        /**
         * @brief Construct a new Sync Trace object
         *
         * @param filter Used to restrict which layer events are reported (substring match on the layer name)
         * @param structure Log synchronize, destroy-all, map and unmap events
         * @param retry Log retry related events
         * @param order Log ordering passes
         * @param group Log group subscription events
         */
        explicit SyncTrace(const std::optional<std::string> &filter = std::nullopt,
                           bool structure = true, bool retry = true, bool order = true, bool group = true);

        void on_before_synchronize(const AbstractSynchronizer &synchronizer) override;
        void on_after_synchronize(const AbstractSynchronizer &synchronizer) override;
        void on_destroy_all(const AbstractSynchronizer &synchronizer) override;
        void on_layer_mapped(const BaseLayer &layer, std::size_t counterpart_count) override;
        void on_layer_unmapped(const BaseLayer &layer, std::size_t counterpart_count) override;
        void on_retry_scheduled(const BaseLayer &layer) override;
        void on_retry_failed(const BaseLayer &layer) override;
        void on_group_listened(const LayerGroup &group) override;
        void on_group_unlistened(const LayerGroup &group) override;
        void on_layers_ordered(std::size_t counterpart_count) override;

        // Static configuration
        static void set_use_stderr(bool value);

        [[nodiscard]] std::size_t line_count() const { return _sequence; }

    private:
        std::optional<std::string> _filter;
        bool _structure;
        bool _retry;
        bool _order;
        bool _group;
        std::size_t _sequence{0};

        static bool _use_stderr;

        void _print(const std::string &msg);
        void _print_layer(const BaseLayer &layer, const std::string &msg);
        [[nodiscard]] std::string _layer_name(const BaseLayer &layer) const;
        [[nodiscard]] bool _should_log_layer(const BaseLayer &layer) const;
    };

} // namespace layersync
