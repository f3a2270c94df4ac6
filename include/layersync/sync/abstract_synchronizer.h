#ifndef LAYERSYNC_ABSTRACT_SYNCHRONIZER_H
#define LAYERSYNC_ABSTRACT_SYNCHRONIZER_H

#include <layersync/sync/counterpart.h>
#include <layersync/sync/synchronizer_options.h>
#include <layersync/types/layer_with_parents.h>
#include <layersync/util/lifecycle.h>

#include <cstdint>
#include <string_view>
#include <vector>

namespace layersync {
    /**
     * Per layer synchronization state.
     *
     * UNMAPPED      - nothing is held for the layer.
     * PENDING_RETRY - creation failed, the layer is watched for CHANGE and creation is attempted again on each one.
     * MAPPED        - the layer has live counterparts. A leaf is watched for CHANGE_Z_INDEX, the layer and each of
     *                 its parents for CHANGE_OPACITY and CHANGE_VISIBLE.
     */
    enum class LayerSyncState : std::uint8_t { UNMAPPED = 0, PENDING_RETRY = 1, MAPPED = 2 };

    [[nodiscard]] LAYERSYNC_EXPORT std::string_view to_string(LayerSyncState state);

    /**
     * @brief Mirrors a source layer tree into a renderer's object collection.
     *
     * The synchronizer walks the tree from the root, asks the backend for the counterparts of every layer and keeps
     * them up to date as the tree emits structural events. A group that produces counterparts of its own stands for
     * its whole subtree, its children are never mapped individually. A group that produces nothing is transparent,
     * its children are mapped one by one.
     *
     * Backends derive from this type and implement the creation and collection primitives. The synchronizer owns
     * the bookkeeping: the layer map, the per-layer listener registry and the per-group listener registry.
     *
     * Life-cycle: start_component synchronizes, stop_component calls destroy_all. The destructor only releases
     * subscriptions on the source tree (it cannot reach the backend any more), a backend that owns renderer
     * resources must call destroy_all from its own destructor.
     */
    struct LAYERSYNC_EXPORT AbstractSynchronizer : ComponentLifeCycle, protected LayerEventListener {
        using ptr = AbstractSynchronizer *;

        explicit AbstractSynchronizer(layer_group_s_ptr root, SynchronizerOptions options = {});

        ~AbstractSynchronizer() override;

        AbstractSynchronizer(const AbstractSynchronizer &) = delete;

        AbstractSynchronizer &operator=(const AbstractSynchronizer &) = delete;

        /**
         * Destroy everything and rebuild the mapping from the current shape of the tree.
         */
        void synchronize();

        /**
         * Remove and destroy every counterpart, release every subscription (the root's included) and empty all
         * registries. Safe to call when nothing is held.
         */
        void destroy_all();

        [[nodiscard]] const layer_group_s_ptr &root() const { return _root; }

        [[nodiscard]] const SynchronizerOptions &options() const { return _options; }

        [[nodiscard]] bool is_mapped(layer_id_t id) const;

        [[nodiscard]] LayerSyncState layer_state(layer_id_t id) const;

        /**
         * The counterparts of a mapped layer, nullptr when the layer is not mapped.
         */
        [[nodiscard]] const counterpart_list *counterparts(layer_id_t id) const;

        [[nodiscard]] std::size_t mapped_layer_count() const { return _layer_map.size(); }

        [[nodiscard]] std::vector<layer_id_t> mapped_layer_ids() const;

        [[nodiscard]] std::size_t layer_listener_count(layer_id_t id) const;

        [[nodiscard]] std::size_t group_listener_count(layer_id_t id) const;

        [[nodiscard]] std::size_t layer_registry_size() const { return _layer_listen_keys.size(); }

        [[nodiscard]] std::size_t group_registry_size() const { return _group_listen_keys.size(); }

        [[nodiscard]] std::size_t pending_retry_count() const;

        /**
         * Every live counterpart in paint order: stable-sorted by effective z-index, ties keep the pre-order
         * position of the owning layer in the tree.
         */
        [[nodiscard]] counterpart_list compute_counterpart_order() const;

        /**
         * Throws SyncInvariantError when the registries disagree with each other or with the tree.
         */
        void check_invariants() const;

        void add_life_cycle_observer(SyncLifeCycleObserver::s_ptr observer);

        void remove_life_cycle_observer(const SyncLifeCycleObserver::s_ptr &observer);

    protected:
        /**
         * The ordering pass, hands compute_counterpart_order to the backend.
         */
        void order_layers();

        /**
         * Attempt to produce the counterparts of a layer. Called again for a layer that previously failed whenever
         * it emits CHANGE. Return std::nullopt (or an empty list) when the layer cannot be represented yet, never
         * throw for that case.
         */
        virtual counterparts_result create_single_layer_counterparts(const LayerWithParents &layer_with_parents) = 0;

        virtual void add_counterpart(const counterpart_s_ptr &counterpart) = 0;

        virtual void remove_single_counterpart(const counterpart_s_ptr &counterpart, bool destroy) = 0;

        virtual void destroy_counterpart(const counterpart_s_ptr &counterpart) = 0;

        virtual void remove_all_counterparts(bool destroy) = 0;

        virtual void apply_counterpart_order(const counterpart_list &ordered) = 0;

        /**
         * Called when the opacity or visibility of a mapped layer, or of one of its parents, changed. The backend
         * refreshes the counterparts from the effective values of layer_with_parents.
         */
        virtual void update_counterpart_properties(const LayerWithParents &layer_with_parents,
                                                   const counterpart_list &counterparts) = 0;

        void initialise() override;

        void start() override;

        void stop() override;

        void dispose() override;

        void on_layer_event(const LayerEvent &event, layer_id_t context) override;

    private:
        struct LayerListeners {
            LayerSyncState state;
            LayerWithParents target;
            listen_key_list keys;
        };

        struct GroupListeners {
            layer_group_s_ptr group;
            // Ancestry handed to children added later, empty for the root.
            std::vector<layer_group_s_ptr> child_parents;
            ListenKey layers_key;
            // Children inherit the group's z-index, empty for the root.
            ListenKey z_index_key;
            // Only these are re-subscribed when the collection is replaced.
            listen_key_list content_keys;
        };

        void add_layers(LayerWithParents seed);

        void add_counterparts(counterpart_list counterparts, const LayerWithParents &target);

        void add_to_backend(const counterpart_list &counterparts);

        void register_mapped(counterpart_list counterparts, const LayerWithParents &target);

        void refresh_counterpart_properties(layer_id_t id);

        void schedule_retry(const LayerWithParents &target);

        void retry_layer(layer_id_t id);

        void release_layer_listeners(layer_id_t id);

        bool remove_and_destroy_single_layer(const BaseLayer &layer);

        void unlisten_single_group(const LayerGroup &group);

        void remove_layer(const base_layer_s_ptr &root);

        void listen_for_group_changes(const LayerWithParents &group);

        void listen_add_remove(GroupListeners &listeners);

        void relisten_group_content(layer_id_t group_id);

        void add_child_layer(layer_id_t group_id, const base_layer_s_ptr &layer);

        void remove_child_layer(layer_id_t group_id, const base_layer_s_ptr &layer);

        bool rebuild_if_group_mapped(layer_id_t group_id);

        void unlisten_all();

        template<typename Fn>
        void notify_observers(Fn &&fn) const;

        layer_group_s_ptr _root;
        SynchronizerOptions _options;
        layer_id_map<counterpart_list> _layer_map;
        layer_id_map<LayerListeners> _layer_listen_keys;
        layer_id_map<GroupListeners> _group_listen_keys;
    };
} // namespace layersync

#endif // LAYERSYNC_ABSTRACT_SYNCHRONIZER_H
