#ifndef LAYERSYNC_SYNC_LIFE_CYCLE_OBSERVER_H
#define LAYERSYNC_SYNC_LIFE_CYCLE_OBSERVER_H

#include <layersync/layersync_base.h>

#include <cstddef>

namespace layersync {
    /**
     * Hooks called by the synchronizer as it maps and unmaps layers. All hooks default to no-op, override the
     * ones of interest. Observers must not mutate the source tree from a hook.
     */
    struct SyncLifeCycleObserver {
        using ptr = SyncLifeCycleObserver *;
        using s_ptr = std::shared_ptr<SyncLifeCycleObserver>;

        virtual ~SyncLifeCycleObserver() = default;

        virtual void on_before_synchronize(const AbstractSynchronizer &) {
        }

        virtual void on_after_synchronize(const AbstractSynchronizer &) {
        }

        virtual void on_destroy_all(const AbstractSynchronizer &) {
        }

        virtual void on_layer_mapped(const BaseLayer &, std::size_t /*counterpart_count*/) {
        }

        virtual void on_layer_unmapped(const BaseLayer &, std::size_t /*counterpart_count*/) {
        }

        virtual void on_retry_scheduled(const BaseLayer &) {
        }

        virtual void on_retry_failed(const BaseLayer &) {
        }

        virtual void on_group_listened(const LayerGroup &) {
        }

        virtual void on_group_unlistened(const LayerGroup &) {
        }

        virtual void on_layers_ordered(std::size_t /*counterpart_count*/) {
        }
    };
} // namespace layersync

#endif // LAYERSYNC_SYNC_LIFE_CYCLE_OBSERVER_H
