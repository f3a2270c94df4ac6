#ifndef LAYERSYNC_SYNCHRONIZER_OPTIONS_H
#define LAYERSYNC_SYNCHRONIZER_OPTIONS_H

#include <layersync/runtime/observers/sync_life_cycle_observer.h>

#include <cstdint>
#include <vector>

namespace layersync {
    struct SynchronizerOptions {
        // Order key of layers when neither the layer nor any of its parents has a z-index.
        std::int32_t default_z_index{0};

        // Run check_invariants after every synchronize and every handled event. Expensive, meant for debugging.
        bool verify_invariants{false};

        std::vector<SyncLifeCycleObserver::s_ptr> observers{};
    };
} // namespace layersync

#endif // LAYERSYNC_SYNCHRONIZER_OPTIONS_H
