#include <layersync/python/nb_base.h>
#include <layersync/runtime/observers/sync_trace.h>
#include <layersync/scene/scene_synchronizer.h>

void export_sync(nb::module_ &m) {
    using namespace layersync;

    nb::enum_<LayerSyncState>(m, "LayerSyncState")
            .value("UNMAPPED", LayerSyncState::UNMAPPED)
            .value("PENDING_RETRY", LayerSyncState::PENDING_RETRY)
            .value("MAPPED", LayerSyncState::MAPPED);

    nb::class_<SyncLifeCycleObserver>(m, "SyncLifeCycleObserver");

    nb::class_<SyncTrace, SyncLifeCycleObserver>(m, "SyncTrace")
            .def(nb::init<const std::optional<std::string> &, bool, bool, bool, bool>(), "filter"_a = nb::none(),
                 "structure"_a = true, "retry"_a = true, "order"_a = true, "group"_a = true)
            .def_prop_ro("line_count", &SyncTrace::line_count)
            .def_static("set_use_stderr", &SyncTrace::set_use_stderr, "value"_a);

    nb::class_<SynchronizerOptions>(m, "SynchronizerOptions")
            .def(nb::init<>())
            .def_rw("default_z_index", &SynchronizerOptions::default_z_index)
            .def_rw("verify_invariants", &SynchronizerOptions::verify_invariants)
            .def_rw("observers", &SynchronizerOptions::observers);

    nb::class_<AbstractSynchronizer, ComponentLifeCycle>(m, "AbstractSynchronizer")
            .def("synchronize", &AbstractSynchronizer::synchronize)
            .def("destroy_all", &AbstractSynchronizer::destroy_all)
            .def_prop_ro("root", &AbstractSynchronizer::root)
            .def("is_mapped", &AbstractSynchronizer::is_mapped, "layer_id"_a)
            .def("layer_state", &AbstractSynchronizer::layer_state, "layer_id"_a)
            .def_prop_ro("mapped_layer_count", &AbstractSynchronizer::mapped_layer_count)
            .def_prop_ro("mapped_layer_ids", &AbstractSynchronizer::mapped_layer_ids)
            .def_prop_ro("pending_retry_count", &AbstractSynchronizer::pending_retry_count)
            .def("layer_listener_count", &AbstractSynchronizer::layer_listener_count, "layer_id"_a)
            .def("group_listener_count", &AbstractSynchronizer::group_listener_count, "layer_id"_a)
            .def("check_invariants", &AbstractSynchronizer::check_invariants)
            .def("add_life_cycle_observer", &AbstractSynchronizer::add_life_cycle_observer, "observer"_a)
            .def("remove_life_cycle_observer", &AbstractSynchronizer::remove_life_cycle_observer, "observer"_a);
}
