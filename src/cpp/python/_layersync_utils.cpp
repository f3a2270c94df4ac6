#include <layersync/python/nb_base.h>
#include <layersync/util/lifecycle.h>

void export_utils(nb::module_ &m) {
    using namespace layersync;

    nb::class_<ComponentLifeCycle>(m, "ComponentLifeCycle")
            .def_prop_ro("is_initialised", &ComponentLifeCycle::is_initialised)
            .def_prop_ro("is_started", &ComponentLifeCycle::is_started)
            .def_prop_ro("is_starting", &ComponentLifeCycle::is_starting)
            .def_prop_ro("is_stopping", &ComponentLifeCycle::is_stopping)
            .def("initialise", &initialise_component)
            .def("start", &start_component)
            .def("stop", &stop_component)
            .def("dispose", &dispose_component);

    m.def("initialise_component", &initialise_component, "component"_a);
    m.def("start_component", &start_component, "component"_a);
    m.def("stop_component", &stop_component, "component"_a);
    m.def("dispose_component", &dispose_component, "component"_a);
}
