#include <layersync/python/nb_base.h>
#include <layersync/types/layer.h>
#include <layersync/types/layer_with_parents.h>

void export_types(nb::module_ &m) {
    using namespace layersync;

    nb::enum_<LayerEventType>(m, "LayerEventType")
            .value("CHANGE", LayerEventType::CHANGE)
            .value("CHANGE_Z_INDEX", LayerEventType::CHANGE_Z_INDEX)
            .value("CHANGE_VISIBLE", LayerEventType::CHANGE_VISIBLE)
            .value("CHANGE_OPACITY", LayerEventType::CHANGE_OPACITY)
            .value("CHANGE_LAYERS", LayerEventType::CHANGE_LAYERS)
            .value("ADD", LayerEventType::ADD)
            .value("REMOVE", LayerEventType::REMOVE);

    nb::class_<Observable>(m, "Observable")
            .def("listener_count", nb::overload_cast<>(&Observable::listener_count, nb::const_))
            .def("listener_count", nb::overload_cast<LayerEventType>(&Observable::listener_count, nb::const_), "type"_a);

    nb::class_<BaseLayer, Observable>(m, "BaseLayer")
            .def_prop_ro("id", &BaseLayer::id)
            .def_prop_ro("is_group", &BaseLayer::is_group)
            .def_prop_rw("label", &BaseLayer::label, &BaseLayer::set_label)
            .def_prop_ro("display_name", &BaseLayer::display_name)
            .def_prop_rw("z_index", &BaseLayer::z_index, &BaseLayer::set_z_index)
            .def_prop_rw("visible", &BaseLayer::visible, &BaseLayer::set_visible)
            .def_prop_rw("opacity", &BaseLayer::opacity, &BaseLayer::set_opacity)
            .def_prop_ro("revision", &BaseLayer::revision)
            .def("changed", &BaseLayer::changed);

    nb::class_<Layer, BaseLayer>(m, "Layer")
            .def(nb::init<std::optional<std::string>, std::optional<std::string>>(), "label"_a = nb::none(),
                 "source"_a = nb::none())
            .def_prop_rw("source", &Layer::source, &Layer::set_source);

    nb::class_<LayerCollection, Observable>(m, "LayerCollection")
            .def(nb::init<>())
            .def("push_back", &LayerCollection::push_back, "layer"_a)
            .def("insert_at", &LayerCollection::insert_at, "index"_a, "layer"_a)
            .def("remove", &LayerCollection::remove, "layer"_a)
            .def("remove_at", &LayerCollection::remove_at, "index"_a)
            .def("set_at", &LayerCollection::set_at, "index"_a, "layer"_a)
            .def("clear", &LayerCollection::clear)
            .def("__contains__", &LayerCollection::contains, "layer"_a)
            .def("__getitem__", &LayerCollection::at, "index"_a)
            .def("__len__", &LayerCollection::size)
            .def_prop_ro("layers", &LayerCollection::layers);

    nb::class_<LayerGroup, BaseLayer>(m, "LayerGroup")
            .def(nb::init<std::optional<std::string>>(), "label"_a = nb::none())
            .def_prop_rw("layers", &LayerGroup::layers, &LayerGroup::set_layers);

    nb::class_<LayerWithParents>(m, "LayerWithParents")
            .def_ro("layer", &LayerWithParents::layer)
            .def_ro("parents", &LayerWithParents::parents)
            .def_prop_ro("effective_visible", &LayerWithParents::effective_visible)
            .def_prop_ro("effective_opacity", &LayerWithParents::effective_opacity)
            .def_prop_ro("effective_z_index", &LayerWithParents::effective_z_index);
}
