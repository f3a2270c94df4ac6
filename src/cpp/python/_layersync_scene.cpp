#include <layersync/python/nb_base.h>
#include <layersync/scene/scene_synchronizer.h>

void export_scene(nb::module_ &m) {
    using namespace layersync;

    nb::enum_<SceneObjectKind>(m, "SceneObjectKind")
            .value("LAYER", SceneObjectKind::LAYER)
            .value("COMPOSITE", SceneObjectKind::COMPOSITE);

    nb::class_<Counterpart>(m, "Counterpart");

    nb::class_<SceneObject, Counterpart>(m, "SceneObject")
            .def_prop_ro("kind", &SceneObject::kind)
            .def_prop_ro("layer_id", &SceneObject::layer_id)
            .def_prop_ro("name", &SceneObject::name)
            .def_prop_ro("sources", &SceneObject::sources)
            .def_prop_ro("opacity", &SceneObject::opacity)
            .def_prop_ro("visible", &SceneObject::visible)
            .def_prop_ro("is_destroyed", &SceneObject::is_destroyed);

    nb::class_<SceneCollection>(m, "SceneCollection")
            .def(nb::init<>())
            .def_prop_ro("objects", &SceneCollection::objects)
            .def_prop_ro("destroy_count", &SceneCollection::destroy_count)
            .def("index_of", &SceneCollection::index_of, "object"_a)
            .def("__contains__", &SceneCollection::contains, "object"_a)
            .def("__len__", &SceneCollection::size);

    nb::class_<SceneSynchronizer, AbstractSynchronizer>(m, "SceneSynchronizer")
            .def(nb::init<layer_group_s_ptr, SceneCollection::s_ptr, bool, SynchronizerOptions>(), "root"_a, "scene"_a,
                 "composite_groups"_a = false, "options"_a = SynchronizerOptions{})
            .def_prop_ro("scene", &SceneSynchronizer::scene)
            .def_prop_ro("composite_groups", &SceneSynchronizer::composite_groups);
}
