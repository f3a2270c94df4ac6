/*
 * The entry point into the python _layersync module exposing the source tree, the scene backend and the
 * synchronizer to python.
 */
#include <layersync/python/nb_base.h>
#include <layersync/util/errors.h>

void export_utils(nb::module_ &);

void export_types(nb::module_ &);

void export_sync(nb::module_ &);

void export_scene(nb::module_ &);

NB_MODULE(_layersync, m) {
    m.doc() = "Mirrors a layer tree into a renderer object collection";

    nb::exception<layersync::SyncInvariantError>(m, "SyncInvariantError", PyExc_RuntimeError);
    nb::exception<layersync::SceneError>(m, "SceneError", PyExc_RuntimeError);

    export_utils(m);
    export_types(m);
    export_sync(m);
    export_scene(m);
}
