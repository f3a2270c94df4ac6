/*
 * Imports for the nanobind bindings. Only the python module includes this, the core library never depends on
 * nanobind.
 */

#ifndef LAYERSYNC_NB_BASE_H
#define LAYERSYNC_NB_BASE_H

#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>

#include <layersync/layersync_base.h>

namespace nb = nanobind;
using namespace nb::literals;

#endif // LAYERSYNC_NB_BASE_H
