/*
 * The core imports for layersync. Include this first so the export macros, forward declarations and the
 * formatting library are always seen in the same order.
 */

#ifndef LAYERSYNC_BASE_H
#define LAYERSYNC_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <ankerl/unordered_dense.h>

#include <layersync/layersync_export.h>
#include <layersync/layersync_forward_declarations.h>

namespace layersync {
    /**
     * Registries keyed by layer id. The dense map keeps iteration cheap for the full sweeps done by
     * destroy_all and check_invariants.
     */
    template<typename V>
    using layer_id_map = ankerl::unordered_dense::map<layer_id_t, V>;

    using layer_id_set = ankerl::unordered_dense::set<layer_id_t>;
} // namespace layersync

#endif // LAYERSYNC_BASE_H
