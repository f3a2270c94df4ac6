#ifndef LAYERSYNC_LAYER_WITH_PARENTS_H
#define LAYERSYNC_LAYER_WITH_PARENTS_H

#include <layersync/types/layer.h>

#include <optional>
#include <vector>

namespace layersync {
    /**
     * A layer together with its ancestor groups, nearest first. The root of the synchronized tree is never part
     * of the parents, so the children of the root have no parents.
     */
    struct LAYERSYNC_EXPORT LayerWithParents {
        base_layer_s_ptr layer;
        std::vector<layer_group_s_ptr> parents;

        /**
         * The ancestry to hand to the children of this layer (this layer followed by its own parents).
         */
        [[nodiscard]] std::vector<layer_group_s_ptr> ancestry_for_children() const;

        // Visible only when the layer and every parent are visible.
        [[nodiscard]] bool effective_visible() const;

        // Own opacity multiplied by the opacity of every parent.
        [[nodiscard]] double effective_opacity() const;

        // Own z-index, otherwise the z-index of the nearest parent that has one.
        [[nodiscard]] std::optional<std::int32_t> effective_z_index() const;
    };
} // namespace layersync

#endif // LAYERSYNC_LAYER_WITH_PARENTS_H
