#ifndef LAYERSYNC_COUNTERPART_H
#define LAYERSYNC_COUNTERPART_H

#include <layersync/layersync_base.h>

#include <optional>

namespace layersync {
    /**
     * Base of every renderer object produced for a source layer. Backends derive their native object (or a thin
     * handle to it) from this type.
     */
    struct LAYERSYNC_EXPORT Counterpart {
        using ptr = Counterpart *;
        using s_ptr = std::shared_ptr<Counterpart>;

        virtual ~Counterpart() = default;
    };

    /**
     * Result of a creation attempt. std::nullopt means the layer cannot be represented yet.
     */
    using counterparts_result = std::optional<counterpart_list>;
} // namespace layersync

#endif // LAYERSYNC_COUNTERPART_H
