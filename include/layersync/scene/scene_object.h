#ifndef LAYERSYNC_SCENE_OBJECT_H
#define LAYERSYNC_SCENE_OBJECT_H

#include <layersync/sync/counterpart.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace layersync {
    enum class SceneObjectKind : std::uint8_t {
        LAYER = 0,      // Drawn from the source of a single layer.
        COMPOSITE = 1,  // Drawn from the sources of every child of a group.
    };

    [[nodiscard]] LAYERSYNC_EXPORT std::string_view to_string(SceneObjectKind kind);

    /**
     * @brief Object held by a SceneCollection, the scene backend's counterpart of a layer.
     *
     * Opacity and visibility are resolved against the layer's ancestry, the synchronizer refreshes them through
     * SceneCollection::update_properties when the layer or one of its parents changes.
     */
    struct LAYERSYNC_EXPORT SceneObject final : Counterpart {
        using ptr = SceneObject *;
        using s_ptr = std::shared_ptr<SceneObject>;

        SceneObject(SceneObjectKind kind, layer_id_t layer_id, std::string name, std::vector<std::string> sources,
                    double opacity, bool visible);

        [[nodiscard]] SceneObjectKind kind() const { return _kind; }

        [[nodiscard]] layer_id_t layer_id() const { return _layer_id; }

        [[nodiscard]] const std::string &name() const { return _name; }

        [[nodiscard]] const std::vector<std::string> &sources() const { return _sources; }

        [[nodiscard]] double opacity() const { return _opacity; }

        [[nodiscard]] bool visible() const { return _visible; }

        [[nodiscard]] bool is_destroyed() const { return _destroyed; }

    private:
        friend class SceneCollection;

        SceneObjectKind _kind;
        layer_id_t _layer_id;
        std::string _name;
        std::vector<std::string> _sources;
        double _opacity;
        bool _visible;
        bool _destroyed{false};
    };
} // namespace layersync

#endif // LAYERSYNC_SCENE_OBJECT_H
