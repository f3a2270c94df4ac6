#include <layersync/scene/scene_synchronizer.h>
#include <layersync/util/errors.h>

#include <cstdio>

namespace layersync {
    SceneSynchronizer::SceneSynchronizer(layer_group_s_ptr root, SceneCollection::s_ptr scene, bool composite_groups,
                                         SynchronizerOptions options)
        : AbstractSynchronizer{std::move(root), std::move(options)}, _scene{std::move(scene)},
          _composite_groups{composite_groups} {
        if (_scene == nullptr) { throw_error<std::invalid_argument>("A scene synchronizer requires a scene collection"); }
    }

    SceneSynchronizer::~SceneSynchronizer() {
        try {
            destroy_all();
        } catch (const std::exception &e) {
            std::fprintf(stderr, "Warning: exception while tearing down scene synchronizer: %s\n", e.what());
        }
    }

    counterparts_result SceneSynchronizer::create_single_layer_counterparts(const LayerWithParents &layer_with_parents) {
        const auto &layer{*layer_with_parents.layer};
        if (layer.is_group()) { return _composite_groups ? create_composite(layer_with_parents) : std::nullopt; }

        const auto &source{static_cast<const Layer &>(layer).source()};
        if (!source.has_value()) { return std::nullopt; }
        return counterpart_list{std::make_shared<SceneObject>(
            SceneObjectKind::LAYER, layer.id(), layer.display_name(), std::vector<std::string>{*source},
            layer_with_parents.effective_opacity(), layer_with_parents.effective_visible())};
    }

    counterparts_result SceneSynchronizer::create_composite(const LayerWithParents &group_with_parents) const {
        const auto &group{static_cast<const LayerGroup &>(*group_with_parents.layer)};
        const auto &children{*group.layers()};
        if (children.empty()) { return std::nullopt; }

        std::vector<std::string> sources;
        sources.reserve(children.size());
        for (const auto &child : children) {
            if (child->is_group()) { return std::nullopt; }
            const auto &source{static_cast<const Layer &>(*child).source()};
            if (!source.has_value()) { return std::nullopt; }
            sources.push_back(*source);
        }
        return counterpart_list{std::make_shared<SceneObject>(
            SceneObjectKind::COMPOSITE, group.id(), group.display_name(), std::move(sources),
            group_with_parents.effective_opacity(), group_with_parents.effective_visible())};
    }

    void SceneSynchronizer::add_counterpart(const counterpart_s_ptr &counterpart) { _scene->add(as_scene_object(counterpart)); }

    void SceneSynchronizer::remove_single_counterpart(const counterpart_s_ptr &counterpart, bool destroy) {
        _scene->remove(as_scene_object(counterpart), destroy);
    }

    void SceneSynchronizer::destroy_counterpart(const counterpart_s_ptr &counterpart) {
        _scene->destroy(as_scene_object(counterpart));
    }

    void SceneSynchronizer::remove_all_counterparts(bool destroy) { _scene->remove_all(destroy); }

    void SceneSynchronizer::apply_counterpart_order(const counterpart_list &ordered) {
        std::vector<SceneObject::s_ptr> objects;
        objects.reserve(ordered.size());
        for (const auto &counterpart : ordered) { objects.push_back(as_scene_object(counterpart)); }
        _scene->reorder(objects);
    }

    void SceneSynchronizer::update_counterpart_properties(const LayerWithParents &layer_with_parents,
                                                          const counterpart_list &counterparts) {
        const auto opacity{layer_with_parents.effective_opacity()};
        const auto visible{layer_with_parents.effective_visible()};
        for (const auto &counterpart : counterparts) { _scene->update_properties(as_scene_object(counterpart), opacity, visible); }
    }

    SceneObject::s_ptr SceneSynchronizer::as_scene_object(const counterpart_s_ptr &counterpart) {
        auto object{std::dynamic_pointer_cast<SceneObject>(counterpart)};
        if (object == nullptr) { throw_error<SceneError>("Counterpart is not a scene object"); }
        return object;
    }
} // namespace layersync
