#ifndef LAYERSYNC_SCENE_SYNCHRONIZER_H
#define LAYERSYNC_SCENE_SYNCHRONIZER_H

#include <layersync/scene/scene_collection.h>
#include <layersync/sync/abstract_synchronizer.h>

namespace layersync {
    /**
     * @brief Synchronizes a layer tree into a SceneCollection.
     *
     * A layer with a source becomes one LAYER object. With composite_groups set, a group whose children are all
     * layers with a source becomes one COMPOSITE object and stands for the whole group.
     */
    struct LAYERSYNC_EXPORT SceneSynchronizer final : AbstractSynchronizer {
        using ptr = SceneSynchronizer *;

        SceneSynchronizer(layer_group_s_ptr root, SceneCollection::s_ptr scene, bool composite_groups = false,
                          SynchronizerOptions options = {});

        ~SceneSynchronizer() override;

        [[nodiscard]] const SceneCollection::s_ptr &scene() const { return _scene; }

        [[nodiscard]] bool composite_groups() const { return _composite_groups; }

    protected:
        counterparts_result create_single_layer_counterparts(const LayerWithParents &layer_with_parents) override;

        void add_counterpart(const counterpart_s_ptr &counterpart) override;

        void remove_single_counterpart(const counterpart_s_ptr &counterpart, bool destroy) override;

        void destroy_counterpart(const counterpart_s_ptr &counterpart) override;

        void remove_all_counterparts(bool destroy) override;

        void apply_counterpart_order(const counterpart_list &ordered) override;

        void update_counterpart_properties(const LayerWithParents &layer_with_parents,
                                           const counterpart_list &counterparts) override;

    private:
        counterparts_result create_composite(const LayerWithParents &group_with_parents) const;

        static SceneObject::s_ptr as_scene_object(const counterpart_s_ptr &counterpart);

        SceneCollection::s_ptr _scene;
        bool _composite_groups;
    };
} // namespace layersync

#endif // LAYERSYNC_SCENE_SYNCHRONIZER_H
