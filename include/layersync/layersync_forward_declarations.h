#ifndef LAYERSYNC_FORWARD_DECLARATIONS_H
#define LAYERSYNC_FORWARD_DECLARATIONS_H

#include <cstdint>
#include <memory>
#include <vector>

namespace layersync {
    using layer_id_t = std::uint64_t;

    // Used as the subscription context when a listener is not bound to a particular layer.
    inline constexpr layer_id_t NO_LAYER_ID = 0;

    struct LayerEvent;
    struct LayerEventListener;
    class Observable;
    struct ListenKey;

    struct BaseLayer;
    using base_layer_ptr = BaseLayer *;
    using base_layer_s_ptr = std::shared_ptr<BaseLayer>;

    struct Layer;
    using layer_ptr = Layer *;
    using layer_s_ptr = std::shared_ptr<Layer>;

    struct LayerGroup;
    using layer_group_ptr = LayerGroup *;
    using layer_group_s_ptr = std::shared_ptr<LayerGroup>;

    class LayerCollection;
    using layer_collection_ptr = LayerCollection *;
    using layer_collection_s_ptr = std::shared_ptr<LayerCollection>;

    struct LayerWithParents;

    struct Counterpart;
    using counterpart_s_ptr = std::shared_ptr<Counterpart>;
    using counterpart_list = std::vector<counterpart_s_ptr>;

    struct AbstractSynchronizer;
    struct SynchronizerOptions;

    struct SyncLifeCycleObserver;
    using sync_observer_s_ptr = std::shared_ptr<SyncLifeCycleObserver>;

    struct SceneObject;
    class SceneCollection;
    struct SceneSynchronizer;
} // namespace layersync

#endif // LAYERSYNC_FORWARD_DECLARATIONS_H
