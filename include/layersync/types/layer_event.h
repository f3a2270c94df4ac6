#ifndef LAYERSYNC_LAYER_EVENT_H
#define LAYERSYNC_LAYER_EVENT_H

#include <layersync/layersync_base.h>

#include <cstdint>
#include <string_view>

namespace layersync {
    /**
     * The notifications emitted by the source tree.
     *
     * CHANGE is the generic "something about this layer changed" notification (a source was set, data
     * arrived), the property specific types are only emitted for their own property.
     */
    enum class LayerEventType : std::uint8_t {
        CHANGE = 0,
        CHANGE_Z_INDEX = 1,
        CHANGE_VISIBLE = 2,
        CHANGE_OPACITY = 3,
        CHANGE_LAYERS = 4,
        ADD = 5,
        REMOVE = 6,
    };

    [[nodiscard]] LAYERSYNC_EXPORT std::string_view to_string(LayerEventType type);

    struct LayerEvent {
        LayerEventType type;
        // The layer the event is about: the layer that changed, or the child added to / removed from a collection.
        base_layer_s_ptr element;
    };

    /**
     * Receiver of layer events. The context is the value supplied when the subscription was made, it lets one
     * listener tell apart subscriptions made on behalf of different layers.
     */
    struct LayerEventListener {
        virtual ~LayerEventListener() = default;

        virtual void on_layer_event(const LayerEvent &event, layer_id_t context) = 0;
    };
} // namespace layersync

#endif // LAYERSYNC_LAYER_EVENT_H
