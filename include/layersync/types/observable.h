#ifndef LAYERSYNC_OBSERVABLE_H
#define LAYERSYNC_OBSERVABLE_H

#include <layersync/types/layer_event.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace layersync {
    namespace detail {
        struct ListenerTable;
    }

    /**
     * @brief Handle for one subscription made with Observable::listen.
     *
     * The key only holds a weak reference to the listener table, so it is safe to keep (and to un_listen) after
     * the observable it came from has been destroyed.
     */
    struct LAYERSYNC_EXPORT ListenKey {
        std::weak_ptr<detail::ListenerTable> table;
        std::uint64_t listener_id{0};

        /**
         * True while the observable is alive and the subscription has not been removed.
         */
        [[nodiscard]] bool is_active() const;

        explicit operator bool() const { return listener_id != 0; }
    };

    using listen_key_list = std::vector<ListenKey>;

    /**
     * @brief Publish/subscribe primitive used by every node of the source tree.
     *
     * Listeners are non-owning pointers, the subscriber is responsible for calling un_listen before it goes away.
     * Dispatch is synchronous. A listener removed while a dispatch is in progress is not called for the rest of
     * that dispatch, a listener added while a dispatch is in progress is only called for later events.
     */
    class LAYERSYNC_EXPORT Observable {
    public:
        Observable();

        virtual ~Observable();

        Observable(const Observable &) = delete;

        Observable &operator=(const Observable &) = delete;

        [[nodiscard]] ListenKey listen(LayerEventType type, LayerEventListener *listener,
                                       layer_id_t context = NO_LAYER_ID);

        /**
         * Remove a subscription. Stale keys (already removed, or the observable is gone) are ignored.
         */
        static void un_listen(const ListenKey &key);

        /**
         * Remove every subscription in keys and clear the list.
         */
        static void un_listen(listen_key_list &keys);

        void dispatch(const LayerEvent &event);

        [[nodiscard]] std::size_t listener_count() const;

        [[nodiscard]] std::size_t listener_count(LayerEventType type) const;

    private:
        std::shared_ptr<detail::ListenerTable> _table;
    };
} // namespace layersync

#endif // LAYERSYNC_OBSERVABLE_H
