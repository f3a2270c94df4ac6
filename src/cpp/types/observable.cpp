#include <layersync/types/layer.h>
#include <layersync/types/observable.h>
#include <layersync/util/errors.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>

namespace layersync {
    namespace detail {
        struct ListenerEntry {
            std::uint64_t id;
            LayerEventType type;
            LayerEventListener *listener;
            layer_id_t context;
            bool active;
        };

        /**
         * Entries are never erased while a dispatch is running, removal only clears the active flag and the table
         * is compacted once the outermost dispatch completes. This keeps indices stable for the dispatch loop.
         */
        struct ListenerTable {
            std::vector<ListenerEntry> entries;
            std::uint64_t next_id{1};
            int dispatch_depth{0};
            bool needs_compaction{false};

            std::vector<ListenerEntry>::iterator find(std::uint64_t id) {
                return std::find_if(entries.begin(), entries.end(), [id](const ListenerEntry &e) { return e.id == id; });
            }

            void compact() {
                std::erase_if(entries, [](const ListenerEntry &e) { return !e.active; });
                needs_compaction = false;
            }
        };

        // Tracks dispatch nesting, compacts the table when the outermost dispatch ends (also when a listener throws).
        struct DispatchGuard {
            explicit DispatchGuard(std::shared_ptr<ListenerTable> table) : _table{std::move(table)} { ++_table->dispatch_depth; }

            ~DispatchGuard() {
                if (--_table->dispatch_depth == 0 && _table->needs_compaction) { _table->compact(); }
            }

            DispatchGuard(const DispatchGuard &) = delete;
            DispatchGuard &operator=(const DispatchGuard &) = delete;

            [[nodiscard]] ListenerTable &table() const { return *_table; }

        private:
            // Held so a listener dropping the last reference to the observable does not free the table mid-loop.
            std::shared_ptr<ListenerTable> _table;
        };
    } // namespace detail

    std::string_view to_string(LayerEventType type) {
        switch (type) {
            case LayerEventType::CHANGE: return "change";
            case LayerEventType::CHANGE_Z_INDEX: return "change:zIndex";
            case LayerEventType::CHANGE_VISIBLE: return "change:visible";
            case LayerEventType::CHANGE_OPACITY: return "change:opacity";
            case LayerEventType::CHANGE_LAYERS: return "change:layers";
            case LayerEventType::ADD: return "add";
            case LayerEventType::REMOVE: return "remove";
        }
        return "unknown";
    }

    bool ListenKey::is_active() const {
        auto t{table.lock()};
        if (!t) { return false; }
        auto it{t->find(listener_id)};
        return it != t->entries.end() && it->active;
    }

    Observable::Observable() : _table{std::make_shared<detail::ListenerTable>()} {}

    // Outstanding keys only hold a weak reference, they expire with the table.
    Observable::~Observable() = default;

    ListenKey Observable::listen(LayerEventType type, LayerEventListener *listener, layer_id_t context) {
        if (listener == nullptr) { throw_error<std::invalid_argument>("Cannot listen for '{}' with a null listener", to_string(type)); }
        auto id{_table->next_id++};
        _table->entries.push_back({id, type, listener, context, true});
        return ListenKey{_table, id};
    }

    void Observable::un_listen(const ListenKey &key) {
        auto table{key.table.lock()};
        if (!table) { return; }
        auto it{table->find(key.listener_id)};
        if (it == table->entries.end()) { return; }
        if (table->dispatch_depth > 0) {
            it->active = false;
            table->needs_compaction = true;
        } else {
            table->entries.erase(it);
        }
    }

    void Observable::un_listen(listen_key_list &keys) {
        for (const auto &key : keys) { un_listen(key); }
        keys.clear();
    }

    void Observable::dispatch(const LayerEvent &event) {
        static const bool debug_events = std::getenv("LAYERSYNC_DEBUG_EVENTS") != nullptr;

        detail::DispatchGuard guard{_table};
        auto &table{guard.table()};

        const auto count{table.entries.size()};
        for (std::size_t i = 0; i < count; ++i) {
            const auto entry{table.entries[i]};
            if (!entry.active || entry.type != event.type) { continue; }
            if (debug_events) {
                std::fprintf(stderr, "[layer_event] %s element=%s listener=%p context=%llu\n",
                             to_string(event.type).data(),
                             event.element ? event.element->display_name().c_str() : "<none>",
                             static_cast<void *>(entry.listener),
                             static_cast<unsigned long long>(entry.context));
            }
            entry.listener->on_layer_event(event, entry.context);
        }
    }

    std::size_t Observable::listener_count() const {
        return static_cast<std::size_t>(
            std::count_if(_table->entries.begin(), _table->entries.end(), [](const auto &e) { return e.active; }));
    }

    std::size_t Observable::listener_count(LayerEventType type) const {
        return static_cast<std::size_t>(std::count_if(_table->entries.begin(), _table->entries.end(),
                                                      [type](const auto &e) { return e.active && e.type == type; }));
    }
} // namespace layersync
