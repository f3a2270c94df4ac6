#include <layersync/sync/abstract_synchronizer.h>
#include <layersync/util/errors.h>

#include <algorithm>
#include <deque>
#include <exception>

namespace layersync {
    namespace {
        bool has_counterparts(const counterparts_result &result) { return result.has_value() && !result->empty(); }
    } // namespace

    std::string_view to_string(LayerSyncState state) {
        switch (state) {
            case LayerSyncState::UNMAPPED: return "UNMAPPED";
            case LayerSyncState::PENDING_RETRY: return "PENDING_RETRY";
            case LayerSyncState::MAPPED: return "MAPPED";
        }
        return "UNKNOWN";
    }

    AbstractSynchronizer::AbstractSynchronizer(layer_group_s_ptr root, SynchronizerOptions options)
        : _root{std::move(root)}, _options{std::move(options)} {
        if (_root == nullptr) { throw_error<std::invalid_argument>("A synchronizer requires a root layer group"); }
    }

    AbstractSynchronizer::~AbstractSynchronizer() { unlisten_all(); }

    void AbstractSynchronizer::synchronize() {
        notify_observers([this](SyncLifeCycleObserver &o) { o.on_before_synchronize(*this); });
        destroy_all();
        add_layers(LayerWithParents{_root, {}});
        notify_observers([this](SyncLifeCycleObserver &o) { o.on_after_synchronize(*this); });
        if (_options.verify_invariants) { check_invariants(); }
    }

    void AbstractSynchronizer::destroy_all() {
        notify_observers([this](SyncLifeCycleObserver &o) { o.on_destroy_all(*this); });
        unlisten_all();
        remove_all_counterparts(true);
        _layer_map.clear();
    }

    bool AbstractSynchronizer::is_mapped(layer_id_t id) const { return _layer_map.contains(id); }

    LayerSyncState AbstractSynchronizer::layer_state(layer_id_t id) const {
        auto it{_layer_listen_keys.find(id)};
        return it == _layer_listen_keys.end() ? LayerSyncState::UNMAPPED : it->second.state;
    }

    const counterpart_list *AbstractSynchronizer::counterparts(layer_id_t id) const {
        auto it{_layer_map.find(id)};
        return it == _layer_map.end() ? nullptr : &it->second;
    }

    std::vector<layer_id_t> AbstractSynchronizer::mapped_layer_ids() const {
        std::vector<layer_id_t> ids;
        ids.reserve(_layer_map.size());
        for (const auto &[id, _] : _layer_map) { ids.push_back(id); }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    std::size_t AbstractSynchronizer::layer_listener_count(layer_id_t id) const {
        auto it{_layer_listen_keys.find(id)};
        return it == _layer_listen_keys.end() ? 0 : it->second.keys.size();
    }

    std::size_t AbstractSynchronizer::group_listener_count(layer_id_t id) const {
        auto it{_group_listen_keys.find(id)};
        if (it == _group_listen_keys.end()) { return 0; }
        return (it->second.layers_key ? 1 : 0) + (it->second.z_index_key ? 1 : 0) + it->second.content_keys.size();
    }

    std::size_t AbstractSynchronizer::pending_retry_count() const {
        return static_cast<std::size_t>(std::count_if(_layer_listen_keys.begin(), _layer_listen_keys.end(), [](const auto &entry) {
            return entry.second.state == LayerSyncState::PENDING_RETRY;
        }));
    }

    counterpart_list AbstractSynchronizer::compute_counterpart_order() const {
        struct OrderEntry {
            std::int32_t z_index;
            const counterpart_list *counterparts;
        };

        struct Frame {
            BaseLayer::ptr layer;
            std::optional<std::int32_t> inherited_z_index;
        };

        std::vector<OrderEntry> entries;
        entries.reserve(_layer_map.size());
        layer_id_set visited;
        layer_id_set expanded_groups;

        // Pre-order walk, the root itself is excluded from ancestry so its z-index is not inherited.
        std::vector<Frame> stack;
        const auto push_children = [&stack, &expanded_groups](const LayerGroup &group, std::optional<std::int32_t> z) {
            if (!expanded_groups.insert(group.id()).second) { return; }
            const auto &children{group.layers()->layers()};
            for (auto it = children.rbegin(); it != children.rend(); ++it) { stack.push_back(Frame{it->get(), z}); }
        };
        push_children(*_root, std::nullopt);

        while (!stack.empty()) {
            auto frame{stack.back()};
            stack.pop_back();
            auto effective{frame.layer->z_index().has_value() ? frame.layer->z_index() : frame.inherited_z_index};
            if (auto it{_layer_map.find(frame.layer->id())}; it != _layer_map.end()) {
                if (visited.insert(it->first).second) {
                    entries.push_back(OrderEntry{effective.value_or(_options.default_z_index), &it->second});
                }
                continue;
            }
            if (frame.layer->is_group()) { push_children(static_cast<const LayerGroup &>(*frame.layer), effective); }
        }

        // Layers still mapped but no longer reachable (their collection was replaced) go after the reachable ones.
        for (const auto &[id, counterparts] : _layer_map) {
            if (visited.contains(id)) { continue; }
            auto record{_layer_listen_keys.find(id)};
            auto z{record == _layer_listen_keys.end() ? std::nullopt : record->second.target.effective_z_index()};
            entries.push_back(OrderEntry{z.value_or(_options.default_z_index), &counterparts});
        }

        std::stable_sort(entries.begin(), entries.end(),
                         [](const OrderEntry &lhs, const OrderEntry &rhs) { return lhs.z_index < rhs.z_index; });

        counterpart_list ordered;
        for (const auto &entry : entries) {
            ordered.insert(ordered.end(), entry.counterparts->begin(), entry.counterparts->end());
        }
        return ordered;
    }

    void AbstractSynchronizer::order_layers() {
        auto ordered{compute_counterpart_order()};
        apply_counterpart_order(ordered);
        notify_observers([&ordered](SyncLifeCycleObserver &o) { o.on_layers_ordered(ordered.size()); });
    }

    void AbstractSynchronizer::check_invariants() const {
        if (_layer_map.contains(_root->id())) {
            throw_error<SyncInvariantError>("The root group {} is mapped to counterparts", _root->display_name());
        }

        for (const auto &[id, counterparts] : _layer_map) {
            if (counterparts.empty()) { throw_error<SyncInvariantError>("Layer #{} is mapped to an empty counterpart set", id); }
            auto record{_layer_listen_keys.find(id)};
            if (record == _layer_listen_keys.end() || record->second.keys.empty()) {
                throw_error<SyncInvariantError>("Mapped layer #{} has no layer listeners", id);
            }
            if (record->second.state != LayerSyncState::MAPPED) {
                throw_error<SyncInvariantError>("Mapped layer #{} is in state {}", id, to_string(record->second.state));
            }
        }

        for (const auto &[id, record] : _layer_listen_keys) {
            const auto mapped{_layer_map.contains(id)};
            if (record.keys.empty()) { throw_error<SyncInvariantError>("Layer #{} has an empty listener entry", id); }
            if (record.state == LayerSyncState::MAPPED && !mapped) {
                throw_error<SyncInvariantError>("Layer #{} is MAPPED without counterparts", id);
            }
            if (record.state == LayerSyncState::PENDING_RETRY && (mapped || record.keys.size() != 1)) {
                throw_error<SyncInvariantError>("Layer #{} pending retry holds counterparts or extra listeners", id);
            }
        }

        // A mapped group stands for its whole subtree.
        for (const auto &[id, record] : _layer_listen_keys) {
            if (record.state != LayerSyncState::MAPPED || !record.target.layer->is_group()) { continue; }
            std::deque<BaseLayer::ptr> fifo;
            layer_id_set seen{id};
            for (const auto &child : *static_cast<const LayerGroup &>(*record.target.layer).layers()) { fifo.push_back(child.get()); }
            while (!fifo.empty()) {
                auto layer{fifo.front()};
                fifo.pop_front();
                if (!seen.insert(layer->id()).second) { continue; }
                if (_layer_map.contains(layer->id())) {
                    throw_error<SyncInvariantError>("Layer {} is mapped below the mapped group #{}", layer->display_name(), id);
                }
                if (layer->is_group()) {
                    for (const auto &child : *static_cast<const LayerGroup &>(*layer).layers()) { fifo.push_back(child.get()); }
                }
            }
        }
    }

    void AbstractSynchronizer::add_life_cycle_observer(SyncLifeCycleObserver::s_ptr observer) {
        if (observer == nullptr) { throw_error<std::invalid_argument>("Cannot add a null life-cycle observer"); }
        _options.observers.push_back(std::move(observer));
    }

    void AbstractSynchronizer::remove_life_cycle_observer(const SyncLifeCycleObserver::s_ptr &observer) {
        std::erase(_options.observers, observer);
    }

    void AbstractSynchronizer::initialise() {}

    void AbstractSynchronizer::start() { synchronize(); }

    void AbstractSynchronizer::stop() { destroy_all(); }

    // dispose_component stops first, nothing is left to release here.
    void AbstractSynchronizer::dispose() {}

    void AbstractSynchronizer::on_layer_event(const LayerEvent &event, layer_id_t context) {
        switch (event.type) {
            case LayerEventType::ADD: add_child_layer(context, event.element); break;
            case LayerEventType::REMOVE: remove_child_layer(context, event.element); break;
            case LayerEventType::CHANGE_LAYERS: relisten_group_content(context); break;
            case LayerEventType::CHANGE: retry_layer(context); break;
            case LayerEventType::CHANGE_Z_INDEX: order_layers(); break;
            case LayerEventType::CHANGE_OPACITY:
            case LayerEventType::CHANGE_VISIBLE: refresh_counterpart_properties(context); break;
            default: return;
        }
        if (_options.verify_invariants) { check_invariants(); }
    }

    void AbstractSynchronizer::add_layers(LayerWithParents seed) {
        std::deque<LayerWithParents> fifo;
        fifo.push_back(std::move(seed));
        while (!fifo.empty()) {
            auto current{std::move(fifo.front())};
            fifo.pop_front();
            const auto &layer{current.layer};
            const auto id{layer->id()};
            if (_layer_map.contains(id) || _layer_listen_keys.contains(id)) {
                throw_error<SyncInvariantError>("Layer {} is already synchronized", layer->display_name());
            }

            counterparts_result counterparts;
            if (layer->is_group()) {
                auto group{std::static_pointer_cast<LayerGroup>(layer)};
                listen_for_group_changes(current);
                const auto is_root{group == _root};
                if (!is_root) { counterparts = create_single_layer_counterparts(current); }
                if (!has_counterparts(counterparts)) {
                    auto child_parents{is_root ? std::vector<layer_group_s_ptr>{} : current.ancestry_for_children()};
                    for (const auto &child : *group->layers()) { fifo.push_back(LayerWithParents{child, child_parents}); }
                }
            } else {
                counterparts = create_single_layer_counterparts(current);
                // Layers that cannot be represented yet (a source is set later, data still loading) are kept
                // under watch until they change.
                if (!has_counterparts(counterparts)) { schedule_retry(current); }
            }

            if (has_counterparts(counterparts)) { add_counterparts(std::move(*counterparts), current); }
        }

        order_layers();
    }

    void AbstractSynchronizer::add_counterparts(counterpart_list counterparts, const LayerWithParents &target) {
        if (_layer_listen_keys.contains(target.layer->id())) {
            throw_error<SyncInvariantError>("Layer {} already has layer listeners", target.layer->display_name());
        }
        add_to_backend(counterparts);
        register_mapped(std::move(counterparts), target);
    }

    void AbstractSynchronizer::add_to_backend(const counterpart_list &counterparts) {
        std::size_t added{0};
        try {
            for (; added < counterparts.size(); ++added) { add_counterpart(counterparts[added]); }
        } catch (const std::exception &) {
            // Nothing is registered yet, take back what the backend already accepted.
            for (std::size_t i = 0; i < added; ++i) {
                remove_single_counterpart(counterparts[i], false);
                destroy_counterpart(counterparts[i]);
            }
            throw;
        }
    }

    void AbstractSynchronizer::register_mapped(counterpart_list counterparts, const LayerWithParents &target) {
        const auto &layer{*target.layer};
        const auto id{layer.id()};
        auto [record, inserted] = _layer_listen_keys.try_emplace(id, LayerListeners{LayerSyncState::MAPPED, target, {}});
        if (!inserted) { throw_error<SyncInvariantError>("Layer {} already has layer listeners", layer.display_name()); }

        auto &keys{record->second.keys};
        // A group's z-index is watched through its group listeners.
        if (!layer.is_group()) { keys.push_back(target.layer->listen(LayerEventType::CHANGE_Z_INDEX, this, id)); }
        keys.push_back(target.layer->listen(LayerEventType::CHANGE_OPACITY, this, id));
        keys.push_back(target.layer->listen(LayerEventType::CHANGE_VISIBLE, this, id));
        for (const auto &parent : target.parents) {
            keys.push_back(parent->listen(LayerEventType::CHANGE_OPACITY, this, id));
            keys.push_back(parent->listen(LayerEventType::CHANGE_VISIBLE, this, id));
        }

        const auto count{counterparts.size()};
        _layer_map.emplace(id, std::move(counterparts));
        notify_observers([&layer, count](SyncLifeCycleObserver &o) { o.on_layer_mapped(layer, count); });
    }

    void AbstractSynchronizer::refresh_counterpart_properties(layer_id_t id) {
        auto mapped{_layer_map.find(id)};
        auto record{_layer_listen_keys.find(id)};
        if (mapped == _layer_map.end() || record == _layer_listen_keys.end()) { return; }
        update_counterpart_properties(record->second.target, mapped->second);
    }

    void AbstractSynchronizer::schedule_retry(const LayerWithParents &target) {
        const auto id{target.layer->id()};
        auto [record, inserted] = _layer_listen_keys.try_emplace(
            id, LayerListeners{LayerSyncState::PENDING_RETRY, target, {}});
        if (!inserted) { throw_error<SyncInvariantError>("Layer {} already has layer listeners", target.layer->display_name()); }
        record->second.keys.push_back(target.layer->listen(LayerEventType::CHANGE, this, id));
        notify_observers([&target](SyncLifeCycleObserver &o) { o.on_retry_scheduled(*target.layer); });
    }

    void AbstractSynchronizer::retry_layer(layer_id_t id) {
        auto record{_layer_listen_keys.find(id)};
        if (record == _layer_listen_keys.end() || record->second.state != LayerSyncState::PENDING_RETRY) { return; }

        auto target{record->second.target};
        auto counterparts{create_single_layer_counterparts(target)};
        if (!has_counterparts(counterparts)) {
            notify_observers([&target](SyncLifeCycleObserver &o) { o.on_retry_failed(*target.layer); });
            return;
        }

        // Still pending when the backend rejects the counterparts.
        add_to_backend(*counterparts);
        release_layer_listeners(id);
        register_mapped(std::move(*counterparts), target);
        order_layers();
    }

    void AbstractSynchronizer::release_layer_listeners(layer_id_t id) {
        auto record{_layer_listen_keys.find(id)};
        if (record == _layer_listen_keys.end()) { return; }
        Observable::un_listen(record->second.keys);
        _layer_listen_keys.erase(record);
    }

    bool AbstractSynchronizer::remove_and_destroy_single_layer(const BaseLayer &layer) {
        const auto id{layer.id()};
        // A layer pending retry has listeners but no counterparts, its retry subscription goes as well.
        release_layer_listeners(id);

        auto it{_layer_map.find(id)};
        if (it == _layer_map.end()) { return false; }
        auto counterparts{std::move(it->second)};
        _layer_map.erase(it);
        for (const auto &counterpart : counterparts) {
            remove_single_counterpart(counterpart, false);
            destroy_counterpart(counterpart);
        }
        const auto count{counterparts.size()};
        notify_observers([&layer, count](SyncLifeCycleObserver &o) { o.on_layer_unmapped(layer, count); });
        return true;
    }

    void AbstractSynchronizer::unlisten_single_group(const LayerGroup &group) {
        if (&group == _root.get()) { return; }
        auto it{_group_listen_keys.find(group.id())};
        if (it == _group_listen_keys.end()) { return; }
        Observable::un_listen(it->second.layers_key);
        Observable::un_listen(it->second.z_index_key);
        Observable::un_listen(it->second.content_keys);
        _group_listen_keys.erase(it);
        notify_observers([&group](SyncLifeCycleObserver &o) { o.on_group_unlistened(group); });
    }

    void AbstractSynchronizer::remove_layer(const base_layer_s_ptr &root) {
        if (root == nullptr) { return; }
        std::deque<base_layer_s_ptr> fifo{root};
        while (!fifo.empty()) {
            auto layer{std::move(fifo.front())};
            fifo.pop_front();
            const auto handled{remove_and_destroy_single_layer(*layer)};
            if (layer->is_group()) {
                const auto &group{static_cast<const LayerGroup &>(*layer)};
                unlisten_single_group(group);
                // Without a counterpart of its own the group's children were mapped one by one.
                if (!handled) {
                    for (const auto &child : *group.layers()) { fifo.push_back(child); }
                }
            }
        }
    }

    void AbstractSynchronizer::listen_for_group_changes(const LayerWithParents &group_with_parents) {
        auto group{std::static_pointer_cast<LayerGroup>(group_with_parents.layer)};
        const auto id{group->id()};
        if (_group_listen_keys.contains(id)) {
            throw_error<SyncInvariantError>("Layer group {} is already subscribed", group->display_name());
        }

        const auto is_root{group == _root};
        GroupListeners listeners{
            group,
            is_root ? std::vector<layer_group_s_ptr>{} : group_with_parents.ancestry_for_children(),
            group->listen(LayerEventType::CHANGE_LAYERS, this, id),
            is_root ? ListenKey{} : group->listen(LayerEventType::CHANGE_Z_INDEX, this, id),
            {}};
        listen_add_remove(listeners);
        _group_listen_keys.emplace(id, std::move(listeners));
        notify_observers([&group](SyncLifeCycleObserver &o) { o.on_group_listened(*group); });
    }

    void AbstractSynchronizer::listen_add_remove(GroupListeners &listeners) {
        const auto id{listeners.group->id()};
        const auto &collection{listeners.group->layers()};
        listeners.content_keys.push_back(collection->listen(LayerEventType::ADD, this, id));
        listeners.content_keys.push_back(collection->listen(LayerEventType::REMOVE, this, id));
    }

    void AbstractSynchronizer::relisten_group_content(layer_id_t group_id) {
        auto it{_group_listen_keys.find(group_id)};
        if (it == _group_listen_keys.end()) {
            throw_error<SyncInvariantError>("Collection of unknown layer group #{} was replaced", group_id);
        }
        Observable::un_listen(it->second.content_keys);
        listen_add_remove(it->second);
    }

    void AbstractSynchronizer::add_child_layer(layer_id_t group_id, const base_layer_s_ptr &layer) {
        auto it{_group_listen_keys.find(group_id)};
        if (it == _group_listen_keys.end()) {
            throw_error<SyncInvariantError>("Layer added to unknown layer group #{}", group_id);
        }
        if (rebuild_if_group_mapped(group_id)) { return; }
        add_layers(LayerWithParents{layer, it->second.child_parents});
    }

    void AbstractSynchronizer::remove_child_layer(layer_id_t group_id, const base_layer_s_ptr &layer) {
        if (rebuild_if_group_mapped(group_id)) { return; }
        remove_layer(layer);
    }

    bool AbstractSynchronizer::rebuild_if_group_mapped(layer_id_t group_id) {
        // The children of a group with its own counterparts are never mapped one by one, the group counterpart
        // has to be produced again from the new set of children.
        if (!_layer_map.contains(group_id)) { return false; }
        auto target{_layer_listen_keys.at(group_id).target};
        remove_layer(target.layer);
        add_layers(std::move(target));
        return true;
    }

    void AbstractSynchronizer::unlisten_all() {
        for (auto &[_, listeners] : _group_listen_keys) {
            Observable::un_listen(listeners.layers_key);
            Observable::un_listen(listeners.z_index_key);
            Observable::un_listen(listeners.content_keys);
        }
        for (auto &[_, listeners] : _layer_listen_keys) { Observable::un_listen(listeners.keys); }
        _group_listen_keys.clear();
        _layer_listen_keys.clear();
    }

    template<typename Fn>
    void AbstractSynchronizer::notify_observers(Fn &&fn) const {
        // A hook may add or remove observers.
        const auto observers{_options.observers};
        for (const auto &observer : observers) { fn(*observer); }
    }
} // namespace layersync
