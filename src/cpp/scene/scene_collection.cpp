#include <layersync/scene/scene_collection.h>
#include <layersync/util/errors.h>

#include <algorithm>

namespace layersync {
    std::string_view to_string(SceneObjectKind kind) {
        switch (kind) {
            case SceneObjectKind::LAYER: return "LAYER";
            case SceneObjectKind::COMPOSITE: return "COMPOSITE";
        }
        return "UNKNOWN";
    }

    SceneObject::SceneObject(SceneObjectKind kind, layer_id_t layer_id, std::string name, std::vector<std::string> sources,
                             double opacity, bool visible)
        : _kind{kind}, _layer_id{layer_id}, _name{std::move(name)}, _sources{std::move(sources)}, _opacity{opacity},
          _visible{visible} {}

    void SceneCollection::add(const SceneObject::s_ptr &object) {
        if (object == nullptr) { throw_error<SceneError>("Cannot add a null scene object"); }
        if (object->is_destroyed()) { throw_error<SceneError>("Scene object '{}' is destroyed", object->name()); }
        if (contains(object)) { throw_error<SceneError>("Scene object '{}' is already in the scene", object->name()); }
        _objects.push_back(object);
    }

    bool SceneCollection::remove(const SceneObject::s_ptr &object, bool destroy) {
        auto it{std::find(_objects.begin(), _objects.end(), object)};
        if (it == _objects.end()) { return false; }
        _objects.erase(it);
        if (destroy) { this->destroy(object); }
        return true;
    }

    void SceneCollection::remove_all(bool destroy) {
        auto objects{std::move(_objects)};
        _objects.clear();
        if (!destroy) { return; }
        for (const auto &object : objects) { this->destroy(object); }
    }

    void SceneCollection::destroy(const SceneObject::s_ptr &object) {
        if (object == nullptr) { throw_error<SceneError>("Cannot destroy a null scene object"); }
        if (object->_destroyed) { throw_error<SceneError>("Scene object '{}' is already destroyed", object->name()); }
        object->_destroyed = true;
        ++_destroy_count;
    }

    void SceneCollection::update_properties(const SceneObject::s_ptr &object, double opacity, bool visible) {
        if (object == nullptr) { throw_error<SceneError>("Cannot update a null scene object"); }
        if (object->_destroyed) { throw_error<SceneError>("Scene object '{}' is destroyed", object->name()); }
        object->_opacity = opacity;
        object->_visible = visible;
    }

    void SceneCollection::reorder(const std::vector<SceneObject::s_ptr> &ordered) {
        ankerl::unordered_dense::set<const SceneObject *> present;
        for (const auto &object : _objects) { present.insert(object.get()); }
        ankerl::unordered_dense::set<const SceneObject *> listed;
        for (const auto &object : ordered) {
            if (present.contains(object.get())) { listed.insert(object.get()); }
        }

        std::vector<SceneObject::s_ptr> result;
        result.reserve(_objects.size());
        for (const auto &object : _objects) {
            if (!listed.contains(object.get())) { result.push_back(object); }
        }
        // Erasing on first use keeps an object listed twice from being placed twice.
        for (const auto &object : ordered) {
            if (listed.erase(object.get()) != 0) { result.push_back(object); }
        }
        _objects = std::move(result);
    }

    bool SceneCollection::contains(const SceneObject::s_ptr &object) const {
        return std::find(_objects.begin(), _objects.end(), object) != _objects.end();
    }

    std::optional<std::size_t> SceneCollection::index_of(const SceneObject::s_ptr &object) const {
        auto it{std::find(_objects.begin(), _objects.end(), object)};
        if (it == _objects.end()) { return std::nullopt; }
        return static_cast<std::size_t>(it - _objects.begin());
    }
} // namespace layersync
