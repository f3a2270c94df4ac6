#ifndef LAYERSYNC_SCENE_COLLECTION_H
#define LAYERSYNC_SCENE_COLLECTION_H

#include <layersync/scene/scene_object.h>

#include <cstddef>
#include <optional>
#include <vector>

namespace layersync {
    /**
     * @brief Ordered set of live scene objects, first object is painted first (bottom-most).
     *
     * Objects are destroyed explicitly, the collection never destroys an object on its own except through
     * remove(…, true) and remove_all(true).
     */
    class LAYERSYNC_EXPORT SceneCollection {
    public:
        using s_ptr = std::shared_ptr<SceneCollection>;

        void add(const SceneObject::s_ptr &object);

        /**
         * Detach object, destroying it when requested. Returns false when the object was not in the collection.
         */
        bool remove(const SceneObject::s_ptr &object, bool destroy);

        void remove_all(bool destroy);

        /**
         * Release the object's resources. The object does not need to be in the collection, destroying it twice
         * raises SceneError.
         */
        void destroy(const SceneObject::s_ptr &object);

        /**
         * Apply new effective opacity and visibility to a live object, raises SceneError for a destroyed one.
         */
        void update_properties(const SceneObject::s_ptr &object, double opacity, bool visible);

        /**
         * Reorder the listed objects to match ordered. Objects that are not listed stay at the bottom in their
         * current relative order, listed objects that are not in the collection are ignored.
         */
        void reorder(const std::vector<SceneObject::s_ptr> &ordered);

        [[nodiscard]] bool contains(const SceneObject::s_ptr &object) const;

        [[nodiscard]] std::optional<std::size_t> index_of(const SceneObject::s_ptr &object) const;

        [[nodiscard]] const std::vector<SceneObject::s_ptr> &objects() const { return _objects; }

        [[nodiscard]] std::size_t size() const { return _objects.size(); }

        [[nodiscard]] bool empty() const { return _objects.empty(); }

        [[nodiscard]] std::size_t destroy_count() const { return _destroy_count; }

    private:
        std::vector<SceneObject::s_ptr> _objects;
        std::size_t _destroy_count{0};
    };
} // namespace layersync

#endif // LAYERSYNC_SCENE_COLLECTION_H
