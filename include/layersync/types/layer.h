#ifndef LAYERSYNC_LAYER_H
#define LAYERSYNC_LAYER_H

#include <layersync/types/observable.h>

#include <cstdint>
#include <optional>
#include <string>

namespace layersync {
    /**
     * @brief A node of the source layer tree.
     *
     * Every node has a process-unique id assigned at construction that never changes. Nodes must be owned by a
     * std::shared_ptr, events carry the shared pointer of the node they are about.
     */
    struct LAYERSYNC_EXPORT BaseLayer : Observable, std::enable_shared_from_this<BaseLayer> {
        using ptr = BaseLayer *;
        using s_ptr = std::shared_ptr<BaseLayer>;

        ~BaseLayer() override = default;

        [[nodiscard]] layer_id_t id() const { return _id; }

        [[nodiscard]] virtual bool is_group() const = 0;

        [[nodiscard]] const std::optional<std::string> &label() const { return _label; }

        void set_label(std::optional<std::string> label);

        /**
         * The label when there is one, otherwise "#<id>".
         */
        [[nodiscard]] std::string display_name() const;

        /**
         * Explicit stacking order key, layers without one use the inherited or default key.
         */
        [[nodiscard]] std::optional<std::int32_t> z_index() const { return _z_index; }

        void set_z_index(std::optional<std::int32_t> z_index);

        [[nodiscard]] bool visible() const { return _visible; }

        void set_visible(bool visible);

        [[nodiscard]] double opacity() const { return _opacity; }

        void set_opacity(double opacity);

        [[nodiscard]] std::uint64_t revision() const { return _revision; }

        /**
         * Bump the revision and emit CHANGE.
         */
        void changed();

    protected:
        explicit BaseLayer(std::optional<std::string> label);

        void notify(LayerEventType type);

    private:
        layer_id_t _id;
        std::optional<std::string> _label;
        std::optional<std::int32_t> _z_index;
        bool _visible{true};
        double _opacity{1.0};
        std::uint64_t _revision{0};
    };

    /**
     * @brief Terminal node. A layer is only representable once it has a source.
     */
    struct LAYERSYNC_EXPORT Layer final : BaseLayer {
        using ptr = Layer *;
        using s_ptr = std::shared_ptr<Layer>;

        explicit Layer(std::optional<std::string> label = std::nullopt, std::optional<std::string> source = std::nullopt);

        [[nodiscard]] bool is_group() const override { return false; }

        [[nodiscard]] const std::optional<std::string> &source() const { return _source; }

        /**
         * Replace the source and emit CHANGE.
         */
        void set_source(std::optional<std::string> source);

    private:
        std::optional<std::string> _source;
    };

    /**
     * @brief Ordered, observable list of child layers. Emits ADD and REMOVE with the affected child.
     */
    class LAYERSYNC_EXPORT LayerCollection final : public Observable {
    public:
        using ptr = LayerCollection *;
        using s_ptr = std::shared_ptr<LayerCollection>;
        using container_type = std::vector<base_layer_s_ptr>;

        LayerCollection() = default;

        explicit LayerCollection(container_type layers);

        void push_back(base_layer_s_ptr layer);

        void insert_at(std::size_t index, base_layer_s_ptr layer);

        /**
         * Remove the first occurrence of layer. Returns false when it is not in the collection.
         */
        bool remove(const base_layer_s_ptr &layer);

        base_layer_s_ptr remove_at(std::size_t index);

        /**
         * Replace the element at index, emits REMOVE for the old element then ADD for the new one.
         */
        void set_at(std::size_t index, base_layer_s_ptr layer);

        /**
         * Remove every element from the back, one REMOVE per element.
         */
        void clear();

        [[nodiscard]] bool contains(const base_layer_s_ptr &layer) const;

        [[nodiscard]] const base_layer_s_ptr &at(std::size_t index) const;

        [[nodiscard]] std::size_t size() const { return _layers.size(); }

        [[nodiscard]] bool empty() const { return _layers.empty(); }

        [[nodiscard]] const container_type &layers() const { return _layers; }

        [[nodiscard]] container_type::const_iterator begin() const { return _layers.begin(); }

        [[nodiscard]] container_type::const_iterator end() const { return _layers.end(); }

    private:
        container_type _layers;
    };

    /**
     * @brief Node owning a replaceable collection of children.
     */
    struct LAYERSYNC_EXPORT LayerGroup final : BaseLayer {
        using ptr = LayerGroup *;
        using s_ptr = std::shared_ptr<LayerGroup>;

        explicit LayerGroup(std::optional<std::string> label = std::nullopt);

        LayerGroup(std::optional<std::string> label, LayerCollection::container_type layers);

        [[nodiscard]] bool is_group() const override { return true; }

        [[nodiscard]] const LayerCollection::s_ptr &layers() const { return _layers; }

        /**
         * Replace the whole child collection and emit CHANGE_LAYERS. The previous collection emits nothing.
         */
        void set_layers(LayerCollection::s_ptr layers);

    private:
        LayerCollection::s_ptr _layers;
    };
} // namespace layersync

#endif // LAYERSYNC_LAYER_H
