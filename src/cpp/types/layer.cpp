#include <layersync/types/layer.h>
#include <layersync/types/layer_with_parents.h>
#include <layersync/util/errors.h>

#include <algorithm>
#include <atomic>

namespace layersync {
    namespace {
        layer_id_t next_layer_id() {
            // Starts at 1, 0 is NO_LAYER_ID.
            static std::atomic<layer_id_t> counter{0};
            return ++counter;
        }
    } // namespace

    BaseLayer::BaseLayer(std::optional<std::string> label) : _id{next_layer_id()}, _label{std::move(label)} {}

    void BaseLayer::set_label(std::optional<std::string> label) { _label = std::move(label); }

    std::string BaseLayer::display_name() const { return _label.has_value() ? *_label : fmt::format("#{}", _id); }

    void BaseLayer::set_z_index(std::optional<std::int32_t> z_index) {
        if (_z_index == z_index) { return; }
        _z_index = z_index;
        notify(LayerEventType::CHANGE_Z_INDEX);
    }

    void BaseLayer::set_visible(bool visible) {
        if (_visible == visible) { return; }
        _visible = visible;
        notify(LayerEventType::CHANGE_VISIBLE);
    }

    void BaseLayer::set_opacity(double opacity) {
        if (opacity < 0.0 || opacity > 1.0) {
            throw_error<std::invalid_argument>("Opacity of layer {} must be within [0, 1], got {}", display_name(), opacity);
        }
        if (_opacity == opacity) { return; }
        _opacity = opacity;
        notify(LayerEventType::CHANGE_OPACITY);
    }

    void BaseLayer::changed() {
        ++_revision;
        notify(LayerEventType::CHANGE);
    }

    void BaseLayer::notify(LayerEventType type) { dispatch(LayerEvent{type, weak_from_this().lock()}); }

    Layer::Layer(std::optional<std::string> label, std::optional<std::string> source)
        : BaseLayer{std::move(label)}, _source{std::move(source)} {}

    void Layer::set_source(std::optional<std::string> source) {
        _source = std::move(source);
        changed();
    }

    LayerCollection::LayerCollection(container_type layers) : _layers{std::move(layers)} {
        if (std::any_of(_layers.begin(), _layers.end(), [](const auto &l) { return l == nullptr; })) {
            throw_error<std::invalid_argument>("A layer collection cannot hold null layers");
        }
    }

    void LayerCollection::push_back(base_layer_s_ptr layer) { insert_at(_layers.size(), std::move(layer)); }

    void LayerCollection::insert_at(std::size_t index, base_layer_s_ptr layer) {
        if (layer == nullptr) { throw_error<std::invalid_argument>("A layer collection cannot hold null layers"); }
        if (index > _layers.size()) {
            throw_error<std::out_of_range>("Insert index {} is past the end of a collection of {}", index, _layers.size());
        }
        _layers.insert(_layers.begin() + static_cast<std::ptrdiff_t>(index), layer);
        dispatch(LayerEvent{LayerEventType::ADD, std::move(layer)});
    }

    bool LayerCollection::remove(const base_layer_s_ptr &layer) {
        auto it{std::find(_layers.begin(), _layers.end(), layer)};
        if (it == _layers.end()) { return false; }
        remove_at(static_cast<std::size_t>(it - _layers.begin()));
        return true;
    }

    base_layer_s_ptr LayerCollection::remove_at(std::size_t index) {
        if (index >= _layers.size()) {
            throw_error<std::out_of_range>("Remove index {} is out of range for a collection of {}", index, _layers.size());
        }
        auto it{_layers.begin() + static_cast<std::ptrdiff_t>(index)};
        auto removed{std::move(*it)};
        _layers.erase(it);
        dispatch(LayerEvent{LayerEventType::REMOVE, removed});
        return removed;
    }

    void LayerCollection::set_at(std::size_t index, base_layer_s_ptr layer) {
        if (index >= _layers.size()) {
            throw_error<std::out_of_range>("Set index {} is out of range for a collection of {}", index, _layers.size());
        }
        remove_at(index);
        insert_at(index, std::move(layer));
    }

    void LayerCollection::clear() {
        while (!_layers.empty()) { remove_at(_layers.size() - 1); }
    }

    bool LayerCollection::contains(const base_layer_s_ptr &layer) const {
        return std::find(_layers.begin(), _layers.end(), layer) != _layers.end();
    }

    const base_layer_s_ptr &LayerCollection::at(std::size_t index) const {
        if (index >= _layers.size()) {
            throw_error<std::out_of_range>("Index {} is out of range for a collection of {}", index, _layers.size());
        }
        return _layers[index];
    }

    LayerGroup::LayerGroup(std::optional<std::string> label) : LayerGroup{std::move(label), {}} {}

    LayerGroup::LayerGroup(std::optional<std::string> label, LayerCollection::container_type layers)
        : BaseLayer{std::move(label)}, _layers{std::make_shared<LayerCollection>(std::move(layers))} {}

    void LayerGroup::set_layers(LayerCollection::s_ptr layers) {
        if (layers == nullptr) {
            throw_error<std::invalid_argument>("Layer group {} cannot be given a null collection", display_name());
        }
        _layers = std::move(layers);
        notify(LayerEventType::CHANGE_LAYERS);
    }

    std::vector<layer_group_s_ptr> LayerWithParents::ancestry_for_children() const {
        if (layer == nullptr || !layer->is_group()) {
            throw_error<std::logic_error>("Only a layer group has an ancestry for children");
        }
        std::vector<layer_group_s_ptr> result;
        result.reserve(parents.size() + 1);
        result.push_back(std::static_pointer_cast<LayerGroup>(layer));
        result.insert(result.end(), parents.begin(), parents.end());
        return result;
    }

    bool LayerWithParents::effective_visible() const {
        return layer->visible() && std::all_of(parents.begin(), parents.end(), [](const auto &p) { return p->visible(); });
    }

    double LayerWithParents::effective_opacity() const {
        double opacity{layer->opacity()};
        for (const auto &parent : parents) { opacity *= parent->opacity(); }
        return opacity;
    }

    std::optional<std::int32_t> LayerWithParents::effective_z_index() const {
        if (auto z{layer->z_index()}; z.has_value()) { return z; }
        for (const auto &parent : parents) {
            if (auto z{parent->z_index()}; z.has_value()) { return z; }
        }
        return std::nullopt;
    }
} // namespace layersync
