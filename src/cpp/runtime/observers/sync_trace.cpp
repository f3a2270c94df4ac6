#include <layersync/runtime/observers/sync_trace.h>
#include <layersync/sync/abstract_synchronizer.h>
#include <layersync/types/layer.h>

#include <fmt/format.h>
#include <iostream>

namespace layersync {

    // Static member initialization
    bool SyncTrace::_use_stderr = true;

    SyncTrace::SyncTrace(const std::optional<std::string> &filter, bool structure, bool retry, bool order, bool group)
        : _filter(filter), _structure(structure), _retry(retry), _order(order), _group(group) {
    }

    void SyncTrace::set_use_stderr(bool value) {
        _use_stderr = value;
    }

    void SyncTrace::_print(const std::string &msg) {
        std::string formatted = fmt::format("[{:>6}] {}", ++_sequence, msg);
        if (_use_stderr) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    std::string SyncTrace::_layer_name(const BaseLayer &layer) const {
        return fmt::format("{}<{}>{}", layer.is_group() ? "group" : "layer", layer.id(),
                           layer.label().has_value() ? ":" + layer.label().value() : "");
    }

    void SyncTrace::_print_layer(const BaseLayer &layer, const std::string &msg) {
        _print(fmt::format("{} {}", _layer_name(layer), msg));
    }

    bool SyncTrace::_should_log_layer(const BaseLayer &layer) const {
        if (!_filter.has_value()) {
            return true;
        }
        return _layer_name(layer).find(_filter.value()) != std::string::npos;
    }

    void SyncTrace::on_before_synchronize(const AbstractSynchronizer &synchronizer) {
        if (_structure) {
            _print(fmt::format(">> {} Synchronizing {} {}", std::string(15, '.'),
                               _layer_name(*synchronizer.root()), std::string(15, '.')));
        }
    }

    void SyncTrace::on_after_synchronize(const AbstractSynchronizer &synchronizer) {
        if (_structure) {
            _print(fmt::format("<< {} Synchronized {} mapped, {} pending {}", std::string(15, '.'),
                               synchronizer.mapped_layer_count(), synchronizer.pending_retry_count(),
                               std::string(15, '.')));
        }
    }

    void SyncTrace::on_destroy_all(const AbstractSynchronizer &synchronizer) {
        if (_structure) {
            _print(fmt::format("Destroying all: {} mapped layers, {} layer listeners, {} group listeners",
                               synchronizer.mapped_layer_count(), synchronizer.layer_registry_size(),
                               synchronizer.group_registry_size()));
        }
    }

    void SyncTrace::on_layer_mapped(const BaseLayer &layer, std::size_t counterpart_count) {
        if (_structure && _should_log_layer(layer)) {
            _print_layer(layer, fmt::format("[MAPPED] {} counterpart(s)", counterpart_count));
        }
    }

    void SyncTrace::on_layer_unmapped(const BaseLayer &layer, std::size_t counterpart_count) {
        if (_structure && _should_log_layer(layer)) {
            _print_layer(layer, fmt::format("[UNMAPPED] {} counterpart(s) destroyed", counterpart_count));
        }
    }

    void SyncTrace::on_retry_scheduled(const BaseLayer &layer) {
        if (_retry && _should_log_layer(layer)) {
            _print_layer(layer, "[PENDING] not representable yet, waiting for change");
        }
    }

    void SyncTrace::on_retry_failed(const BaseLayer &layer) {
        if (_retry && _should_log_layer(layer)) {
            _print_layer(layer, "[PENDING] changed, still not representable");
        }
    }

    void SyncTrace::on_group_listened(const LayerGroup &group) {
        if (_group && _should_log_layer(group)) {
            _print_layer(group, "[LISTEN]");
        }
    }

    void SyncTrace::on_group_unlistened(const LayerGroup &group) {
        if (_group && _should_log_layer(group)) {
            _print_layer(group, "[UNLISTEN]");
        }
    }

    void SyncTrace::on_layers_ordered(std::size_t counterpart_count) {
        if (_order) {
            _print(fmt::format("Ordered {} counterpart(s)", counterpart_count));
        }
    }

} // namespace layersync
