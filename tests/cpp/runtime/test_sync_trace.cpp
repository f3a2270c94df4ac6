/**
 * @file test_sync_trace.cpp
 * @brief SyncTrace output selection.
 */

#include <catch2/catch_test_macros.hpp>
#include <layersync/runtime/observers/sync_trace.h>
#include <layersync/scene/scene_synchronizer.h>
#include <layersync/types/layer.h>

using namespace layersync;

namespace {

struct TracedTree {
    layer_s_ptr roads = std::make_shared<Layer>("roads", "roads.png");
    layer_s_ptr labels = std::make_shared<Layer>("labels");
    layer_group_s_ptr root = std::make_shared<LayerGroup>("root", LayerCollection::container_type{roads, labels});
    SceneCollection::s_ptr scene = std::make_shared<SceneCollection>();
};

}  // namespace

TEST_CASE("SyncTrace - logs every step by default", "[runtime][trace]") {
    SyncTrace::set_use_stderr(true);
    TracedTree tree;
    auto trace{std::make_shared<SyncTrace>()};
    SynchronizerOptions options;
    options.observers.push_back(trace);
    SceneSynchronizer sync{tree.root, tree.scene, false, options};

    sync.synchronize();

    // before, destroy-all, root listened, roads mapped, labels pending, ordered, after.
    CHECK(trace->line_count() == 7);

    tree.labels->changed();
    CHECK(trace->line_count() == 8);
}

TEST_CASE("SyncTrace - flags switch categories off", "[runtime][trace]") {
    TracedTree tree;
    auto trace{std::make_shared<SyncTrace>(std::nullopt, true, false, false, false)};
    SceneSynchronizer sync{tree.root, tree.scene};
    sync.add_life_cycle_observer(trace);

    sync.synchronize();

    // before, destroy-all, roads mapped, after.
    CHECK(trace->line_count() == 4);
}

TEST_CASE("SyncTrace - filter restricts layer lines", "[runtime][trace]") {
    TracedTree tree;
    auto trace{std::make_shared<SyncTrace>(std::string{"labels"}, false, true, false, false)};
    SceneSynchronizer sync{tree.root, tree.scene};
    sync.add_life_cycle_observer(trace);

    sync.synchronize();
    CHECK(trace->line_count() == 1);

    tree.labels->set_source("labels.png");
    // A successful retry is reported as a mapping, structure logging is off.
    CHECK(trace->line_count() == 1);
}
