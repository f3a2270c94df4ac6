/**
 * @file test_synchronizer_events.cpp
 * @brief Incremental updates of AbstractSynchronizer driven by tree events.
 */

#include "recording_synchronizer.h"

#include <catch2/catch_test_macros.hpp>
#include <layersync/types/layer.h>

using namespace layersync;
using layersync::testing::RecordingSynchronizer;

namespace {

SynchronizerOptions verifying_options() {
    SynchronizerOptions options;
    options.verify_invariants = true;
    return options;
}

struct Snapshot {
    std::vector<layer_id_t> mapped;
    std::size_t layer_registry;
    std::size_t group_registry;
    std::size_t root_listeners;

    bool operator==(const Snapshot &) const = default;
};

Snapshot snapshot(const RecordingSynchronizer &sync) {
    return Snapshot{sync.mapped_layer_ids(), sync.layer_registry_size(), sync.group_registry_size(),
                    sync.root()->layers()->listener_count()};
}

}  // namespace

// ============================================================================
// Add and remove
// ============================================================================

TEST_CASE("Synchronizer events - removing a leaf unmaps and destroys it", "[sync][events]") {
    auto x{std::make_shared<Layer>("x", "x.png")};
    x->set_z_index(1);
    auto y{std::make_shared<Layer>("y", "y.png")};
    y->set_z_index(0);
    auto group_a{std::make_shared<LayerGroup>("a", LayerCollection::container_type{x, y})};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{group_a})};
    RecordingSynchronizer sync{root, verifying_options()};
    sync.synchronize();
    REQUIRE(sync.scene_layer_ids() == std::vector<layer_id_t>{y->id(), x->id()});
    auto y_counterpart{std::dynamic_pointer_cast<testing::RecordingCounterpart>(sync.counterparts(y->id())->front())};

    REQUIRE(group_a->layers()->remove(y));

    CHECK(sync.mapped_layer_ids() == std::vector<layer_id_t>{x->id()});
    CHECK(sync.scene_layer_ids() == std::vector<layer_id_t>{x->id()});
    CHECK(sync.layer_state(y->id()) == LayerSyncState::UNMAPPED);
    CHECK(sync.layer_listener_count(y->id()) == 0);
    CHECK(y->listener_count() == 0);
    CHECK(y_counterpart->destroy_count == 1);
}

TEST_CASE("Synchronizer events - add then remove restores the previous state", "[sync][events]") {
    auto x{std::make_shared<Layer>("x", "x.png")};
    auto group_a{std::make_shared<LayerGroup>("a", LayerCollection::container_type{x})};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{group_a})};
    RecordingSynchronizer sync{root, verifying_options()};
    sync.synchronize();
    const auto before{snapshot(sync)};

    SECTION("leaf") {
        auto z{std::make_shared<Layer>("z", "z.png")};
        group_a->layers()->push_back(z);
        CHECK(sync.is_mapped(z->id()));
        CHECK(z->listener_count() == 3);
        CHECK(group_a->listener_count(LayerEventType::CHANGE_OPACITY) == 2);

        group_a->layers()->remove(z);
        CHECK(snapshot(sync) == before);
        CHECK(z->listener_count() == 0);
        CHECK(group_a->listener_count(LayerEventType::CHANGE_OPACITY) == 1);
    }

    SECTION("leaf pending retry") {
        auto z{std::make_shared<Layer>("z")};
        sync.unrepresentable.insert(z->id());
        group_a->layers()->push_back(z);
        CHECK(sync.layer_state(z->id()) == LayerSyncState::PENDING_RETRY);
        CHECK(z->listener_count(LayerEventType::CHANGE) == 1);

        group_a->layers()->remove(z);
        CHECK(snapshot(sync) == before);
        CHECK(sync.pending_retry_count() == 0);
        CHECK(z->listener_count() == 0);
    }

    SECTION("transparent group with children") {
        auto leaf{std::make_shared<Layer>("leaf", "leaf.png")};
        auto inner{std::make_shared<LayerGroup>("inner", LayerCollection::container_type{leaf})};
        auto outer{std::make_shared<LayerGroup>("outer", LayerCollection::container_type{inner})};
        root->layers()->push_back(outer);
        CHECK(sync.is_mapped(leaf->id()));
        CHECK(sync.group_registry_size() == before.group_registry + 2);

        root->layers()->remove(outer);
        CHECK(snapshot(sync) == before);
        CHECK(outer->listener_count() == 0);
        CHECK(inner->layers()->listener_count() == 0);
        CHECK(leaf->listener_count() == 0);
    }

    SECTION("group with its own counterpart") {
        auto leaf{std::make_shared<Layer>("leaf", "leaf.png")};
        auto group{std::make_shared<LayerGroup>("group", LayerCollection::container_type{leaf})};
        sync.group_counterparts.insert(group->id());
        root->layers()->push_back(group);
        CHECK(sync.is_mapped(group->id()));
        CHECK_FALSE(sync.is_mapped(leaf->id()));

        root->layers()->remove(group);
        CHECK(snapshot(sync) == before);
        CHECK(group->listener_count() == 0);
        CHECK(group->layers()->listener_count() == 0);
    }

    CHECK_FALSE(sync.every_created_destroyed_once());
    sync.destroy_all();
    CHECK(sync.every_created_destroyed_once());
}

TEST_CASE("Synchronizer events - children added to a nested group are mapped", "[sync][events]") {
    auto inner{std::make_shared<LayerGroup>("inner")};
    auto outer{std::make_shared<LayerGroup>("outer", LayerCollection::container_type{inner})};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{outer})};
    RecordingSynchronizer sync{root, verifying_options()};
    sync.synchronize();
    CHECK(sync.mapped_layer_count() == 0);

    auto leaf{std::make_shared<Layer>("leaf", "leaf.png")};
    inner->layers()->push_back(leaf);

    CHECK(sync.is_mapped(leaf->id()));
    CHECK(sync.scene_layer_ids() == std::vector<layer_id_t>{leaf->id()});
}

TEST_CASE("Synchronizer events - removing a transparent group unmaps its subtree", "[sync][events]") {
    auto x{std::make_shared<Layer>("x", "x.png")};
    auto y{std::make_shared<Layer>("y", "y.png")};
    auto group_a{std::make_shared<LayerGroup>("a", LayerCollection::container_type{x, y})};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{group_a})};
    RecordingSynchronizer sync{root, verifying_options()};
    sync.synchronize();

    root->layers()->clear();

    CHECK(sync.mapped_layer_count() == 0);
    CHECK(sync.scene.empty());
    CHECK(sync.group_registry_size() == 1);
    CHECK(sync.layer_registry_size() == 0);
    CHECK(group_a->layers()->listener_count() == 0);
    CHECK(sync.every_created_destroyed_once());
}

TEST_CASE("Synchronizer events - replacing an element swaps its counterpart", "[sync][events]") {
    auto x{std::make_shared<Layer>("x", "x.png")};
    auto y{std::make_shared<Layer>("y", "y.png")};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{x})};
    RecordingSynchronizer sync{root, verifying_options()};
    sync.synchronize();

    root->layers()->set_at(0, y);

    CHECK(sync.mapped_layer_ids() == std::vector<layer_id_t>{y->id()});
    CHECK(x->listener_count() == 0);
}

// ============================================================================
// Groups with their own counterpart
// ============================================================================

TEST_CASE("Synchronizer events - structure changes rebuild a mapped group", "[sync][events]") {
    auto leaf{std::make_shared<Layer>("leaf", "leaf.png")};
    auto group{std::make_shared<LayerGroup>("group", LayerCollection::container_type{leaf})};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{group})};
    RecordingSynchronizer sync{root, verifying_options()};
    sync.group_counterparts.insert(group->id());
    sync.synchronize();
    REQUIRE(sync.create_calls_for(group->id()) == 1);
    auto first{sync.all_created.front()};

    SECTION("add") {
        auto added{std::make_shared<Layer>("added", "added.png")};
        group->layers()->push_back(added);

        CHECK(sync.create_calls_for(group->id()) == 2);
        CHECK(sync.mapped_layer_ids() == std::vector<layer_id_t>{group->id()});
        CHECK(sync.create_calls_for(added->id()) == 0);
        CHECK(added->listener_count() == 0);
    }

    SECTION("remove") {
        group->layers()->remove(leaf);

        CHECK(sync.create_calls_for(group->id()) == 2);
        CHECK(sync.mapped_layer_ids() == std::vector<layer_id_t>{group->id()});
    }

    SECTION("group stops producing a counterpart") {
        sync.group_counterparts.erase(group->id());
        auto added{std::make_shared<Layer>("added", "added.png")};
        group->layers()->push_back(added);

        CHECK_FALSE(sync.is_mapped(group->id()));
        CHECK(sync.mapped_layer_ids() == std::vector<layer_id_t>{leaf->id(), added->id()});
    }

    CHECK(first->destroy_count == 1);
    CHECK(sync.scene.size() == sync.mapped_layer_count());
    CHECK(sync.group_listener_count(group->id()) == 4);
}

TEST_CASE("Synchronizer events - the last structural event decides the group mapping", "[sync][events]") {
    auto leaf{std::make_shared<Layer>("leaf", "leaf.png")};
    auto group{std::make_shared<LayerGroup>("group", LayerCollection::container_type{leaf})};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{group})};
    RecordingSynchronizer sync{root, verifying_options()};
    sync.synchronize();
    REQUIRE(sync.is_mapped(leaf->id()));

    // The group becomes representable but nothing structural happened to it yet.
    sync.group_counterparts.insert(group->id());
    auto added{std::make_shared<Layer>("added", "added.png")};
    group->layers()->push_back(added);
    CHECK_FALSE(sync.is_mapped(group->id()));
    CHECK(sync.is_mapped(added->id()));

    // Re-adding the group is the structural event that switches it over.
    root->layers()->remove(group);
    root->layers()->push_back(group);
    CHECK(sync.mapped_layer_ids() == std::vector<layer_id_t>{group->id()});
    CHECK(leaf->listener_count() == 0);
    CHECK(added->listener_count() == 0);
}

// ============================================================================
// Retry
// ============================================================================

TEST_CASE("Synchronizer events - retry converges after repeated failures", "[sync][retry]") {
    auto leaf{std::make_shared<Layer>("leaf", "leaf.png")};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{leaf})};
    RecordingSynchronizer sync{root, verifying_options()};
    sync.failures_before_success[leaf->id()] = 3;
    sync.synchronize();

    CHECK(sync.layer_state(leaf->id()) == LayerSyncState::PENDING_RETRY);
    leaf->changed();
    leaf->changed();
    CHECK(sync.layer_state(leaf->id()) == LayerSyncState::PENDING_RETRY);
    CHECK(sync.create_calls_for(leaf->id()) == 3);

    leaf->changed();

    CHECK(sync.layer_state(leaf->id()) == LayerSyncState::MAPPED);
    CHECK(sync.create_calls_for(leaf->id()) == 4);
    CHECK(sync.all_created.size() == 1);
    CHECK(leaf->listener_count(LayerEventType::CHANGE) == 0);
    CHECK(leaf->listener_count(LayerEventType::CHANGE_Z_INDEX) == 1);
    CHECK(sync.pending_retry_count() == 0);

    leaf->changed();
    CHECK(sync.create_calls_for(leaf->id()) == 4);
    CHECK(sync.scene_layer_ids() == std::vector<layer_id_t>{leaf->id()});
}

TEST_CASE("Synchronizer events - a retried layer takes its place in the order", "[sync][retry]") {
    auto bottom{std::make_shared<Layer>("bottom", "bottom.png")};
    auto late{std::make_shared<Layer>("late")};
    auto top{std::make_shared<Layer>("top", "top.png")};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{bottom, late, top})};
    RecordingSynchronizer sync{root, verifying_options()};
    sync.failures_before_success[late->id()] = 1;
    sync.synchronize();
    REQUIRE(sync.scene_layer_ids() == std::vector<layer_id_t>{bottom->id(), top->id()});

    late->set_source("late.png");

    CHECK(sync.scene_layer_ids() == std::vector<layer_id_t>{bottom->id(), late->id(), top->id()});
}

TEST_CASE("Synchronizer events - other property changes do not retry", "[sync][retry]") {
    auto leaf{std::make_shared<Layer>("leaf")};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{leaf})};
    RecordingSynchronizer sync{root};
    sync.failures_before_success[leaf->id()] = 1;
    sync.synchronize();

    leaf->set_visible(false);
    leaf->set_opacity(0.5);
    leaf->set_z_index(2);

    CHECK(sync.create_calls_for(leaf->id()) == 1);
    CHECK(sync.layer_state(leaf->id()) == LayerSyncState::PENDING_RETRY);
}

// ============================================================================
// Z-index and collection replacement
// ============================================================================

TEST_CASE("Synchronizer events - a z-index change reorders", "[sync][order]") {
    auto x{std::make_shared<Layer>("x", "x.png")};
    x->set_z_index(1);
    auto y{std::make_shared<Layer>("y", "y.png")};
    y->set_z_index(0);
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{x, y})};
    RecordingSynchronizer sync{root};
    sync.synchronize();
    REQUIRE(sync.scene_layer_ids() == std::vector<layer_id_t>{y->id(), x->id()});
    const auto passes{sync.order_calls};

    y->set_z_index(5);

    CHECK(sync.order_calls == passes + 1);
    CHECK(sync.scene_layer_ids() == std::vector<layer_id_t>{x->id(), y->id()});

    // Setting the same value emits nothing.
    y->set_z_index(5);
    CHECK(sync.order_calls == passes + 1);
}

TEST_CASE("Synchronizer events - a z-index change on a transparent group reorders", "[sync][order]") {
    auto a{std::make_shared<Layer>("a", "a.png")};
    auto b{std::make_shared<Layer>("b", "b.png")};
    auto g{std::make_shared<LayerGroup>("g", LayerCollection::container_type{a})};
    auto h{std::make_shared<LayerGroup>("h", LayerCollection::container_type{b})};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{g, h})};
    RecordingSynchronizer sync{root, verifying_options()};
    sync.synchronize();
    REQUIRE(sync.scene_layer_ids() == std::vector<layer_id_t>{a->id(), b->id()});
    CHECK(g->listener_count(LayerEventType::CHANGE_Z_INDEX) == 1);
    CHECK(root->listener_count(LayerEventType::CHANGE_Z_INDEX) == 0);

    g->set_z_index(5);
    CHECK(sync.scene_layer_ids() == std::vector<layer_id_t>{b->id(), a->id()});

    // The leaf's own z-index still wins over the group's.
    a->set_z_index(-1);
    CHECK(sync.scene_layer_ids() == std::vector<layer_id_t>{a->id(), b->id()});

    root->layers()->remove(g);
    CHECK(g->listener_count() == 0);
    CHECK(sync.scene_layer_ids() == std::vector<layer_id_t>{b->id()});
}

TEST_CASE("Synchronizer events - a z-index change on a mapped group reorders", "[sync][order]") {
    auto a{std::make_shared<Layer>("a", "a.png")};
    auto group{std::make_shared<LayerGroup>("group", LayerCollection::container_type{a})};
    auto b{std::make_shared<Layer>("b", "b.png")};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{group, b})};
    RecordingSynchronizer sync{root, verifying_options()};
    sync.group_counterparts.insert(group->id());
    sync.synchronize();
    REQUIRE(sync.scene_layer_ids() == std::vector<layer_id_t>{group->id(), b->id()});
    const auto passes{sync.order_calls};

    group->set_z_index(2);

    CHECK(sync.order_calls == passes + 1);
    CHECK(sync.scene_layer_ids() == std::vector<layer_id_t>{b->id(), group->id()});
    CHECK(group->listener_count(LayerEventType::CHANGE_Z_INDEX) == 1);
}

TEST_CASE("Synchronizer events - a replaced collection is re-subscribed", "[sync][events]") {
    auto x{std::make_shared<Layer>("x", "x.png")};
    auto group{std::make_shared<LayerGroup>("group", LayerCollection::container_type{x})};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{group})};
    RecordingSynchronizer sync{root, verifying_options()};
    sync.synchronize();
    auto old_collection{group->layers()};

    auto w{std::make_shared<Layer>("w", "w.png")};
    group->set_layers(std::make_shared<LayerCollection>(LayerCollection::container_type{w}));

    // Existing mappings are left alone, only the subscriptions move.
    CHECK(sync.mapped_layer_ids() == std::vector<layer_id_t>{x->id()});
    CHECK_FALSE(sync.is_mapped(w->id()));
    CHECK(old_collection->listener_count() == 0);
    CHECK(group->layers()->listener_count() == 2);
    CHECK(sync.group_listener_count(group->id()) == 4);

    auto v{std::make_shared<Layer>("v", "v.png")};
    group->layers()->push_back(v);
    CHECK(sync.is_mapped(v->id()));

    old_collection->push_back(std::make_shared<Layer>("ignored", "ignored.png"));
    CHECK(sync.mapped_layer_count() == 2);

    sync.synchronize();
    CHECK(sync.mapped_layer_ids() == std::vector<layer_id_t>{w->id(), v->id()});
}

TEST_CASE("Synchronizer events - replacing the root collection", "[sync][events]") {
    auto x{std::make_shared<Layer>("x", "x.png")};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{x})};
    RecordingSynchronizer sync{root};
    sync.synchronize();

    root->set_layers(std::make_shared<LayerCollection>());
    auto y{std::make_shared<Layer>("y", "y.png")};
    root->layers()->push_back(y);

    CHECK(sync.mapped_layer_ids() == std::vector<layer_id_t>{x->id(), y->id()});
    // Unreachable layers follow the reachable ones.
    CHECK(sync.scene_layer_ids() == std::vector<layer_id_t>{y->id(), x->id()});
}

// ============================================================================
// Opacity and visibility
// ============================================================================

TEST_CASE("Synchronizer events - opacity and visibility changes refresh the counterparts", "[sync][events]") {
    auto x{std::make_shared<Layer>("x", "x.png")};
    auto y{std::make_shared<Layer>("y", "y.png")};
    auto group{std::make_shared<LayerGroup>("group", LayerCollection::container_type{x, y})};
    auto other{std::make_shared<Layer>("other", "other.png")};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{group, other})};
    RecordingSynchronizer sync{root, verifying_options()};
    sync.synchronize();
    const auto passes{sync.order_calls};

    x->set_opacity(0.5);
    x->set_visible(false);
    CHECK(sync.property_updates_for(x->id()) == 2);
    CHECK(sync.property_updates_for(y->id()) == 0);

    group->set_opacity(0.25);
    CHECK(sync.property_updates_for(x->id()) == 3);
    CHECK(sync.property_updates_for(y->id()) == 1);
    CHECK(sync.property_updates_for(other->id()) == 0);

    // The root is not part of any ancestry.
    root->set_visible(false);
    CHECK(sync.property_updates_for(other->id()) == 0);
    CHECK(sync.order_calls == passes);

    group->layers()->remove(x);
    group->set_visible(false);
    CHECK(sync.property_updates_for(x->id()) == 3);
    CHECK(sync.property_updates_for(y->id()) == 2);
    CHECK(group->listener_count(LayerEventType::CHANGE_OPACITY) == 1);
}

TEST_CASE("Synchronizer events - a pending layer is not refreshed", "[sync][events]") {
    auto leaf{std::make_shared<Layer>("leaf")};
    auto group{std::make_shared<LayerGroup>("group", LayerCollection::container_type{leaf})};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{group})};
    RecordingSynchronizer sync{root, verifying_options()};
    sync.failures_before_success[leaf->id()] = 1;
    sync.synchronize();
    REQUIRE(sync.layer_state(leaf->id()) == LayerSyncState::PENDING_RETRY);

    group->set_opacity(0.5);
    CHECK(group->listener_count(LayerEventType::CHANGE_OPACITY) == 0);
    CHECK(sync.property_updates_for(leaf->id()) == 0);

    leaf->changed();
    REQUIRE(sync.layer_state(leaf->id()) == LayerSyncState::MAPPED);
    group->set_opacity(1.0);
    CHECK(sync.property_updates_for(leaf->id()) == 1);
}

// ============================================================================
// Backend failures
// ============================================================================

TEST_CASE("Synchronizer events - a rejected retry stays pending", "[sync][retry]") {
    auto leaf{std::make_shared<Layer>("leaf", "leaf.png")};
    auto root{std::make_shared<LayerGroup>("root", LayerCollection::container_type{leaf})};
    RecordingSynchronizer sync{root, verifying_options()};
    sync.counterparts_per_layer = 2;
    sync.failures_before_success[leaf->id()] = 1;
    sync.synchronize();
    REQUIRE(sync.layer_state(leaf->id()) == LayerSyncState::PENDING_RETRY);

    sync.reject_second_counterpart.insert(leaf->id());
    CHECK_THROWS_AS(leaf->changed(), std::runtime_error);

    CHECK(sync.layer_state(leaf->id()) == LayerSyncState::PENDING_RETRY);
    CHECK(sync.pending_retry_count() == 1);
    CHECK(leaf->listener_count(LayerEventType::CHANGE) == 1);
    CHECK(leaf->listener_count(LayerEventType::CHANGE_Z_INDEX) == 0);
    CHECK(sync.scene.empty());
    REQUIRE(sync.all_created.size() == 2);
    CHECK(sync.all_created[0]->destroy_count == 1);
    CHECK_NOTHROW(sync.check_invariants());

    sync.reject_second_counterpart.clear();
    leaf->changed();
    CHECK(sync.layer_state(leaf->id()) == LayerSyncState::MAPPED);
    CHECK(sync.scene.size() == 2);
}
