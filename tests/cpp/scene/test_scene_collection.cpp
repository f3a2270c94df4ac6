/**
 * @file test_scene_collection.cpp
 * @brief Unit tests for the scene backend's object collection.
 */

#include <catch2/catch_test_macros.hpp>
#include <layersync/scene/scene_collection.h>
#include <layersync/util/errors.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace layersync;

namespace {

SceneObject::s_ptr make_object(std::string name) {
    return std::make_shared<SceneObject>(SceneObjectKind::LAYER, 1, std::move(name), std::vector<std::string>{"src"},
                                         1.0, true);
}

std::vector<std::string> names(const SceneCollection &scene) {
    std::vector<std::string> result;
    for (const auto &object : scene.objects()) { result.push_back(object->name()); }
    return result;
}

}  // namespace

TEST_CASE("SceneCollection - add appends on top", "[scene]") {
    SceneCollection scene;
    auto a{make_object("a")};
    auto b{make_object("b")};

    scene.add(a);
    scene.add(b);

    CHECK(names(scene) == std::vector<std::string>{"a", "b"});
    CHECK(scene.index_of(b) == 1u);
    CHECK(scene.contains(a));
}

TEST_CASE("SceneCollection - add rejects misuse", "[scene]") {
    SceneCollection scene;
    auto a{make_object("a")};
    scene.add(a);

    CHECK_THROWS_AS(scene.add(a), SceneError);
    CHECK_THROWS_AS(scene.add(nullptr), SceneError);

    auto destroyed{make_object("destroyed")};
    scene.destroy(destroyed);
    CHECK_THROWS_AS(scene.add(destroyed), SceneError);
}

TEST_CASE("SceneCollection - remove with and without destroy", "[scene]") {
    SceneCollection scene;
    auto a{make_object("a")};
    auto b{make_object("b")};
    scene.add(a);
    scene.add(b);

    CHECK(scene.remove(a, false));
    CHECK_FALSE(a->is_destroyed());
    CHECK(scene.remove(b, true));
    CHECK(b->is_destroyed());
    CHECK_FALSE(scene.remove(b, true));

    CHECK(scene.empty());
    CHECK(scene.destroy_count() == 1);
}

TEST_CASE("SceneCollection - destroying twice is an error", "[scene]") {
    SceneCollection scene;
    auto a{make_object("a")};

    scene.destroy(a);
    CHECK_THROWS_AS(scene.destroy(a), SceneError);
    CHECK(scene.destroy_count() == 1);
}

TEST_CASE("SceneCollection - remove_all", "[scene]") {
    SceneCollection scene;
    auto a{make_object("a")};
    auto b{make_object("b")};
    scene.add(a);
    scene.add(b);

    SECTION("keeping the objects") {
        scene.remove_all(false);
        CHECK(scene.destroy_count() == 0);
        CHECK_FALSE(a->is_destroyed());
    }

    SECTION("destroying the objects") {
        scene.remove_all(true);
        CHECK(scene.destroy_count() == 2);
        CHECK(a->is_destroyed());
        CHECK(b->is_destroyed());
    }

    CHECK(scene.empty());
}

TEST_CASE("SceneCollection - reorder", "[scene]") {
    SceneCollection scene;
    auto a{make_object("a")};
    auto b{make_object("b")};
    auto c{make_object("c")};
    scene.add(a);
    scene.add(b);
    scene.add(c);

    SECTION("full order") {
        scene.reorder({c, a, b});
        CHECK(names(scene) == std::vector<std::string>{"c", "a", "b"});
    }

    SECTION("unlisted objects stay at the bottom") {
        scene.reorder({c, a});
        CHECK(names(scene) == std::vector<std::string>{"b", "c", "a"});
    }

    SECTION("objects outside the collection are ignored") {
        scene.reorder({make_object("stranger"), b, a, c});
        CHECK(names(scene) == std::vector<std::string>{"b", "a", "c"});
    }
}

TEST_CASE("SceneCollection - reorder places each object once", "[scene]") {
    SceneCollection scene;
    auto a{make_object("a")};
    auto b{make_object("b")};
    scene.add(a);
    scene.add(b);

    scene.reorder({b, a, b});

    CHECK(names(scene) == std::vector<std::string>{"b", "a"});
}

TEST_CASE("SceneCollection - reorder of a large collection", "[scene]") {
    SceneCollection scene;
    std::vector<SceneObject::s_ptr> reversed;
    for (int i = 0; i < 5000; ++i) {
        auto object{make_object(std::to_string(i))};
        scene.add(object);
        reversed.push_back(object);
    }
    std::reverse(reversed.begin(), reversed.end());

    scene.reorder(reversed);

    REQUIRE(scene.size() == 5000);
    CHECK(scene.objects().front()->name() == "4999");
    CHECK(scene.objects().back()->name() == "0");
    CHECK(scene.objects() == reversed);
}

TEST_CASE("SceneCollection - update_properties", "[scene]") {
    SceneCollection scene;
    auto a{make_object("a")};
    scene.add(a);

    scene.update_properties(a, 0.5, false);
    CHECK(a->opacity() == 0.5);
    CHECK_FALSE(a->visible());

    scene.destroy(a);
    CHECK_THROWS_AS(scene.update_properties(a, 1.0, true), SceneError);
    CHECK_THROWS_AS(scene.update_properties(nullptr, 1.0, true), SceneError);
}

TEST_CASE("SceneObject - kind names", "[scene]") {
    CHECK(to_string(SceneObjectKind::LAYER) == "LAYER");
    CHECK(to_string(SceneObjectKind::COMPOSITE) == "COMPOSITE");
}
