/**
 * @file test_entt_world.cpp
 * @brief Unit tests for the EnTT-backed world adapter.
 */

#include <catch2/catch_test_macros.hpp>

#include "helpers/test_utils.hpp"

using namespace modbridge;
using namespace test_helpers;

TEST_CASE("Queries return fetched components in ascending entity order", "[world][query]") {
    WorldFixture fx;
    auto a = fx.spawn_moving(1, 0, 0, 0, 1, 0);
    auto b = fx.spawn_moving(2, 0, 0, 0, 2, 0);

    // Position only
    auto& registry = fx.world.registry();
    registry.emplace<components::Position>(registry.create(), 9.0f, 9.0f, 9.0f);

    world::WorldQuery q;
    q.fetch = {components::kVelocityId, components::kPositionId};

    auto rows = fx.world.query(q);
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].entity == a);
    REQUIRE(rows[1].entity == b);
    REQUIRE(rows[0].entity < rows[1].entity);

    REQUIRE(rows[0].components.size() == 2);
    REQUIRE(rows[0].components[0].id == components::kVelocityId);
    REQUIRE(rows[0].components[1].id == components::kPositionId);
    REQUIRE(rows[1].components[1].payload == position_bytes(2, 0, 0));
}

TEST_CASE("With and without filters", "[world][query]") {
    WorldFixture fx;
    auto moving = fx.spawn_moving(0, 0, 0, 1, 1, 1);
    auto& registry = fx.world.registry();
    auto still = registry.create();
    registry.emplace<components::Position>(still, 5.0f, 5.0f, 5.0f);

    world::WorldQuery q;
    q.fetch = {components::kPositionId};

    SECTION("with") {
        q.with = {components::kVelocityId};
        auto rows = fx.world.query(q);
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].entity == moving);
        // Filter components are not returned
        REQUIRE(rows[0].components.size() == 1);
    }

    SECTION("without") {
        q.without = {components::kVelocityId};
        auto rows = fx.world.query(q);
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].entity == world::EnttWorld::to_id(still));
    }

    SECTION("unknown ids") {
        q.without = {"not_registered"};
        REQUIRE(fx.world.query(q).size() == 2);

        q.with = {"not_registered"};
        REQUIRE(fx.world.query(q).empty());
    }
}

TEST_CASE("Spawn, insert, remove and despawn", "[world][mutation]") {
    WorldFixture fx;

    std::vector<world::ComponentValue> values = {
        {components::kPositionId, position_bytes(1, 2, 3)},
        {"nonsense", {1, 2}},
    };
    std::vector<Status> failures;
    auto id = fx.world.spawn(values, failures);

    REQUIRE(fx.world.contains(id));
    REQUIRE(failures.size() == 1);
    REQUIRE(failures[0].code == ErrorCode::UnknownComponentType);
    REQUIRE(fx.position_of(id).z == 3.0f);

    SECTION("insert replaces") {
        REQUIRE(fx.world.insert(id, components::kPositionId, position_bytes(4, 5, 6)));
        REQUIRE(fx.position_of(id).x == 4.0f);
    }

    SECTION("insert validates") {
        Bytes bad{1, 2, 3};
        REQUIRE(fx.world.insert(id, components::kPositionId, bad).code == ErrorCode::SchemaMismatch);
        REQUIRE(fx.position_of(id).x == 1.0f);
    }

    SECTION("remove") {
        fx.world.remove(id, components::kPositionId);
        REQUIRE(fx.count_with(components::kPositionId) == 0);
        // Removing again is a no-op
        fx.world.remove(id, components::kPositionId);
        REQUIRE(fx.world.contains(id));
    }

    SECTION("despawn") {
        fx.world.despawn(id);
        REQUIRE_FALSE(fx.world.contains(id));
        fx.world.despawn(id);
        REQUIRE(fx.world.insert(id, components::kPositionId, position_bytes(0, 0, 0)).code ==
                ErrorCode::UnknownEntity);
    }
}

TEST_CASE("Guest components live beside host components", "[world][guest]") {
    WorldFixture fx;
    REQUIRE(fx.types.register_guest_type("score", 4));
    auto id = fx.spawn_moving(0, 0, 0, 0, 0, 0);

    Bytes score{1, 0, 0, 0};
    REQUIRE(fx.world.insert(id, "score", score));

    world::WorldQuery q;
    q.fetch = {"score", components::kPositionId};
    auto rows = fx.world.query(q);
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].components[0].payload == score);

    fx.world.remove(id, "score");
    REQUIRE(fx.world.query(q).empty());
    REQUIRE(fx.count_with(components::kPositionId) == 1);
}

TEST_CASE("Out of range ids never resolve", "[world]") {
    WorldFixture fx;
    REQUIRE_FALSE(fx.world.contains(EntityId{1} << 40));
    REQUIRE_FALSE(fx.world.contains(0));
}
