/**
 * @file test_system_registry.cpp
 * @brief Unit tests for the per-module system table.
 */

#include <catch2/catch_test_macros.hpp>

#include <modbridge/bridge/system_registry.hpp>

using namespace modbridge;
using namespace modbridge::bridge;

namespace {

SystemRegistration make_reg(ModuleHandle module, std::uint32_t slot, std::uint32_t index,
                            const std::string& phase, const std::string& name) {
    SystemRegistration reg;
    reg.module = module;
    reg.generation = 1;
    reg.slot = slot;
    reg.index = index;
    reg.phase = phase;
    reg.name = name;
    return reg;
}

} // namespace

TEST_CASE("Entries are ordered by module slot then declaration", "[bridge][systems]") {
    SystemRegistry registry;

    REQUIRE(registry.replace(2, {make_reg(2, 1, 0, "update", "b0"), make_reg(2, 1, 1, "update", "b1")}));
    REQUIRE(registry.replace(1, {make_reg(1, 0, 0, "update", "a0"), make_reg(1, 0, 1, "post_update", "a1"),
                                 make_reg(1, 0, 2, "update", "a2")}));

    auto update = registry.entries_for("update");
    REQUIRE(update.size() == 4);
    REQUIRE(update[0]->name == "a0");
    REQUIRE(update[1]->name == "a2");
    REQUIRE(update[2]->name == "b0");
    REQUIRE(update[3]->name == "b1");

    REQUIRE(registry.entries_for("post_update").size() == 1);
    REQUIRE(registry.entries_for("fixed_update").empty());
    REQUIRE(registry.size() == 5);
    REQUIRE(registry.count(1) == 3);
    const std::vector<std::string> phases{"post_update", "update"};
    REQUIRE(registry.phases() == phases);
}

TEST_CASE("Replace swaps a module's set as a whole", "[bridge][systems]") {
    SystemRegistry registry;
    REQUIRE(registry.replace(1, {make_reg(1, 0, 0, "update", "old_a"), make_reg(1, 0, 1, "update", "old_b")}));

    auto snapshot = registry.entries_for("update");

    REQUIRE(registry.replace(1, {make_reg(1, 0, 0, "update", "new_a")}));
    REQUIRE(registry.count(1) == 1);
    REQUIRE(registry.entries_for("update")[0]->name == "new_a");

    // Earlier snapshots are unaffected
    REQUIRE(snapshot.size() == 2);
    REQUIRE(snapshot[0]->name == "old_a");

    SECTION("rejected replacement changes nothing") {
        auto status = registry.replace(1, {make_reg(1, 0, 0, "update", "dup"), make_reg(1, 0, 1, "update", "dup")});
        REQUIRE(status.code == ErrorCode::InterfaceMismatch);

        status = registry.replace(1, {make_reg(9, 0, 0, "update", "foreign")});
        REQUIRE(status.code == ErrorCode::InterfaceMismatch);

        REQUIRE(registry.entries_for("update")[0]->name == "new_a");
    }

    SECTION("clear") {
        registry.clear(1);
        REQUIRE(registry.count(1) == 0);
        REQUIRE(registry.size() == 0);
    }
}

TEST_CASE("Query shapes", "[bridge][systems]") {
    QueryShape shape;
    REQUIRE(shape.empty());

    shape.fetch = {{"position", Access::Write}, {"velocity", Access::Read}};
    shape.without = {"frozen"};

    REQUIRE_FALSE(shape.empty());
    REQUIRE(shape.access_of("position") == Access::Write);
    REQUIRE(shape.access_of("velocity") == Access::Read);
    REQUIRE_FALSE(shape.access_of("health").has_value());

    auto q = shape.to_world_query();
    const std::vector<ComponentId> fetch{"position", "velocity"};
    const std::vector<ComponentId> without{"frozen"};
    REQUIRE(q.fetch == fetch);
    REQUIRE(q.without == without);
}
