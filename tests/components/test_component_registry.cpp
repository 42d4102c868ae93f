/**
 * @file test_component_registry.cpp
 * @brief Unit tests for component type registration and payload codecs.
 */

#include <catch2/catch_test_macros.hpp>

#include <modbridge/components/common.hpp>
#include <modbridge/components/component_registry.hpp>

#include <vector>

using namespace modbridge;
using namespace modbridge::components;

namespace {

struct Marker {
    std::uint8_t value{0};
};

StructCodec<Marker> marker_codec(const char* signature) {
    return StructCodec<Marker>(
        signature,
        [](core::ByteWriter& w, const Marker& m) { w.write_u8(m.value); },
        [](core::ByteReader& r, Marker& m) { m.value = r.read_u8(); });
}

} // namespace

// =============================================================================
// Registration
// =============================================================================

TEST_CASE("Registering a host type", "[components][registry]") {
    ComponentTypeRegistry registry;
    REQUIRE(registry.register_type<Position>(kPositionId, position_codec()));
    REQUIRE(registry.contains(kPositionId));
    REQUIRE(registry.size() == 1);

    auto desc = registry.find(kPositionId);
    REQUIRE(desc);
    REQUIRE(desc->codec->signature() == "<fff");
    REQUIRE_FALSE(desc->guestDefined);
}

TEST_CASE("Re-registration is idempotent only for identical types", "[components][registry]") {
    ComponentTypeRegistry registry;
    REQUIRE(registry.register_type<Position>(kPositionId, position_codec()));

    SECTION("same type and layout") {
        REQUIRE(registry.register_type<Position>(kPositionId, position_codec()));
        REQUIRE(registry.size() == 1);
    }

    SECTION("same layout, different native type") {
        auto status = registry.register_type<Velocity>(kPositionId, velocity_codec());
        REQUIRE(status.code == ErrorCode::DuplicateIncompatibleType);
    }

    SECTION("different layout") {
        auto status = registry.register_type<Marker>(kPositionId, marker_codec("<B"));
        REQUIRE(status.code == ErrorCode::DuplicateIncompatibleType);
    }

    SECTION("guest type over a host type") {
        auto status = registry.register_guest_type(kPositionId, 12);
        REQUIRE(status.code == ErrorCode::DuplicateIncompatibleType);
    }

    // The first descriptor is untouched
    REQUIRE(registry.find(kPositionId)->codec->signature() == "<fff");
}

TEST_CASE("Guest types", "[components][registry][guest]") {
    ComponentTypeRegistry registry;
    REQUIRE(registry.register_guest_type("score", 4));
    REQUIRE(registry.register_guest_type("score", 4));
    REQUIRE(registry.register_guest_type("tag"));

    REQUIRE(registry.find("score")->codec->signature() == "c4");
    REQUIRE(registry.find("tag")->codec->signature() == "blob");
    REQUIRE(registry.find("score")->guestDefined);

    REQUIRE(registry.register_guest_type("score", 8).code == ErrorCode::DuplicateIncompatibleType);

    Bytes four{1, 2, 3, 4};
    Bytes three{1, 2, 3};
    REQUIRE(registry.validate("score", four));
    REQUIRE(registry.validate("score", three).code == ErrorCode::SchemaMismatch);
    REQUIRE(registry.validate("tag", three));
}

// =============================================================================
// Codecs
// =============================================================================

TEST_CASE("Typed encode and decode", "[components][codec]") {
    ComponentTypeRegistry registry;
    REQUIRE(register_common_components(registry));

    Bytes bytes;
    REQUIRE(registry.encode(kPositionId, Position{1.0f, 2.0f, 3.0f}, bytes));
    REQUIRE(bytes.size() == 12);

    Position out;
    REQUIRE(registry.decode(kPositionId, bytes, out));
    REQUIRE(out.x == 1.0f);
    REQUIRE(out.y == 2.0f);
    REQUIRE(out.z == 3.0f);

    SECTION("velocity") {
        REQUIRE(registry.encode(kVelocityId, Velocity{-0.5f, 0.0f, 9.75f}, bytes));
        REQUIRE(bytes.size() == 12);

        Velocity v;
        REQUIRE(registry.decode(kVelocityId, bytes, v));
        REQUIRE(v.x == -0.5f);
        REQUIRE(v.y == 0.0f);
        REQUIRE(v.z == 9.75f);
    }

    SECTION("health") {
        REQUIRE(registry.encode(kHealthId, Health{-3, 250}, bytes));
        REQUIRE(bytes.size() == 8);
        REQUIRE(registry.find(kHealthId)->codec->signature() == "<i4i4");

        Health h;
        REQUIRE(registry.decode(kHealthId, bytes, h));
        REQUIRE(h.current == -3);
        REQUIRE(h.max == 250);
    }

    SECTION("wrong native type") {
        Velocity v;
        REQUIRE(registry.decode(kPositionId, bytes, v).code == ErrorCode::SchemaMismatch);
    }

    SECTION("unknown id") {
        REQUIRE(registry.decode("mass", bytes, out).code == ErrorCode::UnknownComponentType);
        REQUIRE(registry.validate("mass", bytes).code == ErrorCode::UnknownComponentType);
    }
}

TEST_CASE("Malformed payloads are schema mismatches, not exceptions", "[components][codec]") {
    ComponentTypeRegistry registry;
    REQUIRE(register_common_components(registry));

    Position untouched{7.0f, 7.0f, 7.0f};

    SECTION("short") {
        Bytes shortPayload{0, 0, 128, 63};
        auto status = registry.decode(kPositionId, shortPayload, untouched);
        REQUIRE(status.code == ErrorCode::SchemaMismatch);
    }

    SECTION("trailing bytes") {
        Bytes longPayload(13, 0);
        REQUIRE(registry.validate(kPositionId, longPayload).code == ErrorCode::SchemaMismatch);
    }

    REQUIRE(untouched.x == 7.0f);
}

TEST_CASE("Guest blobs pass through storage verbatim", "[components][codec][guest]") {
    ComponentTypeRegistry registry;
    REQUIRE(register_common_components(registry));
    REQUIRE(registry.register_guest_type("score", 4));

    auto desc = registry.find("score");
    REQUIRE(desc);

    Bytes payload{0xde, 0xad, 0x00, 0x01};
    REQUIRE(desc->codec->validate(payload));

    entt::registry world;
    auto entity = world.create();
    REQUIRE_FALSE(desc->storage->contains(world, entity));
    REQUIRE(desc->storage->write(world, entity, payload));
    REQUIRE(desc->storage->contains(world, entity));
    REQUIRE(desc->storage->read(world, entity) == payload);
    REQUIRE(desc->storage->collect(world) == std::vector<entt::entity>{entity});

    // A host component on the same entity is independent of the blob
    auto position = registry.find(kPositionId);
    Bytes encoded;
    REQUIRE(registry.encode(kPositionId, Position{1.0f, 2.0f, 3.0f}, encoded));
    REQUIRE(position->storage->write(world, entity, encoded));
    REQUIRE(desc->storage->read(world, entity) == payload);

    desc->storage->erase(world, entity);
    REQUIRE_FALSE(desc->storage->contains(world, entity));
    REQUIRE(position->storage->read(world, entity) == encoded);
}
