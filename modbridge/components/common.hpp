#pragma once

// =============================================================================
// Common components - host-native types most embedders register
// =============================================================================
//
// Guests see them under the ids below and decode them with the layout from
// host.layout(id), e.g.:
//
//   local x, y, z = string.unpack("<fff", row.components["position"])
//

#include "component_registry.hpp"

namespace modbridge::components {

struct Position {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};
};

struct Velocity {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};
};

/// Basic health component
struct Health {
    std::int32_t current{100};
    std::int32_t max{100};
};

inline constexpr const char* kPositionId = "position";
inline constexpr const char* kVelocityId = "velocity";
inline constexpr const char* kHealthId = "health";

inline StructCodec<Position> position_codec() {
    return StructCodec<Position>(
        "<fff",
        [](core::ByteWriter& w, const Position& p) {
            w.write_f32(p.x);
            w.write_f32(p.y);
            w.write_f32(p.z);
        },
        [](core::ByteReader& r, Position& p) {
            p.x = r.read_f32();
            p.y = r.read_f32();
            p.z = r.read_f32();
        });
}

inline StructCodec<Velocity> velocity_codec() {
    return StructCodec<Velocity>(
        "<fff",
        [](core::ByteWriter& w, const Velocity& v) {
            w.write_f32(v.x);
            w.write_f32(v.y);
            w.write_f32(v.z);
        },
        [](core::ByteReader& r, Velocity& v) {
            v.x = r.read_f32();
            v.y = r.read_f32();
            v.z = r.read_f32();
        });
}

inline StructCodec<Health> health_codec() {
    return StructCodec<Health>(
        "<i4i4",
        [](core::ByteWriter& w, const Health& h) {
            w.write_i32(h.current);
            w.write_i32(h.max);
        },
        [](core::ByteReader& r, Health& h) {
            h.current = r.read_i32();
            h.max = r.read_i32();
        });
}

inline Status register_common_components(ComponentTypeRegistry& registry) {
    if (auto s = registry.register_type<Position>(kPositionId, position_codec()); !s) return s;
    if (auto s = registry.register_type<Velocity>(kVelocityId, velocity_codec()); !s) return s;
    return registry.register_type<Health>(kHealthId, health_codec());
}

} // namespace modbridge::components
