#pragma once

/**
 * @file test_utils.hpp
 * @brief Common test utilities: world fixture, payload builders, log capture.
 */

#include <modbridge/bridge/mod_host.hpp>
#include <modbridge/components/common.hpp>
#include <modbridge/core/logger.hpp>
#include <modbridge/world/entt_world.hpp>

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace test_helpers {

using namespace modbridge;

// =============================================================================
// Payload helpers
// =============================================================================

/** @brief Bytes of a string (guest chunks, raw payloads). */
inline Bytes bytes_of(std::string_view s) {
    return Bytes(s.begin(), s.end());
}

inline Bytes position_bytes(float x, float y, float z) {
    return components::position_codec().encode(components::Position{x, y, z});
}

inline Bytes velocity_bytes(float x, float y, float z) {
    return components::velocity_codec().encode(components::Velocity{x, y, z});
}

// =============================================================================
// World fixture
// =============================================================================

/**
 * @brief Component registry with the common types plus an EnTT world over it.
 */
struct WorldFixture {
    components::ComponentTypeRegistry types;
    world::EnttWorld world{types};

    WorldFixture() {
        (void)components::register_common_components(types);
    }

    EntityId spawn_moving(float x, float y, float z, float vx, float vy, float vz) {
        auto& registry = world.registry();
        auto e = registry.create();
        registry.emplace<components::Position>(e, x, y, z);
        registry.emplace<components::Velocity>(e, vx, vy, vz);
        return world::EnttWorld::to_id(e);
    }

    components::Position position_of(EntityId id) {
        return world.registry().get<components::Position>(world::EnttWorld::to_entity(id));
    }

    std::size_t count_with(const ComponentId& id) const {
        world::WorldQuery q;
        q.fetch.push_back(id);
        return world.query(q).size();
    }
};

/** @brief Host config with small sandbox budgets so runaway guests fail fast. */
inline core::HostConfig test_config(unsigned workers = 0, unsigned instances = 1) {
    core::HostConfig cfg;
    cfg.sandbox.max_memory_mb = 16;
    cfg.sandbox.max_instructions = 2000000;
    cfg.sandbox.max_time_sec = 2.0;
    cfg.scheduler.worker_threads = workers;
    cfg.scheduler.instances_per_module = instances;
    return cfg;
}

// =============================================================================
// Log capture
// =============================================================================

/**
 * @brief Installs a Logger sink for its lifetime and records every line.
 */
class LogCapture {
public:
    LogCapture() {
        core::Logger::instance().set_sink([this](LogLevel level, std::string_view msg) {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back(std::string(core::log_level_prefix(level)) + std::string(msg));
        });
    }

    ~LogCapture() {
        core::Logger::instance().set_sink(nullptr);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    bool contains(std::string_view needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(lines_.begin(), lines_.end(), [&](const std::string& line) {
            return line.find(needle) != std::string::npos;
        });
    }

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

// =============================================================================
// Guest sources
// =============================================================================

namespace guests {

/** @brief Moves every entity by its velocity. */
inline constexpr const char* kMover = R"lua(
function setup(app)
    app:add_system("update", "move", {
        query = { {"position", "write"}, {"velocity", "read"} },
    })
end

function move(query, commands)
    for _, row in ipairs(query) do
        local x, y, z = string.unpack("<fff", row.components.position)
        local vx, vy, vz = string.unpack("<fff", row.components.velocity)
        commands:insert(row.entity, "position", string.pack("<fff", x + vx, y + vy, z + vz))
    end
end
)lua";

/** @brief Spawns one entity per call. */
inline constexpr const char* kSpawner = R"lua(
function setup(app)
    app:add_system("update", "spawn_one")
end

function spawn_one(query, commands)
    commands:spawn({ position = string.pack("<fff", 1, 2, 3) })
end
)lua";

/** @brief System that always raises. */
inline constexpr const char* kTrapper = R"lua(
function setup(app)
    app:add_system("update", "explode")
end

function explode(query, commands)
    commands:spawn({ position = string.pack("<fff", 0, 0, 0) })
    error("boom")
end
)lua";

/** @brief Module whose setup raises. */
inline constexpr const char* kBrokenSetup = R"lua(
function setup(app)
    error("setup exploded")
end
)lua";

/** @brief Does not parse. */
inline constexpr const char* kSyntaxError = R"lua(
function setup(app
)lua";

} // namespace guests

} // namespace test_helpers
