#pragma once

#include <modbridge/core/types.hpp>
#include <modbridge/world/world.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace modbridge::bridge {

// Target of a command: an entity that exists in the world, or the entity
// created by the n-th spawn of the same buffer.
struct EntityRef {
    enum class Kind : std::uint8_t {
        Existing,
        Provisional,
    };

    Kind kind{Kind::Existing};
    std::uint64_t value{0};

    static EntityRef existing(EntityId id) { return {Kind::Existing, id}; }
    static EntityRef provisional(std::uint32_t index) { return {Kind::Provisional, index}; }

    bool is_provisional() const { return kind == Kind::Provisional; }

    std::string describe() const;
};

enum class CommandType : std::uint8_t {
    Spawn,
    Despawn,
    Insert,
    Remove,
};

const char* command_type_name(CommandType type);

struct Command {
    CommandType type{CommandType::Spawn};
    EntityRef target{};                              // Despawn, Insert, Remove
    ComponentId component{};                         // Insert, Remove
    Bytes payload{};                                 // Insert
    std::vector<world::ComponentValue> components{}; // Spawn
};

// ============================================================================
// CommandBuffer - ordered mutation log produced by one guest call
//
// Spawns get provisional refs numbered in recording order; the reconciler
// maps them to real ids when the buffer is applied.
// ============================================================================

class CommandBuffer {
public:
    CommandBuffer() = default;

    CommandBuffer(const CommandBuffer&) = delete;
    CommandBuffer& operator=(const CommandBuffer&) = delete;
    CommandBuffer(CommandBuffer&&) = default;
    CommandBuffer& operator=(CommandBuffer&&) = default;

    EntityRef spawn(std::vector<world::ComponentValue> components);
    void despawn(EntityRef target);
    void insert(EntityRef target, ComponentId component, Bytes payload);
    void remove(EntityRef target, ComponentId component);

    const std::vector<Command>& commands() const { return commands_; }
    std::size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }

    std::uint32_t spawn_count() const { return spawnCount_; }

    void clear();

private:
    std::vector<Command> commands_;
    std::uint32_t spawnCount_{0};
};

} // namespace modbridge::bridge
