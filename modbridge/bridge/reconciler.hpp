#pragma once

#include "command_buffer.hpp"

#include <modbridge/components/component_registry.hpp>
#include <modbridge/core/config.hpp>
#include <modbridge/core/error.hpp>
#include <modbridge/world/world.hpp>

#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace modbridge::bridge {

struct ApplyFailure {
    std::size_t index{0};   // position of the command in the buffer
    ErrorCode code{ErrorCode::None};
    std::string message;
};

struct ApplyReport {
    ModuleHandle module{kInvalidModule};
    std::string system;

    std::size_t applied{0};
    std::size_t skipped{0};
    bool aborted{false};    // an OrderingError stopped the buffer

    std::vector<ApplyFailure> failures;

    // provisional index -> real entity id
    std::vector<std::pair<std::uint32_t, EntityId>> spawned;

    bool ok() const { return failures.empty() && !aborted; }
    explicit operator bool() const { return ok(); }
};

// Applies command buffers to the world, one buffer at a time, under the world
// mutex. Invalid commands are skipped and reported; a reference to a spawn
// that has not happened yet aborts the rest of the buffer.
class Reconciler {
public:
    Reconciler(world::IWorld& world,
               components::ComponentTypeRegistry& types,
               core::ComponentSettings settings = {});

    Reconciler(const Reconciler&) = delete;
    Reconciler& operator=(const Reconciler&) = delete;

    ApplyReport apply(const CommandBuffer& buffer, ModuleHandle module, const std::string& system);

    // Host access to the world between phases. Do not call apply() while holding it.
    std::unique_lock<std::mutex> exclusive_access();

    // Stops tracking the entities `module` spawned, despawning the ones still
    // alive if `despawn` is set. Returns how many were despawned.
    std::size_t release_module(ModuleHandle module, bool despawn);

    // Live entities spawned through buffers of `module`.
    std::size_t spawned_by(ModuleHandle module);

    const core::ComponentSettings& settings() const { return settings_; }

private:
    struct ApplyContext;

    void apply_spawn(ApplyContext& ctx, std::size_t index, const Command& cmd);
    void apply_despawn(ApplyContext& ctx, std::size_t index, const Command& cmd);
    void apply_insert(ApplyContext& ctx, std::size_t index, const Command& cmd);
    void apply_remove(ApplyContext& ctx, std::size_t index, const Command& cmd);

    // Resolves a provisional ref; false on an unresolvable one (OrderingError).
    bool resolve(ApplyContext& ctx, std::size_t index, const EntityRef& ref, EntityId& out);

    // Checks a payload against the registered codec (registering guest types if enabled).
    Status check_payload(const ComponentId& id, std::span<const std::uint8_t> bytes);

    world::IWorld& world_;
    components::ComponentTypeRegistry& types_;
    core::ComponentSettings settings_;
    std::mutex worldMutex_;

    // entity -> module whose buffer spawned it, guarded by worldMutex_
    std::unordered_map<EntityId, ModuleHandle> spawnedBy_;
};

} // namespace modbridge::bridge
