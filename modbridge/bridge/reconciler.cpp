#include "reconciler.hpp"

#include <modbridge/core/logger.hpp>

namespace modbridge::bridge {

struct Reconciler::ApplyContext {
    ApplyReport& report;
    std::vector<EntityId> resolved;   // indexed by provisional index

    void fail(std::size_t index, ErrorCode code, std::string message) {
        report.failures.push_back(ApplyFailure{index, code, std::move(message)});
    }
};

Reconciler::Reconciler(world::IWorld& world,
                       components::ComponentTypeRegistry& types,
                       core::ComponentSettings settings)
    : world_(world), types_(types), settings_(settings) {}

std::unique_lock<std::mutex> Reconciler::exclusive_access() {
    return std::unique_lock<std::mutex>(worldMutex_);
}

std::size_t Reconciler::release_module(ModuleHandle module, bool despawn) {
    std::lock_guard<std::mutex> lock(worldMutex_);
    std::size_t despawned = 0;
    for (auto it = spawnedBy_.begin(); it != spawnedBy_.end();) {
        if (it->second != module) {
            ++it;
            continue;
        }
        if (despawn && world_.contains(it->first)) {
            world_.despawn(it->first);
            ++despawned;
        }
        it = spawnedBy_.erase(it);
    }
    return despawned;
}

std::size_t Reconciler::spawned_by(ModuleHandle module) {
    std::lock_guard<std::mutex> lock(worldMutex_);
    std::size_t count = 0;
    for (const auto& [entity, owner] : spawnedBy_) {
        if (owner == module && world_.contains(entity)) {
            ++count;
        }
    }
    return count;
}

ApplyReport Reconciler::apply(const CommandBuffer& buffer, ModuleHandle module, const std::string& system) {
    ApplyReport report;
    report.module = module;
    report.system = system;

    if (buffer.empty()) {
        return report;
    }

    ApplyContext ctx{report, {}};
    ctx.resolved.reserve(buffer.spawn_count());

    std::lock_guard<std::mutex> lock(worldMutex_);

    const auto& commands = buffer.commands();
    for (std::size_t i = 0; i < commands.size() && !report.aborted; ++i) {
        const auto& cmd = commands[i];
        switch (cmd.type) {
            case CommandType::Spawn:   apply_spawn(ctx, i, cmd); break;
            case CommandType::Despawn: apply_despawn(ctx, i, cmd); break;
            case CommandType::Insert:  apply_insert(ctx, i, cmd); break;
            case CommandType::Remove:  apply_remove(ctx, i, cmd); break;
        }
    }

    if (!report.failures.empty()) {
        std::string msg = "Reconciler: " + system + " (module " + std::to_string(module) + "): " +
                          std::to_string(report.applied) + " applied, " +
                          std::to_string(report.skipped) + " skipped";
        if (report.aborted) {
            msg += ", aborted at command " + std::to_string(report.failures.back().index);
        }
        core::log_warning(msg);
        for (const auto& f : report.failures) {
            core::log_debug("  [" + std::to_string(f.index) + "] " + error_code_name(f.code) + ": " + f.message);
        }
    }

    return report;
}

bool Reconciler::resolve(ApplyContext& ctx, std::size_t index, const EntityRef& ref, EntityId& out) {
    if (!ref.is_provisional()) {
        out = ref.value;
        return true;
    }
    if (ref.value >= ctx.resolved.size()) {
        ctx.fail(index, ErrorCode::OrderingError, ref.describe() + " referenced before its spawn");
        ctx.report.aborted = true;
        ctx.report.skipped++;
        return false;
    }
    out = ctx.resolved[static_cast<std::size_t>(ref.value)];
    return true;
}

Status Reconciler::check_payload(const ComponentId& id, std::span<const std::uint8_t> bytes) {
    if (settings_.auto_register_guest_types && !types_.contains(id)) {
        auto status = types_.register_guest_type(id);
        if (!status) {
            return status;
        }
        core::log_info("Reconciler: registered guest component type '" + id + "'");
    }
    return types_.validate(id, bytes);
}

void Reconciler::apply_spawn(ApplyContext& ctx, std::size_t index, const Command& cmd) {
    // The entity is created even if some components are rejected, so later
    // commands referring to it still resolve.
    std::vector<world::ComponentValue> accepted;
    accepted.reserve(cmd.components.size());
    for (const auto& value : cmd.components) {
        auto status = check_payload(value.id, value.payload);
        if (!status) {
            ctx.fail(index, status.code, status.message);
            continue;
        }
        accepted.push_back(value);
    }

    std::vector<Status> failures;
    EntityId id = world_.spawn(accepted, failures);
    for (auto& f : failures) {
        ctx.fail(index, f.code, std::move(f.message));
    }

    if (ctx.report.module != kInvalidModule) {
        spawnedBy_[id] = ctx.report.module;
    }

    const auto provisional = static_cast<std::uint32_t>(ctx.resolved.size());
    ctx.resolved.push_back(id);
    ctx.report.spawned.emplace_back(provisional, id);
    ctx.report.applied++;
}

void Reconciler::apply_despawn(ApplyContext& ctx, std::size_t index, const Command& cmd) {
    EntityId id = 0;
    if (!resolve(ctx, index, cmd.target, id)) {
        return;
    }
    world_.despawn(id);
    spawnedBy_.erase(id);
    ctx.report.applied++;
}

void Reconciler::apply_insert(ApplyContext& ctx, std::size_t index, const Command& cmd) {
    EntityId id = 0;
    if (!resolve(ctx, index, cmd.target, id)) {
        return;
    }

    if (!world_.contains(id)) {
        ctx.fail(index, ErrorCode::UnknownEntity, cmd.target.describe() + " does not exist");
        ctx.report.skipped++;
        return;
    }

    auto status = check_payload(cmd.component, cmd.payload);
    if (status) {
        status = world_.insert(id, cmd.component, cmd.payload);
    }
    if (!status) {
        ctx.fail(index, status.code, status.message);
        ctx.report.skipped++;
        return;
    }
    ctx.report.applied++;
}

void Reconciler::apply_remove(ApplyContext& ctx, std::size_t index, const Command& cmd) {
    EntityId id = 0;
    if (!resolve(ctx, index, cmd.target, id)) {
        return;
    }
    world_.remove(id, cmd.component);
    ctx.report.applied++;
}

} // namespace modbridge::bridge
