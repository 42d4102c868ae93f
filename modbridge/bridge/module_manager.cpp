#include "module_manager.hpp"

#include <modbridge/core/logger.hpp>
#include <modbridge/scripting/sandbox.hpp>

#include <algorithm>
#include <typeindex>

namespace modbridge::bridge {

const char* module_state_name(ModuleState state) {
    switch (state) {
        case ModuleState::Loading: return "Loading";
        case ModuleState::Ready: return "Ready";
        case ModuleState::Reloading: return "Reloading";
        case ModuleState::Failed: return "Failed";
        case ModuleState::Unloaded: return "Unloaded";
    }
    return "unknown";
}

ModuleManager::ModuleManager(SystemRegistry& systems,
                             components::ComponentTypeRegistry& types,
                             core::HostConfig config)
    : systems_(systems), types_(types), config_(std::move(config)) {}

// ============================================================================
// Building
// ============================================================================

std::unique_ptr<ModuleInstance> ModuleManager::instantiate(const std::string& name,
                                                           std::span<const std::uint8_t> bytes,
                                                           guest_api::SetupDeclarations& decls,
                                                           Status& status) {
    auto sandboxCfg = scripting::SandboxConfig::from_settings(config_.sandbox);
    sandboxCfg.printHandler = [name](const std::string& msg) {
        core::log_info("[mod:" + name + "] " + msg);
    };

    auto lua = scripting::Sandbox::create(sandboxCfg);
    if (!lua) {
        status = Status::fail(ErrorCode::SetupTrap, "failed to create a Lua state");
        return nullptr;
    }
    guest_api::install(*lua, types_);

    auto loaded = lua->load_chunk(bytes, name, sandboxCfg.chunk_policy());
    if (!loaded) {
        status = Status::fail(ErrorCode::CompileError, loaded.error);
        return nullptr;
    }

    auto ran = lua->run_loaded();
    if (!ran) {
        status = Status::fail(ErrorCode::SetupTrap, "top-level chunk: " + ran.error);
        return nullptr;
    }

    status = guest_api::run_setup(*lua, config_.modules, decls);
    if (!status) {
        return nullptr;
    }

    return std::make_unique<ModuleInstance>(std::move(lua));
}

ModuleManager::Build ModuleManager::build_artifact(ModuleHandle handle, const std::string& name,
                                                   std::uint64_t generation,
                                                   std::span<const std::uint8_t> bytes) {
    Build build;
    const unsigned count = std::max(1u, config_.scheduler.instances_per_module);

    std::vector<std::unique_ptr<ModuleInstance>> instances;
    instances.reserve(count);

    for (unsigned i = 0; i < count; ++i) {
        guest_api::SetupDeclarations decls;
        auto instance = instantiate(name, bytes, decls, build.status);
        if (!instance) {
            return build;
        }

        if (i == 0) {
            for (const auto& skipped : decls.disallowed) {
                core::log_warning("ModuleManager: '" + name + "' added system '" + skipped.name +
                                  "' to phase '" + skipped.phase + "', which is not open to modules; skipped");
            }
            build.decls = std::move(decls);
        } else if (!guest_api::same_declarations(build.decls, decls)) {
            build.status = Status::fail(ErrorCode::InterfaceMismatch,
                                        "instance " + std::to_string(i) + " declared different systems than instance 0");
            return build;
        }
        instances.push_back(std::move(instance));
    }

    build.artifact = std::make_shared<ModuleArtifact>(handle, name, generation, std::move(instances));
    return build;
}

Status ModuleManager::commit(const ModuleRecord& record, Build& build) {
    // Check every declaration before registering any
    for (const auto& decl : build.decls.components) {
        auto existing = types_.find(decl.id);
        if (!existing) continue;

        components::BlobCodec declared(decl.size);
        if (existing->codec->signature() != declared.signature() ||
            existing->nativeType != std::type_index(typeid(components::GuestComponents))) {
            return Status::fail(ErrorCode::DuplicateIncompatibleType,
                                "component '" + decl.id + "' is already registered as '" +
                                    existing->codec->signature() + "'");
        }
    }
    for (const auto& decl : build.decls.components) {
        auto status = types_.register_guest_type(decl.id, decl.size);
        if (!status) {
            return status;
        }
    }

    std::vector<SystemRegistration> entries;
    entries.reserve(build.decls.systems.size());
    std::uint32_t index = 0;
    for (auto& decl : build.decls.systems) {
        SystemRegistration reg;
        reg.module = record.handle;
        reg.generation = build.artifact->generation();
        reg.phase = decl.phase;
        reg.name = decl.name;
        reg.query = decl.query;
        reg.slot = record.slot;
        reg.index = index++;
        entries.push_back(std::move(reg));
    }

    return systems_.replace(record.handle, std::move(entries));
}

// ============================================================================
// Control
// ============================================================================

LoadResult ModuleManager::load(const std::string& name, std::span<const std::uint8_t> bytes) {
    std::lock_guard<std::mutex> control(controlMutex_);

    ModuleRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(recordsMutex_);
        snapshot.handle = nextHandle_++;
        snapshot.slot = nextSlot_++;
        snapshot.name = name;
        snapshot.state = ModuleState::Loading;
        records_[snapshot.handle] = snapshot;
    }

    core::log_info("ModuleManager: loading '" + name + "' as module " + std::to_string(snapshot.handle));

    auto build = build_artifact(snapshot.handle, name, 1, bytes);
    if (build.status) {
        build.status = commit(snapshot, build);
    }

    std::lock_guard<std::mutex> lock(recordsMutex_);
    auto& rec = records_[snapshot.handle];

    if (!build.status) {
        rec.state = ModuleState::Failed;
        rec.lastError = build.status;
        core::log_error("ModuleManager: failed to load '" + name + "': " + build.status.describe());
        return LoadResult{snapshot.handle, build.status};
    }

    rec.state = ModuleState::Ready;
    rec.generation = 1;
    rec.artifact = std::move(build.artifact);
    rec.lastError = Status::success();
    rec.startupPending = true;

    core::log_info("ModuleManager: '" + name + "' ready, " +
                   std::to_string(build.decls.systems.size()) + " systems, " +
                   std::to_string(rec.artifact->instance_count()) + " instances");
    return LoadResult{snapshot.handle, Status::success()};
}

Status ModuleManager::unload(ModuleHandle handle) {
    std::lock_guard<std::mutex> control(controlMutex_);
    std::shared_ptr<ModuleArtifact> old;

    {
        std::lock_guard<std::mutex> lock(recordsMutex_);
        auto it = records_.find(handle);
        if (it == records_.end()) {
            return Status::fail(ErrorCode::UnknownModule, "no module with handle " + std::to_string(handle));
        }

        auto& rec = it->second;
        if (rec.state == ModuleState::Unloaded) {
            return Status::success();
        }

        systems_.clear(handle);
        old = std::move(rec.artifact);
        rec.state = ModuleState::Unloaded;
        rec.startupPending = false;
        core::log_info("ModuleManager: unloaded '" + rec.name + "'");
    }

    // In-flight calls may still hold the artifact; it dies with the last of them.
    old.reset();
    return Status::success();
}

Status ModuleManager::reload(ModuleHandle handle, std::span<const std::uint8_t> bytes) {
    std::lock_guard<std::mutex> control(controlMutex_);

    ModuleRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(recordsMutex_);
        auto it = records_.find(handle);
        if (it == records_.end()) {
            return Status::fail(ErrorCode::UnknownModule, "no module with handle " + std::to_string(handle));
        }
        if (it->second.state == ModuleState::Unloaded) {
            return Status::fail(ErrorCode::UnknownModule, "module " + std::to_string(handle) + " was unloaded");
        }
        it->second.state = ModuleState::Reloading;
        snapshot = it->second;
    }

    const std::uint64_t generation = snapshot.generation + 1;
    core::log_info("ModuleManager: reloading '" + snapshot.name + "' (generation " +
                   std::to_string(generation) + ")");

    auto build = build_artifact(handle, snapshot.name, generation, bytes);
    if (build.status) {
        build.status = commit(snapshot, build);
    }

    std::shared_ptr<ModuleArtifact> old;
    {
        std::lock_guard<std::mutex> lock(recordsMutex_);
        auto& rec = records_[handle];

        if (!build.status) {
            auto error = Status::fail(ErrorCode::ReloadError, build.status.describe());
            rec.state = rec.artifact ? ModuleState::Ready : ModuleState::Failed;
            rec.lastError = error;
            core::log_error("ModuleManager: reload of '" + rec.name + "' failed, keeping generation " +
                            std::to_string(rec.generation) + ": " + build.status.describe());
            return error;
        }

        old = std::move(rec.artifact);
        rec.artifact = std::move(build.artifact);
        rec.generation = generation;
        rec.state = ModuleState::Ready;
        rec.lastError = Status::success();
        rec.startupPending = true;
        core::log_info("ModuleManager: '" + rec.name + "' swapped to generation " + std::to_string(generation));
    }

    old.reset();
    return Status::success();
}

// ============================================================================
// Queries
// ============================================================================

ModuleInfo ModuleManager::make_info(const ModuleRecord& record) const {
    ModuleInfo info;
    info.handle = record.handle;
    info.name = record.name;
    info.state = record.state;
    info.generation = record.generation;
    info.slot = record.slot;
    info.systemCount = systems_.count(record.handle);
    info.instanceCount = record.artifact ? record.artifact->instance_count() : 0;
    info.lastError = record.lastError;
    return info;
}

std::optional<ModuleInfo> ModuleManager::info(ModuleHandle handle) const {
    std::lock_guard<std::mutex> lock(recordsMutex_);
    auto it = records_.find(handle);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return make_info(it->second);
}

std::vector<ModuleInfo> ModuleManager::modules() const {
    std::lock_guard<std::mutex> lock(recordsMutex_);
    std::vector<ModuleInfo> out;
    out.reserve(records_.size());
    for (const auto& [handle, rec] : records_) {
        out.push_back(make_info(rec));
    }
    return out;
}

std::shared_ptr<ModuleArtifact> ModuleManager::artifact(ModuleHandle handle) const {
    std::lock_guard<std::mutex> lock(recordsMutex_);
    auto it = records_.find(handle);
    if (it == records_.end()) {
        return nullptr;
    }
    return it->second.artifact;
}

std::vector<std::pair<ModuleHandle, std::uint64_t>> ModuleManager::take_pending_startups() {
    std::lock_guard<std::mutex> lock(recordsMutex_);
    std::vector<std::pair<ModuleHandle, std::uint64_t>> out;
    for (auto& [handle, rec] : records_) {
        if (rec.startupPending && rec.artifact) {
            out.emplace_back(handle, rec.generation);
        }
        rec.startupPending = false;
    }
    return out;
}

} // namespace modbridge::bridge
