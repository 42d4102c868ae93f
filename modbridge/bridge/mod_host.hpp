#pragma once

#include "invocation_engine.hpp"
#include "module_manager.hpp"
#include "reconciler.hpp"
#include "system_registry.hpp"

#include <modbridge/components/component_registry.hpp>
#include <modbridge/core/config.hpp>
#include <modbridge/world/world.hpp>

#include <atomic>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace modbridge::bridge {

struct ControlResult {
    Status status{};
    bool deferred{false};   // queued until the running phase ends

    explicit operator bool() const { return status.ok(); }
};

struct ControlOutcome {
    enum class Kind : std::uint8_t {
        Reload,
        Unload,
    };

    Kind kind{Kind::Reload};
    ModuleHandle module{kInvalidModule};
    Status status{};
};

struct PhaseReport {
    std::string phase;
    std::vector<SystemReport> startup;    // startup systems of freshly (re)loaded modules
    std::vector<SystemReport> systems;
    std::vector<ControlOutcome> deferred;

    std::size_t count(CallOutcome outcome) const;
};

// ============================================================================
// ModHost - control surface used by the embedding application
//
//   ModHost host(world, types, config);
//   auto mod = host.load("gravity", bytes);
//   host.run_phase(phases::kUpdate);
//
// Reload and unload requested while a phase runs are applied when it ends;
// outside a phase they run under the phase lock, so a phase never sees a
// module change generation halfway through.
// ============================================================================

class ModHost {
public:
    ModHost(world::IWorld& world, components::ComponentTypeRegistry& types, core::HostConfig config);

    ModHost(const ModHost&) = delete;
    ModHost& operator=(const ModHost&) = delete;

    LoadResult load(const std::string& name, std::span<const std::uint8_t> bytes);
    ControlResult unload(ModuleHandle handle);
    ControlResult reload(ModuleHandle handle, std::span<const std::uint8_t> bytes);

    PhaseReport run_phase(const std::string& phase);

    // Direct world access between phases.
    std::unique_lock<std::mutex> exclusive_access() { return reconciler_.exclusive_access(); }

    // Live entities spawned by a module's command buffers.
    std::size_t spawned_by(ModuleHandle handle) { return reconciler_.spawned_by(handle); }

    bool in_phase() const { return inPhase_.load(); }

    ModuleManager& modules() { return modules_; }
    const SystemRegistry& systems() const { return systems_; }
    const InvocationEngine& engine() const { return engine_; }
    const core::HostConfig& config() const { return config_; }

private:
    struct PendingControl {
        ControlOutcome::Kind kind{ControlOutcome::Kind::Reload};
        ModuleHandle module{kInvalidModule};
        Bytes bytes;
    };

    // Queues the request if a phase is running; nullopt otherwise.
    std::optional<ControlResult> defer_if_in_phase(PendingControl request);

    // Unload plus per-module cleanup: trap counters, spawned entities.
    Status unload_now(ModuleHandle handle);

    void run_startups(PhaseReport& report);
    void drain_pending(PhaseReport& report, std::vector<PendingControl>& pending);

    core::HostConfig config_;
    SystemRegistry systems_;
    ModuleManager modules_;
    Reconciler reconciler_;
    InvocationEngine engine_;

    std::mutex phaseMutex_;          // held by a phase or a control call
    std::atomic<bool> inPhase_{false};   // written under pendingMutex_

    std::mutex pendingMutex_;
    std::vector<PendingControl> pending_;
};

} // namespace modbridge::bridge
