#pragma once

#include "command_buffer.hpp"
#include "module_manager.hpp"
#include "reconciler.hpp"
#include "system_registry.hpp"

#include <modbridge/core/config.hpp>
#include <modbridge/core/task_pool.hpp>
#include <modbridge/world/world.hpp>

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace modbridge::bridge {

enum class CallOutcome : std::uint8_t {
    Success,
    GuestFailure,   // guest returned false
    Trap,           // error, budget or memory exhaustion
    Skipped,        // module gone or registration from a replaced artifact
};

const char* call_outcome_name(CallOutcome outcome);

struct SystemReport {
    ModuleHandle module{kInvalidModule};
    std::string moduleName;
    std::string system;
    CallOutcome outcome{CallOutcome::Skipped};
    Status status{};
    ApplyReport apply{};
    std::uint32_t consecutiveTraps{0};
    double durationMs{0.0};
};

// ============================================================================
// InvocationEngine - runs the systems of one phase
//
// Snapshots are taken on the calling thread, guest calls run on the task
// pool, command buffers are applied afterwards in registration order.
// ============================================================================

class InvocationEngine {
public:
    InvocationEngine(ModuleManager& modules,
                     world::IWorld& world,
                     Reconciler& reconciler,
                     const core::SchedulerSettings& settings);

    InvocationEngine(const InvocationEngine&) = delete;
    InvocationEngine& operator=(const InvocationEngine&) = delete;

    // One report per entry, in entry order.
    std::vector<SystemReport> run(const std::string& phase, const std::vector<SystemRegistrationPtr>& entries);

    std::uint32_t consecutive_traps(ModuleHandle module, const std::string& system) const;

    // Drops the trap counters of an unloaded module.
    void forget(ModuleHandle module);

    unsigned worker_count() const { return pool_.worker_count(); }

private:
    struct Job;

    std::vector<world::QueryRow> snapshot(const SystemRegistration& entry);
    std::uint32_t record_outcome(const SystemRegistration& entry, CallOutcome outcome);

    ModuleManager& modules_;
    world::IWorld& world_;
    Reconciler& reconciler_;
    core::TaskPool pool_;

    mutable std::mutex trapMutex_;
    std::map<std::pair<ModuleHandle, std::string>, std::uint32_t> consecutiveTraps_;
};

} // namespace modbridge::bridge
