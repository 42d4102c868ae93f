#include "mod_host.hpp"

#include <modbridge/core/logger.hpp>

#include <algorithm>

namespace modbridge::bridge {

std::size_t PhaseReport::count(CallOutcome outcome) const {
    auto matches = [outcome](const SystemReport& r) { return r.outcome == outcome; };
    return static_cast<std::size_t>(std::count_if(startup.begin(), startup.end(), matches) +
                                    std::count_if(systems.begin(), systems.end(), matches));
}

ModHost::ModHost(world::IWorld& world, components::ComponentTypeRegistry& types, core::HostConfig config)
    : config_(std::move(config)),
      systems_(),
      modules_(systems_, types, config_),
      reconciler_(world, types, config_.components),
      engine_(modules_, world, reconciler_, config_.scheduler) {}

LoadResult ModHost::load(const std::string& name, std::span<const std::uint8_t> bytes) {
    // Safe during a phase: the running phase works on its own registry snapshot
    return modules_.load(name, bytes);
}

ControlResult ModHost::unload(ModuleHandle handle) {
    if (auto deferred = defer_if_in_phase(PendingControl{ControlOutcome::Kind::Unload, handle, {}})) {
        return *deferred;
    }
    // Waits out a phase that started after the check
    std::lock_guard<std::mutex> phaseLock(phaseMutex_);
    return ControlResult{unload_now(handle), false};
}

ControlResult ModHost::reload(ModuleHandle handle, std::span<const std::uint8_t> bytes) {
    PendingControl request{ControlOutcome::Kind::Reload, handle, Bytes(bytes.begin(), bytes.end())};
    if (auto deferred = defer_if_in_phase(std::move(request))) {
        return *deferred;
    }
    std::lock_guard<std::mutex> phaseLock(phaseMutex_);
    return ControlResult{modules_.reload(handle, bytes), false};
}

std::optional<ControlResult> ModHost::defer_if_in_phase(PendingControl request) {
    const auto kind = request.kind;
    const auto module = request.module;
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        if (!inPhase_.load()) {
            return std::nullopt;
        }
        if (!modules_.info(module)) {
            return ControlResult{Status::fail(ErrorCode::UnknownModule,
                                              "no module with handle " + std::to_string(module)), false};
        }
        pending_.push_back(std::move(request));
    }

    core::log_info("ModHost: " + std::string(kind == ControlOutcome::Kind::Reload ? "reload" : "unload") +
                   " of module " + std::to_string(module) + " deferred to the phase boundary");
    return ControlResult{Status::success(), true};
}

Status ModHost::unload_now(ModuleHandle handle) {
    auto status = modules_.unload(handle);
    if (!status) {
        return status;
    }

    engine_.forget(handle);
    const auto despawned = reconciler_.release_module(handle, config_.modules.despawn_on_unload);
    if (despawned > 0) {
        core::log_info("ModHost: despawned " + std::to_string(despawned) + " entities of module " +
                       std::to_string(handle));
    }
    return status;
}

void ModHost::run_startups(PhaseReport& report) {
    for (const auto& [handle, generation] : modules_.take_pending_startups()) {
        std::vector<SystemRegistrationPtr> entries;
        for (auto& entry : systems_.entries_of(handle)) {
            if (entry->phase == phases::kStartup && entry->generation == generation) {
                entries.push_back(std::move(entry));
            }
        }
        if (entries.empty()) continue;

        auto reports = engine_.run(phases::kStartup, entries);
        for (auto& r : reports) {
            report.startup.push_back(std::move(r));
        }
    }
}

void ModHost::drain_pending(PhaseReport& report, std::vector<PendingControl>& pending) {
    for (auto& op : pending) {
        ControlOutcome outcome;
        outcome.kind = op.kind;
        outcome.module = op.module;
        if (op.kind == ControlOutcome::Kind::Reload) {
            outcome.status = modules_.reload(op.module, op.bytes);
        } else {
            outcome.status = unload_now(op.module);
        }
        if (!outcome.status) {
            core::log_warning("ModHost: deferred " +
                              std::string(op.kind == ControlOutcome::Kind::Reload ? "reload" : "unload") +
                              " of module " + std::to_string(op.module) + " failed: " +
                              outcome.status.describe());
        }
        report.deferred.push_back(std::move(outcome));
    }
}

PhaseReport ModHost::run_phase(const std::string& phase) {
    std::lock_guard<std::mutex> phaseLock(phaseMutex_);

    PhaseReport report;
    report.phase = phase;

    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        inPhase_.store(true);
    }

    run_startups(report);

    auto entries = systems_.entries_for(phase);
    report.systems = engine_.run(phase, entries);

    core::log_debug("ModHost: phase '" + phase + "': " +
                    std::to_string(report.count(CallOutcome::Success)) + " ok, " +
                    std::to_string(report.count(CallOutcome::GuestFailure)) + " failed, " +
                    std::to_string(report.count(CallOutcome::Trap)) + " trapped, " +
                    std::to_string(report.count(CallOutcome::Skipped)) + " skipped");

    // Requests made while draining are queued too; control returns to the
    // caller only once the queue is empty.
    for (;;) {
        std::vector<PendingControl> pending;
        {
            std::lock_guard<std::mutex> lock(pendingMutex_);
            if (pending_.empty()) {
                inPhase_.store(false);
                break;
            }
            pending.swap(pending_);
        }
        drain_pending(report, pending);
    }

    return report;
}

} // namespace modbridge::bridge
