#include "invocation_engine.hpp"

#include "guest_api.hpp"

#include <modbridge/core/logger.hpp>

#include <chrono>
#include <exception>
#include <memory>

namespace modbridge::bridge {

const char* call_outcome_name(CallOutcome outcome) {
    switch (outcome) {
        case CallOutcome::Success: return "Success";
        case CallOutcome::GuestFailure: return "GuestFailure";
        case CallOutcome::Trap: return "Trap";
        case CallOutcome::Skipped: return "Skipped";
    }
    return "unknown";
}

struct InvocationEngine::Job {
    SystemRegistrationPtr entry;
    std::shared_ptr<ModuleArtifact> artifact;
    std::vector<world::QueryRow> rows;
    CommandBuffer buffer;
    Status status;
    double durationMs{0.0};
};

InvocationEngine::InvocationEngine(ModuleManager& modules,
                                   world::IWorld& world,
                                   Reconciler& reconciler,
                                   const core::SchedulerSettings& settings)
    : modules_(modules),
      world_(world),
      reconciler_(reconciler),
      pool_(settings.worker_threads) {}

std::vector<world::QueryRow> InvocationEngine::snapshot(const SystemRegistration& entry) {
    if (entry.query.empty()) {
        return {};
    }
    return world_.query(entry.query.to_world_query());
}

std::uint32_t InvocationEngine::record_outcome(const SystemRegistration& entry, CallOutcome outcome) {
    std::lock_guard<std::mutex> lock(trapMutex_);
    auto& count = consecutiveTraps_[{entry.module, entry.name}];
    if (outcome == CallOutcome::Trap) {
        ++count;
    } else if (outcome != CallOutcome::Skipped) {
        count = 0;
    }
    return count;
}

std::uint32_t InvocationEngine::consecutive_traps(ModuleHandle module, const std::string& system) const {
    std::lock_guard<std::mutex> lock(trapMutex_);
    auto it = consecutiveTraps_.find({module, system});
    return it == consecutiveTraps_.end() ? 0 : it->second;
}

void InvocationEngine::forget(ModuleHandle module) {
    std::lock_guard<std::mutex> lock(trapMutex_);
    auto it = consecutiveTraps_.lower_bound({module, std::string()});
    while (it != consecutiveTraps_.end() && it->first.first == module) {
        it = consecutiveTraps_.erase(it);
    }
}

std::vector<SystemReport> InvocationEngine::run(const std::string& phase,
                                                const std::vector<SystemRegistrationPtr>& entries) {
    std::vector<std::unique_ptr<Job>> jobs;
    jobs.reserve(entries.size());

    // Snapshot every query before any guest runs
    {
        auto world = reconciler_.exclusive_access();
        for (const auto& entry : entries) {
            auto job = std::make_unique<Job>();
            job->entry = entry;
            job->artifact = modules_.artifact(entry->module);
            if (job->artifact && job->artifact->generation() == entry->generation) {
                job->rows = snapshot(*entry);
            } else {
                job->artifact.reset();
            }
            jobs.push_back(std::move(job));
        }
    }

    for (auto& job : jobs) {
        if (!job->artifact) continue;

        Job* j = job.get();
        pool_.dispatch([j] {
            const auto start = std::chrono::steady_clock::now();
            auto lease = j->artifact->acquire();
            try {
                j->status = guest_api::call_system(lease.instance().lua(), *j->entry, j->rows, j->buffer);
            } catch (const std::exception& e) {
                // Raised by the binding layer outside a protected call
                j->status = Status::fail(ErrorCode::InvocationTrap, e.what());
                j->buffer.clear();
            }
            j->durationMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        });
    }
    pool_.wait_for_all();

    std::vector<SystemReport> reports;
    reports.reserve(jobs.size());

    for (auto& job : jobs) {
        const auto& entry = *job->entry;

        SystemReport report;
        report.module = entry.module;
        report.system = entry.name;
        report.durationMs = job->durationMs;

        if (!job->artifact) {
            report.outcome = CallOutcome::Skipped;
            report.consecutiveTraps = record_outcome(entry, report.outcome);
            core::log_debug("InvocationEngine: " + phase + "/" + entry.name + " skipped (module " +
                            std::to_string(entry.module) + " replaced or unloaded)");
            reports.push_back(std::move(report));
            continue;
        }

        report.moduleName = job->artifact->name();
        report.status = job->status;

        switch (job->status.code) {
            case ErrorCode::None:
                report.outcome = CallOutcome::Success;
                report.apply = reconciler_.apply(job->buffer, entry.module, entry.name);
                break;
            case ErrorCode::GuestFailure:
                report.outcome = CallOutcome::GuestFailure;
                core::log_warning("[mod:" + report.moduleName + "] " + entry.name + " failed: " +
                                  job->status.message);
                break;
            default:
                report.outcome = CallOutcome::Trap;
                break;
        }

        report.consecutiveTraps = record_outcome(entry, report.outcome);
        if (report.outcome == CallOutcome::Trap) {
            core::log_warning("[mod:" + report.moduleName + "] " + entry.name + " trapped (" +
                              std::to_string(report.consecutiveTraps) + " in a row): " +
                              job->status.message);
        }

        reports.push_back(std::move(report));
    }

    return reports;
}

} // namespace modbridge::bridge
