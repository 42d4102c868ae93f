#include "system_registry.hpp"

#include <algorithm>
#include <mutex>
#include <set>
#include <utility>

namespace modbridge::bridge {

const char* access_name(Access access) {
    switch (access) {
        case Access::Read: return "read";
        case Access::Write: return "write";
    }
    return "unknown";
}

world::WorldQuery QueryShape::to_world_query() const {
    world::WorldQuery q;
    q.fetch.reserve(fetch.size());
    for (const auto& term : fetch) {
        q.fetch.push_back(term.component);
    }
    q.with = with;
    q.without = without;
    return q;
}

std::optional<Access> QueryShape::access_of(const ComponentId& component) const {
    std::optional<Access> result;
    for (const auto& term : fetch) {
        if (term.component != component) continue;
        // Write wins if a component is listed twice
        if (!result || term.access == Access::Write) {
            result = term.access;
        }
    }
    return result;
}

Status SystemRegistry::replace(ModuleHandle module, std::vector<SystemRegistration> entries) {
    std::set<std::pair<std::string, std::string>> seen;
    std::vector<SystemRegistrationPtr> shared;
    shared.reserve(entries.size());

    for (auto& entry : entries) {
        if (entry.module != module) {
            return Status::fail(ErrorCode::InterfaceMismatch,
                                "system '" + entry.name + "' belongs to module " + std::to_string(entry.module));
        }
        if (!seen.emplace(entry.phase, entry.name).second) {
            return Status::fail(ErrorCode::InterfaceMismatch,
                                "system '" + entry.name + "' registered twice in phase '" + entry.phase + "'");
        }
        shared.push_back(std::make_shared<const SystemRegistration>(std::move(entry)));
    }

    std::unique_lock lock(mutex_);
    if (shared.empty()) {
        modules_.erase(module);
    } else {
        modules_[module] = std::move(shared);
    }
    return Status::success();
}

void SystemRegistry::clear(ModuleHandle module) {
    std::unique_lock lock(mutex_);
    modules_.erase(module);
}

std::vector<SystemRegistrationPtr> SystemRegistry::entries_for(const std::string& phase) const {
    std::vector<SystemRegistrationPtr> out;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [module, entries] : modules_) {
            for (const auto& entry : entries) {
                if (entry->phase == phase) {
                    out.push_back(entry);
                }
            }
        }
    }

    std::sort(out.begin(), out.end(), [](const SystemRegistrationPtr& a, const SystemRegistrationPtr& b) {
        if (a->slot != b->slot) return a->slot < b->slot;
        return a->index < b->index;
    });
    return out;
}

std::vector<SystemRegistrationPtr> SystemRegistry::entries_of(ModuleHandle module) const {
    std::shared_lock lock(mutex_);
    auto it = modules_.find(module);
    if (it == modules_.end()) {
        return {};
    }
    return it->second;
}

std::size_t SystemRegistry::count(ModuleHandle module) const {
    std::shared_lock lock(mutex_);
    auto it = modules_.find(module);
    return it == modules_.end() ? 0 : it->second.size();
}

std::size_t SystemRegistry::size() const {
    std::shared_lock lock(mutex_);
    std::size_t total = 0;
    for (const auto& [module, entries] : modules_) {
        total += entries.size();
    }
    return total;
}

std::vector<std::string> SystemRegistry::phases() const {
    std::set<std::string> names;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [module, entries] : modules_) {
            for (const auto& entry : entries) {
                names.insert(entry->phase);
            }
        }
    }
    return std::vector<std::string>(names.begin(), names.end());
}

} // namespace modbridge::bridge
