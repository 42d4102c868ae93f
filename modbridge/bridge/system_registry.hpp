#pragma once

#include <modbridge/core/error.hpp>
#include <modbridge/core/types.hpp>
#include <modbridge/world/world.hpp>

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace modbridge::bridge {

enum class Access : std::uint8_t {
    Read,
    Write,
};

const char* access_name(Access access);

struct QueryTerm {
    ComponentId component;
    Access access{Access::Read};
};

// Component access declared by a system. `with`/`without` only filter the
// matched entities; their payloads are not handed to the guest.
struct QueryShape {
    std::vector<QueryTerm> fetch;
    std::vector<ComponentId> with;
    std::vector<ComponentId> without;

    // Nothing to fetch: the system gets an empty snapshot.
    bool empty() const { return fetch.empty(); }

    world::WorldQuery to_world_query() const;

    std::optional<Access> access_of(const ComponentId& component) const;
};

struct SystemRegistration {
    ModuleHandle module{kInvalidModule};
    std::uint64_t generation{0};    // artifact that declared it
    std::string phase;
    std::string name;
    QueryShape query;

    // Execution order key: (slot, index). The slot belongs to the module and
    // survives reloads; index is the declaration order inside setup().
    std::uint32_t slot{0};
    std::uint32_t index{0};
};

using SystemRegistrationPtr = std::shared_ptr<const SystemRegistration>;

// ============================================================================
// SystemRegistry - (module, phase, name) -> registration
//
// A module's set is always replaced as a whole. Readers get snapshots that
// stay valid however the registry changes afterwards. Thread-safe.
// ============================================================================

class SystemRegistry {
public:
    SystemRegistry() = default;

    SystemRegistry(const SystemRegistry&) = delete;
    SystemRegistry& operator=(const SystemRegistry&) = delete;

    // Replaces every registration of `module`. Fails without changing anything
    // if an entry names another module or (phase, name) repeats.
    Status replace(ModuleHandle module, std::vector<SystemRegistration> entries);

    void clear(ModuleHandle module);

    // Registrations of one phase ordered by (slot, index).
    std::vector<SystemRegistrationPtr> entries_for(const std::string& phase) const;

    // Registrations of one module in declaration order.
    std::vector<SystemRegistrationPtr> entries_of(ModuleHandle module) const;

    std::size_t count(ModuleHandle module) const;
    std::size_t size() const;

    std::vector<std::string> phases() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<ModuleHandle, std::vector<SystemRegistrationPtr>> modules_;
};

} // namespace modbridge::bridge
