#pragma once

#include <modbridge/core/types.hpp>
#include <modbridge/scripting/lua_state.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace modbridge::bridge {

// One sandboxed instantiation of a module chunk. Entered by one call at a time.
class ModuleInstance {
public:
    explicit ModuleInstance(std::unique_ptr<scripting::LuaState> lua) : lua_(std::move(lua)) {}

    ModuleInstance(const ModuleInstance&) = delete;
    ModuleInstance& operator=(const ModuleInstance&) = delete;

    scripting::LuaState& lua() { return *lua_; }
    std::mutex& mutex() { return mutex_; }

private:
    std::unique_ptr<scripting::LuaState> lua_;
    std::mutex mutex_;
};

// ============================================================================
// ModuleArtifact - every instantiation built from one chunk
//
// Shared by the module manager and in-flight calls, so a reload can swap in
// a new artifact while old calls finish on the previous one.
// ============================================================================

class ModuleArtifact {
public:
    // Exclusive use of one instance for the duration of a call.
    class Lease {
    public:
        Lease(ModuleInstance& instance, std::unique_lock<std::mutex> lock)
            : instance_(&instance), lock_(std::move(lock)) {}

        ModuleInstance& instance() { return *instance_; }

    private:
        ModuleInstance* instance_;
        std::unique_lock<std::mutex> lock_;
    };

    ModuleArtifact(ModuleHandle handle,
                   std::string name,
                   std::uint64_t generation,
                   std::vector<std::unique_ptr<ModuleInstance>> instances);

    ModuleArtifact(const ModuleArtifact&) = delete;
    ModuleArtifact& operator=(const ModuleArtifact&) = delete;

    // Takes a free instance if there is one, otherwise waits for one.
    Lease acquire();

    ModuleHandle handle() const { return handle_; }
    const std::string& name() const { return name_; }
    std::uint64_t generation() const { return generation_; }
    std::size_t instance_count() const { return instances_.size(); }

    ModuleInstance& instance(std::size_t index) { return *instances_.at(index); }

private:
    ModuleHandle handle_;
    std::string name_;
    std::uint64_t generation_;
    std::vector<std::unique_ptr<ModuleInstance>> instances_;
    std::atomic<std::size_t> nextInstance_{0};
};

} // namespace modbridge::bridge
