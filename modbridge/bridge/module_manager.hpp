#pragma once

#include "guest_api.hpp"
#include "module_instance.hpp"
#include "system_registry.hpp"

#include <modbridge/components/component_registry.hpp>
#include <modbridge/core/config.hpp>
#include <modbridge/core/error.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace modbridge::bridge {

enum class ModuleState : std::uint8_t {
    Loading,
    Ready,
    Reloading,
    Failed,     // initial load failed, nothing registered
    Unloaded,   // terminal
};

const char* module_state_name(ModuleState state);

struct ModuleInfo {
    ModuleHandle handle{kInvalidModule};
    std::string name;
    ModuleState state{ModuleState::Loading};
    std::uint64_t generation{0};     // 0 until the first successful load
    std::uint32_t slot{0};
    std::size_t systemCount{0};
    std::size_t instanceCount{0};
    Status lastError{};
};

struct LoadResult {
    ModuleHandle handle{kInvalidModule};
    Status status{};

    explicit operator bool() const { return status.ok(); }
};

// ============================================================================
// ModuleManager - compiles, instantiates and swaps guest modules
//
// Owns the artifacts; the system registry only ever sees the declarations of
// a module's current artifact. Control calls are serialized.
// ============================================================================

class ModuleManager {
public:
    ModuleManager(SystemRegistry& systems,
                  components::ComponentTypeRegistry& types,
                  core::HostConfig config);

    ModuleManager(const ModuleManager&) = delete;
    ModuleManager& operator=(const ModuleManager&) = delete;

    // A failed load still returns a handle: the module stays in Failed so it
    // can be reloaded with fixed bytes or unloaded.
    LoadResult load(const std::string& name, std::span<const std::uint8_t> bytes);

    // Idempotent. UnknownModule for handles never issued.
    Status unload(ModuleHandle handle);

    // Builds a shadow artifact and swaps it in only if it reached Ready.
    // On failure the previous artifact keeps running (ReloadError).
    Status reload(ModuleHandle handle, std::span<const std::uint8_t> bytes);

    std::optional<ModuleInfo> info(ModuleHandle handle) const;
    std::vector<ModuleInfo> modules() const;

    // Current artifact, null unless the module is Ready or Reloading.
    std::shared_ptr<ModuleArtifact> artifact(ModuleHandle handle) const;

    // Modules loaded or reloaded since the last call, with the generation
    // whose startup systems are due.
    std::vector<std::pair<ModuleHandle, std::uint64_t>> take_pending_startups();

    const core::HostConfig& config() const { return config_; }

private:
    struct ModuleRecord {
        ModuleHandle handle{kInvalidModule};
        std::string name;
        ModuleState state{ModuleState::Loading};
        std::uint32_t slot{0};
        std::uint64_t generation{0};
        std::shared_ptr<ModuleArtifact> artifact;
        Status lastError{};
        bool startupPending{false};
    };

    struct Build {
        std::shared_ptr<ModuleArtifact> artifact;
        guest_api::SetupDeclarations decls;
        Status status{};
    };

    Build build_artifact(ModuleHandle handle, const std::string& name,
                         std::uint64_t generation, std::span<const std::uint8_t> bytes);

    std::unique_ptr<ModuleInstance> instantiate(const std::string& name,
                                                std::span<const std::uint8_t> bytes,
                                                guest_api::SetupDeclarations& decls,
                                                Status& status);

    // Registers guest component types and systems of a finished build.
    Status commit(const ModuleRecord& record, Build& build);

    ModuleInfo make_info(const ModuleRecord& record) const;

    SystemRegistry& systems_;
    components::ComponentTypeRegistry& types_;
    core::HostConfig config_;

    std::mutex controlMutex_;          // one load/unload/reload at a time
    mutable std::mutex recordsMutex_;
    std::map<ModuleHandle, ModuleRecord> records_;
    ModuleHandle nextHandle_{1};
    std::uint32_t nextSlot_{0};
};

} // namespace modbridge::bridge
