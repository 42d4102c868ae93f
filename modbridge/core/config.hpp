#pragma once

#include "types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace modbridge::core {

struct LoggingConfig {
    bool enabled{true};
    LogLevel level{LogLevel::Info};
    std::string file{};
};

struct SandboxSettings {
    // Upper bound for max_memory_mb; larger values would overflow the byte count.
    static constexpr std::size_t kMaxMemoryMB = std::size_t{1} << 20;

    std::size_t max_memory_mb{64};
    std::size_t max_instructions{10000000};  // per call
    double max_time_sec{5.0};                // per call

    // Lua source text chunks.
    bool allow_source{true};

    // Precompiled luac chunks. Off by default: the Lua VM does not verify bytecode.
    bool allow_binary_chunks{false};
};

struct SchedulerSettings {
    // 0 runs every guest call inline on the thread driving the phase.
    unsigned worker_threads{0};

    // Instantiations kept per module; >1 lets systems of one module run in parallel.
    unsigned instances_per_module{1};
};

struct ComponentSettings {
    // Register unknown component ids seen in spawn/insert as opaque guest types.
    bool auto_register_guest_types{false};
};

struct ModuleSettings {
    // Phases guests may add systems to; systems declared for any other phase
    // are logged and left out.
    std::vector<std::string> allowed_phases{
        phases::kStartup,
        phases::kPreUpdate,
        phases::kUpdate,
        phases::kPostUpdate,
        phases::kFixedPreUpdate,
        phases::kFixedUpdate,
        phases::kFixedPostUpdate,
    };

    // Entities a module spawned are despawned when it is unloaded.
    bool despawn_on_unload{false};

    bool phase_allowed(const std::string& phase) const;
};

struct HostConfig {
    SandboxSettings sandbox{};
    SchedulerSettings scheduler{};
    ComponentSettings components{};
    ModuleSettings modules{};
    LoggingConfig logging{};
};

// INI-style loader:
//
//   [sandbox]
//   max_memory_mb = 32
//   allow_binary_chunks = false
//   [scheduler]
//   worker_threads = 4
//   [modules]
//   allowed_phases = startup, update, my_phase
//
// Unknown sections/keys are ignored; malformed values keep the current value.
class Config {
public:
    Config() = default;

    bool load_from_file(const std::string& path);
    void load_from_string(const std::string& text);

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const HostConfig& get() const { return config_; }
    HostConfig& get() { return config_; }

    const SandboxSettings& sandbox() const { return config_.sandbox; }
    const SchedulerSettings& scheduler() const { return config_.scheduler; }
    const ComponentSettings& components() const { return config_.components; }
    const ModuleSettings& modules() const { return config_.modules; }
    const LoggingConfig& logging() const { return config_.logging; }

    static LogLevel log_level_from_string(const std::string& v, LogLevel default_value);

private:
    HostConfig config_{};

    std::string loaded_from_path_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static long long parse_int(const std::string& v, long long default_value);
    static double parse_double(const std::string& v, double default_value);
    static std::vector<std::string> parse_list(const std::string& v);

    void parse_stream(std::istream& in);
    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

} // namespace modbridge::core
