#pragma once

#include "lua_state.hpp"

#include <modbridge/core/config.hpp>

#include <algorithm>
#include <functional>
#include <string>
#include <vector>

namespace modbridge::scripting {

// Limits and policy of one guest state, usually built from the [sandbox] config section.
struct SandboxConfig {
    std::size_t maxMemoryMB{64};
    std::size_t maxInstructionsPerCall{10000000};
    double maxExecutionTimeSec{5.0};

    bool allowSource{true};
    bool allowBinaryChunks{false};

    // Receives each print() line; print is a no-op without one.
    std::function<void(const std::string&)> printHandler;

    static SandboxConfig from_settings(const core::SandboxSettings& settings) {
        SandboxConfig cfg;
        cfg.maxMemoryMB = settings.max_memory_mb;
        cfg.maxInstructionsPerCall = settings.max_instructions;
        cfg.maxExecutionTimeSec = settings.max_time_sec;
        cfg.allowSource = settings.allow_source;
        cfg.allowBinaryChunks = settings.allow_binary_chunks;
        return cfg;
    }

    ScriptLimits to_script_limits() const {
        ScriptLimits limits;
        limits.maxMemoryBytes = std::min(maxMemoryMB, core::SandboxSettings::kMaxMemoryMB) * 1024 * 1024;
        limits.maxInstructions = maxInstructionsPerCall;
        limits.maxExecutionTimeSec = maxExecutionTimeSec;
        return limits;
    }

    ChunkPolicy chunk_policy() const {
        return ChunkPolicy{allowSource, allowBinaryChunks};
    }
};

class Sandbox {
public:
    static std::unique_ptr<LuaState> create(const SandboxConfig& config);

    static const std::vector<std::string>& forbidden_functions();
};

} // namespace modbridge::scripting
