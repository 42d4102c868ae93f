#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

struct lua_State;

namespace sol {
class state;
}

namespace modbridge::scripting {

// Why a script call did not complete.
enum class ScriptFault : std::uint8_t {
    None = 0,
    Syntax,        // chunk failed to compile
    Mode,          // chunk kind (source/binary) not allowed
    Runtime,       // error raised while running
    Budget,        // instruction or time budget exceeded
    Memory,        // allocation refused by the memory limit
};

struct ScriptResult {
    bool success{false};
    std::string error;
    ScriptFault fault{ScriptFault::None};

    static ScriptResult ok() { return {true, "", ScriptFault::None}; }
    static ScriptResult fail(const std::string& err, ScriptFault fault = ScriptFault::Runtime) {
        return {false, err, fault};
    }

    explicit operator bool() const { return success; }
};

// Per-state limits; 0 disables a limit. Instruction and time budgets are per call.
struct ScriptLimits {
    std::size_t maxMemoryBytes{64 * 1024 * 1024};
    std::size_t maxInstructions{10000000};
    double maxExecutionTimeSec{5.0};
};

// Which chunk encodings load_chunk() accepts.
struct ChunkPolicy {
    bool allowSource{true};
    bool allowBinary{false};
};

// ============================================================================
// LuaState - one guest VM with resource accounting
//
// Not thread-safe: one thread at a time per LuaState.
// ============================================================================
class LuaState {
public:
    LuaState();
    ~LuaState();

    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&&) noexcept;
    LuaState& operator=(LuaState&&) noexcept;

    // Create the VM with a counting allocator and open the safe standard libraries.
    bool init(const ScriptLimits& limits = {});

    // Strips unsafe globals, guards the protected-call builtins and arms the
    // instruction/time budget. Once a limit trips, the rest of the call fails
    // even under a guest pcall.
    bool apply_sandbox();

    bool is_sandboxed() const { return sandboxed_; }

    // Compile a chunk (source text or luac output) without running it.
    ScriptResult load_chunk(std::span<const std::uint8_t> chunk,
                            const std::string& chunkName,
                            const ChunkPolicy& policy = {});

    // Run the chunk compiled by the last successful load_chunk().
    ScriptResult run_loaded();

    // load_chunk() + run_loaded() for source text
    ScriptResult execute(const std::string& script, const std::string& chunkName = "script");

    ScriptResult call(const std::string& funcName);

    bool has_function(const std::string& funcName) const;

    std::optional<long long> get_global_int(const std::string& name) const;
    bool has_global(const std::string& name) const;

    // Rearms the budget; called before every guest entry.
    void begin_call();

    // Budget or Memory if a limit tripped during the current call, else Runtime.
    ScriptFault classify_failure() const;

    sol::state& state();
    const sol::state& state() const;

    lua_State* lua_state();

    std::size_t memory_used() const;

    const ScriptLimits& limits() const { return limits_; }

    static bool is_binary_chunk(std::span<const std::uint8_t> chunk);

    // Globals removed by apply_sandbox() (string.dump is removed as well)
    static const std::vector<std::string>& stripped_globals();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool sandboxed_{false};
    ScriptLimits limits_{};
};

std::unique_ptr<LuaState> create_sandboxed_state(const ScriptLimits& limits = {});

} // namespace modbridge::scripting
