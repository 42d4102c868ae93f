#include "lua_state.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>

namespace modbridge::scripting {

namespace {

// The count hook fires every kHookInterval VM instructions.
constexpr int kHookInterval = 1000;

const std::vector<std::string> kStrippedGlobals = {
    "os",
    "io",
    "debug",
    "package",
    "require",
    "load",
    "loadfile",
    "dofile",
    "loadstring",
    "collectgarbage",
    "rawget",
    "rawset",
    "rawequal",
    "setmetatable",
    "getfenv",
    "setfenv",
};

// Runs once per state with (check, pcall, xpcall, coroutine.resume,
// coroutine.close). A tripped budget must not be absorbed by a guest handler.
constexpr const char* kGuardScript = R"lua(
local check, pcall, xpcall, resume, close = ...
_G.pcall = function(...) return check(pcall(...)) end
_G.xpcall = function(...) return check(xpcall(...)) end
coroutine.resume = function(...) return check(resume(...)) end
coroutine.close = function(...) return check(close(...)) end
)lua";

// ============================================================================
// GuestBudget - memory, instruction and wall-clock accounting of one state
//
// Installed as the allocator userdata, so the count hook finds it through
// lua_getallocf() without a registry lookup.
// ============================================================================

struct GuestBudget {
    std::atomic<std::size_t> bytesInUse{0};
    std::size_t byteLimit{0};

    std::size_t instructionLimit{0};
    std::size_t instructionsUsed{0};
    double secondsLimit{0.0};
    std::chrono::steady_clock::time_point callStart{std::chrono::steady_clock::now()};

    // First limit hit since the last rearm(); sticky until then.
    ScriptFault tripped{ScriptFault::None};
    const char* reason{""};

    void rearm() {
        instructionsUsed = 0;
        callStart = std::chrono::steady_clock::now();
        tripped = ScriptFault::None;
        reason = "";
    }

    void trip(ScriptFault fault, const char* why) {
        if (tripped == ScriptFault::None) {
            tripped = fault;
            reason = why;
        }
    }

    static GuestBudget* of(lua_State* L) {
        void* ud = nullptr;
        lua_getallocf(L, &ud);
        return static_cast<GuestBudget*>(ud);
    }

    static void* allocate(void* ud, void* ptr, std::size_t osize, std::size_t nsize);
    static void on_count(lua_State* L, lua_Debug* ar);
    static int pass_through(lua_State* L);
};

void* GuestBudget::allocate(void* ud, void* ptr, std::size_t osize, std::size_t nsize) {
    auto* budget = static_cast<GuestBudget*>(ud);

    // For fresh blocks Lua passes the object type in osize, not a size.
    const std::size_t oldSize = ptr ? osize : 0;

    if (nsize == 0) {
        std::free(ptr);
        budget->bytesInUse -= oldSize;
        return nullptr;
    }

    if (nsize > oldSize && budget->byteLimit > 0 &&
        budget->bytesInUse.load() + (nsize - oldSize) > budget->byteLimit) {
        budget->trip(ScriptFault::Memory, "not enough memory");
        return nullptr;
    }

    void* block = std::realloc(ptr, nsize);
    if (block) {
        budget->bytesInUse += nsize;
        budget->bytesInUse -= oldSize;
    }
    return block;
}

void GuestBudget::on_count(lua_State* L, lua_Debug*) {
    auto* budget = of(L);
    if (!budget) return;

    if (budget->tripped == ScriptFault::None) {
        budget->instructionsUsed += static_cast<std::size_t>(lua_gethookcount(L));
        if (budget->instructionLimit > 0 && budget->instructionsUsed > budget->instructionLimit) {
            budget->trip(ScriptFault::Budget, "instruction limit exceeded");
        } else if (budget->secondsLimit > 0.0) {
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - budget->callStart;
            if (elapsed.count() > budget->secondsLimit) {
                budget->trip(ScriptFault::Budget, "execution time limit exceeded");
            }
        }
    }

    if (budget->tripped == ScriptFault::None) {
        // A coroutine may still carry the per-instruction hook of an earlier call
        if (lua_gethookcount(L) != kHookInterval) {
            lua_sethook(L, &GuestBudget::on_count, LUA_MASKCOUNT, kHookInterval);
        }
        return;
    }

    // Raise on every instruction until the call unwinds
    lua_sethook(L, &GuestBudget::on_count, LUA_MASKCOUNT, 1);
    luaL_error(L, "%s", budget->reason);
}

int GuestBudget::pass_through(lua_State* L) {
    auto* budget = of(L);
    if (budget && budget->tripped != ScriptFault::None) {
        return luaL_error(L, "%s", budget->reason);
    }
    return lua_gettop(L);
}

bool install_guards(lua_State* L) {
    if (luaL_loadbufferx(L, kGuardScript, std::strlen(kGuardScript), "=sandbox", "t") != LUA_OK) {
        lua_pop(L, 1);
        return false;
    }
    lua_pushcfunction(L, &GuestBudget::pass_through);
    lua_getglobal(L, "pcall");
    lua_getglobal(L, "xpcall");
    lua_getglobal(L, "coroutine");
    lua_getfield(L, -1, "resume");
    lua_getfield(L, -2, "close");
    lua_remove(L, -3);
    if (lua_pcall(L, 5, 0, 0) != LUA_OK) {
        lua_pop(L, 1);
        return false;
    }
    return true;
}

ScriptResult failed_call(const sol::protected_function_result& result, ScriptFault fault) {
    sol::error err = result;
    return ScriptResult::fail(err.what(), fault);
}

} // namespace

struct LuaState::Impl {
    // Outlives `lua`, which frees its memory through it.
    std::unique_ptr<GuestBudget> budget;
    std::unique_ptr<sol::state> lua;
    sol::protected_function compiled;
};

LuaState::LuaState() : impl_(std::make_unique<Impl>()) {}

LuaState::~LuaState() = default;

LuaState::LuaState(LuaState&&) noexcept = default;
LuaState& LuaState::operator=(LuaState&&) noexcept = default;

bool LuaState::init(const ScriptLimits& limits) {
    limits_ = limits;

    impl_->budget = std::make_unique<GuestBudget>();
    impl_->budget->byteLimit = limits.maxMemoryBytes;

    impl_->lua = std::make_unique<sol::state>(sol::default_at_panic, &GuestBudget::allocate, impl_->budget.get());
    if (!impl_->lua->lua_state()) {
        return false;
    }

    impl_->lua->open_libraries(
        sol::lib::base,
        sol::lib::coroutine,
        sol::lib::string,
        sol::lib::table,
        sol::lib::math,
        sol::lib::utf8
    );
    return true;
}

bool LuaState::apply_sandbox() {
    auto& lua = *impl_->lua;
    for (const auto& name : kStrippedGlobals) {
        lua[name] = sol::lua_nil;
    }

    // string.dump would hand out bytecode of host-visible functions
    sol::optional<sol::table> str = lua["string"];
    if (str) {
        (*str)["dump"] = sol::lua_nil;
    }

    // Silent until the host installs a handler
    lua["print"] = [](sol::variadic_args) {};

    if (!install_guards(lua.lua_state())) {
        return false;
    }

    auto& budget = *impl_->budget;
    budget.instructionLimit = limits_.maxInstructions;
    budget.secondsLimit = limits_.maxExecutionTimeSec;
    sandboxed_ = true;
    begin_call();
    return true;
}

const std::vector<std::string>& LuaState::stripped_globals() {
    return kStrippedGlobals;
}

bool LuaState::is_binary_chunk(std::span<const std::uint8_t> chunk) {
    // LUA_SIGNATURE starts with ESC
    return !chunk.empty() && chunk[0] == 0x1b;
}

ScriptResult LuaState::load_chunk(std::span<const std::uint8_t> chunk,
                                  const std::string& chunkName,
                                  const ChunkPolicy& policy) {
    const bool binary = is_binary_chunk(chunk);
    if (binary && !policy.allowBinary) {
        return ScriptResult::fail("binary chunks are not allowed by the sandbox policy", ScriptFault::Mode);
    }
    if (!binary && !policy.allowSource) {
        return ScriptResult::fail("source chunks are not allowed by the sandbox policy", ScriptFault::Mode);
    }

    lua_State* L = impl_->lua->lua_state();
    const std::string name = "=" + chunkName;

    begin_call();
    const int rc = luaL_loadbufferx(L, reinterpret_cast<const char*>(chunk.data()), chunk.size(),
                                    name.c_str(), binary ? "b" : "t");
    if (rc != LUA_OK) {
        const char* msg = lua_tostring(L, -1);
        std::string err = msg ? msg : "unknown load error";
        lua_pop(L, 1);
        return ScriptResult::fail(err, rc == LUA_ERRMEM ? ScriptFault::Memory : ScriptFault::Syntax);
    }

    impl_->compiled = sol::protected_function(L, -1);
    lua_pop(L, 1);
    return ScriptResult::ok();
}

ScriptResult LuaState::run_loaded() {
    if (!impl_->compiled.valid()) {
        return ScriptResult::fail("no chunk loaded");
    }

    sol::protected_function chunk = std::move(impl_->compiled);
    impl_->compiled = sol::protected_function();

    begin_call();
    auto result = chunk();
    if (!result.valid()) {
        return failed_call(result, classify_failure());
    }
    return ScriptResult::ok();
}

ScriptResult LuaState::execute(const std::string& script, const std::string& chunkName) {
    std::span<const std::uint8_t> bytes(reinterpret_cast<const std::uint8_t*>(script.data()), script.size());
    auto loaded = load_chunk(bytes, chunkName, ChunkPolicy{true, false});
    if (!loaded) {
        return loaded;
    }
    return run_loaded();
}

ScriptResult LuaState::call(const std::string& funcName) {
    if (!has_function(funcName)) {
        return ScriptResult::fail("function '" + funcName + "' not found");
    }
    sol::protected_function func = (*impl_->lua)[funcName];

    begin_call();
    auto result = func();
    if (!result.valid()) {
        return failed_call(result, classify_failure());
    }
    return ScriptResult::ok();
}

bool LuaState::has_function(const std::string& funcName) const {
    sol::object obj = (*impl_->lua)[funcName];
    return obj.get_type() == sol::type::function;
}

bool LuaState::has_global(const std::string& name) const {
    sol::object obj = (*impl_->lua)[name];
    return obj.valid() && obj.get_type() != sol::type::lua_nil;
}

std::optional<long long> LuaState::get_global_int(const std::string& name) const {
    sol::object obj = (*impl_->lua)[name];
    if (!obj.is<lua_Integer>()) {
        return std::nullopt;
    }
    return static_cast<long long>(obj.as<lua_Integer>());
}

void LuaState::begin_call() {
    impl_->budget->rearm();
    if (sandboxed_) {
        lua_sethook(impl_->lua->lua_state(), &GuestBudget::on_count, LUA_MASKCOUNT, kHookInterval);
    }
}

ScriptFault LuaState::classify_failure() const {
    switch (impl_->budget->tripped) {
        case ScriptFault::Budget:
        case ScriptFault::Memory:
            return impl_->budget->tripped;
        default:
            return ScriptFault::Runtime;
    }
}

sol::state& LuaState::state() {
    return *impl_->lua;
}

const sol::state& LuaState::state() const {
    return *impl_->lua;
}

lua_State* LuaState::lua_state() {
    return impl_->lua->lua_state();
}

std::size_t LuaState::memory_used() const {
    return impl_->budget ? impl_->budget->bytesInUse.load() : 0;
}

std::unique_ptr<LuaState> create_sandboxed_state(const ScriptLimits& limits) {
    auto state = std::make_unique<LuaState>();
    if (!state->init(limits)) {
        return nullptr;
    }
    if (!state->apply_sandbox()) {
        return nullptr;
    }
    return state;
}

} // namespace modbridge::scripting
