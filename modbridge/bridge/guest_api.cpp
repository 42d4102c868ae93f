#include "guest_api.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

#include <atomic>
#include <limits>
#include <map>
#include <memory>
#include <unordered_set>

namespace modbridge::bridge::guest_api {

namespace {

// ============================================================================
// app - handed to setup(), dead once setup() returns
// ============================================================================

struct AppState {
    SetupDeclarations decls;
    const core::ModuleSettings* settings{nullptr};
    bool open{true};
};

std::vector<ComponentId> parse_id_list(const sol::table& list, const char* field) {
    std::vector<ComponentId> ids;
    for (std::size_t i = 1; i <= list.size(); ++i) {
        sol::object item = list[i];
        if (item.get_type() != sol::type::string) {
            throw sol::error(std::string("'") + field + "' entries must be component id strings");
        }
        ids.push_back(item.as<std::string>());
    }
    return ids;
}

QueryShape parse_system_spec(const sol::table& spec) {
    QueryShape shape;

    sol::optional<sol::table> query = spec["query"];
    if (query) {
        for (std::size_t i = 1; i <= query->size(); ++i) {
            sol::object item = (*query)[i];

            // Bare id means read access
            if (item.get_type() == sol::type::string) {
                shape.fetch.push_back(QueryTerm{item.as<std::string>(), Access::Read});
                continue;
            }
            if (item.get_type() != sol::type::table) {
                throw sol::error("query terms must be {component_id, \"read\"|\"write\"}");
            }

            sol::table term = item.as<sol::table>();
            sol::object id = term[1];
            sol::object mode = term[2];
            if (id.get_type() != sol::type::string) {
                throw sol::error("query term without a component id");
            }

            Access access = Access::Read;
            if (mode.get_type() == sol::type::string) {
                const auto m = mode.as<std::string>();
                if (m == "write") {
                    access = Access::Write;
                } else if (m != "read") {
                    throw sol::error("unknown query access '" + m + "'");
                }
            } else if (mode.valid() && mode.get_type() != sol::type::lua_nil) {
                throw sol::error("query access must be \"read\" or \"write\"");
            }
            shape.fetch.push_back(QueryTerm{id.as<std::string>(), access});
        }
    }

    sol::optional<sol::table> with = spec["with"];
    if (with) {
        shape.with = parse_id_list(*with, "with");
    }
    sol::optional<sol::table> without = spec["without"];
    if (without) {
        shape.without = parse_id_list(*without, "without");
    }

    return shape;
}

class AppContext {
public:
    explicit AppContext(std::shared_ptr<AppState> state) : state_(std::move(state)) {}

    void add_system(const std::string& phase, const std::string& name, sol::optional<sol::table> spec) {
        auto& decls = open_state().decls;
        if (phase.empty() || name.empty()) {
            throw sol::error("add_system: phase and name must not be empty");
        }
        for (const auto& existing : decls.systems) {
            if (existing.phase == phase && existing.name == name) {
                throw sol::error("add_system: '" + name + "' already added to phase '" + phase + "'");
            }
        }

        SystemDecl decl;
        decl.phase = phase;
        decl.name = name;
        if (spec) {
            decl.query = parse_system_spec(*spec);
        }

        const auto* settings = state_->settings;
        if (settings && !settings->phase_allowed(phase)) {
            decls.disallowed.push_back(std::move(decl));
            return;
        }
        decls.systems.push_back(std::move(decl));
    }

    void register_component(const std::string& id, sol::optional<lua_Integer> size) {
        auto& decls = open_state().decls;
        if (id.empty()) {
            throw sol::error("register_component: empty component id");
        }

        GuestComponentDecl decl;
        decl.id = id;
        if (size) {
            if (*size <= 0) {
                throw sol::error("register_component: size must be positive");
            }
            decl.size = static_cast<std::size_t>(*size);
        }

        for (const auto& existing : decls.components) {
            if (existing.id == id) {
                if (existing == decl) return;
                throw sol::error("register_component: '" + id + "' declared twice with different sizes");
            }
        }
        decls.components.push_back(std::move(decl));
    }

private:
    AppState& open_state() {
        if (!state_->open) {
            throw sol::error("app is only usable inside setup()");
        }
        return *state_;
    }

    std::shared_ptr<AppState> state_;
};

// ============================================================================
// commands - handed to a system call, closed when the call returns
// ============================================================================

struct RecorderState {
    CommandBuffer buffer;
    const SystemRegistration* system{nullptr};
    std::uint32_t tag{0};                  // stamped into this call's provisional refs
    std::unordered_set<EntityId> visible;  // entities of the query snapshot
    bool open{true};
};

// Provisional refs are -(tag << 32 | index + 1), so a ref kept from another
// call never resolves against this call's spawns.
constexpr int kTagShift = 32;
constexpr std::uint64_t kSlotMask = (std::uint64_t{1} << kTagShift) - 1;
constexpr std::uint32_t kTagLimit = std::uint32_t{1} << 30;

std::uint32_t next_call_tag() {
    static std::atomic<std::uint32_t> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed) % kTagLimit + 1;
}

lua_Integer encode_provisional(std::uint32_t tag, const EntityRef& ref) {
    const auto raw = (static_cast<std::uint64_t>(tag) << kTagShift) | (ref.value + 1);
    return -static_cast<lua_Integer>(raw);
}

Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

class CommandRecorder {
public:
    explicit CommandRecorder(std::shared_ptr<RecorderState> state) : state_(std::move(state)) {}

    lua_Integer spawn(sol::table components) {
        auto& st = open_state();

        // Sorted by id so the recorded order does not depend on table iteration
        std::map<ComponentId, Bytes> sorted;
        for (const auto& kv : components) {
            if (kv.first.get_type() != sol::type::string || kv.second.get_type() != sol::type::string) {
                throw sol::error("spawn: components must map component ids to byte strings");
            }
            sorted[kv.first.as<std::string>()] = to_bytes(kv.second.as<std::string>());
        }
        if (st.buffer.spawn_count() == std::numeric_limits<std::uint32_t>::max()) {
            throw sol::error("spawn: too many spawns in one call");
        }

        std::vector<world::ComponentValue> values;
        values.reserve(sorted.size());
        for (auto& [id, payload] : sorted) {
            values.push_back(world::ComponentValue{id, std::move(payload)});
        }

        return encode_provisional(st.tag, st.buffer.spawn(std::move(values)));
    }

    void despawn(lua_Integer ref) {
        auto& st = open_state();
        st.buffer.despawn(target_of(st, ref));
    }

    void insert(lua_Integer ref, const std::string& id, const std::string& bytes) {
        auto& st = open_state();
        auto target = target_of(st, ref);
        check_write_access(st, target, id);
        st.buffer.insert(target, id, to_bytes(bytes));
    }

    void remove(lua_Integer ref, const std::string& id) {
        auto& st = open_state();
        auto target = target_of(st, ref);
        check_write_access(st, target, id);
        st.buffer.remove(target, id);
    }

private:
    RecorderState& open_state() {
        if (!state_->open) {
            throw sol::error("commands used after the system returned");
        }
        return *state_;
    }

    // Existing entities must come from the call's snapshot, provisional refs
    // from one of its spawns.
    static EntityRef target_of(const RecorderState& st, lua_Integer ref) {
        if (ref >= 0) {
            const auto id = static_cast<EntityId>(ref);
            if (st.visible.count(id) == 0) {
                throw sol::error("entity " + std::to_string(ref) + " is not in the query of system '" +
                                 st.system->name + "'");
            }
            return EntityRef::existing(id);
        }

        const std::uint64_t raw = ref == std::numeric_limits<lua_Integer>::min()
                                      ? 0
                                      : static_cast<std::uint64_t>(-ref);
        const auto tag = static_cast<std::uint32_t>(raw >> kTagShift);
        const std::uint64_t slot = raw & kSlotMask;
        if (tag != st.tag || slot == 0) {
            throw sol::error("entity reference " + std::to_string(ref) + " was not spawned by this call");
        }
        // Refs past the last spawn are left for the reconciler (OrderingError)
        return EntityRef::provisional(static_cast<std::uint32_t>(slot - 1));
    }

    static void check_write_access(const RecorderState& st, const EntityRef& target, const ComponentId& id) {
        if (target.is_provisional()) {
            return;
        }
        auto access = st.system->query.access_of(id);
        if (access && *access == Access::Read) {
            throw sol::error("component '" + id + "' is read-only in system '" + st.system->name + "'");
        }
    }

    std::shared_ptr<RecorderState> state_;
};

// ============================================================================
// Helpers
// ============================================================================

const char* fault_name(scripting::ScriptFault fault) {
    switch (fault) {
        case scripting::ScriptFault::Budget: return "execution budget exceeded";
        case scripting::ScriptFault::Memory: return "memory limit exceeded";
        default: return "runtime error";
    }
}

// True when the first result is exactly `false`; `reason` gets the second.
bool reported_failure(const sol::protected_function_result& result, std::string& reason) {
    if (result.return_count() == 0 || result.get_type(0) != sol::type::boolean) {
        return false;
    }
    if (result.get<bool>(0)) {
        return false;
    }
    reason = "returned false";
    if (result.return_count() > 1 && result.get_type(1) == sol::type::string) {
        reason = result.get<std::string>(1);
    }
    return true;
}

// ============================================================================
// Protected entry
//
// Everything that allocates in the guest state, arguments included, runs
// inside lua_pcall so a full state reports LUA_ERRMEM instead of panicking.
// Only the raw C API is used between the push and the call: nothing with a
// destructor may be live when Lua unwinds.
// ============================================================================

struct EntryCall {
    const std::string* function{nullptr};
    const AppContext* app{nullptr};                        // setup(app)
    const std::vector<world::QueryRow>* rows{nullptr};     // system(query, commands)
    const CommandRecorder* commands{nullptr};
};

void push_query(lua_State* L, const std::vector<world::QueryRow>& rows) {
    lua_createtable(L, static_cast<int>(rows.size()), 0);
    lua_Integer i = 1;
    for (const auto& row : rows) {
        lua_createtable(L, 0, 2);
        lua_pushinteger(L, static_cast<lua_Integer>(row.entity));
        lua_setfield(L, -2, "entity");

        lua_createtable(L, 0, static_cast<int>(row.components.size()));
        for (const auto& value : row.components) {
            lua_pushlstring(L, reinterpret_cast<const char*>(value.payload.data()), value.payload.size());
            lua_setfield(L, -2, value.id.c_str());
        }
        lua_setfield(L, -2, "components");

        lua_rawseti(L, -2, i++);
    }
}

int enter_guest(lua_State* L) {
    const auto* call = static_cast<const EntryCall*>(lua_touserdata(L, 1));
    lua_settop(L, 0);

    lua_getglobal(L, call->function->c_str());
    int nargs = 0;
    if (call->app) {
        sol::stack::push(L, *call->app);
        nargs = 1;
    } else {
        push_query(L, *call->rows);
        sol::stack::push(L, *call->commands);
        nargs = 2;
    }
    lua_call(L, nargs, LUA_MULTRET);
    return lua_gettop(L);
}

sol::protected_function_result call_protected(scripting::LuaState& lua, const EntryCall& call) {
    lua_State* L = lua.lua_state();
    const int base = lua_gettop(L);

    lua.begin_call();
    lua_pushcfunction(L, &enter_guest);
    lua_pushlightuserdata(L, const_cast<EntryCall*>(&call));
    const int rc = lua_pcall(L, 1, LUA_MULTRET, 0);

    const int returned = lua_gettop(L) - base;
    return sol::protected_function_result(L, base + 1, returned, returned, static_cast<sol::call_status>(rc));
}

bool same_shape(const QueryShape& a, const QueryShape& b) {
    if (a.fetch.size() != b.fetch.size() || a.with != b.with || a.without != b.without) {
        return false;
    }
    for (std::size_t i = 0; i < a.fetch.size(); ++i) {
        if (a.fetch[i].component != b.fetch[i].component || a.fetch[i].access != b.fetch[i].access) {
            return false;
        }
    }
    return true;
}

} // namespace

bool same_declarations(const SetupDeclarations& a, const SetupDeclarations& b) {
    if (a.components != b.components || a.systems.size() != b.systems.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.systems.size(); ++i) {
        const auto& x = a.systems[i];
        const auto& y = b.systems[i];
        if (x.phase != y.phase || x.name != y.name || !same_shape(x.query, y.query)) {
            return false;
        }
    }
    return true;
}

void install(scripting::LuaState& lua, const components::ComponentTypeRegistry& types) {
    auto& state = lua.state();

    state.new_usertype<AppContext>("ModApp",
        sol::no_constructor,
        "add_system", &AppContext::add_system,
        "register_component", &AppContext::register_component);

    state.new_usertype<CommandRecorder>("ModCommands",
        sol::no_constructor,
        "spawn", &CommandRecorder::spawn,
        "despawn", &CommandRecorder::despawn,
        "insert", &CommandRecorder::insert,
        "remove", &CommandRecorder::remove);

    auto host = state.create_named_table("host");
    host["interface_version"] = kInterfaceVersion;
    host["layout"] = [&types](const std::string& id) -> sol::optional<std::string> {
        auto desc = types.find(id);
        if (!desc) {
            return sol::nullopt;
        }
        return desc->codec->signature();
    };

    // Same routing as print (installed by the sandbox)
    sol::object print = state["print"];
    host["log"] = print;
}

Status run_setup(scripting::LuaState& lua, const core::ModuleSettings& settings, SetupDeclarations& out) {
    if (lua.has_global("interface_version")) {
        auto version = lua.get_global_int("interface_version");
        if (!version || *version != kInterfaceVersion) {
            return Status::fail(ErrorCode::InterfaceMismatch,
                                "module targets interface version " +
                                    (version ? std::to_string(*version) : std::string("?")) +
                                    ", host provides " + std::to_string(kInterfaceVersion));
        }
    }

    if (!lua.has_function("setup")) {
        return Status::fail(ErrorCode::InterfaceMismatch, "module does not define a setup(app) function");
    }

    auto app = std::make_shared<AppState>();
    app->settings = &settings;
    const AppContext context(app);
    const std::string entry = "setup";

    EntryCall call;
    call.function = &entry;
    call.app = &context;

    auto result = call_protected(lua, call);
    app->open = false;

    if (!result.valid()) {
        sol::error err = result;
        return Status::fail(ErrorCode::SetupTrap,
                            std::string("setup: ") + fault_name(lua.classify_failure()) + ": " + err.what());
    }

    std::string reason;
    if (reported_failure(result, reason)) {
        return Status::fail(ErrorCode::SetupTrap, "setup reported failure: " + reason);
    }

    for (const auto& system : app->decls.systems) {
        if (!lua.has_function(system.name)) {
            return Status::fail(ErrorCode::InterfaceMismatch,
                                "system '" + system.name + "' has no entry point function");
        }
    }

    out = std::move(app->decls);
    return Status::success();
}

Status call_system(scripting::LuaState& lua,
                   const SystemRegistration& system,
                   const std::vector<world::QueryRow>& rows,
                   CommandBuffer& out) {
    if (!lua.has_function(system.name)) {
        return Status::fail(ErrorCode::InvocationTrap, "entry point '" + system.name + "' is gone");
    }

    auto recorder = std::make_shared<RecorderState>();
    recorder->system = &system;
    recorder->tag = next_call_tag();
    for (const auto& row : rows) {
        recorder->visible.insert(row.entity);
    }
    const CommandRecorder commands(recorder);

    EntryCall call;
    call.function = &system.name;
    call.rows = &rows;
    call.commands = &commands;

    auto result = call_protected(lua, call);
    recorder->open = false;

    if (!result.valid()) {
        sol::error err = result;
        return Status::fail(ErrorCode::InvocationTrap,
                            std::string(fault_name(lua.classify_failure())) + ": " + err.what());
    }

    std::string reason;
    if (reported_failure(result, reason)) {
        return Status::fail(ErrorCode::GuestFailure, reason);
    }

    out = std::move(recorder->buffer);
    return Status::success();
}

} // namespace modbridge::bridge::guest_api
