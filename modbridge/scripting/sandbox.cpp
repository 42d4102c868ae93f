#include "sandbox.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

namespace modbridge::scripting {

namespace {

// print(...) semantics: tostring() of every argument, tab separated.
std::string join_print_args(lua_State* L, const sol::variadic_args& args) {
    std::string line;
    const int first = args.stack_index();
    const int last = first + static_cast<int>(args.size());
    for (int i = first; i < last; ++i) {
        if (i != first) {
            line += '\t';
        }
        std::size_t len = 0;
        const char* text = luaL_tolstring(L, i, &len);
        line.append(text, len);
        lua_pop(L, 1);
    }
    return line;
}

} // namespace

std::unique_ptr<LuaState> Sandbox::create(const SandboxConfig& config) {
    auto state = create_sandboxed_state(config.to_script_limits());
    if (!state || !config.printHandler) {
        return state;
    }

    auto handler = config.printHandler;
    state->state()["print"] = [handler](sol::this_state ts, sol::variadic_args args) {
        handler(join_print_args(ts, args));
    };
    return state;
}

const std::vector<std::string>& Sandbox::forbidden_functions() {
    return LuaState::stripped_globals();
}

} // namespace modbridge::scripting
