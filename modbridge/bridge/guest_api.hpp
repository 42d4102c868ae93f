#pragma once

#include "command_buffer.hpp"
#include "system_registry.hpp"

#include <modbridge/components/component_registry.hpp>
#include <modbridge/core/config.hpp>
#include <modbridge/core/error.hpp>
#include <modbridge/scripting/lua_state.hpp>
#include <modbridge/world/world.hpp>

#include <optional>
#include <string>
#include <vector>

namespace modbridge::bridge::guest_api {

// Guest-facing surface of the host, versioned by kInterfaceVersion:
//
//   host.interface_version
//   host.layout(component_id)          -> signature string or nil
//   host.log(...), print(...)          -> host logger, tagged with the module name
//
//   function setup(app)
//       app:add_system(phase, name [, { query = {{id, "read"|"write"}, ...},
//                                       with = {id, ...}, without = {id, ...} }])
//       app:register_component(id [, size])
//   end
//
//   function <name>(query, commands)
//       -- query:    { { entity = <int>, components = { [id] = <bytes> } }, ... }
//       -- commands: spawn(components) -> ref, despawn(ref),
//       --           insert(ref, id, bytes), remove(ref, id)
//       -- a ref is an entity of `query` or a value spawn() returned in this call
//       return false, "reason"   -- explicit failure, anything else is success
//   end

struct GuestComponentDecl {
    ComponentId id;
    std::optional<std::size_t> size;

    bool operator==(const GuestComponentDecl& other) const = default;
};

struct SystemDecl {
    std::string phase;
    std::string name;
    QueryShape query;
};

// Everything setup() declared, in declaration order.
struct SetupDeclarations {
    std::vector<SystemDecl> systems;
    std::vector<GuestComponentDecl> components;

    // Systems declared for a phase the host does not open to modules
    std::vector<SystemDecl> disallowed;
};

bool same_declarations(const SetupDeclarations& a, const SetupDeclarations& b);

// Binds the host table and the usertypes behind `app` and `commands`.
void install(scripting::LuaState& lua, const components::ComponentTypeRegistry& types);

// Checks the interface contract and runs setup(app). Systems for phases
// outside settings.allowed_phases land in out.disallowed.
// InterfaceMismatch or SetupTrap on failure.
Status run_setup(scripting::LuaState& lua, const core::ModuleSettings& settings, SetupDeclarations& out);

// Calls the system's entry point with a query snapshot. On success `out`
// receives the recorded commands. GuestFailure or InvocationTrap otherwise.
Status call_system(scripting::LuaState& lua,
                   const SystemRegistration& system,
                   const std::vector<world::QueryRow>& rows,
                   CommandBuffer& out);

} // namespace modbridge::bridge::guest_api
