#pragma once

#include <modbridge/core/error.hpp>
#include <modbridge/core/types.hpp>

#include <span>
#include <vector>

namespace modbridge::world {

struct ComponentValue {
    ComponentId id;
    Bytes payload;
};

// Entities containing every `fetch` and `with` component and none of the
// `without` components. Only `fetch` components are returned, in fetch order.
struct WorldQuery {
    std::vector<ComponentId> fetch;
    std::vector<ComponentId> with;
    std::vector<ComponentId> without;
};

struct QueryRow {
    EntityId entity{0};
    std::vector<ComponentValue> components;
};

// ============================================================================
// IWorld - the authoritative entity-component store seen by the bridge
//
// query() is read-only. The mutating calls require exclusive access
// (see Reconciler::exclusive_access()).
// ============================================================================

class IWorld {
public:
    virtual ~IWorld() = default;

    // Rows in ascending entity id order. Unknown component ids in fetch/with
    // match nothing, as does a query without fetch and with terms.
    virtual std::vector<QueryRow> query(const WorldQuery& q) const = 0;

    // Creates an entity with the given components. Components that are not
    // accepted are dropped; their failures are appended to `failures`.
    virtual EntityId spawn(std::span<const ComponentValue> components, std::vector<Status>& failures) = 0;

    virtual bool contains(EntityId entity) const = 0;

    // No-op when the entity does not exist.
    virtual void despawn(EntityId entity) = 0;

    // UnknownEntity, UnknownComponentType or SchemaMismatch on failure.
    virtual Status insert(EntityId entity, const ComponentId& component, std::span<const std::uint8_t> bytes) = 0;

    // No-op when the entity or the component does not exist.
    virtual void remove(EntityId entity, const ComponentId& component) = 0;
};

} // namespace modbridge::world
