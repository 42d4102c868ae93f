#pragma once

#include "world.hpp"

#include <modbridge/components/component_registry.hpp>

#include <entt/entt.hpp>

namespace modbridge::world {

// IWorld over an entt::registry. Component ids are resolved through the
// ComponentTypeRegistry; host-native types live in their own EnTT storage,
// guest-defined types in components::GuestComponents.
class EnttWorld final : public IWorld {
public:
    explicit EnttWorld(components::ComponentTypeRegistry& types);

    std::vector<QueryRow> query(const WorldQuery& q) const override;
    EntityId spawn(std::span<const ComponentValue> components, std::vector<Status>& failures) override;
    bool contains(EntityId entity) const override;
    void despawn(EntityId entity) override;
    Status insert(EntityId entity, const ComponentId& component, std::span<const std::uint8_t> bytes) override;
    void remove(EntityId entity, const ComponentId& component) override;

    entt::registry& registry() { return registry_; }
    const entt::registry& registry() const { return registry_; }

    components::ComponentTypeRegistry& types() { return types_; }

    static EntityId to_id(entt::entity entity);
    static entt::entity to_entity(EntityId id);

private:
    components::ComponentTypeRegistry& types_;
    entt::registry registry_;
};

} // namespace modbridge::world
