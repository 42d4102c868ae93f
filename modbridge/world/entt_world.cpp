#include "entt_world.hpp"

#include <algorithm>
#include <limits>
#include <memory>
#include <type_traits>

namespace modbridge::world {

using components::ComponentTypeDescriptor;

EnttWorld::EnttWorld(components::ComponentTypeRegistry& types) : types_(types) {}

EntityId EnttWorld::to_id(entt::entity entity) {
    return static_cast<EntityId>(entt::to_integral(entity));
}

entt::entity EnttWorld::to_entity(EntityId id) {
    using Integral = std::underlying_type_t<entt::entity>;
    if (id > static_cast<EntityId>(std::numeric_limits<Integral>::max())) {
        return entt::null;
    }
    return static_cast<entt::entity>(static_cast<Integral>(id));
}

std::vector<QueryRow> EnttWorld::query(const WorldQuery& q) const {
    std::vector<QueryRow> rows;

    std::vector<std::shared_ptr<const ComponentTypeDescriptor>> fetched;
    std::vector<std::shared_ptr<const ComponentTypeDescriptor>> required;
    std::vector<std::shared_ptr<const ComponentTypeDescriptor>> excluded;

    for (const auto& id : q.fetch) {
        auto desc = types_.find(id);
        if (!desc) return rows;
        fetched.push_back(desc);
        required.push_back(desc);
    }
    for (const auto& id : q.with) {
        auto desc = types_.find(id);
        if (!desc) return rows;
        required.push_back(desc);
    }
    for (const auto& id : q.without) {
        // Nothing can contain an unknown type, so it excludes nothing
        if (auto desc = types_.find(id)) {
            excluded.push_back(desc);
        }
    }

    if (required.empty()) {
        return rows;
    }

    // Seed with the smallest candidate set
    std::vector<entt::entity> candidates;
    bool seeded = false;
    for (const auto& desc : required) {
        auto set = desc->storage->collect(registry_);
        if (!seeded || set.size() < candidates.size()) {
            candidates = std::move(set);
            seeded = true;
        }
    }

    std::vector<entt::entity> matches;
    for (auto entity : candidates) {
        bool ok = std::all_of(required.begin(), required.end(), [&](const auto& desc) {
            return desc->storage->contains(registry_, entity);
        });
        ok = ok && std::none_of(excluded.begin(), excluded.end(), [&](const auto& desc) {
            return desc->storage->contains(registry_, entity);
        });
        if (ok) {
            matches.push_back(entity);
        }
    }

    std::sort(matches.begin(), matches.end(), [](entt::entity a, entt::entity b) {
        return to_id(a) < to_id(b);
    });

    rows.reserve(matches.size());
    for (auto entity : matches) {
        QueryRow row;
        row.entity = to_id(entity);
        row.components.reserve(fetched.size());
        for (const auto& desc : fetched) {
            row.components.push_back(ComponentValue{desc->id, desc->storage->read(registry_, entity)});
        }
        rows.push_back(std::move(row));
    }

    return rows;
}

EntityId EnttWorld::spawn(std::span<const ComponentValue> components, std::vector<Status>& failures) {
    auto entity = registry_.create();

    for (const auto& value : components) {
        auto desc = types_.find(value.id);
        if (!desc) {
            failures.push_back(Status::fail(ErrorCode::UnknownComponentType,
                                            "unknown component type '" + value.id + "'"));
            continue;
        }
        auto status = desc->storage->write(registry_, entity, value.payload);
        if (!status) {
            failures.push_back(std::move(status));
        }
    }

    return to_id(entity);
}

bool EnttWorld::contains(EntityId entity) const {
    auto e = to_entity(entity);
    return e != entt::null && registry_.valid(e);
}

void EnttWorld::despawn(EntityId entity) {
    if (contains(entity)) {
        registry_.destroy(to_entity(entity));
    }
}

Status EnttWorld::insert(EntityId entity, const ComponentId& component, std::span<const std::uint8_t> bytes) {
    if (!contains(entity)) {
        return Status::fail(ErrorCode::UnknownEntity, "entity " + std::to_string(entity) + " does not exist");
    }
    auto desc = types_.find(component);
    if (!desc) {
        return Status::fail(ErrorCode::UnknownComponentType, "unknown component type '" + component + "'");
    }
    return desc->storage->write(registry_, to_entity(entity), bytes);
}

void EnttWorld::remove(EntityId entity, const ComponentId& component) {
    if (!contains(entity)) {
        return;
    }
    if (auto desc = types_.find(component)) {
        desc->storage->erase(registry_, to_entity(entity));
    }
}

} // namespace modbridge::world
