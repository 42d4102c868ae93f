#include "component_registry.hpp"

#include <modbridge/core/logger.hpp>

#include <algorithm>
#include <mutex>

namespace modbridge::components {

// ============================================================================
// BlobStorage
// ============================================================================

bool BlobStorage::contains(const entt::registry& registry, entt::entity entity) const {
    if (!registry.valid(entity)) {
        return false;
    }
    const auto* guest = registry.try_get<GuestComponents>(entity);
    return guest && guest->values.count(id_) > 0;
}

std::vector<entt::entity> BlobStorage::collect(const entt::registry& registry) const {
    std::vector<entt::entity> out;
    auto view = registry.view<const GuestComponents>();
    for (auto entity : view) {
        const auto& guest = view.get<const GuestComponents>(entity);
        if (guest.values.count(id_) > 0) {
            out.push_back(entity);
        }
    }
    return out;
}

Bytes BlobStorage::read(const entt::registry& registry, entt::entity entity) const {
    return registry.get<GuestComponents>(entity).values.at(id_);
}

Status BlobStorage::write(entt::registry& registry, entt::entity entity,
                          std::span<const std::uint8_t> bytes) const {
    auto& guest = registry.get_or_emplace<GuestComponents>(entity);
    guest.values[id_] = Bytes(bytes.begin(), bytes.end());
    return Status::success();
}

void BlobStorage::erase(entt::registry& registry, entt::entity entity) const {
    if (!registry.valid(entity)) {
        return;
    }
    auto* guest = registry.try_get<GuestComponents>(entity);
    if (!guest) {
        return;
    }
    guest->values.erase(id_);
    if (guest->values.empty()) {
        registry.remove<GuestComponents>(entity);
    }
}

// ============================================================================
// ComponentTypeRegistry
// ============================================================================

Status ComponentTypeRegistry::register_guest_type(const ComponentId& id, std::optional<std::size_t> fixedSize) {
    ComponentTypeDescriptor desc;
    desc.id = id;
    desc.codec = std::make_shared<const BlobCodec>(fixedSize);
    desc.storage = std::make_shared<const BlobStorage>(id);
    desc.nativeType = std::type_index(typeid(GuestComponents));
    desc.guestDefined = true;
    return register_descriptor(std::move(desc));
}

Status ComponentTypeRegistry::register_descriptor(ComponentTypeDescriptor desc) {
    if (desc.id.empty() || !desc.codec || !desc.storage) {
        return Status::fail(ErrorCode::DuplicateIncompatibleType, "incomplete component type descriptor");
    }

    std::unique_lock lock(mutex_);

    auto it = types_.find(desc.id);
    if (it != types_.end()) {
        const auto& existing = *it->second;
        if (existing.codec->signature() == desc.codec->signature() &&
            existing.nativeType == desc.nativeType) {
            return Status::success();
        }
        return Status::fail(ErrorCode::DuplicateIncompatibleType,
                            "component '" + desc.id + "' already registered with layout '" +
                                existing.codec->signature() + "', got '" + desc.codec->signature() + "'");
    }

    core::log_debug("ComponentTypeRegistry: registered '" + desc.id + "' (" + desc.codec->signature() +
                    (desc.guestDefined ? ", guest)" : ")"));

    auto key = desc.id;
    types_.emplace(std::move(key), std::make_shared<const ComponentTypeDescriptor>(std::move(desc)));
    return Status::success();
}

std::shared_ptr<const ComponentTypeDescriptor> ComponentTypeRegistry::find(const ComponentId& id) const {
    std::shared_lock lock(mutex_);
    auto it = types_.find(id);
    if (it == types_.end()) {
        return nullptr;
    }
    return it->second;
}

bool ComponentTypeRegistry::contains(const ComponentId& id) const {
    std::shared_lock lock(mutex_);
    return types_.count(id) > 0;
}

Status ComponentTypeRegistry::validate(const ComponentId& id, std::span<const std::uint8_t> bytes) const {
    auto desc = find(id);
    if (!desc) {
        return Status::fail(ErrorCode::UnknownComponentType, "unknown component type '" + id + "'");
    }
    auto status = desc->codec->validate(bytes);
    if (!status) {
        status.message = "component '" + id + "': " + status.message;
    }
    return status;
}

std::vector<ComponentId> ComponentTypeRegistry::ids() const {
    std::vector<ComponentId> out;
    {
        std::shared_lock lock(mutex_);
        out.reserve(types_.size());
        for (const auto& [id, desc] : types_) {
            out.push_back(id);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::size_t ComponentTypeRegistry::size() const {
    std::shared_lock lock(mutex_);
    return types_.size();
}

} // namespace modbridge::components
