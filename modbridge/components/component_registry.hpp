#pragma once

#include "component_codec.hpp"

#include <entt/entt.hpp>

#include <map>
#include <memory>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace modbridge::components {

// EnTT component holding the payloads of every guest-defined type on an entity.
struct GuestComponents {
    std::map<ComponentId, Bytes> values;
};

// Binding between a component id and its storage in an entt::registry.
// Callers must hold exclusive access to the registry for the mutating calls.
class NativeStorage {
public:
    virtual ~NativeStorage() = default;

    virtual bool contains(const entt::registry& registry, entt::entity entity) const = 0;
    virtual std::vector<entt::entity> collect(const entt::registry& registry) const = 0;

    // Encoded payload of the component; the entity must contain it.
    virtual Bytes read(const entt::registry& registry, entt::entity entity) const = 0;

    // Decodes and emplaces (or replaces) the component.
    virtual Status write(entt::registry& registry, entt::entity entity,
                         std::span<const std::uint8_t> bytes) const = 0;

    virtual void erase(entt::registry& registry, entt::entity entity) const = 0;
};

// Storage of a host-native struct T (T must not be an empty type).
template <typename T>
class TypedStorage final : public NativeStorage {
public:
    explicit TypedStorage(std::shared_ptr<const StructCodec<T>> codec) : codec_(std::move(codec)) {}

    bool contains(const entt::registry& registry, entt::entity entity) const override {
        return registry.valid(entity) && registry.all_of<T>(entity);
    }

    std::vector<entt::entity> collect(const entt::registry& registry) const override {
        auto view = registry.view<const T>();
        return std::vector<entt::entity>(view.begin(), view.end());
    }

    Bytes read(const entt::registry& registry, entt::entity entity) const override {
        return codec_->encode(registry.get<T>(entity));
    }

    Status write(entt::registry& registry, entt::entity entity,
                 std::span<const std::uint8_t> bytes) const override {
        T value{};
        auto status = codec_->decode(bytes, value);
        if (!status) {
            return status;
        }
        registry.emplace_or_replace<T>(entity, std::move(value));
        return Status::success();
    }

    void erase(entt::registry& registry, entt::entity entity) const override {
        if (registry.valid(entity)) {
            registry.remove<T>(entity);
        }
    }

private:
    std::shared_ptr<const StructCodec<T>> codec_;
};

// Storage of one guest-defined type inside GuestComponents.
class BlobStorage final : public NativeStorage {
public:
    explicit BlobStorage(ComponentId id) : id_(std::move(id)) {}

    bool contains(const entt::registry& registry, entt::entity entity) const override;
    std::vector<entt::entity> collect(const entt::registry& registry) const override;
    Bytes read(const entt::registry& registry, entt::entity entity) const override;
    Status write(entt::registry& registry, entt::entity entity,
                 std::span<const std::uint8_t> bytes) const override;
    void erase(entt::registry& registry, entt::entity entity) const override;

private:
    ComponentId id_;
};

// Immutable once registered.
struct ComponentTypeDescriptor {
    ComponentId id;
    std::shared_ptr<const ComponentCodec> codec;
    std::shared_ptr<const NativeStorage> storage;
    std::type_index nativeType{typeid(void)};
    bool guestDefined{false};
};

// ============================================================================
// ComponentTypeRegistry - string id -> codec + storage binding
//
// Re-registering an id is idempotent when the codec signature and the native
// type match, DuplicateIncompatibleType otherwise. Thread-safe.
// ============================================================================

class ComponentTypeRegistry {
public:
    ComponentTypeRegistry() = default;

    ComponentTypeRegistry(const ComponentTypeRegistry&) = delete;
    ComponentTypeRegistry& operator=(const ComponentTypeRegistry&) = delete;

    template <typename T>
    Status register_type(const ComponentId& id, StructCodec<T> codec) {
        auto shared = std::make_shared<const StructCodec<T>>(std::move(codec));

        ComponentTypeDescriptor desc;
        desc.id = id;
        desc.codec = shared;
        desc.storage = std::make_shared<const TypedStorage<T>>(shared);
        desc.nativeType = std::type_index(typeid(T));
        return register_descriptor(std::move(desc));
    }

    // Guest-defined type backed by BlobCodec/BlobStorage.
    Status register_guest_type(const ComponentId& id, std::optional<std::size_t> fixedSize = std::nullopt);

    Status register_descriptor(ComponentTypeDescriptor desc);

    std::shared_ptr<const ComponentTypeDescriptor> find(const ComponentId& id) const;
    bool contains(const ComponentId& id) const;

    // UnknownComponentType or the codec's verdict.
    Status validate(const ComponentId& id, std::span<const std::uint8_t> bytes) const;

    template <typename T>
    Status encode(const ComponentId& id, const T& value, Bytes& out) const {
        const StructCodec<T>* codec = nullptr;
        auto desc = find(id);
        auto status = typed_codec<T>(id, desc, codec);
        if (!status) {
            return status;
        }
        out = codec->encode(value);
        return Status::success();
    }

    template <typename T>
    Status decode(const ComponentId& id, std::span<const std::uint8_t> bytes, T& out) const {
        const StructCodec<T>* codec = nullptr;
        auto desc = find(id);
        auto status = typed_codec<T>(id, desc, codec);
        if (!status) {
            return status;
        }
        return codec->decode(bytes, out);
    }

    std::vector<ComponentId> ids() const;
    std::size_t size() const;

private:
    template <typename T>
    static Status typed_codec(const ComponentId& id,
                              const std::shared_ptr<const ComponentTypeDescriptor>& desc,
                              const StructCodec<T>*& codec) {
        if (!desc) {
            return Status::fail(ErrorCode::UnknownComponentType, "unknown component type '" + id + "'");
        }
        codec = dynamic_cast<const StructCodec<T>*>(desc->codec.get());
        if (!codec || desc->nativeType != std::type_index(typeid(T))) {
            return Status::fail(ErrorCode::SchemaMismatch,
                                "component '" + id + "' is not bound to the requested native type");
        }
        return Status::success();
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<ComponentId, std::shared_ptr<const ComponentTypeDescriptor>> types_;
};

} // namespace modbridge::components
