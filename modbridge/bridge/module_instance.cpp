#include "module_instance.hpp"

namespace modbridge::bridge {

ModuleArtifact::ModuleArtifact(ModuleHandle handle,
                               std::string name,
                               std::uint64_t generation,
                               std::vector<std::unique_ptr<ModuleInstance>> instances)
    : handle_(handle),
      name_(std::move(name)),
      generation_(generation),
      instances_(std::move(instances)) {}

ModuleArtifact::Lease ModuleArtifact::acquire() {
    const std::size_t count = instances_.size();
    const std::size_t start = nextInstance_.fetch_add(1, std::memory_order_relaxed) % count;

    for (std::size_t i = 0; i < count; ++i) {
        auto& inst = *instances_[(start + i) % count];
        std::unique_lock<std::mutex> lock(inst.mutex(), std::try_to_lock);
        if (lock.owns_lock()) {
            return Lease(inst, std::move(lock));
        }
    }

    // All busy
    auto& inst = *instances_[start];
    return Lease(inst, std::unique_lock<std::mutex>(inst.mutex()));
}

} // namespace modbridge::bridge
