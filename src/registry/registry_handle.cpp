#include <toolhost/registry/registry_handle.hpp>

namespace toolhost {

RegistryHandle::RegistryHandle() : current_(ToolRegistry::Empty()) {}

RegistryHandle::RegistryHandle(std::shared_ptr<const ToolRegistry> initial)
    : current_(initial ? std::move(initial) : ToolRegistry::Empty()) {}

std::shared_ptr<const ToolRegistry> RegistryHandle::Current() const {
    return std::atomic_load_explicit(&current_, std::memory_order_acquire);
}

void RegistryHandle::Publish(std::shared_ptr<const ToolRegistry> registry) {
    if (!registry) {
        return;
    }
    std::atomic_store_explicit(&current_, std::move(registry),
                               std::memory_order_release);
    generation_.fetch_add(1, std::memory_order_acq_rel);
}

} // namespace toolhost
