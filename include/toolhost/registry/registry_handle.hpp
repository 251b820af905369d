#pragma once

#include <toolhost/registry/tool_registry.hpp>

#include <atomic>
#include <cstdint>
#include <memory>

namespace toolhost {

// ---------------------------------------------------------------------------
// RegistryHandle: the one shared, atomically replaced pointer to the
// current registry snapshot.
//
// Readers take a reference-counted copy with Current() and keep using that
// snapshot for the rest of their operation, so a reload never changes what
// an in-flight call sees. Publish() swaps in a complete snapshot in a single
// atomic store; the old one is freed when its last reader lets go.
// ---------------------------------------------------------------------------
class RegistryHandle {
public:
    RegistryHandle();
    explicit RegistryHandle(std::shared_ptr<const ToolRegistry> initial);

    RegistryHandle(const RegistryHandle&) = delete;
    RegistryHandle& operator=(const RegistryHandle&) = delete;

    [[nodiscard]] std::shared_ptr<const ToolRegistry> Current() const;

    /// Ignores nullptr.
    void Publish(std::shared_ptr<const ToolRegistry> registry);

    /// Number of successful Publish() calls.
    [[nodiscard]] std::uint64_t Generation() const noexcept {
        return generation_.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<const ToolRegistry> current_;
    std::atomic<std::uint64_t> generation_{0};
};

} // namespace toolhost
