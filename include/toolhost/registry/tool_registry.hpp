#pragma once

#include <toolhost/registry/tool.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolhost {

// ---------------------------------------------------------------------------
// ToolRegistry: immutable name→Tool snapshot for one point in time.
//
// Snapshots are only ever created by ToolRegistryBuilder and shared as
// std::shared_ptr<const ToolRegistry>; nothing mutates one after Build().
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    /// Snapshot with no tools (version 0).
    static std::shared_ptr<const ToolRegistry> Empty();

    /// nullptr when `name` is not in this snapshot. The pointer is valid for
    /// as long as the caller keeps the snapshot alive.
    [[nodiscard]] const Tool* Find(const std::string& name) const;

    [[nodiscard]] bool HasTool(const std::string& name) const;

    /// Tool names, sorted.
    [[nodiscard]] std::vector<std::string> Names() const;

    [[nodiscard]] std::size_t Size() const noexcept { return tools_.size(); }

    /// Catalog array sorted by name: [{"name", "description", "args_list"}].
    [[nodiscard]] nlohmann::json Catalog() const;

    /// Monotonic build number assigned by the loader; 0 for hand-built ones.
    [[nodiscard]] std::uint64_t Version() const noexcept { return version_; }

private:
    friend class ToolRegistryBuilder;
    ToolRegistry() = default;

    std::map<std::string, Tool> tools_;
    std::uint64_t version_ = 0;
};

// ---------------------------------------------------------------------------
// ToolRegistryBuilder: collects tools for one snapshot.
//
// Duplicate names resolve to the tool added last; the replaced one is
// reported through Replaced() and logged at WARN.
// ---------------------------------------------------------------------------
class ToolRegistryBuilder {
public:
    explicit ToolRegistryBuilder(std::uint64_t version = 0);

    void Add(Tool tool);

    /// Human-readable notes for each name collision, in the order seen.
    [[nodiscard]] const std::vector<std::string>& Replaced() const noexcept {
        return replaced_;
    }

    [[nodiscard]] std::shared_ptr<const ToolRegistry> Build() &&;

private:
    std::shared_ptr<ToolRegistry> registry_;
    std::vector<std::string> replaced_;
};

} // namespace toolhost
