#pragma once

#include <toolhost/core/result.hpp>
#include <toolhost/registry/tool_registry.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace toolhost {

struct LoaderOptions {
    std::vector<std::filesystem::path> roots;
    std::string extension = ".so";
    // Shadow copies of plugins live here; a temp dir is used when empty.
    std::filesystem::path cache_dir;
    bool include_builtins = true;
};

// ---------------------------------------------------------------------------
// ToolLoader: builds a fresh registry snapshot from a full scan.
//
// Scan order, which also decides duplicates (last discovered wins):
//   1. roots in configured order,
//   2. plugin files by path relative to their root, lexicographically,
//   3. tools in the order each plugin registers them,
//   4. built-in tools last, so plugins cannot shadow them.
//
// A scan fails as a whole when any discovered plugin fails to load; nothing
// from a failed scan is returned. A missing root only logs a warning.
// ---------------------------------------------------------------------------
class ToolLoader {
public:
    explicit ToolLoader(LoaderOptions options);

    [[nodiscard]] Result<std::shared_ptr<const ToolRegistry>, Error> Load();

    /// Plugin files in scan order.
    [[nodiscard]] std::vector<std::filesystem::path> DiscoverPlugins() const;

    [[nodiscard]] const LoaderOptions& Options() const noexcept { return options_; }

private:
    std::filesystem::path NextShadowDir() const;

    LoaderOptions options_;
    std::mutex load_mutex_;
    std::uint64_t next_version_ = 1;
};

} // namespace toolhost
