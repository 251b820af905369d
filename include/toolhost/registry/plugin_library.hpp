#pragma once

#include <toolhost/core/result.hpp>
#include <toolhost/registry/tool.hpp>

#include <filesystem>
#include <memory>
#include <vector>

namespace toolhost {

constexpr const char* kRegisterToolsSymbol = "toolhost_register_tools";
constexpr const char* kAbiVersionSymbol = "toolhost_plugin_abi_version";

// ---------------------------------------------------------------------------
// PluginLibrary: one loaded tool plugin (a shared library).
//
// The library is loaded from a private shadow copy so that a plugin rewritten
// in place at its original path is picked up by the next scan; the dynamic
// loader would otherwise hand back the already-mapped image. The shadow file
// is deleted when the library is closed, i.e. when the last Tool referring to
// it goes away.
// ---------------------------------------------------------------------------
class PluginLibrary {
public:
    /// Copy `source` to `shadow`, dlopen the copy and check its ABI version.
    static Result<std::shared_ptr<PluginLibrary>, Error> Open(
        const std::filesystem::path& source,
        const std::filesystem::path& shadow);

    ~PluginLibrary();

    PluginLibrary(const PluginLibrary&) = delete;
    PluginLibrary& operator=(const PluginLibrary&) = delete;

    /// Run the plugin's registration entry point and return what it declared.
    /// The returned specs reference code inside this library.
    [[nodiscard]] Result<std::vector<ToolSpec>, Error> CollectTools() const;

    [[nodiscard]] const std::filesystem::path& Source() const noexcept { return source_; }

private:
    PluginLibrary(std::filesystem::path source, std::filesystem::path shadow,
                  void* handle);

    std::filesystem::path source_;
    std::filesystem::path shadow_;
    void* handle_ = nullptr;
};

} // namespace toolhost
