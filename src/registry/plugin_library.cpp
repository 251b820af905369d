#include <toolhost/registry/plugin_library.hpp>

#include <toolhost/core/log.hpp>

#include <exception>
#include <string>
#include <system_error>

#include <dlfcn.h>

namespace toolhost {

namespace {

using RegisterToolsFn = void (*)(IToolRegistrar*);
using AbiVersionFn = int (*)();

Error MakeLoadError(const std::filesystem::path& source,
                    const std::string& message) {
    return Error::Make(ErrorCategory::Load, "PluginLibrary",
                       source.string() + ": " + message);
}

std::string LastDlError() {
    const char* err = dlerror();
    return err != nullptr ? err : "unknown dynamic loader error";
}

class CollectingRegistrar : public IToolRegistrar {
public:
    void Register(ToolSpec spec) override { specs.push_back(std::move(spec)); }

    std::vector<ToolSpec> specs;
};

} // anonymous namespace

PluginLibrary::PluginLibrary(std::filesystem::path source,
                             std::filesystem::path shadow, void* handle)
    : source_(std::move(source)), shadow_(std::move(shadow)), handle_(handle) {}

PluginLibrary::~PluginLibrary() {
    if (handle_ != nullptr) {
        dlclose(handle_);
    }
    std::error_code ec;
    std::filesystem::remove(shadow_, ec);
    // Drop the per-scan directory once its last library is gone.
    std::filesystem::remove(shadow_.parent_path(), ec);
}

Result<std::shared_ptr<PluginLibrary>, Error> PluginLibrary::Open(
    const std::filesystem::path& source,
    const std::filesystem::path& shadow) {
    using OpenResult = Result<std::shared_ptr<PluginLibrary>, Error>;

    std::error_code ec;
    std::filesystem::create_directories(shadow.parent_path(), ec);
    if (ec) {
        return OpenResult::Err(MakeLoadError(
            source, "cannot create shadow directory: " + ec.message()));
    }
    // Never replace a file another loader may have mapped.
    std::filesystem::copy_file(source, shadow, std::filesystem::copy_options::none, ec);
    if (ec) {
        return OpenResult::Err(MakeLoadError(source, "cannot copy plugin: " + ec.message()));
    }

    // RTLD_LOCAL keeps each plugin's symbols private, so two plugins may
    // define the same internal names.
    void* handle = dlopen(shadow.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr) {
        auto message = LastDlError();
        std::filesystem::remove(shadow, ec);
        return OpenResult::Err(MakeLoadError(source, message));
    }

    std::shared_ptr<PluginLibrary> library(new PluginLibrary(source, shadow, handle));

    dlerror();
    if (auto* abi = reinterpret_cast<AbiVersionFn>(dlsym(handle, kAbiVersionSymbol))) {
        const int version = abi();
        if (version != TOOLHOST_PLUGIN_ABI_VERSION) {
            return OpenResult::Err(MakeLoadError(
                source, "plugin ABI version " + std::to_string(version) +
                            " does not match host version " +
                            std::to_string(TOOLHOST_PLUGIN_ABI_VERSION)));
        }
    }

    dlerror();
    if (dlsym(handle, kRegisterToolsSymbol) == nullptr) {
        return OpenResult::Err(MakeLoadError(
            source, std::string("missing entry point '") + kRegisterToolsSymbol + "'"));
    }

    return OpenResult::Ok(std::move(library));
}

Result<std::vector<ToolSpec>, Error> PluginLibrary::CollectTools() const {
    using CollectResult = Result<std::vector<ToolSpec>, Error>;

    auto* entry = reinterpret_cast<RegisterToolsFn>(dlsym(handle_, kRegisterToolsSymbol));
    if (entry == nullptr) {
        return CollectResult::Err(MakeLoadError(source_, LastDlError()));
    }

    CollectingRegistrar registrar;
    try {
        entry(&registrar);
    } catch (const std::exception& e) {
        return CollectResult::Err(MakeLoadError(
            source_, std::string("registration failed: ") + e.what()));
    } catch (...) {
        return CollectResult::Err(MakeLoadError(
            source_, "registration failed with a non-standard exception"));
    }
    LogDebug("loader", source_.string() + ": " +
                           std::to_string(registrar.specs.size()) + " tool(s) declared");
    return CollectResult::Ok(std::move(registrar.specs));
}

} // namespace toolhost
