#include <toolhost/registry/tool_loader.hpp>

#include <toolhost/core/log.hpp>
#include <toolhost/protocol/message.hpp>
#include <toolhost/registry/builtin_tools.hpp>
#include <toolhost/registry/plugin_library.hpp>

#include <algorithm>
#include <optional>
#include <system_error>

#include <unistd.h>

namespace toolhost {

namespace {

// Adds each declared tool to the builder as it is registered.
class BuilderRegistrar : public IToolRegistrar {
public:
    BuilderRegistrar(ToolRegistryBuilder& builder, std::string origin,
                     std::shared_ptr<const void> library)
        : builder_(builder), origin_(std::move(origin)), library_(std::move(library)) {}

    void Register(ToolSpec spec) override {
        if (error_) return;
        auto tool = Tool::FromSpec(std::move(spec), origin_, library_);
        if (tool.IsErr()) {
            error_ = std::move(tool).Error();
            return;
        }
        builder_.Add(std::move(tool).Value());
    }

    [[nodiscard]] const std::optional<Error>& Failure() const { return error_; }

private:
    ToolRegistryBuilder& builder_;
    std::string origin_;
    std::shared_ptr<const void> library_;
    std::optional<Error> error_;
};

} // anonymous namespace

ToolLoader::ToolLoader(LoaderOptions options) : options_(std::move(options)) {
    if (options_.cache_dir.empty()) {
        std::error_code ec;
        auto tmp = std::filesystem::temp_directory_path(ec);
        if (ec) {
            tmp = "/tmp";
        }
        options_.cache_dir = tmp / ("toolhost-" + std::to_string(::getpid()));
    }
}

std::vector<std::filesystem::path> ToolLoader::DiscoverPlugins() const {
    std::vector<std::filesystem::path> plugins;
    for (const auto& root : options_.roots) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            LogWarn("loader", "tool repository not found: " + root.string());
            continue;
        }

        std::vector<std::filesystem::path> found;
        std::filesystem::recursive_directory_iterator it(
            root, std::filesystem::directory_options::skip_permission_denied, ec);
        for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            const auto& entry = *it;
            std::error_code type_ec;
            if (entry.is_regular_file(type_ec) &&
                entry.path().extension() == options_.extension) {
                found.push_back(entry.path());
            }
        }
        if (ec) {
            LogWarn("loader", "scan of " + root.string() + " stopped early: " + ec.message());
        }

        std::sort(found.begin(), found.end(),
                  [&root](const auto& a, const auto& b) {
                      return a.lexically_relative(root) < b.lexically_relative(root);
                  });
        plugins.insert(plugins.end(), found.begin(), found.end());
    }
    return plugins;
}

std::filesystem::path ToolLoader::NextShadowDir() const {
    // Other loaders, in this process or another, may share cache_dir.
    return options_.cache_dir / ("scan-" + NewMessageId());
}

Result<std::shared_ptr<const ToolRegistry>, Error> ToolLoader::Load() {
    using LoadResult = Result<std::shared_ptr<const ToolRegistry>, Error>;

    std::lock_guard<std::mutex> lock(load_mutex_);
    const auto version = next_version_;
    const auto shadow_dir = NextShadowDir();
    ++next_version_;

    LogInfo("loader", "building tool registry #" + std::to_string(version));
    ToolRegistryBuilder builder(version);

    const auto plugins = DiscoverPlugins();
    for (std::size_t i = 0; i < plugins.size(); ++i) {
        const auto& source = plugins[i];
        // Index prefix keeps shadow names unique when two roots hold a plugin
        // with the same file name.
        auto shadow = shadow_dir / (std::to_string(i) + "-" + source.filename().string());

        auto library = PluginLibrary::Open(source, shadow);
        if (library.IsErr()) {
            LogError("loader", library.Error().message);
            return LoadResult::Err(std::move(library).Error());
        }
        auto lib = std::move(library).Value();

        auto specs = lib->CollectTools();
        if (specs.IsErr()) {
            LogError("loader", specs.Error().message);
            return LoadResult::Err(std::move(specs).Error());
        }

        BuilderRegistrar registrar(builder, source.string(), lib);
        for (auto& spec : std::move(specs).Value()) {
            registrar.Register(std::move(spec));
        }
        if (registrar.Failure()) {
            LogError("loader", registrar.Failure()->message);
            return LoadResult::Err(*registrar.Failure());
        }
    }

    if (options_.include_builtins) {
        BuilderRegistrar registrar(builder, kBuiltinOrigin, nullptr);
        RegisterBuiltinTools(registrar);
        if (registrar.Failure()) {
            return LoadResult::Err(*registrar.Failure());
        }
    }

    auto registry = std::move(builder).Build();
    LogInfo("loader", "registry #" + std::to_string(version) + " complete: " +
                          std::to_string(registry->Size()) + " tool(s) from " +
                          std::to_string(plugins.size()) + " plugin(s)");
    return LoadResult::Ok(std::move(registry));
}

} // namespace toolhost
