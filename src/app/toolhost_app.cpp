#include <toolhost/app/toolhost_app.hpp>

#include <toolhost/core/log.hpp>
#include <toolhost/registry/change_notifier.hpp>

#include <chrono>

namespace toolhost {

namespace {

LoaderOptions MakeLoaderOptions(const AppConfig& config) {
    LoaderOptions options;
    for (const auto& repo : config.tool_repos) {
        options.roots.emplace_back(repo);
    }
    options.extension = config.plugin_extension;
    options.cache_dir = config.cache_dir;
    return options;
}

ServerOptions MakeServerOptions(const ServerConfig& config) {
    ServerOptions options;
    options.host = config.host;
    options.port = config.port;
    options.io_threads = config.io_threads;
    options.max_message_bytes = config.max_message_bytes;
    return options;
}

} // anonymous namespace

ToolhostApp::ToolhostApp(AppConfig config)
    : config_(std::move(config)),
      loader_(MakeLoaderOptions(config_)),
      executor_(static_cast<std::size_t>(config_.server.executor_threads)),
      router_(registry_, executor_),
      server_(MakeServerOptions(config_.server), router_) {}

ToolhostApp::~ToolhostApp() {
    Stop();
}

Result<void, Error> ToolhostApp::Start() {
    if (started_) {
        return Result<void, Error>::Ok();
    }

    auto first = loader_.Load();
    if (first.IsErr()) {
        LogError("app", "initial tool scan failed: " + first.Error().message);
        return Result<void, Error>::Err(std::move(first).Error());
    }
    registry_.Publish(std::move(first).Value());

    if (config_.watch.enabled && !config_.tool_repos.empty()) {
        auto notifier = std::make_unique<PollingChangeNotifier>(
            loader_.Options().roots, config_.plugin_extension);
        WatchOptions options;
        options.debounce = std::chrono::milliseconds(config_.watch.debounce_ms);
        options.poll_interval = std::chrono::milliseconds(config_.watch.poll_interval_ms);
        watcher_ = std::make_unique<ToolWatcher>(loader_, registry_, std::move(notifier),
                                                 options);
        watcher_->Start();
    }

    auto listening = server_.Start();
    if (listening.IsErr()) {
        if (watcher_) {
            watcher_->Stop();
        }
        return listening;
    }

    started_ = true;
    return Result<void, Error>::Ok();
}

void ToolhostApp::Stop() {
    server_.Stop();
    if (watcher_) {
        watcher_->Stop();
    }
    executor_.Shutdown();
    started_ = false;
}

} // namespace toolhost
