#include <toolhost/registry/tool_watcher.hpp>

#include <toolhost/core/log.hpp>

#include <optional>

namespace toolhost {

namespace {

const char* KindName(FileChange::Kind kind) {
    switch (kind) {
        case FileChange::Kind::Created:  return "created";
        case FileChange::Kind::Modified: return "modified";
        case FileChange::Kind::Deleted:  return "deleted";
    }
    return "changed";
}

} // anonymous namespace

ToolWatcher::ToolWatcher(ToolLoader& loader, RegistryHandle& handle,
                         std::unique_ptr<IChangeNotifier> notifier,
                         WatchOptions options)
    : loader_(loader),
      handle_(handle),
      notifier_(std::move(notifier)),
      options_(options) {}

ToolWatcher::~ToolWatcher() {
    Stop();
}

void ToolWatcher::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) {
        return;
    }
    stopping_ = false;
    // Establish the baseline before returning so that changes made right
    // after Start() are reported.
    notifier_->Poll();
    thread_ = std::thread([this] { Loop(); });
    LogInfo("watcher", "watching tool repositories (debounce " +
                           std::to_string(options_.debounce.count()) + " ms)");
}

void ToolWatcher::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_.joinable()) {
            return;
        }
        stopping_ = true;
    }
    wake_.notify_all();
    thread_.join();
    LogInfo("watcher", "stopped");
}

bool ToolWatcher::Running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thread_.joinable() && !stopping_;
}

Result<void, Error> ToolWatcher::ReloadNow() {
    auto registry = loader_.Load();
    if (registry.IsErr()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++reloads_failed_;
        }
        LogError("watcher", "reload failed, keeping registry #" +
                                std::to_string(handle_.Current()->Version()) +
                                ": " + registry.Error().message);
        return Result<void, Error>::Err(std::move(registry).Error());
    }

    auto snapshot = std::move(registry).Value();
    const auto version = snapshot->Version();
    handle_.Publish(std::move(snapshot));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++reloads_ok_;
    }
    LogInfo("watcher", "published registry #" + std::to_string(version));
    return Result<void, Error>::Ok();
}

std::uint64_t ToolWatcher::SuccessfulReloads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reloads_ok_;
}

std::uint64_t ToolWatcher::FailedReloads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reloads_failed_;
}

void ToolWatcher::Loop() {
    using Clock = std::chrono::steady_clock;
    std::optional<Clock::time_point> last_change;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        wake_.wait_for(lock, options_.poll_interval, [this] { return stopping_; });
        if (stopping_) {
            break;
        }

        lock.unlock();
        const auto changes = notifier_->Poll();
        for (const auto& change : changes) {
            LogDebug("watcher", change.path.string() + " " + KindName(change.kind));
        }
        if (!changes.empty()) {
            last_change = Clock::now();
        }

        if (last_change && Clock::now() - *last_change >= options_.debounce) {
            last_change.reset();
            auto reloaded = ReloadNow();
            if (reloaded.IsErr()) {
                LogWarn("watcher", "next reload waits for another change under the "
                                   "tool repositories");
            }
        }
        lock.lock();
    }
}

} // namespace toolhost
