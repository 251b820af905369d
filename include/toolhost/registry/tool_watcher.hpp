#pragma once

#include <toolhost/core/result.hpp>
#include <toolhost/registry/change_notifier.hpp>
#include <toolhost/registry/registry_handle.hpp>
#include <toolhost/registry/tool_loader.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace toolhost {

struct WatchOptions {
    std::chrono::milliseconds debounce{1000};
    std::chrono::milliseconds poll_interval{250};
};

// ---------------------------------------------------------------------------
// ToolWatcher: hot reload.
//
// A background thread polls the notifier. A burst of changes is coalesced:
// the reload fires once no further change has been seen for `debounce`.
// Each reload is a full ToolLoader::Load(); only a successful scan is
// published to the handle. A failed scan is logged and the current snapshot
// stays in place.
// ---------------------------------------------------------------------------
class ToolWatcher {
public:
    ToolWatcher(ToolLoader& loader, RegistryHandle& handle,
                std::unique_ptr<IChangeNotifier> notifier,
                WatchOptions options = {});
    ~ToolWatcher();

    ToolWatcher(const ToolWatcher&) = delete;
    ToolWatcher& operator=(const ToolWatcher&) = delete;

    void Start();

    /// Stops the thread. A reload already running completes first.
    void Stop();

    [[nodiscard]] bool Running() const;

    /// Rescan now and publish on success. Used by the thread and by callers
    /// that want an explicit reload.
    Result<void, Error> ReloadNow();

    [[nodiscard]] std::uint64_t SuccessfulReloads() const;
    [[nodiscard]] std::uint64_t FailedReloads() const;

private:
    void Loop();

    ToolLoader& loader_;
    RegistryHandle& handle_;
    std::unique_ptr<IChangeNotifier> notifier_;
    WatchOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    std::thread thread_;
    std::uint64_t reloads_ok_ = 0;
    std::uint64_t reloads_failed_ = 0;
};

} // namespace toolhost
