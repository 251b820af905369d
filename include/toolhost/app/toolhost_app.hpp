#pragma once

#include <toolhost/config/app_config.hpp>
#include <toolhost/core/result.hpp>
#include <toolhost/registry/registry_handle.hpp>
#include <toolhost/registry/tool_loader.hpp>
#include <toolhost/registry/tool_watcher.hpp>
#include <toolhost/server/router.hpp>
#include <toolhost/server/server.hpp>
#include <toolhost/server/tool_executor.hpp>

#include <cstdint>
#include <memory>

namespace toolhost {

// ---------------------------------------------------------------------------
// ToolhostApp: the server process: owns the loader, the registry handle,
// the watcher, the executor pool and the WebSocket server.
//
// Start():  first scan and publish, then the watcher, then accept.
// Stop():   stop accepting and close connections, stop the watcher, then let
//           running tool calls drain.
// ---------------------------------------------------------------------------
class ToolhostApp {
public:
    explicit ToolhostApp(AppConfig config);
    ~ToolhostApp();

    ToolhostApp(const ToolhostApp&) = delete;
    ToolhostApp& operator=(const ToolhostApp&) = delete;

    /// Fails with a load_error when the first scan fails; nothing is started
    /// in that case.
    [[nodiscard]] Result<void, Error> Start();
    void Stop();

    [[nodiscard]] std::uint16_t Port() const noexcept { return server_.Port(); }
    [[nodiscard]] const RegistryHandle& Registry() const noexcept { return registry_; }

    /// nullptr when watching is disabled or before Start().
    [[nodiscard]] ToolWatcher* Watcher() noexcept { return watcher_.get(); }

private:
    AppConfig config_;
    ToolLoader loader_;
    RegistryHandle registry_;
    ToolExecutor executor_;
    Router router_;
    Server server_;
    std::unique_ptr<ToolWatcher> watcher_;
    bool started_ = false;
};

} // namespace toolhost
