#pragma once

#include <toolhost/protocol/message.hpp>
#include <toolhost/protocol/validator.hpp>
#include <toolhost/registry/tool_registry.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

namespace toolhost {

/// Receives the single response produced for one request.
using ResponseCallback = std::function<void(Message)>;

/// Longest error text an execution failure puts on the wire.
constexpr std::size_t kMaxExecutionErrorBytes = 512;

// ---------------------------------------------------------------------------
// ToolExecutor: runs tool calls on a fixed pool of worker threads.
//
// A submitted call keeps the registry snapshot it was resolved against alive
// until it finishes, so a reload in the meantime does not affect it.
// ---------------------------------------------------------------------------
class ToolExecutor {
public:
    explicit ToolExecutor(std::size_t threads);
    ~ToolExecutor();

    ToolExecutor(const ToolExecutor&) = delete;
    ToolExecutor& operator=(const ToolExecutor&) = delete;

    /// Queue `tool` (owned by `snapshot`) for execution; `done` is called on
    /// a worker thread with the response. After Shutdown() the call is
    /// answered immediately with an internal_error.
    void Submit(std::shared_ptr<const ToolRegistry> snapshot, const Tool* tool,
                Request request, ResponseCallback done);

    /// Run one call synchronously and build its response:
    ///   - argument names are checked against the declared parameters;
    ///   - a registry-aware tool receives `snapshot`;
    ///   - anything the tool throws becomes an execution_error.
    static Message Execute(const std::shared_ptr<const ToolRegistry>& snapshot,
                           const Tool& tool, const std::string& correlation_id,
                           const nlohmann::json& args);

    /// Stop accepting work and wait for the calls already queued.
    void Shutdown();

    [[nodiscard]] std::size_t InFlight() const noexcept {
        return in_flight_.load(std::memory_order_acquire);
    }

private:
    boost::asio::thread_pool pool_;
    std::atomic<std::size_t> in_flight_{0};
    std::atomic<bool> shut_down_{false};
};

/// "Error executing tool '<name>': <detail>", control characters removed and
/// cut to kMaxExecutionErrorBytes without splitting a UTF-8 sequence.
std::string FormatExecutionError(const std::string& tool_name, const std::string& detail);

} // namespace toolhost
