#pragma once

#include <toolhost/core/result.hpp>
#include <toolhost/protocol/message.hpp>
#include <toolhost/transport/ws_channel.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

namespace toolhost {

struct ClientOptions {
    std::string host = "localhost";
    std::uint16_t port = 8765;
    std::chrono::milliseconds timeout{10000};
    std::size_t max_message_bytes = 1 << 20;
};

/// Lifecycle of one request. Completed, Failed and TimedOut are terminal.
enum class RequestState {
    Created,
    Sent,
    Completed,
    Failed,
    TimedOut,
};

const char* RequestStateName(RequestState state);

// ---------------------------------------------------------------------------
// Client: calls tools on a toolhost server over one WebSocket connection.
//
// Every request carries a fresh UUID correlation id; responses are matched by
// that id only, so any number of threads may have calls outstanding at once
// and responses may arrive in any order. A lost connection fails every
// outstanding call with connection_closed. Nothing is retried.
//
// Remote errors come back as Error values whose category is the wire code
// (tool_not_found, execution_error, ...).
// ---------------------------------------------------------------------------
class Client {
public:
    explicit Client(ClientOptions options = {});
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    [[nodiscard]] Result<void, Error> Connect();
    void Close();
    [[nodiscard]] bool IsConnected() const;

    /// Blocks until the result, an error response, the timeout or a
    /// connection failure.
    [[nodiscard]] Result<nlohmann::json, Error> Call(
        const std::string& tool,
        const nlohmann::json& args = nlohmann::json::object());

    /// Call() with a caller-chosen correlation id, which must not belong to a
    /// request still outstanding.
    [[nodiscard]] Result<nlohmann::json, Error> CallWithId(
        const std::string& correlation_id, const std::string& tool,
        const nlohmann::json& args = nlohmann::json::object());

    [[nodiscard]] std::future<Result<nlohmann::json, Error>> CallAsync(
        std::string tool, nlohmann::json args = nlohmann::json::object());

    /// The server's tool catalog (the "tools" array of a list response).
    [[nodiscard]] Result<nlohmann::json, Error> ListTools();

    [[nodiscard]] std::size_t PendingCount() const;

    /// State of a request by correlation id. Outstanding requests are always
    /// known; the last kFinishedHistory finished ones keep their terminal
    /// state. Anything older is nullopt.
    [[nodiscard]] std::optional<RequestState> StateOf(const std::string& correlation_id) const;

    static constexpr std::size_t kFinishedHistory = 256;

private:
    using Reply = Result<Message, Error>;

    struct PendingRequest {
        RequestState state = RequestState::Created;
        std::promise<Reply> promise;
    };

    /// Send `request` and wait for the correlated reply.
    Reply RoundTrip(const Message& request);

    /// Caller holds mutex_.
    void RecordFinished(const std::string& correlation_id, RequestState state);

    void OnMessage(std::string text);
    /// `source` is the channel that ended, or nullptr for a local Close().
    void OnClosed(const WsChannel* source, const Error& reason);

    ClientOptions options_;

    boost::asio::io_context ioc_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread io_thread_;
    std::shared_ptr<WsChannel> channel_;

    mutable std::mutex mutex_;
    std::map<std::string, PendingRequest> pending_;
    std::map<std::string, RequestState> finished_;
    std::deque<std::string> finished_order_;
};

} // namespace toolhost
