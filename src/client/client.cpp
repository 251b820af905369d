#include <toolhost/client/client.hpp>

#include <toolhost/core/log.hpp>

#include <chrono>
#include <thread>

namespace toolhost {

namespace {

constexpr const char* kComponent = "client";

Error RemoteError(const std::string& operation, const Message& message) {
    const auto category =
        Error::CategoryFromCode(message.error->code).value_or(ErrorCategory::Internal);
    return Error::Make(category, operation, message.error->message);
}

Error MalformedResponse(const std::string& operation, const std::string& what) {
    return Error::Make(ErrorCategory::Internal, operation, "malformed response: " + what);
}

} // anonymous namespace

const char* RequestStateName(RequestState state) {
    switch (state) {
        case RequestState::Created:   return "created";
        case RequestState::Sent:      return "sent";
        case RequestState::Completed: return "completed";
        case RequestState::Failed:    return "failed";
        case RequestState::TimedOut:  return "timed_out";
    }
    return "unknown";
}

Client::Client(ClientOptions options) : options_(std::move(options)) {}

Client::~Client() {
    Close();
}

// ---------------------------------------------------------------------------
// Connection
// ---------------------------------------------------------------------------
Result<void, Error> Client::Connect() {
    if (IsConnected()) {
        return Result<void, Error>::Ok();
    }
    // A previous connection may have dropped; release its thread first.
    Close();

    auto connected = WsChannel::Connect(ioc_, options_.host, options_.port,
                                        options_.max_message_bytes);
    if (connected.IsErr()) {
        LogWarn(kComponent, connected.Error().message);
        return Result<void, Error>::Err(std::move(connected).Error());
    }
    auto channel = std::move(connected).Value();

    ioc_.restart();
    work_.emplace(boost::asio::make_work_guard(ioc_));
    io_thread_ = std::thread([this] { ioc_.run(); });

    // Published before reading starts so an immediate close is recognised as
    // coming from the current channel.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel_ = channel;
    }

    WsChannel::Handlers handlers;
    handlers.on_message = [this](const std::shared_ptr<WsChannel>&, std::string text) {
        OnMessage(std::move(text));
    };
    handlers.on_close = [this](const std::shared_ptr<WsChannel>& ch, const Error& reason) {
        OnClosed(ch.get(), reason);
    };
    channel->Start(std::move(handlers));

    LogInfo(kComponent, "connected to ws://" + options_.host + ":" +
                            std::to_string(options_.port) + "/");
    return Result<void, Error>::Ok();
}

void Client::Close() {
    std::shared_ptr<WsChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = std::move(channel_);
        channel_.reset();
    }
    if (channel) {
        channel->Close();
    }

    // Let the close handshake finish, then stop the I/O thread.
    work_.reset();
    if (io_thread_.joinable()) {
        if (channel) {
            const auto deadline = std::chrono::steady_clock::now() + options_.timeout;
            while (channel->IsOpen() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
        ioc_.stop();
        io_thread_.join();
    }

    // Anything still waiting did not get its close notification in time.
    OnClosed(nullptr, Error::Make(ErrorCategory::ConnectionClosed, "Client::Close",
                                  "client closed"));
}

bool Client::IsConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_ && channel_->IsOpen();
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------
Client::Reply Client::RoundTrip(const Message& request) {
    const auto& correlation_id = request.header.correlation_id;

    std::shared_ptr<WsChannel> channel;
    std::future<Reply> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!channel_ || !channel_->IsOpen()) {
            return Reply::Err(Error::Make(ErrorCategory::NotConnected, "Client::Call",
                                          "not connected"));
        }
        auto [it, inserted] = pending_.emplace(correlation_id, PendingRequest{});
        if (!inserted) {
            return Reply::Err(Error::Make(ErrorCategory::Internal, "Client::Call",
                                          "duplicate correlation id " + correlation_id));
        }
        future = it->second.promise.get_future();
        channel = channel_;
    }

    channel->Send(request.Dump());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(correlation_id);
        if (it != pending_.end() && it->second.state == RequestState::Created) {
            it->second.state = RequestState::Sent;
        }
    }

    if (future.wait_for(options_.timeout) == std::future_status::timeout) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(correlation_id);
        if (it != pending_.end()) {
            LogDebug(kComponent, "request " + correlation_id + ": " +
                                     RequestStateName(it->second.state) + " -> " +
                                     RequestStateName(RequestState::TimedOut));
            pending_.erase(it);
            RecordFinished(correlation_id, RequestState::TimedOut);
            return Reply::Err(Error::Make(
                ErrorCategory::Timeout, "Client::Call",
                "no response within " + std::to_string(options_.timeout.count()) + " ms"));
        }
        // Resolved while the timeout fired; the value is ready.
    }
    return future.get();
}

Result<nlohmann::json, Error> Client::Call(const std::string& tool,
                                           const nlohmann::json& args) {
    return CallWithId(NewMessageId(), tool, args);
}

Result<nlohmann::json, Error> Client::CallWithId(const std::string& correlation_id,
                                                 const std::string& tool,
                                                 const nlohmann::json& args) {
    using CallResult = Result<nlohmann::json, Error>;

    auto reply = RoundTrip(MakeToolCallRequest(correlation_id, tool, args));
    if (reply.IsErr()) {
        return CallResult::Err(std::move(reply).Error());
    }
    auto message = std::move(reply).Value();
    if (message.IsError()) {
        return CallResult::Err(RemoteError("Client::Call", message));
    }
    if (!message.body.is_object() || !message.body.contains("result")) {
        return CallResult::Err(MalformedResponse("Client::Call", "body has no 'result'"));
    }
    return CallResult::Ok(std::move(message.body["result"]));
}

std::future<Result<nlohmann::json, Error>> Client::CallAsync(std::string tool,
                                                             nlohmann::json args) {
    return std::async(std::launch::async,
                      [this, tool = std::move(tool), args = std::move(args)] {
                          return Call(tool, args);
                      });
}

Result<nlohmann::json, Error> Client::ListTools() {
    using ListResult = Result<nlohmann::json, Error>;

    auto reply = RoundTrip(MakeListToolsRequest(NewMessageId()));
    if (reply.IsErr()) {
        return ListResult::Err(std::move(reply).Error());
    }
    auto message = std::move(reply).Value();
    if (message.IsError()) {
        return ListResult::Err(RemoteError("Client::ListTools", message));
    }
    if (!message.body.is_object() || !message.body.contains("tools") ||
        !message.body["tools"].is_array()) {
        return ListResult::Err(MalformedResponse("Client::ListTools", "body has no 'tools' array"));
    }
    return ListResult::Ok(std::move(message.body["tools"]));
}

std::size_t Client::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::optional<RequestState> Client::StateOf(const std::string& correlation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(correlation_id);
    if (it != pending_.end()) {
        return it->second.state;
    }
    auto done = finished_.find(correlation_id);
    if (done == finished_.end()) {
        return std::nullopt;
    }
    return done->second;
}

void Client::RecordFinished(const std::string& correlation_id, RequestState state) {
    auto [it, inserted] = finished_.insert_or_assign(correlation_id, state);
    if (!inserted) {
        return;
    }
    finished_order_.push_back(it->first);
    while (finished_order_.size() > kFinishedHistory) {
        finished_.erase(finished_order_.front());
        finished_order_.pop_front();
    }
}

// ---------------------------------------------------------------------------
// Inbound (I/O thread)
// ---------------------------------------------------------------------------
void Client::OnMessage(std::string text) {
    auto doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        LogWarn(kComponent, "dropping unparseable frame");
        return;
    }
    auto decoded = Message::FromJson(doc);
    if (decoded.IsErr()) {
        LogWarn(kComponent, "dropping malformed message: " + decoded.Error().message);
        return;
    }
    auto message = std::move(decoded).Value();

    std::promise<Reply> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(message.header.correlation_id);
        if (it == pending_.end()) {
            if (message.IsError()) {
                LogWarn(kComponent, "server reported " + message.error->code + ": " +
                                        message.error->message);
            } else {
                LogWarn(kComponent, "dropping unsolicited response for '" +
                                        message.header.correlation_id + "'");
            }
            return;
        }
        promise = std::move(it->second.promise);
        pending_.erase(it);
        RecordFinished(message.header.correlation_id, RequestState::Completed);
    }
    promise.set_value(Reply::Ok(std::move(message)));
}

void Client::OnClosed(const WsChannel* source, const Error& reason) {
    std::map<std::string, PendingRequest> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (source != nullptr && channel_ && channel_.get() != source) {
            // Late notification from a channel replaced by a reconnect.
            return;
        }
        failed.swap(pending_);
        for (const auto& entry : failed) {
            RecordFinished(entry.first, RequestState::Failed);
        }
    }
    if (!failed.empty()) {
        LogWarn(kComponent, "connection lost (" + reason.message + "); failing " +
                                std::to_string(failed.size()) + " pending request(s)");
    }
    for (auto& [id, request] : failed) {
        request.promise.set_value(Reply::Err(Error::Make(
            ErrorCategory::ConnectionClosed, "Client::Call",
            "connection closed before a response arrived: " + reason.message)));
    }
}

} // namespace toolhost
