#include <toolhost/server/server.hpp>

#include <toolhost/core/log.hpp>

#include <chrono>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>

namespace toolhost {

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr const char* kComponent = "server";
constexpr auto kCloseGrace = std::chrono::seconds(2);

Error ListenError(const std::string& what, const beast::error_code& ec) {
    return Error::Make(ErrorCategory::Connection, "Server::Start", what + ": " + ec.message());
}

} // anonymous namespace

Server::Server(ServerOptions options, const Router& router)
    : options_(std::move(options)),
      router_(router),
      acceptor_(net::make_strand(ioc_)) {}

Server::~Server() {
    Stop();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
Result<void, Error> Server::Start() {
    if (running_.load(std::memory_order_acquire)) {
        return Result<void, Error>::Ok();
    }

    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(options_.host, std::to_string(options_.port), ec);
    if (ec || results.empty()) {
        return Result<void, Error>::Err(
            ListenError("cannot resolve '" + options_.host + "'", ec));
    }
    const auto endpoint = results.begin()->endpoint();

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        return Result<void, Error>::Err(ListenError("open", ec));
    }
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        acceptor_.close(ec);
        return Result<void, Error>::Err(ListenError("set reuse_address", ec));
    }
    acceptor_.bind(endpoint, ec);
    if (ec) {
        beast::error_code ignored;
        acceptor_.close(ignored);
        return Result<void, Error>::Err(ListenError(
            "cannot bind " + endpoint.address().to_string() + ":" +
                std::to_string(endpoint.port()),
            ec));
    }
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        beast::error_code ignored;
        acceptor_.close(ignored);
        return Result<void, Error>::Err(ListenError("listen", ec));
    }
    bound_port_ = acceptor_.local_endpoint(ec).port();

    running_.store(true, std::memory_order_release);
    DoAccept();

    const int threads = options_.io_threads < 1 ? 1 : options_.io_threads;
    threads_.reserve(static_cast<std::size_t>(threads));
    for (int i = 0; i < threads; ++i) {
        threads_.emplace_back([this] { ioc_.run(); });
    }

    LogInfo(kComponent, "listening on ws://" + options_.host + ":" +
                            std::to_string(bound_port_) + "/");
    return Result<void, Error>::Ok();
}

void Server::Stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    LogInfo(kComponent, "shutting down");

    net::post(acceptor_.get_executor(), [this] {
        beast::error_code ignored;
        acceptor_.close(ignored);
    });

    std::vector<std::shared_ptr<WsChannel>> open;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, connection] : connections_) {
            if (auto channel = connection.channel.lock()) {
                open.push_back(std::move(channel));
            }
        }
    }
    for (auto& channel : open) {
        channel->Close();
    }
    open.clear();

    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!drained_.wait_for(lock, kCloseGrace, [this] { return connections_.empty(); })) {
            LogWarn(kComponent, std::to_string(connections_.size()) +
                                    " connection(s) did not close in time");
        }
    }

    ioc_.stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    LogInfo(kComponent, "stopped");
}

std::size_t Server::ConnectionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

// ---------------------------------------------------------------------------
// Accepting
// ---------------------------------------------------------------------------
void Server::DoAccept() {
    acceptor_.async_accept(net::make_strand(ioc_),
                           beast::bind_front_handler(&Server::OnAccept, this));
}

void Server::OnAccept(beast::error_code ec, tcp::socket socket) {
    if (!running_.load(std::memory_order_acquire) || ec == net::error::operation_aborted) {
        return;
    }
    if (ec) {
        LogWarn(kComponent, "accept failed: " + ec.message());
        DoAccept();
        return;
    }

    auto channel = WsChannel::FromAccepted(std::move(socket), options_.max_message_bytes);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_[channel->Id()] =
            Connection{channel, std::make_shared<std::atomic<std::size_t>>(0)};
    }

    WsChannel::Handlers handlers;
    handlers.on_message = [this](const std::shared_ptr<WsChannel>& ch, std::string text) {
        OnMessage(ch, std::move(text));
    };
    handlers.on_close = [this](const std::shared_ptr<WsChannel>& ch, const Error& reason) {
        OnClosed(ch, reason);
    };
    handlers.encode_fatal = [](const Error& reason) {
        return MakeErrorResponse("", reason).Dump();
    };
    channel->Accept(std::move(handlers));

    DoAccept();
}

// ---------------------------------------------------------------------------
// Per-connection events (run on the connection's strand)
// ---------------------------------------------------------------------------
void Server::OnMessage(const std::shared_ptr<WsChannel>& channel, std::string text) {
    auto request = validator_.Validate(std::string_view(text));
    if (request.IsErr()) {
        const auto& rejection = request.Error();
        LogDebug(kComponent, "connection " + channel->Id() + ": rejected message: " +
                                 (rejection.error ? rejection.error->message : std::string()));
        channel->Send(rejection.Dump());
        return;
    }

    std::shared_ptr<std::atomic<std::size_t>> in_flight;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(channel->Id());
        if (it != connections_.end()) {
            in_flight = it->second.in_flight;
        }
    }
    if (in_flight) {
        in_flight->fetch_add(1, std::memory_order_acq_rel);
    }

    std::weak_ptr<WsChannel> weak = channel;
    auto response = router_.Route(request.Value(), [weak, in_flight](Message message) {
        if (in_flight) {
            in_flight->fetch_sub(1, std::memory_order_acq_rel);
        }
        if (auto ch = weak.lock()) {
            ch->Send(message.Dump());
        }
    });

    if (response) {
        if (in_flight) {
            in_flight->fetch_sub(1, std::memory_order_acq_rel);
        }
        channel->Send(response->Dump());
    }
}

void Server::OnClosed(const std::shared_ptr<WsChannel>& channel, const Error& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(channel->Id());
    if (it == connections_.end()) {
        return;
    }
    const auto pending = it->second.in_flight->load(std::memory_order_acquire);
    if (pending > 0) {
        LogInfo(kComponent, "connection " + channel->Id() + " gone (" + reason.message +
                                "); dropping " + std::to_string(pending) +
                                " in-flight result(s)");
    }
    connections_.erase(it);
    drained_.notify_all();
}

} // namespace toolhost
