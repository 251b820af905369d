#pragma once

#include <toolhost/core/result.hpp>
#include <toolhost/protocol/validator.hpp>
#include <toolhost/server/router.hpp>
#include <toolhost/transport/ws_channel.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace toolhost {

struct ServerOptions {
    std::string host = "localhost";
    std::uint16_t port = 8765;  // 0 picks a free port, see Server::Port()
    int io_threads = 1;
    std::size_t max_message_bytes = 1 << 20;
};

// ---------------------------------------------------------------------------
// Server: WebSocket endpoint. Accepts connections, validates every inbound
// frame and hands it to the Router; responses go back on the connection the
// request arrived on. Results for a connection that has gone away are
// dropped.
// ---------------------------------------------------------------------------
class Server {
public:
    Server(ServerOptions options, const Router& router);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Bind, listen and start the I/O threads.
    [[nodiscard]] Result<void, Error> Start();

    /// Stop accepting, close every connection and join the I/O threads.
    void Stop();

    /// Bound port (useful when started with port 0).
    [[nodiscard]] std::uint16_t Port() const noexcept { return bound_port_; }

    [[nodiscard]] std::size_t ConnectionCount() const;

private:
    struct Connection {
        std::weak_ptr<WsChannel> channel;
        std::shared_ptr<std::atomic<std::size_t>> in_flight;
    };

    void DoAccept();
    void OnAccept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);
    void OnMessage(const std::shared_ptr<WsChannel>& channel, std::string text);
    void OnClosed(const std::shared_ptr<WsChannel>& channel, const Error& reason);

    ServerOptions options_;
    const Router& router_;
    Validator validator_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;
    std::uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};

    mutable std::mutex mutex_;
    std::condition_variable drained_;
    std::map<std::string, Connection> connections_;
};

} // namespace toolhost
