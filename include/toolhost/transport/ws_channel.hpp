#pragma once

#include <toolhost/core/result.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

namespace toolhost {

// ---------------------------------------------------------------------------
// WsChannel: one WebSocket connection carrying one JSON document per text
// frame. Used by both the server (accepted sockets) and the client.
//
// All stream operations run on the socket's strand. Outbound frames go
// through a single queue, so Send() may be called from any thread and frames
// are never interleaved. After the channel is finished, Send() is a no-op.
//
// on_close is invoked exactly once with the reason the channel ended:
//   connection_closed  orderly close (either side)
//   connection_error   transport failure, binary frame, oversized frame
// ---------------------------------------------------------------------------
class WsChannel : public std::enable_shared_from_this<WsChannel> {
public:
    struct Handlers {
        std::function<void(const std::shared_ptr<WsChannel>&, std::string)> on_message;
        std::function<void(const std::shared_ptr<WsChannel>&, const Error&)> on_close;
        // Optional: builds the frame sent to the peer before a fatal close.
        std::function<std::string(const Error&)> encode_fatal;
    };

    /// Wrap a freshly accepted socket. The socket's executor must be a strand.
    static std::shared_ptr<WsChannel> FromAccepted(boost::asio::ip::tcp::socket socket,
                                                   std::size_t max_message_bytes);

    /// Resolve, connect and perform the client handshake (blocking).
    static Result<std::shared_ptr<WsChannel>, Error> Connect(
        boost::asio::io_context& ioc, const std::string& host, std::uint16_t port,
        std::size_t max_message_bytes);

    ~WsChannel();

    WsChannel(const WsChannel&) = delete;
    WsChannel& operator=(const WsChannel&) = delete;

    /// Server side: run the handshake, then start reading.
    void Accept(Handlers handlers);

    /// Client side: start reading on an already connected channel.
    void Start(Handlers handlers);

    void Send(std::string text);

    /// Orderly close once queued frames are flushed.
    void Close();

    [[nodiscard]] bool IsOpen() const noexcept {
        return open_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const std::string& Id() const noexcept { return id_; }
    [[nodiscard]] const std::string& Peer() const noexcept { return peer_; }

private:
    WsChannel(boost::asio::ip::tcp::socket socket, std::size_t max_message_bytes);

    void OnAccept(boost::beast::error_code ec);
    void DoRead();
    void OnRead(boost::beast::error_code ec, std::size_t bytes);
    void Enqueue(std::string text);
    void DoWrite();
    void OnWrite(boost::beast::error_code ec, std::size_t bytes);
    void Fail(Error reason);
    void BeginClose(boost::beast::websocket::close_code code);
    void DoClose();
    void OnClose(boost::beast::error_code ec);
    void Finish(Error reason);

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    std::string id_;
    std::string peer_;
    std::size_t max_message_bytes_;
    Handlers handlers_;

    // Strand-only state.
    std::deque<std::string> queue_;
    bool writing_ = false;
    bool closing_ = false;
    bool finished_ = false;
    boost::beast::websocket::close_code close_code_ =
        boost::beast::websocket::close_code::normal;
    std::optional<Error> fatal_;

    std::atomic<bool> open_{false};
};

} // namespace toolhost
