#include <toolhost/transport/ws_channel.hpp>

#include <toolhost/core/log.hpp>
#include <toolhost/core/version.hpp>
#include <toolhost/protocol/message.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket/error.hpp>

namespace toolhost {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr const char* kComponent = "conn";

Error TransportError(const std::string& operation, const beast::error_code& ec) {
    return Error::Make(ErrorCategory::Connection, "WsChannel::" + operation,
                       ec.message());
}

std::string EndpointString(const tcp::socket& socket) {
    beast::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
WsChannel::WsChannel(tcp::socket socket, std::size_t max_message_bytes)
    : ws_(std::move(socket)),
      id_(NewMessageId()),
      max_message_bytes_(max_message_bytes) {
    peer_ = EndpointString(beast::get_lowest_layer(ws_).socket());
    ws_.read_message_max(max_message_bytes_);
}

WsChannel::~WsChannel() = default;

std::shared_ptr<WsChannel> WsChannel::FromAccepted(tcp::socket socket,
                                                   std::size_t max_message_bytes) {
    return std::shared_ptr<WsChannel>(new WsChannel(std::move(socket), max_message_bytes));
}

Result<std::shared_ptr<WsChannel>, Error> WsChannel::Connect(
    net::io_context& ioc, const std::string& host, std::uint16_t port,
    std::size_t max_message_bytes) {
    using ConnectResult = Result<std::shared_ptr<WsChannel>, Error>;

    beast::error_code ec;
    tcp::resolver resolver(ioc);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        return ConnectResult::Err(TransportError("Resolve", ec));
    }

    tcp::socket socket(net::make_strand(ioc));
    net::connect(socket, endpoints, ec);
    if (ec) {
        return ConnectResult::Err(Error::Make(
            ErrorCategory::Connection, "WsChannel::Connect",
            "cannot connect to " + host + ":" + std::to_string(port) + ": " + ec.message()));
    }

    auto channel = FromAccepted(std::move(socket), max_message_bytes);
    channel->ws_.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::client));
    channel->ws_.set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, std::string("toolhost-client/") + kVersion);
        }));
    channel->ws_.handshake(host + ":" + std::to_string(port), "/", ec);
    if (ec) {
        return ConnectResult::Err(TransportError("Handshake", ec));
    }
    return ConnectResult::Ok(std::move(channel));
}

// ---------------------------------------------------------------------------
// Startup
// ---------------------------------------------------------------------------
void WsChannel::Accept(Handlers handlers) {
    handlers_ = std::move(handlers);
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
            res.set(beast::http::field::server, std::string("toolhost/") + kVersion);
        }));
    net::dispatch(ws_.get_executor(), [self = shared_from_this()] {
        self->ws_.async_accept(beast::bind_front_handler(&WsChannel::OnAccept, self));
    });
}

void WsChannel::OnAccept(beast::error_code ec) {
    if (ec) {
        Finish(TransportError("Accept", ec));
        return;
    }
    open_.store(true, std::memory_order_release);
    LogInfo(kComponent, "connection " + id_ + " from " + peer_ + " opened");
    DoRead();
}

void WsChannel::Start(Handlers handlers) {
    handlers_ = std::move(handlers);
    open_.store(true, std::memory_order_release);
    net::dispatch(ws_.get_executor(), [self = shared_from_this()] { self->DoRead(); });
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------
void WsChannel::DoRead() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WsChannel::OnRead, shared_from_this()));
}

void WsChannel::OnRead(beast::error_code ec, std::size_t /*bytes*/) {
    if (ec) {
        if (ec == websocket::error::closed) {
            Finish(Error::Make(ErrorCategory::ConnectionClosed, "WsChannel::Read",
                               "connection closed"));
        } else if (ec == websocket::error::message_too_big) {
            // The stream has already failed; nothing more can be written.
            Finish(Error::Make(ErrorCategory::Connection, "WsChannel::Read",
                               "message exceeds " + std::to_string(max_message_bytes_) +
                                   " bytes"));
        } else if (closing_ && ec == net::error::operation_aborted) {
            Finish(Error::Make(ErrorCategory::ConnectionClosed, "WsChannel::Read",
                               "connection closed"));
        } else {
            Finish(TransportError("Read", ec));
        }
        return;
    }

    if (!ws_.got_text()) {
        buffer_.consume(buffer_.size());
        Fail(Error::Make(ErrorCategory::Connection, "WsChannel::Read",
                         "binary frames are not supported"));
        DoRead();
        return;
    }

    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    if (handlers_.on_message) {
        handlers_.on_message(shared_from_this(), std::move(text));
    }
    if (!finished_) {
        DoRead();
    }
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------
void WsChannel::Send(std::string text) {
    net::dispatch(ws_.get_executor(),
                  [self = shared_from_this(), text = std::move(text)]() mutable {
                      if (self->finished_ || self->closing_) {
                          return;
                      }
                      self->Enqueue(std::move(text));
                  });
}

void WsChannel::Enqueue(std::string text) {
    queue_.push_back(std::move(text));
    if (!writing_) {
        DoWrite();
    }
}

void WsChannel::DoWrite() {
    writing_ = true;
    ws_.text(true);
    ws_.async_write(net::buffer(queue_.front()),
                    beast::bind_front_handler(&WsChannel::OnWrite, shared_from_this()));
}

void WsChannel::OnWrite(beast::error_code ec, std::size_t /*bytes*/) {
    writing_ = false;
    if (ec) {
        Finish(TransportError("Write", ec));
        queue_.clear();
        return;
    }
    if (finished_) {
        queue_.clear();
        return;
    }
    queue_.pop_front();
    if (!queue_.empty()) {
        DoWrite();
    } else if (closing_) {
        DoClose();
    }
}

// ---------------------------------------------------------------------------
// Closing
// ---------------------------------------------------------------------------
void WsChannel::Close() {
    net::dispatch(ws_.get_executor(), [self = shared_from_this()] {
        if (!self->open_.load(std::memory_order_acquire)) {
            // Handshake still pending or never completed.
            self->Finish(Error::Make(ErrorCategory::ConnectionClosed, "WsChannel::Close",
                                     "connection closed"));
            return;
        }
        self->BeginClose(websocket::close_code::normal);
    });
}

void WsChannel::Fail(Error reason) {
    if (finished_ || closing_) {
        return;
    }
    LogWarn(kComponent, "connection " + id_ + ": " + reason.message);
    if (handlers_.encode_fatal) {
        Enqueue(handlers_.encode_fatal(reason));
    }
    fatal_ = std::move(reason);
    BeginClose(websocket::close_code::policy_error);
}

void WsChannel::BeginClose(websocket::close_code code) {
    if (finished_ || closing_) {
        return;
    }
    closing_ = true;
    close_code_ = code;
    if (!writing_) {
        DoClose();
    }
}

void WsChannel::DoClose() {
    ws_.async_close(close_code_,
                    beast::bind_front_handler(&WsChannel::OnClose, shared_from_this()));
}

void WsChannel::OnClose(beast::error_code ec) {
    if (ec && ec != net::error::operation_aborted) {
        Finish(TransportError("Close", ec));
        return;
    }
    Finish(Error::Make(ErrorCategory::ConnectionClosed, "WsChannel::Close",
                       "connection closed"));
}

void WsChannel::Finish(Error reason) {
    if (finished_) {
        return;
    }
    finished_ = true;
    open_.store(false, std::memory_order_release);
    if (!writing_) {
        // Otherwise the front frame is still referenced by the pending write.
        queue_.clear();
    }

    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);

    if (fatal_) {
        reason = *fatal_;
    }
    if (reason.category == ErrorCategory::ConnectionClosed) {
        LogInfo(kComponent, "connection " + id_ + " closed");
    } else {
        LogWarn(kComponent, "connection " + id_ + " failed: " + reason.message);
    }

    // Released here so the owner's callbacks cannot keep this channel alive.
    auto handlers = std::move(handlers_);
    handlers_ = Handlers{};
    if (handlers.on_close) {
        handlers.on_close(shared_from_this(), reason);
    }
}

} // namespace toolhost
