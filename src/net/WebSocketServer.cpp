#include "WebSocketServer.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <cstdio>
#include <deque>
#include <memory>
#include <optional>
#include <stdexcept>
#include "ProtocolMultiplexer.hpp"
#include "RequestTarget.hpp"
#include "../core/Diagnostics.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

static constexpr const char* kAudioPath = "/ws/audio";
static constexpr const char* kHealthPath = "/health";
static constexpr auto kHttpReadTimeout = std::chrono::seconds(30);

// One upgraded audio connection. Handlers run on the socket's strand.
class WsConnection : public std::enable_shared_from_this<WsConnection>, public MessageSink {
public:
  WsConnection(tcp::socket&& socket, ServerContext& ctx, std::string sessionId)
    : ws_(std::move(socket)), timer_(ws_.get_executor()), ctx_(ctx), sessionId_(std::move(sessionId)) {}

  void run(http::request<http::string_body> req) {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
      res.set(http::field::server, "meterd");
    }));
    ws_.read_message_max(ctx_.maxMessageBytes);
    ws_.async_accept(req, beast::bind_front_handler(&WsConnection::onAccept, shared_from_this()));
  }

  void sendNotice(std::string text) override {
    if (closeRequested_) return;
    notices_.push_back(std::move(text));
    doWrite();
  }

  void sendMeter(std::string text) override {
    if (closeRequested_) return;
    meter_ = std::move(text);
    doWrite();
  }

  void closeConnection(uint16_t code, const std::string& reason) override {
    if (closeRequested_) return;
    closeRequested_ = true;
    pendingClose_ = websocket::close_reason(static_cast<websocket::close_code>(code), reason);
    meter_.reset();
    timer_.cancel();
    doWrite();
  }

private:
  void onAccept(beast::error_code ec) {
    if (ec) {
      std::fprintf(stderr, "[server] websocket accept failed: %s\n", ec.message().c_str());
      return;
    }
    ws_.text(true);
    if (sessionId_.empty()) {
      std::fprintf(stderr, "[server] connection without session_id\n");
      closeConnection(kCloseMissingSessionId, "session_id required");
      doRead();
      return;
    }
    if (!ctx_.registry.reserve(sessionId_)) {
      std::fprintf(stderr, "[server] session %s already connected\n", sessionId_.c_str());
      closeConnection(kCloseSessionInUse, "session_id in use");
      doRead();
      return;
    }
    std::fprintf(stderr, "[server] session %s connected\n", sessionId_.c_str());
    mux_ = std::make_unique<ProtocolMultiplexer>(sessionId_, ctx_.registry, *this);
    armTimer();
    doRead();
  }

  void armTimer() {
    timer_.expires_after(ctx_.registry.options().meterInterval);
    timer_.async_wait(beast::bind_front_handler(&WsConnection::onTimer, shared_from_this()));
  }

  void onTimer(beast::error_code ec) {
    if (ec || finished_ || closeRequested_) return;
    mux_->onMeterTick();
    armTimer();
  }

  void doRead() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WsConnection::onRead, shared_from_this()));
  }

  void onRead(beast::error_code ec, std::size_t bytes) {
    if (ec) {
      if (ec != websocket::error::closed && gVerbose) {
        std::fprintf(stderr, "[server] %s read: %s\n", sessionId_.c_str(), ec.message().c_str());
      }
      finish();
      return;
    }
    if (mux_) {
      if (ws_.got_text()) {
        mux_->onText(beast::buffers_to_string(buffer_.data()));
      } else {
        mux_->onBinary(static_cast<const uint8_t*>(buffer_.data().data()), bytes);
      }
    }
    buffer_.consume(buffer_.size());
    doRead();
  }

  void doWrite() {
    if (writing_ || finished_) return;
    if (!notices_.empty()) {
      writing_ = true;
      outgoing_ = std::move(notices_.front());
      notices_.pop_front();
    } else if (meter_) {
      writing_ = true;
      outgoing_ = std::move(*meter_);
      meter_.reset();
    } else if (pendingClose_) {
      writing_ = true;
      const websocket::close_reason cr = *pendingClose_;
      pendingClose_.reset();
      ws_.async_close(cr, beast::bind_front_handler(&WsConnection::onClosed, shared_from_this()));
      return;
    } else {
      return;
    }
    ws_.async_write(net::buffer(outgoing_), beast::bind_front_handler(&WsConnection::onWrite, shared_from_this()));
  }

  void onWrite(beast::error_code ec, std::size_t) {
    writing_ = false;
    if (ec) {
      std::fprintf(stderr, "[server] %s write: %s\n", sessionId_.c_str(), ec.message().c_str());
      finish();
      return;
    }
    doWrite();
  }

  void onClosed(beast::error_code ec) {
    writing_ = false;
    if (ec && gVerbose) std::fprintf(stderr, "[server] %s close: %s\n", sessionId_.c_str(), ec.message().c_str());
    finish();
  }

  // Terminal; runs once per connection.
  void finish() {
    if (finished_) return;
    finished_ = true;
    timer_.cancel();
    notices_.clear();
    meter_.reset();
    if (mux_) {
      mux_->onClose();
      std::fprintf(stderr, "[server] session %s disconnected\n", sessionId_.c_str());
    }
  }

  websocket::stream<beast::tcp_stream> ws_;
  net::steady_timer timer_;
  ServerContext& ctx_;
  std::string sessionId_;
  std::unique_ptr<ProtocolMultiplexer> mux_;
  beast::flat_buffer buffer_;

  std::deque<std::string> notices_;
  std::optional<std::string> meter_;
  std::optional<websocket::close_reason> pendingClose_;
  std::string outgoing_;
  bool writing_ = false;
  bool closeRequested_ = false;
  bool finished_ = false;
};

// Plain HTTP until a websocket upgrade arrives.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket&& socket, ServerContext& ctx) : stream_(std::move(socket)), ctx_(ctx) {}

  void run() {
    net::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
  }

private:
  void doRead() {
    req_ = {};
    stream_.expires_after(kHttpReadTimeout);
    http::async_read(stream_, buffer_, req_, beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
  }

  void onRead(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) { doClose(); return; }
    if (ec) {
      if (gVerbose) std::fprintf(stderr, "[server] http read: %s\n", ec.message().c_str());
      return;
    }
    const RequestTarget target = parseRequestTarget(std::string(req_.target()));
    if (websocket::is_upgrade(req_) && target.path == kAudioPath) {
      stream_.expires_never();
      std::make_shared<WsConnection>(stream_.release_socket(), ctx_, target.param("session_id"))->run(std::move(req_));
      return;
    }
    if (req_.method() == http::verb::get && target.path == kHealthPath) {
      respond(http::status::ok, R"({"status":"ok"})");
    } else {
      respond(http::status::not_found, R"({"detail":"Not Found"})");
    }
  }

  void respond(http::status status, std::string body) {
    res_ = {};
    res_.result(status);
    res_.version(req_.version());
    res_.set(http::field::server, "meterd");
    res_.set(http::field::content_type, "application/json");
    res_.keep_alive(req_.keep_alive());
    res_.body() = std::move(body);
    res_.prepare_payload();
    http::async_write(stream_, res_, beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(), res_.need_eof()));
  }

  void onWrite(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
      std::fprintf(stderr, "[server] http write: %s\n", ec.message().c_str());
      return;
    }
    if (close) { doClose(); return; }
    doRead();
  }

  void doClose() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (ec && gVerbose) std::fprintf(stderr, "[server] http shutdown: %s\n", ec.message().c_str());
  }

  beast::tcp_stream stream_;
  ServerContext& ctx_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  http::response<http::string_body> res_;
};

WebSocketServer::WebSocketServer(net::io_context& ioc, SessionRegistry& registry, size_t maxMessageBytes)
  : ioc_(ioc), acceptor_(net::make_strand(ioc)), ctx_{registry, maxMessageBytes} {}

void WebSocketServer::start(const std::string& address, uint16_t port) {
  beast::error_code ec;
  const auto addr = net::ip::make_address(address, ec);
  if (ec) throw std::runtime_error("invalid bind address '" + address + "': " + ec.message());
  const tcp::endpoint endpoint(addr, port);

  auto check = [&](const char* what) {
    if (ec) throw std::runtime_error(std::string(what) + " " + address + ":" + std::to_string(port) + ": " + ec.message());
  };
  acceptor_.open(endpoint.protocol(), ec); check("open");
  acceptor_.set_option(net::socket_base::reuse_address(true), ec); check("set_option");
  acceptor_.bind(endpoint, ec); check("bind");
  acceptor_.listen(net::socket_base::max_listen_connections, ec); check("listen");
  boundPort_ = acceptor_.local_endpoint().port();
  std::fprintf(stderr, "[server] listening on %s:%u\n", address.c_str(), static_cast<unsigned>(boundPort_));
  doAccept();
}

void WebSocketServer::stop() {
  net::post(acceptor_.get_executor(), [this] {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) std::fprintf(stderr, "[server] acceptor close: %s\n", ec.message().c_str());
  });
}

void WebSocketServer::doAccept() {
  acceptor_.async_accept(net::make_strand(ioc_), beast::bind_front_handler(&WebSocketServer::onAccept, this));
}

void WebSocketServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec) {
    if (ec == net::error::operation_aborted) return;
    std::fprintf(stderr, "[server] accept: %s\n", ec.message().c_str());
  } else {
    std::make_shared<HttpSession>(std::move(socket), ctx_)->run();
  }
  if (acceptor_.is_open()) doAccept();
}
