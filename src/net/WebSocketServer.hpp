#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <string>
#include "../session/SessionRegistry.hpp"

// Shared by every connection of one server.
struct ServerContext {
  SessionRegistry& registry;
  size_t maxMessageBytes;
};

// TCP listener. Each accepted socket gets its own strand; plain HTTP requests
// are answered directly, /ws/audio upgrades become audio sessions.
class WebSocketServer {
public:
  WebSocketServer(boost::asio::io_context& ioc, SessionRegistry& registry, size_t maxMessageBytes);

  // Bind and start accepting. Throws std::runtime_error if the endpoint is unusable.
  void start(const std::string& address, uint16_t port);
  // Stop accepting; open connections finish on their own.
  void stop();

  uint16_t port() const { return boundPort_; }

private:
  void doAccept();
  void onAccept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  ServerContext ctx_;
  uint16_t boundPort_ = 0;
};
