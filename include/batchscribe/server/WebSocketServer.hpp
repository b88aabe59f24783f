// Repository: BatchScribe
// Component: WebSocket Server
// Purpose: Accepts client connections and runs one sequential session
//          thread per connection.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_SERVER_WEBSOCKET_SERVER_HPP_
#define BATCHSCRIBE_SERVER_WEBSOCKET_SERVER_HPP_

#include <atomic>
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
#include <boost/beast/websocket.hpp>

#include "batchscribe/protocol/IEventSink.hpp"
#include "batchscribe/server/ServerConfig.hpp"
#include "batchscribe/session/Finalizer.hpp"
#include "batchscribe/session/SessionRegistry.hpp"
#include "batchscribe/time/ITimeSource.hpp"

namespace batchscribe::server {

using WebSocketStream = boost::beast::websocket::stream<boost::asio::ip::tcp::socket>;

// Writes outbound events as JSON text frames. Used only from the
// connection thread; a failed write marks the sink closed.
class WebSocketEventSink : public protocol::IEventSink {
 public:
  explicit WebSocketEventSink(std::shared_ptr<WebSocketStream> ws);

  bool Send(const protocol::OutboundEvent& event) override;
  void Close() override;
  bool IsOpen() const override { return open_.load(); }

 private:
  std::shared_ptr<WebSocketStream> ws_;
  std::atomic<bool> open_{true};
};

// WebSocketServer uses the blocking Beast API:
//
//   acceptor thread:    accept -> spawn connection thread
//   connection thread:  HTTP upgrade on ws_path (404 otherwise)
//                       -> SessionScope -> read text frames in order
//
// Stop() shuts down the listening socket and every open connection socket
// so blocked accept()/read() calls return, then joins all threads. Each
// connection's SessionScope finalizes its session on the way out.
class WebSocketServer {
 public:
  WebSocketServer(const ServerConfig& config,
                  session::SessionRegistry& registry,
                  session::Finalizer& finalizer,
                  const time::ITimeSource& clock);
  ~WebSocketServer();

  WebSocketServer(const WebSocketServer&) = delete;
  WebSocketServer& operator=(const WebSocketServer&) = delete;

  // Binds and starts the acceptor thread. Throws std::runtime_error if the
  // address cannot be bound.
  void Start();
  void Stop();

  // Actual port after Start() (port 0 picks an ephemeral one).
  uint16_t BoundPort() const { return bound_port_; }
  bool IsRunning() const { return running_.load(); }

  // Connections whose socket is still tracked for Stop().
  size_t TrackedConnections() const;

 private:
  void AcceptLoop();
  void ServeConnection(boost::asio::ip::tcp::socket socket, uint64_t connection_id);
  void RunSession(const std::shared_ptr<WebSocketStream>& ws, uint64_t connection_id);
  void ReapFinishedConnections();
  // Caller holds connections_mutex_.
  void ReleaseConnectionFd(uint64_t connection_id);

  ServerConfig config_;
  session::SessionRegistry& registry_;
  session::Finalizer& finalizer_;
  const time::ITimeSource& clock_;

  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  uint16_t bound_port_ = 0;

  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
  std::thread accept_thread_;

  mutable std::mutex connections_mutex_;
  std::map<uint64_t, std::thread> connection_threads_;
  // connection id -> dup() of its socket, closed by ReleaseConnectionFd().
  std::map<uint64_t, int> open_fds_;
  std::vector<uint64_t> finished_;
  uint64_t next_connection_id_ = 1;
};

}  // namespace batchscribe::server

#endif  // BATCHSCRIBE_SERVER_WEBSOCKET_SERVER_HPP_
