// Repository: BatchScribe
// Component: WebSocket Server implementation
// Copyright (c) 2025 BatchScribe

#include "batchscribe/server/WebSocketServer.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <exception>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "batchscribe/protocol/EventCodec.hpp"
#include "batchscribe/session/SessionScope.hpp"
#include "batchscribe/util/Logger.hpp"

namespace batchscribe::server {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;
using batchscribe::util::Logger;

namespace {

std::string PathOf(beast::string_view target) {
  std::string path(target.data(), target.size());
  const size_t query = path.find('?');
  if (query != std::string::npos) path.resize(query);
  return path;
}

}  // namespace

// ======================================================================
// WebSocketEventSink
// ======================================================================

WebSocketEventSink::WebSocketEventSink(std::shared_ptr<WebSocketStream> ws)
    : ws_(std::move(ws)) {}

bool WebSocketEventSink::Send(const protocol::OutboundEvent& event) {
  if (!open_.load()) return false;
  const std::string json = protocol::ToJson(event);
  beast::error_code ec;
  ws_->text(true);
  ws_->write(net::buffer(json), ec);
  if (ec) {
    open_.store(false);
    Logger::Debug("[WebSocketEventSink] Write failed err=" + ec.message());
    return false;
  }
  return true;
}

void WebSocketEventSink::Close() {
  if (!open_.exchange(false)) return;
  beast::error_code ec;
  ws_->close(websocket::close_code::normal, ec);
  if (ec) {
    Logger::Debug("[WebSocketEventSink] Close failed err=" + ec.message());
  }
}

// ======================================================================
// WebSocketServer
// ======================================================================

WebSocketServer::WebSocketServer(const ServerConfig& config,
                                 session::SessionRegistry& registry,
                                 session::Finalizer& finalizer,
                                 const time::ITimeSource& clock)
    : config_(config),
      registry_(registry),
      finalizer_(finalizer),
      clock_(clock),
      acceptor_(ioc_) {}

WebSocketServer::~WebSocketServer() { Stop(); }

void WebSocketServer::Start() {
  if (running_.load()) return;

  beast::error_code ec;
  const auto address = net::ip::make_address(config_.host, ec);
  if (ec) {
    throw std::runtime_error("invalid listen host '" + config_.host + "': " + ec.message());
  }
  const tcp::endpoint endpoint(address, config_.port);

  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec) acceptor_.bind(endpoint, ec);
  if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    beast::error_code ignored;
    acceptor_.close(ignored);
    std::ostringstream oss;
    oss << "cannot listen on " << config_.host << ":" << config_.port << ": " << ec.message();
    throw std::runtime_error(oss.str());
  }
  bound_port_ = acceptor_.local_endpoint().port();

  stopping_.store(false);
  running_.store(true);
  accept_thread_ = std::thread(&WebSocketServer::AcceptLoop, this);

  std::ostringstream oss;
  oss << "[WebSocketServer] Listening on ws://" << config_.host << ":" << bound_port_
      << config_.ws_path;
  Logger::Info(oss.str());
}

void WebSocketServer::Stop() {
  if (!running_.exchange(false)) return;
  stopping_.store(true);

  // Wake the blocking accept().
  ::shutdown(acceptor_.native_handle(), SHUT_RDWR);
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  beast::error_code ignored;
  acceptor_.close(ignored);

  std::map<uint64_t, std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (const auto& [id, fd] : open_fds_) {
      if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
    }
    threads.swap(connection_threads_);
    finished_.clear();
  }
  for (auto& [id, t] : threads) {
    if (t.joinable()) t.join();
  }
  Logger::Info("[WebSocketServer] Stopped");
}

void WebSocketServer::AcceptLoop() {
  while (!stopping_.load()) {
    tcp::socket socket(ioc_);
    beast::error_code ec;
    acceptor_.accept(socket, ec);
    if (stopping_.load()) break;
    if (ec) {
      Logger::Warn("[WebSocketServer] Accept failed err=" + ec.message());
      continue;
    }

    ReapFinishedConnections();

    // Stop() shuts connections down through a duplicate descriptor owned
    // here, so the number stays reserved until ReleaseConnectionFd() even
    // after Beast closes the original.
    const int fd = ::dup(socket.native_handle());
    if (fd < 0) {
      Logger::Warn("[WebSocketServer] dup failed; connection cannot be interrupted by Stop");
    }

    std::lock_guard<std::mutex> lock(connections_mutex_);
    const uint64_t id = next_connection_id_++;
    open_fds_[id] = fd;
    connection_threads_[id] =
        std::thread(&WebSocketServer::ServeConnection, this, std::move(socket), id);
  }
}

void WebSocketServer::ReapFinishedConnections() {
  std::vector<std::thread> done;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (uint64_t id : finished_) {
      auto it = connection_threads_.find(id);
      if (it != connection_threads_.end()) {
        done.push_back(std::move(it->second));
        connection_threads_.erase(it);
      }
    }
    finished_.clear();
  }
  for (auto& t : done) {
    if (t.joinable()) t.join();
  }
}

void WebSocketServer::ServeConnection(tcp::socket socket, uint64_t connection_id) {
  beast::error_code ec;
  const auto remote = socket.remote_endpoint(ec);

  beast::flat_buffer buffer;
  http::request<http::string_body> req;
  http::read(socket, buffer, req, ec);

  if (!ec) {
    const std::string path = PathOf(req.target());
    if (!websocket::is_upgrade(req) || path != config_.ws_path) {
      http::response<http::string_body> res{http::status::not_found, req.version()};
      res.set(http::field::content_type, "text/plain");
      res.keep_alive(false);
      res.body() = "Not Found";
      res.prepare_payload();
      http::write(socket, res, ec);
      Logger::Debug("[WebSocketServer] Rejected request path=" + path);
    } else {
      auto ws = std::make_shared<WebSocketStream>(std::move(socket));
      ws->accept(req, ec);
      if (!ec) {
        std::ostringstream oss;
        oss << "[WebSocketServer] Connection accepted conn=" << connection_id
            << " remote=" << remote;
        Logger::Info(oss.str());
        RunSession(ws, connection_id);
      } else {
        Logger::Warn("[WebSocketServer] Upgrade failed err=" + ec.message());
      }
    }
  }

  std::lock_guard<std::mutex> lock(connections_mutex_);
  ReleaseConnectionFd(connection_id);
  finished_.push_back(connection_id);
}

void WebSocketServer::ReleaseConnectionFd(uint64_t connection_id) {
  auto it = open_fds_.find(connection_id);
  if (it == open_fds_.end()) return;
  if (it->second >= 0) ::close(it->second);
  open_fds_.erase(it);
}

size_t WebSocketServer::TrackedConnections() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  return open_fds_.size();
}

void WebSocketServer::RunSession(const std::shared_ptr<WebSocketStream>& ws,
                                 uint64_t connection_id) {
  auto sink = std::make_shared<WebSocketEventSink>(ws);
  try {
    session::SessionScope scope(registry_, finalizer_, clock_, sink);

    beast::flat_buffer frame;
    while (!stopping_.load()) {
      beast::error_code ec;
      ws->read(frame, ec);
      if (ec) {
        if (ec != websocket::error::closed) {
          Logger::Info("[WebSocketServer] Connection lost session=" + scope.session_id() +
                       " err=" + ec.message());
        }
        break;
      }
      if (!ws->got_text()) {
        frame.consume(frame.size());
        continue;
      }
      std::string text = beast::buffers_to_string(frame.data());
      frame.consume(frame.size());
      if (!scope.HandleMessage(text)) break;
    }
    // ~SessionScope finalizes (disconnect) if end_recording did not.
  } catch (const std::exception& e) {
    Logger::Error("[WebSocketServer] Connection failed conn=" + std::to_string(connection_id) +
                  " err=" + e.what());
  }
}

}  // namespace batchscribe::server
