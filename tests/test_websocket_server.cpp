// Repository: BatchScribe
// Component: WebSocket server integration tests

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "batchscribe/archive/ArchiveDispatcher.hpp"
#include "batchscribe/server/WebSocketServer.hpp"
#include "fixtures/FakeObjectStore.h"
#include "support/SessionHarness.hpp"

namespace batchscribe::server {
namespace {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;
using tests::fixtures::FakeObjectStore;

bool WaitFor(const std::function<bool()>& done) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    if (done()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return done();
}

class WebSocketServerTest : public ::testing::Test {
 protected:
  WebSocketServerTest()
      : store_(std::make_shared<FakeObjectStore>()),
        dispatcher_(store_),
        registry_(h_.settings, h_.Collaborators()),
        finalizer_(registry_, dispatcher_, h_.clock) {
    config_.host = "127.0.0.1";
    config_.port = 0;
    server_ = std::make_unique<WebSocketServer>(config_, registry_, finalizer_, h_.clock);
    server_->Start();
  }

  ~WebSocketServerTest() override { server_->Stop(); }

  // Connects and completes the upgrade on path.
  std::unique_ptr<websocket::stream<tcp::socket>> Connect(const std::string& path) {
    auto ws = std::make_unique<websocket::stream<tcp::socket>>(client_ioc_);
    ws->next_layer().connect(
        tcp::endpoint(net::ip::make_address("127.0.0.1"), server_->BoundPort()));
    ws->handshake("127.0.0.1", path);
    return ws;
  }

  static std::string ReadText(websocket::stream<tcp::socket>& ws) {
    beast::flat_buffer buffer;
    ws.read(buffer);
    return beast::buffers_to_string(buffer.data());
  }

  tests::SessionHarness h_;
  std::shared_ptr<FakeObjectStore> store_;
  archive::ArchiveDispatcher dispatcher_;
  session::SessionRegistry registry_;
  session::Finalizer finalizer_;
  ServerConfig config_;
  std::unique_ptr<WebSocketServer> server_;
  net::io_context client_ioc_;
};

TEST_F(WebSocketServerTest, StartBindsEphemeralPort) {
  EXPECT_TRUE(server_->IsRunning());
  EXPECT_NE(server_->BoundPort(), 0);
  EXPECT_EQ(server_->TrackedConnections(), 0u);
}

TEST_F(WebSocketServerTest, SessionEndsAndConnectionSocketIsReleased) {
  auto ws = Connect(config_.ws_path);
  const std::string hello = ReadText(*ws);
  EXPECT_NE(hello.find("\"type\":\"connection\""), std::string::npos) << hello;
  EXPECT_EQ(registry_.Size(), 1u);
  EXPECT_EQ(server_->TrackedConnections(), 1u);

  ws->write(net::buffer(std::string(R"({"type":"end_recording"})")));
  const std::string done = ReadText(*ws);
  EXPECT_NE(done.find("\"type\":\"recording_complete\""), std::string::npos) << done;

  // Server closes the WebSocket after the completion event.
  beast::flat_buffer buffer;
  beast::error_code ec;
  ws->read(buffer, ec);
  EXPECT_TRUE(ec == websocket::error::closed) << ec.message();

  EXPECT_TRUE(WaitFor([&] { return server_->TrackedConnections() == 0; }));
  EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(WebSocketServerTest, StopInterruptsOpenConnectionAndFinalizes) {
  auto ws = Connect(config_.ws_path);
  ReadText(*ws);
  ASSERT_EQ(registry_.Size(), 1u);

  server_->Stop();

  EXPECT_FALSE(server_->IsRunning());
  EXPECT_EQ(server_->TrackedConnections(), 0u);
  EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(WebSocketServerTest, OtherPathsGetNotFound) {
  tcp::socket socket(client_ioc_);
  socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), server_->BoundPort()));

  http::request<http::empty_body> req{http::verb::get, "/health", 11};
  req.set(http::field::host, "127.0.0.1");
  http::write(socket, req);

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(socket, buffer, res);
  EXPECT_EQ(res.result(), http::status::not_found);
  EXPECT_EQ(res.body(), "Not Found");

  EXPECT_TRUE(WaitFor([&] { return server_->TrackedConnections() == 0; }));
  EXPECT_EQ(registry_.Size(), 0u);
}

}  // namespace
}  // namespace batchscribe::server
