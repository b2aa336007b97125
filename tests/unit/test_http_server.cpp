#include "http_server.hpp"
#include "pager_exceptions.hpp"
#include "request_handler.hpp"
#include "test_support.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <gtest/gtest.h>

using namespace logpager;

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class HttpServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_.write("app.txt", test::joinLines(test::loremLines(10)));

    PagerConfig config;
    config.rootPath = dir_.path().string();
    handler_ = std::make_shared<RequestHandler>(PageReader(config));
  }

  // One request per connection, closed by the server after the response
  http::response<http::string_body> fetch(unsigned short port,
                                          const std::string &target) {
    net::io_context ioc;
    tcp::socket socket(ioc);
    socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));

    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.keep_alive(false);
    http::write(socket, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);

    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return res;
  }

  test::TempDirectory dir_;
  std::shared_ptr<RequestHandler> handler_;
};

TEST_F(HttpServerTest, StartWithoutHandlerThrows) {
  HttpServer server("127.0.0.1", 0, 1);
  EXPECT_THROW(server.start(), SystemException);
  EXPECT_FALSE(server.isRunning());
}

TEST_F(HttpServerTest, InvalidAddressIsRejected) {
  HttpServer server("not-an-address", 0, 1);
  server.setRequestHandler(handler_);
  EXPECT_THROW(server.start(), ValidationException);
}

TEST_F(HttpServerTest, ServesRequestsUntilStopped) {
  HttpServer server("127.0.0.1", 0, 2);
  server.setRequestHandler(handler_);
  server.start();
  ASSERT_TRUE(server.isRunning());
  ASSERT_NE(server.port(), 0);

  auto health = fetch(server.port(), "/api/health");
  EXPECT_EQ(health.result(), http::status::ok);
  EXPECT_EQ(health.body(), R"({"status":"ok"})");

  auto page = fetch(server.port(), "/api/pages/last?id=app.txt&count=2");
  ASSERT_EQ(page.result(), http::status::ok);
  const auto json = nlohmann::json::parse(page.body());
  EXPECT_EQ(json["lines"].size(), 2u);
  EXPECT_EQ(json["lines"][1], "0010 lorem ipsum dolor sit amet");

  auto missing = fetch(server.port(), "/api/pages/first?id=nope.txt");
  EXPECT_EQ(missing.result(), http::status::not_found);

  server.stop();
  EXPECT_FALSE(server.isRunning());
}

TEST_F(HttpServerTest, PortInUseFailsToStart) {
  HttpServer first("127.0.0.1", 0, 1);
  first.setRequestHandler(handler_);
  first.start();

  HttpServer second("127.0.0.1", first.port(), 1);
  second.setRequestHandler(handler_);
  EXPECT_THROW(second.start(), SystemException);
  EXPECT_FALSE(second.isRunning());

  first.stop();
}
