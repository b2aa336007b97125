#pragma once

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <memory>

namespace logpager {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class RequestHandler;

/**
 * HttpSession - One client connection. Reads a request, hands it to the
 * RequestHandler, writes the response and loops while keep-alive holds.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket &&socket, std::shared_ptr<const RequestHandler> handler,
              std::chrono::seconds readTimeout = std::chrono::seconds(30));

  void run();

private:
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  std::shared_ptr<const RequestHandler> handler_;
  std::chrono::seconds readTimeout_;

  void doRead();
  void onRead(beast::error_code ec, std::size_t bytesTransferred);
  void sendResponse(http::response<http::string_body> &&msg);
  void onWrite(bool close, beast::error_code ec, std::size_t bytesTransferred);
  void doClose();
};

} // namespace logpager
