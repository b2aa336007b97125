#include "http_session.hpp"
#include "logger.hpp"
#include "request_handler.hpp"
#include "response_builder.hpp"

namespace logpager {

HttpSession::HttpSession(tcp::socket &&socket,
                         std::shared_ptr<const RequestHandler> handler,
                         std::chrono::seconds readTimeout)
    : stream_(std::move(socket)), handler_(std::move(handler)),
      readTimeout_(readTimeout) {}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead,
                                          shared_from_this()));
}

void HttpSession::doRead() {
  req_ = {};
  stream_.expires_after(readTimeout_);

  http::async_read(
      stream_, buffer_, req_,
      beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t bytesTransferred) {
  if (ec == http::error::end_of_stream) {
    HTTP_LOG_DEBUG("HttpSession::onRead() - End of stream, closing");
    return doClose();
  }

  if (ec) {
    if (ec != beast::error::timeout) {
      HTTP_LOG_WARN("HttpSession::onRead() - Error: {}", ec.message());
    }
    return;
  }

  HTTP_LOG_DEBUG("HttpSession::onRead() - {} {} ({} bytes)",
                 std::string(req_.method_string()), std::string(req_.target()),
                 bytesTransferred);

  if (!handler_) {
    HTTP_LOG_ERROR("HttpSession::onRead() - Handler is null");
    auto response = ResponseBuilder()
                        .setVersion(req_.version())
                        .internalServerError("Request handler not available");
    response.keep_alive(false);
    return sendResponse(std::move(response));
  }

  sendResponse(handler_->handleRequest(req_));
}

void HttpSession::sendResponse(http::response<http::string_body> &&msg) {
  auto response =
      std::make_shared<http::response<http::string_body>>(std::move(msg));
  auto self = shared_from_this();

  http::async_write(stream_, *response,
                    [self, response](beast::error_code ec,
                                     std::size_t bytesTransferred) {
                      self->onWrite(response->need_eof(), ec,
                                    bytesTransferred);
                    });
}

void HttpSession::onWrite(bool close, beast::error_code ec,
                          std::size_t bytesTransferred) {
  if (ec) {
    HTTP_LOG_ERROR("HttpSession::onWrite() - Error: {}", ec.message());
    return;
  }

  HTTP_LOG_DEBUG("HttpSession::onWrite() - Wrote {} bytes", bytesTransferred);

  if (close) {
    return doClose();
  }

  doRead();
}

void HttpSession::doClose() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  if (ec && ec != beast::errc::not_connected) {
    HTTP_LOG_WARN("HttpSession::doClose() - Shutdown error: {}", ec.message());
  }
}

} // namespace logpager
