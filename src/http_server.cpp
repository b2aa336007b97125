#include "http_server.hpp"
#include "http_session.hpp"
#include "logger.hpp"
#include "pager_exceptions.hpp"
#include "request_handler.hpp"
#include <algorithm>
#include <thread>
#include <vector>

namespace logpager {

namespace {

class Listener : public std::enable_shared_from_this<Listener> {
public:
  Listener(net::io_context &ioc, tcp::endpoint endpoint,
           std::shared_ptr<const RequestHandler> handler)
      : ioc_(ioc), acceptor_(net::make_strand(ioc)),
        handler_(std::move(handler)) {
    beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      fail(ec, "open");
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
      fail(ec, "set_option");
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      fail(ec, "bind");
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
      fail(ec, "listen");
    }
  }

  void run() { doAccept(); }

  unsigned short port() const { return acceptor_.local_endpoint().port(); }

private:
  net::io_context &ioc_;
  tcp::acceptor acceptor_;
  std::shared_ptr<const RequestHandler> handler_;

  [[noreturn]] void fail(beast::error_code ec, const char *what) {
    HTTP_LOG_ERROR("Listener - {} failed: {}", what, ec.message());
    ErrorContext context;
    context["operation"] = what;
    throw SystemException(ErrorCode::INTERNAL_ERROR,
                          std::string("Listener ") + what + ": " + ec.message(),
                          "HttpServer", context);
  }

  void doAccept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&Listener::onAccept, shared_from_this()));
  }

  void onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec == net::error::operation_aborted ||
          ec == net::error::bad_descriptor) {
        HTTP_LOG_DEBUG("Listener::onAccept() - Listener closed");
        return;
      }
      HTTP_LOG_WARN("Listener::onAccept() - Error: {}", ec.message());
    } else {
      HTTP_LOG_DEBUG("Listener::onAccept() - New connection accepted");
      std::make_shared<HttpSession>(std::move(socket), handler_)->run();
    }

    doAccept();
  }
};

} // namespace

struct HttpServer::Impl {
  std::string address;
  unsigned short port = 0;
  int threads = 1;
  std::shared_ptr<const RequestHandler> handler;
  std::unique_ptr<net::io_context> ioc;
  std::shared_ptr<Listener> listener;
  std::vector<std::thread> threadPool;
  bool running = false;
};

HttpServer::HttpServer(const std::string &address, unsigned short port,
                       int threads)
    : pImpl(std::make_unique<Impl>()) {
  pImpl->address = address;
  pImpl->port = port;
  pImpl->threads = std::max<int>(1, threads);
}

HttpServer::~HttpServer() { stop(); }

void HttpServer::start() {
  if (pImpl->running) {
    HTTP_LOG_WARN("HttpServer::start() - Server already running");
    return;
  }

  if (!pImpl->handler) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          "No request handler set", "HttpServer");
  }

  HTTP_LOG_INFO("HttpServer::start() - Starting HTTP server on {}:{}",
                pImpl->address, pImpl->port);

  beast::error_code ec;
  auto const address = net::ip::make_address(pImpl->address, ec);
  if (ec) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "Invalid listen address: " + ec.message(),
                              "server.address", pImpl->address);
  }

  pImpl->ioc = std::make_unique<net::io_context>(pImpl->threads);
  pImpl->listener = std::make_shared<Listener>(
      *pImpl->ioc, tcp::endpoint{address, pImpl->port}, pImpl->handler);
  pImpl->port = pImpl->listener->port();
  pImpl->listener->run();

  pImpl->threadPool.reserve(pImpl->threads);
  for (int i = 0; i < pImpl->threads; ++i) {
    pImpl->threadPool.emplace_back([this, i]() {
      HTTP_LOG_DEBUG("HttpServer thread {} starting", i);
      // A throwing handler must not take the thread out of the pool
      for (;;) {
        try {
          pImpl->ioc->run();
          break;
        } catch (const std::exception &e) {
          HTTP_LOG_ERROR("HttpServer thread {} exception: {}", i, e.what());
        }
      }
      HTTP_LOG_DEBUG("HttpServer thread {} finished", i);
    });
  }

  pImpl->running = true;
  HTTP_LOG_INFO("HttpServer::start() - Listening on port {} with {} threads",
                pImpl->port, pImpl->threads);
}

void HttpServer::stop() {
  if (!pImpl->running) {
    return;
  }

  HTTP_LOG_INFO("HttpServer::stop() - Stopping HTTP server");
  pImpl->ioc->stop();

  for (auto &t : pImpl->threadPool) {
    if (t.joinable()) {
      t.join();
    }
  }
  pImpl->threadPool.clear();
  pImpl->listener.reset();

  pImpl->running = false;
  HTTP_LOG_INFO("HttpServer::stop() - HTTP server stopped");
}

bool HttpServer::isRunning() const { return pImpl->running; }

void HttpServer::setRequestHandler(
    std::shared_ptr<const RequestHandler> handler) {
  HTTP_LOG_DEBUG("HttpServer::setRequestHandler() - Handler {}",
                 handler ? "set" : "cleared");
  pImpl->handler = std::move(handler);
}

unsigned short HttpServer::port() const { return pImpl->port; }

} // namespace logpager
