#pragma once

#include <memory>
#include <string>

namespace logpager {

class RequestHandler;

/**
 * HttpServer - Beast listener on a fixed-size io_context thread pool.
 *
 * start() throws SystemException when no handler is set or the endpoint
 * cannot be bound.
 */
class HttpServer {
public:
  HttpServer(const std::string &address, unsigned short port, int threads = 1);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  void start();
  void stop();
  bool isRunning() const;

  void setRequestHandler(std::shared_ptr<const RequestHandler> handler);

  // Bound port, useful when constructed with port 0
  unsigned short port() const;

private:
  struct Impl;
  std::unique_ptr<Impl> pImpl;
};

} // namespace logpager
