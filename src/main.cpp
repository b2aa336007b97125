#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "config_manager.hpp"
#include "http_server.hpp"
#include "logger.hpp"
#include "page_reader.hpp"
#include "pager_exceptions.hpp"
#include "request_handler.hpp"

namespace {

std::atomic<bool> shutdownRequested{false};

void signalHandler(int) { shutdownRequested = true; }

} // namespace

int main(int argc, char *argv[]) {
  const std::string configPath = argc > 1 ? argv[1] : "config.json";

  try {
    auto &config = logpager::ConfigManager::getInstance();
    if (!config.loadConfig(configPath)) {
      std::cerr << "Failed to load configuration from " << configPath
                << std::endl;
      return 1;
    }

    auto &logger = Logger::getInstance();
    logger.configure(config.getLoggingConfig());

    LOG_INFO("Main", "Starting LogPager with configuration " + configPath);

    auto validation = config.validateConfiguration();
    for (const auto &warning : validation.warnings) {
      LOG_WARN("Main", "Configuration warning: " + warning);
    }
    if (!validation.isValid) {
      for (const auto &error : validation.errors) {
        LOG_ERROR("Main", "Configuration error: " + error);
      }
      logger.shutdown();
      return 1;
    }

    const auto pagerConfig = config.getPagerConfig();
    const auto serverConfig = config.getServerConfig();

    LOG_INFO("Main", "Serving '" + pagerConfig.extension + "' files from " +
                         pagerConfig.rootPath);

    auto requestHandler = std::make_shared<logpager::RequestHandler>(
        logpager::PageReader(pagerConfig));

    logpager::HttpServer server(serverConfig.address,
                                static_cast<unsigned short>(serverConfig.port),
                                serverConfig.threads);
    server.setRequestHandler(requestHandler);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    server.start();
    LOG_INFO("Main", "LogPager is running. Press Ctrl+C to stop.");

    while (server.isRunning() && !shutdownRequested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Main", "Shutting down gracefully...");
    server.stop();
  } catch (const logpager::PagerException &e) {
    LOG_FATAL("Main", "Startup failed: " + e.toLogString());
    Logger::getInstance().shutdown();
    return 1;
  } catch (const std::exception &e) {
    LOG_FATAL("Main", "Unhandled exception: " + std::string(e.what()));
    Logger::getInstance().shutdown();
    return 1;
  }

  LOG_INFO("Main", "LogPager shutdown complete");
  Logger::getInstance().shutdown();
  return 0;
}
