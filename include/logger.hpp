#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <fstream>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <unordered_set>

// Custom transparent hasher for string types
struct TransparentStringHash {
  using is_transparent = void; // Enables heterogeneous lookup

  template <typename StringType>
  std::size_t operator()(const StringType &str) const {
    return std::hash<std::string_view>{}(str);
  }
};

using LogContext = std::unordered_map<std::string, std::string,
                                      TransparentStringHash, std::equal_to<>>;

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

enum class LogFormat { TEXT = 0, JSON = 1 };

struct LogConfig {
  LogLevel level = LogLevel::INFO;
  LogFormat format = LogFormat::TEXT;
  bool consoleOutput = true;
  bool fileOutput = false;
  bool asyncLogging = false;
  std::string logFile = "logs/logpager.log";
  size_t maxFileSize = 10 * 1024 * 1024; // 10MB
  int maxBackupFiles = 5;
  bool enableRotation = true;
  std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>
      componentFilter; // Empty = all components
};

struct LogMetrics {
  std::atomic<uint64_t> totalMessages{0};
  std::atomic<uint64_t> errorCount{0};
  std::atomic<uint64_t> warningCount{0};
  std::atomic<uint64_t> droppedMessages{0};
  std::chrono::steady_clock::time_point startTime;

  LogMetrics() : startTime(std::chrono::steady_clock::now()) {}

  // Copy constructor - can't copy atomics directly, so copy their values
  LogMetrics(const LogMetrics &other)
      : totalMessages(other.totalMessages.load()),
        errorCount(other.errorCount.load()),
        warningCount(other.warningCount.load()),
        droppedMessages(other.droppedMessages.load()),
        startTime(other.startTime) {}

  LogMetrics &operator=(const LogMetrics &other) {
    if (this != &other) {
      totalMessages.store(other.totalMessages.load());
      errorCount.store(other.errorCount.load());
      warningCount.store(other.warningCount.load());
      droppedMessages.store(other.droppedMessages.load());
      startTime = other.startTime;
    }
    return *this;
  }
};

class Logger {
public:
  static Logger &getInstance();

  // Configuration methods
  void configure(const LogConfig &config);
  LogConfig getConfig() const;

  // Logging methods
  void log(LogLevel level, const std::string &component,
           const std::string &message, const LogContext &context = {});
  void debug(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void info(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void warn(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void error(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void fatal(const std::string &component, const std::string &message,
             const LogContext &context = {});

  LogMetrics getMetrics() const;
  bool isEnabled(LogLevel level, const std::string &component) const;

  // Control methods
  void flush();
  void shutdown();

  static std::string levelToString(LogLevel level);
  static LogLevel parseLevel(const std::string &levelStr);
  static LogFormat parseFormat(const std::string &formatStr);

private:
  Logger() = default;
  ~Logger();

  // Configuration
  LogConfig config_;
  mutable std::mutex configMutex_;

  // File handling
  std::ofstream fileStream_;
  std::string currentLogFile_;
  size_t currentFileSize_ = 0;
  mutable std::mutex fileMutex_;

  // Async logging
  std::queue<std::string> messageQueue_;
  std::thread asyncThread_;
  std::condition_variable asyncCondition_;
  std::mutex asyncMutex_;
  std::atomic<bool> stopAsync_{false};
  std::atomic<bool> asyncStarted_{false};

  LogMetrics metrics_;

  // Helper methods
  std::string formatTimestamp() const;
  std::string formatMessage(const LogConfig &config, LogLevel level,
                            const std::string &component,
                            const std::string &message,
                            const LogContext &context) const;
  std::string formatTextMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  std::string formatJsonMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  void openLogFile(const std::string &filename);
  void writeLog(const LogConfig &config, const std::string &formattedMessage);
  void writeLogSync(const LogConfig &config,
                    const std::string &formattedMessage);
  void writeLogAsync(const std::string &formattedMessage);
  void asyncWorker();
  void startAsyncWorker();
  void stopAsyncWorker();
  void rotateLogFile(const LogConfig &config);
  static std::string escapeJson(const std::string &str);
};

// Standard logging macros
#define LOG_DEBUG(component, message, ...)                                     \
  Logger::getInstance().debug(component, message, ##__VA_ARGS__)
#define LOG_INFO(component, message, ...)                                      \
  Logger::getInstance().info(component, message, ##__VA_ARGS__)
#define LOG_WARN(component, message, ...)                                      \
  Logger::getInstance().warn(component, message, ##__VA_ARGS__)
#define LOG_ERROR(component, message, ...)                                     \
  Logger::getInstance().error(component, message, ##__VA_ARGS__)
#define LOG_FATAL(component, message, ...)                                     \
  Logger::getInstance().fatal(component, message, ##__VA_ARGS__)

#include "component_logger.hpp"

#define CONFIG_LOG_DEBUG(message, ...)                                         \
  logpager::ConfigLogger::debug(message, ##__VA_ARGS__)
#define CONFIG_LOG_INFO(message, ...)                                          \
  logpager::ConfigLogger::info(message, ##__VA_ARGS__)
#define CONFIG_LOG_WARN(message, ...)                                          \
  logpager::ConfigLogger::warn(message, ##__VA_ARGS__)
#define CONFIG_LOG_ERROR(message, ...)                                         \
  logpager::ConfigLogger::error(message, ##__VA_ARGS__)

#define READER_LOG_DEBUG(message, ...)                                         \
  logpager::LineReaderLogger::debug(message, ##__VA_ARGS__)
#define READER_LOG_INFO(message, ...)                                          \
  logpager::LineReaderLogger::info(message, ##__VA_ARGS__)
#define READER_LOG_WARN(message, ...)                                          \
  logpager::LineReaderLogger::warn(message, ##__VA_ARGS__)
#define READER_LOG_ERROR(message, ...)                                         \
  logpager::LineReaderLogger::error(message, ##__VA_ARGS__)

#define REPO_LOG_DEBUG(message, ...)                                           \
  logpager::FileRepositoryLogger::debug(message, ##__VA_ARGS__)
#define REPO_LOG_INFO(message, ...)                                            \
  logpager::FileRepositoryLogger::info(message, ##__VA_ARGS__)
#define REPO_LOG_WARN(message, ...)                                            \
  logpager::FileRepositoryLogger::warn(message, ##__VA_ARGS__)
#define REPO_LOG_ERROR(message, ...)                                           \
  logpager::FileRepositoryLogger::error(message, ##__VA_ARGS__)

#define PAGER_LOG_DEBUG(message, ...)                                          \
  logpager::PageReaderLogger::debug(message, ##__VA_ARGS__)
#define PAGER_LOG_INFO(message, ...)                                           \
  logpager::PageReaderLogger::info(message, ##__VA_ARGS__)
#define PAGER_LOG_WARN(message, ...)                                           \
  logpager::PageReaderLogger::warn(message, ##__VA_ARGS__)
#define PAGER_LOG_ERROR(message, ...)                                          \
  logpager::PageReaderLogger::error(message, ##__VA_ARGS__)

#define HTTP_LOG_DEBUG(message, ...)                                           \
  logpager::HttpLogger::debug(message, ##__VA_ARGS__)
#define HTTP_LOG_INFO(message, ...)                                            \
  logpager::HttpLogger::info(message, ##__VA_ARGS__)
#define HTTP_LOG_WARN(message, ...)                                            \
  logpager::HttpLogger::warn(message, ##__VA_ARGS__)
#define HTTP_LOG_ERROR(message, ...)                                           \
  logpager::HttpLogger::error(message, ##__VA_ARGS__)

#define REQ_LOG_DEBUG(message, ...)                                            \
  logpager::RequestLogger::debug(message, ##__VA_ARGS__)
#define REQ_LOG_INFO(message, ...)                                             \
  logpager::RequestLogger::info(message, ##__VA_ARGS__)
#define REQ_LOG_WARN(message, ...)                                             \
  logpager::RequestLogger::warn(message, ##__VA_ARGS__)
#define REQ_LOG_ERROR(message, ...)                                            \
  logpager::RequestLogger::error(message, ##__VA_ARGS__)
