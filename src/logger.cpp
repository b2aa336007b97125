#include "logger.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::~Logger() { shutdown(); }

void Logger::configure(const LogConfig &config) {
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = config;
  }

  {
    std::lock_guard<std::mutex> fileLock(fileMutex_);
    if (fileStream_.is_open()) {
      fileStream_.close();
    }
    currentLogFile_ = config.logFile;
    if (config.fileOutput) {
      openLogFile(config.logFile);
    }
  }

  if (config.asyncLogging) {
    startAsyncWorker();
  } else {
    stopAsyncWorker();
  }
}

LogConfig Logger::getConfig() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return config_;
}

// Caller holds fileMutex_
void Logger::openLogFile(const std::string &filename) {
  std::filesystem::path logPath(filename);
  std::error_code ec;
  if (logPath.has_parent_path()) {
    std::filesystem::create_directories(logPath.parent_path(), ec);
  }

  fileStream_.open(filename, std::ios::app);
  if (!fileStream_.is_open()) {
    std::cerr << "Failed to open log file: " << filename << std::endl;
    return;
  }

  currentFileSize_ = std::filesystem::exists(filename, ec)
                         ? std::filesystem::file_size(filename, ec)
                         : 0;
  if (ec) {
    currentFileSize_ = 0;
  }

  std::string startupMsg =
      "[" + formatTimestamp() + "] [INFO ] [Logger] Logger initialized";
  fileStream_ << startupMsg << std::endl;
  currentFileSize_ += startupMsg.length() + 1;
}

void Logger::log(LogLevel level, const std::string &component,
                 const std::string &message, const LogContext &context) {
  LogConfig config = getConfig();
  if (level < config.level) {
    return;
  }
  if (!config.componentFilter.empty() &&
      config.componentFilter.find(component) ==
          config.componentFilter.end()) {
    return;
  }

  metrics_.totalMessages++;
  if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
    metrics_.errorCount++;
  } else if (level == LogLevel::WARN) {
    metrics_.warningCount++;
  }

  writeLog(config, formatMessage(config, level, component, message, context));
}

void Logger::debug(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string &component, const std::string &message,
                  const LogContext &context) {
  log(LogLevel::INFO, component, message, context);
}

void Logger::warn(const std::string &component, const std::string &message,
                  const LogContext &context) {
  log(LogLevel::WARN, component, message, context);
}

void Logger::error(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::ERROR, component, message, context);
}

void Logger::fatal(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::FATAL, component, message, context);
}

LogMetrics Logger::getMetrics() const { return metrics_; }

bool Logger::isEnabled(LogLevel level, const std::string &component) const {
  std::lock_guard<std::mutex> lock(configMutex_);
  if (level < config_.level) {
    return false;
  }
  return config_.componentFilter.empty() ||
         config_.componentFilter.find(component) !=
             config_.componentFilter.end();
}

void Logger::flush() {
  {
    std::lock_guard<std::mutex> lock(asyncMutex_);
    asyncCondition_.notify_all();
  }

  std::lock_guard<std::mutex> lock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.flush();
  }
}

void Logger::shutdown() {
  stopAsyncWorker();

  std::lock_guard<std::mutex> lock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.close();
  }
}

std::string Logger::formatTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time_t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  oss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO ";
  case LogLevel::WARN:
    return "WARN ";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

LogLevel Logger::parseLevel(const std::string &levelStr) {
  std::string level = levelStr;
  std::transform(level.begin(), level.end(), level.begin(), ::toupper);

  if (level == "DEBUG")
    return LogLevel::DEBUG;
  if (level == "WARN" || level == "WARNING")
    return LogLevel::WARN;
  if (level == "ERROR")
    return LogLevel::ERROR;
  if (level == "FATAL")
    return LogLevel::FATAL;

  return LogLevel::INFO;
}

LogFormat Logger::parseFormat(const std::string &formatStr) {
  std::string format = formatStr;
  std::transform(format.begin(), format.end(), format.begin(), ::toupper);
  return format == "JSON" ? LogFormat::JSON : LogFormat::TEXT;
}

std::string Logger::formatMessage(const LogConfig &config, LogLevel level,
                                  const std::string &component,
                                  const std::string &message,
                                  const LogContext &context) const {
  return config.format == LogFormat::JSON
             ? formatJsonMessage(level, component, message, context)
             : formatTextMessage(level, component, message, context);
}

std::string Logger::formatTextMessage(LogLevel level,
                                      const std::string &component,
                                      const std::string &message,
                                      const LogContext &context) const {
  std::ostringstream oss;
  oss << "[" << formatTimestamp() << "] "
      << "[" << levelToString(level) << "] "
      << "[" << component << "] " << message;

  if (!context.empty()) {
    oss << " |";
    for (const auto &[key, value] : context) {
      oss << " " << key << "=" << value;
    }
  }

  return oss.str();
}

std::string Logger::formatJsonMessage(LogLevel level,
                                      const std::string &component,
                                      const std::string &message,
                                      const LogContext &context) const {
  std::string levelName = levelToString(level);
  levelName.erase(levelName.find_last_not_of(' ') + 1);

  std::ostringstream oss;
  oss << "{"
      << "\"timestamp\":\"" << formatTimestamp() << "\","
      << "\"level\":\"" << levelName << "\","
      << "\"component\":\"" << escapeJson(component) << "\","
      << "\"message\":\"" << escapeJson(message) << "\"";

  if (!context.empty()) {
    oss << ",\"context\":{";
    bool first = true;
    for (const auto &[key, value] : context) {
      if (!first)
        oss << ",";
      oss << "\"" << escapeJson(key) << "\":\"" << escapeJson(value) << "\"";
      first = false;
    }
    oss << "}";
  }

  oss << "}";
  return oss.str();
}

std::string Logger::escapeJson(const std::string &str) {
  std::string result;
  result.reserve(str.length() + 20);

  for (char c : str) {
    switch (c) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\b':
      result += "\\b";
      break;
    case '\f':
      result += "\\f";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\r':
      result += "\\r";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        std::ostringstream oss;
        oss << "\\u" << std::setfill('0') << std::setw(4) << std::hex
            << static_cast<int>(c);
        result += oss.str();
      } else {
        result += c;
      }
      break;
    }
  }

  return result;
}

void Logger::writeLog(const LogConfig &config,
                      const std::string &formattedMessage) {
  if (config.asyncLogging && asyncStarted_) {
    writeLogAsync(formattedMessage);
  } else {
    writeLogSync(config, formattedMessage);
  }
}

void Logger::writeLogSync(const LogConfig &config,
                          const std::string &formattedMessage) {
  if (config.consoleOutput) {
    std::cout << formattedMessage << std::endl;
  }

  if (config.fileOutput) {
    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
      if (config.enableRotation &&
          currentFileSize_ + formattedMessage.length() > config.maxFileSize) {
        rotateLogFile(config);
      }

      fileStream_ << formattedMessage << std::endl;
      currentFileSize_ += formattedMessage.length() + 1;
    }
  }
}

void Logger::writeLogAsync(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(asyncMutex_);

  // Check queue size to prevent memory issues
  if (messageQueue_.size() > 10000) {
    metrics_.droppedMessages++;
    return;
  }

  messageQueue_.push(formattedMessage);
  asyncCondition_.notify_one();
}

void Logger::startAsyncWorker() {
  if (asyncStarted_.exchange(true)) {
    return;
  }
  stopAsync_ = false;
  asyncThread_ = std::thread(&Logger::asyncWorker, this);
}

void Logger::stopAsyncWorker() {
  if (!asyncStarted_) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(asyncMutex_);
    stopAsync_ = true;
  }
  asyncCondition_.notify_all();
  if (asyncThread_.joinable()) {
    asyncThread_.join();
  }
  asyncStarted_ = false;
}

void Logger::asyncWorker() {
  std::unique_lock<std::mutex> lock(asyncMutex_);
  while (true) {
    asyncCondition_.wait(
        lock, [this] { return !messageQueue_.empty() || stopAsync_; });

    while (!messageQueue_.empty()) {
      std::string message = std::move(messageQueue_.front());
      messageQueue_.pop();
      lock.unlock();

      writeLogSync(getConfig(), message);

      lock.lock();
    }

    if (stopAsync_) {
      break;
    }
  }
}

// Caller holds fileMutex_
void Logger::rotateLogFile(const LogConfig &config) {
  fileStream_.close();

  std::error_code ec;
  for (int i = config.maxBackupFiles - 1; i > 0; i--) {
    std::string oldFile = currentLogFile_ + "." + std::to_string(i);
    std::string newFile = currentLogFile_ + "." + std::to_string(i + 1);

    if (std::filesystem::exists(oldFile, ec)) {
      if (i == config.maxBackupFiles - 1) {
        std::filesystem::remove(newFile, ec); // Remove oldest
      }
      std::filesystem::rename(oldFile, newFile, ec);
    }
  }

  if (config.maxBackupFiles > 0 &&
      std::filesystem::exists(currentLogFile_, ec)) {
    std::filesystem::rename(currentLogFile_, currentLogFile_ + ".1", ec);
  }

  fileStream_.open(currentLogFile_, std::ios::out | std::ios::trunc);
  currentFileSize_ = 0;

  if (!fileStream_.is_open()) {
    std::cerr << "Failed to create new log file after rotation: "
              << currentLogFile_ << std::endl;
  }
}
