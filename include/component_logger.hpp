#pragma once

#include "logger.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace logpager {

template <typename Component> struct ComponentTrait;

template <> struct ComponentTrait<class ConfigManager> {
  static constexpr const char *name = "ConfigManager";
};

template <> struct ComponentTrait<class LineReader> {
  static constexpr const char *name = "LineReader";
};

template <> struct ComponentTrait<class FileRepository> {
  static constexpr const char *name = "FileRepository";
};

template <> struct ComponentTrait<class PageReader> {
  static constexpr const char *name = "PageReader";
};

template <> struct ComponentTrait<class HttpServer> {
  static constexpr const char *name = "HttpServer";
};

template <> struct ComponentTrait<class RequestHandler> {
  static constexpr const char *name = "RequestHandler";
};

/**
 * ComponentLogger - Template-based logging with the component name resolved
 * at compile time through ComponentTrait.
 *
 * Messages may carry "{}" placeholders that are filled from the trailing
 * arguments in order.
 */
template <typename Component> class ComponentLogger {
private:
  static_assert(std::is_class_v<Component>, "Component must be a class type");

  static constexpr const char *component_name = ComponentTrait<Component>::name;

  static Logger &getLogger() { return Logger::getInstance(); }

public:
  template <typename... Args>
  static void debug(const std::string &message, Args &&...args) {
    if (!getLogger().isEnabled(LogLevel::DEBUG, component_name)) {
      return;
    }
    getLogger().debug(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void info(const std::string &message, Args &&...args) {
    getLogger().info(component_name,
                     format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void warn(const std::string &message, Args &&...args) {
    getLogger().warn(component_name,
                     format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void error(const std::string &message, Args &&...args) {
    getLogger().error(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void fatal(const std::string &message, Args &&...args) {
    getLogger().fatal(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

private:
  template <typename T>
  static void stream_value(std::stringstream &ss, T &&value) {
    if constexpr (std::is_arithmetic_v<std::decay_t<T>> ||
                  std::is_convertible_v<T, std::string>) {
      ss << std::forward<T>(value);
    } else {
      ss << "[object]";
    }
  }

  template <typename... Args>
  static std::string format_message(const std::string &format,
                                    Args &&...args) {
    if constexpr (sizeof...(args) == 0) {
      return format;
    } else {
      std::stringstream ss;
      format_impl(ss, format, std::forward<Args>(args)...);
      return ss.str();
    }
  }

  template <typename T, typename... Args>
  static void format_impl(std::stringstream &ss, const std::string &format,
                          T &&arg, Args &&...args) {
    size_t pos = format.find("{}");
    if (pos != std::string::npos) {
      ss << format.substr(0, pos);
      stream_value(ss, std::forward<T>(arg));
      if constexpr (sizeof...(args) > 0) {
        format_impl(ss, format.substr(pos + 2), std::forward<Args>(args)...);
      } else {
        ss << format.substr(pos + 2);
      }
    } else {
      ss << format;
    }
  }
};

using ConfigLogger = ComponentLogger<class ConfigManager>;
using LineReaderLogger = ComponentLogger<class LineReader>;
using FileRepositoryLogger = ComponentLogger<class FileRepository>;
using PageReaderLogger = ComponentLogger<class PageReader>;
using HttpLogger = ComponentLogger<class HttpServer>;
using RequestLogger = ComponentLogger<class RequestHandler>;

} // namespace logpager
