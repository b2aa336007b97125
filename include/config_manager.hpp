#pragma once

#include "line_reader.hpp"
#include "logger.hpp"
#include "text_encoding.hpp"
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace logpager {

class ConfigManager;

// Configuration validation result
struct ConfigValidationResult {
  bool isValid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  void addError(const std::string &error) {
    isValid = false;
    errors.push_back(error);
  }

  void addWarning(const std::string &warning) { warnings.push_back(warning); }
};

// Paging configuration structure
struct PagerConfig {
  std::string rootPath = "Logs";
  std::string extension = ".txt";
  std::size_t bufferSize = 1024;
  TextEncoding encoding;
  bool detectEncoding = true;
  int defaultPageSize = 10;
  int maxPageSize = 1000;

  // LOGPAGER_ROOT overrides pager.root_path
  static PagerConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
  LineReaderOptions readerOptions() const;
};

// HTTP listener configuration structure
struct HttpServerConfig {
  std::string address = "0.0.0.0";
  int port = 8080;
  int threads = 2;

  static HttpServerConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
};

class ConfigManager {
public:
  static ConfigManager &getInstance();

  bool loadConfig(const std::string &configPath);
  bool loadConfigFromString(const std::string &jsonText);

  std::string getString(const std::string &key,
                        const std::string &defaultValue = "") const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>
  getStringSet(const std::string &key) const;

  // Section helpers
  LogConfig getLoggingConfig() const;
  PagerConfig getPagerConfig() const;
  HttpServerConfig getServerConfig() const;

  ConfigValidationResult validateConfiguration() const;

  // Configuration access with validation
  template <typename T>
  T getValidatedValue(
      const std::string &key, const T &defaultValue,
      const std::function<bool(const T &)> &validator = nullptr) const;

private:
  ConfigManager() = default;

  std::unordered_map<std::string, std::string, TransparentStringHash,
                     std::equal_to<>>
      configData;
  std::string configFilePath;
  mutable std::mutex configMutex_;

  bool applyJson(const nlohmann::json &json);
  void flattenJson(const nlohmann::json &json, const std::string &prefix,
                   int currentDepth, int maxDepth);
};

/**
 * @brief Retrieve a typed configuration value for a key with optional runtime
 * validation.
 *
 * If the key is absent, or @p validator rejects the stored value, @p
 * defaultValue is returned.
 */
template <typename T>
T ConfigManager::getValidatedValue(
    const std::string &key, const T &defaultValue,
    const std::function<bool(const T &)> &validator) const {
  T value;

  if constexpr (std::is_same_v<T, std::string>) {
    value = getString(key, defaultValue);
  } else if constexpr (std::is_same_v<T, int>) {
    value = getInt(key, defaultValue);
  } else if constexpr (std::is_same_v<T, bool>) {
    value = getBool(key, defaultValue);
  } else {
    static_assert(std::is_same_v<T, std::string> || std::is_same_v<T, int> ||
                      std::is_same_v<T, bool>,
                  "Unsupported type for getValidatedValue");
    return defaultValue;
  }

  if (validator && !validator(value)) {
    return defaultValue;
  }

  return value;
}

} // namespace logpager
