#include "config_manager.hpp"
#include "logger.hpp"
#include "pager_exceptions.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace logpager {

ConfigManager &ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

bool ConfigManager::loadConfig(const std::string &configPath) {
  CONFIG_LOG_INFO("Loading configuration from: {}", configPath);

  std::ifstream file(configPath);
  if (!file.is_open()) {
    CONFIG_LOG_ERROR("Cannot open config file: {}", configPath);
    return false;
  }

  try {
    nlohmann::json jsonConfig;
    file >> jsonConfig;
    if (!applyJson(jsonConfig)) {
      return false;
    }
  } catch (const nlohmann::json::exception &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON config file {}: {}", configPath,
                     e.what());
    return false;
  }

  std::size_t parameterCount = 0;
  {
    std::scoped_lock lock(configMutex_);
    configFilePath = configPath;
    parameterCount = configData.size();
  }
  CONFIG_LOG_INFO("Configuration loaded successfully with {} parameters",
                  parameterCount);
  return true;
}

bool ConfigManager::loadConfigFromString(const std::string &jsonText) {
  try {
    return applyJson(nlohmann::json::parse(jsonText));
  } catch (const nlohmann::json::exception &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON configuration: {}", e.what());
    return false;
  }
}

bool ConfigManager::applyJson(const nlohmann::json &json) {
  if (!json.is_object()) {
    CONFIG_LOG_ERROR("Configuration root must be a JSON object");
    return false;
  }

  std::scoped_lock lock(configMutex_);
  configData.clear();
  flattenJson(json, "", 0, 100);
  return true;
}

void ConfigManager::flattenJson(const nlohmann::json &json,
                                const std::string &prefix, int currentDepth,
                                int maxDepth) {
  if (currentDepth >= maxDepth) {
    std::string key = prefix.empty() ? "deep_nested" : prefix + ".deep_nested";
    configData[key] = json.dump();
    return;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

    if (it->is_object()) {
      flattenJson(*it, key, currentDepth + 1, maxDepth);
    } else if (it->is_array()) {
      // Arrays stay JSON text, see getStringSet()
      configData[key] = it->dump();
    } else if (it->is_string()) {
      configData[key] = it->get<std::string>();
    } else if (it->is_number_integer()) {
      configData[key] = std::to_string(it->get<long long>());
    } else if (it->is_boolean()) {
      configData[key] = it->get<bool>() ? "true" : "false";
    } else {
      configData[key] = it->dump();
    }
  }
}

std::string ConfigManager::getString(const std::string &key,
                                     const std::string &defaultValue) const {
  std::scoped_lock lock(configMutex_);
  if (auto it = configData.find(key); it != configData.end()) {
    return it->second;
  }
  return defaultValue;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  std::scoped_lock lock(configMutex_);
  if (auto it = configData.find(key); it != configData.end()) {
    try {
      return std::stoi(it->second);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  std::scoped_lock lock(configMutex_);
  if (auto it = configData.find(key); it != configData.end()) {
    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    return value == "true" || value == "1" || value == "yes" || value == "on";
  }
  return defaultValue;
}

std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>
ConfigManager::getStringSet(const std::string &key) const {
  std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>
      result;
  const std::string raw = getString(key);
  if (raw.empty()) {
    return result;
  }

  if (raw.front() == '[') {
    auto arr = nlohmann::json::parse(raw, nullptr, false);
    if (!arr.is_discarded() && arr.is_array()) {
      for (const auto &v : arr) {
        if (v.is_string())
          result.insert(v.get<std::string>());
      }
      return result;
    }
  }

  // Comma separated fallback
  std::stringstream ss(raw);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item.erase(0, item.find_first_not_of(" \t\""));
    item.erase(item.find_last_not_of(" \t\"") + 1);
    if (!item.empty())
      result.insert(item);
  }
  return result;
}

LogConfig ConfigManager::getLoggingConfig() const {
  LogConfig config;

  config.level = Logger::parseLevel(getString("logging.level", "INFO"));
  config.format = Logger::parseFormat(getString("logging.format", "TEXT"));
  config.consoleOutput = getBool("logging.console_output", true);
  config.fileOutput = getBool("logging.file_output", false);
  config.asyncLogging = getBool("logging.async_logging", false);
  config.logFile = getString("logging.log_file", "logs/logpager.log");
  config.maxFileSize =
      static_cast<size_t>(getInt("logging.max_file_size", 10485760));
  config.maxBackupFiles = getInt("logging.max_backup_files", 5);
  config.enableRotation = getBool("logging.enable_rotation", true);
  config.componentFilter = getStringSet("logging.component_filter");

  return config;
}

PagerConfig ConfigManager::getPagerConfig() const {
  return PagerConfig::fromConfig(*this);
}

HttpServerConfig ConfigManager::getServerConfig() const {
  return HttpServerConfig::fromConfig(*this);
}

ConfigValidationResult ConfigManager::validateConfiguration() const {
  ConfigValidationResult result;

  auto merge = [&result](const ConfigValidationResult &section,
                         const std::string &label) {
    result.isValid = result.isValid && section.isValid;
    for (const auto &error : section.errors) {
      result.errors.push_back(label + ": " + error);
    }
    for (const auto &warning : section.warnings) {
      result.warnings.push_back(label + ": " + warning);
    }
  };

  try {
    merge(getPagerConfig().validate(), "Pager");
  } catch (const SystemException &e) {
    result.addError("Pager: " + e.getMessage());
  }
  merge(getServerConfig().validate(), "Server");

  return result;
}

// ===== PagerConfig Implementation =====

PagerConfig PagerConfig::fromConfig(const ConfigManager &config) {
  PagerConfig pager;

  const char *rootEnv = std::getenv("LOGPAGER_ROOT");
  pager.rootPath = rootEnv && *rootEnv
                       ? std::string(rootEnv)
                       : config.getString("pager.root_path", "Logs");
  pager.extension = config.getString("pager.extension", ".txt");
  pager.bufferSize = static_cast<std::size_t>(config.getValidatedValue<int>(
      "pager.buffer_size", 1024, [](const int &v) { return v > 0; }));
  pager.detectEncoding = config.getBool("pager.detect_encoding", true);
  pager.defaultPageSize = config.getInt("pager.default_page_size", 10);
  pager.maxPageSize = config.getInt("pager.max_page_size", 1000);

  const std::string encodingName = config.getString("pager.encoding", "utf-8");
  try {
    pager.encoding = TextEncoding::fromName(encodingName);
  } catch (const ValidationException &e) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR, e.getMessage(),
                          "ConfigManager", {{"key", "pager.encoding"}});
  }

  return pager;
}

ConfigValidationResult PagerConfig::validate() const {
  ConfigValidationResult result;

  if (rootPath.empty()) {
    result.addError("root_path must not be empty");
  }

  if (extension.empty()) {
    result.addWarning("extension is empty, every file in the root is listed");
  } else if (extension.front() != '.') {
    std::stringstream ss;
    ss << "extension \"" << extension << "\" does not start with '.'";
    result.addWarning(ss.str());
  }

  if (bufferSize < 128) {
    std::stringstream ss;
    ss << "buffer_size " << bufferSize
       << " is below the minimum, 128 bytes will be used";
    result.addWarning(ss.str());
  }

  if (maxPageSize <= 0) {
    std::stringstream ss;
    ss << "max_page_size must be positive, got: " << maxPageSize;
    result.addError(ss.str());
  }

  if (defaultPageSize < 0 || defaultPageSize > maxPageSize) {
    std::stringstream ss;
    ss << "default_page_size must be between 0 and " << maxPageSize
       << ", got: " << defaultPageSize;
    result.addError(ss.str());
  }

  return result;
}

LineReaderOptions PagerConfig::readerOptions() const {
  LineReaderOptions options;
  options.encoding = encoding;
  options.detectEncoding = detectEncoding;
  options.bufferSize = bufferSize;
  return options;
}

// ===== HttpServerConfig Implementation =====

HttpServerConfig HttpServerConfig::fromConfig(const ConfigManager &config) {
  HttpServerConfig server;

  server.address = config.getString("server.address", "0.0.0.0");
  server.port = config.getInt("server.port", 8080);
  server.threads = config.getInt("server.threads", 2);

  return server;
}

ConfigValidationResult HttpServerConfig::validate() const {
  ConfigValidationResult result;

  if (port <= 0 || port > 65535) {
    std::stringstream ss;
    ss << "port must be between 1 and 65535, got: " << port;
    result.addError(ss.str());
  } else if (port < 1024) {
    std::stringstream ss;
    ss << "port " << port << " is in privileged range (< 1024)";
    result.addWarning(ss.str());
  }

  if (threads <= 0) {
    std::stringstream ss;
    ss << "threads must be positive, got: " << threads;
    result.addError(ss.str());
  }

  if (address.empty()) {
    result.addError("address must not be empty");
  }

  return result;
}

} // namespace logpager
