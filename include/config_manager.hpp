#pragma once

#include "logger.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace xfer {

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

// Tunables for the transfer engine ("transfer.*" keys)
struct TransferConfig {
  // Empty = resolve from the execution search path
  std::string mongodumpPath;
  std::string mongorestorePath;

  size_t diagnosticTailLines = 10;
  size_t previewTailLines = 20;
  size_t pollIntervalRecords = 100;
  size_t progressIntervalRecords = 1000;
  int gzipScanDepth = 5;
  std::string archiveExtension = ".archive";
  std::string nativeExtension = ".zip";
  size_t eventQueueSize = 1000;

  std::chrono::milliseconds toolVersionTimeout{5000};
  std::chrono::milliseconds previewTimeout{30000};
  std::chrono::milliseconds authLookupTimeout{5000};

  static TransferConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
  bool operator==(const TransferConfig &other) const = default;
};

class ConfigManager {
public:
  static ConfigManager &getInstance();

  bool loadConfig(const std::string &configPath);
  bool loadConfigFromString(const std::string &jsonText);
  bool reloadConfiguration();
  void clear();

  std::string getString(const std::string &key,
                        const std::string &defaultValue = "") const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;
  std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>
  getStringSet(const std::string &key) const;

  LogConfig getLoggingConfig() const;

  // Falls back to defaults (with a warning) when validation fails
  TransferConfig getTransferConfig() const;
  ConfigValidationResult validateConfiguration() const;

  template <typename T>
  T getValidatedValue(
      const std::string &key, const T &defaultValue,
      const std::function<bool(const T &)> &validator = nullptr) const;

private:
  ConfigManager() = default;

  mutable std::recursive_mutex mutex_;
  std::unordered_map<std::string, std::string, TransparentStringHash,
                     std::equal_to<>>
      configData_;
  std::string configFilePath_;
  nlohmann::json rawConfig_;

  bool applyJson(const nlohmann::json &json);
  void flattenJson(const nlohmann::json &json, const std::string &prefix,
                   int currentDepth, int maxDepth);
  LogFormat parseLogFormat(const std::string &formatStr) const;
};

/**
 * Retrieve a typed value for @p key. Returns @p defaultValue when the key is
 * absent or when @p validator rejects the stored value.
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
  } else if constexpr (std::is_same_v<T, double>) {
    value = getDouble(key, defaultValue);
  } else {
    static_assert(std::is_same_v<T, std::string> || std::is_same_v<T, int> ||
                      std::is_same_v<T, bool> || std::is_same_v<T, double>,
                  "Unsupported type for getValidatedValue");
    return defaultValue;
  }

  if (validator && !validator(value)) {
    return defaultValue;
  }

  return value;
}

} // namespace xfer
