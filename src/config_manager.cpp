#include "config_manager.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace xfer {

ConfigManager &ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

bool ConfigManager::loadConfig(const std::string &configPath) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  CONFIG_LOG_INFO("Loading configuration from: {}", configPath);

  configFilePath_ = configPath;
  std::ifstream file(configPath);
  if (!file.is_open()) {
    CONFIG_LOG_ERROR("Cannot open config file: {}", configPath);
    return false;
  }

  try {
    nlohmann::json jsonConfig;
    file >> jsonConfig;
    bool result = applyJson(jsonConfig);
    CONFIG_LOG_INFO("Configuration loaded successfully with {} parameters",
                    configData_.size());
    return result;
  } catch (const nlohmann::json::exception &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON config file {}: {}", configPath,
                     e.what());
    return false;
  }
}

bool ConfigManager::loadConfigFromString(const std::string &jsonText) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  try {
    return applyJson(nlohmann::json::parse(jsonText));
  } catch (const nlohmann::json::exception &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON configuration: {}", e.what());
    return false;
  }
}

bool ConfigManager::reloadConfiguration() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (configFilePath_.empty()) {
    CONFIG_LOG_WARN("No configuration file loaded, nothing to reload");
    return false;
  }
  return loadConfig(configFilePath_);
}

void ConfigManager::clear() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  configData_.clear();
  rawConfig_ = nlohmann::json::object();
  configFilePath_.clear();
}

bool ConfigManager::applyJson(const nlohmann::json &json) {
  if (!json.is_object()) {
    CONFIG_LOG_ERROR("Configuration root must be a JSON object");
    return false;
  }
  configData_.clear();
  rawConfig_ = json;
  flattenJson(json, "", 0, 32);
  return true;
}

void ConfigManager::flattenJson(const nlohmann::json &json,
                                const std::string &prefix, int currentDepth,
                                int maxDepth) {
  if (currentDepth >= maxDepth) {
    configData_[prefix] = json.dump();
    return;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

    if (it->is_object()) {
      flattenJson(*it, key, currentDepth + 1, maxDepth);
    } else if (it->is_string()) {
      configData_[key] = it->get<std::string>();
    } else if (it->is_number_integer()) {
      configData_[key] = std::to_string(it->get<long long>());
    } else if (it->is_boolean()) {
      configData_[key] = it->get<bool>() ? "true" : "false";
    } else {
      // Arrays and floats keep their JSON text
      configData_[key] = it->dump();
    }
  }
}

std::string ConfigManager::getString(const std::string &key,
                                     const std::string &defaultValue) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    return it->second;
  }
  return defaultValue;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
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
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    std::string value = string_utils::to_lower(it->second);
    return value == "true" || value == "1" || value == "yes" || value == "on";
  }
  return defaultValue;
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    try {
      return std::stod(it->second);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>
ConfigManager::getStringSet(const std::string &key) const {
  std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>
      result;
  std::string raw = getString(key);
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

  for (const auto &item : string_utils::split(raw, ',')) {
    auto trimmed = string_utils::trim(item);
    if (!trimmed.empty())
      result.emplace(trimmed);
  }
  return result;
}

LogConfig ConfigManager::getLoggingConfig() const {
  LogConfig config;

  config.level = Logger::parseLevel(getString("logging.level", "INFO"));
  config.format = parseLogFormat(getString("logging.format", "TEXT"));
  config.consoleOutput = getBool("logging.console_output", true);
  config.fileOutput = getBool("logging.file_output", false);
  config.asyncLogging = getBool("logging.async_logging", false);
  config.logFile = getString("logging.log_file", "logs/mongoxfer.log");
  config.maxFileSize =
      static_cast<size_t>(getInt("logging.max_file_size", 10485760));
  config.maxBackupFiles = getInt("logging.max_backup_files", 5);
  config.enableRotation = getBool("logging.enable_rotation", true);
  config.componentFilter = getStringSet("logging.component_filter");

  return config;
}

LogFormat ConfigManager::parseLogFormat(const std::string &formatStr) const {
  return string_utils::iequals(formatStr, "json") ? LogFormat::JSON
                                                  : LogFormat::TEXT;
}

TransferConfig ConfigManager::getTransferConfig() const {
  auto config = TransferConfig::fromConfig(*this);
  auto validation = config.validate();
  for (const auto &warning : validation.warnings) {
    CONFIG_LOG_WARN("transfer configuration: {}", warning);
  }
  if (!validation.isValid) {
    for (const auto &error : validation.errors) {
      CONFIG_LOG_ERROR("transfer configuration: {}", error);
    }
    CONFIG_LOG_WARN("Invalid transfer configuration, using defaults");
    return TransferConfig{};
  }
  return config;
}

ConfigValidationResult ConfigManager::validateConfiguration() const {
  ConfigValidationResult result = TransferConfig::fromConfig(*this).validate();

  auto logging = getLoggingConfig();
  if (logging.fileOutput && logging.logFile.empty()) {
    result.addError("logging.log_file must be set when file_output is enabled");
  }
  if (logging.maxBackupFiles < 0) {
    result.addError("logging.max_backup_files must not be negative");
  }

  return result;
}

// ===== TransferConfig Implementation =====

TransferConfig TransferConfig::fromConfig(const ConfigManager &config) {
  TransferConfig tc;
  auto positive = std::function<bool(const int &)>(
      [](const int &v) { return v > 0; });

  tc.mongodumpPath = config.getString("transfer.mongodump_path", "");
  tc.mongorestorePath = config.getString("transfer.mongorestore_path", "");
  tc.diagnosticTailLines = static_cast<size_t>(
      config.getInt("transfer.diagnostic_tail_lines", 10));
  tc.previewTailLines =
      static_cast<size_t>(config.getInt("transfer.preview_tail_lines", 20));
  tc.pollIntervalRecords = static_cast<size_t>(config.getValidatedValue<int>(
      "transfer.poll_interval_records", 100, positive));
  tc.progressIntervalRecords =
      static_cast<size_t>(config.getValidatedValue<int>(
          "transfer.progress_interval_records", 1000, positive));
  tc.gzipScanDepth = config.getInt("transfer.gzip_scan_depth", 5);
  tc.archiveExtension =
      config.getString("transfer.archive_extension", ".archive");
  tc.nativeExtension = config.getString("transfer.native_extension", ".zip");
  tc.eventQueueSize = static_cast<size_t>(config.getValidatedValue<int>(
      "transfer.event_queue_size", 1000, positive));
  tc.toolVersionTimeout = std::chrono::milliseconds(
      config.getInt("transfer.tool_version_timeout_ms", 5000));
  tc.previewTimeout = std::chrono::milliseconds(
      config.getInt("transfer.preview_timeout_ms", 30000));
  tc.authLookupTimeout = std::chrono::milliseconds(
      config.getInt("transfer.auth_lookup_timeout_ms", 5000));

  return tc;
}

ConfigValidationResult TransferConfig::validate() const {
  ConfigValidationResult result;

  if (diagnosticTailLines < 1) {
    result.addError("diagnostic_tail_lines must be positive");
  } else if (diagnosticTailLines < 10 || diagnosticTailLines > 20) {
    std::stringstream ss;
    ss << "diagnostic_tail_lines " << diagnosticTailLines
       << " is outside the usual 10-20 range";
    result.addWarning(ss.str());
  }

  if (previewTailLines < 1) {
    result.addError("preview_tail_lines must be positive");
  }

  if (gzipScanDepth < 0) {
    result.addError("gzip_scan_depth must not be negative");
  }

  if (archiveExtension.empty() || archiveExtension.front() != '.') {
    result.addError("archive_extension must start with '.', got: '" +
                    archiveExtension + "'");
  }

  if (nativeExtension.empty() || nativeExtension.front() != '.') {
    result.addError("native_extension must start with '.', got: '" +
                    nativeExtension + "'");
  }

  if (progressIntervalRecords < pollIntervalRecords) {
    result.addWarning(
        "progress_interval_records is smaller than poll_interval_records");
  }

  if (toolVersionTimeout.count() <= 0 || previewTimeout.count() <= 0 ||
      authLookupTimeout.count() <= 0) {
    result.addError("tool timeouts must be positive");
  }

  return result;
}

} // namespace xfer
