#pragma once

#include "logger.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace xfer {

template <typename Component> struct ComponentTrait;

// Component trait specializations, one per engine component
template <> struct ComponentTrait<class TransferEngine> {
  static constexpr const char *name = "TransferEngine";
};

template <> struct ComponentTrait<class ConfigManager> {
  static constexpr const char *name = "ConfigManager";
};

template <> struct ComponentTrait<class ToolUriBuilder> {
  static constexpr const char *name = "UriBuilder";
};

template <> struct ComponentTrait<class ArchiveClassifier> {
  static constexpr const char *name = "ArchiveClassifier";
};

template <> struct ComponentTrait<class ProcessRunner> {
  static constexpr const char *name = "ProcessRunner";
};

template <> struct ComponentTrait<class ToolTransfer> {
  static constexpr const char *name = "ToolTransfer";
};

template <> struct ComponentTrait<class NativeExporter> {
  static constexpr const char *name = "NativeExporter";
};

template <> struct ComponentTrait<class NativeImporter> {
  static constexpr const char *name = "NativeImporter";
};

template <> struct ComponentTrait<class ProgressEmitter> {
  static constexpr const char *name = "ProgressEmitter";
};

template <> struct ComponentTrait<class CancellationRegistry> {
  static constexpr const char *name = "CancellationRegistry";
};

template <> struct ComponentTrait<class MongoDatabase> {
  static constexpr const char *name = "MongoDatabase";
};

template <> struct ComponentTrait<class CommandLine> {
  static constexpr const char *name = "CommandLine";
};

/**
 * ComponentLogger - compile-time component naming over the Logger singleton.
 *
 * Messages accept "{}" placeholders that are substituted in order with the
 * trailing arguments.
 */
template <typename Component> class ComponentLogger {
private:
  static_assert(std::is_class_v<Component>, "Component must be a class type");

  static constexpr const char *component_name = ComponentTrait<Component>::name;

  static Logger &getLogger() { return Logger::getInstance(); }

public:
  template <typename... Args>
  static void debug(const std::string &message, Args &&...args) {
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

  // Job-specific logging methods

  template <typename... Args>
  static void debugJob(const std::string &message, const std::string &jobId,
                       Args &&...args) {
    getLogger().debugForJob(
        component_name, format_message(message, std::forward<Args>(args)...),
        jobId);
  }

  template <typename... Args>
  static void infoJob(const std::string &message, const std::string &jobId,
                      Args &&...args) {
    getLogger().infoForJob(
        component_name, format_message(message, std::forward<Args>(args)...),
        jobId);
  }

  template <typename... Args>
  static void warnJob(const std::string &message, const std::string &jobId,
                      Args &&...args) {
    getLogger().warnForJob(
        component_name, format_message(message, std::forward<Args>(args)...),
        jobId);
  }

  template <typename... Args>
  static void errorJob(const std::string &message, const std::string &jobId,
                       Args &&...args) {
    getLogger().errorForJob(
        component_name, format_message(message, std::forward<Args>(args)...),
        jobId);
  }

  static void infoWithContext(const std::string &message,
                              const LogContext &context = {}) {
    getLogger().info(component_name, message, context);
  }

  static void errorWithContext(const std::string &message,
                               const LogContext &context = {}) {
    getLogger().error(component_name, message, context);
  }

  static constexpr const char *getComponentName() { return component_name; }

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
  static std::string format_message(const std::string &format, Args &&...args) {
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

using EngineLogger = ComponentLogger<class TransferEngine>;
using ConfigLogger = ComponentLogger<class ConfigManager>;
using UriLogger = ComponentLogger<class ToolUriBuilder>;
using ClassifierLogger = ComponentLogger<class ArchiveClassifier>;
using ProcessLogger = ComponentLogger<class ProcessRunner>;
using ToolLogger = ComponentLogger<class ToolTransfer>;
using ExportLogger = ComponentLogger<class NativeExporter>;
using ImportLogger = ComponentLogger<class NativeImporter>;
using EmitterLogger = ComponentLogger<class ProgressEmitter>;
using CancelLogger = ComponentLogger<class CancellationRegistry>;
using DriverLogger = ComponentLogger<class MongoDatabase>;
using CliLogger = ComponentLogger<class CommandLine>;

} // namespace xfer

#define ENGINE_LOG_DEBUG(message, ...)                                         \
  xfer::EngineLogger::debug(message, ##__VA_ARGS__)
#define ENGINE_LOG_INFO(message, ...)                                          \
  xfer::EngineLogger::info(message, ##__VA_ARGS__)
#define ENGINE_LOG_WARN(message, ...)                                          \
  xfer::EngineLogger::warn(message, ##__VA_ARGS__)
#define ENGINE_LOG_ERROR(message, ...)                                         \
  xfer::EngineLogger::error(message, ##__VA_ARGS__)

#define ENGINE_LOG_INFO_JOB(message, jobId, ...)                               \
  xfer::EngineLogger::infoJob(message, jobId, ##__VA_ARGS__)
#define ENGINE_LOG_WARN_JOB(message, jobId, ...)                               \
  xfer::EngineLogger::warnJob(message, jobId, ##__VA_ARGS__)
#define ENGINE_LOG_ERROR_JOB(message, jobId, ...)                              \
  xfer::EngineLogger::errorJob(message, jobId, ##__VA_ARGS__)

#define CONFIG_LOG_DEBUG(message, ...)                                         \
  xfer::ConfigLogger::debug(message, ##__VA_ARGS__)
#define CONFIG_LOG_INFO(message, ...)                                          \
  xfer::ConfigLogger::info(message, ##__VA_ARGS__)
#define CONFIG_LOG_WARN(message, ...)                                          \
  xfer::ConfigLogger::warn(message, ##__VA_ARGS__)
#define CONFIG_LOG_ERROR(message, ...)                                         \
  xfer::ConfigLogger::error(message, ##__VA_ARGS__)

#define TOOL_LOG_DEBUG(message, ...)                                           \
  xfer::ToolLogger::debug(message, ##__VA_ARGS__)
#define TOOL_LOG_INFO(message, ...)                                            \
  xfer::ToolLogger::info(message, ##__VA_ARGS__)
#define TOOL_LOG_WARN(message, ...)                                            \
  xfer::ToolLogger::warn(message, ##__VA_ARGS__)
#define TOOL_LOG_ERROR(message, ...)                                           \
  xfer::ToolLogger::error(message, ##__VA_ARGS__)

#define TOOL_LOG_INFO_JOB(message, jobId, ...)                                 \
  xfer::ToolLogger::infoJob(message, jobId, ##__VA_ARGS__)
#define TOOL_LOG_WARN_JOB(message, jobId, ...)                                 \
  xfer::ToolLogger::warnJob(message, jobId, ##__VA_ARGS__)
#define TOOL_LOG_ERROR_JOB(message, jobId, ...)                                \
  xfer::ToolLogger::errorJob(message, jobId, ##__VA_ARGS__)

#define PROC_LOG_DEBUG(message, ...)                                           \
  xfer::ProcessLogger::debug(message, ##__VA_ARGS__)
#define PROC_LOG_WARN(message, ...)                                            \
  xfer::ProcessLogger::warn(message, ##__VA_ARGS__)
#define PROC_LOG_ERROR(message, ...)                                           \
  xfer::ProcessLogger::error(message, ##__VA_ARGS__)

#define EXPORT_LOG_DEBUG(message, ...)                                         \
  xfer::ExportLogger::debug(message, ##__VA_ARGS__)
#define EXPORT_LOG_INFO(message, ...)                                          \
  xfer::ExportLogger::info(message, ##__VA_ARGS__)
#define EXPORT_LOG_WARN(message, ...)                                          \
  xfer::ExportLogger::warn(message, ##__VA_ARGS__)
#define EXPORT_LOG_ERROR(message, ...)                                         \
  xfer::ExportLogger::error(message, ##__VA_ARGS__)

#define EXPORT_LOG_INFO_JOB(message, jobId, ...)                               \
  xfer::ExportLogger::infoJob(message, jobId, ##__VA_ARGS__)
#define EXPORT_LOG_WARN_JOB(message, jobId, ...)                               \
  xfer::ExportLogger::warnJob(message, jobId, ##__VA_ARGS__)

#define IMPORT_LOG_DEBUG(message, ...)                                         \
  xfer::ImportLogger::debug(message, ##__VA_ARGS__)
#define IMPORT_LOG_INFO(message, ...)                                          \
  xfer::ImportLogger::info(message, ##__VA_ARGS__)
#define IMPORT_LOG_WARN(message, ...)                                          \
  xfer::ImportLogger::warn(message, ##__VA_ARGS__)

#define IMPORT_LOG_INFO_JOB(message, jobId, ...)                               \
  xfer::ImportLogger::infoJob(message, jobId, ##__VA_ARGS__)
#define IMPORT_LOG_WARN_JOB(message, jobId, ...)                               \
  xfer::ImportLogger::warnJob(message, jobId, ##__VA_ARGS__)
#define IMPORT_LOG_ERROR_JOB(message, jobId, ...)                              \
  xfer::ImportLogger::errorJob(message, jobId, ##__VA_ARGS__)

#define DRIVER_LOG_DEBUG(message, ...)                                         \
  xfer::DriverLogger::debug(message, ##__VA_ARGS__)
#define DRIVER_LOG_WARN(message, ...)                                          \
  xfer::DriverLogger::warn(message, ##__VA_ARGS__)
#define DRIVER_LOG_ERROR(message, ...)                                         \
  xfer::DriverLogger::error(message, ##__VA_ARGS__)
