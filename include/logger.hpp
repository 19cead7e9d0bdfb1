#pragma once

#include "string_utils.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace xfer {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

enum class LogFormat { TEXT = 0, JSON = 1 };

using LogContext = std::unordered_map<std::string, std::string,
                                      TransparentStringHash, std::equal_to<>>;

struct LogConfig {
  LogLevel level = LogLevel::INFO;
  LogFormat format = LogFormat::TEXT;
  bool consoleOutput = true;
  bool fileOutput = false;
  bool asyncLogging = false;
  std::string logFile = "logs/mongoxfer.log";
  size_t maxFileSize = 10 * 1024 * 1024; // 10MB
  int maxBackupFiles = 5;
  bool enableRotation = true;
  std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>
      componentFilter; // Empty = all components
  size_t maxQueueSize = 10000;
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

  void configure(const LogConfig &config);
  void setLogLevel(LogLevel level);
  LogConfig getConfig() const;

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

  // Job-scoped variants attach the job id to the context
  void logForJob(LogLevel level, const std::string &component,
                 const std::string &message, const std::string &jobId,
                 const LogContext &context = {});
  void debugForJob(const std::string &component, const std::string &message,
                   const std::string &jobId, const LogContext &context = {});
  void infoForJob(const std::string &component, const std::string &message,
                  const std::string &jobId, const LogContext &context = {});
  void warnForJob(const std::string &component, const std::string &message,
                  const std::string &jobId, const LogContext &context = {});
  void errorForJob(const std::string &component, const std::string &message,
                   const std::string &jobId, const LogContext &context = {});
  void fatalForJob(const std::string &component, const std::string &message,
                   const std::string &jobId, const LogContext &context = {});

  LogMetrics getMetrics() const;

  void flush();
  void shutdown();

  static LogLevel parseLevel(const std::string &levelStr);

private:
  Logger() = default;
  ~Logger();

  LogConfig config_;
  mutable std::mutex configMutex_;

  std::ofstream fileStream_;
  std::string currentLogFile_;
  size_t currentFileSize_ = 0;
  mutable std::mutex fileMutex_;

  std::queue<std::string> messageQueue_;
  std::thread asyncThread_;
  std::condition_variable asyncCondition_;
  std::mutex asyncMutex_;
  std::atomic<bool> stopAsync_{false};
  std::atomic<bool> asyncStarted_{false};

  LogMetrics metrics_;

  std::string formatTimestamp();
  std::string levelToString(LogLevel level);
  std::string formatMessage(LogLevel level, const std::string &component,
                            const std::string &message,
                            const LogContext &context);
  std::string formatTextMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context);
  std::string formatJsonMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context);
  void openLogFile();
  void startAsyncWorker();
  void stopAsyncWorker();
  void writeLog(const std::string &formattedMessage);
  void writeLogSync(const std::string &formattedMessage);
  void writeLogAsync(const std::string &formattedMessage);
  void asyncWorker();
  void rotateLogFile();
  bool shouldLog(LogLevel level, const std::string &component) const;
};

} // namespace xfer

#include "component_logger.hpp"
