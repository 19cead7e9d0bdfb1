#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace xfer {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    bool wantAsync = false;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        wantAsync = config.asyncLogging;
        config_ = config;
        config_.asyncLogging = asyncStarted_.load();

        std::lock_guard<std::mutex> fileLock(fileMutex_);
        if (fileStream_.is_open()) {
            fileStream_.close();
        }
        currentLogFile_ = config_.logFile;
        if (config_.fileOutput) {
            openLogFile();
        }
    }

    if (wantAsync) {
        startAsyncWorker();
    } else {
        stopAsyncWorker();
    }
}

// Caller holds configMutex_ and fileMutex_
void Logger::openLogFile() {
    std::filesystem::path logPath(currentLogFile_);
    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    fileStream_.open(currentLogFile_, std::ios::app);
    if (!fileStream_.is_open()) {
        std::cerr << "Failed to open log file: " << currentLogFile_ << std::endl;
        config_.fileOutput = false;
        return;
    }

    auto size = std::filesystem::file_size(currentLogFile_, ec);
    currentFileSize_ = ec ? 0 : static_cast<size_t>(size);
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.level = level;
}

LogConfig Logger::getConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

void Logger::startAsyncWorker() {
    bool expected = false;
    if (!asyncStarted_.compare_exchange_strong(expected, true)) {
        return;
    }
    stopAsync_ = false;
    asyncThread_ = std::thread(&Logger::asyncWorker, this);
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.asyncLogging = true;
}

void Logger::stopAsyncWorker() {
    if (!asyncStarted_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_.asyncLogging = false;
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

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const LogContext& context) {
    if (!shouldLog(level, component)) {
        return;
    }

    metrics_.totalMessages++;
    if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
        metrics_.errorCount++;
    } else if (level == LogLevel::WARN) {
        metrics_.warningCount++;
    }

    writeLog(formatMessage(level, component, message, context));
}

void Logger::debug(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string& component, const std::string& message,
                  const LogContext& context) {
    log(LogLevel::INFO, component, message, context);
}

void Logger::warn(const std::string& component, const std::string& message,
                  const LogContext& context) {
    log(LogLevel::WARN, component, message, context);
}

void Logger::error(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::ERROR, component, message, context);
}

void Logger::fatal(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::FATAL, component, message, context);
}

void Logger::logForJob(LogLevel level, const std::string& component,
                       const std::string& message, const std::string& jobId,
                       const LogContext& context) {
    LogContext jobContext = context;
    jobContext["job_id"] = jobId;
    log(level, component, message, jobContext);
}

void Logger::debugForJob(const std::string& component, const std::string& message,
                         const std::string& jobId, const LogContext& context) {
    logForJob(LogLevel::DEBUG, component, message, jobId, context);
}

void Logger::infoForJob(const std::string& component, const std::string& message,
                        const std::string& jobId, const LogContext& context) {
    logForJob(LogLevel::INFO, component, message, jobId, context);
}

void Logger::warnForJob(const std::string& component, const std::string& message,
                        const std::string& jobId, const LogContext& context) {
    logForJob(LogLevel::WARN, component, message, jobId, context);
}

void Logger::errorForJob(const std::string& component, const std::string& message,
                         const std::string& jobId, const LogContext& context) {
    logForJob(LogLevel::ERROR, component, message, jobId, context);
}

void Logger::fatalForJob(const std::string& component, const std::string& message,
                         const std::string& jobId, const LogContext& context) {
    logForJob(LogLevel::FATAL, component, message, jobId, context);
}

LogMetrics Logger::getMetrics() const {
    return metrics_;
}

void Logger::flush() {
    if (asyncStarted_) {
        std::unique_lock<std::mutex> lock(asyncMutex_);
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

LogLevel Logger::parseLevel(const std::string& levelStr) {
    auto level = string_utils::to_lower(levelStr);
    if (level == "debug") return LogLevel::DEBUG;
    if (level == "warn" || level == "warning") return LogLevel::WARN;
    if (level == "error") return LogLevel::ERROR;
    if (level == "fatal") return LogLevel::FATAL;
    return LogLevel::INFO;
}

std::string Logger::formatTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string Logger::formatMessage(LogLevel level, const std::string& component,
                                  const std::string& message,
                                  const LogContext& context) {
    LogFormat format;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        format = config_.format;
    }
    return format == LogFormat::JSON
        ? formatJsonMessage(level, component, message, context)
        : formatTextMessage(level, component, message, context);
}

std::string Logger::formatTextMessage(LogLevel level, const std::string& component,
                                      const std::string& message,
                                      const LogContext& context) {
    std::ostringstream oss;
    oss << "[" << formatTimestamp() << "] "
        << "[" << levelToString(level) << "] "
        << "[" << component << "] "
        << message;

    if (!context.empty()) {
        oss << " |";
        for (const auto& [key, value] : context) {
            oss << " " << key << "=" << value;
        }
    }

    return oss.str();
}

std::string Logger::formatJsonMessage(LogLevel level, const std::string& component,
                                      const std::string& message,
                                      const LogContext& context) {
    nlohmann::json j;
    j["timestamp"] = formatTimestamp();
    j["level"] = std::string(string_utils::trim(levelToString(level)));
    j["component"] = component;
    j["message"] = message;
    if (!context.empty()) {
        auto& ctx = j["context"];
        for (const auto& [key, value] : context) {
            ctx[key] = value;
        }
    }
    // Tool output can carry arbitrary bytes
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::writeLog(const std::string& formattedMessage) {
    if (asyncStarted_) {
        writeLogAsync(formattedMessage);
    } else {
        writeLogSync(formattedMessage);
    }
}

void Logger::writeLogSync(const std::string& formattedMessage) {
    bool console = false;
    bool file = false;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        console = config_.consoleOutput;
        file = config_.fileOutput;
    }

    if (console) {
        std::cout << formattedMessage << std::endl;
    }

    if (file) {
        std::lock_guard<std::mutex> lock(fileMutex_);
        if (fileStream_.is_open()) {
            if (config_.enableRotation &&
                currentFileSize_ + formattedMessage.length() > config_.maxFileSize) {
                rotateLogFile();
            }

            fileStream_ << formattedMessage << std::endl;
            currentFileSize_ += formattedMessage.length() + 1;
        }
    }
}

void Logger::writeLogAsync(const std::string& formattedMessage) {
    std::lock_guard<std::mutex> lock(asyncMutex_);

    if (messageQueue_.size() >= config_.maxQueueSize) {
        metrics_.droppedMessages++;
        return;
    }

    messageQueue_.push(formattedMessage);
    asyncCondition_.notify_one();
}

void Logger::asyncWorker() {
    std::unique_lock<std::mutex> lock(asyncMutex_);
    while (!stopAsync_) {
        asyncCondition_.wait(lock, [this] {
            return !messageQueue_.empty() || stopAsync_;
        });

        while (!messageQueue_.empty()) {
            std::string message = std::move(messageQueue_.front());
            messageQueue_.pop();
            lock.unlock();

            writeLogSync(message);

            lock.lock();
        }
    }

    // Drain what is left on shutdown
    while (!messageQueue_.empty()) {
        std::string message = std::move(messageQueue_.front());
        messageQueue_.pop();
        lock.unlock();
        writeLogSync(message);
        lock.lock();
    }
}

// Caller holds fileMutex_
void Logger::rotateLogFile() {
    fileStream_.close();

    std::error_code ec;
    for (int i = config_.maxBackupFiles - 1; i > 0; i--) {
        std::string oldFile = currentLogFile_ + "." + std::to_string(i);
        std::string newFile = currentLogFile_ + "." + std::to_string(i + 1);

        if (std::filesystem::exists(oldFile, ec)) {
            if (i == config_.maxBackupFiles - 1) {
                std::filesystem::remove(newFile, ec); // Remove oldest
            }
            std::filesystem::rename(oldFile, newFile, ec);
        }
    }

    if (std::filesystem::exists(currentLogFile_, ec)) {
        std::filesystem::rename(currentLogFile_, currentLogFile_ + ".1", ec);
    }

    fileStream_.open(currentLogFile_, std::ios::out);
    currentFileSize_ = 0;

    if (!fileStream_.is_open()) {
        std::cerr << "Failed to create new log file after rotation: " << currentLogFile_ << std::endl;
    }
}

bool Logger::shouldLog(LogLevel level, const std::string& component) const {
    std::lock_guard<std::mutex> lock(configMutex_);
    if (level < config_.level) {
        return false;
    }

    if (!config_.componentFilter.empty() &&
        config_.componentFilter.find(component) == config_.componentFilter.end()) {
        return false;
    }

    return true;
}

} // namespace xfer
