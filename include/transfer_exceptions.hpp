#pragma once

#include "error_codes.hpp"
#include <chrono>
#include <exception>
#include <string>
#include <unordered_map>

namespace xfer {

class TransferException;
class ValidationException;
class EnvironmentException;
class SystemException;
class ToolException;
class CancelledException;

// Error context for additional debugging information
using ErrorContext = std::unordered_map<std::string, std::string>;

// Where the external database tools can be obtained
inline constexpr const char *TOOL_DOWNLOAD_URL =
    "https://www.mongodb.com/try/download/database-tools";

// Base exception with error context and correlation ID support
class TransferException : public std::exception {
public:
  TransferException(ErrorCode code, std::string message,
                    ErrorContext context = {});

  TransferException(const TransferException &other) = default;
  TransferException &operator=(const TransferException &other) = default;
  TransferException(TransferException &&other) noexcept = default;
  TransferException &operator=(TransferException &&other) noexcept = default;

  virtual ~TransferException() = default;

  ErrorCode getCode() const { return errorCode_; }
  const std::string &getMessage() const { return message_; }
  const ErrorContext &getContext() const { return context_; }
  const std::string &getCorrelationId() const { return correlationId_; }
  std::chrono::system_clock::time_point getTimestamp() const {
    return timestamp_;
  }

  const char *what() const noexcept override { return message_.c_str(); }

  virtual std::string toLogString() const;
  std::string toJsonString() const;

  void addContext(const std::string &key, const std::string &value);
  void setCorrelationId(const std::string &correlationId);

protected:
  ErrorCode errorCode_;
  std::string message_;
  ErrorContext context_;
  std::string correlationId_;
  std::chrono::system_clock::time_point timestamp_;

  static std::string generateCorrelationId();
};

// Bad request: empty paths, malformed selections, invalid configuration values
class ValidationException : public TransferException {
public:
  ValidationException(ErrorCode code, std::string message,
                      std::string field = "", std::string value = "",
                      ErrorContext context = {});

  const std::string &getField() const { return field_; }
  const std::string &getValue() const { return value_; }

  std::string toLogString() const override;

private:
  std::string field_;
  std::string value_;
};

// A required external tool is missing. The message names the install source.
class EnvironmentException : public TransferException {
public:
  EnvironmentException(ErrorCode code, std::string message, std::string tool,
                       ErrorContext context = {});

  const std::string &getTool() const { return tool_; }

  std::string toLogString() const override;

private:
  std::string tool_;
};

// Filesystem, archive container or driver failure
class SystemException : public TransferException {
public:
  SystemException(ErrorCode code, std::string message,
                  std::string component = "", ErrorContext context = {});

  const std::string &getComponent() const { return component_; }

  std::string toLogString() const override;

private:
  std::string component_;
};

// Non-zero exit of an external tool. The diagnostics are already masked.
class ToolException : public TransferException {
public:
  ToolException(std::string message, std::string tool, int exitCode,
                ErrorContext context = {});

  const std::string &getTool() const { return tool_; }
  int getExitCode() const { return exitCode_; }

  std::string toLogString() const override;

private:
  std::string tool_;
  int exitCode_;
};

// Explicit cancellation. Partial output is gone by the time this is thrown.
class CancelledException : public TransferException {
public:
  explicit CancelledException(std::string jobId, ErrorContext context = {});

  const std::string &getJobId() const { return jobId_; }

private:
  std::string jobId_;
};

ValidationException createValidationError(const std::string &field,
                                          const std::string &value,
                                          const std::string &reason);

SystemException createSystemError(ErrorCode code, const std::string &component,
                                  const std::string &details);

EnvironmentException createToolNotFoundError(const std::string &tool);

bool isValidationError(const std::exception &ex);
bool isEnvironmentError(const std::exception &ex);
bool isSystemError(const std::exception &ex);
bool isToolError(const std::exception &ex);
bool isCancellation(const std::exception &ex);

template <typename ExceptionType>
const ExceptionType *asException(const std::exception &ex) {
  return dynamic_cast<const ExceptionType *>(&ex);
}

} // namespace xfer
