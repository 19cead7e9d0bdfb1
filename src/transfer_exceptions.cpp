#include "transfer_exceptions.hpp"
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>

namespace xfer {

std::string TransferException::generateCorrelationId() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

TransferException::TransferException(ErrorCode code, std::string message, ErrorContext context)
    : errorCode_(code), message_(std::move(message)), context_(std::move(context)),
      correlationId_(generateCorrelationId()), timestamp_(std::chrono::system_clock::now()) {
}

std::string TransferException::toLogString() const {
    std::stringstream ss;
    ss << "[" << correlationId_ << "] "
       << "ErrorCode=" << errorCodeToString(errorCode_) << " "
       << "Message=\"" << message_ << "\"";

    if (!context_.empty()) {
        ss << " Context={";
        bool first = true;
        for (const auto& [key, value] : context_) {
            if (!first) ss << ", ";
            ss << key << "=\"" << value << "\"";
            first = false;
        }
        ss << "}";
    }

    return ss.str();
}

std::string TransferException::toJsonString() const {
    nlohmann::json j;
    j["correlationId"] = correlationId_;
    j["errorCode"] = static_cast<int>(errorCode_);
    j["error"] = errorCodeToString(errorCode_);
    j["message"] = message_;
    j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp_.time_since_epoch()).count();
    if (!context_.empty()) {
        j["context"] = context_;
    }
    return j.dump();
}

void TransferException::addContext(const std::string& key, const std::string& value) {
    context_[key] = value;
}

void TransferException::setCorrelationId(const std::string& correlationId) {
    correlationId_ = correlationId;
}

// ValidationException
ValidationException::ValidationException(ErrorCode code, std::string message,
                                         std::string field, std::string value,
                                         ErrorContext context)
    : TransferException(code, std::move(message), std::move(context)),
      field_(std::move(field)), value_(std::move(value)) {
    if (!field_.empty()) {
        addContext("field", field_);
    }
    if (!value_.empty()) {
        addContext("value", value_);
    }
}

std::string ValidationException::toLogString() const {
    std::stringstream ss;
    ss << "[VALIDATION] " << TransferException::toLogString();
    if (!field_.empty()) {
        ss << " Field=\"" << field_ << "\"";
    }
    return ss.str();
}

// EnvironmentException
EnvironmentException::EnvironmentException(ErrorCode code, std::string message,
                                           std::string tool, ErrorContext context)
    : TransferException(code, std::move(message), std::move(context)),
      tool_(std::move(tool)) {
    addContext("tool", tool_);
}

std::string EnvironmentException::toLogString() const {
    return "[ENVIRONMENT] " + TransferException::toLogString();
}

// SystemException
SystemException::SystemException(ErrorCode code, std::string message,
                                 std::string component, ErrorContext context)
    : TransferException(code, std::move(message), std::move(context)),
      component_(std::move(component)) {
    if (!component_.empty()) {
        addContext("component", component_);
    }
}

std::string SystemException::toLogString() const {
    std::stringstream ss;
    ss << "[SYSTEM] " << TransferException::toLogString();
    if (!component_.empty()) {
        ss << " Component=\"" << component_ << "\"";
    }
    return ss.str();
}

// ToolException
ToolException::ToolException(std::string message, std::string tool, int exitCode,
                             ErrorContext context)
    : TransferException(ErrorCode::TOOL_FAILED, std::move(message), std::move(context)),
      tool_(std::move(tool)), exitCode_(exitCode) {
    addContext("tool", tool_);
    addContext("exitCode", std::to_string(exitCode_));
}

std::string ToolException::toLogString() const {
    return "[TOOL] " + TransferException::toLogString();
}

// CancelledException
CancelledException::CancelledException(std::string jobId, ErrorContext context)
    : TransferException(ErrorCode::OPERATION_CANCELLED, "operation cancelled",
                        std::move(context)),
      jobId_(std::move(jobId)) {
    if (!jobId_.empty()) {
        addContext("jobId", jobId_);
    }
}

ValidationException createValidationError(const std::string& field,
                                          const std::string& value,
                                          const std::string& reason) {
    ErrorContext context;
    context["reason"] = reason;
    return ValidationException(ErrorCode::INVALID_INPUT,
                               "Validation failed: " + reason,
                               field, value, context);
}

SystemException createSystemError(ErrorCode code,
                                  const std::string& component,
                                  const std::string& details) {
    ErrorContext context;
    context["details"] = details;
    return SystemException(code, std::string(getErrorCodeDescription(code)) + ": " + details,
                           component, context);
}

EnvironmentException createToolNotFoundError(const std::string& tool) {
    return EnvironmentException(
        ErrorCode::TOOL_NOT_FOUND,
        tool + " not found. Install MongoDB Database Tools: " + TOOL_DOWNLOAD_URL,
        tool, {{"installSource", TOOL_DOWNLOAD_URL}});
}

bool isValidationError(const std::exception& ex) {
    return dynamic_cast<const ValidationException*>(&ex) != nullptr;
}

bool isEnvironmentError(const std::exception& ex) {
    return dynamic_cast<const EnvironmentException*>(&ex) != nullptr;
}

bool isSystemError(const std::exception& ex) {
    return dynamic_cast<const SystemException*>(&ex) != nullptr;
}

bool isToolError(const std::exception& ex) {
    return dynamic_cast<const ToolException*>(&ex) != nullptr;
}

bool isCancellation(const std::exception& ex) {
    return dynamic_cast<const CancelledException*>(&ex) != nullptr;
}

} // namespace xfer
