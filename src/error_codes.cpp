#include "error_codes.hpp"

namespace xfer {

const std::unordered_map<ErrorCode, ErrorCodeInfo>& getErrorCodeInfo() {
    static const std::unordered_map<ErrorCode, ErrorCodeInfo> errorInfo = {
        // Validation errors
        {ErrorCode::INVALID_INPUT, {
            "Invalid request or selection",
            "Validation",
            true,
            true
        }},
        {ErrorCode::MISSING_FIELD, {
            "Required value is missing",
            "Validation",
            true,
            true
        }},
        {ErrorCode::INVALID_RANGE, {
            "Value is outside acceptable range",
            "Validation",
            true,
            true
        }},

        // Environment errors
        {ErrorCode::TOOL_NOT_FOUND, {
            "External database tool not found",
            "Environment",
            true, // user installs the tools
            true
        }},
        {ErrorCode::TOOL_UNUSABLE, {
            "External database tool could not be started",
            "Environment",
            true,
            true
        }},

        // System errors
        {ErrorCode::DATABASE_ERROR, {
            "Database driver operation failed",
            "System",
            false,
            true
        }},
        {ErrorCode::FILE_ERROR, {
            "Filesystem operation failed",
            "System",
            false,
            true
        }},
        {ErrorCode::ARCHIVE_ERROR, {
            "Archive container is malformed or unwritable",
            "System",
            false,
            true
        }},
        {ErrorCode::CONFIGURATION_ERROR, {
            "Configuration error",
            "System",
            true,
            true
        }},
        {ErrorCode::PROCESS_ERROR, {
            "Subprocess management failed",
            "System",
            false,
            true
        }},
        {ErrorCode::INTERNAL_ERROR, {
            "Internal error",
            "System",
            false,
            true
        }},

        // Transfer errors
        {ErrorCode::OPERATION_CANCELLED, {
            "Operation cancelled",
            "Transfer",
            false,
            true
        }},
        {ErrorCode::TOOL_FAILED, {
            "External tool exited with an error",
            "Transfer",
            false,
            true
        }},
        {ErrorCode::DOCUMENT_DECODE_FAILED, {
            "Document could not be decoded or serialized",
            "Transfer",
            false,
            false // counted, never aborts
        }},
        {ErrorCode::PARTIAL_FAILURE, {
            "Some entries of the batch failed",
            "Transfer",
            false,
            false
        }}
    };

    return errorInfo;
}

const char* getErrorCodeDescription(ErrorCode code) {
    const auto& info = getErrorCodeInfo();
    auto it = info.find(code);
    if (it != info.end()) {
        return it->second.description.c_str();
    }
    return "Unknown error";
}

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_INPUT: return "INVALID_INPUT";
        case ErrorCode::MISSING_FIELD: return "MISSING_FIELD";
        case ErrorCode::INVALID_RANGE: return "INVALID_RANGE";
        case ErrorCode::TOOL_NOT_FOUND: return "TOOL_NOT_FOUND";
        case ErrorCode::TOOL_UNUSABLE: return "TOOL_UNUSABLE";
        case ErrorCode::DATABASE_ERROR: return "DATABASE_ERROR";
        case ErrorCode::FILE_ERROR: return "FILE_ERROR";
        case ErrorCode::ARCHIVE_ERROR: return "ARCHIVE_ERROR";
        case ErrorCode::CONFIGURATION_ERROR: return "CONFIGURATION_ERROR";
        case ErrorCode::PROCESS_ERROR: return "PROCESS_ERROR";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case ErrorCode::OPERATION_CANCELLED: return "OPERATION_CANCELLED";
        case ErrorCode::TOOL_FAILED: return "TOOL_FAILED";
        case ErrorCode::DOCUMENT_DECODE_FAILED: return "DOCUMENT_DECODE_FAILED";
        case ErrorCode::PARTIAL_FAILURE: return "PARTIAL_FAILURE";
    }
    return "UNKNOWN";
}

} // namespace xfer
