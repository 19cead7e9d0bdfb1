#pragma once

#include <functional> // Needed for std::hash
#include <string>
#include <type_traits>
#include <unordered_map>

namespace xfer {

// Error codes organized by category
enum class ErrorCode {
  // Validation errors (1000-1999)
  INVALID_INPUT = 1000,
  MISSING_FIELD = 1001,
  INVALID_RANGE = 1002,

  // Environment errors (2000-2999)
  TOOL_NOT_FOUND = 2000,
  TOOL_UNUSABLE = 2001,

  // System errors (3000-3999)
  DATABASE_ERROR = 3000,
  FILE_ERROR = 3001,
  ARCHIVE_ERROR = 3002,
  CONFIGURATION_ERROR = 3003,
  PROCESS_ERROR = 3004,
  INTERNAL_ERROR = 3005,

  // Transfer errors (4000-4999)
  OPERATION_CANCELLED = 4000,
  TOOL_FAILED = 4001,
  DOCUMENT_DECODE_FAILED = 4002,
  PARTIAL_FAILURE = 4003
};

// Error code metadata
struct ErrorCodeInfo {
  std::string description;
  std::string category;
  bool isUserActionable;
  bool abortsJob;
};

const std::unordered_map<ErrorCode, ErrorCodeInfo> &getErrorCodeInfo();

const char *getErrorCodeDescription(ErrorCode code);
std::string errorCodeToString(ErrorCode code);

} // namespace xfer

// Hash support for ErrorCode keys in unordered_map
namespace std {
template <> struct hash<xfer::ErrorCode> {
  size_t operator()(const xfer::ErrorCode code) const noexcept {
    using Underlying = std::underlying_type_t<xfer::ErrorCode>;
    return std::hash<Underlying>{}(static_cast<Underlying>(code));
  }
};
} // namespace std
