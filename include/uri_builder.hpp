#pragma once

#include "config_manager.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xfer {

namespace uri {

// Removes a path-style database segment. When one was removed and the query
// has no authSource, the segment becomes "authSource=<db>" (prepended).
// Stripping an already stripped string returns it unchanged.
std::string stripDatabase(const std::string &connectionString);

// Path-style database segment, empty when there is none
std::string databaseSegment(std::string_view connectionString);

// Percent-decoded username from the userinfo, empty when absent
std::string username(std::string_view connectionString);

// Case-insensitive query parameter lookup
std::optional<std::string> queryParam(std::string_view connectionString,
                                      std::string_view name);

std::string appendQueryParam(const std::string &connectionString,
                             std::string_view name, std::string_view value);

} // namespace uri

// Driver-side lookup of the SASL mechanisms a user may authenticate with.
// Implementations throw on failure.
class AuthMechanismProbe {
public:
  virtual ~AuthMechanismProbe() = default;

  // userNamespace is "<authSource>.<username>"
  virtual std::vector<std::string>
  saslSupportedMechanisms(const std::string &userNamespace,
                          std::chrono::milliseconds timeout) = 0;
};

// SCRAM-SHA-256 over SCRAM-SHA-1; empty when neither is offered
std::string preferredAuthMechanism(const std::vector<std::string> &mechanisms);

/**
 * Derives a connection string for the external dump/restore tools.
 *
 * When credentials are present and no authMechanism is configured, the
 * mechanism lookup is asked for the user's mechanisms and the strongest one is appended.
 * A failed lookup leaves the string as it was. An explicit mechanism is never
 * touched. With a target database the path segment is stripped afterwards.
 */
class ToolUriBuilder {
public:
  ToolUriBuilder(AuthMechanismProbe *mechanisms, std::chrono::milliseconds timeout);

  std::string build(const std::string &storedUri,
                    const std::optional<std::string> &targetDatabase) const;

  std::string negotiateAuthMechanism(const std::string &storedUri) const;

private:
  AuthMechanismProbe *mechanisms_;
  std::chrono::milliseconds timeout_;
};

} // namespace xfer
