#include "uri_builder.hpp"
#include "credential_masker.hpp"
#include "logger.hpp"
#include "string_utils.hpp"
#include <algorithm>

namespace xfer {
namespace uri {

namespace {

// Offsets into a connection string: [authorityStart, pathSlash) is
// userinfo+hosts, pathSlash is npos when there is no path
struct UriLayout {
    size_t authorityStart = std::string_view::npos;
    size_t hostStart = std::string_view::npos;
    size_t pathSlash = std::string_view::npos;
    size_t queryMark = std::string_view::npos;
};

UriLayout layoutOf(std::string_view s) {
    UriLayout layout;
    auto schemeEnd = s.find("://");
    if (schemeEnd == std::string_view::npos) {
        return layout;
    }
    layout.authorityStart = schemeEnd + 3;
    layout.queryMark = s.find('?', layout.authorityStart);

    auto beforeQuery = s.substr(0, layout.queryMark);
    auto at = beforeQuery.rfind('@');
    layout.hostStart = (at == std::string_view::npos || at < layout.authorityStart)
                           ? layout.authorityStart
                           : at + 1;

    auto slash = s.find('/', layout.hostStart);
    if (slash != std::string_view::npos &&
        (layout.queryMark == std::string_view::npos || slash < layout.queryMark)) {
        layout.pathSlash = slash;
    }
    return layout;
}

std::vector<std::string> queryParts(std::string_view s) {
    auto q = s.find('?');
    if (q == std::string_view::npos || q + 1 >= s.size()) {
        return {};
    }
    return string_utils::split(s.substr(q + 1), '&');
}

} // namespace

std::string databaseSegment(std::string_view connectionString) {
    auto layout = layoutOf(connectionString);
    if (layout.pathSlash == std::string_view::npos) {
        return {};
    }
    auto end = layout.queryMark == std::string_view::npos ? connectionString.size()
                                                          : layout.queryMark;
    return std::string(connectionString.substr(layout.pathSlash + 1,
                                               end - layout.pathSlash - 1));
}

std::string stripDatabase(const std::string& connectionString) {
    auto layout = layoutOf(connectionString);
    std::string database = databaseSegment(connectionString);
    if (database.empty()) {
        return connectionString;
    }

    std::string base = connectionString.substr(0, layout.pathSlash + 1);
    std::string query;
    if (layout.queryMark != std::string::npos) {
        query = connectionString.substr(layout.queryMark + 1);
    }

    if (!queryParam(connectionString, "authSource")) {
        query = query.empty() ? "authSource=" + database
                              : "authSource=" + database + "&" + query;
    }

    return query.empty() ? base : base + "?" + query;
}

std::string username(std::string_view connectionString) {
    auto layout = layoutOf(connectionString);
    if (layout.authorityStart == std::string_view::npos ||
        layout.hostStart == layout.authorityStart) {
        return {};
    }
    auto userinfo = connectionString.substr(
        layout.authorityStart, layout.hostStart - 1 - layout.authorityStart);
    auto colon = userinfo.find(':');
    return string_utils::percent_decode(userinfo.substr(0, colon));
}

std::optional<std::string> queryParam(std::string_view connectionString,
                                      std::string_view name) {
    for (const auto& part : queryParts(connectionString)) {
        auto eq = part.find('=');
        std::string_view key = std::string_view(part).substr(0, eq);
        if (string_utils::iequals(key, name)) {
            return eq == std::string::npos ? std::string() : part.substr(eq + 1);
        }
    }
    return std::nullopt;
}

std::string appendQueryParam(const std::string& connectionString,
                             std::string_view name, std::string_view value) {
    std::string result = connectionString;
    if (result.find('?') == std::string::npos) {
        result += '?';
    } else if (result.back() != '?' && result.back() != '&') {
        result += '&';
    }
    result.append(name);
    result += '=';
    result.append(value);
    return result;
}

} // namespace uri

std::string preferredAuthMechanism(const std::vector<std::string>& mechanisms) {
    auto offered = [&mechanisms](const char* name) {
        return std::find(mechanisms.begin(), mechanisms.end(), name) != mechanisms.end();
    };
    if (offered("SCRAM-SHA-256")) {
        return "SCRAM-SHA-256";
    }
    if (offered("SCRAM-SHA-1")) {
        return "SCRAM-SHA-1";
    }
    return {};
}

ToolUriBuilder::ToolUriBuilder(AuthMechanismProbe* mechanisms,
                               std::chrono::milliseconds timeout)
    : mechanisms_(mechanisms), timeout_(timeout) {}

std::string ToolUriBuilder::build(const std::string& storedUri,
                                  const std::optional<std::string>& targetDatabase) const {
    std::string result = negotiateAuthMechanism(storedUri);
    if (targetDatabase && !targetDatabase->empty()) {
        result = uri::stripDatabase(result);
    }
    return result;
}

std::string ToolUriBuilder::negotiateAuthMechanism(const std::string& storedUri) const {
    std::string user = uri::username(storedUri);
    if (user.empty() || uri::queryParam(storedUri, "authMechanism") || !mechanisms_) {
        return storedUri;
    }

    std::string authDb = uri::queryParam(storedUri, "authSource").value_or("");
    if (authDb.empty()) {
        authDb = uri::databaseSegment(storedUri);
    }
    if (authDb.empty()) {
        authDb = "admin";
    }

    try {
        auto mechanism = preferredAuthMechanism(
            mechanisms_->saslSupportedMechanisms(authDb + "." + user, timeout_));
        if (mechanism.empty()) {
            UriLogger::debug("No SCRAM mechanism advertised for {}", user);
            return storedUri;
        }
        UriLogger::debug("Negotiated {} for {}", mechanism, user);
        return uri::appendQueryParam(storedUri, "authMechanism", mechanism);
    } catch (const std::exception& e) {
        UriLogger::warn("Auth mechanism lookup failed, using connection string as is: {}",
                        maskCredentials(e.what()));
        return storedUri;
    }
}

} // namespace xfer
