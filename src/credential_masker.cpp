#include "credential_masker.hpp"
#include <regex>

namespace xfer {

namespace {

// scheme://user:password@ where user holds no ':' and password holds no
// delimiter that could start the host, path or query
const std::regex &credentialPattern() {
    static const std::regex pattern(
        R"(([A-Za-z][A-Za-z0-9+.\-]*://)([^:/?#@\s]*):([^@/?#\s]*)@)");
    return pattern;
}

} // namespace

std::string maskCredentials(std::string_view text) {
    if (text.find("://") == std::string_view::npos) {
        return std::string(text);
    }
    return std::regex_replace(std::string(text), credentialPattern(),
                              std::string("$1$2:") + MASKED_PASSWORD + "@");
}

std::string maskLines(const std::vector<std::string>& lines) {
    std::string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            result += '\n';
        }
        result += maskCredentials(lines[i]);
    }
    return result;
}

} // namespace xfer
