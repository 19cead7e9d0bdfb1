#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace xfer {

inline constexpr const char *MASKED_PASSWORD = "***";

// Replaces the password of every "scheme://user:password@" occurrence with
// MASKED_PASSWORD. Username and host stay visible; text without a credential
// comes back unchanged. Masking masked text is a no-op.
std::string maskCredentials(std::string_view text);

// Masks each line and joins them with '\n'
std::string maskLines(const std::vector<std::string> &lines);

} // namespace xfer
