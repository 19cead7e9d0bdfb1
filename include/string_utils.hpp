#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace xfer {

// Transparent hasher so string-keyed maps accept string_view lookups
struct TransparentStringHash {
  using is_transparent = void;

  template <typename StringType>
  std::size_t operator()(const StringType &str) const {
    return std::hash<std::string_view>{}(str);
  }
};

namespace string_utils {

std::string_view trim_left(std::string_view str) noexcept;
std::string_view trim_right(std::string_view str) noexcept;
std::string_view trim(std::string_view str) noexcept;

/**
 * Case-insensitive comparison helpers. Connection-string option names are
 * case-insensitive, so these back every query parameter lookup.
 */
bool iequals(std::string_view lhs, std::string_view rhs) noexcept;
bool iends_with(std::string_view str, std::string_view suffix) noexcept;

std::vector<std::string> split(std::string_view str, char delimiter);

template <typename Container>
std::string join(const Container &container, std::string_view separator) {
  std::string result;
  bool first = true;
  for (const auto &item : container) {
    if (!first) {
      result.append(separator);
    }
    result.append(item);
    first = false;
  }
  return result;
}

std::string to_lower(std::string_view str);

// Percent-decoding for URI userinfo; '+' is left alone
std::string percent_decode(std::string_view str);

} // namespace string_utils
} // namespace xfer
