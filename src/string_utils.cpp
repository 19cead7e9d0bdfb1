#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace xfer {
namespace string_utils {

std::string_view trim_left(std::string_view str) noexcept {
  auto start = str.find_first_not_of(" \t\n\r\f\v");
  return start == std::string_view::npos ? std::string_view{}
                                         : str.substr(start);
}

std::string_view trim_right(std::string_view str) noexcept {
  auto end = str.find_last_not_of(" \t\n\r\f\v");
  return end == std::string_view::npos ? std::string_view{}
                                       : str.substr(0, end + 1);
}

std::string_view trim(std::string_view str) noexcept {
  return trim_left(trim_right(str));
}

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  return std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
  });
}

bool iends_with(std::string_view str, std::string_view suffix) noexcept {
  return str.size() >= suffix.size() &&
         iequals(str.substr(str.size() - suffix.size()), suffix);
}

std::vector<std::string> split(std::string_view str, char delimiter) {
  std::vector<std::string> result;
  std::size_t start = 0;
  std::size_t pos = 0;

  while ((pos = str.find(delimiter, start)) != std::string_view::npos) {
    result.emplace_back(str.substr(start, pos - start));
    start = pos + 1;
  }
  result.emplace_back(str.substr(start));

  return result;
}

std::string to_lower(std::string_view str) {
  std::string result(str);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

std::string percent_decode(std::string_view str) {
  std::string decoded;
  decoded.reserve(str.size());

  for (std::size_t i = 0; i < str.size(); ++i) {
    if (str[i] == '%' && i + 2 < str.size()) {
      char hex_str[3] = {str[i + 1], str[i + 2], '\0'};
      char *end_ptr;
      long value = std::strtol(hex_str, &end_ptr, 16);

      if (end_ptr == hex_str + 2) {
        decoded.push_back(static_cast<char>(value));
        i += 2;
      } else {
        decoded.push_back(str[i]); // Invalid encoding, keep as-is
      }
    } else {
      decoded.push_back(str[i]);
    }
  }

  return decoded;
}

} // namespace string_utils
} // namespace xfer
