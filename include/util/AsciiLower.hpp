#pragma once

#include <string>
#include <string_view>

namespace snapwatch::util {

[[nodiscard]] constexpr char ascii_lower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

[[nodiscard]] inline std::string ascii_lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = ascii_lower(static_cast<unsigned char>(c));
  return out;
}

} // namespace snapwatch::util
