#ifndef BENCHLAB_CORE_NUMBER_FORMAT_HPP_
#define BENCHLAB_CORE_NUMBER_FORMAT_HPP_

#include <array>
#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

namespace benchlab::core {

// Shortest decimal text that parses back to exactly `value`: 3.0 -> "3",
// 0.1 -> "0.1". Non-finite values are spelled out.
inline std::string FormatShortestDouble(double value) {
  if (std::isnan(value)) {
    return "NaN";
  }
  if (std::isinf(value)) {
    return value > 0.0 ? "Infinity" : "-Infinity";
  }

  std::array<char, 64> buffer{};
  const auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  if (result.ec != std::errc()) {
    return std::to_string(value);
  }
  return std::string(buffer.data(), result.ptr);
}

} // namespace benchlab::core

#endif // BENCHLAB_CORE_NUMBER_FORMAT_HPP_
