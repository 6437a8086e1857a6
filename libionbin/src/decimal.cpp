//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/decimal.hpp"

namespace ionbin {

auto decimal::digits() const -> size_t {
  return coefficient.str().size();
}

auto decimal::is_zero() const -> bool {
  return coefficient.is_zero();
}

auto to_string(const decimal& x) -> std::string {
  auto digits = x.coefficient.str();
  auto result = std::string{x.negative ? "-" : ""};
  const auto length = static_cast<int64_t>(digits.size());
  // The adjusted exponent is the exponent of the most significant digit. The
  // computation happens on big integers since the exponent may be extreme.
  const integer adjusted = integer{x.exponent} + (length - 1);
  if (x.exponent <= 0 and adjusted >= -6) {
    if (x.exponent == 0) {
      return result + digits;
    }
    const auto point = length + x.exponent;
    if (point > 0) {
      const auto split = static_cast<size_t>(point);
      return fmt::format("{}{}.{}", result, digits.substr(0, split),
                         digits.substr(split));
    }
    return fmt::format("{}0.{}{}", result,
                       std::string(static_cast<size_t>(-point), '0'), digits);
  }
  result += digits[0];
  if (digits.size() > 1) {
    result += '.';
    result.append(digits, 1);
  }
  result += 'E';
  result += adjusted >= 0 ? "+" : "";
  result += adjusted.str();
  return result;
}

} // namespace ionbin
