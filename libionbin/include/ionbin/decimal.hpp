//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/fwd.hpp"

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace ionbin {

/// An arbitrary-precision signed integer.
using integer = boost::multiprecision::cpp_int;

/// An arbitrary-precision decimal number `(-1)^negative * coefficient *
/// 10^exponent`. The representation is kept as encoded: `-0` and `0`, as well
/// as `1.0` and `1.00`, are different decimals.
struct decimal {
  bool negative = false;
  integer coefficient = 0;
  int64_t exponent = 0;

  /// @returns the number of decimal digits of the coefficient; 1 for zero.
  auto digits() const -> size_t;

  /// @returns whether the coefficient is zero, regardless of sign.
  auto is_zero() const -> bool;

  friend auto operator==(const decimal& lhs, const decimal& rhs) -> bool {
    return lhs.negative == rhs.negative and lhs.exponent == rhs.exponent
           and lhs.coefficient == rhs.coefficient;
  }
};

/// Renders a decimal in scientific notation per the General Decimal
/// Arithmetic specification, e.g., `-0`, `0.001`, `1.234E-17` or `0E+1`.
/// @relates decimal
auto to_string(const decimal& x) -> std::string;

} // namespace ionbin

template <>
struct fmt::formatter<ionbin::decimal> : fmt::formatter<std::string> {
  template <class FormatContext>
  auto format(const ionbin::decimal& x, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(to_string(x), ctx);
  }
};
