//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/fwd.hpp"

#include "ionbin/decimal.hpp"

#include <caf/error.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string>

namespace ionbin {

/// The most precise field that a timestamp carries.
enum class timestamp_precision : uint8_t {
  year,
  month,
  day,
  minute,
  second,
};

/// @relates timestamp_precision
auto to_string(timestamp_precision x) -> const char*;

/// Calendar and clock fields of a point in time.
struct timestamp_fields {
  int32_t year = 1;
  uint32_t month = 1;
  uint32_t day = 1;
  uint32_t hour = 0;
  uint32_t minute = 0;
  uint32_t second = 0;

  friend auto operator==(const timestamp_fields&, const timestamp_fields&)
    -> bool
    = default;
};

/// A point in time as encoded on the wire: the fields are in UTC, and the
/// offset describes the local time zone of the writer.
struct timestamp {
  /// The most precise field present in the encoding. Less precise fields
  /// keep their defaults.
  timestamp_precision precision = timestamp_precision::year;

  /// The UTC fields.
  timestamp_fields utc = {};

  /// The local offset in minutes east of UTC; absent if unknown.
  std::optional<int32_t> offset = {};

  /// Fractional seconds in [0, 1); only present for second precision.
  std::optional<decimal> fraction = {};

  /// @returns the fields in the local time of the writer. An unknown offset
  /// is treated as UTC.
  auto local() const -> timestamp_fields;

  /// Checks that all present fields are within their calendar ranges.
  auto validate() const -> caf::error;

  friend auto operator==(const timestamp& lhs, const timestamp& rhs) -> bool
    = default;
};

/// Renders a timestamp in local time with the precision it was encoded with,
/// e.g., `2016T`, `2016-02-01` or `2016-02-01T23:00:30.001-01:00`.
/// @relates timestamp
auto to_string(const timestamp& x) -> std::string;

} // namespace ionbin

template <>
struct fmt::formatter<ionbin::timestamp> : fmt::formatter<std::string> {
  template <class FormatContext>
  auto format(const ionbin::timestamp& x, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(to_string(x), ctx);
  }
};
