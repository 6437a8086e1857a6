//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/timestamp.hpp"

#include "ionbin/detail/assert.hpp"
#include "ionbin/error.hpp"

#include <chrono>
#include <cstdlib>

namespace ionbin {

namespace {

constexpr auto max_offset_minutes = int32_t{24 * 60};

auto render_offset(const std::optional<int32_t>& offset) -> std::string {
  if (not offset) {
    return "-00:00";
  }
  if (*offset == 0) {
    return "Z";
  }
  const auto magnitude = std::abs(*offset);
  return fmt::format("{}{:02}:{:02}", *offset < 0 ? '-' : '+',
                     magnitude / 60, magnitude % 60);
}

auto render_fraction(const std::optional<decimal>& fraction) -> std::string {
  if (not fraction or fraction->exponent >= 0) {
    return {};
  }
  auto digits = fraction->coefficient.str();
  const auto width = static_cast<size_t>(-fraction->exponent);
  if (digits.size() < width) {
    digits.insert(0, width - digits.size(), '0');
  }
  return fmt::format(".{}", digits);
}

} // namespace

auto to_string(timestamp_precision x) -> const char* {
  switch (x) {
    case timestamp_precision::year:
      return "year";
    case timestamp_precision::month:
      return "month";
    case timestamp_precision::day:
      return "day";
    case timestamp_precision::minute:
      return "minute";
    case timestamp_precision::second:
      return "second";
  }
  IONBIN_UNREACHABLE();
}

auto timestamp::local() const -> timestamp_fields {
  using namespace std::chrono;
  const auto date = sys_days{year{utc.year} / month{utc.month} / day{utc.day}};
  const auto point = date + hours{utc.hour} + minutes{utc.minute}
                     + minutes{offset.value_or(0)} + seconds{utc.second};
  const auto local_date = floor<days>(point);
  const auto ymd = year_month_day{local_date};
  const auto time = hh_mm_ss{point - local_date};
  return {
    .year = static_cast<int32_t>(static_cast<int>(ymd.year())),
    .month = static_cast<unsigned>(ymd.month()),
    .day = static_cast<unsigned>(ymd.day()),
    .hour = static_cast<uint32_t>(time.hours().count()),
    .minute = static_cast<uint32_t>(time.minutes().count()),
    .second = static_cast<uint32_t>(time.seconds().count()),
  };
}

auto timestamp::validate() const -> caf::error {
  using namespace std::chrono;
  if (utc.year < 1 or utc.year > 9999) {
    return make_malformed_error("timestamp year {} is out of range", utc.year);
  }
  if (utc.month < 1 or utc.month > 12) {
    return make_malformed_error("timestamp month {} is out of range",
                                utc.month);
  }
  const auto date = year{utc.year} / month{utc.month} / day{utc.day};
  if (not date.ok()) {
    return make_malformed_error("timestamp day {} is out of range for "
                                "{:04}-{:02}",
                                utc.day, utc.year, utc.month);
  }
  if (utc.hour > 23 or utc.minute > 59) {
    return make_malformed_error("timestamp time {}:{} is out of range",
                                utc.hour, utc.minute);
  }
  if (utc.second > 59) {
    return make_malformed_error("timestamp second {} is out of range",
                                utc.second);
  }
  if (offset and std::abs(*offset) >= max_offset_minutes) {
    return make_malformed_error("timestamp offset of {} minutes is out of "
                                "range",
                                *offset);
  }
  if (fraction and not fraction->is_zero()) {
    if (fraction->negative) {
      return make_malformed_error("negative fractional seconds {}",
                                  *fraction);
    }
    if (fraction->exponent >= 0
        or fraction->digits() > static_cast<size_t>(-fraction->exponent)) {
      return make_malformed_error("fractional seconds {} are not below 1",
                                  *fraction);
    }
  }
  return {};
}

auto to_string(const timestamp& x) -> std::string {
  const auto fields = x.local();
  switch (x.precision) {
    case timestamp_precision::year:
      return fmt::format("{:04}T", fields.year);
    case timestamp_precision::month:
      return fmt::format("{:04}-{:02}T", fields.year, fields.month);
    case timestamp_precision::day:
      return fmt::format("{:04}-{:02}-{:02}", fields.year, fields.month,
                         fields.day);
    case timestamp_precision::minute:
      return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}{}", fields.year,
                         fields.month, fields.day, fields.hour, fields.minute,
                         render_offset(x.offset));
    case timestamp_precision::second:
      return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}{}{}",
                         fields.year, fields.month, fields.day, fields.hour,
                         fields.minute, fields.second,
                         render_fraction(x.fraction), render_offset(x.offset));
  }
  IONBIN_UNREACHABLE();
}

} // namespace ionbin
