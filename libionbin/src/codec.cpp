//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/codec.hpp"

#include "ionbin/error.hpp"

#include <arrow/util/utf8.h>

#include <bit>
#include <limits>
#include <string_view>

namespace ionbin {

namespace {

constexpr auto var_value_mask = uint8_t{0b0111'1111};
constexpr auto var_value_bits = 7;
constexpr auto var_end_flag = uint8_t{0b1000'0000};
constexpr auto var_sign_flag = uint8_t{0b0100'0000};
constexpr auto var_sign_value_mask = uint8_t{0b0011'1111};
constexpr auto int_sign_flag = uint8_t{0b1000'0000};
constexpr auto int_sign_value_mask = uint8_t{0b0111'1111};

constexpr auto max_shiftable
  = std::numeric_limits<uint64_t>::max() >> var_value_bits;

auto octet(std::byte x) -> uint8_t {
  return std::to_integer<uint8_t>(x);
}

/// Shifts the next seven payload bits of a variable-length field into
/// *value*, failing if the result would not fit.
auto accumulate(uint64_t& value, uint8_t x) -> caf::error {
  if (value > max_shiftable) {
    return make_malformed_error("variable-length integer exceeds 64 bits");
  }
  value = (value << var_value_bits) | (x & var_value_mask);
  return {};
}

template <class T>
auto load_big_endian(std::span<const std::byte> bytes) -> T {
  auto result = T{0};
  for (auto x : bytes) {
    result = static_cast<T>((result << 8) | octet(x));
  }
  return result;
}

/// Reads a VarUInt field of a timestamp and checks its upper bound.
auto read_timestamp_field(std::span<const std::byte>& bytes,
                          std::string_view name, uint64_t max)
  -> caf::expected<uint32_t> {
  auto value = read_var_uint(bytes);
  if (not value) {
    return add_context(value.error(), "failed to read timestamp {}", name);
  }
  if (*value > max) {
    return make_malformed_error("timestamp {} {} is out of range", name,
                                *value);
  }
  return static_cast<uint32_t>(*value);
}

} // namespace

auto read_var_uint(std::span<const std::byte>& bytes)
  -> caf::expected<uint64_t> {
  auto value = uint64_t{0};
  for (size_t i = 0; i < bytes.size(); ++i) {
    const auto x = octet(bytes[i]);
    if (auto err = accumulate(value, x)) {
      return err;
    }
    if ((x & var_end_flag) != 0) {
      bytes = bytes.subspan(i + 1);
      return value;
    }
  }
  return make_malformed_error("unterminated VarUInt in a field of {} bytes",
                              bytes.size());
}

auto read_var_int(std::span<const std::byte>& bytes)
  -> caf::expected<signed_magnitude> {
  if (bytes.empty()) {
    return make_malformed_error("missing VarInt");
  }
  const auto first = octet(bytes[0]);
  auto result = signed_magnitude{
    .negative = (first & var_sign_flag) != 0,
    .magnitude = static_cast<uint64_t>(first & var_sign_value_mask),
  };
  if ((first & var_end_flag) != 0) {
    bytes = bytes.subspan(1);
    return result;
  }
  for (size_t i = 1; i < bytes.size(); ++i) {
    const auto x = octet(bytes[i]);
    if (auto err = accumulate(result.magnitude, x)) {
      return err;
    }
    if ((x & var_end_flag) != 0) {
      bytes = bytes.subspan(i + 1);
      return result;
    }
  }
  return make_malformed_error("unterminated VarInt in a field of {} bytes",
                              bytes.size());
}

auto read_var_uint(const chunked_buffer& buffer)
  -> caf::expected<std::pair<uint64_t, chunked_buffer>> {
  auto value = uint64_t{0};
  auto rest = buffer;
  while (true) {
    auto next = rest.read_byte();
    if (not next) {
      return std::move(next.error());
    }
    const auto x = octet(next->first);
    if (auto err = accumulate(value, x)) {
      return err;
    }
    rest = std::move(next->second);
    if ((x & var_end_flag) != 0) {
      return std::pair{value, std::move(rest)};
    }
  }
}

auto decode_uint(std::span<const std::byte> bytes) -> integer {
  auto result = integer{0};
  for (auto x : bytes) {
    result <<= 8;
    result |= octet(x);
  }
  return result;
}

auto decode_int(std::span<const std::byte> bytes) -> std::pair<bool, integer> {
  if (bytes.empty()) {
    return {false, integer{0}};
  }
  const auto first = octet(bytes[0]);
  auto magnitude = integer{first & int_sign_value_mask};
  for (auto x : bytes.subspan(1)) {
    magnitude <<= 8;
    magnitude |= octet(x);
  }
  return {(first & int_sign_flag) != 0, std::move(magnitude)};
}

auto decode_float(std::span<const std::byte> bytes) -> caf::expected<double> {
  switch (bytes.size()) {
    case 0:
      return 0.0;
    case 4:
      return static_cast<double>(
        std::bit_cast<float>(load_big_endian<uint32_t>(bytes)));
    case 8:
      return std::bit_cast<double>(load_big_endian<uint64_t>(bytes));
    default:
      return make_malformed_error("invalid float length of {} bytes",
                                  bytes.size());
  }
}

auto decode_decimal(std::span<const std::byte> bytes)
  -> caf::expected<decimal> {
  if (bytes.empty()) {
    return decimal{};
  }
  auto rest = bytes;
  auto exponent = read_var_int(rest);
  if (not exponent) {
    return add_context(exponent.error(), "failed to read decimal exponent");
  }
  if (exponent->magnitude
      > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return make_malformed_error("decimal exponent exceeds 64 bits");
  }
  const auto magnitude = static_cast<int64_t>(exponent->magnitude);
  auto [negative, coefficient] = decode_int(rest);
  return decimal{
    .negative = negative,
    .coefficient = std::move(coefficient),
    .exponent = exponent->negative ? -magnitude : magnitude,
  };
}

auto decode_timestamp(std::span<const std::byte> bytes)
  -> caf::expected<timestamp> {
  auto rest = bytes;
  auto result = timestamp{};
  auto offset = read_var_int(rest);
  if (not offset) {
    return add_context(offset.error(), "failed to read timestamp offset");
  }
  if (offset->magnitude > static_cast<uint64_t>(
        std::numeric_limits<int32_t>::max())) {
    return make_malformed_error("timestamp offset {} is out of range",
                                offset->magnitude);
  }
  // Negative zero denotes an unknown offset.
  if (not(offset->negative and offset->magnitude == 0)) {
    const auto minutes = static_cast<int32_t>(offset->magnitude);
    result.offset = offset->negative ? -minutes : minutes;
  }
  auto finish = [&]() -> caf::expected<timestamp> {
    if (auto err = result.validate()) {
      return err;
    }
    return std::move(result);
  };
  auto year = read_timestamp_field(rest, "year", 9999);
  if (not year) {
    return std::move(year.error());
  }
  result.utc.year = static_cast<int32_t>(*year);
  if (rest.empty()) {
    return finish();
  }
  auto month = read_timestamp_field(rest, "month", 12);
  if (not month) {
    return std::move(month.error());
  }
  result.utc.month = *month;
  result.precision = timestamp_precision::month;
  if (rest.empty()) {
    return finish();
  }
  auto day = read_timestamp_field(rest, "day", 31);
  if (not day) {
    return std::move(day.error());
  }
  result.utc.day = *day;
  result.precision = timestamp_precision::day;
  if (rest.empty()) {
    return finish();
  }
  // Hour and minute only ever appear together.
  auto hour = read_timestamp_field(rest, "hour", 23);
  if (not hour) {
    return std::move(hour.error());
  }
  auto minute = read_timestamp_field(rest, "minute", 59);
  if (not minute) {
    return std::move(minute.error());
  }
  result.utc.hour = *hour;
  result.utc.minute = *minute;
  result.precision = timestamp_precision::minute;
  if (rest.empty()) {
    return finish();
  }
  auto second = read_timestamp_field(rest, "second", 59);
  if (not second) {
    return std::move(second.error());
  }
  result.utc.second = *second;
  result.precision = timestamp_precision::second;
  if (rest.empty()) {
    return finish();
  }
  auto fraction = decode_decimal(rest);
  if (not fraction) {
    return add_context(fraction.error(), "failed to read fractional seconds");
  }
  // A zero fraction with a non-negative exponent carries no precision.
  if (not(fraction->is_zero() and fraction->exponent > -1)) {
    result.fraction = std::move(*fraction);
  }
  return finish();
}

auto decode_string(std::span<const std::byte> bytes)
  -> caf::expected<std::string> {
  const auto* data = reinterpret_cast<const uint8_t*>(bytes.data());
  if (not arrow::util::ValidateUTF8(data, static_cast<int64_t>(bytes.size()))) {
    return make_malformed_error("string of {} bytes is not valid UTF-8",
                                bytes.size());
  }
  return std::string{reinterpret_cast<const char*>(bytes.data()),
                     bytes.size()};
}

auto decode_symbol(std::span<const std::byte> bytes)
  -> caf::expected<symbol_token> {
  const auto id = decode_uint(bytes);
  if (id > std::numeric_limits<uint64_t>::max()) {
    return make_malformed_error("symbol identifier {} exceeds 64 bits",
                                id.str());
  }
  return symbol_token{.id = id.convert_to<uint64_t>()};
}

auto decode_annotations(std::span<const std::byte> bytes)
  -> caf::expected<std::vector<symbol_token>> {
  auto result = std::vector<symbol_token>{};
  auto rest = bytes;
  while (not rest.empty()) {
    auto id = read_var_uint(rest);
    if (not id) {
      return add_context(id.error(), "failed to read annotation");
    }
    result.push_back(symbol_token{.id = *id});
  }
  return result;
}

} // namespace ionbin
