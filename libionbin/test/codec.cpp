//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause
#include "ionbin/codec.hpp"

#include "ionbin/error.hpp"
#include "ionbin/test/test.hpp"

#include <cmath>
#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <vector>

using namespace ionbin;
using namespace std::string_literals;

namespace {

auto octets(std::initializer_list<int> xs) -> std::vector<std::byte> {
  auto result = std::vector<std::byte>{};
  for (auto x : xs) {
    result.push_back(static_cast<std::byte>(x));
  }
  return result;
}

auto timestamp_of(std::initializer_list<int> xs) -> caf::expected<timestamp> {
  return decode_timestamp(octets(xs));
}

} // namespace

TEST("VarUInt") {
  auto xs = octets({0x81, 0x0F, 0xE0, 0x7F});
  auto bytes = std::span<const std::byte>{xs};
  CHECK_EQUAL(unbox(read_var_uint(bytes)), 1u);
  CHECK_EQUAL(unbox(read_var_uint(bytes)), 2016u);
  CHECK_EQUAL(bytes.size(), 1u);
  auto unterminated = read_var_uint(bytes);
  REQUIRE(not unterminated);
  CHECK_EQUAL(unterminated.error(), ec::malformed_input);
}

TEST("VarUInt wider than 64 bits") {
  auto max = octets({0x01, 0x7F, 0x7F, 0x7F, 0x7F, 0x7F, 0x7F, 0x7F, 0x7F,
                     0xFF});
  auto bytes = std::span<const std::byte>{max};
  CHECK_EQUAL(unbox(read_var_uint(bytes)),
              std::numeric_limits<uint64_t>::max());
  auto wide = octets({0x02, 0x7F, 0x7F, 0x7F, 0x7F, 0x7F, 0x7F, 0x7F, 0x7F,
                      0xFF});
  bytes = std::span<const std::byte>{wide};
  auto result = read_var_uint(bytes);
  REQUIRE(not result);
  CHECK_EQUAL(result.error(), ec::malformed_input);
}

TEST("VarUInt from a chunked buffer") {
  auto buffer = unbox(chunked_buffer::empty().extend(test::bytes({0x0F})));
  auto partial = read_var_uint(buffer);
  REQUIRE(not partial);
  CHECK_EQUAL(partial.error(), ec::incomplete);
  buffer = unbox(buffer.extend(test::bytes({0xE0, 0x21})));
  auto [value, rest] = unbox(read_var_uint(buffer));
  CHECK_EQUAL(value, 2016u);
  CHECK_EQUAL(rest.size(), 1u);
}

TEST("VarInt") {
  auto xs = octets({0xC1, 0x81, 0x80, 0xC0, 0x43, 0xA4});
  auto bytes = std::span<const std::byte>{xs};
  CHECK(unbox(read_var_int(bytes)) == (signed_magnitude{true, 1}));
  CHECK(unbox(read_var_int(bytes)) == (signed_magnitude{false, 1}));
  CHECK(unbox(read_var_int(bytes)) == (signed_magnitude{false, 0}));
  CHECK(unbox(read_var_int(bytes)) == (signed_magnitude{true, 0}));
  CHECK(unbox(read_var_int(bytes)) == (signed_magnitude{true, 420}));
  CHECK(bytes.empty());
  auto missing = read_var_int(bytes);
  REQUIRE(not missing);
  CHECK_EQUAL(missing.error(), ec::malformed_input);
}

TEST("UInt and Int") {
  CHECK_EQUAL(decode_uint(octets({})).str(), "0"s);
  CHECK_EQUAL(decode_uint(octets({0x01, 0x00})).str(), "256"s);
  CHECK_EQUAL(decode_uint(octets({0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
                                  0xFF, 0xFF}))
                .str(),
              "4722366482869645213695"s);
  auto [negative, magnitude] = decode_int(octets({0x80}));
  CHECK(negative);
  CHECK_EQUAL(magnitude.str(), "0"s);
  auto [positive, value] = decode_int(octets({0x04, 0xD2}));
  CHECK(not positive);
  CHECK_EQUAL(value.str(), "1234"s);
}

TEST("floats") {
  CHECK_EQUAL(unbox(decode_float(octets({}))), 0.0);
  CHECK_EQUAL(unbox(decode_float(octets({0x3F, 0x80, 0x00, 0x00}))), 1.0);
  CHECK_EQUAL(unbox(decode_float(octets({0xC0, 0x00, 0x00, 0x00}))), -2.0);
  CHECK(std::isinf(unbox(decode_float(octets({0x7F, 0x80, 0x00, 0x00})))));
  CHECK_EQUAL(unbox(decode_float(
                octets({0x42, 0x02, 0xA0, 0x5F, 0x20, 0x00, 0x00, 0x00}))),
              1e10);
  CHECK(std::isnan(unbox(decode_float(
    octets({0x7F, 0xF8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00})))));
  auto invalid = decode_float(octets({0x00, 0x00}));
  REQUIRE(not invalid);
  CHECK_EQUAL(invalid.error(), ec::malformed_input);
}

TEST("decimals") {
  auto check_decimal = [](std::initializer_list<int> xs, std::string str) {
    auto value = decode_decimal(octets(xs));
    REQUIRE(value.has_value());
    CHECK_EQUAL(to_string(*value), str);
  };
  check_decimal({}, "0");
  check_decimal({0x47, 0xE8}, "0E-1000");
  check_decimal({0x07, 0xE8, 0x00, 0x00}, "0E+1000");
  check_decimal({0x81, 0x01}, "1E+1");
  check_decimal({0xD4, 0x04, 0xD2}, "1.234E-17");
  check_decimal({0x80, 0x80}, "-0");
  check_decimal({0xC1, 0x01}, "0.1");
  check_decimal({0xC1}, "0.0");
  check_decimal({0x81}, "0E+1");
  check_decimal({0xC1, 0x80}, "-0.0");
  auto exponent = decode_decimal(octets({0x81}));
  REQUIRE(exponent.has_value());
  CHECK_EQUAL(exponent->exponent, 1);
  CHECK(exponent->is_zero());
  auto missing = decode_decimal(octets({0x01}));
  REQUIRE(not missing);
  CHECK_EQUAL(missing.error(), ec::malformed_input);
}

TEST("timestamps with year precision") {
  auto unknown = unbox(timestamp_of({0xC0, 0x0F, 0xE0}));
  CHECK_EQUAL(unknown.precision, timestamp_precision::year);
  CHECK_EQUAL(unknown.utc.year, 2016);
  CHECK(not unknown.offset);
  CHECK_EQUAL(to_string(unknown), "2016T"s);
  auto utc = unbox(timestamp_of({0x80, 0x0F, 0xE0}));
  REQUIRE(utc.offset.has_value());
  CHECK_EQUAL(*utc.offset, 0);
}

TEST("timestamps with month and day precision") {
  auto month = unbox(timestamp_of({0x81, 0x0F, 0xE0, 0x82}));
  CHECK_EQUAL(month.precision, timestamp_precision::month);
  CHECK_EQUAL(month.offset.value_or(0), 1);
  const auto local = month.local();
  CHECK_EQUAL(local.year, 2016);
  CHECK_EQUAL(local.month, 2u);
  CHECK_EQUAL(local.day, 1u);
  CHECK_EQUAL(local.hour, 0u);
  CHECK_EQUAL(local.minute, 1u);
  CHECK_EQUAL(to_string(month), "2016-02T"s);
  auto day = unbox(timestamp_of({0xFC, 0x0F, 0xE0, 0x82, 0x82}));
  CHECK_EQUAL(day.precision, timestamp_precision::day);
  CHECK_EQUAL(day.offset.value_or(0), -60);
  CHECK_EQUAL(day.local().day, 1u);
  CHECK_EQUAL(day.local().hour, 23u);
  CHECK_EQUAL(to_string(day), "2016-02-01"s);
}

TEST("timestamps with minute and second precision") {
  auto minute = unbox(
    timestamp_of({0x43, 0xA4, 0x0F, 0xE0, 0x82, 0x82, 0x87, 0x80}));
  CHECK_EQUAL(minute.precision, timestamp_precision::minute);
  CHECK_EQUAL(minute.utc.hour, 7u);
  CHECK_EQUAL(minute.offset.value_or(0), -420);
  CHECK_EQUAL(to_string(minute), "2016-02-02T00:00-07:00"s);
  auto second = unbox(
    timestamp_of({0x43, 0xA4, 0x0F, 0xE0, 0x82, 0x82, 0x87, 0x80, 0x9E}));
  CHECK_EQUAL(second.precision, timestamp_precision::second);
  CHECK_EQUAL(second.utc.second, 30u);
  CHECK(not second.fraction);
  CHECK_EQUAL(to_string(second), "2016-02-02T00:00:30-07:00"s);
  auto fraction = unbox(timestamp_of(
    {0x43, 0xA4, 0x0F, 0xE0, 0x82, 0x82, 0x87, 0x80, 0x9E, 0xC3, 0x01}));
  REQUIRE(fraction.fraction.has_value());
  CHECK_EQUAL(*fraction.fraction, (decimal{.coefficient = 1, .exponent = -3}));
  CHECK_EQUAL(to_string(fraction), "2016-02-02T00:00:30.001-07:00"s);
}

TEST("timestamp fractions") {
  auto zero = unbox(timestamp_of(
    {0xC1, 0x81, 0x81, 0x81, 0x80, 0x81, 0x80, 0x80, 0x00}));
  CHECK(not zero.fraction);
  CHECK_EQUAL(zero.offset.value_or(0), -1);
  CHECK_EQUAL(zero.local().minute, 0u);
  auto small = unbox(timestamp_of(
    {0xC0, 0x81, 0x81, 0x81, 0x80, 0x80, 0x80, 0xC7, 0x01}));
  REQUIRE(small.fraction.has_value());
  CHECK_EQUAL(to_string(*small.fraction), "1E-7"s);
  CHECK_EQUAL(to_string(small), "0001-01-01T00:00:00.0000001-00:00"s);
}

TEST("invalid timestamps") {
  auto invalid = std::vector<std::vector<int>>{
    // Year zero.
    {0x80, 0x80},
    // Month 13.
    {0x80, 0x0F, 0xE0, 0x8D},
    // February 30th.
    {0x80, 0x0F, 0xE0, 0x82, 0x9E},
    // Hour without minute.
    {0x80, 0x0F, 0xE0, 0x82, 0x82, 0x87},
    // Hour 24.
    {0x80, 0x0F, 0xE0, 0x82, 0x82, 0x98, 0x80},
    // Second 60.
    {0x80, 0x0F, 0xE0, 0x82, 0x82, 0x87, 0x80, 0xBC},
    // Fraction of one second.
    {0x80, 0x0F, 0xE0, 0x82, 0x82, 0x87, 0x80, 0x9E, 0x80, 0x01},
    // Negative fraction.
    {0x80, 0x0F, 0xE0, 0x82, 0x82, 0x87, 0x80, 0x9E, 0xC1, 0x81},
    // Offset of a full day.
    {0x0B, 0xA0, 0x0F, 0xE0},
    // Missing year.
    {0x80},
  };
  for (const auto& xs : invalid) {
    auto bytes = std::vector<std::byte>{};
    for (auto x : xs) {
      bytes.push_back(static_cast<std::byte>(x));
    }
    auto result = decode_timestamp(bytes);
    REQUIRE(not result);
    CHECK_EQUAL(result.error(), ec::malformed_input);
  }
}

TEST("strings") {
  CHECK_EQUAL(unbox(decode_string(octets({0x61, 0x62}))), "ab"s);
  CHECK_EQUAL(unbox(decode_string(octets({}))), ""s);
  auto invalid = decode_string(octets({0xC3, 0x28}));
  REQUIRE(not invalid);
  CHECK_EQUAL(invalid.error(), ec::malformed_input);
}

TEST("symbols") {
  CHECK_EQUAL(unbox(decode_symbol(octets({0x02}))).id, 2u);
  CHECK_EQUAL(unbox(decode_symbol(octets({0x01, 0x00}))).id, 256u);
  CHECK_EQUAL(unbox(decode_symbol(octets({}))).id, 0u);
  auto wide = decode_symbol(
    octets({0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
  REQUIRE(not wide);
  CHECK_EQUAL(wide.error(), ec::malformed_input);
}

TEST("annotations") {
  auto annotations = unbox(decode_annotations(octets({0x84, 0x87})));
  REQUIRE_EQUAL(annotations.size(), 2u);
  CHECK_EQUAL(annotations[0].id, 4u);
  CHECK_EQUAL(annotations[1].id, 7u);
  auto truncated = decode_annotations(octets({0x84, 0x07}));
  REQUIRE(not truncated);
  CHECK_EQUAL(truncated.error(), ec::malformed_input);
}
