//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/fwd.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace ionbin {

/// The logical type of a value in the data model.
enum class value_type : uint8_t {
  null,
  bool_,
  int_,
  float_,
  decimal,
  timestamp,
  symbol,
  string,
  clob,
  blob,
  list,
  sexp,
  struct_,
};

/// @relates value_type
auto to_string(value_type x) -> const char*;

/// @returns whether values of type *x* open a nested sequence of values.
constexpr auto is_container(value_type x) -> bool {
  return x == value_type::list or x == value_type::sexp
         or x == value_type::struct_;
}

/// @returns whether values of type *x* carry text.
constexpr auto is_text(value_type x) -> bool {
  return x == value_type::string or x == value_type::symbol;
}

/// @returns whether values of type *x* carry opaque bytes.
constexpr auto is_lob(value_type x) -> bool {
  return x == value_type::clob or x == value_type::blob;
}

/// The 4-bit type identifier in the high nibble of a type octet.
enum class type_id : uint8_t {
  null = 0x0,
  bool_ = 0x1,
  positive_int = 0x2,
  negative_int = 0x3,
  float_ = 0x4,
  decimal = 0x5,
  timestamp = 0x6,
  symbol = 0x7,
  string = 0x8,
  clob = 0x9,
  blob = 0xA,
  list = 0xB,
  sexp = 0xC,
  struct_ = 0xD,
  annotation = 0xE,
};

/// @relates type_id
auto to_string(type_id x) -> const char*;

/// Maps a binary type identifier to the logical type of its values.
/// @returns `std::nullopt` for the annotation wrapper, which has no type.
auto logical_type(type_id x) -> std::optional<value_type>;

/// Length nibble that denotes a null value.
inline constexpr uint8_t null_nibble = 0xF;

/// Length nibble that announces an explicit length field.
inline constexpr uint8_t length_follows_nibble = 0xE;

/// Splits a type octet into its type identifier and its length nibble.
constexpr auto split_type_octet(std::byte octet)
  -> std::pair<uint8_t, uint8_t> {
  const auto x = std::to_integer<uint8_t>(octet);
  return {static_cast<uint8_t>(x >> 4), static_cast<uint8_t>(x & 0x0F)};
}

} // namespace ionbin

template <>
struct fmt::formatter<ionbin::value_type> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(ionbin::value_type x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(ionbin::to_string(x), ctx);
  }
};

template <>
struct fmt::formatter<ionbin::type_id> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(ionbin::type_id x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(ionbin::to_string(x), ctx);
  }
};
