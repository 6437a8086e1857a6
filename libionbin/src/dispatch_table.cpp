//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/dispatch_table.hpp"

#include "ionbin/detail/assert.hpp"

#include <initializer_list>
#include <span>
#include <string>

namespace ionbin::dispatch {

namespace {

constexpr auto make_octet(type_id id, uint8_t nibble) -> size_t {
  return (static_cast<size_t>(id) << 4) | nibble;
}

/// @returns the length bound to a nibble, or `std::nullopt` if a length field
/// follows.
constexpr auto nibble_length(uint8_t nibble) -> std::optional<uint64_t> {
  if (nibble == length_follows_nibble) {
    return std::nullopt;
  }
  return nibble;
}

/// Binds the length-prefixed scalars of a type for the given nibbles.
void bind_length_scalars(table_type& table, type_id id, scalar_codec codec,
                         std::span<const uint8_t> nibbles) {
  const auto type = logical_type(id);
  IONBIN_ASSERT(type.has_value());
  for (auto nibble : nibbles) {
    table[make_octet(id, nibble)]
      = length_scalar{*type, codec, nibble_length(nibble)};
  }
}

constexpr auto non_zero_lengths = std::array<uint8_t, 14>{
  1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14,
};

constexpr auto float_lengths = std::array<uint8_t, 2>{4, 8};

auto make_table() -> table_type {
  auto table = table_type{};
  for (size_t i = 0; i < table.size(); ++i) {
    table[i] = invalid{static_cast<std::byte>(i)};
  }
  table[make_octet(type_id::annotation, 0)] = version_marker{};
  // Nulls of every type but the annotation wrapper.
  for (auto id = uint8_t{0}; id <= static_cast<uint8_t>(type_id::struct_);
       ++id) {
    const auto tid = static_cast<type_id>(id);
    table[make_octet(tid, null_nibble)] = null{*logical_type(tid)};
  }
  // Values that need no bytes beyond the type octet.
  table[0x10] = static_scalar{value_type::bool_, scalar{false}};
  table[0x11] = static_scalar{value_type::bool_, scalar{true}};
  table[0x20] = static_scalar{value_type::int_, scalar{integer{0}}};
  table[0x40] = static_scalar{value_type::float_, scalar{0.0}};
  table[0x50] = static_scalar{value_type::decimal, scalar{decimal{}}};
  table[0x70] = static_scalar{value_type::symbol, scalar{symbol_token{}}};
  table[0x80] = static_scalar{value_type::string, scalar{std::string{}}};
  table[0x90] = static_scalar{value_type::clob, scalar{blob{}}};
  table[0xA0] = static_scalar{value_type::blob, scalar{blob{}}};
  // Scalars with a length.
  bind_length_scalars(table, type_id::positive_int,
                      scalar_codec::positive_int, non_zero_lengths);
  bind_length_scalars(table, type_id::negative_int,
                      scalar_codec::negative_int, non_zero_lengths);
  bind_length_scalars(table, type_id::float_, scalar_codec::float_,
                      float_lengths);
  bind_length_scalars(table, type_id::decimal, scalar_codec::decimal,
                      non_zero_lengths);
  bind_length_scalars(table, type_id::timestamp, scalar_codec::timestamp,
                      non_zero_lengths);
  bind_length_scalars(table, type_id::symbol, scalar_codec::symbol,
                      non_zero_lengths);
  bind_length_scalars(table, type_id::string, scalar_codec::string,
                      non_zero_lengths);
  bind_length_scalars(table, type_id::clob, scalar_codec::lob,
                      non_zero_lengths);
  bind_length_scalars(table, type_id::blob, scalar_codec::lob,
                      non_zero_lengths);
  // Containers use every nibble but the null nibble.
  for (auto id : {type_id::list, type_id::sexp, type_id::struct_}) {
    for (auto nibble = uint8_t{0}; nibble <= length_follows_nibble; ++nibble) {
      table[make_octet(id, nibble)]
        = container_start{*logical_type(id), nibble_length(nibble)};
    }
  }
  // An ordered struct always has an explicit length field.
  table[make_octet(type_id::struct_, 1)]
    = container_start{value_type::struct_, std::nullopt, true};
  // The smallest annotation wrapper holds a length, one symbol, and a value.
  for (auto nibble = uint8_t{3}; nibble <= length_follows_nibble; ++nibble) {
    table[make_octet(type_id::annotation, nibble)]
      = annotation_wrapper{nibble_length(nibble)};
  }
  for (auto nibble = uint8_t{0}; nibble <= length_follows_nibble; ++nibble) {
    table[make_octet(type_id::null, nibble)] = padding{nibble_length(nibble)};
  }
  return table;
}

} // namespace

auto table() -> const table_type& {
  static const auto instance = make_table();
  return instance;
}

} // namespace ionbin::dispatch
