//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/fwd.hpp"

#include "ionbin/lazy_scalar.hpp"
#include "ionbin/scalar.hpp"
#include "ionbin/symbol_token.hpp"
#include "ionbin/type.hpp"
#include "ionbin/variant.hpp"

#include <caf/expected.hpp>
#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ionbin {

/// The kinds of events that the reader emits.
enum class event_kind : int8_t {
  scalar,
  container_start,
  container_end,
  version_marker,
  stream_incomplete,
  stream_end,
};

/// @relates event_kind
auto to_string(event_kind x) -> const char*;

/// @returns whether *x* asks the caller for more data.
constexpr auto is_stream_signal(event_kind x) -> bool {
  return x == event_kind::stream_incomplete or x == event_kind::stream_end;
}

/// @returns whether *x* starts a value in the data model.
constexpr auto begins_value(event_kind x) -> bool {
  return x == event_kind::scalar or x == event_kind::container_start;
}

/// @returns whether *x* closes a container.
constexpr auto ends_container(event_kind x) -> bool {
  return x == event_kind::container_end;
}

/// The payload of an event: nothing, a materialized scalar, or a lazy scalar.
/// Null values, containers, version markers and stream signals carry nothing.
using event_value = variant<std::monostate, scalar, lazy_scalar>;

/// A single step of a depth-first traversal of the stream.
struct event {
  event_kind kind = event_kind::stream_end;

  /// The logical type; absent for version markers and stream signals.
  std::optional<value_type> type = {};

  event_value value = {};

  /// The nesting depth: 0 for top-level values.
  size_t depth = 0;

  std::vector<symbol_token> annotations = {};

  /// The field name of a struct member.
  std::optional<symbol_token> field_name = {};

  // -- factories --------------------------------------------------------------

  static auto make_scalar(value_type type, event_value value, size_t depth)
    -> event;

  static auto make_null(value_type type, size_t depth) -> event;

  static auto make_container_start(value_type type, size_t depth) -> event;

  static auto make_container_end(value_type type, size_t depth) -> event;

  static auto make_version_marker() -> event;

  static auto make_stream_incomplete() -> event;

  static auto make_stream_end() -> event;

  // -- derivation -------------------------------------------------------------

  auto with_field_name(symbol_token name) && -> event;

  auto with_annotations(std::vector<symbol_token> annotations) && -> event;

  auto with_value(event_value value) && -> event;

  // -- properties -------------------------------------------------------------

  /// @returns whether this is a scalar event of a null value.
  auto is_null() const -> bool;

  /// @returns whether the value still needs to be decoded.
  auto is_lazy() const -> bool;

  /// Forces a lazy value.
  /// @returns the materialized value, `std::nullopt` for events without a
  /// value, or the decoding error.
  auto materialize() const -> caf::expected<std::optional<scalar>>;

  /// Compares all fields and the materialized values. A lazy value that fails
  /// to decode compares unequal to everything.
  friend auto operator==(const event& lhs, const event& rhs) -> bool;
};

/// @relates event
auto to_string(const event& x) -> std::string;

} // namespace ionbin

template <>
struct fmt::formatter<ionbin::event_kind> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(ionbin::event_kind x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(ionbin::to_string(x), ctx);
  }
};

template <>
struct fmt::formatter<ionbin::event> : fmt::formatter<std::string> {
  template <class FormatContext>
  auto format(const ionbin::event& x, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(to_string(x), ctx);
  }
};
