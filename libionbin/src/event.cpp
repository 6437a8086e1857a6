//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/event.hpp"

#include "ionbin/detail/assert.hpp"

#include <fmt/ranges.h>

namespace ionbin {

auto to_string(event_kind x) -> const char* {
  switch (x) {
    case event_kind::scalar:
      return "scalar";
    case event_kind::container_start:
      return "container_start";
    case event_kind::container_end:
      return "container_end";
    case event_kind::version_marker:
      return "version_marker";
    case event_kind::stream_incomplete:
      return "stream_incomplete";
    case event_kind::stream_end:
      return "stream_end";
  }
  IONBIN_UNREACHABLE();
}

// -- factories ----------------------------------------------------------------

auto event::make_scalar(value_type type, event_value value, size_t depth)
  -> event {
  IONBIN_ASSERT(not is_container(type));
  return {
    .kind = event_kind::scalar,
    .type = type,
    .value = std::move(value),
    .depth = depth,
  };
}

auto event::make_null(value_type type, size_t depth) -> event {
  return {
    .kind = event_kind::scalar,
    .type = type,
    .depth = depth,
  };
}

auto event::make_container_start(value_type type, size_t depth) -> event {
  IONBIN_ASSERT(is_container(type));
  return {
    .kind = event_kind::container_start,
    .type = type,
    .depth = depth,
  };
}

auto event::make_container_end(value_type type, size_t depth) -> event {
  IONBIN_ASSERT(is_container(type));
  return {
    .kind = event_kind::container_end,
    .type = type,
    .depth = depth,
  };
}

auto event::make_version_marker() -> event {
  return {.kind = event_kind::version_marker};
}

auto event::make_stream_incomplete() -> event {
  return {.kind = event_kind::stream_incomplete};
}

auto event::make_stream_end() -> event {
  return {.kind = event_kind::stream_end};
}

// -- derivation ---------------------------------------------------------------

auto event::with_field_name(symbol_token name) && -> event {
  field_name = std::move(name);
  return std::move(*this);
}

auto event::with_annotations(std::vector<symbol_token> annotations) && -> event {
  this->annotations = std::move(annotations);
  return std::move(*this);
}

auto event::with_value(event_value value) && -> event {
  this->value = std::move(value);
  return std::move(*this);
}

// -- properties ---------------------------------------------------------------

auto event::is_null() const -> bool {
  return kind == event_kind::scalar and is<std::monostate>(value);
}

auto event::is_lazy() const -> bool {
  return is<lazy_scalar>(value);
}

auto event::materialize() const -> caf::expected<std::optional<scalar>> {
  return value.match(
    [](std::monostate) -> caf::expected<std::optional<scalar>> {
      return std::optional<scalar>{};
    },
    [](const scalar& x) -> caf::expected<std::optional<scalar>> {
      return std::optional<scalar>{x};
    },
    [](const lazy_scalar& x) -> caf::expected<std::optional<scalar>> {
      auto result = x.materialize();
      if (not result) {
        return std::move(result.error());
      }
      return std::optional<scalar>{std::move(*result)};
    });
}

auto operator==(const event& lhs, const event& rhs) -> bool {
  if (lhs.kind != rhs.kind or lhs.type != rhs.type or lhs.depth != rhs.depth
      or lhs.annotations != rhs.annotations
      or lhs.field_name != rhs.field_name) {
    return false;
  }
  auto x = lhs.materialize();
  auto y = rhs.materialize();
  if (not x or not y) {
    return false;
  }
  return *x == *y;
}

auto to_string(const event& x) -> std::string {
  auto result = fmt::format("{}(", x.kind);
  if (x.type) {
    result += fmt::format("{}, ", *x.type);
  }
  if (x.field_name) {
    result += fmt::format("{}: ", *x.field_name);
  }
  if (not x.annotations.empty()) {
    result += fmt::format("{}::", fmt::join(x.annotations, "::"));
  }
  x.value.match(
    [&](std::monostate) {
      if (x.kind == event_kind::scalar) {
        result += "null, ";
      }
    },
    [&](const scalar& y) {
      result += fmt::format("{}, ", to_string(y));
    },
    [&](const lazy_scalar& y) {
      auto materialized = y.materialize();
      result += materialized ? fmt::format("{}, ", to_string(*materialized))
                             : fmt::format("<{}>, ", y.codec());
    });
  result += fmt::format("depth={})", x.depth);
  return result;
}

} // namespace ionbin
