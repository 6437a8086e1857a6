//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/symbol_resolver.hpp"

#include "ionbin/scalar.hpp"

#include <utility>

namespace ionbin {

auto resolve_symbols(event x, const symbol_resolver& resolver)
  -> caf::expected<event> {
  for (auto& annotation : x.annotations) {
    annotation = resolver.resolve(annotation);
  }
  if (x.field_name) {
    x.field_name = resolver.resolve(*x.field_name);
  }
  if (x.type != value_type::symbol or x.is_null()) {
    return x;
  }
  auto value = x.materialize();
  if (not value) {
    return std::move(value.error());
  }
  if (not *value) {
    return x;
  }
  if (const auto* token = try_as<symbol_token>(**value)) {
    auto resolved = resolver.resolve(*token);
    return std::move(x).with_value(scalar{std::move(resolved)});
  }
  return x;
}

} // namespace ionbin
