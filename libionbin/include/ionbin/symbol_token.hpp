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

#include <cstdint>
#include <optional>
#include <string>

namespace ionbin {

/// A reference to an entry in a symbol table. The decoder only ever produces
/// identifiers; the text is filled in by a symbol resolver.
struct symbol_token {
  uint64_t id = 0;
  std::optional<std::string> text = {};

  friend auto operator==(const symbol_token& lhs, const symbol_token& rhs)
    -> bool
    = default;
};

/// Renders a token as `$<id>`, or as the quoted text if it is known.
/// @relates symbol_token
auto to_string(const symbol_token& x) -> std::string;

} // namespace ionbin

template <>
struct fmt::formatter<ionbin::symbol_token> : fmt::formatter<std::string> {
  template <class FormatContext>
  auto format(const ionbin::symbol_token& x, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(to_string(x), ctx);
  }
};
