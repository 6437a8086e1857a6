//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/fwd.hpp"

#include "ionbin/event.hpp"
#include "ionbin/symbol_token.hpp"

#include <caf/expected.hpp>

namespace ionbin {

/// Maps symbol ids to their text. The reader itself never resolves symbols;
/// this is the seam for a symbol table maintained by the caller.
class symbol_resolver {
public:
  virtual ~symbol_resolver() noexcept = default;

  /// Resolves a single token.
  /// @returns the token with its text filled in if the id is known, and the
  /// unchanged token otherwise.
  virtual auto resolve(const symbol_token& token) const -> symbol_token = 0;
};

/// Resolves the annotations, the field name and a symbol value of an event.
/// Lazy symbol values are materialized in the process.
/// @returns the resolved event or the error of decoding the symbol value.
auto resolve_symbols(event x, const symbol_resolver& resolver)
  -> caf::expected<event>;

} // namespace ionbin
