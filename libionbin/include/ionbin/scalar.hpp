//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/fwd.hpp"

#include "ionbin/decimal.hpp"
#include "ionbin/symbol_token.hpp"
#include "ionbin/timestamp.hpp"
#include "ionbin/variant.hpp"

#include <fmt/format.h>

#include <string>

namespace ionbin {

/// A materialized, non-null scalar value. Clobs and blobs share the `blob`
/// representation; the event type tells them apart.
using scalar = variant<bool, integer, double, decimal, timestamp,
                       symbol_token, std::string, blob>;

/// @relates scalar
auto to_string(const scalar& x) -> std::string;

} // namespace ionbin

template <>
struct fmt::formatter<ionbin::scalar> : fmt::formatter<std::string> {
  template <class FormatContext>
  auto format(const ionbin::scalar& x, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(to_string(x), ctx);
  }
};
