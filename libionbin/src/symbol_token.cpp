//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/symbol_token.hpp"

namespace ionbin {

auto to_string(const symbol_token& x) -> std::string {
  if (x.text) {
    return fmt::format("'{}'", *x.text);
  }
  return fmt::format("${}", x.id);
}

} // namespace ionbin
