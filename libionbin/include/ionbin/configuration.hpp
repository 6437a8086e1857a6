//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/fwd.hpp"

#include "ionbin/defaults.hpp"

#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <cstddef>

namespace ionbin {

/// Tuning knobs of the reader.
struct reader_options {
  /// The maximum nesting depth of containers.
  size_t max_depth = defaults::reader::max_depth;

  /// Whether to decode lazy scalars before emitting them.
  bool materialize = defaults::reader::materialize;

  /// Reads the options from the `ionbin.reader` section of *cfg*, falling
  /// back to the defaults for absent keys.
  static auto make(const caf::settings& cfg) -> caf::expected<reader_options>;

  friend auto operator==(const reader_options&, const reader_options&) -> bool
    = default;
};

} // namespace ionbin
