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
#include "ionbin/type.hpp"
#include "ionbin/variant.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace ionbin::dispatch {

// Each type octet maps to one of the descriptors below. A descriptor with an
// absent length means that a VarUInt length field follows the type octet.

/// An octet that cannot start a value.
struct invalid {
  std::byte octet;
};

/// The first octet of a version marker.
struct version_marker {};

/// A typed null.
struct null {
  value_type type;
};

/// A value fully determined by its type octet.
struct static_scalar {
  value_type type;
  scalar value;
};

/// A scalar whose bytes follow the type octet.
struct length_scalar {
  value_type type;
  scalar_codec codec;
  std::optional<uint64_t> length;
};

/// The start of a list, sexp or struct.
struct container_start {
  value_type type;
  std::optional<uint64_t> length;
  /// Marks a struct with sorted fields, which must not be empty.
  bool ordered = false;
};

/// An annotation wrapper around a single value.
struct annotation_wrapper {
  std::optional<uint64_t> length;
};

/// Padding bytes without a value.
struct padding {
  std::optional<uint64_t> length;
};

using handler = variant<invalid, version_marker, null, static_scalar,
                        length_scalar, container_start, annotation_wrapper,
                        padding>;

/// The dispatch table, indexed by type octet.
using table_type = std::array<handler, 256>;

/// @returns the process-wide dispatch table, built on first use.
auto table() -> const table_type&;

/// @returns the descriptor for a type octet.
inline auto lookup(std::byte octet) -> const handler& {
  return table()[std::to_integer<size_t>(octet)];
}

} // namespace ionbin::dispatch
