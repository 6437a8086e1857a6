//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/fwd.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ionbin::defaults {

// -- constants for the binary reader ------------------------------------------

namespace reader {

/// Maximum nesting depth of containers before the reader bails out.
/// Note: the value must be > 0.
inline constexpr size_t max_depth = 100;

/// Whether the reader forces lazy scalars before emitting them.
inline constexpr bool materialize = false;

} // namespace reader

// -- constants for the binary format ------------------------------------------

namespace format {

/// The version marker that opens every binary stream: a leading octet
/// followed by the major version, the minor version and a terminator.
inline constexpr std::array<std::byte, 4> version_marker = {
  std::byte{0xE0},
  std::byte{0x01},
  std::byte{0x00},
  std::byte{0xEA},
};

} // namespace format

// -- constants for logging ----------------------------------------------------

namespace logger {

/// Verbosity of the console sink.
inline constexpr std::string_view console_verbosity = "info";

/// Pattern of the console sink.
inline constexpr std::string_view console_format = "%^[%T.%e] %v%$";

/// Color mode of the console sink.
inline constexpr std::string_view console_color = "automatic";

} // namespace logger

} // namespace ionbin::defaults
