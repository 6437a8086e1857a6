//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/fwd.hpp"

#include "ionbin/chunked_buffer.hpp"
#include "ionbin/decimal.hpp"
#include "ionbin/symbol_token.hpp"
#include "ionbin/timestamp.hpp"

#include <caf/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

// Decoders for the primitive encodings of the binary format. The span-based
// functions operate on a complete field: running out of bytes is a malformed
// input. Only the buffer-based variant reports `ec::incomplete`.

namespace ionbin {

/// The sign and magnitude of a signed field. Keeping the sign separate
/// preserves negative zero.
struct signed_magnitude {
  bool negative = false;
  uint64_t magnitude = 0;

  friend auto operator==(const signed_magnitude&, const signed_magnitude&)
    -> bool
    = default;
};

/// Reads a VarUInt from the front of *bytes* and drops the consumed octets.
auto read_var_uint(std::span<const std::byte>& bytes)
  -> caf::expected<uint64_t>;

/// Reads a VarInt from the front of *bytes* and drops the consumed octets.
auto read_var_int(std::span<const std::byte>& bytes)
  -> caf::expected<signed_magnitude>;

/// Reads a VarUInt from a buffer that may not yet hold all of its octets.
auto read_var_uint(const chunked_buffer& buffer)
  -> caf::expected<std::pair<uint64_t, chunked_buffer>>;

/// Decodes a big-endian UInt; an empty field is zero.
auto decode_uint(std::span<const std::byte> bytes) -> integer;

/// Decodes a signed-magnitude Int into its sign and magnitude; an empty field
/// is positive zero.
auto decode_int(std::span<const std::byte> bytes) -> std::pair<bool, integer>;

/// Decodes an IEEE 754 binary32 or binary64 float.
auto decode_float(std::span<const std::byte> bytes) -> caf::expected<double>;

/// Decodes a VarInt exponent followed by an Int coefficient.
auto decode_decimal(std::span<const std::byte> bytes)
  -> caf::expected<decimal>;

/// Decodes a timestamp. The precision follows from the fields present.
auto decode_timestamp(std::span<const std::byte> bytes)
  -> caf::expected<timestamp>;

/// Decodes UTF-8 text, rejecting invalid sequences.
auto decode_string(std::span<const std::byte> bytes)
  -> caf::expected<std::string>;

/// Decodes a symbol value, a UInt symbol identifier.
auto decode_symbol(std::span<const std::byte> bytes)
  -> caf::expected<symbol_token>;

/// Decodes the annotation list of an annotation wrapper, a sequence of
/// VarUInt symbol identifiers.
auto decode_annotations(std::span<const std::byte> bytes)
  -> caf::expected<std::vector<symbol_token>>;

} // namespace ionbin
