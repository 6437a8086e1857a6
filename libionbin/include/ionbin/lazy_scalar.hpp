//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/fwd.hpp"

#include "ionbin/chunk.hpp"
#include "ionbin/scalar.hpp"

#include <caf/expected.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <span>

namespace ionbin {

/// Selects the decoder that turns the bytes of a lazy scalar into a value.
enum class scalar_codec : uint8_t {
  positive_int,
  negative_int,
  float_,
  decimal,
  timestamp,
  symbol,
  string,
  lob,
};

/// @relates scalar_codec
auto to_string(scalar_codec x) -> const char*;

/// A scalar whose bytes have been sliced off the stream but not yet
/// interpreted. Decoding happens only on `materialize()`, which is pure: it
/// yields the same result on every call.
class lazy_scalar {
public:
  lazy_scalar(scalar_codec codec, chunk_ptr bytes);

  /// @returns the decoder for the bytes.
  auto codec() const noexcept -> scalar_codec {
    return codec_;
  }

  /// @returns the encoded representation, without type octet and length.
  auto bytes() const noexcept -> std::span<const std::byte> {
    return as_bytes(bytes_);
  }

  /// Decodes the value.
  /// @returns the value or an `ec::malformed_input` error.
  auto materialize() const -> caf::expected<scalar>;

private:
  scalar_codec codec_;
  chunk_ptr bytes_;
};

} // namespace ionbin

template <>
struct fmt::formatter<ionbin::scalar_codec> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(ionbin::scalar_codec x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(ionbin::to_string(x), ctx);
  }
};
