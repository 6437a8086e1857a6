//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/fwd.hpp"

#include "ionbin/detail/assert.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <fmt/format.h>

#include <string>
#include <type_traits>

namespace ionbin {

/// The error codes of the decoder.
enum class ec : uint8_t {
  /// No error.
  no_error = 0,
  /// The byte stream violates the binary format. Fatal for the stream.
  malformed_input,
  /// Not enough bytes are buffered to complete the current read.
  incomplete,
  /// The caller issued a request that is not valid in the current state.
  protocol_violation,
  /// The input ended in the middle of a value.
  end_of_input,
  /// A function received an invalid argument.
  invalid_argument,
  /// A component failed, because its configuration was invalid.
  invalid_configuration,
  /// Containers are nested deeper than the configured maximum.
  recursion_limit_reached,
  /// No error; number of error codes.
  ec_count,
};

/// @relates ec
auto to_string(ec x) -> const char*;

/// A formatting function that converts an error into a human-readable string.
/// @relates ec
auto render(const caf::error& err) -> std::string;

template <class Inspector>
auto inspect(Inspector& f, ec& x) -> bool {
  using underlying = std::underlying_type_t<ec>;
  auto get = [&x] {
    return static_cast<underlying>(x);
  };
  auto set = [&x](underlying value) {
    if (value >= static_cast<underlying>(ec::ec_count)) {
      return false;
    }
    x = static_cast<ec>(value);
    return true;
  };
  return f.apply(get, set);
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error;

template <class... Ts>
auto add_context(const caf::error& error, fmt::format_string<Ts...> fmt,
                 Ts&&... args) -> caf::error {
  return add_context_impl(error, fmt::format(std::move(fmt),
                                             std::forward<Ts>(args)...));
}

/// Shorthand for a malformed-input error with a formatted description.
template <class... Ts>
auto make_malformed_error(fmt::format_string<Ts...> fmt, Ts&&... args)
  -> caf::error {
  return caf::make_error(ec::malformed_input,
                         fmt::format(std::move(fmt),
                                     std::forward<Ts>(args)...));
}

} // namespace ionbin

CAF_ERROR_CODE_ENUM(ionbin::ec)

template <>
struct fmt::formatter<ionbin::ec> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(ionbin::ec x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(ionbin::to_string(x), ctx);
  }
};
