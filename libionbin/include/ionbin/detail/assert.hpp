//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/config.hpp"

#include <source_location>
#include <string>
#include <string_view>

namespace ionbin::detail {

/// Logs the message and source location, then throws a `std::runtime_error`,
/// or terminates the process if `IONBIN_ABORT_ON_PANIC` is set.
[[noreturn]] IONBIN_NO_INLINE void
panic_impl(std::string message, std::source_location source);

[[noreturn]] IONBIN_NO_INLINE void
fail_assertion_impl(const char* expr, std::string_view explanation,
                    std::source_location source);

} // namespace ionbin::detail

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define IONBIN_ASSERT_1(expr)                                                  \
  do {                                                                         \
    if (not static_cast<bool>(expr)) [[unlikely]] {                            \
      ::ionbin::detail::fail_assertion_impl(                                   \
        #expr, {}, std::source_location::current());                           \
    }                                                                          \
  } while (false)

#define IONBIN_ASSERT_2(expr, explanation)                                     \
  do {                                                                         \
    if (not static_cast<bool>(expr)) [[unlikely]] {                            \
      ::ionbin::detail::fail_assertion_impl(                                   \
        #expr, explanation, std::source_location::current());                  \
    }                                                                          \
  } while (false)

#define IONBIN_ASSERT_SELECT(_1, _2, name, ...) name

/// Checks an internal invariant. Use this only for programming errors, never
/// for properties of the input.
#define IONBIN_ASSERT(...)                                                     \
  IONBIN_ASSERT_SELECT(__VA_ARGS__, IONBIN_ASSERT_2, IONBIN_ASSERT_1)          \
  (__VA_ARGS__)

#define IONBIN_UNREACHABLE()                                                   \
  ::ionbin::detail::panic_impl("unreachable", std::source_location::current())

// NOLINTEND(cppcoreguidelines-macro-usage)
