//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/config.hpp"
#include "ionbin/error.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/fwd.hpp>

#include <memory>
#include <string>

// IONBIN_INFO -> spdlog::info
// IONBIN_VERBOSE -> spdlog::debug
// IONBIN_DEBUG -> spdlog::trace
// IONBIN_TRACE -> spdlog::trace

#if IONBIN_LOG_LEVEL == IONBIN_LOG_LEVEL_TRACE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif IONBIN_LOG_LEVEL == IONBIN_LOG_LEVEL_DEBUG
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif IONBIN_LOG_LEVEL == IONBIN_LOG_LEVEL_VERBOSE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#elif IONBIN_LOG_LEVEL == IONBIN_LOG_LEVEL_INFO
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif IONBIN_LOG_LEVEL == IONBIN_LOG_LEVEL_WARNING
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#elif IONBIN_LOG_LEVEL == IONBIN_LOG_LEVEL_ERROR
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#elif IONBIN_LOG_LEVEL == IONBIN_LOG_LEVEL_CRITICAL
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_CRITICAL
#elif IONBIN_LOG_LEVEL == IONBIN_LOG_LEVEL_QUIET
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

// Important: keep that below the log level mapping
#include <spdlog/spdlog.h>

namespace ionbin::detail {

/// @returns the process-wide logger; a null logger until logging is set up.
auto logger() -> std::shared_ptr<spdlog::logger>&;

auto setup_spdlog(const caf::settings& cfg) -> bool;

void shutdown_spdlog() noexcept;

template <class... Ts>
constexpr void discard_args(Ts&&...) noexcept {
  // nop
}

} // namespace ionbin::detail

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define IONBIN_DISCARD_ARGS(...)                                               \
  do {                                                                         \
    if (false) {                                                               \
      ::ionbin::detail::discard_args(__VA_ARGS__);                             \
    }                                                                          \
  } while (false)

#if IONBIN_LOG_LEVEL >= IONBIN_LOG_LEVEL_TRACE
#  define IONBIN_TRACE(...)                                                    \
    SPDLOG_LOGGER_TRACE(::ionbin::detail::logger(), __VA_ARGS__)
#else
#  define IONBIN_TRACE(...) IONBIN_DISCARD_ARGS(__VA_ARGS__)
#endif

#if IONBIN_LOG_LEVEL >= IONBIN_LOG_LEVEL_DEBUG
#  define IONBIN_DEBUG(...)                                                    \
    SPDLOG_LOGGER_TRACE(::ionbin::detail::logger(), __VA_ARGS__)
#else
#  define IONBIN_DEBUG(...) IONBIN_DISCARD_ARGS(__VA_ARGS__)
#endif

#if IONBIN_LOG_LEVEL >= IONBIN_LOG_LEVEL_VERBOSE
#  define IONBIN_VERBOSE(...)                                                  \
    SPDLOG_LOGGER_DEBUG(::ionbin::detail::logger(), __VA_ARGS__)
#else
#  define IONBIN_VERBOSE(...) IONBIN_DISCARD_ARGS(__VA_ARGS__)
#endif

#if IONBIN_LOG_LEVEL >= IONBIN_LOG_LEVEL_INFO
#  define IONBIN_INFO(...)                                                     \
    SPDLOG_LOGGER_INFO(::ionbin::detail::logger(), __VA_ARGS__)
#else
#  define IONBIN_INFO(...) IONBIN_DISCARD_ARGS(__VA_ARGS__)
#endif

#if IONBIN_LOG_LEVEL >= IONBIN_LOG_LEVEL_WARNING
#  define IONBIN_WARN(...)                                                     \
    SPDLOG_LOGGER_WARN(::ionbin::detail::logger(), __VA_ARGS__)
#else
#  define IONBIN_WARN(...) IONBIN_DISCARD_ARGS(__VA_ARGS__)
#endif

#if IONBIN_LOG_LEVEL >= IONBIN_LOG_LEVEL_ERROR
#  define IONBIN_ERROR(...)                                                    \
    SPDLOG_LOGGER_ERROR(::ionbin::detail::logger(), __VA_ARGS__)
#else
#  define IONBIN_ERROR(...) IONBIN_DISCARD_ARGS(__VA_ARGS__)
#endif

#if IONBIN_LOG_LEVEL >= IONBIN_LOG_LEVEL_CRITICAL
#  define IONBIN_CRITICAL(...)                                                 \
    SPDLOG_LOGGER_CRITICAL(::ionbin::detail::logger(), __VA_ARGS__)
#else
#  define IONBIN_CRITICAL(...) IONBIN_DISCARD_ARGS(__VA_ARGS__)
#endif

// NOLINTEND(cppcoreguidelines-macro-usage)

namespace ionbin {

/// Converts a verbosity to its integer counterpart. For unknown values,
/// the `default_value` parameter will be returned.
auto loglevel_to_int(std::string x, int default_value = IONBIN_LOG_LEVEL_QUIET)
  -> int;

/// Installs the console logger configured by the `ionbin.console-*` keys.
/// @returns a guard that shuts logging down when it goes out of scope.
[[nodiscard]] auto create_log_context(const caf::settings& cfg)
  -> caf::expected<caf::detail::scope_guard<void (*)() noexcept>>;

} // namespace ionbin
