//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/logger.hpp"

#include "ionbin/defaults.hpp"

#include <caf/settings.hpp>
#include <spdlog/common.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>

namespace ionbin {

auto create_log_context(const caf::settings& cfg)
  -> caf::expected<caf::detail::scope_guard<void (*)() noexcept>> {
  if (not detail::setup_spdlog(cfg)) {
    return caf::make_error(ec::invalid_configuration,
                           "failed to set up logging");
  }
  return {caf::detail::make_scope_guard(
    std::addressof(detail::shutdown_spdlog))};
}

/// Convert a log level to an int.
/// @note x is passed by value because it is modified.
auto loglevel_to_int(std::string x, int default_value) -> int {
  for (auto& ch : x) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  if (x == "quiet") {
    return IONBIN_LOG_LEVEL_QUIET;
  }
  if (x == "error") {
    return IONBIN_LOG_LEVEL_ERROR;
  }
  if (x == "warning") {
    return IONBIN_LOG_LEVEL_WARNING;
  }
  if (x == "info") {
    return IONBIN_LOG_LEVEL_INFO;
  }
  if (x == "verbose") {
    return IONBIN_LOG_LEVEL_VERBOSE;
  }
  if (x == "debug") {
    return IONBIN_LOG_LEVEL_DEBUG;
  }
  if (x == "trace") {
    return IONBIN_LOG_LEVEL_TRACE;
  }
  return default_value;
}

namespace {

/// Converts an ionbin log level to an spdlog level.
auto ionbin_loglevel_to_spd(const int value) -> spdlog::level::level_enum {
  switch (value) {
    case IONBIN_LOG_LEVEL_QUIET:
      return spdlog::level::off;
    case IONBIN_LOG_LEVEL_CRITICAL:
      return spdlog::level::critical;
    case IONBIN_LOG_LEVEL_ERROR:
      return spdlog::level::err;
    case IONBIN_LOG_LEVEL_WARNING:
      return spdlog::level::warn;
    case IONBIN_LOG_LEVEL_INFO:
      return spdlog::level::info;
    case IONBIN_LOG_LEVEL_VERBOSE:
      return spdlog::level::debug;
    case IONBIN_LOG_LEVEL_DEBUG:
    case IONBIN_LOG_LEVEL_TRACE:
      return spdlog::level::trace;
    default:
      IONBIN_ASSERT(false, "unhandled log level");
  }
  IONBIN_UNREACHABLE();
}

auto make_null_logger() -> std::shared_ptr<spdlog::logger> {
  return std::make_shared<spdlog::logger>(
    "/dev/null", std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace

namespace detail {

auto logger() -> std::shared_ptr<spdlog::logger>& {
  static auto instance = make_null_logger();
  return instance;
}

auto setup_spdlog(const caf::settings& cfg) -> bool try {
  if (logger()->name() != "/dev/null") {
    IONBIN_ERROR("log already up");
    return false;
  }
  auto console_verbosity
    = std::string{defaults::logger::console_verbosity};
  if (auto verbosity
      = caf::get_if<std::string>(&cfg, "ionbin.console-verbosity")) {
    if (loglevel_to_int(*verbosity, -1) < 0) {
      fmt::print(stderr,
                 "failed to start logger; ionbin.console-verbosity '{}' is "
                 "invalid\n",
                 *verbosity);
      return false;
    }
    console_verbosity = *verbosity;
  }
  const auto color = [&]() -> std::optional<spdlog::color_mode> {
    auto value = caf::get_or(cfg, "ionbin.console",
                             std::string{defaults::logger::console_color});
    if (value == "automatic") {
      return spdlog::color_mode::automatic;
    }
    if (value == "always") {
      return spdlog::color_mode::always;
    }
    if (value == "never") {
      return spdlog::color_mode::never;
    }
    fmt::print(stderr,
               "failed to start logger; ionbin.console '{}' is invalid\n",
               value);
    return std::nullopt;
  }();
  if (not color) {
    return false;
  }
  auto format = caf::get_or(cfg, "ionbin.console-format",
                            std::string{defaults::logger::console_format});
  auto sink
    = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(*color);
  sink->set_pattern(format);
  auto result = std::make_shared<spdlog::logger>("ionbin", std::move(sink));
  result->set_level(ionbin_loglevel_to_spd(loglevel_to_int(console_verbosity)));
  result->flush_on(spdlog::level::err);
  logger() = std::move(result);
  return true;
} catch (const spdlog::spdlog_ex& err) {
  fmt::print(stderr, "failed to set up logging: {}\n", err.what());
  return false;
}

void shutdown_spdlog() noexcept {
  IONBIN_DEBUG("shut down logging");
  logger()->flush();
  logger() = make_null_logger();
}

} // namespace detail

} // namespace ionbin
