//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/logger.hpp"
#include "ionbin/test/test.hpp"

#include <caf/config_option_set.hpp>
#include <caf/settings.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace caf::test {

int main(int, char**);

} // namespace caf::test

namespace {

// Retrieves arguments after the '--' delimiter.
std::vector<std::string> get_test_args(int argc, const char* const* argv) {
  constexpr std::string_view delimiter = "--";
  auto start = argv + 1;
  auto end = argv + argc;
  auto args_start = std::find(start, end, delimiter);
  if (args_start == end) {
    return {};
  }
  return {args_start + 1, end};
}

} // namespace

int main(int argc, char** argv) {
  ::setenv("IONBIN_ABORT_ON_PANIC", "1", 1);
  std::string ionbin_loglevel = "quiet";
  auto test_args = get_test_args(argc, argv);
  if (!test_args.empty()) {
    auto options = caf::config_option_set{}
                     .add(ionbin_loglevel, "ionbin-verbosity",
                          "console verbosity for libionbin")
                     .add<bool>("help", "print this help text");
    caf::settings cfg;
    auto res = options.parse(cfg, test_args);
    if (res.first != caf::pec::success) {
      std::cout << "error while parsing argument \"" << *res.second
                << "\": " << to_string(res.first) << "\n\n";
      std::cout << options.help_text() << std::endl;
      return 1;
    }
    if (caf::get_or(cfg, "help", false)) {
      std::cout << options.help_text() << std::endl;
      return 0;
    }
    ionbin::test::config = {
      std::make_move_iterator(std::begin(test_args)),
      std::make_move_iterator(std::end(test_args)),
    };
  }
  caf::settings log_settings;
  put(log_settings, "ionbin.console-verbosity", ionbin_loglevel);
  put(log_settings, "ionbin.console-format", "%^[%s:%#] %v%$");
  auto log_context = ionbin::create_log_context(log_settings);
  if (not log_context) {
    fmt::print(stderr, "failed to set up logging: {}\n",
               ionbin::render(log_context.error()));
    return EXIT_FAILURE;
  }
  return caf::test::main(argc, argv);
}
