//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/configuration.hpp"

#include "ionbin/error.hpp"
#include "ionbin/logger.hpp"

#include <caf/config_value.hpp>
#include <caf/deep_to_string.hpp>

#include <cstdint>

namespace ionbin {

auto reader_options::make(const caf::settings& cfg)
  -> caf::expected<reader_options> {
  auto result = reader_options{};
  if (const auto* value = caf::get_if(&cfg, "ionbin.reader.max-depth")) {
    auto max_depth = caf::get_as<int64_t>(*value);
    if (not max_depth or *max_depth <= 0) {
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("ionbin.reader.max-depth must be a "
                                         "positive integer, got {}",
                                         caf::deep_to_string(*value)));
    }
    result.max_depth = static_cast<size_t>(*max_depth);
  }
  if (const auto* value = caf::get_if(&cfg, "ionbin.reader.materialize")) {
    auto materialize = caf::get_as<bool>(*value);
    if (not materialize) {
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("ionbin.reader.materialize must be a "
                                         "boolean, got {}",
                                         caf::deep_to_string(*value)));
    }
    result.materialize = *materialize;
  }
  IONBIN_DEBUG("reader options: max-depth = {}, materialize = {}",
               result.max_depth, result.materialize);
  return result;
}

} // namespace ionbin
