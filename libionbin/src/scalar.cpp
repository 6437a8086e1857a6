//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/scalar.hpp"

#include <cmath>

namespace ionbin {

auto to_string(const scalar& x) -> std::string {
  return x.match(
    [](bool y) -> std::string {
      return y ? "true" : "false";
    },
    [](const integer& y) -> std::string {
      return y.str();
    },
    [](double y) -> std::string {
      if (std::isnan(y)) {
        return "nan";
      }
      if (std::isinf(y)) {
        return y > 0 ? "+inf" : "-inf";
      }
      return fmt::format("{}e0", y);
    },
    [](const decimal& y) -> std::string {
      return to_string(y);
    },
    [](const timestamp& y) -> std::string {
      return to_string(y);
    },
    [](const symbol_token& y) -> std::string {
      return to_string(y);
    },
    [](const std::string& y) -> std::string {
      return fmt::format("\"{}\"", y);
    },
    [](const blob& y) -> std::string {
      auto result = std::string{"{"};
      for (auto byte : y) {
        result += fmt::format("{:02X}", std::to_integer<unsigned>(byte));
      }
      result += "}";
      return result;
    });
}

} // namespace ionbin
