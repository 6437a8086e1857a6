//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause
#include "ionbin/error.hpp"

#include "ionbin/test/test.hpp"

#include <string>

using namespace ionbin;
using namespace std::string_literals;

TEST("error codes render with their context") {
  CHECK_EQUAL(render(caf::error{}), ""s);
  CHECK_EQUAL(render(caf::make_error(ec::incomplete)), "!! incomplete"s);
  auto err = caf::make_error(ec::malformed_input, "bad octet");
  CHECK_EQUAL(render(err), "!! malformed_input: bad octet"s);
  err = add_context(err, "at offset {}", 3);
  CHECK_EQUAL(render(err), "!! malformed_input: bad octet at offset 3"s);
  CHECK_EQUAL(err, ec::malformed_input);
}

TEST("context on an empty error") {
  auto err = add_context(caf::error{}, "ignored");
  CHECK(not err);
}

TEST("malformed input helper") {
  auto err = make_malformed_error("length {} exceeds {}", 5, 4);
  CHECK_EQUAL(err, ec::malformed_input);
  CHECK_EQUAL(render(err), "!! malformed_input: length 5 exceeds 4"s);
}

TEST("error code names") {
  CHECK_EQUAL(std::string{to_string(ec::protocol_violation)},
              "protocol_violation"s);
  CHECK_EQUAL(fmt::format("{}", ec::recursion_limit_reached),
              "recursion_limit_reached"s);
}
