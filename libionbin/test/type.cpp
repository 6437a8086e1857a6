//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause
#include "ionbin/type.hpp"

#include "ionbin/scalar.hpp"
#include "ionbin/test/test.hpp"

#include <cmath>
#include <limits>
#include <string>

using namespace ionbin;
using namespace std::string_literals;

TEST("type octets") {
  auto [id, nibble] = split_type_octet(std::byte{0xD1});
  CHECK_EQUAL(id, 0xDu);
  CHECK_EQUAL(nibble, 1u);
  CHECK(logical_type(static_cast<type_id>(id)) == value_type::struct_);
  CHECK(logical_type(type_id::negative_int) == value_type::int_);
  CHECK(logical_type(type_id::positive_int) == value_type::int_);
  CHECK(not logical_type(type_id::annotation));
}

TEST("type predicates") {
  CHECK(is_container(value_type::sexp));
  CHECK(not is_container(value_type::string));
  CHECK(is_text(value_type::symbol));
  CHECK(is_lob(value_type::clob));
  CHECK(not is_lob(value_type::string));
  CHECK_EQUAL(fmt::format("{}", value_type::struct_), "struct"s);
}

TEST("scalar rendering") {
  CHECK_EQUAL(to_string(scalar{true}), "true"s);
  CHECK_EQUAL(to_string(scalar{integer{-42}}), "-42"s);
  CHECK_EQUAL(to_string(scalar{1.5}), "1.5e0"s);
  CHECK_EQUAL(to_string(scalar{std::numeric_limits<double>::infinity()}),
              "+inf"s);
  CHECK_EQUAL(to_string(scalar{std::nan("")}), "nan"s);
  CHECK_EQUAL(to_string(scalar{std::string{"foo"}}), "\"foo\""s);
  CHECK_EQUAL(to_string(scalar{symbol_token{.id = 3}}), "$3"s);
  CHECK_EQUAL(to_string(scalar{blob{std::byte{0x0A}, std::byte{0xFF}}}),
              "{0AFF}"s);
}
