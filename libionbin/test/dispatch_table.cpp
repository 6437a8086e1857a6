//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause
#include "ionbin/dispatch_table.hpp"

#include "ionbin/test/test.hpp"

#include <cstddef>

using namespace ionbin;

namespace {

auto at(int octet) -> const dispatch::handler& {
  return dispatch::lookup(static_cast<std::byte>(octet));
}

} // namespace

TEST("every octet has a handler") {
  size_t invalid = 0;
  for (size_t i = 0; i < 256; ++i) {
    if (is<dispatch::invalid>(dispatch::table()[i])) {
      ++invalid;
    }
  }
  // 0x12-0x1E, 0x30, the twelve unbound float lengths, 0xE1, 0xE2, 0xEF,
  // and the reserved type 0xF.
  CHECK_EQUAL(invalid, 13u + 1u + 12u + 3u + 16u);
}

TEST("version marker and padding") {
  CHECK(is<dispatch::version_marker>(at(0xE0)));
  const auto* pad = try_as<dispatch::padding>(at(0x03));
  REQUIRE(pad != nullptr);
  CHECK_EQUAL(pad->length.value_or(99), 3u);
  const auto* long_pad = try_as<dispatch::padding>(at(0x0E));
  REQUIRE(long_pad != nullptr);
  CHECK(not long_pad->length);
  CHECK(is<dispatch::null>(at(0x0F)));
}

TEST("nulls carry their type") {
  for (auto [octet, type] : {std::pair{0x1F, value_type::bool_},
                             std::pair{0x3F, value_type::int_},
                             std::pair{0x7F, value_type::symbol},
                             std::pair{0xAF, value_type::blob},
                             std::pair{0xDF, value_type::struct_}}) {
    const auto* null = try_as<dispatch::null>(at(octet));
    REQUIRE(null != nullptr);
    CHECK_EQUAL(null->type, type);
  }
}

TEST("scalars") {
  const auto* zero = try_as<dispatch::static_scalar>(at(0x20));
  REQUIRE(zero != nullptr);
  CHECK_EQUAL(zero->type, value_type::int_);
  const auto* negative = try_as<dispatch::length_scalar>(at(0x35));
  REQUIRE(negative != nullptr);
  CHECK_EQUAL(negative->codec, scalar_codec::negative_int);
  CHECK_EQUAL(negative->length.value_or(0), 5u);
  const auto* string = try_as<dispatch::length_scalar>(at(0x8E));
  REQUIRE(string != nullptr);
  CHECK_EQUAL(string->type, value_type::string);
  CHECK(not string->length);
  const auto* clob = try_as<dispatch::length_scalar>(at(0x91));
  REQUIRE(clob != nullptr);
  CHECK_EQUAL(clob->type, value_type::clob);
  CHECK_EQUAL(clob->codec, scalar_codec::lob);
  CHECK(is<dispatch::length_scalar>(at(0x44)));
  CHECK(is<dispatch::length_scalar>(at(0x48)));
  CHECK(is<dispatch::invalid>(at(0x45)));
}

TEST("containers") {
  const auto* list = try_as<dispatch::container_start>(at(0xB0));
  REQUIRE(list != nullptr);
  CHECK_EQUAL(list->type, value_type::list);
  CHECK_EQUAL(list->length.value_or(99), 0u);
  const auto* sexp = try_as<dispatch::container_start>(at(0xCE));
  REQUIRE(sexp != nullptr);
  CHECK(not sexp->length);
  const auto* ordered = try_as<dispatch::container_start>(at(0xD1));
  REQUIRE(ordered != nullptr);
  CHECK(ordered->ordered);
  CHECK(not ordered->length);
  const auto* plain = try_as<dispatch::container_start>(at(0xD2));
  REQUIRE(plain != nullptr);
  CHECK(not plain->ordered);
}

TEST("annotation wrappers") {
  CHECK(is<dispatch::invalid>(at(0xE1)));
  CHECK(is<dispatch::invalid>(at(0xE2)));
  CHECK(is<dispatch::invalid>(at(0xEF)));
  const auto* wrapper = try_as<dispatch::annotation_wrapper>(at(0xE3));
  REQUIRE(wrapper != nullptr);
  CHECK_EQUAL(wrapper->length.value_or(0), 3u);
}
