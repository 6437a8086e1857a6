//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause
#include "ionbin/event.hpp"

#include "ionbin/error.hpp"
#include "ionbin/test/test.hpp"

#include <string>

using namespace ionbin;
using namespace std::string_literals;

namespace {

auto lazy(scalar_codec codec, std::initializer_list<int> xs) -> lazy_scalar {
  return lazy_scalar{codec, test::bytes(xs)};
}

} // namespace

TEST("kind predicates") {
  CHECK(is_stream_signal(event_kind::stream_end));
  CHECK(is_stream_signal(event_kind::stream_incomplete));
  CHECK(not is_stream_signal(event_kind::version_marker));
  CHECK(begins_value(event_kind::container_start));
  CHECK(begins_value(event_kind::scalar));
  CHECK(not begins_value(event_kind::container_end));
  CHECK(ends_container(event_kind::container_end));
}

TEST("lazy and materialized values compare equal") {
  auto x = event::make_scalar(value_type::int_,
                              lazy(scalar_codec::negative_int, {0x01, 0x00}),
                              2);
  CHECK(x.is_lazy());
  auto y = event::make_scalar(value_type::int_, scalar{integer{-256}}, 2);
  CHECK(not y.is_lazy());
  CHECK_EQUAL(x, y);
  CHECK(x != event::make_scalar(value_type::int_, scalar{integer{-256}}, 1));
  CHECK(x
        != event::make_scalar(value_type::int_, scalar{integer{-256}}, 2)
             .with_field_name(symbol_token{.id = 10}));
}

TEST("negative zero integers are zero") {
  auto x = event::make_scalar(value_type::int_,
                              lazy(scalar_codec::negative_int, {0x00}), 0);
  CHECK_EQUAL(x, event::make_scalar(value_type::int_, scalar{integer{0}}, 0));
}

TEST("values that fail to decode are unequal") {
  auto x = event::make_scalar(value_type::string,
                              lazy(scalar_codec::string, {0xFF}), 0);
  CHECK(x != x);
  auto materialized = x.materialize();
  REQUIRE(not materialized);
  CHECK_EQUAL(materialized.error(), ec::malformed_input);
}

TEST("materialization is repeatable") {
  auto x = event::make_scalar(value_type::decimal,
                              lazy(scalar_codec::decimal, {0xC1, 0x01}), 0);
  auto first = unbox(x.materialize());
  auto second = unbox(x.materialize());
  REQUIRE(first.has_value());
  CHECK(first == second);
  CHECK_EQUAL(to_string(*first), "0.1"s);
  auto null = event::make_null(value_type::decimal, 0);
  CHECK(null.is_null());
  CHECK(not unbox(null.materialize()).has_value());
}

TEST("with value") {
  auto x = event::make_scalar(value_type::symbol,
                              lazy(scalar_codec::symbol, {0x05}), 0);
  auto y = std::move(x).with_value(scalar{symbol_token{.id = 5, .text = "a"}});
  CHECK(not y.is_lazy());
  CHECK_EQUAL(to_string(y), "scalar(symbol, 'a', depth=0)"s);
}

TEST("rendering") {
  CHECK_EQUAL(to_string(event::make_stream_end()), "stream_end(depth=0)"s);
  CHECK_EQUAL(to_string(event::make_null(value_type::list, 1)
                          .with_annotations({symbol_token{.id = 4},
                                             symbol_token{.id = 7}})
                          .with_field_name(symbol_token{.id = 9})),
              "scalar(list, $9: $4::$7::null, depth=1)"s);
  CHECK_EQUAL(fmt::format("{}", event::make_container_start(value_type::sexp,
                                                            0)),
              "container_start(sexp, depth=0)"s);
  CHECK_EQUAL(to_string(event::make_scalar(
                value_type::string, lazy(scalar_codec::string, {0xFF}), 0)),
              "scalar(string, <string>, depth=0)"s);
}
