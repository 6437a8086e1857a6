//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/chunked_buffer.hpp"

#include "ionbin/error.hpp"
#include "ionbin/test/test.hpp"

#include <cstddef>

using namespace ionbin;

namespace {

auto octet(const std::pair<std::byte, chunked_buffer>& x) -> int {
  return std::to_integer<int>(x.first);
}

} // namespace

TEST("empty buffer") {
  auto buffer = chunked_buffer::empty();
  CHECK_EQUAL(buffer.size(), 0u);
  auto byte = buffer.read_byte();
  REQUIRE(not byte);
  CHECK_EQUAL(byte.error(), ec::incomplete);
  auto slice = buffer.read_slice(1);
  REQUIRE(not slice);
  CHECK_EQUAL(slice.error(), ec::incomplete);
  auto [skipped, rest] = buffer.skip(3);
  CHECK_EQUAL(skipped, 0u);
  CHECK_EQUAL(rest.size(), 0u);
}

TEST("extending rejects empty chunks") {
  auto buffer = chunked_buffer::empty();
  auto null = buffer.extend(nullptr);
  REQUIRE(not null);
  CHECK_EQUAL(null.error(), ec::invalid_argument);
  auto empty = buffer.extend(chunk::make_empty());
  REQUIRE(not empty);
  CHECK_EQUAL(empty.error(), ec::invalid_argument);
}

TEST("reads leave the receiver untouched") {
  auto buffer = unbox(chunked_buffer::empty().extend(test::bytes({1, 2})));
  auto first = unbox(buffer.read_byte());
  CHECK_EQUAL(octet(first), 1);
  CHECK_EQUAL(first.second.size(), 1u);
  CHECK_EQUAL(buffer.size(), 2u);
  auto again = unbox(buffer.read_byte());
  CHECK_EQUAL(octet(again), 1);
  auto second = unbox(first.second.read_byte());
  CHECK_EQUAL(octet(second), 2);
  CHECK_EQUAL(second.second.size(), 0u);
}

TEST("reading across chunk boundaries") {
  auto buffer = unbox(chunked_buffer::empty().extend(test::bytes({1, 2})));
  buffer = unbox(buffer.extend(test::bytes({3})));
  buffer = unbox(buffer.extend(test::bytes({4, 5, 6})));
  CHECK_EQUAL(buffer.size(), 6u);
  auto [head, rest] = unbox(buffer.read_byte());
  CHECK_EQUAL(std::to_integer<int>(head), 1);
  auto [merged, tail] = unbox(rest.read_slice(3));
  REQUIRE_EQUAL(merged->size(), 3u);
  CHECK_EQUAL(std::to_integer<int>(merged->data()[0]), 2);
  CHECK_EQUAL(std::to_integer<int>(merged->data()[1]), 3);
  CHECK_EQUAL(std::to_integer<int>(merged->data()[2]), 4);
  CHECK_EQUAL(tail.size(), 2u);
  auto last = unbox(tail.read_byte());
  CHECK_EQUAL(octet(last), 5);
}

TEST("slices within a chunk share memory") {
  auto chunk = test::bytes({1, 2, 3, 4});
  auto buffer = unbox(chunked_buffer::empty().extend(chunk));
  auto [skipped, rest] = buffer.skip(1);
  CHECK_EQUAL(skipped, 1u);
  auto [slice, tail] = unbox(rest.read_slice(2));
  CHECK(slice->data() == chunk->data() + 1);
  CHECK_EQUAL(tail.size(), 1u);
  auto [empty, same] = unbox(tail.read_slice(0));
  CHECK_EQUAL(empty->size(), 0u);
  CHECK_EQUAL(same.size(), 1u);
}

TEST("slices longer than the buffer are incomplete") {
  auto buffer = unbox(chunked_buffer::empty().extend(test::bytes({1, 2})));
  auto slice = buffer.read_slice(3);
  REQUIRE(not slice);
  CHECK_EQUAL(slice.error(), ec::incomplete);
}

TEST("partial skip") {
  auto buffer = unbox(chunked_buffer::empty().extend(test::bytes({1, 2})));
  buffer = unbox(buffer.extend(test::bytes({3})));
  auto [skipped, rest] = buffer.skip(5);
  CHECK_EQUAL(skipped, 3u);
  CHECK_EQUAL(rest.size(), 0u);
  rest = unbox(rest.extend(test::bytes({7})));
  auto next = unbox(rest.read_byte());
  CHECK_EQUAL(octet(next), 7);
}
