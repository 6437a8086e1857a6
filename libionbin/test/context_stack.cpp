//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause
#include "ionbin/context_stack.hpp"

#include "ionbin/test/test.hpp"

#include <string>

using namespace ionbin;
using namespace std::string_literals;

TEST("top level") {
  auto stack = context_stack{};
  CHECK(stack.at_top_level());
  CHECK_EQUAL(stack.size(), 1u);
  CHECK(stack.top() == context_frame{});
  CHECK_EQUAL(to_string(stack.top()), "top-level(depth=0)"s);
}

TEST("push and pop") {
  auto stack = context_stack{};
  const auto& list = stack.push(value_type::list, 10);
  CHECK(list.mode == frame_mode::sequence);
  CHECK_EQUAL(list.depth, 1u);
  CHECK_EQUAL(list.limit.value_or(0), 10u);
  const auto& record = stack.push(value_type::struct_, 8);
  CHECK(record.mode == frame_mode::fields);
  CHECK_EQUAL(record.depth, 2u);
  CHECK_EQUAL(stack.size(), 3u);
  CHECK_EQUAL(fmt::format("{}", stack.top()), "struct(depth=2, limit=8)"s);
  auto popped = stack.pop();
  CHECK(popped.type == value_type::struct_);
  CHECK_EQUAL(stack.top().depth, 1u);
  stack.pop();
  CHECK(stack.at_top_level());
}
