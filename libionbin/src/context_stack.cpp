//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/context_stack.hpp"

#include "ionbin/detail/assert.hpp"

namespace ionbin {

auto to_string(const context_frame& x) -> std::string {
  if (not x.type) {
    return fmt::format("top-level(depth={})", x.depth);
  }
  return fmt::format("{}(depth={}, limit={})", *x.type, x.depth,
                     x.limit.value_or(0));
}

context_stack::context_stack() : frames_{context_frame{}} {
}

auto context_stack::top() const noexcept -> const context_frame& {
  return frames_.back();
}

auto context_stack::at_top_level() const noexcept -> bool {
  return frames_.size() == 1;
}

auto context_stack::size() const noexcept -> size_t {
  return frames_.size();
}

auto context_stack::push(value_type type, uint64_t limit)
  -> const context_frame& {
  IONBIN_ASSERT(is_container(type));
  const auto mode
    = type == value_type::struct_ ? frame_mode::fields : frame_mode::sequence;
  frames_.push_back(context_frame{
    .mode = mode,
    .type = type,
    .depth = top().depth + 1,
    .limit = limit,
  });
  return frames_.back();
}

auto context_stack::pop() -> context_frame {
  IONBIN_ASSERT(not at_top_level());
  auto result = std::move(frames_.back());
  frames_.pop_back();
  return result;
}

} // namespace ionbin
