//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/fwd.hpp"

#include "ionbin/type.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ionbin {

/// How the values of a frame are laid out.
enum class frame_mode : uint8_t {
  /// Plain values, at the top level or in a list or sexp.
  sequence,
  /// Each value is preceded by a VarUInt field name.
  fields,
};

/// An open container, or the top level of the stream.
struct context_frame {
  frame_mode mode = frame_mode::sequence;

  /// The container type; absent for the top level.
  std::optional<value_type> type = {};

  /// The depth of the values inside this frame.
  size_t depth = 0;

  /// The stream offset at which the container ends; absent for the top level.
  std::optional<uint64_t> limit = {};

  friend auto operator==(const context_frame&, const context_frame&) -> bool
    = default;
};

/// @relates context_frame
auto to_string(const context_frame& x) -> std::string;

/// The stack of open containers. The bottom frame is the top level of the
/// stream and never gets popped.
class context_stack {
public:
  context_stack();

  /// @returns the innermost frame.
  auto top() const noexcept -> const context_frame&;

  /// @returns whether no container is open.
  auto at_top_level() const noexcept -> bool;

  /// @returns the number of frames, including the top level.
  auto size() const noexcept -> size_t;

  /// Opens a container that ends at stream offset *limit*.
  /// @pre `is_container(type)`
  auto push(value_type type, uint64_t limit) -> const context_frame&;

  /// Closes the innermost container.
  /// @pre `not at_top_level()`
  auto pop() -> context_frame;

private:
  std::vector<context_frame> frames_;
};

} // namespace ionbin

template <>
struct fmt::formatter<ionbin::context_frame> : fmt::formatter<std::string> {
  template <class FormatContext>
  auto format(const ionbin::context_frame& x, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(to_string(x), ctx);
  }
};
