//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/fwd.hpp"

#include "ionbin/as_bytes.hpp"
#include "ionbin/detail/assert.hpp"

#include <caf/intrusive_ptr.hpp>
#include <caf/ref_counted.hpp>
#include <fmt/format.h>

#include <cstddef>
#include <cstring>
#include <functional>
#include <limits>
#include <memory>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

namespace ionbin {

/// A reference-counted contiguous block of memory. A chunk supports custom
/// deleters for custom deallocations when the last instance goes out of scope.
class chunk final : public caf::ref_counted {
public:
  // -- member types -----------------------------------------------------------

  using value_type = std::byte;
  using view_type = std::span<const value_type>;
  using pointer = typename view_type::pointer;
  using size_type = typename view_type::size_type;
  using iterator = typename view_type::iterator;
  using deleter_type = std::function<void()>;

  // -- constructors, destructors, and assignment operators --------------------

  /// Forbid all means of construction explicitly.
  chunk() noexcept = delete;
  chunk(const chunk&) noexcept = delete;
  chunk& operator=(const chunk&) noexcept = delete;
  chunk(chunk&&) noexcept = delete;
  chunk& operator=(chunk&&) noexcept = delete;

  /// Destroys the chunk and releases owned memory via the deleter.
  ~chunk() noexcept override;

  // -- factory functions ------------------------------------------------------

  /// Constructs a chunk of particular size and pointer to data.
  /// @param data The raw byte data.
  /// @param size The number of bytes *data* points to.
  /// @param deleter The function to delete the data.
  /// @returns A chunk pointer or `nullptr` on failure.
  static auto make(const void* data, size_type size, deleter_type&& deleter)
    -> chunk_ptr;

  /// Constructs a chunk of particular size and pointer to data.
  /// @param view The span holding the raw data.
  /// @param deleter The function to delete the data.
  /// @returns A chunk pointer or `nullptr` on failure.
  static auto make(view_type view, deleter_type&& deleter) -> chunk_ptr;

  /// Constructs an empty chunk
  static auto make_empty() -> chunk_ptr;

  /// Construct a chunk from a byte buffer, and bind the lifetime of the chunk
  /// to the buffer.
  /// @param buffer The byte buffer.
  /// @note This overload can only be selected if the buffer is an
  /// rvalue-reference, and an overload of *as_bytes* exists for the buffer. This
  /// is intended to guard against accidental copies when calling this function.
  /// @returns A chunk pointer or `nullptr` on failure.
  template <class Buffer>
    requires(not std::is_lvalue_reference_v<Buffer> && //
             requires(const Buffer& buffer) {
               { as_bytes(buffer) } -> std::convertible_to<view_type>;
             })
  static auto make(Buffer&& buffer) -> chunk_ptr {
    // Move the buffer into a shared pointer; otherwise, we might run into
    // issues when moving the buffer invalidates the span, e.g., for strings
    // with small buffer optimizations.
    auto movable_buffer = std::make_shared<Buffer>(std::exchange(buffer, {}));
    const auto view = static_cast<view_type>(as_bytes(*movable_buffer));
    return make(view, [buffer = std::move(movable_buffer)]() noexcept {
      static_cast<void>(buffer);
    });
  }

  /// Avoid the common mistake of binding ownership to a span.
  template <class Byte, size_t Extent>
  static auto make(std::span<Byte, Extent>&&) = delete;

  /// Avoid the common mistake of binding ownership to a string view.
  static auto make(std::string_view&&) = delete;

  /// Construct a chunk from a byte buffer by copying it.
  /// @param buffer The byte buffer.
  /// @returns A chunk pointer or `nullptr` on failure.
  template <class Buffer>
    requires requires(const Buffer& buffer) {
      { as_bytes(buffer) } -> std::convertible_to<view_type>;
    }
  static auto copy(const Buffer& buffer) -> chunk_ptr {
    const auto view = static_cast<view_type>(as_bytes(buffer));
    return copy(view.data(), view.size());
  }

  /// Construct a chunk from a byte buffer by copying it.
  /// @param data The pointer to the start of the byte buffer.
  /// @param size The size of the byte buffer.
  /// @returns A chunk pointer or `nullptr` on failure.
  static auto copy(const void* data, size_t size) -> chunk_ptr;

  // -- container facade -------------------------------------------------------

  /// @returns The pointer to the chunk.
  auto data() const noexcept -> pointer;

  /// @returns The size of the chunk.
  auto size() const noexcept -> size_type;

  /// @returns A pointer to the first byte in the chunk.
  auto begin() const noexcept -> iterator;

  /// @returns A pointer to one past the last byte in the chunk.
  auto end() const noexcept -> iterator;

  // -- accessors --------------------------------------------------------------

  /// Creates a new chunk that structurally shares the data of this chunk.
  /// @param start The offset from the beginning where to begin the new chunk.
  /// @param length The length of the slice, beginning at *start*.
  /// @returns A new chunk over the subset.
  /// @pre `start <= size()`
  auto slice(size_type start,
             size_type length = std::numeric_limits<size_type>::max()) const
    -> chunk_ptr;

  /// Creates a new chunk that structurally shares the data of this chunk.
  /// @param view A view of the to-be sliced chunk.
  /// @returns A new chunk over the subset.
  /// @pre `view.begin() >= begin()`
  /// @pre `view.end() <= end()`
  auto slice(view_type view) const -> chunk_ptr;

  // -- concepts --------------------------------------------------------------

  friend auto as_bytes(const chunk_ptr& x) noexcept -> view_type;

private:
  // -- implementation details -------------------------------------------------

  /// Constructs a chunk from a span and a deleter.
  /// @param view The span holding the raw data.
  /// @param deleter The function to delete the data.
  chunk(view_type view, deleter_type&& deleter) noexcept;

  /// A sized view on the raw data.
  const view_type view_;

  /// The function to delete the data.
  deleter_type deleter_;
};

/// Splits a chunk into two chunks at the given position.
/// @pre `partition_point <= size(chunk)`
auto split(const chunk_ptr& chunk, size_t partition_point)
  -> std::pair<chunk_ptr, chunk_ptr>;

/// @returns the number of bytes in a possibly null chunk.
auto size(const chunk_ptr& chunk) -> uint64_t;

} // namespace ionbin

namespace fmt {

template <>
struct formatter<ionbin::chunk_ptr> {
  template <class ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <class FormatContext>
  auto format(const ionbin::chunk_ptr& value, FormatContext& ctx) const {
    if (not value) {
      return fmt::format_to(ctx.out(), "{}", "nullptr");
    }
    return fmt::format_to(ctx.out(), "chunk(size={})", value->size());
  }
};

} // namespace fmt
