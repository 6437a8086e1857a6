//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/fwd.hpp"

#include "ionbin/chunk.hpp"

#include <caf/expected.hpp>

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace ionbin {

/// An immutable view on a sequence of chunks. Every read returns the read
/// bytes together with a new view on the remainder and leaves the receiver
/// untouched, so a failed read never loses data.
///
/// Reads that need more bytes than the view holds fail with `ec::incomplete`.
class chunked_buffer {
public:
  /// @returns a view without any bytes.
  static auto empty() -> chunked_buffer;

  /// Appends a chunk to the end of the view.
  /// @returns a new view, or `ec::invalid_argument` if *chunk* is null or
  /// empty.
  auto extend(chunk_ptr chunk) const -> caf::expected<chunked_buffer>;

  /// @returns the number of unread bytes.
  auto size() const noexcept -> size_t {
    return size_;
  }

  /// Reads a single byte.
  auto read_byte() const -> caf::expected<std::pair<std::byte, chunked_buffer>>;

  /// Reads *n* bytes as one contiguous chunk. The result shares memory with
  /// the underlying chunk if the bytes do not straddle a chunk boundary.
  auto read_slice(size_t n) const
    -> caf::expected<std::pair<chunk_ptr, chunked_buffer>>;

  /// Discards up to *n* bytes.
  /// @returns the number of discarded bytes and the remainder.
  auto skip(size_t n) const -> std::pair<size_t, chunked_buffer>;

private:
  using chunk_list = std::vector<chunk_ptr>;

  chunked_buffer(std::shared_ptr<const chunk_list> chunks, size_t index,
                 size_t offset, size_t size);

  /// @returns the view after the first *n* bytes.
  /// @pre `n <= size()`
  auto advance(size_t n) const -> chunked_buffer;

  /// Shared between all views derived from the same `extend()`.
  std::shared_ptr<const chunk_list> chunks_;

  /// The index of the first chunk with unread bytes.
  size_t index_ = 0;

  /// The number of read bytes in the first chunk.
  size_t offset_ = 0;

  /// The number of unread bytes across all chunks.
  size_t size_ = 0;
};

} // namespace ionbin
