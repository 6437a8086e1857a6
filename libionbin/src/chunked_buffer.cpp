//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/chunked_buffer.hpp"

#include "ionbin/detail/assert.hpp"
#include "ionbin/error.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>

namespace ionbin {

chunked_buffer::chunked_buffer(std::shared_ptr<const chunk_list> chunks,
                               size_t index, size_t offset, size_t size)
  : chunks_{std::move(chunks)}, index_{index}, offset_{offset}, size_{size} {
}

auto chunked_buffer::empty() -> chunked_buffer {
  return {std::make_shared<const chunk_list>(), 0, 0, 0};
}

auto chunked_buffer::extend(chunk_ptr chunk) const
  -> caf::expected<chunked_buffer> {
  if (not chunk or chunk->size() == 0) {
    return caf::make_error(ec::invalid_argument,
                           "cannot extend a buffer with an empty chunk");
  }
  auto chunks = chunk_list{};
  chunks.reserve(chunks_->size() - index_ + 1);
  std::copy(chunks_->begin() + static_cast<ptrdiff_t>(index_), chunks_->end(),
            std::back_inserter(chunks));
  const auto added = chunk->size();
  chunks.push_back(std::move(chunk));
  return chunked_buffer{std::make_shared<const chunk_list>(std::move(chunks)),
                        0, offset_, size_ + added};
}

auto chunked_buffer::read_byte() const
  -> caf::expected<std::pair<std::byte, chunked_buffer>> {
  if (size_ == 0) {
    return caf::make_error(ec::incomplete);
  }
  const auto& front = (*chunks_)[index_];
  return std::pair{front->data()[offset_], advance(1)};
}

auto chunked_buffer::read_slice(size_t n) const
  -> caf::expected<std::pair<chunk_ptr, chunked_buffer>> {
  if (n > size_) {
    return caf::make_error(ec::incomplete);
  }
  if (n == 0) {
    return std::pair{chunk::make_empty(), *this};
  }
  const auto& front = (*chunks_)[index_];
  if (front->size() - offset_ >= n) {
    return std::pair{front->slice(offset_, n), advance(n)};
  }
  // The slice straddles chunk boundaries, so we merge the pieces.
  auto merged = std::vector<std::byte>{};
  merged.reserve(n);
  auto index = index_;
  auto offset = offset_;
  while (merged.size() < n) {
    const auto& current = (*chunks_)[index];
    const auto count = std::min(current->size() - offset, n - merged.size());
    merged.insert(merged.end(), current->begin() + static_cast<ptrdiff_t>(offset),
                  current->begin() + static_cast<ptrdiff_t>(offset + count));
    offset = 0;
    ++index;
  }
  return std::pair{chunk::make(std::move(merged)), advance(n)};
}

auto chunked_buffer::skip(size_t n) const -> std::pair<size_t, chunked_buffer> {
  const auto count = std::min(n, size_);
  return {count, advance(count)};
}

auto chunked_buffer::advance(size_t n) const -> chunked_buffer {
  IONBIN_ASSERT(n <= size_);
  auto index = index_;
  auto offset = offset_ + n;
  // Drop fully consumed chunks from the front of the view.
  while (index < chunks_->size() and offset >= (*chunks_)[index]->size()) {
    offset -= (*chunks_)[index]->size();
    ++index;
  }
  return {chunks_, index, offset, size_ - n};
}

} // namespace ionbin
