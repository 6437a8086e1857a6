//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/chunk.hpp"

#include <cstddef>
#include <cstring>
#include <memory>
#include <span>

namespace ionbin {

// -- constructors, destructors, and assignment operators ----------------------

chunk::~chunk() noexcept {
  if (deleter_) {
    std::invoke(deleter_);
  }
}

// -- factory functions ------------------------------------------------------

auto chunk::make(const void* data, size_type size, deleter_type&& deleter)
  -> chunk_ptr {
  return make(view_type{static_cast<pointer>(data), size}, std::move(deleter));
}

auto chunk::make(view_type view, deleter_type&& deleter) -> chunk_ptr {
  return chunk_ptr{new chunk{view, std::move(deleter)}, false};
}

auto chunk::make_empty() -> chunk_ptr {
  return chunk_ptr{new chunk{view_type{}, deleter_type{}}, false};
}

auto chunk::copy(const void* data, size_t size) -> chunk_ptr {
  // A shared pointer keeps the deleter copyable.
  auto copy = std::shared_ptr<value_type[]>{new value_type[size]};
  if (size > 0) {
    std::memcpy(copy.get(), data, size);
  }
  const auto* copy_data = copy.get();
  return make(copy_data, size, [copy = std::move(copy)]() noexcept {
    static_cast<void>(copy);
  });
}

// -- container facade ---------------------------------------------------------

auto chunk::data() const noexcept -> pointer {
  return view_.data();
}

auto chunk::size() const noexcept -> size_type {
  return view_.size();
}

auto chunk::begin() const noexcept -> iterator {
  return view_.begin();
}

auto chunk::end() const noexcept -> iterator {
  return view_.end();
}

// -- accessors ----------------------------------------------------------------

auto chunk::slice(size_type start, size_type length) const -> chunk_ptr {
  IONBIN_ASSERT(start <= size());
  if (length > size() - start) {
    length = size() - start;
  }
  return slice(view_.subspan(start, length));
}

auto chunk::slice(view_type view) const -> chunk_ptr {
  IONBIN_ASSERT(view.data() >= data() || view.empty());
  IONBIN_ASSERT(view.data() + view.size() <= data() + size() || view.empty());
  this->ref();
  return make(view, [this]() noexcept {
    this->deref();
  });
}

// -- concepts -----------------------------------------------------------------

auto as_bytes(const chunk_ptr& x) noexcept -> chunk::view_type {
  if (not x) {
    return {};
  }
  return x->view_;
}

// -- implementation details ---------------------------------------------------

chunk::chunk(view_type view, deleter_type&& deleter) noexcept
  : view_{view}, deleter_{std::move(deleter)} {
}

auto split(const chunk_ptr& chunk, size_t partition_point)
  -> std::pair<chunk_ptr, chunk_ptr> {
  if (partition_point == 0) {
    return {chunk::make_empty(), chunk};
  }
  if (partition_point >= size(chunk)) {
    return {chunk, chunk::make_empty()};
  }
  return {
    chunk->slice(0, partition_point),
    chunk->slice(partition_point),
  };
}

auto size(const chunk_ptr& chunk) -> uint64_t {
  return chunk ? chunk->size() : 0;
}

} // namespace ionbin
