//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/detail/assert.hpp"

#include <array>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <span>
#include <type_traits>

namespace ionbin {

namespace concepts {

/// Contiguous byte buffers
template <class T>
concept byte_container = requires(T& t) {
  std::data(t);
  std::size(t);
  requires sizeof(decltype(*std::data(t))) == 1;
};

} // namespace concepts

template <size_t Extent = std::dynamic_extent>
auto as_bytes(const void* data, size_t size) noexcept
  -> std::span<const std::byte, Extent> {
  if constexpr (Extent != std::dynamic_extent) {
    IONBIN_ASSERT(size >= Extent);
  }
  return std::span<const std::byte, Extent>{
    reinterpret_cast<const std::byte*>(data), size};
}

template <std::integral T, size_t N>
constexpr auto as_bytes(const std::array<T, N>& xs) noexcept
  -> std::span<const std::byte, N * sizeof(T)> {
  const auto* const data = reinterpret_cast<const std::byte*>(xs.data());
  return std::span<const std::byte, N * sizeof(T)>{data, N * sizeof(T)};
}

template <concepts::byte_container Buffer>
constexpr auto
as_bytes(const Buffer& xs) noexcept -> std::span<const std::byte> {
  const auto* const data = reinterpret_cast<const std::byte*>(std::data(xs));
  return {data, std::size(xs)};
}

} // namespace ionbin
