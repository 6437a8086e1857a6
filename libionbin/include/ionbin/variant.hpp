//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/fwd.hpp"

#include "ionbin/detail/assert.hpp"
#include "ionbin/detail/overload.hpp"

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

namespace ionbin {

namespace detail {

template <class Result, class F>
auto make_conversion_wrapper(F f) -> auto {
  return [f = std::move(f)]<class... Args>(Args&&... args) -> Result {
    static_assert(std::invocable<F, Args...>);
    if constexpr (std::same_as<std::invoke_result_t<F, Args...>, void>) {
      IONBIN_UNREACHABLE();
    } else {
      return Result{std::invoke(f, std::forward<Args>(args)...)};
    }
  };
}

template <class Result, class Variant, class... Fs>
auto match(Variant&& variant, Fs&&... fs) -> decltype(auto) {
  if constexpr (std::same_as<Result, void>) {
    return std::visit(detail::overload{std::forward<Fs>(fs)...},
                      std::forward<Variant>(variant));
  } else {
    return std::visit(make_conversion_wrapper<Result>(
                        detail::overload{std::forward<Fs>(fs)...}),
                      std::forward<Variant>(variant));
  }
}

} // namespace detail

/// A `std::variant` with an overload-set based `match()`.
template <class... Ts>
class variant : public std::variant<Ts...> {
public:
  using std::variant<Ts...>::variant;

  template <class T>
  static constexpr auto can_have = (std::same_as<T, Ts> || ...);

  template <class Result = void, class... Fs>
  auto match(Fs&&... fs) & -> decltype(auto) {
    return detail::match<Result>(as_std(), std::forward<Fs>(fs)...);
  }

  template <class Result = void, class... Fs>
  auto match(Fs&&... fs) const& -> decltype(auto) {
    return detail::match<Result>(as_std(), std::forward<Fs>(fs)...);
  }

  template <class Result = void, class... Fs>
  auto match(Fs&&... fs) && -> decltype(auto) {
    return detail::match<Result>(std::move(*this).as_std(),
                                 std::forward<Fs>(fs)...);
  }

  auto as_std() & -> std::variant<Ts...>& {
    return *this;
  }

  auto as_std() const& -> const std::variant<Ts...>& {
    return *this;
  }

  auto as_std() && -> std::variant<Ts...>&& {
    return std::move(*this);
  }
};

/// Returns a pointer to the alternative `T` of `x` or `nullptr`.
template <class T, class... Ts>
auto try_as(variant<Ts...>& x) -> T* {
  return std::get_if<T>(&x.as_std());
}

template <class T, class... Ts>
auto try_as(const variant<Ts...>& x) -> const T* {
  return std::get_if<T>(&x.as_std());
}

/// Checks whether `x` currently holds a `T`.
template <class T, class... Ts>
auto is(const variant<Ts...>& x) -> bool {
  return std::holds_alternative<T>(x.as_std());
}

} // namespace ionbin
