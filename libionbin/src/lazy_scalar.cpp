//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/lazy_scalar.hpp"

#include "ionbin/codec.hpp"
#include "ionbin/detail/assert.hpp"
#include "ionbin/error.hpp"

namespace ionbin {

namespace {

template <class T>
auto lift(caf::expected<T> x) -> caf::expected<scalar> {
  if (not x) {
    return std::move(x.error());
  }
  return scalar{std::move(*x)};
}

} // namespace

auto to_string(scalar_codec x) -> const char* {
  switch (x) {
    case scalar_codec::positive_int:
      return "positive_int";
    case scalar_codec::negative_int:
      return "negative_int";
    case scalar_codec::float_:
      return "float";
    case scalar_codec::decimal:
      return "decimal";
    case scalar_codec::timestamp:
      return "timestamp";
    case scalar_codec::symbol:
      return "symbol";
    case scalar_codec::string:
      return "string";
    case scalar_codec::lob:
      return "lob";
  }
  IONBIN_UNREACHABLE();
}

lazy_scalar::lazy_scalar(scalar_codec codec, chunk_ptr bytes)
  : codec_{codec}, bytes_{std::move(bytes)} {
  IONBIN_ASSERT(bytes_ != nullptr);
}

auto lazy_scalar::materialize() const -> caf::expected<scalar> {
  const auto data = bytes();
  switch (codec_) {
    case scalar_codec::positive_int:
      return scalar{decode_uint(data)};
    case scalar_codec::negative_int:
      return scalar{integer{-decode_uint(data)}};
    case scalar_codec::float_:
      return lift(decode_float(data));
    case scalar_codec::decimal:
      return lift(decode_decimal(data));
    case scalar_codec::timestamp:
      return lift(decode_timestamp(data));
    case scalar_codec::symbol:
      return lift(decode_symbol(data));
    case scalar_codec::string:
      return lift(decode_string(data));
    case scalar_codec::lob:
      return scalar{blob{data.begin(), data.end()}};
  }
  IONBIN_UNREACHABLE();
}

} // namespace ionbin
