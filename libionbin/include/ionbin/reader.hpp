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
#include "ionbin/chunked_buffer.hpp"
#include "ionbin/configuration.hpp"
#include "ionbin/context_stack.hpp"
#include "ionbin/event.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ionbin {

/// The kinds of requests that drive the reader.
enum class request_kind : uint8_t {
  /// Decode the next event.
  next,
  /// Discard the rest of the innermost container.
  skip,
  /// Append bytes to the stream.
  data,
};

/// @relates request_kind
auto to_string(request_kind x) -> const char*;

/// A single request to the reader.
struct request {
  request_kind kind = request_kind::next;

  /// The appended bytes of a data request.
  chunk_ptr chunk = {};

  static auto next() -> request;

  static auto skip() -> request;

  static auto data(chunk_ptr chunk) -> request;
};

/// A resumable decoder for the binary format. Each call to `advance()`
/// answers one request with one event. When the buffered bytes do not hold
/// a complete value, the reader answers with a stream signal and expects a
/// data request next; a value is never partially consumed.
///
/// Malformed input and misuse of the request protocol are fatal: the reader
/// answers every later request with the same error.
class reader {
public:
  reader();

  explicit reader(reader_options options);

  /// Processes a request.
  /// @returns the next event, or an error with the code
  /// `ec::malformed_input`, `ec::protocol_violation` or
  /// `ec::recursion_limit_reached`.
  auto advance(request req) -> caf::expected<event>;

  /// @returns the number of bytes consumed from the stream.
  auto cursor() const noexcept -> uint64_t {
    return cursor_;
  }

  /// @returns the depth of the values in the innermost open container.
  auto depth() const noexcept -> size_t {
    return stack_.top().depth;
  }

  /// @returns the number of buffered but unconsumed bytes.
  auto buffered() const noexcept -> size_t {
    return buffer_.size();
  }

  auto options() const noexcept -> const reader_options& {
    return options_;
  }

private:
  auto accept(request req) -> caf::error;

  auto step() -> caf::expected<event>;

  auto finish(event result, uint64_t container_length)
    -> caf::expected<event>;

  auto fail(caf::error err) -> caf::error;

  reader_options options_;
  chunked_buffer buffer_;
  context_stack stack_;
  uint64_t cursor_ = 0;
  request_kind mode_ = request_kind::next;
  bool expect_data_ = false;
  bool expect_version_marker_ = true;
  caf::error failure_;
};

/// Drives a reader over a sequence of chunks until the stream ends.
/// @returns all events except the stream signals, or `ec::end_of_input` if
/// the chunks end in the middle of a value.
auto read_all(reader& r, std::span<const chunk_ptr> chunks)
  -> caf::expected<std::vector<event>>;

} // namespace ionbin

template <>
struct fmt::formatter<ionbin::request_kind> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(ionbin::request_kind x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(ionbin::to_string(x), ctx);
  }
};
