//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/reader.hpp"

#include "ionbin/codec.hpp"
#include "ionbin/defaults.hpp"
#include "ionbin/detail/assert.hpp"
#include "ionbin/dispatch_table.hpp"
#include "ionbin/error.hpp"
#include "ionbin/logger.hpp"

#include <algorithm>
#include <limits>
#include <optional>
#include <span>
#include <utility>

namespace ionbin {

namespace {

/// The outcome of parsing one item from the buffer.
struct parsed {
  /// The decoded event; absent for padding.
  std::optional<event> value = {};

  /// The declared length of a container start.
  uint64_t container_length = 0;

  /// The buffer after the item.
  chunked_buffer rest;
};

auto apply(const dispatch::handler& handler, chunked_buffer buffer,
           size_t depth) -> caf::expected<parsed>;

/// Returns the length from the type octet or reads the VarUInt after it.
auto read_length(std::optional<uint64_t> length, chunked_buffer buffer)
  -> caf::expected<std::pair<uint64_t, chunked_buffer>> {
  if (length) {
    return std::pair{*length, std::move(buffer)};
  }
  return read_var_uint(buffer);
}

auto parse_annotation_wrapper(std::optional<uint64_t> declared,
                              chunked_buffer buffer, size_t depth)
  -> caf::expected<parsed> {
  auto wrapper = read_length(declared, std::move(buffer));
  if (not wrapper) {
    return std::move(wrapper.error());
  }
  auto [length, rest] = std::move(*wrapper);
  const auto init_size = rest.size();
  auto annotation_length = read_var_uint(rest);
  if (not annotation_length) {
    return std::move(annotation_length.error());
  }
  if (annotation_length->first < 1) {
    return make_malformed_error("annotation wrapper without annotations");
  }
  auto slice = annotation_length->second.read_slice(annotation_length->first);
  if (not slice) {
    return std::move(slice.error());
  }
  auto annotations = decode_annotations(as_bytes(slice->first));
  if (not annotations) {
    return std::move(annotations.error());
  }
  rest = std::move(slice->second);
  const auto consumed = init_size - rest.size();
  if (length <= consumed) {
    return make_malformed_error("annotation wrapper of length {} holds no "
                                "value after {} bytes of annotations",
                                length, consumed);
  }
  // Reject inadmissible wrapped values by their type octet alone.
  auto octet = rest.read_byte();
  if (not octet) {
    return std::move(octet.error());
  }
  const auto& handler = dispatch::lookup(octet->first);
  if (is<dispatch::annotation_wrapper>(handler)) {
    return make_malformed_error("annotation wrapper must not wrap another "
                                "annotation wrapper");
  }
  if (is<dispatch::padding>(handler)) {
    return make_malformed_error("annotation wrapper must not wrap padding");
  }
  if (is<dispatch::version_marker>(handler)) {
    return make_malformed_error("annotation wrapper must not wrap a version "
                                "marker");
  }
  auto inner = apply(handler, std::move(octet->second), depth);
  if (not inner) {
    return std::move(inner.error());
  }
  IONBIN_ASSERT(inner->value);
  auto actual = uint64_t{init_size - inner->rest.size()};
  if (inner->value->kind == event_kind::container_start) {
    if (inner->container_length
        > std::numeric_limits<uint64_t>::max() - actual) {
      return make_malformed_error("annotated container length overflows");
    }
    actual += inner->container_length;
  }
  if (actual != length) {
    return make_malformed_error("annotation wrapper declares {} bytes but "
                                "wraps {} bytes",
                                length, actual);
  }
  inner->value
    = std::move(*inner->value).with_annotations(std::move(*annotations));
  return inner;
}

auto apply(const dispatch::handler& handler, chunked_buffer buffer,
           size_t depth) -> caf::expected<parsed> {
  return handler.match(
    [](const dispatch::invalid& x) -> caf::expected<parsed> {
      return make_malformed_error("invalid type octet 0x{:02X}",
                                  std::to_integer<int>(x.octet));
    },
    [&](const dispatch::version_marker&) -> caf::expected<parsed> {
      if (depth != 0) {
        return make_malformed_error("version marker inside a container");
      }
      auto tail = buffer.read_slice(defaults::format::version_marker.size()
                                    - 1);
      if (not tail) {
        return std::move(tail.error());
      }
      const auto expected
        = std::span{defaults::format::version_marker}.subspan(1);
      if (not std::ranges::equal(as_bytes(tail->first), expected)) {
        return make_malformed_error("unsupported version marker");
      }
      return parsed{
        .value = event::make_version_marker(),
        .rest = std::move(tail->second),
      };
    },
    [&](const dispatch::null& x) -> caf::expected<parsed> {
      return parsed{
        .value = event::make_null(x.type, depth),
        .rest = std::move(buffer),
      };
    },
    [&](const dispatch::static_scalar& x) -> caf::expected<parsed> {
      return parsed{
        .value = event::make_scalar(x.type, x.value, depth),
        .rest = std::move(buffer),
      };
    },
    [&](const dispatch::length_scalar& x) -> caf::expected<parsed> {
      auto length = read_length(x.length, std::move(buffer));
      if (not length) {
        return std::move(length.error());
      }
      auto slice = length->second.read_slice(length->first);
      if (not slice) {
        return std::move(slice.error());
      }
      auto value = lazy_scalar{x.codec, std::move(slice->first)};
      return parsed{
        .value = event::make_scalar(x.type, std::move(value), depth),
        .rest = std::move(slice->second),
      };
    },
    [&](const dispatch::container_start& x) -> caf::expected<parsed> {
      auto length = read_length(x.length, std::move(buffer));
      if (not length) {
        return std::move(length.error());
      }
      if (x.ordered and length->first < 2) {
        return make_malformed_error("ordered struct must not be empty, but "
                                    "declares {} bytes",
                                    length->first);
      }
      return parsed{
        .value = event::make_container_start(x.type, depth),
        .container_length = length->first,
        .rest = std::move(length->second),
      };
    },
    [&](const dispatch::annotation_wrapper& x) -> caf::expected<parsed> {
      return parse_annotation_wrapper(x.length, std::move(buffer), depth);
    },
    [&](const dispatch::padding& x) -> caf::expected<parsed> {
      auto length = read_length(x.length, std::move(buffer));
      if (not length) {
        return std::move(length.error());
      }
      auto [skipped, rest] = length->second.skip(length->first);
      if (skipped < length->first) {
        return caf::make_error(ec::incomplete);
      }
      return parsed{.rest = std::move(rest)};
    });
}

auto parse_value(const chunked_buffer& buffer, size_t depth)
  -> caf::expected<parsed> {
  auto octet = buffer.read_byte();
  if (not octet) {
    return std::move(octet.error());
  }
  return apply(dispatch::lookup(octet->first), std::move(octet->second),
               depth);
}

auto parse_field(const chunked_buffer& buffer, size_t depth)
  -> caf::expected<parsed> {
  auto sid = read_var_uint(buffer);
  if (not sid) {
    return std::move(sid.error());
  }
  auto result = parse_value(sid->second, depth);
  if (result and result->value) {
    result->value = std::move(*result->value)
                      .with_field_name(symbol_token{.id = sid->first});
  }
  return result;
}

auto parse_version_marker(const chunked_buffer& buffer)
  -> caf::expected<parsed> {
  auto octet = buffer.read_byte();
  if (not octet) {
    return std::move(octet.error());
  }
  if (octet->first != defaults::format::version_marker[0]) {
    return make_malformed_error("stream must begin with a version marker, "
                                "found type octet 0x{:02X}",
                                std::to_integer<int>(octet->first));
  }
  return apply(dispatch::version_marker{}, std::move(octet->second), 0);
}

} // namespace

auto to_string(request_kind x) -> const char* {
  switch (x) {
    case request_kind::next:
      return "next";
    case request_kind::skip:
      return "skip";
    case request_kind::data:
      return "data";
  }
  IONBIN_UNREACHABLE();
}

auto request::next() -> request {
  return request{.kind = request_kind::next};
}

auto request::skip() -> request {
  return request{.kind = request_kind::skip};
}

auto request::data(chunk_ptr chunk) -> request {
  return request{.kind = request_kind::data, .chunk = std::move(chunk)};
}

reader::reader() : reader(reader_options{}) {
}

reader::reader(reader_options options)
  : options_{options}, buffer_{chunked_buffer::empty()} {
}

auto reader::advance(request req) -> caf::expected<event> {
  if (failure_) {
    return failure_;
  }
  if (auto err = accept(std::move(req))) {
    return fail(std::move(err));
  }
  auto result = step();
  if (not result) {
    return fail(std::move(result.error()));
  }
  return result;
}

auto reader::accept(request req) -> caf::error {
  if (expect_data_) {
    if (req.kind != request_kind::data) {
      return caf::make_error(ec::protocol_violation,
                             fmt::format("expected a data request but got "
                                         "{} at offset {}",
                                         req.kind, cursor_));
    }
    if (size(req.chunk) == 0) {
      return caf::make_error(ec::protocol_violation,
                             "data request without bytes");
    }
    auto extended = buffer_.extend(std::move(req.chunk));
    if (not extended) {
      return std::move(extended.error());
    }
    buffer_ = std::move(*extended);
    return {};
  }
  if (req.kind == request_kind::data) {
    return caf::make_error(ec::protocol_violation,
                           fmt::format("unexpected data request at offset {}",
                                       cursor_));
  }
  if (req.kind == request_kind::skip and stack_.at_top_level()) {
    return caf::make_error(ec::protocol_violation,
                           "cannot skip outside of a container");
  }
  mode_ = req.kind;
  return {};
}

auto reader::step() -> caf::expected<event> {
  const auto& frame = stack_.top();
  if (mode_ == request_kind::skip) {
    IONBIN_ASSERT(frame.limit);
    auto [skipped, rest] = buffer_.skip(*frame.limit - cursor_);
    cursor_ += skipped;
    buffer_ = std::move(rest);
    if (cursor_ < *frame.limit) {
      IONBIN_DEBUG("reader skipped to offset {} of {}", cursor_,
                   *frame.limit);
      return finish(event::make_stream_incomplete(), 0);
    }
  }
  while (true) {
    if (frame.limit and cursor_ == *frame.limit) {
      return finish(event::make_container_end(*frame.type, frame.depth - 1),
                    0);
    }
    auto result = expect_version_marker_ ? parse_version_marker(buffer_)
                  : frame.mode == frame_mode::fields
                    ? parse_field(buffer_, frame.depth)
                    : parse_value(buffer_, frame.depth);
    if (not result) {
      if (result.error() == ec::incomplete) {
        IONBIN_DEBUG("reader suspends at offset {} with {} buffered bytes",
                     cursor_, buffer_.size());
        if (frame.depth == 0 and buffer_.size() == 0) {
          return finish(event::make_stream_end(), 0);
        }
        return finish(event::make_stream_incomplete(), 0);
      }
      return add_context(result.error(), "at offset {}", cursor_);
    }
    const auto start = cursor_;
    cursor_ += buffer_.size() - result->rest.size();
    buffer_ = std::move(result->rest);
    if (frame.limit and cursor_ > *frame.limit) {
      return make_malformed_error("value at offset {} ends at offset {} "
                                  "beyond its container end at offset {}",
                                  start, cursor_, *frame.limit);
    }
    if (result->value) {
      return finish(std::move(*result->value), result->container_length);
    }
  }
}

auto reader::finish(event result, uint64_t container_length)
  -> caf::expected<event> {
  if (is_stream_signal(result.kind)) {
    expect_data_ = true;
    return result;
  }
  expect_data_ = false;
  expect_version_marker_ = false;
  if (result.kind == event_kind::container_start) {
    const auto& parent = stack_.top();
    if (parent.depth + 1 > options_.max_depth) {
      return caf::make_error(ec::recursion_limit_reached,
                             fmt::format("containers nest deeper than {} "
                                         "levels at offset {}",
                                         options_.max_depth, cursor_));
    }
    if (container_length > std::numeric_limits<uint64_t>::max() - cursor_) {
      return make_malformed_error("container length {} at offset {} "
                                  "overflows",
                                  container_length, cursor_);
    }
    const auto limit = cursor_ + container_length;
    if (parent.limit and limit > *parent.limit) {
      return make_malformed_error("container ending at offset {} exceeds its "
                                  "parent ending at offset {}",
                                  limit, *parent.limit);
    }
    const auto& child = stack_.push(*result.type, limit);
    IONBIN_DEBUG("reader enters {}", child);
  } else if (result.kind == event_kind::container_end) {
    const auto closed = stack_.pop();
    IONBIN_DEBUG("reader leaves {}", closed);
  }
  if (options_.materialize and result.is_lazy()) {
    auto value = result.materialize();
    if (not value) {
      return add_context(value.error(), "at offset {}", cursor_);
    }
    IONBIN_ASSERT(*value);
    result = std::move(result).with_value(std::move(**value));
  }
  return result;
}

auto reader::fail(caf::error err) -> caf::error {
  IONBIN_VERBOSE("reader failed: {}", render(err));
  failure_ = err;
  return err;
}

auto read_all(reader& r, std::span<const chunk_ptr> chunks)
  -> caf::expected<std::vector<event>> {
  auto result = std::vector<event>{};
  auto next_chunk = chunks.begin();
  auto req = request::next();
  while (true) {
    auto ev = r.advance(std::move(req));
    if (not ev) {
      return std::move(ev.error());
    }
    if (not is_stream_signal(ev->kind)) {
      result.push_back(std::move(*ev));
      req = request::next();
      continue;
    }
    while (next_chunk != chunks.end() and size(*next_chunk) == 0) {
      ++next_chunk;
    }
    if (next_chunk == chunks.end()) {
      if (ev->kind == event_kind::stream_end) {
        return result;
      }
      return caf::make_error(ec::end_of_input,
                             fmt::format("input ends inside a value at offset "
                                         "{}",
                                         r.cursor()));
    }
    req = request::data(*next_chunk++);
  }
}

} // namespace ionbin
