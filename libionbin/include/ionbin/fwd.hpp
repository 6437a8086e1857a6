//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ionbin/config.hpp" // IWYU pragma: export

#include <caf/config.hpp>
#include <caf/fwd.hpp>
#include <caf/type_id.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

#define IONBIN_ADD_TYPE_ID(type) CAF_ADD_TYPE_ID(ionbin_types, type)

// -- ionbin -------------------------------------------------------------------

namespace ionbin {

class chunk;
class chunked_buffer;
class context_stack;
class lazy_scalar;
class reader;
class symbol_resolver;

struct context_frame;
struct decimal;
struct event;
struct reader_options;
struct request;
struct symbol_token;
struct timestamp;

enum class ec : uint8_t;
enum class event_kind : int8_t;
enum class value_type : uint8_t;
enum class type_id : uint8_t;

template <class... Ts>
class variant;

using chunk_ptr = caf::intrusive_ptr<chunk>;

/// An opaque sequence of bytes, used for both clobs and blobs.
using blob = std::vector<std::byte>;

} // namespace ionbin

// -- type announcements -------------------------------------------------------

constexpr inline caf::type_id_t first_ionbin_type_id = 800;

CAF_BEGIN_TYPE_ID_BLOCK(ionbin_types, first_ionbin_type_id)

  IONBIN_ADD_TYPE_ID((ionbin::ec))

CAF_END_TYPE_ID_BLOCK(ionbin_types)

#undef IONBIN_ADD_TYPE_ID
