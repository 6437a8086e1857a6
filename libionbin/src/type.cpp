//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ionbin/type.hpp"

#include "ionbin/detail/assert.hpp"

namespace ionbin {

auto to_string(value_type x) -> const char* {
  switch (x) {
    case value_type::null:
      return "null";
    case value_type::bool_:
      return "bool";
    case value_type::int_:
      return "int";
    case value_type::float_:
      return "float";
    case value_type::decimal:
      return "decimal";
    case value_type::timestamp:
      return "timestamp";
    case value_type::symbol:
      return "symbol";
    case value_type::string:
      return "string";
    case value_type::clob:
      return "clob";
    case value_type::blob:
      return "blob";
    case value_type::list:
      return "list";
    case value_type::sexp:
      return "sexp";
    case value_type::struct_:
      return "struct";
  }
  IONBIN_UNREACHABLE();
}

auto to_string(type_id x) -> const char* {
  switch (x) {
    case type_id::null:
      return "null";
    case type_id::bool_:
      return "bool";
    case type_id::positive_int:
      return "positive_int";
    case type_id::negative_int:
      return "negative_int";
    case type_id::float_:
      return "float";
    case type_id::decimal:
      return "decimal";
    case type_id::timestamp:
      return "timestamp";
    case type_id::symbol:
      return "symbol";
    case type_id::string:
      return "string";
    case type_id::clob:
      return "clob";
    case type_id::blob:
      return "blob";
    case type_id::list:
      return "list";
    case type_id::sexp:
      return "sexp";
    case type_id::struct_:
      return "struct";
    case type_id::annotation:
      return "annotation";
  }
  IONBIN_UNREACHABLE();
}

auto logical_type(type_id x) -> std::optional<value_type> {
  switch (x) {
    case type_id::null:
      return value_type::null;
    case type_id::bool_:
      return value_type::bool_;
    case type_id::positive_int:
    case type_id::negative_int:
      return value_type::int_;
    case type_id::float_:
      return value_type::float_;
    case type_id::decimal:
      return value_type::decimal;
    case type_id::timestamp:
      return value_type::timestamp;
    case type_id::symbol:
      return value_type::symbol;
    case type_id::string:
      return value_type::string;
    case type_id::clob:
      return value_type::clob;
    case type_id::blob:
      return value_type::blob;
    case type_id::list:
      return value_type::list;
    case type_id::sexp:
      return value_type::sexp;
    case type_id::struct_:
      return value_type::struct_;
    case type_id::annotation:
      return std::nullopt;
  }
  IONBIN_UNREACHABLE();
}

} // namespace ionbin
