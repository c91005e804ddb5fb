/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cctype>
#include <string>
#include <tuple>
#include <vector>

#define _JSON_NAMES_1(f, name) f(#name)
#define _JSON_NAMES_2(f, name, ...) \
  _JSON_NAMES_1(f, name), _JSON_NAMES_1(f, __VA_ARGS__)
#define _JSON_NAMES_3(f, name, ...) \
  _JSON_NAMES_1(f, name), _JSON_NAMES_2(f, __VA_ARGS__)
#define _JSON_NAMES_4(f, name, ...) \
  _JSON_NAMES_1(f, name), _JSON_NAMES_3(f, __VA_ARGS__)
#define _JSON_NAMES_5(f, name, ...) \
  _JSON_NAMES_1(f, name), _JSON_NAMES_4(f, __VA_ARGS__)
#define _JSON_NAMES_6(f, name, ...) \
  _JSON_NAMES_1(f, name), _JSON_NAMES_5(f, __VA_ARGS__)
#define _JSON_NAMES_7(f, name, ...) \
  _JSON_NAMES_1(f, name), _JSON_NAMES_6(f, __VA_ARGS__)
#define _JSON_NAMES_8(f, name, ...) \
  _JSON_NAMES_1(f, name), _JSON_NAMES_7(f, __VA_ARGS__)
#define _JSON_NAMES_9(f, name, ...) \
  _JSON_NAMES_1(f, name), _JSON_NAMES_8(f, __VA_ARGS__)
#define _JSON_NAMES_10(f, name, ...) \
  _JSON_NAMES_1(f, name), _JSON_NAMES_9(f, __VA_ARGS__)
#define _JSON_NAMES_OVERLOAD(                            \
    _1, _2, _3, _4, _5, _6, _7, _8, _9, _10, macro, ...) \
  macro
#define _JSON_NAMES_OVERLOAD_CALL(macro, ...) macro(__VA_ARGS__)
#define _JSON_NAMES(f, ...)                                        \
  _JSON_NAMES_OVERLOAD_CALL(_JSON_NAMES_OVERLOAD(__VA_ARGS__,      \
                                                 _JSON_NAMES_10,   \
                                                 _JSON_NAMES_9,    \
                                                 _JSON_NAMES_8,    \
                                                 _JSON_NAMES_7,    \
                                                 _JSON_NAMES_6,    \
                                                 _JSON_NAMES_5,    \
                                                 _JSON_NAMES_4,    \
                                                 _JSON_NAMES_3,    \
                                                 _JSON_NAMES_2,    \
                                                 _JSON_NAMES_1),   \
                            f,                                     \
                            __VA_ARGS__)

#define _JSON_OBJECT(f, ...)                                     \
  static const auto &fieldNames() {                              \
    static std::array field_names{_JSON_NAMES(f, __VA_ARGS__)};  \
    return field_names;                                          \
  }                                                              \
  auto fields() {                                                \
    return std::tie(__VA_ARGS__);                                \
  }                                                              \
  auto fields() const {                                          \
    return std::tie(__VA_ARGS__);                                \
  }

/// Object fields named exactly as the members
#define JSON_FIELDS(...) _JSON_OBJECT(::kv::json::fieldName, __VA_ARGS__)

/// Object fields named as the members converted to camelCase
#define JSON_CAMEL(...) _JSON_OBJECT(::kv::json::toCamelCase, __VA_ARGS__)

#define JSON_ENUM(type, ...)                                              \
  inline const auto &enumValues(const type &) {                           \
    static std::vector<std::pair<type, std::string>> values{__VA_ARGS__}; \
    return values;                                                        \
  }

namespace kv::json {
  inline std::string fieldName(std::string_view name) {
    return std::string{name};
  }

  inline std::string toCamelCase(std::string_view name) {
    std::string camel;
    bool capitalize = false;
    for (auto &c : name) {
      if (c == '_') {
        capitalize = true;
        continue;
      }
      if (capitalize) {
        capitalize = false;
        camel.push_back(static_cast<char>(std::toupper(c)));
      } else {
        camel.push_back(c);
      }
    }
    return camel;
  }
}  // namespace kv::json
