/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <unordered_map>

#include <fmt/format.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "serde/json_fwd.hpp"

#define JSON_ASSERT(c) \
  if (not(c)) throw ::kv::json::JsonError{"json: " #c}

namespace kv::json {
  /// Value does not fit the expected shape
  struct JsonError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  /// Text is not JSON at all
  struct JsonSyntaxError : JsonError {
    using JsonError::JsonError;
  };

  struct Json {
    const rapidjson::Value &v;
  };

  // text in and out must be valid UTF-8, as for plain string values
  using Writer = rapidjson::Writer<rapidjson::StringBuffer,
                                   rapidjson::UTF8<>,
                                   rapidjson::UTF8<>,
                                   rapidjson::CrtAllocator,
                                   rapidjson::kWriteValidateEncodingFlag>;

  // decode

  inline std::string_view decodeStr(Json json) {
    JSON_ASSERT(json.v.IsString());
    return {json.v.GetString(), json.v.GetStringLength()};
  }

  inline void decode(std::string &v, Json json) {
    v = decodeStr(json);
  }

  template <typename T>
  void decode(std::optional<T> &v, Json json);

  template <typename T>
  void decode(std::vector<T> &v, Json json);

  template <typename T>
  void decode(std::map<std::string, T> &v, Json json);

  template <typename T>
  void decode(std::unordered_map<std::string, T> &v, Json json);

  template <typename T>
    requires requires(T &v) {
      v.fieldNames();
      v.fields();
    }
  void decode(T &v, Json json);

  template <typename T>
    requires requires(T &v) { enumValues(v); }
  void decode(T &v, Json json);

  template <std::integral T>
  void decode(T &v, Json json) {
    if constexpr (std::is_same_v<T, bool>) {
      JSON_ASSERT(json.v.IsBool());
      v = json.v.GetBool();
    } else if constexpr (std::is_unsigned_v<T>) {
      JSON_ASSERT(json.v.IsUint64());
      auto x = json.v.GetUint64();
      JSON_ASSERT(x <= std::numeric_limits<T>::max());
      v = static_cast<T>(x);
    } else {
      JSON_ASSERT(json.v.IsInt64());
      auto x = json.v.GetInt64();
      JSON_ASSERT(x >= std::numeric_limits<T>::min()
                  and x <= std::numeric_limits<T>::max());
      v = static_cast<T>(x);
    }
  }

  template <std::floating_point T>
  void decode(T &v, Json json) {
    JSON_ASSERT(json.v.IsNumber());
    auto x = json.v.GetDouble();
    JSON_ASSERT(x >= std::numeric_limits<T>::lowest()
                and x <= std::numeric_limits<T>::max());
    v = static_cast<T>(x);
  }

  template <typename T>
  void decode(std::optional<T> &v, Json json) {
    v.reset();
    if (not json.v.IsNull()) {
      T value;
      decode(value, json);
      v.emplace(std::move(value));
    }
  }

  template <typename T>
  void decode(std::vector<T> &v, Json json) {
    v.clear();
    JSON_ASSERT(json.v.IsArray());
    for (auto it = json.v.Begin(); it != json.v.End(); ++it) {
      T value;
      decode(value, Json{*it});
      v.emplace_back(std::move(value));
    }
  }

  template <typename T>
  void decodeMembers(auto &v, Json json) {
    v.clear();
    JSON_ASSERT(json.v.IsObject());
    for (auto it = json.v.MemberBegin(); it != json.v.MemberEnd(); ++it) {
      std::string key;
      decode(key, Json{it->name});
      T value;
      decode(value, Json{it->value});
      v.emplace(std::move(key), std::move(value));
    }
  }

  template <typename T>
  void decode(std::map<std::string, T> &v, Json json) {
    decodeMembers<T>(v, json);
  }

  template <typename T>
  void decode(std::unordered_map<std::string, T> &v, Json json) {
    decodeMembers<T>(v, json);
  }

  template <size_t I, typename T>
  void decodeFields(const T &fields, const auto &field_names, Json json) {
    JSON_ASSERT(json.v.IsObject());
    auto &field = std::get<I>(fields);
    auto &field_name = field_names.at(I);
    auto it = json.v.FindMember(field_name.c_str());
    static const rapidjson::Value json_null;
    decode(field, Json{it != json.v.MemberEnd() ? it->value : json_null});
    if constexpr (I + 1 < std::tuple_size_v<T>) {
      decodeFields<I + 1>(fields, field_names, json);
    }
  }

  template <typename T>
    requires requires(T &v) {
      v.fieldNames();
      v.fields();
    }
  void decode(T &v, Json json) {
    auto fields = v.fields();
    auto &field_names = v.fieldNames();
    decodeFields<0>(fields, field_names, json);
  }

  template <typename T>
    requires requires(T &v) { enumValues(v); }
  void decode(T &v, Json json) {
    auto &enum_values = enumValues(v);
    auto str = decodeStr(json);
    for (auto &[enum_value, enum_str] : enum_values) {
      if (str == enum_str) {
        v = enum_value;
        return;
      }
    }
    JSON_ASSERT(false);
  }

  void decode(auto &v, std::string_view json_str) {
    rapidjson::Document document;
    document.Parse<rapidjson::kParseValidateEncodingFlag>(json_str.data(),
                                                          json_str.size());
    if (document.HasParseError()) {
      throw JsonSyntaxError{
          fmt::format("json: {} at offset {}",
                      rapidjson::GetParseError_En(document.GetParseError()),
                      document.GetErrorOffset())};
    }
    decode(v, Json{document});
  }

  // encode

  inline void encode(const std::string &v, Writer &writer) {
    JSON_ASSERT(
        writer.String(v.data(), static_cast<rapidjson::SizeType>(v.size())));
  }

  template <typename T>
  void encode(const std::optional<T> &v, Writer &writer);

  template <typename T>
  void encode(const std::vector<T> &v, Writer &writer);

  template <typename T>
  void encode(const std::map<std::string, T> &v, Writer &writer);

  template <typename T>
  void encode(const std::unordered_map<std::string, T> &v, Writer &writer);

  template <typename T>
    requires requires(const T &v) {
      v.fieldNames();
      v.fields();
    }
  void encode(const T &v, Writer &writer);

  template <typename T>
    requires requires(const T &v) { enumValues(v); }
  void encode(const T &v, Writer &writer);

  template <std::integral T>
  void encode(const T &v, Writer &writer) {
    if constexpr (std::is_same_v<T, bool>) {
      writer.Bool(v);
    } else if constexpr (std::is_unsigned_v<T>) {
      writer.Uint64(v);
    } else {
      writer.Int64(v);
    }
  }

  template <std::floating_point T>
  void encode(const T &v, Writer &writer) {
    JSON_ASSERT(std::isfinite(v));
    writer.Double(static_cast<double>(v));
  }

  template <typename T>
  void encode(const std::optional<T> &v, Writer &writer) {
    if (v.has_value()) {
      encode(*v, writer);
    } else {
      writer.Null();
    }
  }

  template <typename T>
  void encode(const std::vector<T> &v, Writer &writer) {
    writer.StartArray();
    for (auto &item : v) {
      encode(item, writer);
    }
    writer.EndArray();
  }

  void encodeMembers(const auto &v, Writer &writer) {
    writer.StartObject();
    for (auto &[key, value] : v) {
      encode(key, writer);
      encode(value, writer);
    }
    writer.EndObject();
  }

  template <typename T>
  void encode(const std::map<std::string, T> &v, Writer &writer) {
    encodeMembers(v, writer);
  }

  template <typename T>
  void encode(const std::unordered_map<std::string, T> &v, Writer &writer) {
    encodeMembers(v, writer);
  }

  template <size_t I, typename T>
  void encodeFields(const T &fields, const auto &field_names, Writer &writer) {
    encode(field_names.at(I), writer);
    encode(std::get<I>(fields), writer);
    if constexpr (I + 1 < std::tuple_size_v<T>) {
      encodeFields<I + 1>(fields, field_names, writer);
    }
  }

  template <typename T>
    requires requires(const T &v) {
      v.fieldNames();
      v.fields();
    }
  void encode(const T &v, Writer &writer) {
    writer.StartObject();
    encodeFields<0>(v.fields(), v.fieldNames(), writer);
    writer.EndObject();
  }

  template <typename T>
    requires requires(const T &v) { enumValues(v); }
  void encode(const T &v, Writer &writer) {
    for (auto &[enum_value, enum_str] : enumValues(v)) {
      if (v == enum_value) {
        encode(enum_str, writer);
        return;
      }
    }
    JSON_ASSERT(false);
  }

  std::string encode(const auto &v) {
    rapidjson::StringBuffer buffer;
    Writer writer{buffer};
    encode(v, writer);
    return {buffer.GetString(), buffer.GetSize()};
  }
}  // namespace kv::json
