/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "serde/json.hpp"

namespace {
  enum class Role : uint8_t { Reader, Writer };
  JSON_ENUM(Role, {Role::Reader, "reader"}, {Role::Writer, "writer"});

  struct Grant {
    std::string bucket_name;
    Role role = Role::Reader;
    std::optional<uint32_t> expires_at;

    bool operator==(const Grant &) const = default;

    JSON_CAMEL(bucket_name, role, expires_at);
  };

  struct User {
    std::string name;
    std::vector<Grant> grants;
    std::map<std::string, int64_t> quotas;

    bool operator==(const User &) const = default;

    JSON_FIELDS(name, grants, quotas);
  };
}  // namespace

/**
 * @given nested structure with camelCase fields, enums and containers
 * @when encoded
 * @then the JSON text uses the declared names and enum strings
 */
TEST(JsonTest, Encode) {
  User user{
      .name = "alice",
      .grants = {{.bucket_name = "blocks", .role = Role::Writer}},
      .quotas = {{"blocks", -1}},
  };
  EXPECT_EQ(kv::json::encode(user),
            R"({"name":"alice","grants":[{"bucketName":"blocks",)"
            R"("role":"writer","expiresAt":null}],"quotas":{"blocks":-1}})");
}

/**
 * @given JSON text of a nested structure
 * @when decoded
 * @then every field is filled, absent optionals stay empty
 */
TEST(JsonTest, Decode) {
  User user;
  kv::json::decode(user, std::string_view{R"({
    "name": "bob",
    "grants": [{"bucketName": "meta", "role": "reader", "expiresAt": 10},
               {"bucketName": "logs", "role": "writer"}],
    "quotas": {}
  })"});
  EXPECT_EQ(user.name, "bob");
  ASSERT_EQ(user.grants.size(), 2);
  EXPECT_EQ(user.grants[0].expires_at, std::make_optional<uint32_t>(10));
  EXPECT_EQ(user.grants[1].role, Role::Writer);
  EXPECT_EQ(user.grants[1].expires_at, std::nullopt);
  EXPECT_TRUE(user.quotas.empty());
}

/**
 * @given text which is not JSON and JSON of another shape
 * @when decoded
 * @then syntax errors and shape errors are told apart
 */
TEST(JsonTest, Errors) {
  User user;
  EXPECT_THROW(kv::json::decode(user, std::string_view{"{"}),
               kv::json::JsonSyntaxError);
  EXPECT_THROW(kv::json::decode(user, std::string_view{"42"}),
               kv::json::JsonError);
  Grant grant;
  EXPECT_THROW(kv::json::decode(grant,
                                std::string_view{
                                    R"({"bucketName":"x","role":"owner"})"}),
               kv::json::JsonError);
  try {
    kv::json::decode(user, std::string_view{"[]"});
    FAIL() << "decoded array as object";
  } catch (const kv::json::JsonSyntaxError &) {
    FAIL() << "shape error reported as syntax error";
  } catch (const kv::json::JsonError &) {
    SUCCEED();
  }
}
