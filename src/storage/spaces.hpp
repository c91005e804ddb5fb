/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Naming of logical storage spaces.
 *
 * A space is a named partition of one physical store. Spaces are created on
 * demand by name; the unnamed space always exists.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace kv::storage {

  /// Name of the space used when no name is given
  constexpr std::string_view kDefaultSpaceName = "default";

  inline std::string spaceName(const std::optional<std::string> &name) {
    return name.has_value() ? name.value() : std::string(kDefaultSpaceName);
  }

}  // namespace kv::storage
