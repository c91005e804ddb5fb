/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <optional>

#include "log/logger.hpp"

namespace kv {

  /// Soft limit of open file descriptors, or nullopt if it can't be read
  std::optional<size_t> getFdLimit(const log::Logger &logger);

}  // namespace kv
