/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace kv {

  enum class TransactionError : uint8_t {
    CONFLICT = 1,       ///< concurrent modification, the body runs again
    RETRIES_EXHAUSTED,  ///< still conflicting after the configured retries
    ABORTED,            ///< aborted by the body without a reason
    NOT_RUNNING,        ///< transaction already finished
  };

  /// Errors on which the transaction body is run again
  bool isConflict(const std::error_code &ec);

}  // namespace kv

OUTCOME_HPP_DECLARE_ERROR(kv, TransactionError);
