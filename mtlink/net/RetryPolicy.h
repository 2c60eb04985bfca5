//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/net/NetError.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/Status.h"
#include "mtlink/utils/StringBuilder.h"

namespace mtlink {

struct RetryPolicy {
  // total number of attempts for transient failures, including the first one
  int32 max_attempts = 5;
  double initial_backoff = 1.0;
  double backoff_multiplier = 2.0;
  double max_backoff = 30.0;

  // flood waits are handled separately and don't consume attempts
  int32 max_flood_wait_count = 10;
  double max_total_flood_wait = 60.0;

  // additional error codes to be treated as transient
  vector<int32> retryable_codes;

  Status validate() const MTLINK_WARN_UNUSED_RESULT;

  // delay before the attempt with the given number, attempt 1 is the first retry
  double get_backoff(int32 attempt) const;

  bool is_retryable(int32 code) const;

  // like get_error_kind, but also takes retryable_codes into account
  ErrorKind classify(const Status &status) const;
};

StringBuilder &operator<<(StringBuilder &string_builder, const RetryPolicy &retry_policy);

}  // namespace mtlink
