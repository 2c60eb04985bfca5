//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/net/RetryPolicy.h"

#include <algorithm>

namespace mtlink {

Status RetryPolicy::validate() const {
  if (max_attempts <= 0) {
    return Status::Error(400, "Number of attempts must be positive");
  }
  if (initial_backoff < 0 || max_backoff < initial_backoff) {
    return Status::Error(400, "Invalid backoff interval");
  }
  if (backoff_multiplier < 1.0) {
    return Status::Error(400, "Backoff multiplier must be at least 1");
  }
  if (max_flood_wait_count < 0 || max_total_flood_wait < 0) {
    return Status::Error(400, "Invalid flood wait limits");
  }
  return Status::OK();
}

double RetryPolicy::get_backoff(int32 attempt) const {
  double backoff = initial_backoff;
  for (int32 i = 1; i < attempt && backoff < max_backoff; i++) {
    backoff *= backoff_multiplier;
  }
  return min(backoff, max_backoff);
}

bool RetryPolicy::is_retryable(int32 code) const {
  return is_default_retryable_code(code) ||
         std::find(retryable_codes.begin(), retryable_codes.end(), code) != retryable_codes.end();
}

ErrorKind RetryPolicy::classify(const Status &status) const {
  auto kind = get_error_kind(status);
  if (kind == ErrorKind::PermanentRejection && is_retryable(status.code())) {
    return ErrorKind::Retryable;
  }
  return kind;
}

StringBuilder &operator<<(StringBuilder &string_builder, const RetryPolicy &retry_policy) {
  return string_builder << "RetryPolicy[attempts = " << retry_policy.max_attempts
                        << ", backoff = " << retry_policy.initial_backoff << " x " << retry_policy.backoff_multiplier
                        << " up to " << retry_policy.max_backoff
                        << ", flood waits = " << retry_policy.max_flood_wait_count << '/'
                        << retry_policy.max_total_flood_wait << ']';
}

}  // namespace mtlink
