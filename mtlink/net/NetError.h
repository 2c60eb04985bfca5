//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/utils/common.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"
#include "mtlink/utils/StringBuilder.h"

namespace mtlink {

class NetError {
 public:
  enum Code : int32 {
    Canceled = 203,
    FloodWait = 420,
    LinkDown = -1001,
    TimedOut = -1002,
    Indeterminate = -1003,
    SizeMismatch = -1004,
    UploadFailed = -1005,
    Aborted = -1006
  };
};

enum class ErrorKind : int32 {
  Ok,
  SizeMismatch,
  UploadFailed,
  LinkDown,
  FloodWait,
  TimedOut,
  Indeterminate,
  Canceled,
  Aborted,
  Retryable,
  PermanentRejection
};

StringBuilder &operator<<(StringBuilder &string_builder, ErrorKind kind);

// 500-599 server errors and unclassified negative transport codes
bool is_default_retryable_code(int32 code);

ErrorKind get_error_kind(const Status &status);

Status link_down_error(bool after_ack) MTLINK_WARN_UNUSED_RESULT;

Status flood_wait_error(int32 seconds) MTLINK_WARN_UNUSED_RESULT;

Status timed_out_error() MTLINK_WARN_UNUSED_RESULT;

Status indeterminate_error(Slice reason) MTLINK_WARN_UNUSED_RESULT;

Status size_mismatch_error(Slice reason) MTLINK_WARN_UNUSED_RESULT;

Status upload_failed_error(int32 part_id, const Status &cause) MTLINK_WARN_UNUSED_RESULT;

Status upload_canceled_error() MTLINK_WARN_UNUSED_RESULT;

Status request_canceled_error() MTLINK_WARN_UNUSED_RESULT;

Status request_aborted_error() MTLINK_WARN_UNUSED_RESULT;

// number of seconds to wait before resending, or 0 if the error isn't a flood wait
int32 get_flood_wait_seconds(const Status &status);

bool is_link_down_after_ack(const Status &status);

// index of the failed part, or -1 if the error isn't UploadFailed
int32 get_upload_failed_part(const Status &status);

}  // namespace mtlink
