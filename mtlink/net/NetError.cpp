//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/net/NetError.h"

#include "mtlink/utils/logging.h"
#include "mtlink/utils/misc.h"

namespace mtlink {

namespace {

constexpr int32 MAX_FLOOD_WAIT = 14 * 24 * 60 * 60;

Slice link_down_message(bool after_ack) {
  return after_ack ? Slice("LINK_DOWN_AFTER_ACK") : Slice("LINK_DOWN");
}

}  // namespace

StringBuilder &operator<<(StringBuilder &string_builder, ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Ok:
      return string_builder << "Ok";
    case ErrorKind::SizeMismatch:
      return string_builder << "SizeMismatch";
    case ErrorKind::UploadFailed:
      return string_builder << "UploadFailed";
    case ErrorKind::LinkDown:
      return string_builder << "LinkDown";
    case ErrorKind::FloodWait:
      return string_builder << "FloodWait";
    case ErrorKind::TimedOut:
      return string_builder << "TimedOut";
    case ErrorKind::Indeterminate:
      return string_builder << "Indeterminate";
    case ErrorKind::Canceled:
      return string_builder << "Canceled";
    case ErrorKind::Aborted:
      return string_builder << "Aborted";
    case ErrorKind::Retryable:
      return string_builder << "Retryable";
    case ErrorKind::PermanentRejection:
      return string_builder << "PermanentRejection";
    default:
      UNREACHABLE();
  }
}

bool is_default_retryable_code(int32 code) {
  return (500 <= code && code < 600) || (-1000 < code && code < 0);
}

ErrorKind get_error_kind(const Status &status) {
  if (status.is_ok()) {
    return ErrorKind::Ok;
  }
  switch (status.code()) {
    case NetError::Canceled:
      return ErrorKind::Canceled;
    case NetError::LinkDown:
      return ErrorKind::LinkDown;
    case NetError::TimedOut:
      return ErrorKind::TimedOut;
    case NetError::Indeterminate:
      return ErrorKind::Indeterminate;
    case NetError::SizeMismatch:
      return ErrorKind::SizeMismatch;
    case NetError::UploadFailed:
      return ErrorKind::UploadFailed;
    case NetError::Aborted:
      return ErrorKind::Aborted;
    default:
      break;
  }
  if (get_flood_wait_seconds(status) > 0) {
    return ErrorKind::FloodWait;
  }
  if (is_default_retryable_code(status.code())) {
    return ErrorKind::Retryable;
  }
  return ErrorKind::PermanentRejection;
}

Status link_down_error(bool after_ack) {
  return Status::Error(NetError::LinkDown, link_down_message(after_ack));
}

Status flood_wait_error(int32 seconds) {
  return Status::Error(NetError::FloodWait, PSLICE() << "FLOOD_WAIT_" << seconds);
}

Status timed_out_error() {
  return Status::Error(NetError::TimedOut, "TIMEOUT");
}

Status indeterminate_error(Slice reason) {
  return Status::Error(NetError::Indeterminate, PSLICE() << "INDETERMINATE: " << reason);
}

Status size_mismatch_error(Slice reason) {
  return Status::Error(NetError::SizeMismatch, PSLICE() << "SIZE_MISMATCH: " << reason);
}

Status upload_failed_error(int32 part_id, const Status &cause) {
  CHECK(cause.is_error());
  return Status::Error(NetError::UploadFailed, PSLICE() << "UPLOAD_FAILED_" << part_id << ": " << cause.message());
}

Status upload_canceled_error() {
  return Status::Error(NetError::Canceled, "Upload canceled");
}

Status request_canceled_error() {
  return Status::Error(NetError::Canceled, "Request canceled");
}

Status request_aborted_error() {
  return Status::Error(NetError::Aborted, "Request aborted");
}

int32 get_flood_wait_seconds(const Status &status) {
  if (status.is_ok() || status.code() != NetError::FloodWait) {
    return 0;
  }
  auto error_message = status.message();
  for (auto prefix : {Slice("FLOOD_WAIT_"), Slice("SLOWMODE_WAIT_"), Slice("2FA_CONFIRM_WAIT_"),
                      Slice("TAKEOUT_INIT_DELAY_"), Slice("FLOOD_PREMIUM_WAIT_")}) {
    if (begins_with(error_message, prefix)) {
      auto r_seconds = to_integer_safe<int32>(error_message.substr(prefix.size()));
      if (r_seconds.is_error()) {
        LOG(WARNING) << "Receive invalid " << error_message;
        return 1;
      }
      return clamp(r_seconds.ok(), 1, MAX_FLOOD_WAIT);
    }
  }
  if (begins_with(error_message, "FLOOD_SKIP_FAILED_WAIT")) {
    return 1;
  }
  return 0;
}

bool is_link_down_after_ack(const Status &status) {
  return status.is_error() && status.code() == NetError::LinkDown && status.message() == link_down_message(true);
}

int32 get_upload_failed_part(const Status &status) {
  if (status.is_ok() || status.code() != NetError::UploadFailed) {
    return -1;
  }
  Slice message = status.message();
  Slice prefix("UPLOAD_FAILED_");
  if (!begins_with(message, prefix)) {
    return -1;
  }
  message.remove_prefix(prefix.size());
  auto colon_pos = message.find(':');
  if (colon_pos == static_cast<size_t>(-1)) {
    return -1;
  }
  auto r_part_id = to_integer_safe<int32>(message.substr(0, colon_pos));
  if (r_part_id.is_error()) {
    return -1;
  }
  return r_part_id.ok();
}

}  // namespace mtlink
