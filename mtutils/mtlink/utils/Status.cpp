//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/utils/Status.h"

#include <cstring>

namespace mtlink {

namespace {
// strerror_r is either XSI-compliant and returns int or GNU-specific and returns char *
MTLINK_UNUSED const char *strerror_result(int result, const char *buffer) {
  if (result != 0) {
    return "Unknown error";
  }
  return buffer;
}

MTLINK_UNUSED const char *strerror_result(const char *result, const char *buffer) {
  return result;
}
}  // namespace

CSlice strerror_safe(int code) {
  const size_t size = 1000;

  static thread_local char buf[size];
  buf[0] = '\0';
  return CSlice(strerror_result(strerror_r(code, buf, size), buf));
}

Status Status::move_as_error_prefix(Slice prefix) const {
  CHECK(is_error());
  return Status(ptr_->error_type, ptr_->error_code, PSLICE() << prefix << message());
}

Status Status::move_as_error_suffix(Slice suffix) const {
  CHECK(is_error());
  return Status(ptr_->error_type, ptr_->error_code, PSLICE() << message() << suffix);
}

}  // namespace mtlink
