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

namespace mtlink {

class FileFd {
 public:
  FileFd() = default;
  FileFd(const FileFd &) = delete;
  FileFd &operator=(const FileFd &) = delete;
  FileFd(FileFd &&other) noexcept;
  FileFd &operator=(FileFd &&other) noexcept;
  ~FileFd();

  enum Flags : int32 { Write = 1, Read = 2, Truncate = 4, Create = 8, Append = 16, CreateNew = 32 };

  static Result<FileFd> open(CSlice filepath, int32 flags, int32 mode = 0600) MTLINK_WARN_UNUSED_RESULT;

  Result<size_t> write(Slice slice) MTLINK_WARN_UNUSED_RESULT;

  Result<size_t> read(MutableSlice slice) MTLINK_WARN_UNUSED_RESULT;

  Result<size_t> pwrite(Slice slice, int64 offset) MTLINK_WARN_UNUSED_RESULT;

  // may read less than requested only at the end of the file
  Result<size_t> pread(MutableSlice slice, int64 offset) const MTLINK_WARN_UNUSED_RESULT;

  Result<int64> get_size() const MTLINK_WARN_UNUSED_RESULT;

  void close();

  bool empty() const {
    return fd_ < 0;
  }

  int get_native_fd() const {
    return fd_;
  }

 private:
  int fd_ = -1;

  explicit FileFd(int fd) : fd_(fd) {
  }
};

}  // namespace mtlink
