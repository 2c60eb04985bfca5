//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/utils/common.h"
#include "mtlink/utils/port/FileFd.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"

#include <functional>

namespace mtlink {

// Bytes to be uploaded. Owned by the caller, borrowed by FileUploader for the duration of an upload.
// All reads may return less than requested only at the end of the data.
class ByteSource {
 public:
  ByteSource() = default;
  ByteSource(const ByteSource &) = delete;
  ByteSource &operator=(const ByteSource &) = delete;
  ByteSource(ByteSource &&) = default;
  ByteSource &operator=(ByteSource &&) = default;
  virtual ~ByteSource() = default;

  virtual Slice get_name() const = 0;

  // -1 if the size isn't known in advance
  virtual int64 get_size() const = 0;

  virtual bool is_seekable() const = 0;

  // only for seekable sources
  virtual Result<string> read_range(int64 offset, size_t size) MTLINK_WARN_UNUSED_RESULT = 0;

  virtual Result<string> read_next(size_t size) MTLINK_WARN_UNUSED_RESULT = 0;
};

class MemoryByteSource final : public ByteSource {
 public:
  MemoryByteSource(string name, string data);

  // declared_size may differ from the real size of the data, or be -1 if unknown
  MemoryByteSource(string name, string data, int64 declared_size);

  Slice get_name() const final {
    return name_;
  }

  int64 get_size() const final {
    return declared_size_;
  }

  bool is_seekable() const final {
    return true;
  }

  Result<string> read_range(int64 offset, size_t size) final;

  Result<string> read_next(size_t size) final;

 private:
  string name_;
  string data_;
  int64 declared_size_;
  size_t position_ = 0;
};

class FileByteSource final : public ByteSource {
 public:
  static Result<FileByteSource> open(CSlice path) MTLINK_WARN_UNUSED_RESULT;

  Slice get_name() const final {
    return name_;
  }

  int64 get_size() const final {
    return size_;
  }

  bool is_seekable() const final {
    return true;
  }

  Result<string> read_range(int64 offset, size_t size) final;

  Result<string> read_next(size_t size) final;

 private:
  FileFd fd_;
  string name_;
  int64 size_ = 0;
  int64 position_ = 0;

  FileByteSource(FileFd fd, string name, int64 size);
};

// a non-seekable stream; the reader returns an empty string at the end of the stream
class StreamByteSource final : public ByteSource {
 public:
  using Reader = std::function<Result<string>(size_t max_size)>;

  StreamByteSource(string name, Reader reader, int64 declared_size = -1);

  Slice get_name() const final {
    return name_;
  }

  int64 get_size() const final {
    return declared_size_;
  }

  bool is_seekable() const final {
    return false;
  }

  Result<string> read_range(int64 offset, size_t size) final;

  Result<string> read_next(size_t size) final;

  int64 get_read_size() const {
    return read_size_;
  }

 private:
  string name_;
  Reader reader_;
  int64 declared_size_;
  int64 read_size_ = 0;
  bool is_finished_ = false;
};

}  // namespace mtlink
