//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/files/ByteSource.h"

#include "mtlink/utils/logging.h"
#include "mtlink/utils/misc.h"

namespace mtlink {

MemoryByteSource::MemoryByteSource(string name, string data)
    : name_(std::move(name)), data_(std::move(data)), declared_size_(static_cast<int64>(data_.size())) {
}

MemoryByteSource::MemoryByteSource(string name, string data, int64 declared_size)
    : name_(std::move(name)), data_(std::move(data)), declared_size_(declared_size) {
}

Result<string> MemoryByteSource::read_range(int64 offset, size_t size) {
  if (offset < 0) {
    return Status::Error(PSLICE() << "Invalid offset " << offset);
  }
  if (static_cast<uint64>(offset) >= data_.size()) {
    return string();
  }
  return Slice(data_).substr(static_cast<size_t>(offset), size).str();
}

Result<string> MemoryByteSource::read_next(size_t size) {
  auto result = Slice(data_).substr(position_, size).str();
  position_ += result.size();
  return std::move(result);
}

FileByteSource::FileByteSource(FileFd fd, string name, int64 size)
    : fd_(std::move(fd)), name_(std::move(name)), size_(size) {
}

Result<FileByteSource> FileByteSource::open(CSlice path) {
  TRY_RESULT(fd, FileFd::open(path, FileFd::Read));
  TRY_RESULT(size, fd.get_size());
  Slice name = path;
  auto slash_pos = name.rfind('/');
  if (slash_pos != static_cast<size_t>(-1)) {
    name.remove_prefix(slash_pos + 1);
  }
  return FileByteSource(std::move(fd), name.str(), size);
}

Result<string> FileByteSource::read_range(int64 offset, size_t size) {
  if (offset < 0) {
    return Status::Error(PSLICE() << "Invalid offset " << offset);
  }
  string result(size, '\0');
  TRY_RESULT(read_size, fd_.pread(MutableSlice(result), offset));
  CHECK(read_size <= size);
  result.resize(read_size);
  return std::move(result);
}

Result<string> FileByteSource::read_next(size_t size) {
  TRY_RESULT(result, read_range(position_, size));
  position_ += static_cast<int64>(result.size());
  return std::move(result);
}

StreamByteSource::StreamByteSource(string name, Reader reader, int64 declared_size)
    : name_(std::move(name)), reader_(std::move(reader)), declared_size_(declared_size) {
  CHECK(reader_);
}

Result<string> StreamByteSource::read_range(int64 offset, size_t size) {
  return Status::Error(PSLICE() << "Source \"" << name_ << "\" isn't seekable");
}

Result<string> StreamByteSource::read_next(size_t size) {
  string result;
  while (!is_finished_ && result.size() < size) {
    TRY_RESULT(chunk, reader_(size - result.size()));
    if (chunk.empty()) {
      is_finished_ = true;
      break;
    }
    if (chunk.size() > size - result.size()) {
      return Status::Error(PSLICE() << "Reader returned " << chunk.size() << " bytes instead of at most "
                                    << size - result.size());
    }
    result += chunk;
  }
  read_size_ += static_cast<int64>(result.size());
  return std::move(result);
}

}  // namespace mtlink
