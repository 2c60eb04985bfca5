//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/utils/port/FileFd.h"

#include "mtlink/utils/logging.h"

#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace mtlink {

namespace {

template <class F>
auto skip_eintr(F &&f) {
  decltype(f()) res;
  do {
    errno = 0;
    res = f();
  } while (res < 0 && errno == EINTR);
  return res;
}

}  // namespace

FileFd::FileFd(FileFd &&other) noexcept : fd_(other.fd_) {
  other.fd_ = -1;
}

FileFd &FileFd::operator=(FileFd &&other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

FileFd::~FileFd() {
  close();
}

Result<FileFd> FileFd::open(CSlice filepath, int32 flags, int32 mode) {
  if (flags & ~(Write | Read | Truncate | Create | Append | CreateNew)) {
    return Status::Error(PSLICE() << "File \"" << filepath << "\" has failed to be opened with unsupported flags "
                                  << flags);
  }
  if ((flags & (Write | Read)) == 0) {
    return Status::Error(PSLICE() << "File \"" << filepath << "\" can't be opened neither for reading nor writing");
  }

  int native_flags = 0;
  if ((flags & Write) && (flags & Read)) {
    native_flags |= O_RDWR;
  } else if (flags & Write) {
    native_flags |= O_WRONLY;
  } else {
    native_flags |= O_RDONLY;
  }
  if (flags & Truncate) {
    native_flags |= O_TRUNC;
  }
  if (flags & Create) {
    native_flags |= O_CREAT;
  } else if (flags & CreateNew) {
    native_flags |= O_CREAT | O_EXCL;
  }
  if (flags & Append) {
    native_flags |= O_APPEND;
  }
  native_flags |= O_CLOEXEC;

  int native_fd = skip_eintr([&] { return ::open(filepath.c_str(), native_flags, static_cast<mode_t>(mode)); });
  if (native_fd < 0) {
    return OS_ERROR(PSLICE() << "File \"" << filepath << "\" can't be opened");
  }
  return FileFd(native_fd);
}

Result<size_t> FileFd::write(Slice slice) {
  CHECK(!empty());
  auto bytes_written = skip_eintr([&] { return ::write(fd_, slice.begin(), slice.size()); });
  if (bytes_written < 0) {
    return OS_ERROR(PSLICE() << "Write to file " << fd_ << " has failed");
  }
  return static_cast<size_t>(bytes_written);
}

Result<size_t> FileFd::read(MutableSlice slice) {
  CHECK(!empty());
  auto bytes_read = skip_eintr([&] { return ::read(fd_, slice.begin(), slice.size()); });
  if (bytes_read < 0) {
    return OS_ERROR(PSLICE() << "Read from file " << fd_ << " has failed");
  }
  return static_cast<size_t>(bytes_read);
}

Result<size_t> FileFd::pwrite(Slice slice, int64 offset) {
  CHECK(!empty());
  if (offset < 0) {
    return Status::Error("Offset must be non-negative");
  }
  auto bytes_written =
      skip_eintr([&] { return ::pwrite(fd_, slice.begin(), slice.size(), static_cast<off_t>(offset)); });
  if (bytes_written < 0) {
    return OS_ERROR(PSLICE() << "Pwrite to file " << fd_ << " at offset " << offset << " has failed");
  }
  return static_cast<size_t>(bytes_written);
}

Result<size_t> FileFd::pread(MutableSlice slice, int64 offset) const {
  CHECK(!empty());
  if (offset < 0) {
    return Status::Error("Offset must be non-negative");
  }
  size_t total = 0;
  while (total < slice.size()) {
    auto part = slice.substr(total);
    auto part_offset = static_cast<off_t>(offset + static_cast<int64>(total));
    auto bytes_read = skip_eintr([&] { return ::pread(fd_, part.begin(), part.size(), part_offset); });
    if (bytes_read < 0) {
      return OS_ERROR(PSLICE() << "Pread from file " << fd_ << " at offset " << offset << " has failed");
    }
    if (bytes_read == 0) {
      break;
    }
    total += static_cast<size_t>(bytes_read);
  }
  return total;
}

Result<int64> FileFd::get_size() const {
  CHECK(!empty());
  struct ::stat buf;
  if (fstat(fd_, &buf) < 0) {
    return OS_ERROR(PSLICE() << "Stat for file " << fd_ << " has failed");
  }
  return static_cast<int64>(buf.st_size);
}

void FileFd::close() {
  if (fd_ >= 0) {
    if (::close(fd_) < 0) {
      auto status = OS_ERROR("Failed to close file");
      LOG(ERROR) << status;
    }
    fd_ = -1;
  }
}

}  // namespace mtlink
