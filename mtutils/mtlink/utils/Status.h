//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/utils/common.h"
#include "mtlink/utils/logging.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/StringBuilder.h"

#include <cerrno>
#include <new>
#include <type_traits>
#include <utility>

#define TRY_STATUS(status)                      \
  {                                             \
    auto try_status = (status);                 \
    if (try_status.is_error()) {                \
      return try_status.move_as_error_unsafe(); \
    }                                           \
  }

#define TRY_STATUS_PREFIX(status, prefix)                    \
  {                                                          \
    auto try_status = (status);                              \
    if (try_status.is_error()) {                             \
      return try_status.move_as_error_prefix_unsafe(prefix); \
    }                                                        \
  }

#define TRY_STATUS_PROMISE(promise_name, status)                        \
  {                                                                     \
    auto try_status = (status);                                         \
    if (try_status.is_error()) {                                        \
      return promise_name.set_error(try_status.move_as_error_unsafe()); \
    }                                                                   \
  }

#define TRY_RESULT(name, result) \
  TRY_RESULT_IMPL(MTLINK_CONCAT(MTLINK_CONCAT(r_, name), __LINE__), auto name, result)

#define TRY_RESULT_PROMISE(promise_name, name, result) \
  TRY_RESULT_PROMISE_IMPL(promise_name, MTLINK_CONCAT(MTLINK_CONCAT(r_, name), __LINE__), auto name, result)

#define TRY_RESULT_ASSIGN(name, result) TRY_RESULT_IMPL(MTLINK_CONCAT(r_response, __LINE__), name, result)

#define TRY_RESULT_PREFIX(name, result, prefix) \
  TRY_RESULT_PREFIX_IMPL(MTLINK_CONCAT(MTLINK_CONCAT(r_, name), __LINE__), auto name, result, prefix)

#define TRY_RESULT_IMPL(r_name, name, result) \
  auto r_name = (result);                     \
  if (r_name.is_error()) {                    \
    return r_name.move_as_error_unsafe();     \
  }                                           \
  name = r_name.move_as_ok_unsafe();

#define TRY_RESULT_PREFIX_IMPL(r_name, name, result, prefix) \
  auto r_name = (result);                                    \
  if (r_name.is_error()) {                                   \
    return r_name.move_as_error_prefix_unsafe(prefix);       \
  }                                                          \
  name = r_name.move_as_ok_unsafe();

#define TRY_RESULT_PROMISE_IMPL(promise_name, r_name, name, result) \
  auto r_name = (result);                                           \
  if (r_name.is_error()) {                                          \
    return promise_name.set_error(r_name.move_as_error_unsafe());   \
  }                                                                 \
  name = r_name.move_as_ok_unsafe();

#define LOG_STATUS(status)                             \
  {                                                    \
    auto log_status = (status);                        \
    if (log_status.is_error()) {                       \
      LOG(ERROR) << log_status.move_as_error_unsafe(); \
    }                                                  \
  }

#define ensure() ensure_impl(__FILE__, __LINE__)
#define ensure_error() ensure_error_impl(__FILE__, __LINE__)

#define OS_ERROR(message)                                        \
  [&] {                                                          \
    auto saved_errno = errno;                                    \
    return ::mtlink::Status::PosixError(saved_errno, (message)); \
  }()

namespace mtlink {

CSlice strerror_safe(int code);

class Status {
  enum class ErrorType : int8 { General, Os };

 public:
  Status() = default;

  Status clone() const MTLINK_WARN_UNUSED_RESULT {
    if (is_ok()) {
      return Status();
    }
    return Status(ptr_->error_type, ptr_->error_code, ptr_->message);
  }

  static Status OK() MTLINK_WARN_UNUSED_RESULT {
    return Status();
  }

  static Status Error(int err, Slice message = Slice()) MTLINK_WARN_UNUSED_RESULT {
    return Status(ErrorType::General, err, message);
  }

  static Status Error(Slice message) MTLINK_WARN_UNUSED_RESULT {
    return Error(0, message);
  }

  static Status PosixError(int32 saved_errno, Slice message) MTLINK_WARN_UNUSED_RESULT {
    return Status(ErrorType::Os, saved_errno, message);
  }

  template <int Code>
  static Status Error() {
    return Error(Code);
  }

  StringBuilder &print(StringBuilder &sb) const {
    if (is_ok()) {
      return sb << "OK";
    }
    switch (ptr_->error_type) {
      case ErrorType::General:
        sb << "[Error";
        break;
      case ErrorType::Os:
        sb << "[PosixError : " << strerror_safe(ptr_->error_code);
        break;
      default:
        UNREACHABLE();
    }
    sb << " : " << code() << " : " << message() << "]";
    return sb;
  }

  string to_string() const {
    StringBuilder sb;
    print(sb);
    return sb.move_as_string();
  }

  bool is_ok() const MTLINK_WARN_UNUSED_RESULT {
    return !is_error();
  }

  bool is_error() const MTLINK_WARN_UNUSED_RESULT {
    return ptr_ != nullptr;
  }

  void ensure_impl(CSlice file_name, int line) const {
    if (!is_ok()) {
      LOG(FATAL) << "Unexpected Status " << to_string() << " in file " << file_name << " at line " << line;
    }
  }
  void ensure_error_impl(CSlice file_name, int line) const {
    if (is_ok()) {
      LOG(FATAL) << "Unexpected Status::OK in file " << file_name << " at line " << line;
    }
  }

  void ignore() const {
    // nop
  }

  int32 code() const {
    if (is_ok()) {
      return 0;
    }
    return ptr_->error_code;
  }

  CSlice message() const {
    if (is_ok()) {
      return CSlice("OK");
    }
    return CSlice(ptr_->message);
  }

  string public_message() const {
    if (is_ok()) {
      return "OK";
    }
    if (ptr_->error_type == ErrorType::Os) {
      return strerror_safe(ptr_->error_code).str();
    }
    return ptr_->message;
  }

  const Status &error() const {
    return *this;
  }

  Status move() MTLINK_WARN_UNUSED_RESULT {
    return std::move(*this);
  }

  Status move_as_error() MTLINK_WARN_UNUSED_RESULT {
    return std::move(*this);
  }

  Status move_as_error_unsafe() MTLINK_WARN_UNUSED_RESULT {
    return std::move(*this);
  }

  Status move_as_ok() = delete;

  Status move_as_error_prefix(Slice prefix) const MTLINK_WARN_UNUSED_RESULT;

  Status move_as_error_prefix_unsafe(Slice prefix) const MTLINK_WARN_UNUSED_RESULT {
    return move_as_error_prefix(prefix);
  }

  Status move_as_error_suffix(Slice suffix) const MTLINK_WARN_UNUSED_RESULT;

 private:
  struct Info {
    ErrorType error_type;
    int32 error_code;
    string message;
  };

  unique_ptr<Info> ptr_;

  Status(ErrorType error_type, int error_code, Slice message)
      : ptr_(make_unique<Info>(Info{error_type, error_code, message.str()})) {
  }
};

template <class T = Unit>
class Result {
 public:
  using ValueT = T;
  Result() : status_(Status::Error<-1>()) {
  }
  template <class S, std::enable_if_t<!std::is_same<std::decay_t<S>, Result>::value, int> = 0>
  Result(S &&x) : status_(), value_(std::forward<S>(x)) {
  }
  struct emplace_t {};
  template <class... ArgsT>
  Result(emplace_t, ArgsT &&...args) : status_(), value_(std::forward<ArgsT>(args)...) {
  }
  Result(Status &&status) : status_(std::move(status)) {
    CHECK(status_.is_error());
  }
  Result(const Result &) = delete;
  Result &operator=(const Result &) = delete;
  Result(Result &&other) noexcept : status_(std::move(other.status_)) {
    if (status_.is_ok()) {
      new (&value_) T(std::move(other.value_));
      other.value_.~T();
    }
    other.status_ = Status::Error<-2>();
  }
  Result &operator=(Result &&other) noexcept {
    CHECK(this != &other);
    if (status_.is_ok()) {
      value_.~T();
    }
    if (other.status_.is_ok()) {
      new (&value_) T(std::move(other.value_));
      other.value_.~T();
    }
    status_ = std::move(other.status_);
    other.status_ = Status::Error<-3>();
    return *this;
  }
  template <class... ArgsT>
  void emplace(ArgsT &&...args) {
    if (status_.is_ok()) {
      value_.~T();
    }
    new (&value_) T(std::forward<ArgsT>(args)...);
    status_ = Status::OK();
  }
  ~Result() {
    if (status_.is_ok()) {
      value_.~T();
    }
  }

  void ensure_impl(CSlice file_name, int line) const {
    if (is_error()) {
      LOG(FATAL) << "Unexpected Status " << error().to_string() << " in file " << file_name << " at line " << line;
    }
  }
  void ensure_error_impl(CSlice file_name, int line) const {
    if (is_ok()) {
      LOG(FATAL) << "Unexpected Status::OK in file " << file_name << " at line " << line;
    }
  }

  void ignore() const {
    status_.ignore();
  }
  bool is_ok() const {
    return status_.is_ok();
  }
  bool is_error() const {
    return status_.is_error();
  }
  const Status &error() const {
    CHECK(status_.is_error());
    return status_;
  }
  Status move_as_error() MTLINK_WARN_UNUSED_RESULT {
    CHECK(status_.is_error());
    auto status = std::move(status_);
    status_ = Status::Error<-5>();
    return status;
  }
  Status move_as_error_unsafe() MTLINK_WARN_UNUSED_RESULT {
    return move_as_error();
  }
  Status move_as_error_prefix(Slice prefix) MTLINK_WARN_UNUSED_RESULT {
    CHECK(status_.is_error());
    auto result = status_.move_as_error_prefix(prefix);
    status_ = Status::Error<-5>();
    return result;
  }
  Status move_as_error_prefix_unsafe(Slice prefix) MTLINK_WARN_UNUSED_RESULT {
    return move_as_error_prefix(prefix);
  }
  const T &ok() const {
    LOG_CHECK(status_.is_ok()) << status_.to_string();
    return value_;
  }
  T &ok_ref() {
    LOG_CHECK(status_.is_ok()) << status_.to_string();
    return value_;
  }
  T move_as_ok() {
    LOG_CHECK(status_.is_ok()) << status_.to_string();
    return std::move(value_);
  }
  T move_as_ok_unsafe() {
    return std::move(value_);
  }

  Result<T> clone() const MTLINK_WARN_UNUSED_RESULT {
    if (is_ok()) {
      return Result<T>(ok());
    }
    return error().clone();
  }
  void clear() {
    *this = Result<T>();
  }

 private:
  Status status_;
  union {
    T value_;
  };
};

template <>
inline Result<Unit>::Result(Status &&status) : status_(std::move(status)) {
  // no assert
}

inline StringBuilder &operator<<(StringBuilder &string_builder, const Status &status) {
  return status.print(string_builder);
}

}  // namespace mtlink
