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
#include "mtlink/utils/Status.h"

#include <cstring>

namespace mtlink {

class TlParser {
  const unsigned char *data_ = nullptr;
  size_t data_len_ = 0;
  size_t left_len_ = 0;
  const char *error_ = nullptr;
  size_t error_pos_ = static_cast<size_t>(-1);

 public:
  explicit TlParser(Slice slice) {
    data_ = slice.ubegin();
    data_len_ = left_len_ = slice.size();
  }

  TlParser(const TlParser &) = delete;
  TlParser &operator=(const TlParser &) = delete;

  void set_error(const char *error_message) {
    if (error_ == nullptr) {
      CHECK(error_message != nullptr);
      error_ = error_message;
      error_pos_ = data_len_ - left_len_;
      data_ = empty_data();
      left_len_ = 0;
      data_len_ = 0;
    } else {
      data_ = empty_data();
      CHECK(error_pos_ != static_cast<size_t>(-1));
      CHECK(data_len_ == 0);
      CHECK(left_len_ == 0);
    }
  }

  const char *get_error() const {
    return error_;
  }

  size_t get_error_pos() const {
    return error_pos_;
  }

  Status get_status() const {
    if (error_ == nullptr) {
      return Status::OK();
    }
    return Status::Error(PSLICE() << error_ << " at " << error_pos_);
  }

  void check_len(const size_t len) {
    if (unlikely(left_len_ < len)) {
      set_error("Not enough data to read");
    } else {
      left_len_ -= len;
    }
  }

  int32 fetch_int() {
    int32 result = 0;
    fetch_binary(result);
    return result;
  }

  int64 fetch_long() {
    int64 result = 0;
    fetch_binary(result);
    return result;
  }

  bool fetch_bool() {
    auto constructor_id = fetch_int();
    if (constructor_id == bool_true_id()) {
      return true;
    }
    if (constructor_id != bool_false_id()) {
      set_error("Bool expected");
    }
    return false;
  }

  template <class T>
  T fetch_string() {
    check_len(sizeof(int32));
    if (error_ != nullptr) {
      return T();
    }
    size_t result_len = *data_;
    const unsigned char *result_begin;
    size_t result_aligned_len;
    if (result_len < 254) {
      result_begin = data_ + 1;
      result_aligned_len = (result_len >> 2) << 2;
    } else if (result_len == 254) {
      result_len = data_[1] + (data_[2] << 8) + (data_[3] << 16);
      result_begin = data_ + 4;
      result_aligned_len = ((result_len + 3) >> 2) << 2;
    } else {
      set_error("Can't fetch string, 255 found");
      return T();
    }
    check_len(result_aligned_len);
    if (error_ != nullptr) {
      return T();
    }
    data_ += result_aligned_len + sizeof(int32);
    return T(reinterpret_cast<const char *>(result_begin), result_len);
  }

  void fetch_end() {
    if (left_len_) {
      set_error("Too much data to fetch");
    }
  }

  size_t get_left_len() const {
    return left_len_;
  }

  static constexpr int32 bool_true_id() {
    return static_cast<int32>(0x997275b5);
  }

  static constexpr int32 bool_false_id() {
    return static_cast<int32>(0xbc799737);
  }

 private:
  template <class T>
  void fetch_binary(T &result) {
    check_len(sizeof(T));
    if (error_ != nullptr) {
      return;
    }
    std::memcpy(&result, data_, sizeof(T));
    data_ += sizeof(T);
  }

  static const unsigned char *empty_data() {
    static const unsigned char empty[4] = {};
    return empty;
  }
};

}  // namespace mtlink
