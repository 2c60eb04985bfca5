//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/utils/common.h"

#include <cstring>
#include <type_traits>

namespace mtlink {

class MutableSlice {
  char *s_;
  size_t len_;

 public:
  MutableSlice() : s_(const_cast<char *>("")), len_(0) {
  }
  MutableSlice(char *s, size_t len) : s_(s), len_(len) {
  }
  MutableSlice(unsigned char *s, size_t len) : s_(reinterpret_cast<char *>(s)), len_(len) {
  }
  MutableSlice(string &s) : s_(&s[0]), len_(s.size()) {
  }
  MutableSlice(char *s, char *t) : s_(s), len_(static_cast<size_t>(t - s)) {
  }

  bool empty() const {
    return len_ == 0;
  }
  size_t size() const {
    return len_;
  }

  MutableSlice &remove_prefix(size_t prefix_len) {
    prefix_len = min(prefix_len, len_);
    s_ += prefix_len;
    len_ -= prefix_len;
    return *this;
  }
  MutableSlice &truncate(size_t size) {
    if (len_ > size) {
      len_ = size;
    }
    return *this;
  }
  MutableSlice substr(size_t from) const {
    from = min(from, len_);
    return MutableSlice(s_ + from, len_ - from);
  }
  MutableSlice substr(size_t from, size_t size) const {
    from = min(from, len_);
    return MutableSlice(s_ + from, min(size, len_ - from));
  }

  char *data() const {
    return s_;
  }
  char *begin() const {
    return s_;
  }
  unsigned char *ubegin() const {
    return reinterpret_cast<unsigned char *>(s_);
  }
  char *end() const {
    return s_ + len_;
  }
  string str() const {
    return string(begin(), size());
  }
  char &operator[](size_t i) const {
    return s_[i];
  }
};

class Slice {
  const char *s_;
  size_t len_;

  struct private_tag {};

 public:
  Slice() : s_(""), len_(0) {
  }
  Slice(const MutableSlice &other) : s_(other.begin()), len_(other.size()) {
  }
  Slice(const char *s, size_t len) : s_(s), len_(len) {
  }
  Slice(const unsigned char *s, size_t len) : s_(reinterpret_cast<const char *>(s)), len_(len) {
  }
  Slice(const string &s) : s_(s.c_str()), len_(s.size()) {
  }
  template <class T>
  Slice(T s, std::enable_if_t<std::is_same<char *, std::remove_const_t<T>>::value, private_tag> = {})
      : s_(s), len_(std::strlen(s)) {
  }
  template <class T>
  Slice(T s, std::enable_if_t<std::is_same<const char *, std::remove_const_t<T>>::value, private_tag> = {})
      : s_(s), len_(std::strlen(s)) {
  }
  Slice(const char *s, const char *t) : s_(s), len_(static_cast<size_t>(t - s)) {
  }

  template <size_t N>
  constexpr Slice(char (&a)[N]) = delete;

  template <size_t N>
  constexpr Slice(const char (&a)[N]) : s_(a), len_(N - 1) {
  }

  bool empty() const {
    return len_ == 0;
  }
  size_t size() const {
    return len_;
  }

  Slice &remove_prefix(size_t prefix_len) {
    prefix_len = min(prefix_len, len_);
    s_ += prefix_len;
    len_ -= prefix_len;
    return *this;
  }
  Slice &remove_suffix(size_t suffix_len) {
    suffix_len = min(suffix_len, len_);
    len_ -= suffix_len;
    return *this;
  }
  Slice &truncate(size_t size) {
    if (len_ > size) {
      len_ = size;
    }
    return *this;
  }
  Slice substr(size_t from) const {
    from = min(from, len_);
    return Slice(s_ + from, len_ - from);
  }
  Slice substr(size_t from, size_t size) const {
    from = min(from, len_);
    return Slice(s_ + from, min(size, len_ - from));
  }

  size_t find(char c) const {
    for (size_t pos = 0; pos < len_; pos++) {
      if (s_[pos] == c) {
        return pos;
      }
    }
    return static_cast<size_t>(-1);
  }

  size_t rfind(char c) const {
    for (size_t pos = len_; pos-- > 0;) {
      if (s_[pos] == c) {
        return pos;
      }
    }
    return static_cast<size_t>(-1);
  }

  const char *data() const {
    return s_;
  }
  const char *begin() const {
    return s_;
  }
  const unsigned char *ubegin() const {
    return reinterpret_cast<const unsigned char *>(s_);
  }
  const char *end() const {
    return s_ + len_;
  }
  string str() const {
    return string(begin(), size());
  }
  char operator[](size_t i) const {
    return s_[i];
  }
};

inline bool operator==(const Slice &a, const Slice &b) {
  return a.size() == b.size() && (a.size() == 0 || std::memcmp(a.data(), b.data(), a.size()) == 0);
}

inline bool operator!=(const Slice &a, const Slice &b) {
  return !(a == b);
}

// null-terminated slice
class CSlice : public Slice {
  struct private_tag {};

 public:
  explicit CSlice(const MutableSlice &other) : Slice(other) {
  }
  CSlice(const char *s, const char *t) : Slice(s, t) {
  }
  CSlice(const string &str) : Slice(str) {
  }
  template <class T>
  CSlice(T s, std::enable_if_t<std::is_same<char *, std::remove_const_t<T>>::value, private_tag> = {}) : Slice(s) {
  }
  template <class T>
  CSlice(T s, std::enable_if_t<std::is_same<const char *, std::remove_const_t<T>>::value, private_tag> = {})
      : Slice(s) {
  }

  template <size_t N>
  constexpr CSlice(char (&a)[N]) = delete;

  template <size_t N>
  constexpr CSlice(const char (&a)[N]) : Slice(a) {
  }

  CSlice() : CSlice("") {
  }

  const char *c_str() const {
    return begin();
  }
};

}  // namespace mtlink
