//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/utils/common.h"
#include "mtlink/utils/Slice.h"

#include <type_traits>
#include <utility>

namespace mtlink {

class StringBuilder {
 public:
  StringBuilder() = default;

  void clear() {
    buffer_.clear();
  }

  void push_back(char c) {
    buffer_.push_back(c);
  }

  void append_char(size_t count, char c) {
    buffer_.append(count, c);
  }

  CSlice as_cslice() const {
    return CSlice(buffer_);
  }

  size_t size() const {
    return buffer_.size();
  }

  string move_as_string() {
    return std::move(buffer_);
  }

  StringBuilder &ref() {
    return *this;
  }

  template <class T>
  std::enable_if_t<std::is_same<char *, std::remove_const_t<T>>::value, StringBuilder> &operator<<(T str) {
    return *this << Slice(str);
  }
  template <class T>
  std::enable_if_t<std::is_same<const char *, std::remove_const_t<T>>::value, StringBuilder> &operator<<(T str) {
    return *this << Slice(str);
  }

  template <size_t N>
  StringBuilder &operator<<(char (&str)[N]) = delete;

  template <size_t N>
  StringBuilder &operator<<(const char (&str)[N]) {
    return *this << Slice(str, N - 1);
  }

  StringBuilder &operator<<(const string &str) {
    return *this << Slice(str);
  }

  StringBuilder &operator<<(Slice slice) {
    buffer_.append(slice.data(), slice.size());
    return *this;
  }

  StringBuilder &operator<<(bool b) {
    return *this << (b ? Slice("true") : Slice("false"));
  }

  StringBuilder &operator<<(char c) {
    buffer_.push_back(c);
    return *this;
  }

  StringBuilder &operator<<(int x);

  StringBuilder &operator<<(unsigned int x);

  StringBuilder &operator<<(long int x);

  StringBuilder &operator<<(long unsigned int x);

  StringBuilder &operator<<(long long int x);

  StringBuilder &operator<<(long long unsigned int x);

  StringBuilder &operator<<(double x);

  StringBuilder &operator<<(const void *ptr);

  template <class A, class B>
  StringBuilder &operator<<(const std::pair<A, B> &p) {
    return *this << '[' << p.first << ';' << p.second << ']';
  }

  template <class T>
  StringBuilder &operator<<(const vector<T> &v) {
    *this << '{';
    if (!v.empty()) {
      *this << v[0];
      for (size_t i = 1; i < v.size(); i++) {
        *this << ", " << v[i];
      }
    }
    return *this << '}';
  }

 private:
  string buffer_;
};

template <class T>
string to_string(const T &x) {
  StringBuilder sb;
  sb << x;
  return sb.move_as_string();
}

}  // namespace mtlink
