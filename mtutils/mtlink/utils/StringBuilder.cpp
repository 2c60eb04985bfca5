//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/utils/StringBuilder.h"

#include <cstdio>

namespace mtlink {

namespace {
template <class T>
void append_formatted(string &buffer, const char *format, T value) {
  char buf[64];
  auto len = std::snprintf(buf, sizeof(buf), format, value);
  if (len > 0) {
    buffer.append(buf, min(static_cast<size_t>(len), sizeof(buf) - 1));
  }
}
}  // namespace

StringBuilder &StringBuilder::operator<<(int x) {
  append_formatted(buffer_, "%d", x);
  return *this;
}

StringBuilder &StringBuilder::operator<<(unsigned int x) {
  append_formatted(buffer_, "%u", x);
  return *this;
}

StringBuilder &StringBuilder::operator<<(long int x) {
  append_formatted(buffer_, "%ld", x);
  return *this;
}

StringBuilder &StringBuilder::operator<<(long unsigned int x) {
  append_formatted(buffer_, "%lu", x);
  return *this;
}

StringBuilder &StringBuilder::operator<<(long long int x) {
  append_formatted(buffer_, "%lld", x);
  return *this;
}

StringBuilder &StringBuilder::operator<<(long long unsigned int x) {
  append_formatted(buffer_, "%llu", x);
  return *this;
}

StringBuilder &StringBuilder::operator<<(double x) {
  append_formatted(buffer_, "%.6g", x);
  return *this;
}

StringBuilder &StringBuilder::operator<<(const void *ptr) {
  append_formatted(buffer_, "%p", ptr);
  return *this;
}

}  // namespace mtlink
