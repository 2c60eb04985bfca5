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

#include <limits>
#include <type_traits>

namespace mtlink {

vector<string> full_split(Slice s, char delimiter = ' ', size_t max_parts = std::numeric_limits<size_t>::max());

inline bool begins_with(Slice str, Slice prefix) {
  return prefix.size() <= str.size() && prefix == Slice(str.data(), prefix.size());
}

inline char to_lower(char c) {
  if ('A' <= c && c <= 'Z') {
    return static_cast<char>(c - 'A' + 'a');
  }
  return c;
}

string to_lower(Slice slice);

inline bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\0' || c == '\v';
}

inline bool is_digit(char c) {
  return static_cast<unsigned char>(c - '0') <= 9;
}

Slice trim(Slice str);

string hex_encode(Slice data);

template <class T>
T clamp(T value, T min_value, T max_value) {
  CHECK(min_value <= max_value);
  if (value < min_value) {
    return min_value;
  }
  if (value > max_value) {
    return max_value;
  }
  return value;
}

namespace detail {
class NarrowCast {
  const char *file_;
  int line_;

 public:
  NarrowCast(const char *file, int line) : file_(file), line_(line) {
  }

  template <class R, class A>
  R cast(const A &a) const {
    using RT = std::decay_t<R>;
    using AT = std::decay_t<A>;

    auto r = R(a);
    LOG_CHECK(A(r) == a) << static_cast<AT>(a) << " " << static_cast<RT>(r) << " " << file_ << " " << line_;
    LOG_CHECK((std::is_signed<RT>::value == std::is_signed<AT>::value) || ((static_cast<RT>(r) < RT{}) == (a < AT{})))
        << static_cast<AT>(a) << " " << static_cast<RT>(r) << " " << file_ << " " << line_;

    return r;
  }
};
}  // namespace detail

#define narrow_cast ::mtlink::detail::NarrowCast(__FILE__, __LINE__).cast

// decimal integer with optional leading minus, no overflow
template <class T>
Result<T> to_integer_safe(Slice str) {
  static_assert(std::is_integral<T>::value, "expected an integral type");
  if (str.empty()) {
    return Status::Error("Expected a number, but found an empty string");
  }
  bool is_negative = false;
  size_t pos = 0;
  if (str[0] == '-') {
    if (!std::is_signed<T>::value) {
      return Status::Error(PSLICE() << "Expected a non-negative number, but found \"" << str << '"');
    }
    is_negative = true;
    pos = 1;
  }
  if (pos == str.size()) {
    return Status::Error(PSLICE() << "Can't parse \"" << str << "\" as number");
  }

  using UT = std::make_unsigned_t<T>;
  UT limit = is_negative ? static_cast<UT>(static_cast<UT>(std::numeric_limits<T>::max()) + 1)
                         : static_cast<UT>(std::numeric_limits<T>::max());
  UT result = 0;
  for (; pos < str.size(); pos++) {
    auto c = str[pos];
    if (!is_digit(c)) {
      return Status::Error(PSLICE() << "Can't parse \"" << str << "\" as number");
    }
    auto digit = static_cast<UT>(c - '0');
    if (result > (limit - digit) / 10) {
      return Status::Error(PSLICE() << "Can't parse \"" << str << "\" as number: overflow");
    }
    result = static_cast<UT>(result * 10 + digit);
  }
  if (is_negative) {
    return static_cast<T>(static_cast<UT>(0) - result);
  }
  return static_cast<T>(result);
}

Result<double> to_double_safe(Slice str) MTLINK_WARN_UNUSED_RESULT;

}  // namespace mtlink
