//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#define MTLINK_DEFINE_STR_IMPL(x) #x
#define MTLINK_DEFINE_STR(x) MTLINK_DEFINE_STR_IMPL(x)
#define MTLINK_CONCAT_IMPL(x, y) x##y
#define MTLINK_CONCAT(x, y) MTLINK_CONCAT_IMPL(x, y)

#if defined(__GNUC__) || defined(__clang__)
#define MTLINK_WARN_UNUSED_RESULT __attribute__((warn_unused_result))
#define MTLINK_UNUSED __attribute__((unused))
#else
#define MTLINK_WARN_UNUSED_RESULT
#define MTLINK_UNUSED
#endif

namespace mtlink {

using int8 = std::int8_t;
using int16 = std::int16_t;
using uint16 = std::uint16_t;
using int32 = std::int32_t;
using uint32 = std::uint32_t;
using int64 = std::int64_t;
using uint64 = std::uint64_t;
using uint8 = std::uint8_t;

inline bool likely(bool x) {
#if defined(__GNUC__) || defined(__clang__)
  return __builtin_expect(x, 1);
#else
  return x;
#endif
}

inline bool unlikely(bool x) {
#if defined(__GNUC__) || defined(__clang__)
  return __builtin_expect(x, 0);
#else
  return x;
#endif
}

// accept parameters by value, so constexpr variables aren't required to be instantiated
template <class T>
T max(T a, T b) {
  return a < b ? b : a;
}

template <class T>
T min(T a, T b) {
  return a < b ? a : b;
}

using string = std::string;

template <class ValueT>
using vector = std::vector<ValueT>;

template <class ValueT>
using unique_ptr = std::unique_ptr<ValueT>;

using std::make_unique;

struct Unit {};

struct Auto {
  template <class ToT>
  operator ToT() const {
    return ToT();
  }
};

}  // namespace mtlink
