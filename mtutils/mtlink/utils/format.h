//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/utils/common.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/StringBuilder.h"

#include <type_traits>

namespace mtlink {
namespace format {

/*** Tagged value ***/
template <class ValueT>
struct Tagged {
  Slice tag;
  const ValueT &ref;
};

template <class ValueT>
StringBuilder &operator<<(StringBuilder &stream, const Tagged<ValueT> &tagged) {
  return stream << '[' << tagged.tag << ':' << tagged.ref << ']';
}

template <class ValueT>
Tagged<ValueT> tag(Slice tag, const ValueT &ref) {
  return Tagged<ValueT>{tag, ref};
}

/*** Hex ***/
template <class T>
struct Hex {
  const T &value;
};

template <class T>
Hex<T> as_hex(const T &value) {
  return Hex<T>{value};
}

template <class T>
StringBuilder &operator<<(StringBuilder &builder, const Hex<T> &hex) {
  const char *digits = "0123456789abcdef";
  auto value = static_cast<uint64>(static_cast<std::make_unsigned_t<T>>(hex.value));
  char buf[sizeof(T) * 2];
  for (size_t i = 0; i < sizeof(buf); i++) {
    buf[sizeof(buf) - 1 - i] = digits[(value >> (4 * i)) & 15];
  }
  return builder << "0x" << Slice(buf, sizeof(buf));
}

/*** Time to string ***/
struct Time {
  double seconds_;
};

inline StringBuilder &operator<<(StringBuilder &logger, Time t) {
  struct NamedValue {
    const char *name;
    double value;
  };

  static constexpr NamedValue durations[] = {{"ns", 1e-9}, {"us", 1e-6}, {"ms", 1e-3}, {"s", 1}};
  static constexpr size_t durations_n = sizeof(durations) / sizeof(NamedValue);

  size_t i = 0;
  while (i + 1 < durations_n && t.seconds_ > 10 * durations[i + 1].value) {
    i++;
  }
  logger << t.seconds_ / durations[i].value << Slice(durations[i].name);
  return logger;
}

inline Time as_time(double seconds) {
  return Time{seconds};
}

}  // namespace format

using format::tag;

}  // namespace mtlink
