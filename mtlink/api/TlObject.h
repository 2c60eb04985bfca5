//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/utils/common.h"
#include "mtlink/utils/logging.h"
#include "mtlink/utils/misc.h"
#include "mtlink/utils/StringBuilder.h"
#include "mtlink/utils/tl_parsers.h"
#include "mtlink/utils/tl_storers.h"

#include <utility>

namespace mtlink {
namespace api {

class TlObject {
 public:
  TlObject() = default;
  TlObject(const TlObject &) = delete;
  TlObject &operator=(const TlObject &) = delete;
  TlObject(TlObject &&) = delete;
  TlObject &operator=(TlObject &&) = delete;
  virtual ~TlObject() = default;

  virtual int32 get_id() const = 0;

  virtual void store(TlStorerCalcLength &s) const = 0;

  virtual void store(TlStorerUnsafe &s) const = 0;

  virtual void print(StringBuilder &sb) const = 0;
};

class Object : public TlObject {};

class Function : public TlObject {};

template <class T>
using object_ptr = unique_ptr<T>;

template <class T, class... ArgsT>
object_ptr<T> make_object(ArgsT &&...args) {
  return object_ptr<T>(new T(std::forward<ArgsT>(args)...));
}

inline StringBuilder &operator<<(StringBuilder &sb, const TlObject &object) {
  object.print(sb);
  return sb;
}

namespace detail {

constexpr int32 VECTOR_ID = 0x1cb5c415;

template <class StorerT>
void store_int_vector(const vector<int32> &v, StorerT &s) {
  s.store_int(VECTOR_ID);
  s.store_int(narrow_cast<int32>(v.size()));
  for (auto x : v) {
    s.store_int(x);
  }
}

inline vector<int32> fetch_int_vector(TlParser &p) {
  vector<int32> result;
  if (p.fetch_int() != VECTOR_ID) {
    p.set_error("Vector expected");
    return result;
  }
  auto size = p.fetch_int();
  if (size < 0 || static_cast<size_t>(size) > p.get_left_len() / sizeof(int32)) {
    p.set_error("Wrong vector length");
    return result;
  }
  result.reserve(static_cast<size_t>(size));
  for (int32 i = 0; i < size; i++) {
    result.push_back(p.fetch_int());
  }
  return result;
}

}  // namespace detail

// objects are always stored boxed, i.e. prefixed with their constructor identifier
inline string serialize_object(const TlObject &object) {
  return serialize(object);
}

}  // namespace api
}  // namespace mtlink
