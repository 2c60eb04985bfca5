//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/utils/common.h"
#include "mtlink/utils/Slice.h"

namespace mtlink {

void md5(Slice input, MutableSlice output);

class Md5State {
 public:
  Md5State();
  Md5State(const Md5State &) = delete;
  Md5State &operator=(const Md5State &) = delete;
  Md5State(Md5State &&other) noexcept;
  Md5State &operator=(Md5State &&other) noexcept;
  ~Md5State();

  void init();

  void feed(Slice data);

  // output must be at least 16 bytes long
  void extract(MutableSlice output);

  bool is_inited() const {
    return is_inited_;
  }

 private:
  class Impl;
  unique_ptr<Impl> impl_;
  bool is_inited_ = false;
};

uint32 crc32(Slice data);

}  // namespace mtlink
