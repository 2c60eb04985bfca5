//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/utils/crypto.h"

#include "mtlink/utils/logging.h"

#include <openssl/evp.h>

#include <zlib.h>

#include <limits>

namespace mtlink {

void md5(Slice input, MutableSlice output) {
  Md5State state;
  state.init();
  state.feed(input);
  state.extract(output);
}

class Md5State::Impl {
 public:
  EVP_MD_CTX *ctx_;

  Impl() {
    ctx_ = EVP_MD_CTX_new();
    LOG_IF(FATAL, ctx_ == nullptr) << "Failed to create EVP_MD_CTX";
  }
  Impl(const Impl &) = delete;
  Impl &operator=(const Impl &) = delete;
  Impl(Impl &&) = delete;
  Impl &operator=(Impl &&) = delete;
  ~Impl() {
    CHECK(ctx_ != nullptr);
    EVP_MD_CTX_free(ctx_);
  }
};

Md5State::Md5State() = default;

Md5State::Md5State(Md5State &&other) noexcept : impl_(std::move(other.impl_)), is_inited_(other.is_inited_) {
  other.is_inited_ = false;
}

Md5State &Md5State::operator=(Md5State &&other) noexcept {
  impl_ = std::move(other.impl_);
  is_inited_ = other.is_inited_;
  other.is_inited_ = false;
  return *this;
}

Md5State::~Md5State() = default;

void Md5State::init() {
  if (!impl_) {
    impl_ = make_unique<Impl>();
  }
  int err = EVP_DigestInit_ex(impl_->ctx_, EVP_md5(), nullptr);
  LOG_IF(FATAL, err != 1) << "EVP_DigestInit_ex failed";
  is_inited_ = true;
}

void Md5State::feed(Slice data) {
  CHECK(impl_);
  CHECK(is_inited_);
  if (data.empty()) {
    return;
  }
  int err = EVP_DigestUpdate(impl_->ctx_, data.ubegin(), data.size());
  LOG_IF(FATAL, err != 1) << "EVP_DigestUpdate failed";
}

void Md5State::extract(MutableSlice output) {
  CHECK(output.size() >= 16);
  CHECK(impl_);
  CHECK(is_inited_);
  unsigned int size = 0;
  int err = EVP_DigestFinal_ex(impl_->ctx_, output.ubegin(), &size);
  LOG_IF(FATAL, err != 1 || size != 16) << "EVP_DigestFinal_ex failed";
  is_inited_ = false;
}

uint32 crc32(Slice data) {
  uLong crc = ::crc32(0L, Z_NULL, 0);
  while (!data.empty()) {
    auto chunk_size = static_cast<uInt>(min(data.size(), static_cast<size_t>(std::numeric_limits<uInt>::max())));
    crc = ::crc32(crc, data.ubegin(), chunk_size);
    data.remove_prefix(chunk_size);
  }
  return static_cast<uint32>(crc);
}

}  // namespace mtlink
