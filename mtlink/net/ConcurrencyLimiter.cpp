//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/net/ConcurrencyLimiter.h"

#include "mtlink/net/NetError.h"

#include "mtlink/utils/logging.h"

#include <utility>

namespace mtlink {

ConcurrencyLimiter::Permit::Permit(Permit &&other) noexcept : limiter_(other.limiter_) {
  other.limiter_ = nullptr;
}

ConcurrencyLimiter::Permit &ConcurrencyLimiter::Permit::operator=(Permit &&other) noexcept {
  if (this != &other) {
    release();
    limiter_ = other.limiter_;
    other.limiter_ = nullptr;
  }
  return *this;
}

ConcurrencyLimiter::Permit::~Permit() {
  release();
}

void ConcurrencyLimiter::Permit::release() {
  if (limiter_ == nullptr) {
    return;
  }
  auto limiter = limiter_;
  limiter_ = nullptr;
  limiter->on_release();
}

ConcurrencyLimiter::ConcurrencyLimiter(int32 capacity) : capacity_(capacity) {
  CHECK(capacity_ > 0);
}

ConcurrencyLimiter::~ConcurrencyLimiter() {
  close();
  LOG_IF(ERROR, in_use_ != 0) << "Destroy concurrency limiter with " << in_use_ << " permits in use";
}

ConcurrencyLimiter::Permit ConcurrencyLimiter::take_slot() {
  CHECK(in_use_ < capacity_);
  in_use_++;
  if (in_use_ > high_water_mark_) {
    high_water_mark_ = in_use_;
  }
  return Permit(this);
}

void ConcurrencyLimiter::acquire(Promise<Permit> promise) {
  if (is_closed_) {
    return promise.set_error(request_aborted_error());
  }
  if (in_use_ < capacity_ && waiting_promises_.empty()) {
    return promise.set_value(take_slot());
  }
  VLOG(DEBUG) << "Wait for a free slot: " << in_use_ << " of " << capacity_ << " are in use";
  waiting_promises_.push_back(std::move(promise));
}

void ConcurrencyLimiter::close() {
  if (is_closed_) {
    return;
  }
  is_closed_ = true;
  auto waiting_promises = std::move(waiting_promises_);
  waiting_promises_.clear();
  for (auto &promise : waiting_promises) {
    promise.set_error(request_aborted_error());
  }
}

void ConcurrencyLimiter::on_release() {
  CHECK(in_use_ > 0);
  in_use_--;
  if (waiting_promises_.empty() || is_closed_) {
    return;
  }
  auto promise = std::move(waiting_promises_.front());
  waiting_promises_.pop_front();
  promise.set_value(take_slot());
}

}  // namespace mtlink
