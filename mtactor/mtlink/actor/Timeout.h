//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/actor/Scheduler.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/logging.h"
#include "mtlink/utils/Promise.h"
#include "mtlink/utils/Time.h"

namespace mtlink {

class Timeout {
 public:
  using Data = void *;
  using Callback = void (*)(Data);

  explicit Timeout(Scheduler *scheduler) : scheduler_(scheduler) {
    CHECK(scheduler_ != nullptr);
  }
  Timeout(const Timeout &) = delete;
  Timeout &operator=(const Timeout &) = delete;
  Timeout(Timeout &&) = delete;
  Timeout &operator=(Timeout &&) = delete;
  ~Timeout() {
    cancel_timeout();
  }

  void set_callback(Callback callback) {
    callback_ = callback;
  }
  void set_callback_data(Data data) {
    data_ = data;
  }

  bool has_timeout() const {
    return timer_id_ != 0;
  }
  double get_timeout() const {
    return timeout_at_;
  }
  void set_timeout_in(double timeout) {
    set_timeout_at(Time::now() + timeout);
  }
  void set_timeout_at(double timeout) {
    if (has_timeout()) {
      scheduler_->cancel_timer(timer_id_);
    }
    timeout_at_ = timeout;
    timer_id_ = scheduler_->set_timer_at(timeout, [this] { timeout_expired(); });
  }
  void cancel_timeout() {
    if (has_timeout()) {
      scheduler_->cancel_timer(timer_id_);
      timer_id_ = 0;
      timeout_at_ = 0;
    }
  }

 private:
  Scheduler *scheduler_;
  Scheduler::TimerId timer_id_ = 0;
  double timeout_at_ = 0;

  Callback callback_{};
  Data data_{};

  void timeout_expired() {
    timer_id_ = 0;
    timeout_at_ = 0;
    CHECK(callback_ != Callback());
    callback_(data_);
  }
};

// Sets promise value after timeout seconds
inline void sleep_for(Scheduler *scheduler, double timeout, Promise<Unit> promise) {
  scheduler->set_timer_in(timeout, [promise = std::move(promise)]() mutable { promise.set_value(Unit()); });
}

}  // namespace mtlink
