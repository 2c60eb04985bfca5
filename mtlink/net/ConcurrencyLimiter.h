//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/utils/common.h"
#include "mtlink/utils/Promise.h"
#include "mtlink/utils/Status.h"

#include <deque>

namespace mtlink {

// Bounds the number of simultaneously held permits. Waiters are served in FIFO order.
class ConcurrencyLimiter {
 public:
  // returns the slot to the limiter when destroyed
  class Permit {
   public:
    Permit() = default;
    Permit(const Permit &) = delete;
    Permit &operator=(const Permit &) = delete;
    Permit(Permit &&other) noexcept;
    Permit &operator=(Permit &&other) noexcept;
    ~Permit();

    bool empty() const {
      return limiter_ == nullptr;
    }

    void release();

   private:
    friend class ConcurrencyLimiter;

    explicit Permit(ConcurrencyLimiter *limiter) : limiter_(limiter) {
    }

    ConcurrencyLimiter *limiter_ = nullptr;
  };

  explicit ConcurrencyLimiter(int32 capacity);
  ConcurrencyLimiter(const ConcurrencyLimiter &) = delete;
  ConcurrencyLimiter &operator=(const ConcurrencyLimiter &) = delete;
  ConcurrencyLimiter(ConcurrencyLimiter &&) = delete;
  ConcurrencyLimiter &operator=(ConcurrencyLimiter &&) = delete;
  ~ConcurrencyLimiter();

  // the promise is completed immediately if a slot is free
  void acquire(Promise<Permit> promise);

  // fails all waiters and all future acquisitions; held permits stay valid
  void close();

  int32 get_capacity() const {
    return capacity_;
  }

  int32 get_in_use() const {
    return in_use_;
  }

  int32 get_high_water_mark() const {
    return high_water_mark_;
  }

  size_t get_waiting_count() const {
    return waiting_promises_.size();
  }

 private:
  int32 capacity_;
  int32 in_use_ = 0;
  int32 high_water_mark_ = 0;
  bool is_closed_ = false;
  std::deque<Promise<Permit>> waiting_promises_;

  Permit take_slot();

  void on_release();
};

}  // namespace mtlink
