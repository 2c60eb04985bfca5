//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/utils/Time.h"

#include <atomic>
#include <chrono>

namespace mtlink {

static std::atomic<double> time_diff;

double Time::now() {
  return now_unadjusted() + time_diff.load(std::memory_order_relaxed);
}

double Time::now_unadjusted() {
  auto duration = std::chrono::steady_clock::now().time_since_epoch();
  // start from a positive value, so Timestamp::now() is never treated as empty
  return static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count()) * 1e-9 + 1.0;
}

void Time::jump_in_future(double at) {
  auto old_time_diff = time_diff.load();

  while (true) {
    auto diff = at - now();
    if (diff < 0) {
      return;
    }
    if (time_diff.compare_exchange_strong(old_time_diff, old_time_diff + diff)) {
      return;
    }
  }
}

}  // namespace mtlink
