//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/utils/Closure.h"
#include "mtlink/utils/common.h"
#include "mtlink/utils/Slice.h"

#include <condition_variable>
#include <map>
#include <mutex>
#include <set>

namespace mtlink {

// Single-threaded cooperative event loop: posted closures and timers.
// post() may be called from any thread, everything else only from the thread running the loop.
class Scheduler {
 public:
  using TimerId = uint64;

  explicit Scheduler(Slice name = Slice("Scheduler"));
  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;
  Scheduler(Scheduler &&) = delete;
  Scheduler &operator=(Scheduler &&) = delete;
  ~Scheduler();

  Slice get_name() const {
    return name_;
  }

  void post(Closure closure);

  TimerId set_timer_at(double at, Closure callback);

  TimerId set_timer_in(double timeout, Closure callback);

  void cancel_timer(TimerId timer_id);

  bool has_timer(TimerId timer_id) const;

  // 0 if there are no timers
  double get_next_timer_at() const;

  // runs all posted closures and expired timers, returns whether something was run
  bool run_once();

  // runs until there is no more work; with jump_in_time, virtual time is moved to the next timer
  // instead of waiting for it
  void run_until_idle(bool jump_in_time = true);

  // waits for cross-thread posts and timers no longer than timeout seconds of real time
  void run(double timeout);

  bool is_idle() const;

 private:
  struct Timer {
    double at;
    Closure callback;
  };

  string name_;

  mutable std::mutex mutex_;
  std::condition_variable cond_;
  vector<Closure> pending_;

  TimerId next_timer_id_ = 1;
  std::map<TimerId, Timer> timers_;
  std::set<std::pair<double, TimerId>> timer_queue_;

  bool run_posted();
  bool run_expired_timers();
};

}  // namespace mtlink
