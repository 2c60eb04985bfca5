//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/actor/Scheduler.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Time.h"

#include <map>
#include <set>

namespace mtlink {

// a set of keyed timeouts sharing one scheduler timer
class MultiTimeout {
 public:
  using Data = void *;
  using Callback = void (*)(Data, int64);

  MultiTimeout(Slice name, Scheduler *scheduler);
  MultiTimeout(const MultiTimeout &) = delete;
  MultiTimeout &operator=(const MultiTimeout &) = delete;
  MultiTimeout(MultiTimeout &&) = delete;
  MultiTimeout &operator=(MultiTimeout &&) = delete;
  ~MultiTimeout();

  void set_callback(Callback callback) {
    callback_ = callback;
  }
  void set_callback_data(Data data) {
    data_ = data;
  }

  Slice get_name() const {
    return name_;
  }

  bool has_timeout(int64 key) const;

  void set_timeout_in(int64 key, double timeout) {
    set_timeout_at(key, Time::now() + timeout);
  }

  void add_timeout_in(int64 key, double timeout) {
    add_timeout_at(key, Time::now() + timeout);
  }

  void set_timeout_at(int64 key, double timeout);

  // doesn't replace an existing timeout
  void add_timeout_at(int64 key, double timeout);

  void cancel_timeout(int64 key);

  // calls the callback for all keys immediately
  void run_all();

  size_t size() const {
    return items_.size();
  }

 private:
  string name_;
  Scheduler *scheduler_;
  Scheduler::TimerId timer_id_ = 0;
  double timer_at_ = 0;

  Callback callback_{};
  Data data_{};

  std::map<int64, double> items_;
  std::set<std::pair<double, int64>> timeout_queue_;

  void update_timeout();

  void timeout_expired();

  vector<int64> get_expired_keys(double now);
};

}  // namespace mtlink
