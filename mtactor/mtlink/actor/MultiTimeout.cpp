//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/actor/MultiTimeout.h"

#include "mtlink/utils/logging.h"

namespace mtlink {

MultiTimeout::MultiTimeout(Slice name, Scheduler *scheduler) : name_(name.str()), scheduler_(scheduler) {
  CHECK(scheduler_ != nullptr);
}

MultiTimeout::~MultiTimeout() {
  if (timer_id_ != 0) {
    scheduler_->cancel_timer(timer_id_);
  }
}

bool MultiTimeout::has_timeout(int64 key) const {
  return items_.count(key) > 0;
}

void MultiTimeout::set_timeout_at(int64 key, double timeout) {
  LOG(DEBUG) << "Set " << name_ << " for " << key << " in " << timeout - Time::now();
  auto it = items_.find(key);
  if (it != items_.end()) {
    timeout_queue_.erase(std::make_pair(it->second, key));
    it->second = timeout;
  } else {
    items_.emplace(key, timeout);
  }
  timeout_queue_.emplace(timeout, key);
  update_timeout();
}

void MultiTimeout::add_timeout_at(int64 key, double timeout) {
  LOG(DEBUG) << "Add " << name_ << " for " << key << " in " << timeout - Time::now();
  if (items_.count(key) != 0) {
    return;
  }
  items_.emplace(key, timeout);
  timeout_queue_.emplace(timeout, key);
  update_timeout();
}

void MultiTimeout::cancel_timeout(int64 key) {
  auto it = items_.find(key);
  if (it == items_.end()) {
    return;
  }
  LOG(DEBUG) << "Cancel " << name_ << " for " << key;
  timeout_queue_.erase(std::make_pair(it->second, key));
  items_.erase(it);
  update_timeout();
}

void MultiTimeout::update_timeout() {
  if (timeout_queue_.empty()) {
    if (timer_id_ != 0) {
      scheduler_->cancel_timer(timer_id_);
      timer_id_ = 0;
      timer_at_ = 0;
    }
    return;
  }
  auto top_at = timeout_queue_.begin()->first;
  if (timer_id_ != 0 && timer_at_ == top_at) {
    return;
  }
  if (timer_id_ != 0) {
    scheduler_->cancel_timer(timer_id_);
  }
  timer_at_ = top_at;
  timer_id_ = scheduler_->set_timer_at(top_at, [this] {
    timer_id_ = 0;
    timer_at_ = 0;
    timeout_expired();
  });
}

vector<int64> MultiTimeout::get_expired_keys(double now) {
  vector<int64> expired_keys;
  while (!timeout_queue_.empty() && timeout_queue_.begin()->first <= now) {
    auto key = timeout_queue_.begin()->second;
    timeout_queue_.erase(timeout_queue_.begin());
    items_.erase(key);
    expired_keys.push_back(key);
  }
  return expired_keys;
}

void MultiTimeout::timeout_expired() {
  auto expired_keys = get_expired_keys(Time::now());
  update_timeout();
  CHECK(callback_ != Callback());
  for (auto key : expired_keys) {
    callback_(data_, key);
  }
}

void MultiTimeout::run_all() {
  auto expired_keys = get_expired_keys(Time::now() + 1e10);
  update_timeout();
  for (auto key : expired_keys) {
    callback_(data_, key);
  }
}

}  // namespace mtlink
