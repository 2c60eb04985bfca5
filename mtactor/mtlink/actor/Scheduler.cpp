//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/actor/Scheduler.h"

#include "mtlink/utils/logging.h"
#include "mtlink/utils/Time.h"

#include <chrono>
#include <utility>

namespace mtlink {

int VERBOSITY_NAME(actor) = VERBOSITY_NAME(DEBUG) + 10;

Scheduler::Scheduler(Slice name) : name_(name.str()) {
}

Scheduler::~Scheduler() {
  // destroyed closures may own promises, which can post new closures while being destroyed
  while (true) {
    vector<Closure> pending;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pending = std::move(pending_);
      pending_.clear();
    }
    auto timers = std::move(timers_);
    timers_.clear();
    timer_queue_.clear();
    if (pending.empty() && timers.empty()) {
      break;
    }
  }
}

void Scheduler::post(Closure closure) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(std::move(closure));
  }
  cond_.notify_one();
}

Scheduler::TimerId Scheduler::set_timer_at(double at, Closure callback) {
  auto timer_id = next_timer_id_++;
  VLOG(actor) << "Set timer " << timer_id << " of " << name_ << " in " << at - Time::now();
  timers_.emplace(timer_id, Timer{at, std::move(callback)});
  timer_queue_.emplace(at, timer_id);
  return timer_id;
}

Scheduler::TimerId Scheduler::set_timer_in(double timeout, Closure callback) {
  return set_timer_at(Time::now() + timeout, std::move(callback));
}

void Scheduler::cancel_timer(TimerId timer_id) {
  auto it = timers_.find(timer_id);
  if (it == timers_.end()) {
    return;
  }
  VLOG(actor) << "Cancel timer " << timer_id << " of " << name_;
  timer_queue_.erase(std::make_pair(it->second.at, timer_id));
  timers_.erase(it);
}

bool Scheduler::has_timer(TimerId timer_id) const {
  return timers_.count(timer_id) != 0;
}

double Scheduler::get_next_timer_at() const {
  if (timer_queue_.empty()) {
    return 0;
  }
  return timer_queue_.begin()->first;
}

bool Scheduler::is_idle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.empty() && timers_.empty();
}

bool Scheduler::run_posted() {
  bool was_run = false;
  while (true) {
    vector<Closure> pending;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (pending_.empty()) {
        break;
      }
      pending = std::move(pending_);
      pending_.clear();
    }
    for (auto &closure : pending) {
      closure();
      was_run = true;
    }
  }
  return was_run;
}

bool Scheduler::run_expired_timers() {
  bool was_run = false;
  auto now = Time::now();
  while (!timer_queue_.empty() && timer_queue_.begin()->first <= now) {
    auto timer_id = timer_queue_.begin()->second;
    timer_queue_.erase(timer_queue_.begin());
    auto it = timers_.find(timer_id);
    CHECK(it != timers_.end());
    auto callback = std::move(it->second.callback);
    timers_.erase(it);
    VLOG(actor) << "Run timer " << timer_id << " of " << name_;
    callback();
    was_run = true;
  }
  return was_run;
}

bool Scheduler::run_once() {
  bool was_run = run_posted();
  if (run_expired_timers()) {
    was_run = true;
  }
  return was_run;
}

void Scheduler::run_until_idle(bool jump_in_time) {
  while (true) {
    if (run_once()) {
      continue;
    }
    if (!jump_in_time || timer_queue_.empty()) {
      break;
    }
    Time::jump_in_future(get_next_timer_at());
  }
}

void Scheduler::run(double timeout) {
  auto deadline = Time::now_unadjusted() + timeout;
  while (true) {
    run_once();

    auto now = Time::now_unadjusted();
    if (now >= deadline) {
      break;
    }
    auto wait_for = deadline - now;
    if (!timer_queue_.empty()) {
      wait_for = min(wait_for, max(get_next_timer_at() - Time::now(), 0.0));
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (pending_.empty() && wait_for > 0) {
      cond_.wait_for(lock, std::chrono::duration<double>(wait_for));
    }
  }
}

}  // namespace mtlink
