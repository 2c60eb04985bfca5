//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/net/NetQuery.h"

#include "mtlink/actor/MultiTimeout.h"
#include "mtlink/actor/Scheduler.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/Status.h"

namespace mtlink {

// postpones resending of queries failed with a flood wait or a transient error
class NetQueryDelayer {
 public:
  class Callback {
   public:
    Callback() = default;
    Callback(const Callback &) = delete;
    Callback &operator=(const Callback &) = delete;
    virtual ~Callback() = default;

    virtual void on_delay_expired(uint64 query_id) = 0;
  };

  NetQueryDelayer(Scheduler *scheduler, Callback *callback);

  // returns OK if the query will be resent, or the error with which it must be resolved
  Status delay(NetQuery &query, const Status &error) MTLINK_WARN_UNUSED_RESULT;

  void cancel(uint64 query_id);

  size_t get_delayed_count() const {
    return timeouts_.size();
  }

 private:
  MultiTimeout timeouts_;
  Callback *callback_;

  static void on_timeout_callback(void *delayer_ptr, int64 query_id);
};

}  // namespace mtlink
