//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/net/ConcurrencyLimiter.h"
#include "mtlink/net/Frame.h"
#include "mtlink/net/LinkPool.h"
#include "mtlink/net/NetQuery.h"
#include "mtlink/net/NetQueryDelayer.h"
#include "mtlink/net/RetryPolicy.h"
#include "mtlink/net/TransportLink.h"

#include "mtlink/actor/MultiTimeout.h"
#include "mtlink/actor/Scheduler.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/Promise.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"

#include <map>

namespace mtlink {

/*
 * Drives queries through their attempts: takes a permit from the limiter and a link from the pool,
 * sends the request with a fresh correlation identifier and matches the response.
 * Flood waits and transient failures are retried through NetQueryDelayer.
 * Every query is resolved exactly once.
 */
class NetQueryDispatcher final : private NetQueryDelayer::Callback {
 public:
  NetQueryDispatcher(Scheduler *scheduler, LinkPool *link_pool, ConcurrencyLimiter *limiter);
  NetQueryDispatcher(const NetQueryDispatcher &) = delete;
  NetQueryDispatcher &operator=(const NetQueryDispatcher &) = delete;
  NetQueryDispatcher(NetQueryDispatcher &&) = delete;
  NetQueryDispatcher &operator=(NetQueryDispatcher &&) = delete;
  ~NetQueryDispatcher() final;

  // returns identifier of the created query
  uint64 invoke(string query, int32 tl_constructor, NetQuery::Type type, bool is_idempotent, double timeout,
                RetryPolicy retry_policy, Promise<string> promise, Slice source = Slice());

  void dispatch(NetQueryPtr query);

  // resolves the query with "Request canceled"; a response arriving later is dropped
  void cancel(uint64 query_id);

  // resolves all pending queries with "Request aborted"
  void close();

  size_t get_pending_query_count() const {
    return queries_.size();
  }

  // total number of request frames handed to links
  uint64 get_sent_count() const {
    return sent_count_;
  }

 private:
  LinkPool *link_pool_;
  ConcurrencyLimiter *limiter_;
  NetQueryDelayer delayer_;
  MultiTimeout deadline_timeout_;

  std::map<uint64, NetQueryPtr> queries_;
  uint64 next_query_id_ = 1;
  uint64 next_correlation_id_ = 1;
  uint64 sent_count_ = 0;
  bool is_closed_ = false;

  static void on_deadline_timeout_callback(void *dispatcher_ptr, int64 query_id);

  // nullptr if the query is already resolved or the callback belongs to a previous attempt
  NetQuery *get_query(uint64 query_id, uint64 correlation_id);

  void start_attempt(NetQuery *query);

  void on_permit(uint64 query_id, uint64 correlation_id, Result<ConcurrencyLimiter::Permit> r_permit);

  void on_link(uint64 query_id, uint64 correlation_id, Result<TransportLink *> r_link);

  void on_ack(uint64 query_id, uint64 correlation_id);

  void on_response(uint64 query_id, uint64 correlation_id, Result<Frame> r_frame);

  void on_attempt_failed(NetQuery *query, Status status);

  void on_deadline(uint64 query_id);

  void on_delay_expired(uint64 query_id) final;

  void resolve(NetQuery *query, Result<string> result);

  void cancel_on_link(NetQuery *query);
};

}  // namespace mtlink
