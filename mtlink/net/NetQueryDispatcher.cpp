//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/net/NetQueryDispatcher.h"

#include "mtlink/net/NetError.h"

#include "mtlink/utils/format.h"
#include "mtlink/utils/logging.h"
#include "mtlink/utils/Time.h"

namespace mtlink {

NetQueryDispatcher::NetQueryDispatcher(Scheduler *scheduler, LinkPool *link_pool, ConcurrencyLimiter *limiter)
    : link_pool_(link_pool)
    , limiter_(limiter)
    , delayer_(scheduler, this)
    , deadline_timeout_("NetQueryDeadline", scheduler) {
  CHECK(link_pool_ != nullptr);
  CHECK(limiter_ != nullptr);
  deadline_timeout_.set_callback(on_deadline_timeout_callback);
  deadline_timeout_.set_callback_data(static_cast<void *>(this));
}

NetQueryDispatcher::~NetQueryDispatcher() {
  close();
}

uint64 NetQueryDispatcher::invoke(string query, int32 tl_constructor, NetQuery::Type type, bool is_idempotent,
                                  double timeout, RetryPolicy retry_policy, Promise<string> promise, Slice source) {
  auto query_id = next_query_id_++;
  auto net_query = make_unique<NetQuery>(query_id, std::move(query), tl_constructor, type, is_idempotent, timeout,
                                         std::move(retry_policy), std::move(promise));
  net_query->source_ = source.str();
  dispatch(std::move(net_query));
  return query_id;
}

void NetQueryDispatcher::dispatch(NetQueryPtr query) {
  CHECK(query != nullptr);
  CHECK(!query->is_resolved());
  if (is_closed_) {
    return query->set_error(request_aborted_error());
  }
  auto status = query->retry_policy().validate();
  if (status.is_error()) {
    return query->set_error(std::move(status));
  }

  auto query_id = query->id();
  VLOG(net_query) << "Dispatch " << query;
  auto *query_ptr = query.get();
  CHECK(queries_.emplace(query_id, std::move(query)).second);
  if (query_ptr->timeout() > 0) {
    query_ptr->deadline_at_ = Time::now() + query_ptr->timeout();
    deadline_timeout_.set_timeout_at(static_cast<int64>(query_id), query_ptr->deadline_at_);
  }
  start_attempt(query_ptr);
}

void NetQueryDispatcher::cancel(uint64 query_id) {
  auto it = queries_.find(query_id);
  if (it == queries_.end()) {
    return;
  }
  auto *query = it->second.get();
  VLOG(net_query) << "Cancel " << *query;
  cancel_on_link(query);
  resolve(query, request_canceled_error());
}

void NetQueryDispatcher::close() {
  if (is_closed_) {
    return;
  }
  is_closed_ = true;
  LOG_IF(INFO, !queries_.empty()) << "Abort " << queries_.size() << " pending queries";
  while (!queries_.empty()) {
    auto *query = queries_.begin()->second.get();
    cancel_on_link(query);
    resolve(query, request_aborted_error());
  }
}

void NetQueryDispatcher::on_deadline_timeout_callback(void *dispatcher_ptr, int64 query_id) {
  static_cast<NetQueryDispatcher *>(dispatcher_ptr)->on_deadline(static_cast<uint64>(query_id));
}

NetQuery *NetQueryDispatcher::get_query(uint64 query_id, uint64 correlation_id) {
  auto it = queries_.find(query_id);
  if (it == queries_.end()) {
    return nullptr;
  }
  auto *query = it->second.get();
  if (query->correlation_id_ != correlation_id) {
    return nullptr;
  }
  return query;
}

void NetQueryDispatcher::start_attempt(NetQuery *query) {
  CHECK(query != nullptr);
  if (query->state() != NetQuery::State::FloodWaitBackoff) {
    query->attempt_count_++;
  }
  query->correlation_id_ = next_correlation_id_++;
  query->link_id_ = 0;
  query->is_acked_ = false;
  query->set_state(NetQuery::State::Pending);

  auto query_id = query->id();
  auto correlation_id = query->correlation_id_;
  VLOG(net_query) << "Start attempt " << query->attempt_count_ << " of " << *query;
  limiter_->acquire(PromiseCreator::lambda(
      [this, query_id, correlation_id](Result<ConcurrencyLimiter::Permit> r_permit) mutable {
        on_permit(query_id, correlation_id, std::move(r_permit));
      }));
}

void NetQueryDispatcher::on_permit(uint64 query_id, uint64 correlation_id,
                                   Result<ConcurrencyLimiter::Permit> r_permit) {
  auto *query = get_query(query_id, correlation_id);
  if (query == nullptr) {
    return;
  }
  if (r_permit.is_error()) {
    return resolve(query, r_permit.move_as_error());
  }
  query->permit_ = r_permit.move_as_ok();
  link_pool_->get_link(PromiseCreator::lambda([this, query_id, correlation_id](Result<TransportLink *> r_link) {
    on_link(query_id, correlation_id, std::move(r_link));
  }));
}

void NetQueryDispatcher::on_link(uint64 query_id, uint64 correlation_id, Result<TransportLink *> r_link) {
  auto *query = get_query(query_id, correlation_id);
  if (query == nullptr) {
    return;
  }
  if (r_link.is_error()) {
    return on_attempt_failed(query, r_link.move_as_error());
  }
  auto *link = r_link.ok();
  CHECK(link != nullptr);
  query->link_id_ = link->get_id();
  query->set_state(NetQuery::State::Sent);
  sent_count_++;
  VLOG(net_query) << "Send " << *query << " over link " << link->get_id();

  // the query can be resolved inside send, so it must not be used afterwards
  link->send(Frame::request(correlation_id, query->query()),
             PromiseCreator::lambda([this, query_id, correlation_id](Result<Frame> r_frame) {
               on_response(query_id, correlation_id, std::move(r_frame));
             }),
             PromiseCreator::lambda([this, query_id, correlation_id](Result<Unit> r_ack) {
               if (r_ack.is_ok()) {
                 on_ack(query_id, correlation_id);
               }
             }));
}

void NetQueryDispatcher::on_ack(uint64 query_id, uint64 correlation_id) {
  auto *query = get_query(query_id, correlation_id);
  if (query == nullptr) {
    return;
  }
  query->is_acked_ = true;
  if (query->state() == NetQuery::State::Sent) {
    query->set_state(NetQuery::State::WaitingResponse);
  }
}

void NetQueryDispatcher::on_response(uint64 query_id, uint64 correlation_id, Result<Frame> r_frame) {
  auto *query = get_query(query_id, correlation_id);
  if (query == nullptr) {
    VLOG(net_query) << "Drop late response for query " << query_id << tag("correlation_id", correlation_id);
    return;
  }
  query->permit_.release();
  query->link_id_ = 0;
  if (r_frame.is_error()) {
    return on_attempt_failed(query, r_frame.move_as_error());
  }
  auto frame = r_frame.move_as_ok();
  if (frame.kind == Frame::Kind::Result) {
    return resolve(query, std::move(frame.payload));
  }
  on_attempt_failed(query, frame.as_status());
}

void NetQueryDispatcher::on_attempt_failed(NetQuery *query, Status status) {
  CHECK(status.is_error());
  query->permit_.release();
  query->link_id_ = 0;
  if (is_link_down_after_ack(status) && !query->is_idempotent()) {
    LOG(WARNING) << "Link went down after " << *query << " was received by the remote side";
    return resolve(query, indeterminate_error("link went down after the request was received"));
  }

  auto delay_status = delayer_.delay(*query, status);
  if (delay_status.is_error()) {
    return resolve(query, std::move(delay_status));
  }
  if (query->state() == NetQuery::State::FloodWaitBackoff && query->deadline_at_ > 0) {
    // time spent waiting out a flood wait isn't counted against the deadline
    query->deadline_left_ = max(query->deadline_at_ - Time::now(), 0.0);
    deadline_timeout_.cancel_timeout(static_cast<int64>(query->id()));
  }
}

void NetQueryDispatcher::on_deadline(uint64 query_id) {
  auto it = queries_.find(query_id);
  if (it == queries_.end()) {
    return;
  }
  auto *query = it->second.get();
  LOG(INFO) << "Deadline expired for " << *query;
  cancel_on_link(query);
  resolve(query, timed_out_error());
}

void NetQueryDispatcher::on_delay_expired(uint64 query_id) {
  auto it = queries_.find(query_id);
  if (it == queries_.end()) {
    return;
  }
  auto *query = it->second.get();
  if (query->state() == NetQuery::State::FloodWaitBackoff && query->deadline_at_ > 0) {
    query->deadline_at_ = Time::now() + query->deadline_left_;
    deadline_timeout_.set_timeout_at(static_cast<int64>(query_id), query->deadline_at_);
  }
  start_attempt(query);
}

void NetQueryDispatcher::cancel_on_link(NetQuery *query) {
  if (query->link_id_ == 0) {
    return;
  }
  auto *link = link_pool_->get_link_by_id(query->link_id_);
  auto correlation_id = query->correlation_id_;
  // late callbacks of the canceled attempt are ignored
  query->correlation_id_ = 0;
  query->link_id_ = 0;
  if (link != nullptr) {
    link->cancel(correlation_id);
  }
}

void NetQueryDispatcher::resolve(NetQuery *query, Result<string> result) {
  auto query_id = query->id();
  auto it = queries_.find(query_id);
  CHECK(it != queries_.end());
  CHECK(it->second.get() == query);
  auto query_ptr = std::move(it->second);
  queries_.erase(it);
  deadline_timeout_.cancel_timeout(static_cast<int64>(query_id));
  delayer_.cancel(query_id);

  if (result.is_ok()) {
    query_ptr->set_ok(result.move_as_ok());
  } else {
    query_ptr->set_error(result.move_as_error());
  }
}

}  // namespace mtlink
