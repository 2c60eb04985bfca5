//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/net/NetQueryDelayer.h"

#include "mtlink/net/NetError.h"

#include "mtlink/utils/format.h"
#include "mtlink/utils/logging.h"

namespace mtlink {

NetQueryDelayer::NetQueryDelayer(Scheduler *scheduler, Callback *callback)
    : timeouts_("NetQueryDelayer", scheduler), callback_(callback) {
  CHECK(callback_ != nullptr);
  timeouts_.set_callback(on_timeout_callback);
  timeouts_.set_callback_data(static_cast<void *>(this));
}

Status NetQueryDelayer::delay(NetQuery &query, const Status &error) {
  CHECK(error.is_error());
  const auto &retry_policy = query.retry_policy();
  double timeout = 0;
  switch (retry_policy.classify(error)) {
    case ErrorKind::FloodWait: {
      auto seconds = get_flood_wait_seconds(error);
      CHECK(seconds > 0);
      if (query.flood_wait_count_ >= retry_policy.max_flood_wait_count ||
          query.total_flood_wait_ + seconds > retry_policy.max_total_flood_wait) {
        LOG(WARNING) << "Failed: " << query << tag("timeout", seconds)
                     << tag("flood_wait_count", query.flood_wait_count_)
                     << tag("total_timeout", query.total_flood_wait_) << " because of " << error << " from "
                     << query.source_;
        return flood_wait_error(seconds);
      }
      query.flood_wait_count_++;
      query.total_flood_wait_ += seconds;
      query.next_timeout_ = retry_policy.initial_backoff;
      query.set_state(NetQuery::State::FloodWaitBackoff);
      timeout = seconds;
      break;
    }
    case ErrorKind::LinkDown:
    case ErrorKind::Retryable:
      if (query.attempt_count_ >= retry_policy.max_attempts) {
        LOG(WARNING) << "Failed: " << query << " after " << query.attempt_count_ << " attempts because of " << error
                     << " from " << query.source_;
        return error.clone();
      }
      timeout = query.next_timeout_;
      query.next_timeout_ = min(query.next_timeout_ * retry_policy.backoff_multiplier, retry_policy.max_backoff);
      query.set_state(NetQuery::State::RetryBackoff);
      break;
    default:
      return error.clone();
  }

  query.last_timeout_ = timeout;
  LOG(INFO) << "Delay: " << query << ' ' << tag("timeout", timeout) << tag("total_timeout", query.total_flood_wait_)
            << " because of " << error << " from " << query.source_;
  timeouts_.set_timeout_in(static_cast<int64>(query.id()), timeout);
  return Status::OK();
}

void NetQueryDelayer::cancel(uint64 query_id) {
  timeouts_.cancel_timeout(static_cast<int64>(query_id));
}

void NetQueryDelayer::on_timeout_callback(void *delayer_ptr, int64 query_id) {
  auto delayer = static_cast<NetQueryDelayer *>(delayer_ptr);
  delayer->callback_->on_delay_expired(static_cast<uint64>(query_id));
}

}  // namespace mtlink
