//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/net/NetQuery.h"

#include "mtlink/utils/format.h"

namespace mtlink {

int VERBOSITY_NAME(net_query) = VERBOSITY_NAME(INFO);

NetQuery::NetQuery(uint64 id, string query, int32 tl_constructor, Type type, bool is_idempotent, double timeout,
                   RetryPolicy retry_policy, Promise<string> promise)
    : id_(id)
    , query_(std::move(query))
    , tl_constructor_(tl_constructor)
    , type_(type)
    , is_idempotent_(is_idempotent)
    , timeout_(timeout)
    , retry_policy_(std::move(retry_policy))
    , promise_(std::move(promise)) {
  next_timeout_ = retry_policy_.initial_backoff;
}

void NetQuery::set_state(State state) {
  CHECK(!is_resolved());
  VLOG(net_query) << "Query " << id_ << " moves from " << state_ << " to " << state;
  state_ = state;
}

void NetQuery::set_ok(string answer) {
  CHECK(!is_resolved());
  VLOG(net_query) << "Got result of size " << answer.size() << " for " << *this;
  state_ = State::Resolved;
  permit_.release();
  promise_.set_value(std::move(answer));
}

void NetQuery::set_error(Status status) {
  CHECK(!is_resolved());
  CHECK(status.is_error());
  VLOG(net_query) << "Got error " << status << " for " << *this;
  state_ = State::Resolved;
  permit_.release();
  promise_.set_error(std::move(status));
}

StringBuilder &operator<<(StringBuilder &string_builder, NetQuery::State state) {
  switch (state) {
    case NetQuery::State::Pending:
      return string_builder << "Pending";
    case NetQuery::State::Sent:
      return string_builder << "Sent";
    case NetQuery::State::WaitingResponse:
      return string_builder << "WaitingResponse";
    case NetQuery::State::FloodWaitBackoff:
      return string_builder << "FloodWaitBackoff";
    case NetQuery::State::RetryBackoff:
      return string_builder << "RetryBackoff";
    case NetQuery::State::Resolved:
      return string_builder << "Resolved";
    default:
      UNREACHABLE();
  }
}

StringBuilder &operator<<(StringBuilder &string_builder, const NetQuery &net_query) {
  string_builder << "[Query:" << tag("id", net_query.id()) << tag("state", net_query.state())
                 << tag("tl", format::as_hex(net_query.tl_constructor()))
                 << tag("size", net_query.query().size()) << tag("attempt", net_query.attempt_count_);
  if (net_query.type() == NetQuery::Type::Upload) {
    string_builder << " [Upload]";
  }
  if (net_query.correlation_id_ != 0) {
    string_builder << tag("correlation_id", net_query.correlation_id_);
  }
  if (!net_query.source_.empty()) {
    string_builder << tag("source", net_query.source_);
  }
  return string_builder << ']';
}

}  // namespace mtlink
