//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/net/ConcurrencyLimiter.h"
#include "mtlink/net/RetryPolicy.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/logging.h"
#include "mtlink/utils/Promise.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"
#include "mtlink/utils/StringBuilder.h"
#include "mtlink/utils/tl_parsers.h"

namespace mtlink {

extern int VERBOSITY_NAME(net_query);

// one logical invocation, possibly spanning several attempts
class NetQuery {
 public:
  enum class Type : int8 { Common, Upload };
  enum class State : int8 { Pending, Sent, WaitingResponse, FloodWaitBackoff, RetryBackoff, Resolved };

  NetQuery(uint64 id, string query, int32 tl_constructor, Type type, bool is_idempotent, double timeout,
           RetryPolicy retry_policy, Promise<string> promise);

  uint64 id() const {
    return id_;
  }

  Type type() const {
    return type_;
  }

  int32 tl_constructor() const {
    return tl_constructor_;
  }

  const string &query() const {
    return query_;
  }

  bool is_idempotent() const {
    return is_idempotent_;
  }

  // 0 if there is no deadline
  double timeout() const {
    return timeout_;
  }

  const RetryPolicy &retry_policy() const {
    return retry_policy_;
  }

  State state() const {
    return state_;
  }

  void set_state(State state);

  bool is_resolved() const {
    return state_ == State::Resolved;
  }

  void set_ok(string answer);

  void set_error(Status status);

 private:
  uint64 id_;
  string query_;
  int32 tl_constructor_;
  Type type_;
  bool is_idempotent_;
  double timeout_;
  RetryPolicy retry_policy_;
  Promise<string> promise_;
  State state_ = State::Pending;

 public:
  uint64 correlation_id_ = 0;               // of the current attempt, for NetQueryDispatcher
  uint64 link_id_ = 0;                      // of the current attempt, for NetQueryDispatcher
  ConcurrencyLimiter::Permit permit_;       // held while the request is on a link
  bool is_acked_ = false;                   // the remote confirmed receipt of the current attempt
  int32 attempt_count_ = 0;                 // for NetQueryDelayer, flood waits aren't counted
  int32 flood_wait_count_ = 0;              // for NetQueryDelayer
  double total_flood_wait_ = 0;             // for NetQueryDelayer
  double next_timeout_ = 0;                 // for NetQueryDelayer
  double last_timeout_ = 0;                 // for NetQueryDelayer
  double deadline_at_ = 0;                  // for NetQueryDispatcher, 0 if there is no deadline
  double deadline_left_ = 0;                // time left to the deadline while it is suspended by a flood wait
  string source_;                           // to be set by caller
};

using NetQueryPtr = unique_ptr<NetQuery>;

StringBuilder &operator<<(StringBuilder &string_builder, NetQuery::State state);

StringBuilder &operator<<(StringBuilder &string_builder, const NetQuery &net_query);

inline StringBuilder &operator<<(StringBuilder &string_builder, const NetQueryPtr &net_query_ptr) {
  if (net_query_ptr == nullptr) {
    return string_builder << "[Query: null]";
  }
  return string_builder << *net_query_ptr;
}

// parses the serialized result of a function T
template <class T>
Result<typename T::ReturnType> fetch_result(Slice message) {
  TlParser parser(message);
  auto result = T::fetch_result(parser);
  parser.fetch_end();
  const char *error = parser.get_error();
  if (error != nullptr) {
    LOG(ERROR) << "Can't parse result of function " << static_cast<int32>(T::ID) << " of size " << message.size()
               << ": " << error;
    return Status::Error(500, Slice(error));
  }
  return std::move(result);
}

template <class T>
Result<typename T::ReturnType> fetch_result(Result<string> r_answer) {
  TRY_RESULT(answer, std::move(r_answer));
  return fetch_result<T>(Slice(answer));
}

}  // namespace mtlink
