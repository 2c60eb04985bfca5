//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/api/Api.h"
#include "mtlink/api/TlObject.h"

#include "mtlink/net/Connection.h"
#include "mtlink/net/Frame.h"
#include "mtlink/net/FramedTransportLink.h"
#include "mtlink/net/LoopbackConnection.h"

#include "mtlink/actor/Scheduler.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"

#include <deque>
#include <map>
#include <set>

namespace mtlink {

// In-process remote side of framed links: answers save-part and profile photo requests
// and can be scripted to fail, delay or drop them.
class FakeRemote {
 public:
  struct ReceivedPart {
    int64 file_id = 0;
    // -1 for small files and for big files of unknown size
    int32 total_parts = -1;
    bool is_big = false;
    string bytes;
  };

  explicit FakeRemote(Scheduler *scheduler);
  FakeRemote(const FakeRemote &) = delete;
  FakeRemote &operator=(const FakeRemote &) = delete;
  FakeRemote(FakeRemote &&) = delete;
  FakeRemote &operator=(FakeRemote &&) = delete;
  ~FakeRemote();

  Result<unique_ptr<Connection>> connect();

  FramedLinkFactory::Connector get_connector();

  // the next count requests for the part are answered with the error
  void fail_part(int32 part_id, int32 count, int32 error_code = 500, Slice error_message = Slice("INTERNAL"));

  // the next requests are answered with the flood waits in the order of addition
  void add_flood_wait(int32 seconds) {
    flood_waits_.push_back(seconds);
  }

  void set_response_delay(double delay) {
    response_delay_ = delay;
  }

  // requests are received, but never acknowledged nor answered
  void set_silent(bool is_silent) {
    is_silent_ = is_silent;
  }

  // the next count requests are left unanswered, after which all connections are broken
  void break_links_after_requests(int32 count) {
    break_after_request_count_ = count;
  }

  // requests are acknowledged, and then the connection is broken
  void set_break_after_ack(bool break_after_ack) {
    break_after_ack_ = break_after_ack;
  }

  void set_send_ack(bool send_ack) {
    send_ack_ = send_ack;
  }

  // all requests are rejected with the error if error_code isn't 0
  void set_reject(int32 error_code, Slice error_message) {
    reject_code_ = error_code;
    reject_message_ = error_message.str();
  }

  void set_part_answer(bool answer) {
    part_answer_ = answer;
  }

  void set_photo_id(int64 photo_id) {
    photo_id_ = photo_id;
  }

  void break_links();

  int32 get_request_count() const {
    return request_count_;
  }

  int32 get_max_outstanding_count() const {
    return max_outstanding_count_;
  }

  int32 get_connection_count() const {
    return connection_count_;
  }

  // number of received requests for the part
  int32 get_part_request_count(int32 part_id) const;

  const std::map<int32, ReceivedPart> &get_parts() const {
    return parts_;
  }

  // concatenation of all saved parts, which must be numbered from 0 without gaps
  string get_saved_bytes() const;

  const api::UploadProfilePhoto *get_profile_photo_request() const {
    return profile_photo_request_.get();
  }

 private:
  class ConnectionCallback;

  struct Session {
    unique_ptr<LoopbackConnection> connection;
    FrameParser parser;
    uint32 next_seq_no = 0;
    int32 outstanding_count = 0;
    bool is_closed = false;
  };

  Scheduler *scheduler_;
  int32 next_session_id_ = 1;
  std::map<int32, unique_ptr<Session>> sessions_;
  std::set<Scheduler::TimerId> timer_ids_;

  std::map<int32, std::deque<Frame>> part_failures_;
  std::deque<int32> flood_waits_;
  double response_delay_ = 0.0;
  bool is_silent_ = false;
  int32 break_after_request_count_ = 0;
  bool break_after_ack_ = false;
  bool send_ack_ = true;
  int32 reject_code_ = 0;
  string reject_message_;
  bool part_answer_ = true;
  int64 photo_id_ = 1;

  int32 connection_count_ = 0;
  int32 request_count_ = 0;
  int32 outstanding_count_ = 0;
  int32 max_outstanding_count_ = 0;
  std::map<int32, int32> part_request_counts_;
  std::map<int32, ReceivedPart> parts_;
  unique_ptr<api::UploadProfilePhoto> profile_photo_request_;

  void on_data(int32 session_id, Slice data);

  void on_closed(int32 session_id, Status status);

  void on_request(int32 session_id, Frame request);

  Frame process_request(uint64 correlation_id, api::object_ptr<api::Function> function);

  Frame process_part(uint64 correlation_id, int32 part_id, ReceivedPart part);

  void send_frame(int32 session_id, const Frame &frame);

  void send_answer(int32 session_id, Frame answer);
};

}  // namespace mtlink
