//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "test/FakeRemote.h"

#include "mtlink/api/FunctionRegistry.h"

#include "mtlink/utils/logging.h"
#include "mtlink/utils/tl_parsers.h"
#include "mtlink/utils/tl_storers.h"

namespace mtlink {

namespace {

string serialize_bool(bool value) {
  string result(4, '\0');
  TlStorerUnsafe storer(reinterpret_cast<unsigned char *>(&result[0]));
  storer.store_int(value ? TlParser::bool_true_id() : TlParser::bool_false_id());
  return result;
}

}  // namespace

class FakeRemote::ConnectionCallback final : public Connection::Callback {
 public:
  ConnectionCallback(FakeRemote *remote, int32 session_id) : remote_(remote), session_id_(session_id) {
  }

  void on_data(Slice data) final {
    remote_->on_data(session_id_, data);
  }

  void on_closed(Status status) final {
    remote_->on_closed(session_id_, std::move(status));
  }

 private:
  FakeRemote *remote_;
  int32 session_id_;
};

FakeRemote::FakeRemote(Scheduler *scheduler) : scheduler_(scheduler) {
  CHECK(scheduler_ != nullptr);
}

FakeRemote::~FakeRemote() {
  for (auto timer_id : timer_ids_) {
    scheduler_->cancel_timer(timer_id);
  }
  for (auto &it : sessions_) {
    it.second->connection->close();
  }
}

Result<unique_ptr<Connection>> FakeRemote::connect() {
  auto connections = LoopbackConnection::create_pair(scheduler_);
  auto session_id = next_session_id_++;
  auto session = make_unique<Session>();
  session->connection = std::move(connections.second);
  session->connection->set_callback(make_unique<ConnectionCallback>(this, session_id));
  sessions_.emplace(session_id, std::move(session));
  connection_count_++;
  LOG(INFO) << "Accept connection " << session_id;

  unique_ptr<Connection> connection = std::move(connections.first);
  return std::move(connection);
}

FramedLinkFactory::Connector FakeRemote::get_connector() {
  return [this] {
    return connect();
  };
}

void FakeRemote::fail_part(int32 part_id, int32 count, int32 error_code, Slice error_message) {
  for (int32 i = 0; i < count; i++) {
    part_failures_[part_id].push_back(Frame::error(0, error_code, error_message));
  }
}

void FakeRemote::break_links() {
  for (auto &it : sessions_) {
    if (!it.second->is_closed) {
      it.second->connection->break_link();
    }
  }
}

int32 FakeRemote::get_part_request_count(int32 part_id) const {
  auto it = part_request_counts_.find(part_id);
  if (it == part_request_counts_.end()) {
    return 0;
  }
  return it->second;
}

string FakeRemote::get_saved_bytes() const {
  string result;
  int32 expected_part_id = 0;
  for (auto &it : parts_) {
    CHECK(it.first == expected_part_id);
    expected_part_id++;
    result += it.second.bytes;
  }
  return result;
}

void FakeRemote::on_data(int32 session_id, Slice data) {
  auto it = sessions_.find(session_id);
  CHECK(it != sessions_.end());
  auto *session = it->second.get();
  if (session->is_closed) {
    return;
  }
  session->parser.append(data);
  while (!session->is_closed) {
    Frame frame;
    auto r_need_size = session->parser.read_next(frame);
    if (r_need_size.is_error()) {
      LOG(ERROR) << "Receive invalid data: " << r_need_size.error();
      session->connection->close();
      return on_closed(session_id, r_need_size.move_as_error());
    }
    if (r_need_size.ok() != 0) {
      break;
    }
    CHECK(frame.kind == Frame::Kind::Request);
    on_request(session_id, std::move(frame));
  }
}

void FakeRemote::on_closed(int32 session_id, Status status) {
  auto it = sessions_.find(session_id);
  CHECK(it != sessions_.end());
  auto *session = it->second.get();
  if (session->is_closed) {
    return;
  }
  LOG(INFO) << "Connection " << session_id << " is closed: " << status;
  session->is_closed = true;
  outstanding_count_ -= session->outstanding_count;
  session->outstanding_count = 0;
}

void FakeRemote::on_request(int32 session_id, Frame request) {
  auto *session = sessions_[session_id].get();
  request_count_++;
  session->outstanding_count++;
  outstanding_count_++;
  max_outstanding_count_ = max(max_outstanding_count_, outstanding_count_);

  auto correlation_id = request.correlation_id;
  auto r_function = api::FunctionRegistry::fetch_function(request.payload);
  if (r_function.is_error()) {
    auto error = r_function.move_as_error();
    return send_answer(session_id, Frame::error(correlation_id, error.code(), error.message()));
  }
  auto function = r_function.move_as_ok();
  LOG(INFO) << "Receive " << api::FunctionRegistry::get_function_name(function->get_id()) << " over connection "
            << session_id;

  if (is_silent_) {
    return;
  }
  if (break_after_request_count_ > 0) {
    if (function->get_id() == api::SaveFilePart::ID) {
      part_request_counts_[static_cast<const api::SaveFilePart &>(*function).file_part_]++;
    } else if (function->get_id() == api::SaveBigFilePart::ID) {
      part_request_counts_[static_cast<const api::SaveBigFilePart &>(*function).file_part_]++;
    }
    if (--break_after_request_count_ == 0) {
      break_links();
    }
    return;
  }

  if (send_ack_) {
    send_frame(session_id, Frame::ack(correlation_id));
  }
  if (break_after_ack_) {
    session->connection->break_link("Connection lost after acknowledgement");
    return;
  }
  send_answer(session_id, process_request(correlation_id, std::move(function)));
}

Frame FakeRemote::process_request(uint64 correlation_id, api::object_ptr<api::Function> function) {
  if (!flood_waits_.empty()) {
    auto seconds = flood_waits_.front();
    flood_waits_.pop_front();
    return Frame::flood_wait(correlation_id, seconds);
  }
  if (reject_code_ != 0) {
    return Frame::error(correlation_id, reject_code_, reject_message_);
  }

  switch (function->get_id()) {
    case api::SaveFilePart::ID: {
      auto &request = static_cast<const api::SaveFilePart &>(*function);
      ReceivedPart part;
      part.file_id = request.file_id_;
      part.bytes = request.bytes_;
      return process_part(correlation_id, request.file_part_, std::move(part));
    }
    case api::SaveBigFilePart::ID: {
      auto &request = static_cast<const api::SaveBigFilePart &>(*function);
      ReceivedPart part;
      part.file_id = request.file_id_;
      part.total_parts = request.file_total_parts_;
      part.is_big = true;
      part.bytes = request.bytes_;
      return process_part(correlation_id, request.file_part_, std::move(part));
    }
    case api::UploadProfilePhoto::ID:
      profile_photo_request_ = unique_ptr<api::UploadProfilePhoto>(
          static_cast<api::UploadProfilePhoto *>(function.release()));
      return Frame::result(correlation_id, api::serialize_object(api::ProfilePhoto(photo_id_)));
    default:
      UNREACHABLE();
      return Frame();
  }
}

Frame FakeRemote::process_part(uint64 correlation_id, int32 part_id, ReceivedPart part) {
  part_request_counts_[part_id]++;
  auto it = part_failures_.find(part_id);
  if (it != part_failures_.end() && !it->second.empty()) {
    auto error = std::move(it->second.front());
    it->second.pop_front();
    error.correlation_id = correlation_id;
    return error;
  }
  parts_[part_id] = std::move(part);
  return Frame::result(correlation_id, serialize_bool(part_answer_));
}

void FakeRemote::send_frame(int32 session_id, const Frame &frame) {
  auto *session = sessions_[session_id].get();
  if (session->is_closed) {
    LOG(INFO) << "Drop " << frame << " for closed connection " << session_id;
    return;
  }
  auto packet = FrameCodec::encode(frame, session->next_seq_no++, 0).move_as_ok();
  auto status = session->connection->write(packet);
  if (status.is_error()) {
    LOG(INFO) << "Failed to send " << frame << ": " << status;
  }
}

void FakeRemote::send_answer(int32 session_id, Frame answer) {
  auto do_send = [this, session_id](Frame frame) {
    auto *session = sessions_[session_id].get();
    if (session->is_closed) {
      return;
    }
    session->outstanding_count--;
    outstanding_count_--;
    send_frame(session_id, frame);
  };
  if (response_delay_ <= 0) {
    return do_send(std::move(answer));
  }
  auto timer_id = scheduler_->set_timer_in(
      response_delay_, [do_send, answer = std::move(answer)]() mutable { do_send(std::move(answer)); });
  timer_ids_.insert(timer_id);
}

}  // namespace mtlink
