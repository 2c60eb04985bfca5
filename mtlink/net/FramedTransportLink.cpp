//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/net/FramedTransportLink.h"

#include "mtlink/net/NetError.h"

#include "mtlink/utils/format.h"
#include "mtlink/utils/logging.h"

namespace mtlink {

class FramedTransportLink::ConnectionCallback final : public Connection::Callback {
 public:
  explicit ConnectionCallback(FramedTransportLink *link) : link_(link) {
  }

  void on_data(Slice data) final {
    link_->on_data(data);
  }

  void on_closed(Status status) final {
    link_->on_error(std::move(status));
  }

 private:
  FramedTransportLink *link_;
};

FramedTransportLink::FramedTransportLink(unique_ptr<Connection> connection, Options options)
    : connection_(std::move(connection)), options_(options) {
  CHECK(connection_ != nullptr);
  connection_->set_callback(make_unique<ConnectionCallback>(this));
}

FramedTransportLink::~FramedTransportLink() {
  close();
}

void FramedTransportLink::send(Frame request, Promise<Frame> promise, Promise<Unit> ack_promise) {
  CHECK(request.kind == Frame::Kind::Request);
  auto correlation_id = request.correlation_id;
  Status status;
  {
    auto guard = mutex_.lock();
    if (!is_alive()) {
      guard.reset();
      ack_promise.set_error(link_down_error(false));
      return promise.set_error(link_down_error(false));
    }
    if (pending_requests_.count(correlation_id) != 0) {
      guard.reset();
      return promise.set_error(Status::Error(400, PSLICE() << "Duplicate correlation identifier " << correlation_id));
    }

    auto seq_no = next_output_seq_no_;
    auto r_packet = FrameCodec::encode(request, seq_no, options_.gzip_threshold);
    if (r_packet.is_error()) {
      guard.reset();
      LOG(WARNING) << "Failed to encode " << request << ": " << r_packet.error();
      ack_promise.set_error(r_packet.error().clone());
      return promise.set_error(r_packet.move_as_error());
    }
    auto packet = r_packet.move_as_ok();
    next_output_seq_no_++;
    VLOG(DEBUG) << "Send " << request << tag("seq_no", seq_no) << " over link " << get_id() << " as "
                << packet.size() << " bytes";

    auto &pending_request = pending_requests_[correlation_id];
    pending_request.promise = std::move(promise);
    pending_request.ack_promise = std::move(ack_promise);

    // frames must be written in the order of their sequence numbers
    status = connection_->write(packet);
  }
  if (status.is_error()) {
    on_error(status.move_as_error_prefix("Failed to write frame: "));
  }
}

void FramedTransportLink::cancel(uint64 correlation_id) {
  PendingRequest pending_request;
  {
    auto guard = mutex_.lock();
    auto it = pending_requests_.find(correlation_id);
    if (it == pending_requests_.end()) {
      return;
    }
    pending_request = std::move(it->second);
    pending_requests_.erase(it);
  }
  VLOG(DEBUG) << "Cancel request " << correlation_id << " on link " << get_id();
  pending_request.ack_promise.set_error(request_canceled_error());
  pending_request.promise.set_error(request_canceled_error());
}

void FramedTransportLink::close() {
  on_error(Status::Error("Link closed"));
}

size_t FramedTransportLink::get_pending_count() const {
  auto guard = mutex_.lock();
  return pending_requests_.size();
}

void FramedTransportLink::on_data(Slice data) {
  if (!is_alive()) {
    return;
  }
  parser_.append(data);
  while (is_alive()) {
    Frame frame;
    auto r_need_size = parser_.read_next(frame);
    if (r_need_size.is_error()) {
      return on_error(r_need_size.move_as_error_prefix("Transport desynchronized: "));
    }
    if (r_need_size.ok() != 0) {
      break;
    }
    on_frame(std::move(frame));
  }
}

void FramedTransportLink::on_frame(Frame frame) {
  VLOG(DEBUG) << "Receive " << frame << " over link " << get_id();
  if (frame.seq_no != next_input_seq_no_) {
    return on_error(Status::Error(PSLICE() << "Transport desynchronized: receive frame with seq_no " << frame.seq_no
                                           << " instead of " << next_input_seq_no_));
  }
  next_input_seq_no_++;

  if (frame.kind == Frame::Kind::Request) {
    return on_error(Status::Error("Transport desynchronized: receive request from the remote side"));
  }

  Promise<Unit> ack_promise;
  PendingRequest pending_request;
  {
    auto guard = mutex_.lock();
    auto it = pending_requests_.find(frame.correlation_id);
    if (it == pending_requests_.end()) {
      guard.reset();
      LOG(INFO) << "Drop " << frame << " for unknown request";
      return;
    }

    if (frame.kind == Frame::Kind::Ack) {
      if (it->second.is_acked) {
        guard.reset();
        LOG(INFO) << "Receive duplicate " << frame;
        return;
      }
      it->second.is_acked = true;
      ack_promise = std::move(it->second.ack_promise);
    } else {
      CHECK(frame.is_final());
      pending_request = std::move(it->second);
      pending_requests_.erase(it);
    }
  }

  if (frame.kind == Frame::Kind::Ack) {
    ack_promise.set_value(Unit());
  } else {
    pending_request.promise.set_value(std::move(frame));
  }
}

void FramedTransportLink::on_error(Status status) {
  CHECK(status.is_error());
  std::map<uint64, PendingRequest> pending_requests;
  {
    auto guard = mutex_.lock();
    if (!is_alive_.exchange(false)) {
      return;
    }
    pending_requests = std::move(pending_requests_);
    pending_requests_.clear();
  }
  LOG(INFO) << "Transport link " << get_id() << " is down with " << pending_requests.size()
            << " pending requests: " << status;
  connection_->close();

  for (auto &it : pending_requests) {
    auto &pending_request = it.second;
    pending_request.ack_promise.set_error(link_down_error(false));
    pending_request.promise.set_error(link_down_error(pending_request.is_acked));
  }
}

FramedLinkFactory::FramedLinkFactory(Connector connector, FramedTransportLink::Options options)
    : connector_(std::move(connector)), options_(options) {
  CHECK(connector_);
}

void FramedLinkFactory::create_link(Promise<unique_ptr<TransportLink>> promise) {
  TRY_RESULT_PROMISE(promise, connection, connector_());
  created_link_count_++;
  promise.set_value(make_unique<FramedTransportLink>(std::move(connection), options_));
}

}  // namespace mtlink
