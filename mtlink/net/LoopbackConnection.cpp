//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/net/LoopbackConnection.h"

#include "mtlink/utils/logging.h"

namespace mtlink {

struct LoopbackConnection::Pipe {
  struct Endpoint {
    std::shared_ptr<Connection::Callback> callback;
    bool is_closed = false;
  };

  explicit Pipe(Scheduler *scheduler) : scheduler(scheduler) {
  }

  Scheduler *scheduler;
  Mutex mutex;
  Endpoint endpoints[2];
};

LoopbackConnection::LoopbackConnection(std::shared_ptr<Pipe> pipe, int side) : pipe_(std::move(pipe)), side_(side) {
  CHECK(side_ == 0 || side_ == 1);
}

LoopbackConnection::~LoopbackConnection() {
  close();
}

std::pair<unique_ptr<LoopbackConnection>, unique_ptr<LoopbackConnection>> LoopbackConnection::create_pair(
    Scheduler *scheduler) {
  CHECK(scheduler != nullptr);
  auto pipe = std::make_shared<Pipe>(scheduler);
  return std::make_pair(make_unique<LoopbackConnection>(pipe, 0), make_unique<LoopbackConnection>(pipe, 1));
}

void LoopbackConnection::set_callback(unique_ptr<Callback> callback) {
  auto guard = pipe_->mutex.lock();
  auto &endpoint = pipe_->endpoints[side_];
  if (endpoint.is_closed) {
    return;
  }
  endpoint.callback = std::shared_ptr<Callback>(std::move(callback));
}

Status LoopbackConnection::write(Slice data) {
  {
    auto guard = pipe_->mutex.lock();
    if (pipe_->endpoints[side_].is_closed) {
      return Status::Error("Connection is closed");
    }
    if (pipe_->endpoints[1 - side_].is_closed) {
      return Status::Error("Connection reset by peer");
    }
  }
  if (data.empty()) {
    return Status::OK();
  }
  written_size_ += data.size();
  auto pipe = pipe_;
  auto side = 1 - side_;
  pipe_->scheduler->post([pipe = std::move(pipe), side, data = data.str()] { deliver(pipe, side, data); });
  return Status::OK();
}

void LoopbackConnection::close() {
  bool notify_peer = false;
  std::shared_ptr<Callback> callback;
  {
    auto guard = pipe_->mutex.lock();
    auto &endpoint = pipe_->endpoints[side_];
    if (endpoint.is_closed) {
      return;
    }
    endpoint.is_closed = true;
    callback = std::move(endpoint.callback);
    notify_peer = !pipe_->endpoints[1 - side_].is_closed;
  }
  if (notify_peer) {
    auto pipe = pipe_;
    auto side = 1 - side_;
    pipe_->scheduler->post(
        [pipe = std::move(pipe), side] { notify_closed(pipe, side, Status::Error("Connection closed by peer")); });
  }
}

bool LoopbackConnection::is_closed() const {
  auto guard = pipe_->mutex.lock();
  return pipe_->endpoints[side_].is_closed;
}

void LoopbackConnection::break_link(Slice reason) {
  LOG(INFO) << "Break loopback connection: " << reason;
  for (int side = 0; side < 2; side++) {
    auto pipe = pipe_;
    pipe_->scheduler->post(
        [pipe = std::move(pipe), side, reason = reason.str()] { notify_closed(pipe, side, Status::Error(reason)); });
  }
}

void LoopbackConnection::deliver(const std::shared_ptr<Pipe> &pipe, int side, const string &data) {
  std::shared_ptr<Callback> callback;
  {
    auto guard = pipe->mutex.lock();
    auto &endpoint = pipe->endpoints[side];
    if (endpoint.is_closed || endpoint.callback == nullptr) {
      VLOG(DEBUG) << "Drop " << data.size() << " bytes sent to a closed loopback connection";
      return;
    }
    callback = endpoint.callback;
  }
  callback->on_data(data);
}

void LoopbackConnection::notify_closed(const std::shared_ptr<Pipe> &pipe, int side, Status status) {
  std::shared_ptr<Callback> callback;
  {
    auto guard = pipe->mutex.lock();
    auto &endpoint = pipe->endpoints[side];
    if (endpoint.is_closed) {
      return;
    }
    endpoint.is_closed = true;
    callback = std::move(endpoint.callback);
  }
  if (callback != nullptr) {
    callback->on_closed(std::move(status));
  }
}

}  // namespace mtlink
