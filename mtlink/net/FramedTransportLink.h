//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/net/Connection.h"
#include "mtlink/net/Frame.h"
#include "mtlink/net/LinkFactory.h"
#include "mtlink/net/TransportLink.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/port/Mutex.h"
#include "mtlink/utils/Promise.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"

#include <atomic>
#include <functional>
#include <map>

namespace mtlink {

// TransportLink over a byte stream connection, frames are encoded with FrameCodec.
// Pending requests are guarded by a mutex, so send may be called from any thread,
// but promises are completed from the thread delivering connection events.
class FramedTransportLink final : public TransportLink {
 public:
  struct Options {
    size_t gzip_threshold = 512;
  };

  FramedTransportLink(unique_ptr<Connection> connection, Options options);
  ~FramedTransportLink() final;

  using TransportLink::send;
  void send(Frame request, Promise<Frame> promise, Promise<Unit> ack_promise) final;

  void cancel(uint64 correlation_id) final;

  bool is_alive() const final {
    return is_alive_.load(std::memory_order_relaxed);
  }

  void close() final;

  size_t get_pending_count() const;

 private:
  class ConnectionCallback;

  struct PendingRequest {
    Promise<Frame> promise;
    Promise<Unit> ack_promise;
    bool is_acked = false;
  };

  unique_ptr<Connection> connection_;
  Options options_;
  FrameParser parser_;
  uint32 next_input_seq_no_ = 0;

  mutable Mutex mutex_;
  uint32 next_output_seq_no_ = 0;
  std::map<uint64, PendingRequest> pending_requests_;
  std::atomic<bool> is_alive_{true};

  void on_data(Slice data);

  void on_frame(Frame frame);

  void on_error(Status status);
};

class FramedLinkFactory final : public LinkFactory {
 public:
  using Connector = std::function<Result<unique_ptr<Connection>>()>;

  FramedLinkFactory(Connector connector, FramedTransportLink::Options options);

  void create_link(Promise<unique_ptr<TransportLink>> promise) final;

  int32 get_created_link_count() const {
    return created_link_count_;
  }

 private:
  Connector connector_;
  FramedTransportLink::Options options_;
  int32 created_link_count_ = 0;
};

}  // namespace mtlink
