//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/net/Frame.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/Promise.h"

namespace mtlink {

// a logical duplex channel to the remote service
class TransportLink {
 public:
  TransportLink();
  TransportLink(const TransportLink &) = delete;
  TransportLink &operator=(const TransportLink &) = delete;
  TransportLink(TransportLink &&) = delete;
  TransportLink &operator=(TransportLink &&) = delete;
  virtual ~TransportLink() = default;

  uint64 get_id() const {
    return id_;
  }

  // promise receives the final frame for the correlation id of the request,
  // ack_promise is set when the remote confirms receipt of the request.
  // If the link goes down before the final frame, promise fails with LinkDown.
  virtual void send(Frame request, Promise<Frame> promise, Promise<Unit> ack_promise) = 0;

  void send(Frame request, Promise<Frame> promise) {
    send(std::move(request), std::move(promise), Promise<Unit>());
  }

  // forgets the request; a late response is dropped
  virtual void cancel(uint64 correlation_id) = 0;

  virtual bool is_alive() const = 0;

  // fails all pending requests with LinkDown
  virtual void close() = 0;

 private:
  uint64 id_;
};

}  // namespace mtlink
