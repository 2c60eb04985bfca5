//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/utils/common.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"

namespace mtlink {

// a reliable ordered byte stream, callbacks are called from the scheduler thread
class Connection {
 public:
  class Callback {
   public:
    Callback() = default;
    Callback(const Callback &) = delete;
    Callback &operator=(const Callback &) = delete;
    virtual ~Callback() = default;

    virtual void on_data(Slice data) = 0;

    // called once, after which the connection is unusable
    virtual void on_closed(Status status) = 0;
  };

  Connection() = default;
  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;
  Connection(Connection &&) = delete;
  Connection &operator=(Connection &&) = delete;
  virtual ~Connection() = default;

  virtual void set_callback(unique_ptr<Callback> callback) = 0;

  virtual Status write(Slice data) MTLINK_WARN_UNUSED_RESULT = 0;

  // the callback isn't called after close
  virtual void close() = 0;

  virtual bool is_closed() const = 0;
};

}  // namespace mtlink
