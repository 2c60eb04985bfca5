//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/net/Connection.h"

#include "mtlink/actor/Scheduler.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/port/Mutex.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"

#include <memory>
#include <utility>

namespace mtlink {

// in-process connection; written data is delivered to the other end through the scheduler
class LoopbackConnection final : public Connection {
  struct Pipe;

 public:
  LoopbackConnection(std::shared_ptr<Pipe> pipe, int side);
  ~LoopbackConnection() final;

  static std::pair<unique_ptr<LoopbackConnection>, unique_ptr<LoopbackConnection>> create_pair(Scheduler *scheduler);

  void set_callback(unique_ptr<Callback> callback) final;

  Status write(Slice data) final;

  void close() final;

  bool is_closed() const final;

  // simulates a network failure: both ends are closed with the error
  void break_link(Slice reason = Slice("Connection reset"));

  uint64 get_written_size() const {
    return written_size_;
  }

 private:
  std::shared_ptr<Pipe> pipe_;
  int side_;
  uint64 written_size_ = 0;

  static void deliver(const std::shared_ptr<Pipe> &pipe, int side, const string &data);
  static void notify_closed(const std::shared_ptr<Pipe> &pipe, int side, Status status);
};

}  // namespace mtlink
