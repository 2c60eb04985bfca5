//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/net/LinkFactory.h"
#include "mtlink/net/TransportLink.h"

#include "mtlink/actor/Scheduler.h"
#include "mtlink/actor/Timeout.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/Promise.h"
#include "mtlink/utils/Status.h"

namespace mtlink {

// Keeps up to pool_size live transport links and hands them out in round-robin order.
// Dead links are replaced on demand through the factory.
class LinkPool {
 public:
  LinkPool(Scheduler *scheduler, unique_ptr<LinkFactory> factory, int32 pool_size);
  LinkPool(const LinkPool &) = delete;
  LinkPool &operator=(const LinkPool &) = delete;
  LinkPool(LinkPool &&) = delete;
  LinkPool &operator=(LinkPool &&) = delete;
  ~LinkPool();

  // the returned link is valid until the next call to the scheduler
  void get_link(Promise<TransportLink *> promise);

  // nullptr if there is no such live link
  TransportLink *get_link_by_id(uint64 link_id);

  void close();

  int32 get_pool_size() const {
    return pool_size_;
  }

  int32 get_alive_link_count() const;

  // number of successfully created links, including the initial ones
  int32 get_created_link_count() const {
    return created_link_count_;
  }

 private:
  int32 pool_size_;

  vector<unique_ptr<TransportLink>> links_;
  vector<unique_ptr<TransportLink>> dead_links_;
  Timeout cleanup_timeout_;
  size_t next_link_pos_ = 0;

  vector<Promise<TransportLink *>> waiting_promises_;
  int32 pending_link_count_ = 0;
  int32 created_link_count_ = 0;
  bool is_closed_ = false;

  unique_ptr<LinkFactory> factory_;

  static void on_cleanup_timeout_callback(void *link_pool_ptr);

  void prune_dead_links();

  void create_links();

  void on_link_created(Result<unique_ptr<TransportLink>> r_link);

  TransportLink *pick_link();
};

}  // namespace mtlink
