//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/net/LinkPool.h"

#include "mtlink/net/NetError.h"

#include "mtlink/utils/format.h"
#include "mtlink/utils/logging.h"

namespace mtlink {

LinkPool::LinkPool(Scheduler *scheduler, unique_ptr<LinkFactory> factory, int32 pool_size)
    : pool_size_(pool_size), cleanup_timeout_(scheduler), factory_(std::move(factory)) {
  CHECK(factory_ != nullptr);
  CHECK(pool_size_ > 0);
  cleanup_timeout_.set_callback(on_cleanup_timeout_callback);
  cleanup_timeout_.set_callback_data(static_cast<void *>(this));
}

LinkPool::~LinkPool() {
  close();
}

void LinkPool::on_cleanup_timeout_callback(void *link_pool_ptr) {
  auto link_pool = static_cast<LinkPool *>(link_pool_ptr);
  VLOG(DEBUG) << "Destroy " << link_pool->dead_links_.size() << " dead links";
  link_pool->dead_links_.clear();
}

void LinkPool::get_link(Promise<TransportLink *> promise) {
  if (is_closed_) {
    return promise.set_error(request_aborted_error());
  }
  auto link = pick_link();
  if (link != nullptr) {
    promise.set_value(std::move(link));
  } else {
    waiting_promises_.push_back(std::move(promise));
  }
  create_links();
}

TransportLink *LinkPool::get_link_by_id(uint64 link_id) {
  for (auto &link : links_) {
    if (link->get_id() == link_id && link->is_alive()) {
      return link.get();
    }
  }
  return nullptr;
}

void LinkPool::close() {
  if (is_closed_) {
    return;
  }
  is_closed_ = true;
  LOG(INFO) << "Close pool of " << links_.size() << " links";
  fail_promises(waiting_promises_, request_aborted_error());
  for (auto &link : links_) {
    link->close();
  }
  links_.clear();
  dead_links_.clear();
  cleanup_timeout_.cancel_timeout();
}

int32 LinkPool::get_alive_link_count() const {
  int32 result = 0;
  for (auto &link : links_) {
    if (link->is_alive()) {
      result++;
    }
  }
  return result;
}

void LinkPool::prune_dead_links() {
  size_t old_size = links_.size();
  for (size_t i = 0; i < links_.size();) {
    if (links_[i]->is_alive()) {
      i++;
      continue;
    }
    LOG(INFO) << "Remove dead link " << links_[i]->get_id() << " from the pool";
    dead_links_.push_back(std::move(links_[i]));
    links_.erase(links_.begin() + i);
  }
  if (links_.size() != old_size) {
    // links can die inside their own methods, so they are destroyed later
    cleanup_timeout_.set_timeout_in(0);
  }
}

TransportLink *LinkPool::pick_link() {
  prune_dead_links();
  if (links_.empty()) {
    return nullptr;
  }
  if (next_link_pos_ >= links_.size()) {
    next_link_pos_ = 0;
  }
  return links_[next_link_pos_++].get();
}

void LinkPool::create_links() {
  prune_dead_links();
  // the factory can fail synchronously, so the number of requests is fixed beforehand
  auto need_link_count = pool_size_ - static_cast<int32>(links_.size()) - pending_link_count_;
  for (int32 i = 0; i < need_link_count && !is_closed_; i++) {
    pending_link_count_++;
    VLOG(DEBUG) << "Request new link: " << tag("alive", links_.size()) << tag("pending", pending_link_count_);
    factory_->create_link(PromiseCreator::lambda([this](Result<unique_ptr<TransportLink>> r_link) {
      if (is_closed_) {
        return;
      }
      on_link_created(std::move(r_link));
    }));
  }
}

void LinkPool::on_link_created(Result<unique_ptr<TransportLink>> r_link) {
  CHECK(pending_link_count_ > 0);
  pending_link_count_--;
  if (r_link.is_error()) {
    LOG(WARNING) << "Failed to create transport link: " << r_link.error();
    prune_dead_links();
    if (links_.empty() && pending_link_count_ == 0) {
      fail_promises(waiting_promises_, link_down_error(false));
    }
    return;
  }

  created_link_count_++;
  auto link = r_link.move_as_ok();
  CHECK(link != nullptr);
  LOG(INFO) << "Transport link " << link->get_id() << " is ready";
  links_.push_back(std::move(link));

  auto waiting_promises = std::move(waiting_promises_);
  waiting_promises_.clear();
  for (size_t i = 0; i < waiting_promises.size(); i++) {
    if (is_closed_) {
      waiting_promises[i].set_error(request_aborted_error());
      continue;
    }
    auto picked_link = pick_link();
    if (picked_link == nullptr) {
      for (; i < waiting_promises.size(); i++) {
        waiting_promises_.push_back(std::move(waiting_promises[i]));
      }
      create_links();
      break;
    }
    waiting_promises[i].set_value(std::move(picked_link));
  }
}

}  // namespace mtlink
