//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/net/TransportLink.h"

#include <atomic>

namespace mtlink {

static std::atomic<uint64> next_transport_link_id{1};

TransportLink::TransportLink() : id_(next_transport_link_id.fetch_add(1, std::memory_order_relaxed)) {
}

}  // namespace mtlink
