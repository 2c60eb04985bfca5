//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/net/TransportLink.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/Promise.h"

namespace mtlink {

// opens new transport links to the remote service
class LinkFactory {
 public:
  LinkFactory() = default;
  LinkFactory(const LinkFactory &) = delete;
  LinkFactory &operator=(const LinkFactory &) = delete;
  virtual ~LinkFactory() = default;

  virtual void create_link(Promise<unique_ptr<TransportLink>> promise) = 0;
};

}  // namespace mtlink
