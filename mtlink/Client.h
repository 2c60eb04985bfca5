//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/ClientOptions.h"

#include "mtlink/api/FunctionRegistry.h"
#include "mtlink/api/TlObject.h"

#include "mtlink/files/ByteSource.h"
#include "mtlink/files/FileUploader.h"
#include "mtlink/files/InputFile.h"

#include "mtlink/net/ConcurrencyLimiter.h"
#include "mtlink/net/FramedTransportLink.h"
#include "mtlink/net/LinkFactory.h"
#include "mtlink/net/LinkPool.h"
#include "mtlink/net/NetQuery.h"
#include "mtlink/net/NetQueryDispatcher.h"

#include "mtlink/actor/Scheduler.h"
#include "mtlink/actor/Timeout.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/Promise.h"
#include "mtlink/utils/Status.h"

#include <map>

namespace mtlink {

/*
 * Session handle: owns the link pool, the concurrency limiter and the query dispatcher
 * and runs uploads and typed requests over them. All methods must be called from the scheduler thread.
 * Pending requests and uploads are aborted when the client is destroyed.
 */
class Client {
 public:
  Client(Scheduler *scheduler, unique_ptr<LinkFactory> link_factory, ClientOptions options);
  Client(const Client &) = delete;
  Client &operator=(const Client &) = delete;
  Client(Client &&) = delete;
  Client &operator=(Client &&) = delete;
  ~Client();

  // the options must be valid
  static unique_ptr<LinkFactory> create_link_factory(FramedLinkFactory::Connector connector,
                                                     const ClientOptions &options);

  const ClientOptions &get_options() const {
    return options_;
  }

  // source must stay valid until the promise is completed; returns identifier of the upload
  uint64 upload(ByteSource &source, Promise<InputFile> promise, unique_ptr<FileUploader::Callback> callback = nullptr);

  void cancel_upload(uint64 upload_id);

  // nullptr if there is no such active upload
  const FileUploader *get_upload(uint64 upload_id) const;

  // returns identifier of the query
  template <class FunctionT>
  uint64 invoke(const FunctionT &function, Promise<typename FunctionT::ReturnType> promise) {
    return dispatcher_->invoke(
        api::serialize_object(function), FunctionT::ID, NetQuery::Type::Common, false, options_.invoke_timeout,
        options_.retry_policy,
        PromiseCreator::lambda([promise = std::move(promise)](Result<string> r_answer) mutable {
          promise.set_result(fetch_result<FunctionT>(std::move(r_answer)));
        }),
        api::FunctionRegistry::get_function_name(FunctionT::ID));
  }

  ConcurrencyLimiter &get_limiter() {
    return *limiter_;
  }

  LinkPool &get_link_pool() {
    return *link_pool_;
  }

  NetQueryDispatcher &get_dispatcher() {
    return *dispatcher_;
  }

  size_t get_active_upload_count() const {
    return uploaders_.size();
  }

 private:
  Scheduler *scheduler_;
  ClientOptions options_;
  unique_ptr<ConcurrencyLimiter> limiter_;
  unique_ptr<LinkPool> link_pool_;
  unique_ptr<NetQueryDispatcher> dispatcher_;

  uint64 next_upload_id_ = 1;
  std::map<uint64, unique_ptr<FileUploader>> uploaders_;
  // finished uploaders are destroyed from a separate timeout, because they can't destroy themselves
  vector<unique_ptr<FileUploader>> closed_uploaders_;
  Timeout cleanup_timeout_;

  static void on_cleanup_timeout_callback(void *client_ptr);

  void on_upload_closed(uint64 upload_id);
};

}  // namespace mtlink
