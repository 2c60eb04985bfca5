//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/files/ByteSource.h"
#include "mtlink/files/InputFile.h"
#include "mtlink/files/PartsManager.h"

#include "mtlink/net/NetQueryDispatcher.h"
#include "mtlink/net/RetryPolicy.h"

#include "mtlink/actor/MultiTimeout.h"
#include "mtlink/actor/Scheduler.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/crypto.h"
#include "mtlink/utils/Promise.h"
#include "mtlink/utils/Status.h"

#include <map>

namespace mtlink {

// Uploads one ByteSource with save-part requests. Parts are sent by up to options.workers at a time
// and retried one by one; the promise is resolved once no part query is left in flight.
class FileUploader {
 public:
  class Callback {
   public:
    Callback() = default;
    Callback(const Callback &) = delete;
    Callback &operator=(const Callback &) = delete;
    Callback(Callback &&) = delete;
    Callback &operator=(Callback &&) = delete;
    virtual ~Callback() = default;

    // total_size is -1 while the size of the source is unknown
    virtual void on_progress(int64 ready_size, int64 total_size) = 0;

    virtual void on_part_retry(int32 part_id, int32 retry_count, const Status &error) {
    }
  };

  struct Options {
    int32 workers = 1;
    // 0 if the part size must be chosen automatically
    size_t part_size = 0;
    bool is_premium = false;
    // of a single part query, 0 if unlimited
    double part_timeout = 60.0;
    RetryPolicy retry_policy;
  };

  FileUploader(Scheduler *scheduler, NetQueryDispatcher *dispatcher, ByteSource &source, Options options,
               unique_ptr<Callback> callback, Promise<InputFile> promise);
  FileUploader(const FileUploader &) = delete;
  FileUploader &operator=(const FileUploader &) = delete;
  FileUploader(FileUploader &&) = delete;
  FileUploader &operator=(FileUploader &&) = delete;
  ~FileUploader();

  void start();

  // stops sending new parts, the upload fails with "Upload canceled" after sent parts are finished
  void cancel();

  bool is_closed() const {
    return is_closed_;
  }

  int64 get_file_id() const {
    return file_id_;
  }

  bool is_big() const {
    return is_big_;
  }

  const PartsManager &get_parts_manager() const {
    return parts_manager_;
  }

  int32 get_part_retry_count(int32 part_id) const;

  int32 get_total_retry_count() const {
    return total_retry_count_;
  }

  int32 get_max_in_flight_count() const {
    return max_in_flight_count_;
  }

 private:
  struct PartInfo {
    Part part;
    // the real number of bytes in the part
    size_t size = 0;
    // file_total_parts sent with the first attempt
    int32 total_parts = -1;
    // kept until the part is acknowledged if the source isn't seekable
    string bytes;
    uint64 query_id = 0;
    int32 retry_count = 0;
    bool is_in_flight = false;
    bool is_waiting_retry = false;
  };

  NetQueryDispatcher *dispatcher_;
  ByteSource &source_;
  Options options_;
  RetryPolicy part_retry_policy_;
  unique_ptr<Callback> callback_;
  Promise<InputFile> promise_;

  PartsManager parts_manager_;
  std::map<int32, PartInfo> parts_;
  MultiTimeout retry_timeout_;
  Md5State md5_state_;

  int64 file_id_ = 0;
  bool is_big_ = false;
  bool is_started_ = false;
  bool stop_flag_ = false;
  bool is_closed_ = false;
  Status stop_status_;

  int32 active_part_count_ = 0;
  int32 in_flight_count_ = 0;
  int32 max_in_flight_count_ = 0;
  int32 total_retry_count_ = 0;

  bool is_looping_ = false;
  bool need_loop_ = false;

  static void on_retry_timeout_callback(void *uploader_ptr, int64 part_id);

  void loop();
  Status do_loop() MTLINK_WARN_UNUSED_RESULT;

  Status init() MTLINK_WARN_UNUSED_RESULT;
  Status start_part(Part part) MTLINK_WARN_UNUSED_RESULT;
  Result<string> read_part(const Part &part) MTLINK_WARN_UNUSED_RESULT;
  Status check_source_end() MTLINK_WARN_UNUSED_RESULT;
  void send_part(int32 part_id, string bytes);

  void on_part_result(int32 part_id, Result<string> r_answer);
  Status process_part_result(Result<string> r_answer) MTLINK_WARN_UNUSED_RESULT;
  void on_part_error(int32 part_id, Status status);
  void on_retry_timeout(int32 part_id);
  Status retry_part(int32 part_id) MTLINK_WARN_UNUSED_RESULT;

  void on_error(Status status);
  void stop(Status status, bool cancel_queries);
  void close(Result<InputFile> result);
};

}  // namespace mtlink
