//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/files/FileUploader.h"

#include "mtlink/api/Api.h"

#include "mtlink/net/NetError.h"
#include "mtlink/net/NetQuery.h"

#include "mtlink/utils/format.h"
#include "mtlink/utils/logging.h"
#include "mtlink/utils/misc.h"
#include "mtlink/utils/Random.h"

namespace mtlink {

FileUploader::FileUploader(Scheduler *scheduler, NetQueryDispatcher *dispatcher, ByteSource &source, Options options,
                           unique_ptr<Callback> callback, Promise<InputFile> promise)
    : dispatcher_(dispatcher)
    , source_(source)
    , options_(std::move(options))
    , part_retry_policy_(options_.retry_policy)
    , callback_(std::move(callback))
    , promise_(std::move(promise))
    , retry_timeout_("FileUploaderRetry", scheduler) {
  CHECK(dispatcher_ != nullptr);
  // part queries are resent here, so the dispatcher must return the first transient error
  part_retry_policy_.max_attempts = 1;
  retry_timeout_.set_callback(on_retry_timeout_callback);
  retry_timeout_.set_callback_data(static_cast<void *>(this));
}

FileUploader::~FileUploader() {
  if (is_closed_) {
    return;
  }
  LOG(WARNING) << "Destroy unfinished upload of file " << file_id_;
  if (!stop_flag_) {
    stop(request_aborted_error(), true);
  }
  LOG_IF(ERROR, !is_closed_) << "Upload of file " << file_id_ << " has " << in_flight_count_
                             << " parts left in flight";
}

int32 FileUploader::get_part_retry_count(int32 part_id) const {
  auto it = parts_.find(part_id);
  if (it == parts_.end()) {
    return 0;
  }
  return it->second.retry_count;
}

void FileUploader::start() {
  CHECK(!is_started_);
  is_started_ = true;
  if (stop_flag_) {
    return loop();
  }
  auto status = init();
  if (status.is_error()) {
    LOG(INFO) << "Can't start upload of \"" << source_.get_name() << "\": " << status;
    return close(std::move(status));
  }
  loop();
}

void FileUploader::cancel() {
  if (stop_flag_ || is_closed_) {
    return;
  }
  LOG(INFO) << "Cancel upload of file " << file_id_ << " with " << in_flight_count_ << " parts in flight";
  stop(upload_canceled_error(), false);
}

Status FileUploader::init() {
  TRY_STATUS(options_.retry_policy.validate());
  if (options_.workers <= 0) {
    return Status::Error(400, "Invalid number of upload workers");
  }
  TRY_RESULT(layout, PartPlanner::plan(source_.get_size(), options_.part_size, options_.is_premium));
  TRY_STATUS(parts_manager_.init(layout));
  is_big_ = layout.is_big;
  do {
    file_id_ = Random::secure_int64();
  } while (file_id_ == 0);
  if (!is_big_) {
    md5_state_.init();
  }
  LOG(INFO) << "Start upload of \"" << source_.get_name() << "\" as file " << file_id_ << " with " << layout;
  return Status::OK();
}

void FileUploader::loop() {
  if (is_looping_) {
    need_loop_ = true;
    return;
  }
  is_looping_ = true;
  do {
    need_loop_ = false;
    auto status = do_loop();
    if (status.is_error()) {
      on_error(std::move(status));
    }
  } while (need_loop_);
  is_looping_ = false;
}

Status FileUploader::do_loop() {
  if (is_closed_) {
    return Status::OK();
  }
  if (stop_flag_) {
    if (in_flight_count_ == 0) {
      close(std::move(stop_status_));
    }
    return Status::OK();
  }
  if (!is_started_) {
    return Status::OK();
  }

  if (parts_manager_.ready()) {
    TRY_STATUS(parts_manager_.finish());
    InputFile input_file;
    input_file.file_id = file_id_;
    input_file.part_count = parts_manager_.get_part_count();
    input_file.name = source_.get_name().str();
    input_file.is_big = is_big_;
    if (!is_big_) {
      string md5(16, '\0');
      md5_state_.extract(MutableSlice(md5));
      input_file.md5_checksum = hex_encode(md5);
    }
    close(std::move(input_file));
    return Status::OK();
  }

  while (active_part_count_ < options_.workers) {
    TRY_RESULT(part, parts_manager_.start_part());
    if (part.id == -1) {
      break;
    }
    VLOG(file_loader) << "Start part " << tag("id", part.id) << tag("size", part.size);
    TRY_STATUS(start_part(part));
    if (stop_flag_) {
      break;
    }
  }
  return Status::OK();
}

Status FileUploader::start_part(Part part) {
  TRY_RESULT(bytes, read_part(part));
  if (!is_big_) {
    md5_state_.feed(bytes);
  }

  auto &info = parts_[part.id];
  info.part = part;
  info.size = bytes.size();
  info.total_parts = parts_manager_.is_size_known() ? parts_manager_.get_part_count() : -1;
  if (!source_.is_seekable()) {
    info.bytes = bytes;
  }
  active_part_count_++;
  send_part(part.id, std::move(bytes));
  return Status::OK();
}

Result<string> FileUploader::read_part(const Part &part) {
  Result<string> r_bytes =
      source_.is_seekable() ? source_.read_range(part.offset, part.size) : source_.read_next(part.size);
  TRY_RESULT_PREFIX(bytes, std::move(r_bytes), PSLICE() << "Failed to read part " << part.id << ": ");
  if (bytes.size() > part.size) {
    return Status::Error(PSLICE() << "Receive " << bytes.size() << " bytes instead of " << part.size << " for part "
                                  << part.id);
  }
  if (parts_manager_.is_size_known()) {
    if (bytes.size() != part.size) {
      return size_mismatch_error(PSLICE() << "expected " << part.size << " bytes at offset " << part.offset
                                          << ", but read " << bytes.size());
    }
    if (part.id + 1 == parts_manager_.get_part_count()) {
      TRY_STATUS(check_source_end());
    }
  } else if (bytes.size() < part.size) {
    TRY_STATUS(parts_manager_.set_terminal_part(part.id, bytes.size()));
  }
  return std::move(bytes);
}

Status FileUploader::check_source_end() {
  auto size = parts_manager_.get_size();
  Result<string> r_extra = source_.is_seekable() ? source_.read_range(size, 1) : source_.read_next(1);
  TRY_RESULT(extra, std::move(r_extra));
  if (!extra.empty()) {
    return size_mismatch_error(PSLICE() << "source \"" << source_.get_name() << "\" is longer than declared size "
                                        << size);
  }
  return Status::OK();
}

void FileUploader::send_part(int32 part_id, string bytes) {
  auto &info = parts_[part_id];
  CHECK(!info.is_in_flight);

  string query;
  int32 tl_constructor;
  if (is_big_) {
    api::SaveBigFilePart request(file_id_, part_id, info.total_parts, std::move(bytes));
    query = api::serialize_object(request);
    tl_constructor = api::SaveBigFilePart::ID;
  } else {
    api::SaveFilePart request(file_id_, part_id, std::move(bytes));
    query = api::serialize_object(request);
    tl_constructor = api::SaveFilePart::ID;
  }

  info.is_in_flight = true;
  in_flight_count_++;
  max_in_flight_count_ = max(max_in_flight_count_, in_flight_count_);
  auto query_id = dispatcher_->invoke(
      std::move(query), tl_constructor, NetQuery::Type::Upload, true, options_.part_timeout, part_retry_policy_,
      PromiseCreator::lambda([this, part_id](Result<string> r_answer) {
        on_part_result(part_id, std::move(r_answer));
      }),
      is_big_ ? Slice("upload.saveBigFilePart") : Slice("upload.saveFilePart"));
  if (info.is_in_flight) {
    info.query_id = query_id;
  }
}

void FileUploader::on_part_result(int32 part_id, Result<string> r_answer) {
  auto it = parts_.find(part_id);
  CHECK(it != parts_.end());
  auto &info = it->second;
  CHECK(info.is_in_flight);
  info.is_in_flight = false;
  info.query_id = 0;
  in_flight_count_--;

  if (stop_flag_) {
    VLOG(file_loader) << "Ignore result of part " << part_id << " of stopped upload";
    active_part_count_--;
    return loop();
  }

  auto status = process_part_result(std::move(r_answer));
  if (status.is_error()) {
    return on_part_error(part_id, std::move(status));
  }

  VLOG(file_loader) << "Ok part " << tag("id", part_id) << tag("size", info.size);
  active_part_count_--;
  status = parts_manager_.on_part_ok(part_id, info.size);
  if (status.is_error()) {
    return on_error(std::move(status));
  }
  info.bytes = string();
  if (callback_ != nullptr) {
    callback_->on_progress(parts_manager_.get_ready_size(), parts_manager_.get_size());
  }
  loop();
}

Status FileUploader::process_part_result(Result<string> r_answer) {
  Result<bool> result = is_big_ ? fetch_result<api::SaveBigFilePart>(std::move(r_answer))
                                : fetch_result<api::SaveFilePart>(std::move(r_answer));
  if (result.is_error()) {
    return result.move_as_error();
  }
  if (!result.ok()) {
    return Status::Error(500, "Internal Server Error during file upload");
  }
  return Status::OK();
}

void FileUploader::on_part_error(int32 part_id, Status status) {
  auto &info = parts_[part_id];
  auto kind = options_.retry_policy.classify(status);
  if (kind == ErrorKind::Aborted) {
    return on_error(std::move(status));
  }
  bool is_transient = kind == ErrorKind::LinkDown || kind == ErrorKind::TimedOut || kind == ErrorKind::Retryable;
  if (is_transient && info.retry_count + 1 < options_.retry_policy.max_attempts) {
    info.retry_count++;
    total_retry_count_++;
    auto backoff = options_.retry_policy.get_backoff(info.retry_count);
    LOG(INFO) << "Resend part " << part_id << " of file " << file_id_ << " in " << backoff << " seconds after "
              << status;
    info.is_waiting_retry = true;
    retry_timeout_.set_timeout_in(part_id, backoff);
    if (callback_ != nullptr) {
      callback_->on_part_retry(part_id, info.retry_count, status);
    }
    return;
  }
  LOG(WARNING) << "Part " << part_id << " of file " << file_id_ << " failed after " << info.retry_count
               << " retries: " << status;
  on_error(upload_failed_error(part_id, status));
}

void FileUploader::on_retry_timeout_callback(void *uploader_ptr, int64 part_id) {
  static_cast<FileUploader *>(uploader_ptr)->on_retry_timeout(narrow_cast<int32>(part_id));
}

void FileUploader::on_retry_timeout(int32 part_id) {
  auto it = parts_.find(part_id);
  CHECK(it != parts_.end());
  CHECK(it->second.is_waiting_retry);
  it->second.is_waiting_retry = false;
  if (stop_flag_) {
    active_part_count_--;
    return loop();
  }
  auto status = retry_part(part_id);
  if (status.is_error()) {
    on_error(std::move(status));
  }
}

Status FileUploader::retry_part(int32 part_id) {
  auto &info = parts_[part_id];
  string bytes;
  if (source_.is_seekable()) {
    TRY_RESULT_ASSIGN(bytes, source_.read_range(info.part.offset, info.size));
    if (bytes.size() != info.size) {
      return size_mismatch_error(PSLICE() << "part " << part_id << " changed its size from " << info.size << " to "
                                          << bytes.size());
    }
  } else {
    bytes = info.bytes;
  }
  VLOG(file_loader) << "Resend part " << part_id << ", retry " << info.retry_count;
  send_part(part_id, std::move(bytes));
  return Status::OK();
}

void FileUploader::on_error(Status status) {
  CHECK(status.is_error());
  if (stop_flag_ || is_closed_) {
    LOG(INFO) << "Ignore error for stopped upload of file " << file_id_ << ": " << status;
    return;
  }
  LOG(WARNING) << "Upload of file " << file_id_ << " failed: " << status;
  stop(std::move(status), true);
}

void FileUploader::stop(Status status, bool cancel_queries) {
  CHECK(!stop_flag_);
  stop_flag_ = true;
  stop_status_ = std::move(status);
  for (auto &it : parts_) {
    auto &info = it.second;
    if (info.is_waiting_retry) {
      retry_timeout_.cancel_timeout(it.first);
      info.is_waiting_retry = false;
      active_part_count_--;
    }
  }
  if (cancel_queries) {
    vector<uint64> query_ids;
    for (auto &it : parts_) {
      if (it.second.is_in_flight && it.second.query_id != 0) {
        query_ids.push_back(it.second.query_id);
      }
    }
    for (auto query_id : query_ids) {
      dispatcher_->cancel(query_id);
    }
  }
  loop();
}

void FileUploader::close(Result<InputFile> result) {
  CHECK(!is_closed_);
  is_closed_ = true;
  if (result.is_ok()) {
    LOG(INFO) << "Finish upload: " << result.ok() << " after " << total_retry_count_ << " retries";
  } else {
    LOG(INFO) << "Finish upload of file " << file_id_ << " with error " << result.error();
  }
  promise_.set_result(std::move(result));
}

}  // namespace mtlink
