//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/Client.h"

#include "mtlink/files/PartPlanner.h"

#include "mtlink/utils/logging.h"

namespace mtlink {

Client::Client(Scheduler *scheduler, unique_ptr<LinkFactory> link_factory, ClientOptions options)
    : scheduler_(scheduler), options_(std::move(options)), cleanup_timeout_(scheduler) {
  CHECK(scheduler_ != nullptr);
  auto status = options_.validate();
  LOG_CHECK(status.is_ok()) << status;
  limiter_ = make_unique<ConcurrencyLimiter>(options_.concurrency_limit);
  link_pool_ = make_unique<LinkPool>(scheduler_, std::move(link_factory), options_.pool_size);
  dispatcher_ = make_unique<NetQueryDispatcher>(scheduler_, link_pool_.get(), limiter_.get());
  cleanup_timeout_.set_callback(on_cleanup_timeout_callback);
  cleanup_timeout_.set_callback_data(static_cast<void *>(this));
  LOG(INFO) << "Create client with " << options_;
}

Client::~Client() {
  dispatcher_->close();

  vector<uint64> upload_ids;
  for (auto &it : uploaders_) {
    upload_ids.push_back(it.first);
  }
  for (auto upload_id : upload_ids) {
    auto it = uploaders_.find(upload_id);
    if (it != uploaders_.end()) {
      it->second->cancel();
    }
  }
  LOG_IF(ERROR, !uploaders_.empty()) << "Have " << uploaders_.size() << " unfinished uploads";

  link_pool_->close();
  limiter_->close();
}

unique_ptr<LinkFactory> Client::create_link_factory(FramedLinkFactory::Connector connector,
                                                    const ClientOptions &options) {
  FramedTransportLink::Options link_options;
  link_options.gzip_threshold = options.gzip_threshold;
  return make_unique<FramedLinkFactory>(std::move(connector), link_options);
}

uint64 Client::upload(ByteSource &source, Promise<InputFile> promise, unique_ptr<FileUploader::Callback> callback) {
  auto upload_id = next_upload_id_++;

  FileUploader::Options uploader_options;
  uploader_options.workers =
      PartPlanner::is_file_big(source.get_size()) ? options_.big_file_workers : options_.small_file_workers;
  uploader_options.part_size = options_.part_size;
  uploader_options.is_premium = options_.is_premium;
  uploader_options.part_timeout = options_.upload_part_timeout;
  uploader_options.retry_policy = options_.retry_policy;

  auto uploader = make_unique<FileUploader>(
      scheduler_, dispatcher_.get(), source, std::move(uploader_options), std::move(callback),
      PromiseCreator::lambda([this, upload_id, promise = std::move(promise)](Result<InputFile> r_input_file) mutable {
        on_upload_closed(upload_id);
        promise.set_result(std::move(r_input_file));
      }));
  auto *uploader_ptr = uploader.get();
  uploaders_.emplace(upload_id, std::move(uploader));
  uploader_ptr->start();
  return upload_id;
}

void Client::cancel_upload(uint64 upload_id) {
  auto it = uploaders_.find(upload_id);
  if (it == uploaders_.end()) {
    return;
  }
  it->second->cancel();
}

const FileUploader *Client::get_upload(uint64 upload_id) const {
  auto it = uploaders_.find(upload_id);
  if (it == uploaders_.end()) {
    return nullptr;
  }
  return it->second.get();
}

void Client::on_upload_closed(uint64 upload_id) {
  auto it = uploaders_.find(upload_id);
  if (it == uploaders_.end()) {
    return;
  }
  closed_uploaders_.push_back(std::move(it->second));
  uploaders_.erase(it);
  if (!cleanup_timeout_.has_timeout()) {
    cleanup_timeout_.set_timeout_in(0);
  }
}

void Client::on_cleanup_timeout_callback(void *client_ptr) {
  auto *client = static_cast<Client *>(client_ptr);
  VLOG(file_loader) << "Destroy " << client->closed_uploaders_.size() << " finished uploaders";
  client->closed_uploaders_.clear();
}

}  // namespace mtlink
