//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/Client.h"
#include "mtlink/ClientOptions.h"

#include "mtlink/files/ByteSource.h"
#include "mtlink/files/FileUploader.h"
#include "mtlink/files/InputFile.h"

#include "mtlink/net/NetError.h"

#include "mtlink/actor/Scheduler.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/crypto.h"
#include "mtlink/utils/misc.h"
#include "mtlink/utils/Promise.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"
#include "mtlink/utils/tests.h"
#include "mtlink/utils/Time.h"

#include "test/FakeRemote.h"

#include <map>

namespace {

struct UploadStats {
  mtlink::int32 progress_count = 0;
  mtlink::int64 ready_size = 0;
  mtlink::int64 total_size = 0;
  std::map<mtlink::int32, mtlink::int32> part_retries;
  mtlink::int32 total_retries = 0;
};

class RecordingCallback final : public mtlink::FileUploader::Callback {
 public:
  explicit RecordingCallback(UploadStats *stats) : stats_(stats) {
  }

  void on_progress(mtlink::int64 ready_size, mtlink::int64 total_size) final {
    ASSERT_TRUE(ready_size >= stats_->ready_size);
    stats_->progress_count++;
    stats_->ready_size = ready_size;
    stats_->total_size = total_size;
  }

  void on_part_retry(mtlink::int32 part_id, mtlink::int32 retry_count, const mtlink::Status &error) final {
    stats_->part_retries[part_id] = retry_count;
    stats_->total_retries++;
  }

 private:
  UploadStats *stats_;
};

mtlink::string make_data(size_t size) {
  mtlink::string data(size, '\0');
  for (size_t i = 0; i < size; i++) {
    data[i] = static_cast<char>((i * 7 + i / 1024) & 0xff);
  }
  return data;
}

mtlink::string get_md5(mtlink::Slice data) {
  mtlink::string md5(16, '\0');
  mtlink::md5(data, md5);
  return mtlink::hex_encode(md5);
}

mtlink::ClientOptions get_upload_options() {
  mtlink::ClientOptions options;
  options.part_size = 1024;
  options.gzip_threshold = 0;
  return options;
}

mtlink::unique_ptr<mtlink::LinkFactory> create_factory(mtlink::FakeRemote &remote,
                                                       const mtlink::ClientOptions &options) {
  return mtlink::Client::create_link_factory(remote.get_connector(), options);
}

mtlink::Result<mtlink::InputFile> run_upload(mtlink::Scheduler &scheduler, mtlink::Client &client,
                                             mtlink::ByteSource &source, UploadStats *stats = nullptr) {
  bool is_finished = false;
  mtlink::Result<mtlink::InputFile> result;
  mtlink::unique_ptr<mtlink::FileUploader::Callback> callback;
  if (stats != nullptr) {
    callback = mtlink::make_unique<RecordingCallback>(stats);
  }
  client.upload(source, mtlink::PromiseCreator::lambda([&](mtlink::Result<mtlink::InputFile> r_input_file) {
                  result = std::move(r_input_file);
                  is_finished = true;
                }),
                std::move(callback));
  scheduler.run_until_idle();
  ASSERT_TRUE(is_finished);
  ASSERT_EQ(0u, client.get_active_upload_count());
  return result;
}

}  // namespace

TEST(Upload, small_file) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  UploadStats stats;
  auto options = get_upload_options();
  mtlink::Client client(&scheduler, create_factory(remote, options), options);

  auto data = make_data(2500);
  mtlink::MemoryByteSource source("photo.jpg", data);
  auto r_input_file = run_upload(scheduler, client, source, &stats);
  ASSERT_TRUE(r_input_file.is_ok());
  auto input_file = r_input_file.move_as_ok();
  ASSERT_EQ(3, input_file.part_count);
  ASSERT_TRUE(!input_file.is_big);
  ASSERT_STREQ("photo.jpg", input_file.name);
  ASSERT_EQ(get_md5(data), input_file.md5_checksum);
  ASSERT_TRUE(input_file.file_id != 0);

  ASSERT_EQ(3u, remote.get_parts().size());
  for (auto &it : remote.get_parts()) {
    ASSERT_EQ(input_file.file_id, it.second.file_id);
    ASSERT_TRUE(!it.second.is_big);
  }
  ASSERT_TRUE(remote.get_saved_bytes() == data);
  ASSERT_EQ(3, remote.get_request_count());

  ASSERT_EQ(3, stats.progress_count);
  ASSERT_EQ(2500, stats.ready_size);
  ASSERT_EQ(2500, stats.total_size);
  ASSERT_EQ(0, stats.total_retries);

  auto api_file = input_file.to_api();
  ASSERT_EQ(mtlink::api::InputFileSmall::ID, api_file->get_id());
}

TEST(Upload, empty_file) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  auto options = get_upload_options();
  mtlink::Client client(&scheduler, create_factory(remote, options), options);

  mtlink::MemoryByteSource source("empty.txt", mtlink::string());
  auto r_input_file = run_upload(scheduler, client, source);
  ASSERT_TRUE(r_input_file.is_ok());
  auto input_file = r_input_file.move_as_ok();
  ASSERT_EQ(1, input_file.part_count);
  ASSERT_TRUE(!input_file.is_big);
  ASSERT_STREQ("d41d8cd98f00b204e9800998ecf8427e", input_file.md5_checksum);

  ASSERT_EQ(1u, remote.get_parts().size());
  ASSERT_TRUE(remote.get_parts().at(0).bytes.empty());
}

TEST(Upload, big_file_with_transient_part_errors) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  UploadStats stats;
  auto options = get_upload_options();
  options.part_size = 512 << 10;
  options.big_file_workers = 4;
  mtlink::Client client(&scheduler, create_factory(remote, options), options);

  auto data = make_data(50 << 20);
  auto data_crc = mtlink::crc32(data);
  mtlink::MemoryByteSource source("video.mp4", std::move(data));
  remote.fail_part(37, 2);

  auto start_time = mtlink::Time::now();
  auto r_input_file = run_upload(scheduler, client, source, &stats);
  ASSERT_TRUE(r_input_file.is_ok());
  auto input_file = r_input_file.move_as_ok();
  ASSERT_EQ(100, input_file.part_count);
  ASSERT_TRUE(input_file.is_big);
  ASSERT_TRUE(input_file.md5_checksum.empty());

  ASSERT_EQ(2, stats.total_retries);
  ASSERT_EQ(1u, stats.part_retries.size());
  ASSERT_EQ(2, stats.part_retries[37]);
  // backoff before the first and the second retry
  ASSERT_TRUE(mtlink::Time::now() - start_time >= 3.0 - 1e-6);

  ASSERT_EQ(100u, remote.get_parts().size());
  ASSERT_EQ(3, remote.get_part_request_count(37));
  ASSERT_EQ(1, remote.get_part_request_count(36));
  for (auto &it : remote.get_parts()) {
    ASSERT_TRUE(it.second.is_big);
    ASSERT_EQ(100, it.second.total_parts);
    ASSERT_EQ(input_file.file_id, it.second.file_id);
  }
  ASSERT_EQ(data_crc, mtlink::crc32(remote.get_saved_bytes()));
  ASSERT_EQ(52428800, stats.ready_size);
}

TEST(Upload, part_fails_on_every_attempt) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  auto options = get_upload_options();
  options.retry_policy.max_attempts = 3;
  mtlink::Client client(&scheduler, create_factory(remote, options), options);

  mtlink::MemoryByteSource source("photo.jpg", make_data(2500));
  remote.fail_part(1, 100);
  auto r_input_file = run_upload(scheduler, client, source);
  ASSERT_TRUE(r_input_file.is_error());
  auto error = r_input_file.move_as_error();
  ASSERT_EQ(mtlink::NetError::UploadFailed, error.code());
  ASSERT_EQ(1, mtlink::get_upload_failed_part(error));
  ASSERT_TRUE(mtlink::begins_with(error.message(), "UPLOAD_FAILED_1"));
  ASSERT_EQ(3, remote.get_part_request_count(1));
  ASSERT_EQ(0, remote.get_part_request_count(2));
}

TEST(Upload, permanent_part_rejection) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  UploadStats stats;
  auto options = get_upload_options();
  mtlink::Client client(&scheduler, create_factory(remote, options), options);

  mtlink::MemoryByteSource source("photo.jpg", make_data(2500));
  remote.fail_part(0, 1, 400, "FILE_PART_INVALID");
  auto r_input_file = run_upload(scheduler, client, source, &stats);
  ASSERT_TRUE(r_input_file.is_error());
  ASSERT_EQ(mtlink::ErrorKind::UploadFailed, mtlink::get_error_kind(r_input_file.error()));
  ASSERT_EQ(0, mtlink::get_upload_failed_part(r_input_file.error()));
  ASSERT_EQ(1, remote.get_part_request_count(0));
  ASSERT_EQ(0, stats.total_retries);
}

TEST(Upload, link_down_with_parts_in_flight) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  UploadStats stats;
  auto options = get_upload_options();
  options.small_file_workers = 3;
  mtlink::Client client(&scheduler, create_factory(remote, options), options);

  auto data = make_data(3000);
  mtlink::MemoryByteSource source("photo.jpg", data);
  remote.break_links_after_requests(3);
  auto r_input_file = run_upload(scheduler, client, source, &stats);
  ASSERT_TRUE(r_input_file.is_ok());
  ASSERT_EQ(3, r_input_file.ok().part_count);

  ASSERT_EQ(2, remote.get_connection_count());
  for (mtlink::int32 part_id = 0; part_id < 3; part_id++) {
    ASSERT_EQ(2, remote.get_part_request_count(part_id));
    ASSERT_EQ(1, stats.part_retries[part_id]);
  }
  ASSERT_EQ(3, stats.total_retries);
  ASSERT_TRUE(remote.get_saved_bytes() == data);
}

TEST(Upload, flood_wait_is_not_a_retry) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  UploadStats stats;
  auto options = get_upload_options();
  mtlink::Client client(&scheduler, create_factory(remote, options), options);

  mtlink::MemoryByteSource source("photo.jpg", make_data(1500));
  remote.add_flood_wait(4);
  auto start_time = mtlink::Time::now();
  auto r_input_file = run_upload(scheduler, client, source, &stats);
  ASSERT_TRUE(r_input_file.is_ok());
  ASSERT_TRUE(mtlink::Time::now() - start_time >= 4.0 - 1e-6);
  ASSERT_EQ(0, stats.total_retries);
  ASSERT_EQ(3, remote.get_request_count());
  ASSERT_EQ(1, remote.get_part_request_count(0));
  ASSERT_EQ(1, remote.get_part_request_count(1));
}

TEST(Upload, flood_waits_up_to_total_limit_with_default_options) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  mtlink::ClientOptions options;
  ASSERT_EQ(options.upload_part_timeout, options.retry_policy.max_total_flood_wait);
  mtlink::Client client(&scheduler, create_factory(remote, options), options);

  mtlink::MemoryByteSource source("photo.jpg", make_data(1000));
  remote.add_flood_wait(30);
  remote.add_flood_wait(30);
  auto start_time = mtlink::Time::now();
  auto r_input_file = run_upload(scheduler, client, source, nullptr);
  ASSERT_TRUE(r_input_file.is_ok());
  ASSERT_EQ(1, r_input_file.ok().part_count);
  ASSERT_TRUE(mtlink::Time::now() - start_time >= 60.0 - 1e-6);
  ASSERT_EQ(3, remote.get_request_count());
  ASSERT_EQ(1, remote.get_part_request_count(0));
}

TEST(Upload, concurrency_limit) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  auto options = get_upload_options();
  options.concurrency_limit = 2;
  options.pool_size = 2;
  options.small_file_workers = 6;
  mtlink::Client client(&scheduler, create_factory(remote, options), options);

  auto data = make_data(10 * 1024);
  mtlink::MemoryByteSource source("photo.jpg", data);
  remote.set_response_delay(1.0);
  auto r_input_file = run_upload(scheduler, client, source);
  ASSERT_TRUE(r_input_file.is_ok());
  ASSERT_EQ(10, r_input_file.ok().part_count);

  ASSERT_TRUE(remote.get_max_outstanding_count() <= 2);
  ASSERT_EQ(2, client.get_limiter().get_high_water_mark());
  ASSERT_EQ(0, client.get_limiter().get_in_use());
  ASSERT_TRUE(remote.get_saved_bytes() == data);
}

TEST(Upload, part_timeout) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  UploadStats stats;
  auto options = get_upload_options();
  options.upload_part_timeout = 3.0;
  options.retry_policy.max_attempts = 2;
  mtlink::Client client(&scheduler, create_factory(remote, options), options);

  mtlink::MemoryByteSource source("photo.jpg", make_data(100));
  remote.set_silent(true);
  auto r_input_file = run_upload(scheduler, client, source, &stats);
  ASSERT_TRUE(r_input_file.is_error());
  ASSERT_EQ(mtlink::NetError::UploadFailed, r_input_file.error().code());
  ASSERT_EQ(0, mtlink::get_upload_failed_part(r_input_file.error()));
  ASSERT_STREQ("UPLOAD_FAILED_0: TIMEOUT", r_input_file.error().message());
  ASSERT_EQ(1, stats.total_retries);
  ASSERT_EQ(2, remote.get_request_count());
  ASSERT_EQ(0u, client.get_dispatcher().get_pending_query_count());
}

TEST(Upload, false_part_answer) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  auto options = get_upload_options();
  options.retry_policy.max_attempts = 2;
  mtlink::Client client(&scheduler, create_factory(remote, options), options);

  mtlink::MemoryByteSource source("photo.jpg", make_data(100));
  remote.set_part_answer(false);
  auto r_input_file = run_upload(scheduler, client, source);
  ASSERT_TRUE(r_input_file.is_error());
  ASSERT_EQ(mtlink::NetError::UploadFailed, r_input_file.error().code());
  ASSERT_EQ(2, remote.get_part_request_count(0));
}

TEST(Upload, stream_of_unknown_size) {
  for (size_t size : {2500, 2048}) {
    mtlink::Scheduler scheduler;
    mtlink::FakeRemote remote(&scheduler);
    auto options = get_upload_options();
    mtlink::Client client(&scheduler, create_factory(remote, options), options);

    auto data = make_data(size);
    size_t position = 0;
    auto reader = [&data, &position](size_t max_size) -> mtlink::Result<mtlink::string> {
      auto chunk_size = mtlink::min(mtlink::min(max_size, static_cast<size_t>(700)), data.size() - position);
      auto chunk = data.substr(position, chunk_size);
      position += chunk_size;
      return std::move(chunk);
    };
    mtlink::StreamByteSource source("stream.bin", reader);
    auto r_input_file = run_upload(scheduler, client, source);
    ASSERT_TRUE(r_input_file.is_ok());
    auto input_file = r_input_file.move_as_ok();
    ASSERT_TRUE(input_file.is_big);
    ASSERT_EQ(3, input_file.part_count);
    ASSERT_TRUE(input_file.md5_checksum.empty());

    auto &parts = remote.get_parts();
    ASSERT_EQ(3u, parts.size());
    ASSERT_EQ(-1, parts.at(0).total_parts);
    ASSERT_EQ(-1, parts.at(1).total_parts);
    ASSERT_EQ(3, parts.at(2).total_parts);
    ASSERT_EQ(size - 2048, parts.at(2).bytes.size());
    ASSERT_TRUE(remote.get_saved_bytes() == data);
  }
}

TEST(Upload, source_shorter_than_declared) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  auto options = get_upload_options();
  mtlink::Client client(&scheduler, create_factory(remote, options), options);

  mtlink::MemoryByteSource source("photo.jpg", make_data(1000), 2000);
  auto r_input_file = run_upload(scheduler, client, source);
  ASSERT_TRUE(r_input_file.is_error());
  ASSERT_EQ(mtlink::NetError::SizeMismatch, r_input_file.error().code());
  ASSERT_EQ(0, remote.get_request_count());
}

TEST(Upload, source_longer_than_declared) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  auto options = get_upload_options();
  mtlink::Client client(&scheduler, create_factory(remote, options), options);

  mtlink::MemoryByteSource source("photo.jpg", make_data(3000), 2048);
  auto r_input_file = run_upload(scheduler, client, source);
  ASSERT_TRUE(r_input_file.is_error());
  ASSERT_EQ(mtlink::ErrorKind::SizeMismatch, mtlink::get_error_kind(r_input_file.error()));
  ASSERT_EQ(1, remote.get_request_count());
}

TEST(Upload, file_too_big) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  mtlink::ClientOptions options;
  mtlink::Client client(&scheduler, create_factory(remote, options), options);

  mtlink::MemoryByteSource source("huge.bin", "data", static_cast<mtlink::int64>(3) << 30);
  auto r_input_file = run_upload(scheduler, client, source);
  ASSERT_TRUE(r_input_file.is_error());
  ASSERT_EQ(400, r_input_file.error().code());
  ASSERT_STREQ("File is too big", r_input_file.error().message());
  ASSERT_EQ(0, remote.get_connection_count());
}

TEST(Upload, cancel) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  auto options = get_upload_options();
  mtlink::Client client(&scheduler, create_factory(remote, options), options);

  mtlink::MemoryByteSource source("photo.jpg", make_data(3000));
  remote.set_response_delay(10.0);
  bool is_finished = false;
  mtlink::Result<mtlink::InputFile> r_input_file;
  auto upload_id = client.upload(source, mtlink::PromiseCreator::lambda([&](mtlink::Result<mtlink::InputFile> result) {
                                   r_input_file = std::move(result);
                                   is_finished = true;
                                 }));
  ASSERT_TRUE(client.get_upload(upload_id) != nullptr);
  while (remote.get_request_count() == 0) {
    ASSERT_TRUE(scheduler.run_once());
  }
  client.cancel_upload(upload_id);
  ASSERT_TRUE(!is_finished);

  scheduler.run_until_idle();
  ASSERT_TRUE(is_finished);
  ASSERT_TRUE(r_input_file.is_error());
  ASSERT_EQ(mtlink::NetError::Canceled, r_input_file.error().code());
  ASSERT_STREQ("Upload canceled", r_input_file.error().message());
  ASSERT_EQ(1, remote.get_request_count());
  ASSERT_TRUE(client.get_upload(upload_id) == nullptr);
}

TEST(Upload, destroyed_client) {
  mtlink::Scheduler scheduler;
  mtlink::FakeRemote remote(&scheduler);
  auto options = get_upload_options();

  mtlink::MemoryByteSource source("photo.jpg", make_data(3000));
  remote.set_silent(true);
  bool is_finished = false;
  mtlink::Result<mtlink::InputFile> r_input_file;
  {
    mtlink::Client client(&scheduler, create_factory(remote, options), options);
    client.upload(source, mtlink::PromiseCreator::lambda([&](mtlink::Result<mtlink::InputFile> result) {
                    r_input_file = std::move(result);
                    is_finished = true;
                  }));
    while (remote.get_request_count() == 0) {
      ASSERT_TRUE(scheduler.run_once());
    }
  }
  ASSERT_TRUE(is_finished);
  ASSERT_TRUE(r_input_file.is_error());
  ASSERT_EQ(mtlink::NetError::Aborted, r_input_file.error().code());
  scheduler.run_until_idle();
}
