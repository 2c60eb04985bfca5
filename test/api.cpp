//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/api/Api.h"
#include "mtlink/api/FunctionRegistry.h"
#include "mtlink/api/TlObject.h"

#include "mtlink/files/InputFile.h"

#include "mtlink/net/NetQuery.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/misc.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"
#include "mtlink/utils/StringBuilder.h"
#include "mtlink/utils/tests.h"
#include "mtlink/utils/tl_parsers.h"

TEST(Api, function_registry) {
  ASSERT_TRUE(mtlink::api::FunctionRegistry::is_known(mtlink::api::SaveFilePart::ID));
  ASSERT_TRUE(mtlink::api::FunctionRegistry::is_known(mtlink::api::SaveBigFilePart::ID));
  ASSERT_TRUE(mtlink::api::FunctionRegistry::is_known(mtlink::api::UploadProfilePhoto::ID));
  ASSERT_TRUE(!mtlink::api::FunctionRegistry::is_known(mtlink::api::ProfilePhoto::ID));
  ASSERT_STREQ("upload.saveBigFilePart",
               mtlink::api::FunctionRegistry::get_function_name(mtlink::api::SaveBigFilePart::ID));
  ASSERT_STREQ("unknown", mtlink::api::FunctionRegistry::get_function_name(0));
}

TEST(Api, fetch_function) {
  auto query = mtlink::api::serialize_object(mtlink::api::SaveBigFilePart(77, 5, 100, "bytes"));
  auto r_function = mtlink::api::FunctionRegistry::fetch_function(query);
  ASSERT_TRUE(r_function.is_ok());
  auto function = r_function.move_as_ok();
  ASSERT_EQ(mtlink::api::SaveBigFilePart::ID, function->get_id());
  auto &request = static_cast<const mtlink::api::SaveBigFilePart &>(*function);
  ASSERT_EQ(77, request.file_id_);
  ASSERT_EQ(5, request.file_part_);
  ASSERT_EQ(100, request.file_total_parts_);
  ASSERT_STREQ("bytes", request.bytes_);

  auto status = mtlink::api::FunctionRegistry::fetch_function(mtlink::Slice("ab")).move_as_error();
  ASSERT_EQ(400, status.code());
  ASSERT_STREQ("Request is too short", status.message());

  status = mtlink::api::FunctionRegistry::fetch_function(mtlink::api::serialize_object(mtlink::api::ProfilePhoto(1)))
               .move_as_error();
  ASSERT_EQ(400, status.code());
  ASSERT_TRUE(mtlink::begins_with(status.message(), "Unknown function"));

  auto truncated = query.substr(0, query.size() - 4);
  status = mtlink::api::FunctionRegistry::fetch_function(truncated).move_as_error();
  ASSERT_TRUE(mtlink::begins_with(status.message(), "Can't parse upload.saveBigFilePart"));

  ASSERT_TRUE(mtlink::api::FunctionRegistry::fetch_function(query + "tail").is_error());
}

TEST(Api, upload_profile_photo) {
  auto markup = mtlink::api::make_object<mtlink::api::VideoSizeEmojiMarkup>(
      12345, mtlink::vector<mtlink::int32>{0x112233, 0x445566, 0x778899});
  mtlink::api::UploadProfilePhoto request(
      mtlink::api::UploadProfilePhoto::VIDEO_MASK | mtlink::api::UploadProfilePhoto::VIDEO_EMOJI_MARKUP_MASK, true,
      nullptr, mtlink::api::make_object<mtlink::api::InputFileBig>(9, 12, "video.mp4"), std::move(markup));
  auto query = mtlink::api::serialize_object(request);

  auto r_function = mtlink::api::FunctionRegistry::fetch_function(query);
  ASSERT_TRUE(r_function.is_ok());
  auto function = r_function.move_as_ok();
  auto &parsed = static_cast<const mtlink::api::UploadProfilePhoto &>(*function);
  ASSERT_TRUE(parsed.fallback_);
  ASSERT_TRUE(parsed.file_ == nullptr);
  ASSERT_TRUE(parsed.video_ != nullptr);
  ASSERT_EQ(mtlink::api::InputFileBig::ID, parsed.video_->get_id());
  auto &video = static_cast<const mtlink::api::InputFileBig &>(*parsed.video_);
  ASSERT_EQ(9, video.id_);
  ASSERT_EQ(12, video.parts_);
  ASSERT_STREQ("video.mp4", video.name_);
  ASSERT_TRUE(parsed.video_emoji_markup_ != nullptr);
  ASSERT_EQ(12345, parsed.video_emoji_markup_->emoji_id_);
  ASSERT_EQ(3u, parsed.video_emoji_markup_->background_colors_.size());
  ASSERT_EQ(0x778899, parsed.video_emoji_markup_->background_colors_[2]);
  ASSERT_TRUE(query == mtlink::api::serialize_object(parsed));

  auto description = PSTRING() << parsed;
  ASSERT_TRUE(mtlink::begins_with(description, "photos.uploadProfilePhoto{"));
}

TEST(Api, fetch_result) {
  auto r_photo = mtlink::fetch_result<mtlink::api::UploadProfilePhoto>(
      mtlink::Result<mtlink::string>(mtlink::api::serialize_object(mtlink::api::ProfilePhoto(555))));
  ASSERT_TRUE(r_photo.is_ok());
  ASSERT_EQ(555, r_photo.ok()->photo_id_);

  auto r_ok = mtlink::fetch_result<mtlink::api::SaveFilePart>(mtlink::Slice("\xb5\x75\x72\x99", 4));
  ASSERT_TRUE(r_ok.is_ok());
  ASSERT_TRUE(r_ok.ok());

  r_ok = mtlink::fetch_result<mtlink::api::SaveFilePart>(mtlink::Slice("\x01\x02\x03\x04", 4));
  ASSERT_TRUE(r_ok.is_error());
  ASSERT_EQ(500, r_ok.error().code());

  r_ok = mtlink::fetch_result<mtlink::api::SaveFilePart>(
      mtlink::Result<mtlink::string>(mtlink::Status::Error(400, "FILE_PART_INVALID")));
  ASSERT_EQ(400, r_ok.error().code());
}

TEST(Api, input_file) {
  mtlink::InputFile input_file;
  input_file.file_id = 1234;
  input_file.part_count = 3;
  input_file.name = "photo.jpg";
  input_file.md5_checksum = "900150983cd24fb0d6963f7d28e17f72";

  auto small_file = input_file.to_api();
  ASSERT_EQ(mtlink::api::InputFileSmall::ID, small_file->get_id());
  auto &small = static_cast<const mtlink::api::InputFileSmall &>(*small_file);
  ASSERT_EQ(1234, small.id_);
  ASSERT_EQ(3, small.parts_);
  ASSERT_STREQ("photo.jpg", small.name_);
  ASSERT_STREQ(input_file.md5_checksum, small.md5_checksum_);

  input_file.is_big = true;
  input_file.md5_checksum.clear();
  auto big_file = input_file.to_api();
  ASSERT_EQ(mtlink::api::InputFileBig::ID, big_file->get_id());
  ASSERT_EQ(3, static_cast<const mtlink::api::InputFileBig &>(*big_file).parts_);
  ASSERT_STREQ("InputFile[id = 1234, parts = 3, name = \"photo.jpg\", big]", PSTRING() << input_file);
}
