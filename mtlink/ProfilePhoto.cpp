//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/ProfilePhoto.h"

#include "mtlink/Client.h"

#include "mtlink/api/Api.h"

#include "mtlink/files/InputFile.h"

#include "mtlink/utils/logging.h"
#include "mtlink/utils/Status.h"

namespace mtlink {

constexpr int32 BackgroundColors::DEFAULT_COLOR;

static constexpr size_t MAX_BACKGROUND_COLOR_COUNT = 4;

StringBuilder &operator<<(StringBuilder &string_builder, const ProfileMedia &media) {
  switch (media.get_type()) {
    case ProfileMedia::Type::None:
      return string_builder << "no media";
    case ProfileMedia::Type::Photo:
      return string_builder << "photo \"" << media.get_source()->get_name() << '"';
    case ProfileMedia::Type::Video:
      return string_builder << "video \"" << media.get_source()->get_name() << '"';
    default:
      UNREACHABLE();
      return string_builder;
  }
}

vector<int32> BackgroundColors::get_colors() const {
  if (colors_.empty()) {
    return {DEFAULT_COLOR};
  }
  return colors_;
}

static Status check_background_colors(const vector<int32> &colors) {
  if (colors.size() > MAX_BACKGROUND_COLOR_COUNT) {
    return Status::Error(400, "Too many background colors specified");
  }
  for (auto color : colors) {
    if (color < 0 || color > 0xFFFFFF) {
      return Status::Error(400, PSLICE() << "Invalid background color " << color);
    }
  }
  return Status::OK();
}

static void send_upload_profile_photo(Client &client, ProfileMedia::Type type, Result<InputFile> r_input_file,
                                      api::object_ptr<api::VideoSizeEmojiMarkup> emoji_markup, bool is_public,
                                      Promise<bool> promise) {
  int32 flags = 0;
  api::object_ptr<api::InputFile> file;
  api::object_ptr<api::InputFile> video;
  if (type != ProfileMedia::Type::None) {
    TRY_RESULT_PROMISE(promise, input_file, std::move(r_input_file));
    LOG(INFO) << "Uploaded profile media as " << input_file;
    if (type == ProfileMedia::Type::Photo) {
      flags |= api::UploadProfilePhoto::FILE_MASK;
      file = input_file.to_api();
    } else {
      flags |= api::UploadProfilePhoto::VIDEO_MASK;
      video = input_file.to_api();
    }
  }
  if (emoji_markup != nullptr) {
    flags |= api::UploadProfilePhoto::VIDEO_EMOJI_MARKUP_MASK;
  }

  api::UploadProfilePhoto request(flags, is_public, std::move(file), std::move(video), std::move(emoji_markup));
  client.invoke(request, PromiseCreator::lambda([promise = std::move(promise)](
                                                    Result<api::object_ptr<api::ProfilePhoto>> r_photo) mutable {
                  TRY_RESULT_PROMISE(promise, photo, std::move(r_photo));
                  if (photo == nullptr) {
                    return promise.set_error(Status::Error(500, "Receive no profile photo"));
                  }
                  LOG(INFO) << "Set profile photo " << photo->photo_id_;
                  promise.set_value(true);
                }));
}

void set_profile_photo(Client &client, ProfileMedia media, int64 emoji_id, BackgroundColors background_colors,
                       bool is_public, Promise<bool> promise) {
  if (media.empty() && emoji_id == 0) {
    return promise.set_error(Status::Error(400, "Profile photo must be non-empty"));
  }
  LOG(INFO) << "Set profile photo from " << media << " with emoji " << emoji_id << ", is_public = " << is_public;

  api::object_ptr<api::VideoSizeEmojiMarkup> emoji_markup;
  if (emoji_id != 0) {
    auto colors = background_colors.get_colors();
    TRY_STATUS_PROMISE(promise, check_background_colors(colors));
    emoji_markup = api::make_object<api::VideoSizeEmojiMarkup>(emoji_id, std::move(colors));
  }

  auto type = media.get_type();
  if (type == ProfileMedia::Type::None) {
    return send_upload_profile_photo(client, type, Result<InputFile>(), std::move(emoji_markup), is_public,
                                     std::move(promise));
  }

  auto *client_ptr = &client;
  client.upload(*media.get_source(),
                PromiseCreator::lambda([client_ptr, type, emoji_markup = std::move(emoji_markup), is_public,
                                        promise = std::move(promise)](Result<InputFile> r_input_file) mutable {
                  send_upload_profile_photo(*client_ptr, type, std::move(r_input_file), std::move(emoji_markup),
                                            is_public, std::move(promise));
                }));
}

}  // namespace mtlink
