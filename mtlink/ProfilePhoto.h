//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/files/ByteSource.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/Promise.h"
#include "mtlink/utils/StringBuilder.h"

namespace mtlink {

class Client;

// new profile photo or video; the source isn't owned and must outlive the request
class ProfileMedia {
 public:
  enum class Type : int32 { None, Photo, Video };

  ProfileMedia() = default;

  static ProfileMedia photo(ByteSource &source) {
    return ProfileMedia(Type::Photo, &source);
  }

  static ProfileMedia video(ByteSource &source) {
    return ProfileMedia(Type::Video, &source);
  }

  Type get_type() const {
    return type_;
  }

  bool empty() const {
    return type_ == Type::None;
  }

  ByteSource *get_source() const {
    return source_;
  }

 private:
  Type type_ = Type::None;
  ByteSource *source_ = nullptr;

  ProfileMedia(Type type, ByteSource *source) : type_(type), source_(source) {
  }
};

StringBuilder &operator<<(StringBuilder &string_builder, const ProfileMedia &media);

// background of an emoji profile photo, either one color or a gradient of up to 4 colors
class BackgroundColors {
 public:
  static constexpr int32 DEFAULT_COLOR = 0xFFFFFF;

  BackgroundColors() = default;

  BackgroundColors(int32 color) : colors_{color} {
  }

  BackgroundColors(vector<int32> colors) : colors_(std::move(colors)) {
  }

  // returns the default white background if no colors were specified
  vector<int32> get_colors() const;

 private:
  vector<int32> colors_;
};

// Uploads the media, if any, and sets it as the profile photo of the current user.
// If emoji_id is non-zero, the emoji on the given background is used as the animated photo.
// A public photo is shown to users, who can't see the main profile photo.
void set_profile_photo(Client &client, ProfileMedia media, int64 emoji_id, BackgroundColors background_colors,
                       bool is_public, Promise<bool> promise);

}  // namespace mtlink
