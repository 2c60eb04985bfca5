//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/api/TlObject.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/StringBuilder.h"
#include "mtlink/utils/tl_parsers.h"
#include "mtlink/utils/tl_storers.h"

namespace mtlink {
namespace api {

// a file uploaded with save-part requests, referenced by later requests
class InputFile : public Object {
 public:
  static object_ptr<InputFile> fetch(TlParser &p);
};

// a file uploaded with SaveFilePart
class InputFileSmall final : public InputFile {
 public:
  int64 id_;
  int32 parts_;
  string name_;
  string md5_checksum_;

  InputFileSmall(int64 id, int32 parts, string name, string md5_checksum);

  static const int32 ID = static_cast<int32>(0xf52ff27f);
  int32 get_id() const final {
    return ID;
  }

  static object_ptr<InputFileSmall> fetch_bare(TlParser &p);

  void store(TlStorerCalcLength &s) const final;
  void store(TlStorerUnsafe &s) const final;
  void print(StringBuilder &sb) const final;

 private:
  template <class StorerT>
  void store_impl(StorerT &s) const;
};

// a file uploaded with SaveBigFilePart
class InputFileBig final : public InputFile {
 public:
  int64 id_;
  int32 parts_;
  string name_;

  InputFileBig(int64 id, int32 parts, string name);

  static const int32 ID = static_cast<int32>(0xfa4f0bb5);
  int32 get_id() const final {
    return ID;
  }

  static object_ptr<InputFileBig> fetch_bare(TlParser &p);

  void store(TlStorerCalcLength &s) const final;
  void store(TlStorerUnsafe &s) const final;
  void print(StringBuilder &sb) const final;

 private:
  template <class StorerT>
  void store_impl(StorerT &s) const;
};

// animated emoji shown instead of a profile video
class VideoSizeEmojiMarkup final : public Object {
 public:
  int64 emoji_id_;
  vector<int32> background_colors_;

  VideoSizeEmojiMarkup(int64 emoji_id, vector<int32> background_colors);

  static const int32 ID = static_cast<int32>(0xf85c413c);
  int32 get_id() const final {
    return ID;
  }

  static object_ptr<VideoSizeEmojiMarkup> fetch(TlParser &p);

  void store(TlStorerCalcLength &s) const final;
  void store(TlStorerUnsafe &s) const final;
  void print(StringBuilder &sb) const final;

 private:
  template <class StorerT>
  void store_impl(StorerT &s) const;
};

// result of UploadProfilePhoto, reduced to the identifier of the new photo
class ProfilePhoto final : public Object {
 public:
  int64 photo_id_;

  explicit ProfilePhoto(int64 photo_id);

  static const int32 ID = static_cast<int32>(0x20212ca8);
  int32 get_id() const final {
    return ID;
  }

  static object_ptr<ProfilePhoto> fetch(TlParser &p);

  void store(TlStorerCalcLength &s) const final;
  void store(TlStorerUnsafe &s) const final;
  void print(StringBuilder &sb) const final;

 private:
  template <class StorerT>
  void store_impl(StorerT &s) const;
};

class SaveFilePart final : public Function {
 public:
  int64 file_id_;
  int32 file_part_;
  string bytes_;

  SaveFilePart(int64 file_id, int32 file_part, string bytes);

  static const int32 ID = static_cast<int32>(0xb304a621);
  int32 get_id() const final {
    return ID;
  }

  static object_ptr<SaveFilePart> fetch_bare(TlParser &p);

  void store(TlStorerCalcLength &s) const final;
  void store(TlStorerUnsafe &s) const final;
  void print(StringBuilder &sb) const final;

  using ReturnType = bool;
  static ReturnType fetch_result(TlParser &p);

 private:
  template <class StorerT>
  void store_impl(StorerT &s) const;
};

class SaveBigFilePart final : public Function {
 public:
  int64 file_id_;
  int32 file_part_;
  // -1 while the total number of parts is unknown
  int32 file_total_parts_;
  string bytes_;

  SaveBigFilePart(int64 file_id, int32 file_part, int32 file_total_parts, string bytes);

  static const int32 ID = static_cast<int32>(0xde7b673d);
  int32 get_id() const final {
    return ID;
  }

  static object_ptr<SaveBigFilePart> fetch_bare(TlParser &p);

  void store(TlStorerCalcLength &s) const final;
  void store(TlStorerUnsafe &s) const final;
  void print(StringBuilder &sb) const final;

  using ReturnType = bool;
  static ReturnType fetch_result(TlParser &p);

 private:
  template <class StorerT>
  void store_impl(StorerT &s) const;
};

class UploadProfilePhoto final : public Function {
 public:
  enum Flags : int32 { FILE_MASK = 1, VIDEO_MASK = 2, FALLBACK_MASK = 8, VIDEO_EMOJI_MARKUP_MASK = 16 };

  int32 flags_;
  bool fallback_;
  object_ptr<InputFile> file_;
  object_ptr<InputFile> video_;
  object_ptr<VideoSizeEmojiMarkup> video_emoji_markup_;

  UploadProfilePhoto(int32 flags, bool fallback, object_ptr<InputFile> file, object_ptr<InputFile> video,
                     object_ptr<VideoSizeEmojiMarkup> video_emoji_markup);

  static const int32 ID = static_cast<int32>(0x0388a3b5);
  int32 get_id() const final {
    return ID;
  }

  static object_ptr<UploadProfilePhoto> fetch_bare(TlParser &p);

  void store(TlStorerCalcLength &s) const final;
  void store(TlStorerUnsafe &s) const final;
  void print(StringBuilder &sb) const final;

  using ReturnType = object_ptr<ProfilePhoto>;
  static ReturnType fetch_result(TlParser &p);

 private:
  template <class StorerT>
  void store_impl(StorerT &s) const;
};

}  // namespace api
}  // namespace mtlink
