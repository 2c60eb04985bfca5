//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/api/Api.h"

#include "mtlink/utils/logging.h"

namespace mtlink {
namespace api {

object_ptr<InputFile> InputFile::fetch(TlParser &p) {
  auto constructor_id = p.fetch_int();
  switch (constructor_id) {
    case InputFileSmall::ID:
      return InputFileSmall::fetch_bare(p);
    case InputFileBig::ID:
      return InputFileBig::fetch_bare(p);
    default:
      p.set_error("Unknown constructor found");
      return nullptr;
  }
}

const int32 InputFileSmall::ID;

InputFileSmall::InputFileSmall(int64 id, int32 parts, string name, string md5_checksum)
    : id_(id), parts_(parts), name_(std::move(name)), md5_checksum_(std::move(md5_checksum)) {
}

object_ptr<InputFileSmall> InputFileSmall::fetch_bare(TlParser &p) {
  auto id = p.fetch_long();
  auto parts = p.fetch_int();
  auto name = p.fetch_string<string>();
  auto md5_checksum = p.fetch_string<string>();
  return make_object<InputFileSmall>(id, parts, std::move(name), std::move(md5_checksum));
}

template <class StorerT>
void InputFileSmall::store_impl(StorerT &s) const {
  s.store_int(ID);
  s.store_long(id_);
  s.store_int(parts_);
  s.store_string(name_);
  s.store_string(md5_checksum_);
}

void InputFileSmall::store(TlStorerCalcLength &s) const {
  store_impl(s);
}

void InputFileSmall::store(TlStorerUnsafe &s) const {
  store_impl(s);
}

void InputFileSmall::print(StringBuilder &sb) const {
  sb << "inputFile{id = " << id_ << ", parts = " << parts_ << ", name = \"" << name_ << "\", md5_checksum = \""
     << md5_checksum_ << "\"}";
}

const int32 InputFileBig::ID;

InputFileBig::InputFileBig(int64 id, int32 parts, string name) : id_(id), parts_(parts), name_(std::move(name)) {
}

object_ptr<InputFileBig> InputFileBig::fetch_bare(TlParser &p) {
  auto id = p.fetch_long();
  auto parts = p.fetch_int();
  auto name = p.fetch_string<string>();
  return make_object<InputFileBig>(id, parts, std::move(name));
}

template <class StorerT>
void InputFileBig::store_impl(StorerT &s) const {
  s.store_int(ID);
  s.store_long(id_);
  s.store_int(parts_);
  s.store_string(name_);
}

void InputFileBig::store(TlStorerCalcLength &s) const {
  store_impl(s);
}

void InputFileBig::store(TlStorerUnsafe &s) const {
  store_impl(s);
}

void InputFileBig::print(StringBuilder &sb) const {
  sb << "inputFileBig{id = " << id_ << ", parts = " << parts_ << ", name = \"" << name_ << "\"}";
}

const int32 VideoSizeEmojiMarkup::ID;

VideoSizeEmojiMarkup::VideoSizeEmojiMarkup(int64 emoji_id, vector<int32> background_colors)
    : emoji_id_(emoji_id), background_colors_(std::move(background_colors)) {
}

object_ptr<VideoSizeEmojiMarkup> VideoSizeEmojiMarkup::fetch(TlParser &p) {
  if (p.fetch_int() != ID) {
    p.set_error("Unexpected constructor identifier");
    return nullptr;
  }
  auto emoji_id = p.fetch_long();
  auto background_colors = detail::fetch_int_vector(p);
  return make_object<VideoSizeEmojiMarkup>(emoji_id, std::move(background_colors));
}

template <class StorerT>
void VideoSizeEmojiMarkup::store_impl(StorerT &s) const {
  s.store_int(ID);
  s.store_long(emoji_id_);
  detail::store_int_vector(background_colors_, s);
}

void VideoSizeEmojiMarkup::store(TlStorerCalcLength &s) const {
  store_impl(s);
}

void VideoSizeEmojiMarkup::store(TlStorerUnsafe &s) const {
  store_impl(s);
}

void VideoSizeEmojiMarkup::print(StringBuilder &sb) const {
  sb << "videoSizeEmojiMarkup{emoji_id = " << emoji_id_ << ", background_colors = " << background_colors_ << "}";
}

const int32 ProfilePhoto::ID;

ProfilePhoto::ProfilePhoto(int64 photo_id) : photo_id_(photo_id) {
}

object_ptr<ProfilePhoto> ProfilePhoto::fetch(TlParser &p) {
  if (p.fetch_int() != ID) {
    p.set_error("Unexpected constructor identifier");
    return nullptr;
  }
  return make_object<ProfilePhoto>(p.fetch_long());
}

template <class StorerT>
void ProfilePhoto::store_impl(StorerT &s) const {
  s.store_int(ID);
  s.store_long(photo_id_);
}

void ProfilePhoto::store(TlStorerCalcLength &s) const {
  store_impl(s);
}

void ProfilePhoto::store(TlStorerUnsafe &s) const {
  store_impl(s);
}

void ProfilePhoto::print(StringBuilder &sb) const {
  sb << "photos.photo{photo_id = " << photo_id_ << "}";
}

const int32 SaveFilePart::ID;

SaveFilePart::SaveFilePart(int64 file_id, int32 file_part, string bytes)
    : file_id_(file_id), file_part_(file_part), bytes_(std::move(bytes)) {
}

object_ptr<SaveFilePart> SaveFilePart::fetch_bare(TlParser &p) {
  auto file_id = p.fetch_long();
  auto file_part = p.fetch_int();
  auto bytes = p.fetch_string<string>();
  return make_object<SaveFilePart>(file_id, file_part, std::move(bytes));
}

template <class StorerT>
void SaveFilePart::store_impl(StorerT &s) const {
  s.store_int(ID);
  s.store_long(file_id_);
  s.store_int(file_part_);
  s.store_string(bytes_);
}

void SaveFilePart::store(TlStorerCalcLength &s) const {
  store_impl(s);
}

void SaveFilePart::store(TlStorerUnsafe &s) const {
  store_impl(s);
}

void SaveFilePart::print(StringBuilder &sb) const {
  sb << "upload.saveFilePart{file_id = " << file_id_ << ", file_part = " << file_part_
     << ", bytes = " << bytes_.size() << " bytes}";
}

SaveFilePart::ReturnType SaveFilePart::fetch_result(TlParser &p) {
  return p.fetch_bool();
}

const int32 SaveBigFilePart::ID;

SaveBigFilePart::SaveBigFilePart(int64 file_id, int32 file_part, int32 file_total_parts, string bytes)
    : file_id_(file_id), file_part_(file_part), file_total_parts_(file_total_parts), bytes_(std::move(bytes)) {
}

object_ptr<SaveBigFilePart> SaveBigFilePart::fetch_bare(TlParser &p) {
  auto file_id = p.fetch_long();
  auto file_part = p.fetch_int();
  auto file_total_parts = p.fetch_int();
  auto bytes = p.fetch_string<string>();
  return make_object<SaveBigFilePart>(file_id, file_part, file_total_parts, std::move(bytes));
}

template <class StorerT>
void SaveBigFilePart::store_impl(StorerT &s) const {
  s.store_int(ID);
  s.store_long(file_id_);
  s.store_int(file_part_);
  s.store_int(file_total_parts_);
  s.store_string(bytes_);
}

void SaveBigFilePart::store(TlStorerCalcLength &s) const {
  store_impl(s);
}

void SaveBigFilePart::store(TlStorerUnsafe &s) const {
  store_impl(s);
}

void SaveBigFilePart::print(StringBuilder &sb) const {
  sb << "upload.saveBigFilePart{file_id = " << file_id_ << ", file_part = " << file_part_
     << ", file_total_parts = " << file_total_parts_ << ", bytes = " << bytes_.size() << " bytes}";
}

SaveBigFilePart::ReturnType SaveBigFilePart::fetch_result(TlParser &p) {
  return p.fetch_bool();
}

const int32 UploadProfilePhoto::ID;

UploadProfilePhoto::UploadProfilePhoto(int32 flags, bool fallback, object_ptr<InputFile> file,
                                       object_ptr<InputFile> video,
                                       object_ptr<VideoSizeEmojiMarkup> video_emoji_markup)
    : flags_(flags)
    , fallback_(fallback)
    , file_(std::move(file))
    , video_(std::move(video))
    , video_emoji_markup_(std::move(video_emoji_markup)) {
}

object_ptr<UploadProfilePhoto> UploadProfilePhoto::fetch_bare(TlParser &p) {
  auto flags = p.fetch_int();
  if (flags < 0) {
    p.set_error("Variable of type # can't be negative");
    return nullptr;
  }
  bool fallback = (flags & FALLBACK_MASK) != 0;
  object_ptr<InputFile> file;
  object_ptr<InputFile> video;
  object_ptr<VideoSizeEmojiMarkup> video_emoji_markup;
  if (flags & FILE_MASK) {
    file = InputFile::fetch(p);
  }
  if (flags & VIDEO_MASK) {
    video = InputFile::fetch(p);
  }
  if (flags & VIDEO_EMOJI_MARKUP_MASK) {
    video_emoji_markup = VideoSizeEmojiMarkup::fetch(p);
  }
  if (p.get_error() != nullptr) {
    return nullptr;
  }
  return make_object<UploadProfilePhoto>(flags, fallback, std::move(file), std::move(video),
                                         std::move(video_emoji_markup));
}

template <class StorerT>
void UploadProfilePhoto::store_impl(StorerT &s) const {
  int32 flags = flags_;
  if (fallback_) {
    flags |= FALLBACK_MASK;
  }
  s.store_int(ID);
  s.store_int(flags);
  if (flags & FILE_MASK) {
    CHECK(file_ != nullptr);
    file_->store(s);
  }
  if (flags & VIDEO_MASK) {
    CHECK(video_ != nullptr);
    video_->store(s);
  }
  if (flags & VIDEO_EMOJI_MARKUP_MASK) {
    CHECK(video_emoji_markup_ != nullptr);
    video_emoji_markup_->store(s);
  }
}

void UploadProfilePhoto::store(TlStorerCalcLength &s) const {
  store_impl(s);
}

void UploadProfilePhoto::store(TlStorerUnsafe &s) const {
  store_impl(s);
}

void UploadProfilePhoto::print(StringBuilder &sb) const {
  sb << "photos.uploadProfilePhoto{flags = " << flags_ << ", fallback = " << fallback_;
  if (file_ != nullptr) {
    sb << ", file = " << *file_;
  }
  if (video_ != nullptr) {
    sb << ", video = " << *video_;
  }
  if (video_emoji_markup_ != nullptr) {
    sb << ", video_emoji_markup = " << *video_emoji_markup_;
  }
  sb << "}";
}

UploadProfilePhoto::ReturnType UploadProfilePhoto::fetch_result(TlParser &p) {
  return ProfilePhoto::fetch(p);
}

}  // namespace api
}  // namespace mtlink
