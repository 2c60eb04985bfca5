//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/net/Frame.h"

#include "mtlink/net/NetError.h"

#include "mtlink/utils/crypto.h"
#include "mtlink/utils/format.h"
#include "mtlink/utils/Gzip.h"
#include "mtlink/utils/logging.h"
#include "mtlink/utils/tl_parsers.h"
#include "mtlink/utils/tl_storers.h"

#include <cstring>

namespace mtlink {

namespace {

template <class T>
T read_as(const char *ptr) {
  T result;
  std::memcpy(&result, ptr, sizeof(T));
  return result;
}

class FrameBody {
 public:
  FrameBody(const Frame &frame, Slice payload) : frame_(frame), payload_(payload) {
  }

  template <class StorerT>
  void store(StorerT &storer) const {
    switch (frame_.kind) {
      case Frame::Kind::Request:
      case Frame::Kind::Result:
        storer.store_string(payload_);
        break;
      case Frame::Kind::Ack:
        break;
      case Frame::Kind::Error:
        storer.store_int(frame_.error_code);
        storer.store_string(Slice(frame_.error_message));
        break;
      case Frame::Kind::FloodWait:
        storer.store_int(frame_.flood_wait_seconds);
        break;
      default:
        UNREACHABLE();
    }
  }

 private:
  const Frame &frame_;
  Slice payload_;
};

bool is_valid_kind(int32 kind) {
  return static_cast<int32>(Frame::Kind::Request) <= kind && kind <= static_cast<int32>(Frame::Kind::FloodWait);
}

}  // namespace

constexpr size_t FrameCodec::HEADER_SIZE;
constexpr size_t FrameCodec::MIN_FRAME_SIZE;
constexpr size_t FrameCodec::MAX_FRAME_SIZE;
constexpr int32 FrameCodec::GZIP_FLAG;

Frame Frame::request(uint64 correlation_id, string payload) {
  Frame frame;
  frame.kind = Kind::Request;
  frame.correlation_id = correlation_id;
  frame.payload = std::move(payload);
  return frame;
}

Frame Frame::ack(uint64 correlation_id) {
  Frame frame;
  frame.kind = Kind::Ack;
  frame.correlation_id = correlation_id;
  return frame;
}

Frame Frame::result(uint64 correlation_id, string payload) {
  Frame frame;
  frame.kind = Kind::Result;
  frame.correlation_id = correlation_id;
  frame.payload = std::move(payload);
  return frame;
}

Frame Frame::error(uint64 correlation_id, int32 error_code, Slice error_message) {
  Frame frame;
  frame.kind = Kind::Error;
  frame.correlation_id = correlation_id;
  frame.error_code = error_code;
  frame.error_message = error_message.str();
  return frame;
}

Frame Frame::flood_wait(uint64 correlation_id, int32 seconds) {
  Frame frame;
  frame.kind = Kind::FloodWait;
  frame.correlation_id = correlation_id;
  frame.flood_wait_seconds = seconds;
  return frame;
}

Status Frame::as_status() const {
  switch (kind) {
    case Kind::Error:
      if (error_code == 0) {
        return Status::Error(500, error_message.empty() ? Slice("Unknown error") : Slice(error_message));
      }
      return Status::Error(error_code, error_message);
    case Kind::FloodWait:
      return flood_wait_error(flood_wait_seconds);
    default:
      return Status::OK();
  }
}

StringBuilder &operator<<(StringBuilder &string_builder, Frame::Kind kind) {
  switch (kind) {
    case Frame::Kind::Request:
      return string_builder << "Request";
    case Frame::Kind::Ack:
      return string_builder << "Ack";
    case Frame::Kind::Result:
      return string_builder << "Result";
    case Frame::Kind::Error:
      return string_builder << "Error";
    case Frame::Kind::FloodWait:
      return string_builder << "FloodWait";
    default:
      return string_builder << "Unknown" << static_cast<int32>(kind);
  }
}

StringBuilder &operator<<(StringBuilder &string_builder, const Frame &frame) {
  string_builder << "Frame[" << frame.kind << tag("id", frame.correlation_id) << tag("seq_no", frame.seq_no);
  switch (frame.kind) {
    case Frame::Kind::Request:
    case Frame::Kind::Result:
      string_builder << tag("size", frame.payload.size());
      break;
    case Frame::Kind::Error:
      string_builder << tag("code", frame.error_code) << tag("message", frame.error_message);
      break;
    case Frame::Kind::FloodWait:
      string_builder << tag("seconds", frame.flood_wait_seconds);
      break;
    default:
      break;
  }
  return string_builder << ']';
}

Result<string> FrameCodec::encode(const Frame &frame, uint32 seq_no, size_t gzip_threshold) {
  int32 flags = 0;
  string packed_payload;
  Slice payload = frame.payload;
  if (gzip_threshold != 0 && payload.size() >= gzip_threshold &&
      (frame.kind == Frame::Kind::Request || frame.kind == Frame::Kind::Result)) {
    packed_payload = gzencode(payload, 0.9);
    if (!packed_payload.empty()) {
      VLOG(DEBUG) << "Compress payload from " << payload.size() << " to " << packed_payload.size() << " bytes";
      payload = packed_payload;
      flags |= GZIP_FLAG;
    }
  }

  FrameBody body(frame, payload);
  TlStorerCalcLength calc_length;
  body.store(calc_length);
  size_t length = HEADER_SIZE + calc_length.get_length() + 4;
  if (length > MAX_FRAME_SIZE) {
    return Status::Error(400, PSLICE() << "Frame is too big: " << length << " bytes");
  }

  string result(length, '\0');
  TlStorerUnsafe storer(reinterpret_cast<unsigned char *>(&result[0]));
  storer.store_binary(static_cast<uint32>(length));
  storer.store_binary(seq_no);
  storer.store_binary(frame.correlation_id);
  storer.store_int(static_cast<int32>(frame.kind));
  storer.store_int(flags);
  body.store(storer);
  auto crc = crc32(Slice(result.data(), length - 4));
  storer.store_binary(crc);
  CHECK(storer.get_buf() == reinterpret_cast<unsigned char *>(&result[0]) + length);
  return std::move(result);
}

Result<Frame> FrameCodec::decode(Slice packet) {
  if (packet.size() < MIN_FRAME_SIZE || packet.size() > MAX_FRAME_SIZE || packet.size() % 4 != 0) {
    return Status::Error(PSLICE() << "Invalid frame length " << packet.size());
  }
  auto length = read_as<uint32>(packet.data());
  if (length != packet.size()) {
    return Status::Error(PSLICE() << "Frame length mismatch: " << length << " instead of " << packet.size());
  }
  auto expected_crc = read_as<uint32>(packet.end() - 4);
  auto crc = crc32(packet.substr(0, packet.size() - 4));
  if (crc != expected_crc) {
    return Status::Error(PSLICE() << "Frame checksum mismatch: " << crc << " instead of " << expected_crc);
  }

  Frame frame;
  frame.seq_no = read_as<uint32>(packet.data() + 4);
  frame.correlation_id = read_as<uint64>(packet.data() + 8);
  auto kind = read_as<int32>(packet.data() + 16);
  auto flags = read_as<int32>(packet.data() + 20);
  if (!is_valid_kind(kind)) {
    return Status::Error(PSLICE() << "Unknown frame kind " << kind);
  }
  if ((flags & ~GZIP_FLAG) != 0) {
    return Status::Error(PSLICE() << "Unknown frame flags " << flags);
  }
  frame.kind = static_cast<Frame::Kind>(kind);

  TlParser parser(packet.substr(HEADER_SIZE, packet.size() - HEADER_SIZE - 4));
  switch (frame.kind) {
    case Frame::Kind::Request:
    case Frame::Kind::Result:
      frame.payload = parser.fetch_string<string>();
      break;
    case Frame::Kind::Ack:
      break;
    case Frame::Kind::Error:
      frame.error_code = parser.fetch_int();
      frame.error_message = parser.fetch_string<string>();
      break;
    case Frame::Kind::FloodWait:
      frame.flood_wait_seconds = parser.fetch_int();
      break;
    default:
      UNREACHABLE();
  }
  parser.fetch_end();
  TRY_STATUS_PREFIX(parser.get_status(), PSLICE() << "Failed to parse " << frame.kind << " frame body: ");

  if ((flags & GZIP_FLAG) != 0) {
    if (frame.kind != Frame::Kind::Request && frame.kind != Frame::Kind::Result) {
      return Status::Error(PSLICE() << "Unexpected compressed " << frame.kind << " frame");
    }
    TRY_RESULT_PREFIX(payload, gzdecode(frame.payload), "Failed to decompress frame payload: ");
    frame.payload = std::move(payload);
  }
  return std::move(frame);
}

void FrameParser::append(Slice data) {
  if (begin_pos_ != 0 && begin_pos_ * 2 >= buffer_.size()) {
    buffer_.erase(0, begin_pos_);
    begin_pos_ = 0;
  }
  buffer_.append(data.begin(), data.size());
}

Result<size_t> FrameParser::read_next(Frame &frame) {
  size_t available = get_buffered_size();
  if (available < 4) {
    return FrameCodec::MIN_FRAME_SIZE;
  }
  auto length = static_cast<size_t>(read_as<uint32>(buffer_.data() + begin_pos_));
  if (length < FrameCodec::MIN_FRAME_SIZE || length > FrameCodec::MAX_FRAME_SIZE || length % 4 != 0) {
    return Status::Error(PSLICE() << "Receive frame with invalid length " << length);
  }
  if (available < length) {
    return length;
  }
  TRY_RESULT_ASSIGN(frame, FrameCodec::decode(Slice(buffer_.data() + begin_pos_, length)));
  begin_pos_ += length;
  if (begin_pos_ == buffer_.size()) {
    buffer_.clear();
    begin_pos_ = 0;
  }
  return 0;
}

}  // namespace mtlink
