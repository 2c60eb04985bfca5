//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/utils/common.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"
#include "mtlink/utils/StringBuilder.h"

namespace mtlink {

// a unit exchanged over a transport link
struct Frame {
  enum class Kind : int32 { Request = 1, Ack = 2, Result = 3, Error = 4, FloodWait = 5 };

  Kind kind = Kind::Request;
  uint64 correlation_id = 0;
  // assigned by the codec on the sending side
  uint32 seq_no = 0;

  int32 error_code = 0;
  string error_message;
  int32 flood_wait_seconds = 0;

  // serialized function for requests, serialized result for results
  string payload;

  static Frame request(uint64 correlation_id, string payload);
  static Frame ack(uint64 correlation_id);
  static Frame result(uint64 correlation_id, string payload);
  static Frame error(uint64 correlation_id, int32 error_code, Slice error_message);
  static Frame flood_wait(uint64 correlation_id, int32 seconds);

  bool is_final() const {
    return kind == Kind::Result || kind == Kind::Error || kind == Kind::FloodWait;
  }

  // error carried by an Error or FloodWait frame, OK for other frames
  Status as_status() const;
};

StringBuilder &operator<<(StringBuilder &string_builder, Frame::Kind kind);

StringBuilder &operator<<(StringBuilder &string_builder, const Frame &frame);

/*
 * Wire layout, all integers are little-endian:
 *   uint32 length         length of the whole frame including this field and the checksum
 *   uint32 seq_no         per-direction frame number, starts from 0
 *   uint64 correlation_id
 *   int32  kind
 *   int32  flags          bit 0: the payload is gzipped
 *   body                  TL-serialized, depends on the kind
 *   uint32 crc32          of all preceding bytes
 */
class FrameCodec {
 public:
  static constexpr size_t HEADER_SIZE = 24;
  static constexpr size_t MIN_FRAME_SIZE = HEADER_SIZE + 4;
  static constexpr size_t MAX_FRAME_SIZE = 1 << 24;
  static constexpr int32 GZIP_FLAG = 1;

  // payloads of at least gzip_threshold bytes are compressed if it saves space, 0 disables compression
  static Result<string> encode(const Frame &frame, uint32 seq_no, size_t gzip_threshold) MTLINK_WARN_UNUSED_RESULT;

  // packet must contain exactly one frame
  static Result<Frame> decode(Slice packet) MTLINK_WARN_UNUSED_RESULT;
};

// splits a byte stream into frames
class FrameParser {
 public:
  void append(Slice data);

  // returns 0 if a frame was parsed, the number of bytes needed for the next frame otherwise
  // an error means the stream is desynchronized and can't be used anymore
  Result<size_t> read_next(Frame &frame) MTLINK_WARN_UNUSED_RESULT;

  size_t get_buffered_size() const {
    return buffer_.size() - begin_pos_;
  }

 private:
  string buffer_;
  size_t begin_pos_ = 0;
};

}  // namespace mtlink
