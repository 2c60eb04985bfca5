//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/utils/common.h"
#include "mtlink/utils/Status.h"
#include "mtlink/utils/StringBuilder.h"

namespace mtlink {

struct Part {
  int32 id;
  int64 offset;
  size_t size;
};

StringBuilder &operator<<(StringBuilder &string_builder, const Part &part);

struct PartLayout {
  // -1 if unknown
  int64 size = 0;
  size_t part_size = 0;
  // -1 if unknown, the last part is recognized by a short read
  int32 part_count = 0;
  // the upper limit on the number of parts in an upload
  int32 max_part_count = 0;
  bool is_big = false;

  bool is_size_known() const {
    return size >= 0;
  }

  // for unknown size returns the maximum range of the part
  Part get_part(int32 part_id) const;
};

StringBuilder &operator<<(StringBuilder &string_builder, const PartLayout &layout);

class PartPlanner {
 public:
  static constexpr int32 MAX_PART_COUNT = 4000;
  static constexpr int32 MAX_PART_COUNT_PREMIUM = 8000;
  static constexpr size_t MIN_PART_SIZE = 64 << 10;
  static constexpr size_t MAX_PART_SIZE = 512 << 10;
  static constexpr int64 BIG_FILE_SIZE = 10 << 20;

  // size is -1 if unknown, part_size_hint is 0 if the part size must be chosen automatically
  static Result<PartLayout> plan(int64 size, size_t part_size_hint, bool is_premium) MTLINK_WARN_UNUSED_RESULT;

  static bool is_file_big(int64 size);

  static int32 get_max_part_count(bool is_premium);

  static int64 get_max_file_size(bool is_premium);

  static Status check_part_size(size_t part_size) MTLINK_WARN_UNUSED_RESULT;
};

}  // namespace mtlink
