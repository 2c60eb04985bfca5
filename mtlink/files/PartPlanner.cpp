//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/files/PartPlanner.h"

#include "mtlink/utils/logging.h"
#include "mtlink/utils/misc.h"

namespace mtlink {

constexpr int32 PartPlanner::MAX_PART_COUNT;
constexpr int32 PartPlanner::MAX_PART_COUNT_PREMIUM;
constexpr size_t PartPlanner::MIN_PART_SIZE;
constexpr size_t PartPlanner::MAX_PART_SIZE;
constexpr int64 PartPlanner::BIG_FILE_SIZE;

namespace {
int64 calc_part_count(int64 size, int64 part_size) {
  CHECK(part_size != 0);
  return (size + part_size - 1) / part_size;
}
}  // namespace

Part PartLayout::get_part(int32 part_id) const {
  CHECK(part_id >= 0);
  auto offset = static_cast<int64>(part_size) * part_id;
  if (!is_size_known()) {
    return Part{part_id, offset, part_size};
  }
  CHECK(part_id < part_count);
  auto part_size_int = static_cast<int64>(part_size);
  auto size_left = size - offset;
  return Part{part_id, offset, static_cast<size_t>(size_left < part_size_int ? size_left : part_size_int)};
}

StringBuilder &operator<<(StringBuilder &string_builder, const Part &part) {
  return string_builder << "Part[" << part.id << ", offset = " << part.offset << ", size = " << part.size << ']';
}

StringBuilder &operator<<(StringBuilder &string_builder, const PartLayout &layout) {
  return string_builder << "PartLayout[size = " << layout.size << ", part_size = " << layout.part_size
                        << ", part_count = " << layout.part_count
                        << ", max_part_count = " << layout.max_part_count << ", is_big = " << layout.is_big << ']';
}

bool PartPlanner::is_file_big(int64 size) {
  return size < 0 || size > BIG_FILE_SIZE;
}

int32 PartPlanner::get_max_part_count(bool is_premium) {
  return is_premium ? MAX_PART_COUNT_PREMIUM : MAX_PART_COUNT;
}

int64 PartPlanner::get_max_file_size(bool is_premium) {
  return static_cast<int64>(MAX_PART_SIZE) * get_max_part_count(is_premium);
}

Status PartPlanner::check_part_size(size_t part_size) {
  if (part_size == 0 || part_size % 1024 != 0 || MAX_PART_SIZE % part_size != 0) {
    return Status::Error(400, PSLICE() << "Invalid part size " << part_size);
  }
  return Status::OK();
}

Result<PartLayout> PartPlanner::plan(int64 size, size_t part_size_hint, bool is_premium) {
  if (part_size_hint != 0) {
    TRY_STATUS(check_part_size(part_size_hint));
  }

  PartLayout layout;
  layout.size = size;
  layout.max_part_count = get_max_part_count(is_premium);
  layout.is_big = is_file_big(size);
  if (size < 0) {
    layout.size = -1;
    layout.part_size = part_size_hint != 0 ? part_size_hint : static_cast<size_t>(MAX_PART_SIZE);
    layout.part_count = -1;
    return layout;
  }

  if (size > get_max_file_size(is_premium)) {
    return Status::Error(400, "File is too big");
  }

  auto max_part_count = layout.max_part_count;
  size_t part_size = part_size_hint != 0 ? part_size_hint : static_cast<size_t>(MIN_PART_SIZE);
  while (part_size < MAX_PART_SIZE && calc_part_count(size, static_cast<int64>(part_size)) > max_part_count) {
    part_size *= 2;
  }
  LOG_IF(INFO, part_size_hint != 0 && part_size != part_size_hint)
      << "Increase part size from " << part_size_hint << " to " << part_size << " for a file of size " << size;

  layout.part_size = part_size;
  layout.part_count = size == 0 ? 1 : narrow_cast<int32>(calc_part_count(size, static_cast<int64>(part_size)));
  CHECK(layout.part_count <= max_part_count);
  return layout;
}

}  // namespace mtlink
