//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/files/PartPlanner.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/Status.h"
#include "mtlink/utils/StringBuilder.h"

namespace mtlink {

extern int VERBOSITY_NAME(file_loader);

// tracks which parts of one upload are started and acknowledged
class PartsManager {
 public:
  Status init(const PartLayout &layout) MTLINK_WARN_UNUSED_RESULT;

  bool ready() const;
  Status finish() const MTLINK_WARN_UNUSED_RESULT;

  // returns empty part with id -1 if nothing to return
  Result<Part> start_part() MTLINK_WARN_UNUSED_RESULT;

  // acknowledging an already acknowledged part is a no-op
  Status on_part_ok(int32 part_id, size_t actual_size) MTLINK_WARN_UNUSED_RESULT;

  // for unknown size, marks the part with the short read as the last one
  Status set_terminal_part(int32 part_id, size_t size) MTLINK_WARN_UNUSED_RESULT;

  bool is_size_known() const {
    return !unknown_size_flag_;
  }
  // -1 if unknown
  int64 get_size() const;
  int64 get_ready_size() const;
  size_t get_part_size() const;
  // number of parts known so far
  int32 get_part_count() const;
  int32 get_ready_count() const;
  int32 get_pending_count() const;
  bool is_part_ready(int32 part_id) const;

  Part get_part(int32 part_id) const;

 private:
  enum class PartStatus : int32 { Empty, Pending, Ready };

  int64 size_{0};
  bool unknown_size_flag_{false};
  int64 ready_size_{0};

  size_t part_size_{0};
  int32 part_count_{0};
  int32 max_part_count_{0};
  int32 ready_count_{0};
  int32 pending_count_{0};
  int32 first_empty_part_{0};
  vector<PartStatus> part_status_;

  void update_first_empty_part();

  friend StringBuilder &operator<<(StringBuilder &string_builder, const PartsManager &parts_manager);
};

StringBuilder &operator<<(StringBuilder &string_builder, const PartsManager &parts_manager);

}  // namespace mtlink
