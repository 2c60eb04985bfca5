//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/files/PartsManager.h"

#include "mtlink/utils/format.h"
#include "mtlink/utils/logging.h"
#include "mtlink/utils/misc.h"

namespace mtlink {

int VERBOSITY_NAME(file_loader) = VERBOSITY_NAME(DEBUG);

Status PartsManager::init(const PartLayout &layout) {
  if (layout.part_size == 0) {
    return Status::Error("Invalid part size");
  }
  if (layout.max_part_count <= 0) {
    return Status::Error("Invalid part count limit");
  }
  part_size_ = layout.part_size;
  max_part_count_ = layout.max_part_count;
  ready_size_ = 0;
  ready_count_ = 0;
  pending_count_ = 0;
  first_empty_part_ = 0;
  if (layout.is_size_known()) {
    unknown_size_flag_ = false;
    size_ = layout.size;
    part_count_ = layout.part_count;
    LOG_CHECK(part_count_ >= 1) << layout;
  } else {
    unknown_size_flag_ = true;
    size_ = 0;
    part_count_ = 0;
  }
  part_status_ = vector<PartStatus>(part_count_);
  return Status::OK();
}

bool PartsManager::ready() const {
  VLOG(file_loader) << "Check readiness. Ready size is " << ready_size_ << ", total size is " << size_
                    << ", unknown_size_flag = " << unknown_size_flag_;
  return !unknown_size_flag_ && ready_count_ == part_count_;
}

Status PartsManager::finish() const {
  if (ready()) {
    return Status::OK();
  }
  return Status::Error("File transferring not finished");
}

void PartsManager::update_first_empty_part() {
  while (first_empty_part_ < part_count_ && part_status_[first_empty_part_] != PartStatus::Empty) {
    first_empty_part_++;
  }
}

Result<Part> PartsManager::start_part() {
  update_first_empty_part();
  auto part_id = first_empty_part_;
  if (part_id == part_count_) {
    if (!unknown_size_flag_) {
      return Part{-1, 0, 0};
    }
    if (part_count_ >= max_part_count_) {
      return Status::Error(400, "Too big file with unknown size");
    }
    part_count_++;
    part_status_.push_back(PartStatus::Empty);
  }

  CHECK(part_status_[part_id] == PartStatus::Empty);
  part_status_[part_id] = PartStatus::Pending;
  pending_count_++;
  return get_part(part_id);
}

Status PartsManager::set_terminal_part(int32 part_id, size_t size) {
  if (!unknown_size_flag_) {
    return Status::Error(PSLICE() << "Size is already known" << tag("part_id", part_id));
  }
  LOG_CHECK(part_id + 1 == part_count_) << part_id << ' ' << *this;
  if (size >= part_size_) {
    return Status::Error(PSLICE() << "Last part must be shorter than " << part_size_ << " bytes");
  }
  unknown_size_flag_ = false;
  size_ = static_cast<int64>(part_size_) * part_id + static_cast<int64>(size);
  VLOG(file_loader) << "File size is " << size_ << " bytes in " << part_count_ << " parts";
  return Status::OK();
}

Status PartsManager::on_part_ok(int32 part_id, size_t actual_size) {
  LOG_CHECK(0 <= part_id && static_cast<size_t>(part_id) < part_status_.size()) << part_id << ' ' << *this;
  if (part_status_[part_id] == PartStatus::Ready) {
    VLOG(file_loader) << "Ignore repeated acknowledgement of part " << part_id;
    return Status::OK();
  }
  if (part_status_[part_id] != PartStatus::Pending) {
    return Status::Error(PSLICE() << "Receive acknowledgement for not started part " << part_id);
  }

  if (!unknown_size_flag_ || part_id + 1 < part_count_) {
    auto part = get_part(part_id);
    if (actual_size != part.size) {
      auto status = Status::Error(PSLICE() << "Failed to transfer file: " << tag("size", size_)
                                           << tag("offset", part.offset) << tag("transferred size", actual_size)
                                           << tag("part size", part.size));
      LOG(ERROR) << status << ' ' << *this;
      return status;
    }
  }

  pending_count_--;
  part_status_[part_id] = PartStatus::Ready;
  ready_count_++;
  ready_size_ += narrow_cast<int64>(actual_size);

  VLOG(file_loader) << "Transferred part " << part_id << " of size " << actual_size
                    << ", total ready size = " << ready_size_;
  return Status::OK();
}

int64 PartsManager::get_size() const {
  if (unknown_size_flag_) {
    return -1;
  }
  return size_;
}

int64 PartsManager::get_ready_size() const {
  return ready_size_;
}

size_t PartsManager::get_part_size() const {
  return part_size_;
}

int32 PartsManager::get_part_count() const {
  return part_count_;
}

int32 PartsManager::get_ready_count() const {
  return ready_count_;
}

int32 PartsManager::get_pending_count() const {
  return pending_count_;
}

bool PartsManager::is_part_ready(int32 part_id) const {
  return 0 <= part_id && static_cast<size_t>(part_id) < part_status_.size() &&
         part_status_[part_id] == PartStatus::Ready;
}

Part PartsManager::get_part(int32 part_id) const {
  auto size = narrow_cast<int64>(part_size_);
  auto offset = size * part_id;
  if (!unknown_size_flag_) {
    if (size_ < offset) {
      size = 0;
    } else {
      size = min(size, size_ - offset);
    }
  }
  return Part{part_id, offset, static_cast<size_t>(size)};
}

StringBuilder &operator<<(StringBuilder &string_builder, const PartsManager &parts_manager) {
  return string_builder << "PartsManager[size = " << parts_manager.size_
                        << ", unknown_size = " << parts_manager.unknown_size_flag_
                        << ", ready_size = " << parts_manager.ready_size_
                        << ", part_size = " << parts_manager.part_size_
                        << ", part_count = " << parts_manager.part_count_
                        << ", ready_count = " << parts_manager.ready_count_
                        << ", pending_count = " << parts_manager.pending_count_
                        << ", first_empty_part = " << parts_manager.first_empty_part_ << ']';
}

}  // namespace mtlink
