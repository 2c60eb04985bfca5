//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/api/Api.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/StringBuilder.h"

namespace mtlink {

// result of a finished upload
struct InputFile {
  int64 file_id = 0;
  int32 part_count = 0;
  string name;
  // hex-encoded MD5 of the content, empty for big files
  string md5_checksum;
  bool is_big = false;

  api::object_ptr<api::InputFile> to_api() const;
};

StringBuilder &operator<<(StringBuilder &string_builder, const InputFile &input_file);

}  // namespace mtlink
