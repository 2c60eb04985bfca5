//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/files/InputFile.h"

namespace mtlink {

api::object_ptr<api::InputFile> InputFile::to_api() const {
  if (is_big) {
    return api::make_object<api::InputFileBig>(file_id, part_count, name);
  }
  return api::make_object<api::InputFileSmall>(file_id, part_count, name, md5_checksum);
}

StringBuilder &operator<<(StringBuilder &string_builder, const InputFile &input_file) {
  string_builder << "InputFile[id = " << input_file.file_id << ", parts = " << input_file.part_count << ", name = \""
                 << input_file.name << '"';
  if (input_file.is_big) {
    string_builder << ", big";
  } else {
    string_builder << ", md5 = " << input_file.md5_checksum;
  }
  return string_builder << ']';
}

}  // namespace mtlink
