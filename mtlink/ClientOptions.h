//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/net/RetryPolicy.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/OptionParser.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"
#include "mtlink/utils/StringBuilder.h"

namespace mtlink {

struct ClientOptions {
  int32 pool_size = 1;
  // maximum number of requests simultaneously sent over the pool
  int32 concurrency_limit = 8;
  int32 small_file_workers = 1;
  int32 big_file_workers = 4;
  // 0 if the part size must be chosen automatically
  size_t part_size = 0;
  bool is_premium = false;
  // 0 if unlimited
  double invoke_timeout = 60.0;
  double upload_part_timeout = 60.0;
  size_t gzip_threshold = 512;
  RetryPolicy retry_policy;

  // value is parsed according to the type of the option
  Status set_option(Slice name, Slice value) MTLINK_WARN_UNUSED_RESULT;

  Status validate() const MTLINK_WARN_UNUSED_RESULT;

  // registers every option as --<name> <value> and a final validation check
  void add_to(OptionParser &option_parser);

  static vector<Slice> get_option_names();
};

StringBuilder &operator<<(StringBuilder &string_builder, const ClientOptions &options);

}  // namespace mtlink
