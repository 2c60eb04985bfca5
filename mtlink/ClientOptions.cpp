//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/ClientOptions.h"

#include "mtlink/files/PartPlanner.h"

#include "mtlink/utils/logging.h"
#include "mtlink/utils/misc.h"

namespace mtlink {

namespace {

struct OptionInfo {
  const char *name;
  const char *description;
};

const OptionInfo OPTIONS[] = {
    {"pool_size", "number of connections in the pool"},
    {"concurrency_limit", "maximum number of simultaneously sent requests"},
    {"small_file_workers", "number of simultaneously uploaded parts of a small file"},
    {"big_file_workers", "number of simultaneously uploaded parts of a big file"},
    {"part_size", "upload part size in bytes, 0 to choose automatically"},
    {"is_premium", "use the limits of a premium account"},
    {"invoke_timeout", "timeout of a request in seconds, 0 if unlimited"},
    {"upload_part_timeout", "timeout of an upload part request in seconds, 0 if unlimited"},
    {"gzip_threshold", "minimum size of a payload to be packed with gzip"},
    {"max_attempts", "maximum number of attempts for transient failures"},
    {"initial_backoff", "delay before the first retry in seconds"},
    {"backoff_multiplier", "multiplier of the delay between retries"},
    {"max_backoff", "maximum delay between retries in seconds"},
    {"max_flood_wait_count", "maximum number of flood waits of a request"},
    {"max_total_flood_wait", "maximum total flood wait of a request in seconds"},
    {"retryable_codes", "comma-separated list of additional retryable error codes"}};

Status invalid_value_error(Slice name, Slice value, const Status &error) {
  return Status::Error(400, PSLICE() << "Invalid value \"" << value << "\" of option \"" << name
                                     << "\": " << error.message());
}

template <class T>
Status parse_integer(Slice name, Slice value, T &result) {
  auto r_value = to_integer_safe<T>(trim(value));
  if (r_value.is_error()) {
    return invalid_value_error(name, value, r_value.error());
  }
  result = r_value.move_as_ok();
  return Status::OK();
}

Status parse_double(Slice name, Slice value, double &result) {
  auto r_value = to_double_safe(value);
  if (r_value.is_error()) {
    return invalid_value_error(name, value, r_value.error());
  }
  result = r_value.move_as_ok();
  return Status::OK();
}

Status parse_bool(Slice name, Slice value, bool &result) {
  auto str = to_lower(trim(value));
  if (str == "true" || str == "1") {
    result = true;
  } else if (str == "false" || str == "0") {
    result = false;
  } else {
    return invalid_value_error(name, value, Status::Error("Expected true or false"));
  }
  return Status::OK();
}

Status parse_codes(Slice name, Slice value, vector<int32> &result) {
  vector<int32> codes;
  if (!trim(value).empty()) {
    for (auto &code_str : full_split(value, ',')) {
      int32 code = 0;
      TRY_STATUS(parse_integer(name, code_str, code));
      codes.push_back(code);
    }
  }
  result = std::move(codes);
  return Status::OK();
}

}  // namespace

Status ClientOptions::set_option(Slice name, Slice value) {
  if (name == "pool_size") {
    return parse_integer(name, value, pool_size);
  }
  if (name == "concurrency_limit") {
    return parse_integer(name, value, concurrency_limit);
  }
  if (name == "small_file_workers") {
    return parse_integer(name, value, small_file_workers);
  }
  if (name == "big_file_workers") {
    return parse_integer(name, value, big_file_workers);
  }
  if (name == "part_size") {
    return parse_integer(name, value, part_size);
  }
  if (name == "is_premium") {
    return parse_bool(name, value, is_premium);
  }
  if (name == "invoke_timeout") {
    return parse_double(name, value, invoke_timeout);
  }
  if (name == "upload_part_timeout") {
    return parse_double(name, value, upload_part_timeout);
  }
  if (name == "gzip_threshold") {
    return parse_integer(name, value, gzip_threshold);
  }
  if (name == "max_attempts") {
    return parse_integer(name, value, retry_policy.max_attempts);
  }
  if (name == "initial_backoff") {
    return parse_double(name, value, retry_policy.initial_backoff);
  }
  if (name == "backoff_multiplier") {
    return parse_double(name, value, retry_policy.backoff_multiplier);
  }
  if (name == "max_backoff") {
    return parse_double(name, value, retry_policy.max_backoff);
  }
  if (name == "max_flood_wait_count") {
    return parse_integer(name, value, retry_policy.max_flood_wait_count);
  }
  if (name == "max_total_flood_wait") {
    return parse_double(name, value, retry_policy.max_total_flood_wait);
  }
  if (name == "retryable_codes") {
    return parse_codes(name, value, retry_policy.retryable_codes);
  }
  return Status::Error(400, PSLICE() << "Unknown option \"" << name << '"');
}

Status ClientOptions::validate() const {
  if (pool_size <= 0) {
    return Status::Error(400, "Pool size must be positive");
  }
  if (concurrency_limit <= 0) {
    return Status::Error(400, "Concurrency limit must be positive");
  }
  if (small_file_workers <= 0 || big_file_workers <= 0) {
    return Status::Error(400, "Number of upload workers must be positive");
  }
  if (part_size != 0) {
    TRY_STATUS(PartPlanner::check_part_size(part_size));
  }
  if (invoke_timeout < 0 || upload_part_timeout < 0) {
    return Status::Error(400, "Timeout can't be negative");
  }
  TRY_STATUS(retry_policy.validate());
  return Status::OK();
}

void ClientOptions::add_to(OptionParser &option_parser) {
  for (auto &option : OPTIONS) {
    Slice name = option.name;
    option_parser.add_checked_option('\0', name, option.description,
                                     [this, name](Slice value) { return set_option(name, value); });
  }
  option_parser.add_check([this] { return validate(); });
}

vector<Slice> ClientOptions::get_option_names() {
  vector<Slice> result;
  for (auto &option : OPTIONS) {
    result.push_back(Slice(option.name));
  }
  return result;
}

StringBuilder &operator<<(StringBuilder &string_builder, const ClientOptions &options) {
  return string_builder << "ClientOptions[pool_size = " << options.pool_size
                        << ", concurrency_limit = " << options.concurrency_limit
                        << ", small_file_workers = " << options.small_file_workers
                        << ", big_file_workers = " << options.big_file_workers
                        << ", part_size = " << options.part_size << ", is_premium = " << options.is_premium
                        << ", invoke_timeout = " << options.invoke_timeout
                        << ", upload_part_timeout = " << options.upload_part_timeout
                        << ", gzip_threshold = " << options.gzip_threshold << ", " << options.retry_policy << ']';
}

}  // namespace mtlink
