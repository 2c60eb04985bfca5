//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/utils/logging.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace mtlink {

LogOptions log_options;

static DefaultLog default_log;
LogInterface *const default_log_interface = &default_log;
LogInterface *log_interface = default_log_interface;

void DefaultLog::append(CSlice slice, int log_level) {
  static std::mutex mutex;
  std::lock_guard<std::mutex> guard(mutex);
  std::fwrite(slice.data(), 1, slice.size(), stderr);
  if (log_level <= VERBOSITY_NAME(ERROR)) {
    std::fflush(stderr);
  }
}

Logger::Logger(LogInterface &log, const LogOptions &options, int log_level, Slice file_name, int line_num,
               Slice comment)
    : log_(log), options_(options), log_level_(log_level) {
  if (log_level == VERBOSITY_NAME(PLAIN) || !options_.add_info) {
    return;
  }

  // log level
  sb_ << '[';
  if (static_cast<unsigned int>(log_level) < 10) {
    sb_ << ' ' << static_cast<char>('0' + log_level);
  } else {
    sb_ << log_level;
  }
  sb_ << ']';

  // timestamp
  auto now = std::chrono::system_clock::now().time_since_epoch();
  auto nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  auto unix_time = static_cast<uint32>(nanoseconds / 1000000000);
  auto fraction = static_cast<uint32>(nanoseconds % 1000000000);
  sb_ << '[' << unix_time << '.';
  uint32 limit = 100000000;
  while (fraction < limit && limit > 1) {
    sb_ << '0';
    limit /= 10;
  }
  sb_ << fraction << ']';

  // file : line
  if (!file_name.empty()) {
    auto last_slash = static_cast<int32>(file_name.size()) - 1;
    while (last_slash >= 0 && file_name[last_slash] != '/' && file_name[last_slash] != '\\') {
      last_slash--;
    }
    file_name = file_name.substr(last_slash + 1);
    sb_ << '[' << file_name << ':' << static_cast<unsigned int>(line_num) << ']';
  }

  // comment (e.g. condition in LOG_IF)
  if (!comment.empty()) {
    sb_ << "[&" << comment << ']';
  }

  sb_ << '\t';
}

Logger::~Logger() {
  if (options_.fix_newlines) {
    auto slice = sb_.as_cslice();
    if (slice.empty() || slice[slice.size() - 1] != '\n') {
      sb_ << '\n';
    }
  }
  log_.append(sb_.as_cslice(), log_level_);
  if (log_level_ == VERBOSITY_NAME(FATAL)) {
    std::abort();
  }
}

namespace detail {

void process_check_error(const char *message, const char *file, int line) {
  ::mtlink::Logger(*log_interface, log_options, VERBOSITY_NAME(FATAL), Slice(file), line, Slice())
      << "Check `" << message << "` failed";
  std::abort();
}

}  // namespace detail

}  // namespace mtlink
