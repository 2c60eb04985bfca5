//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

/*
 * Simple logging.
 *
 * Predefined log levels: FATAL, ERROR, WARNING, INFO, DEBUG
 *
 * LOG(WARNING) << "Hello world!";
 * LOG(INFO) << "Hello " << 1234 << " world!";
 * LOG_IF(INFO, condition) << "Hello world if condition!";
 *
 * Named verbosity levels are declared with
 *   extern int VERBOSITY_NAME(name);
 * and used with
 *   VLOG(name) << "Message";
 *
 * LOG(FATAL) and failed CHECK terminate the process.
 */

#include "mtlink/utils/common.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/StringBuilder.h"

#include <atomic>

#define VERBOSITY_NAME(x) verbosity_##x

#define MTLINK_LOG_IS_ON(level) (VERBOSITY_NAME(level) <= ::mtlink::log_options.get_level())

#define MTLINK_LOG_IMPL(level, condition, comment)                                                      \
  !(MTLINK_LOG_IS_ON(level) && (condition))                                                              \
      ? (void)0                                                                                          \
      : ::mtlink::detail::Voidify() & ::mtlink::Logger(*::mtlink::log_interface, ::mtlink::log_options, \
                                                       VERBOSITY_NAME(level), __FILE__, __LINE__, comment)

#define LOG(level) MTLINK_LOG_IMPL(level, true, ::mtlink::Slice())
#define LOG_IF(level, condition) MTLINK_LOG_IMPL(level, condition, #condition)

#define VLOG(level) MTLINK_LOG_IMPL(level, true, MTLINK_DEFINE_STR(level))
#define VLOG_IF(level, condition) MTLINK_LOG_IMPL(level, condition, MTLINK_DEFINE_STR(level) " " #condition)

#define LOG_CHECK(condition) LOG_IF(FATAL, !(condition))

#define CHECK(condition)                                                          \
  if (::mtlink::unlikely(!(condition))) {                                         \
    ::mtlink::detail::process_check_error(#condition, __FILE__, __LINE__);        \
  }

#define UNREACHABLE() ::mtlink::detail::process_check_error("Unreachable", __FILE__, __LINE__)

#define SET_VERBOSITY_LEVEL(level) ::mtlink::log_options.set_level(level)

#define GET_VERBOSITY_LEVEL() ::mtlink::log_options.get_level()

#define PSTRING() ::mtlink::detail::Stringify() & ::mtlink::StringBuilder().ref()
#define PSLICE() PSTRING()

constexpr int VERBOSITY_NAME(PLAIN) = -1;
constexpr int VERBOSITY_NAME(FATAL) = 0;
constexpr int VERBOSITY_NAME(ERROR) = 1;
constexpr int VERBOSITY_NAME(WARNING) = 2;
constexpr int VERBOSITY_NAME(INFO) = 3;
constexpr int VERBOSITY_NAME(DEBUG) = 4;
constexpr int VERBOSITY_NAME(NEVER) = 1024;

namespace mtlink {

struct LogOptions {
  std::atomic<int> level{VERBOSITY_NAME(DEBUG) + 1};
  bool fix_newlines{true};
  bool add_info{true};

  int get_level() const {
    return level.load(std::memory_order_relaxed);
  }
  int set_level(int new_level) {
    return level.exchange(new_level);
  }

  LogOptions() = default;
  LogOptions(const LogOptions &) = delete;
  LogOptions &operator=(const LogOptions &) = delete;
};

extern LogOptions log_options;

class LogInterface {
 public:
  LogInterface() = default;
  LogInterface(const LogInterface &) = delete;
  LogInterface &operator=(const LogInterface &) = delete;
  LogInterface(LogInterface &&) = delete;
  LogInterface &operator=(LogInterface &&) = delete;
  virtual ~LogInterface() = default;

  virtual void append(CSlice slice, int log_level) = 0;
};

class DefaultLog final : public LogInterface {
 public:
  void append(CSlice slice, int log_level) final;
};

extern LogInterface *const default_log_interface;
extern LogInterface *log_interface;

class Logger {
 public:
  Logger(LogInterface &log, const LogOptions &options, int log_level, Slice file_name, int line_num, Slice comment);
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;
  Logger(Logger &&) = delete;
  Logger &operator=(Logger &&) = delete;
  ~Logger();

  template <class T>
  Logger &operator<<(const T &other) {
    sb_ << other;
    return *this;
  }

 private:
  LogInterface &log_;
  const LogOptions &options_;
  int log_level_;
  StringBuilder sb_;
};

namespace detail {

class Voidify {
 public:
  template <class T>
  void operator&(const T &) {
  }
};

class Stringify {
 public:
  string operator&(StringBuilder &sb) {
    return sb.move_as_string();
  }
};

[[noreturn]] void process_check_error(const char *message, const char *file, int line);

}  // namespace detail

}  // namespace mtlink
