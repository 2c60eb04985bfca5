//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/utils/tests.h"

#include "mtlink/utils/misc.h"
#include "mtlink/utils/Time.h"

namespace mtlink {

TestsRunner &TestsRunner::get_default() {
  static TestsRunner default_runner;
  return default_runner;
}

void TestsRunner::add_test(string name, std::function<unique_ptr<Test>()> test) {
  for (auto &it : tests_) {
    LOG_IF(FATAL, it.name == name) << "Test name collision " << name;
  }
  tests_.push_back(Info{std::move(name), std::move(test)});
}

void TestsRunner::add_substr_filter(string str) {
  if (str[0] != '+' && str[0] != '-') {
    str = "+" + str;
  }
  substr_filters_.push_back(std::move(str));
}

void TestsRunner::set_offset(string offset) {
  offset_ = std::move(offset);
}

bool TestsRunner::is_filtered(Slice name) const {
  if (substr_filters_.empty()) {
    return false;
  }
  auto lowered_name = to_lower(name);
  bool has_positive = false;
  bool is_matched = false;
  for (auto &filter : substr_filters_) {
    auto pattern = to_lower(Slice(filter).substr(1));
    bool found = lowered_name.find(pattern) != string::npos;
    if (filter[0] == '-') {
      if (found) {
        return true;
      }
    } else {
      has_positive = true;
      is_matched |= found;
    }
  }
  return has_positive && !is_matched;
}

void TestsRunner::run_all() {
  bool is_offset_reached = offset_.empty();
  size_t run_count = 0;
  auto start = Time::now_unadjusted();
  for (auto &info : tests_) {
    if (!is_offset_reached) {
      if (to_lower(info.name).find(to_lower(offset_)) == string::npos) {
        continue;
      }
      is_offset_reached = true;
    }
    if (is_filtered(info.name)) {
      continue;
    }
    LOG(ERROR) << "Run test " << tag("name", info.name);
    auto test_start = Time::now_unadjusted();
    auto test = info.test();
    test->run();
    run_count++;
    LOG(INFO) << "Test " << info.name << " finished in " << format::as_time(Time::now_unadjusted() - test_start);
  }
  LOG(ERROR) << "Run " << run_count << " tests in " << format::as_time(Time::now_unadjusted() - start);
}

}  // namespace mtlink
