//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/utils/common.h"
#include "mtlink/utils/format.h"
#include "mtlink/utils/logging.h"
#include "mtlink/utils/Slice.h"

#include <functional>
#include <utility>

namespace mtlink {

class Test {
 public:
  Test() = default;
  Test(const Test &) = delete;
  Test &operator=(const Test &) = delete;
  Test(Test &&) = delete;
  Test &operator=(Test &&) = delete;
  virtual ~Test() = default;

  virtual void run() = 0;
};

class TestsRunner {
 public:
  static TestsRunner &get_default();

  void add_test(string name, std::function<unique_ptr<Test>()> test);
  void add_substr_filter(string str);
  void set_offset(string offset);

  void run_all();

 private:
  struct Info {
    string name;
    std::function<unique_ptr<Test>()> test;
  };
  vector<Info> tests_;
  vector<string> substr_filters_;
  string offset_;

  bool is_filtered(Slice name) const;
};

template <class T>
class RegisterTest {
 public:
  explicit RegisterTest(string name, TestsRunner &runner = TestsRunner::get_default()) {
    runner.add_test(std::move(name), [] { return make_unique<T>(); });
  }
};

namespace detail {

template <class ExpectedT, class GotT>
void assert_eq_impl(const ExpectedT &expected, const GotT &got, const char *file, int line) {
  LOG_CHECK(expected == got) << tag("expected", expected) << tag("got", got) << " in " << file << " at line "
                             << line;
}

template <class T>
void assert_true_impl(const T &got, const char *file, int line) {
  LOG_CHECK(got) << "Expected true in " << file << " at line " << line;
}

}  // namespace detail

}  // namespace mtlink

#define ASSERT_EQ(expected, got) ::mtlink::detail::assert_eq_impl((expected), (got), __FILE__, __LINE__)

#define ASSERT_NE(not_expected, got) \
  LOG_CHECK(!((not_expected) == (got))) << "Unexpected equality in " << __FILE__ << " at line " << __LINE__

#define ASSERT_TRUE(got) ::mtlink::detail::assert_true_impl((got), __FILE__, __LINE__)

#define ASSERT_STREQ(expected, got) \
  ::mtlink::detail::assert_eq_impl(::mtlink::Slice((expected)), ::mtlink::Slice((got)), __FILE__, __LINE__)

#define MTLINK_REGISTER_TESTS_IMPL(test_case_name, test_name)                                       \
  static ::mtlink::RegisterTest<test_case_name##_##test_name> MTLINK_CONCAT(register_test_, __LINE__)( \
      #test_case_name "_" #test_name)

#define TEST(test_case_name, test_name)                               \
  namespace {                                                         \
  class test_case_name##_##test_name final : public ::mtlink::Test { \
   public:                                                            \
    void run() final;                                                 \
  };                                                                  \
  }                                                                   \
  MTLINK_REGISTER_TESTS_IMPL(test_case_name, test_name);              \
  void test_case_name##_##test_name::run()
