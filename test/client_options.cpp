//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/ClientOptions.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/OptionParser.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"
#include "mtlink/utils/tests.h"

#include <algorithm>

TEST(ClientOptions, defaults) {
  mtlink::ClientOptions options;
  ASSERT_TRUE(options.validate().is_ok());
  ASSERT_EQ(1, options.pool_size);
  ASSERT_EQ(8, options.concurrency_limit);
  ASSERT_EQ(1, options.small_file_workers);
  ASSERT_EQ(4, options.big_file_workers);
  ASSERT_EQ(0u, options.part_size);
  ASSERT_EQ(5, options.retry_policy.max_attempts);
  ASSERT_TRUE(options.retry_policy.retryable_codes.empty());
}

TEST(ClientOptions, set_option) {
  mtlink::ClientOptions options;
  ASSERT_TRUE(options.set_option("pool_size", "3").is_ok());
  ASSERT_TRUE(options.set_option("concurrency_limit", " 16 ").is_ok());
  ASSERT_TRUE(options.set_option("part_size", "131072").is_ok());
  ASSERT_TRUE(options.set_option("is_premium", "TRUE").is_ok());
  ASSERT_TRUE(options.set_option("invoke_timeout", "2.5").is_ok());
  ASSERT_TRUE(options.set_option("max_attempts", "7").is_ok());
  ASSERT_TRUE(options.set_option("max_total_flood_wait", "120").is_ok());
  ASSERT_TRUE(options.set_option("retryable_codes", "429, 503").is_ok());

  ASSERT_EQ(3, options.pool_size);
  ASSERT_EQ(16, options.concurrency_limit);
  ASSERT_EQ(131072u, options.part_size);
  ASSERT_TRUE(options.is_premium);
  ASSERT_EQ(2.5, options.invoke_timeout);
  ASSERT_EQ(7, options.retry_policy.max_attempts);
  ASSERT_EQ(120.0, options.retry_policy.max_total_flood_wait);
  ASSERT_EQ(2u, options.retry_policy.retryable_codes.size());
  ASSERT_EQ(429, options.retry_policy.retryable_codes[0]);
  ASSERT_EQ(503, options.retry_policy.retryable_codes[1]);
  ASSERT_TRUE(options.validate().is_ok());

  ASSERT_TRUE(options.set_option("retryable_codes", "").is_ok());
  ASSERT_TRUE(options.retry_policy.retryable_codes.empty());
  ASSERT_TRUE(options.set_option("is_premium", "0").is_ok());
  ASSERT_TRUE(!options.is_premium);
}

TEST(ClientOptions, invalid_option) {
  mtlink::ClientOptions options;
  auto status = options.set_option("pool", "1");
  ASSERT_TRUE(status.is_error());
  ASSERT_EQ(400, status.code());
  ASSERT_STREQ("Unknown option \"pool\"", status.message());

  ASSERT_TRUE(options.set_option("pool_size", "many").is_error());
  ASSERT_TRUE(options.set_option("part_size", "-1").is_error());
  ASSERT_TRUE(options.set_option("is_premium", "yes").is_error());
  ASSERT_TRUE(options.set_option("max_backoff", "1m").is_error());
  ASSERT_TRUE(options.set_option("retryable_codes", "429,x").is_error());
  ASSERT_EQ(1, options.pool_size);
  ASSERT_TRUE(options.retry_policy.retryable_codes.empty());
}

TEST(ClientOptions, validate) {
  mtlink::ClientOptions options;
  options.part_size = 1000;
  ASSERT_TRUE(options.validate().is_error());
  options.part_size = 1024;
  ASSERT_TRUE(options.validate().is_ok());
  options.part_size = 1024 * 1024;
  ASSERT_TRUE(options.validate().is_error());
  options.part_size = 0;

  options.concurrency_limit = 0;
  ASSERT_TRUE(options.validate().is_error());
  options.concurrency_limit = 1;

  options.big_file_workers = 0;
  ASSERT_TRUE(options.validate().is_error());
  options.big_file_workers = 4;

  options.invoke_timeout = -1;
  ASSERT_TRUE(options.validate().is_error());
  options.invoke_timeout = 0;

  options.retry_policy.max_attempts = 0;
  ASSERT_TRUE(options.validate().is_error());
  options.retry_policy.max_attempts = 1;
  ASSERT_TRUE(options.validate().is_ok());
}

TEST(ClientOptions, command_line) {
  auto names = mtlink::ClientOptions::get_option_names();
  ASSERT_EQ(16u, names.size());
  ASSERT_TRUE(std::find(names.begin(), names.end(), mtlink::Slice("upload_part_timeout")) != names.end());

  mtlink::ClientOptions options;
  mtlink::OptionParser parser;
  options.add_to(parser);
  mtlink::string args[] = {"exe", "--concurrency_limit", "4", "--is_premium=true", "--retryable_codes=429", "file"};
  char *argv[] = {&args[0][0], &args[1][0], &args[2][0], &args[3][0], &args[4][0], &args[5][0]};
  auto r_non_options = parser.run(6, argv, 1);
  ASSERT_TRUE(r_non_options.is_ok());
  ASSERT_STREQ("file", r_non_options.ok()[0]);
  ASSERT_EQ(4, options.concurrency_limit);
  ASSERT_TRUE(options.is_premium);
  ASSERT_EQ(1u, options.retry_policy.retryable_codes.size());

  mtlink::ClientOptions bad_options;
  mtlink::OptionParser bad_parser;
  bad_options.add_to(bad_parser);
  mtlink::string bad_args[] = {"exe", "--pool_size=0"};
  char *bad_argv[] = {&bad_args[0][0], &bad_args[1][0]};
  ASSERT_TRUE(bad_parser.run(2, bad_argv, 0).is_error());
}
