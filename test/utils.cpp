//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/utils/common.h"
#include "mtlink/utils/crypto.h"
#include "mtlink/utils/Gzip.h"
#include "mtlink/utils/misc.h"
#include "mtlink/utils/OptionParser.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"
#include "mtlink/utils/tests.h"

TEST(Misc, to_integer_safe) {
  ASSERT_EQ(12345, mtlink::to_integer_safe<mtlink::int32>("12345").ok());
  ASSERT_EQ(-2147483648ll, mtlink::to_integer_safe<mtlink::int32>("-2147483648").ok());
  ASSERT_TRUE(mtlink::to_integer_safe<mtlink::int32>("2147483648").is_error());
  ASSERT_TRUE(mtlink::to_integer_safe<mtlink::int32>("").is_error());
  ASSERT_TRUE(mtlink::to_integer_safe<mtlink::int32>("-").is_error());
  ASSERT_TRUE(mtlink::to_integer_safe<mtlink::int32>("12a").is_error());
  ASSERT_TRUE(mtlink::to_integer_safe<mtlink::uint32>("-1").is_error());
  ASSERT_EQ(524288u, mtlink::to_integer_safe<size_t>("524288").ok());
}

TEST(Misc, to_double_safe) {
  ASSERT_EQ(1.5, mtlink::to_double_safe("1.5").ok());
  ASSERT_EQ(30.0, mtlink::to_double_safe(" 30 ").ok());
  ASSERT_TRUE(mtlink::to_double_safe("").is_error());
  ASSERT_TRUE(mtlink::to_double_safe("1.5s").is_error());
}

TEST(Misc, strings) {
  ASSERT_STREQ("abc", mtlink::trim(" \t abc\n"));
  ASSERT_STREQ("", mtlink::trim("   "));
  ASSERT_STREQ("true", mtlink::to_lower("TrUe"));
  ASSERT_STREQ("00ff10", mtlink::hex_encode(mtlink::Slice("\x00\xff\x10", 3)));
  ASSERT_TRUE(mtlink::begins_with("FLOOD_WAIT_10", "FLOOD_WAIT_"));
  ASSERT_TRUE(!mtlink::begins_with("FLOOD", "FLOOD_WAIT_"));

  auto parts = mtlink::full_split("500,,503", ',');
  ASSERT_EQ(3u, parts.size());
  ASSERT_STREQ("500", parts[0]);
  ASSERT_STREQ("", parts[1]);
  ASSERT_STREQ("503", parts[2]);
  ASSERT_TRUE(mtlink::full_split("", ',').empty());

  mtlink::Slice path("/tmp/dir/photo.jpg");
  ASSERT_EQ(8u, path.rfind('/'));
  ASSERT_EQ(static_cast<size_t>(-1), mtlink::Slice("photo.jpg").rfind('/'));
}

TEST(Crypto, crc32) {
  ASSERT_EQ(0xcbf43926u, mtlink::crc32("123456789"));
  ASSERT_EQ(0u, mtlink::crc32(""));
}

TEST(Crypto, md5) {
  mtlink::string result(16, '\0');
  mtlink::md5("abc", result);
  ASSERT_STREQ("900150983cd24fb0d6963f7d28e17f72", mtlink::hex_encode(result));

  mtlink::Md5State state;
  state.init();
  state.feed("a");
  state.feed("");
  state.feed("bc");
  mtlink::string state_result(16, '\0');
  state.extract(state_result);
  ASSERT_STREQ(mtlink::hex_encode(result), mtlink::hex_encode(state_result));

  mtlink::Md5State empty_state;
  empty_state.init();
  empty_state.extract(state_result);
  ASSERT_STREQ("d41d8cd98f00b204e9800998ecf8427e", mtlink::hex_encode(state_result));
}

TEST(Gzip, encode_decode) {
  mtlink::string data;
  for (int i = 0; i < 1000; i++) {
    data += "save file part ";
  }
  auto packed = mtlink::gzencode(data, 0.9);
  ASSERT_TRUE(!packed.empty());
  ASSERT_TRUE(packed.size() < data.size());
  auto r_unpacked = mtlink::gzdecode(packed);
  ASSERT_TRUE(r_unpacked.is_ok());
  ASSERT_STREQ(data, r_unpacked.ok());

  ASSERT_TRUE(mtlink::gzencode("a", 0.9).empty());
  ASSERT_TRUE(mtlink::gzdecode("not a gzip stream").is_error());
}

static mtlink::Status check_positive(int value) {
  if (value <= 0) {
    return mtlink::Status::Error(400, "Value must be positive");
  }
  return mtlink::Status::OK();
}

static mtlink::Result<int> twice_positive(int value) {
  TRY_STATUS_PREFIX(check_positive(value), "Invalid argument: ");
  return value * 2;
}

static mtlink::Result<int> four_times_positive(int value) {
  TRY_RESULT(twice, twice_positive(value));
  return twice * 2;
}

TEST(Status, try_macros) {
  ASSERT_EQ(8, four_times_positive(2).ok());
  auto r_value = four_times_positive(-1);
  ASSERT_TRUE(r_value.is_error());
  ASSERT_EQ(400, r_value.error().code());
  ASSERT_STREQ("Invalid argument: Value must be positive", r_value.error().message());

  auto error = mtlink::Status::Error(420, "FLOOD_WAIT_5");
  auto copy = error.clone();
  ASSERT_EQ(error.code(), copy.code());
  ASSERT_STREQ(error.message(), copy.message());
  ASSERT_TRUE(mtlink::Status::OK().is_ok());
}

TEST(OptionParser, run) {
  mtlink::OptionParser options;
  mtlink::string filter;
  int verbosity = 0;
  bool is_stress = false;
  options.add_option('f', "filter", "test filter", mtlink::OptionParser::parse_string(filter));
  options.add_checked_option('v', "verbosity", "verbosity level", mtlink::OptionParser::parse_integer(verbosity));
  options.add_option('s', "stress", "stress mode", [&] { is_stress = true; });
  options.add_check([&] {
    if (verbosity > 10) {
      return mtlink::Status::Error("Too big verbosity level");
    }
    return mtlink::Status::OK();
  });

  mtlink::string args[] = {"exe", "--filter=Upload", "-v3", "-s", "rest"};
  char *argv[] = {&args[0][0], &args[1][0], &args[2][0], &args[3][0], &args[4][0]};
  auto r_non_options = options.run(5, argv, 1);
  ASSERT_TRUE(r_non_options.is_ok());
  ASSERT_EQ(1u, r_non_options.ok().size());
  ASSERT_STREQ("rest", r_non_options.ok()[0]);
  ASSERT_STREQ("Upload", filter);
  ASSERT_EQ(3, verbosity);
  ASSERT_TRUE(is_stress);

  mtlink::string bad_args[] = {"exe", "--verbosity", "20"};
  char *bad_argv[] = {&bad_args[0][0], &bad_args[1][0], &bad_args[2][0]};
  ASSERT_TRUE(options.run(3, bad_argv, 0).is_error());

  mtlink::string unknown_args[] = {"exe", "--unknown"};
  char *unknown_argv[] = {&unknown_args[0][0], &unknown_args[1][0]};
  ASSERT_TRUE(options.run(2, unknown_argv, 0).is_error());
}
