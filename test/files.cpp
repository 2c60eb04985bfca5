//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/files/ByteSource.h"
#include "mtlink/files/PartPlanner.h"
#include "mtlink/files/PartsManager.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/port/FileFd.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"
#include "mtlink/utils/tests.h"

#include <cstdio>

static void check_partition(const mtlink::PartLayout &layout) {
  ASSERT_TRUE(layout.is_size_known());
  ASSERT_TRUE(layout.part_count >= 1);
  mtlink::int64 offset = 0;
  for (mtlink::int32 part_id = 0; part_id < layout.part_count; part_id++) {
    auto part = layout.get_part(part_id);
    ASSERT_EQ(part_id, part.id);
    ASSERT_EQ(offset, part.offset);
    ASSERT_TRUE(part.size <= layout.part_size);
    if (part_id + 1 < layout.part_count) {
      ASSERT_EQ(layout.part_size, part.size);
    } else if (layout.size != 0) {
      ASSERT_TRUE(part.size > 0);
    }
    offset += static_cast<mtlink::int64>(part.size);
  }
  ASSERT_EQ(layout.size, offset);
}

TEST(PartPlanner, partition) {
  for (mtlink::int64 size : {0ll, 1ll, 1023ll, 1024ll, 65535ll, 65536ll, 65537ll, 10485760ll, 10485761ll,
                             52428800ll, 314572800ll, 2097152000ll}) {
    for (size_t part_size_hint : {static_cast<size_t>(0), static_cast<size_t>(1024), static_cast<size_t>(524288)}) {
      auto r_layout = mtlink::PartPlanner::plan(size, part_size_hint, false);
      ASSERT_TRUE(r_layout.is_ok());
      auto layout = r_layout.move_as_ok();
      check_partition(layout);
      auto part_size = static_cast<mtlink::int64>(layout.part_size);
      auto expected_part_count = size == 0 ? 1 : (size + part_size - 1) / part_size;
      ASSERT_EQ(expected_part_count, layout.part_count);
      ASSERT_EQ(size > 10485760, layout.is_big);
      ASSERT_TRUE(layout.part_count <= mtlink::PartPlanner::MAX_PART_COUNT);
    }
  }
}

TEST(PartPlanner, part_size) {
  auto layout = mtlink::PartPlanner::plan(0, 0, false).move_as_ok();
  ASSERT_EQ(65536u, layout.part_size);
  ASSERT_EQ(1, layout.part_count);
  ASSERT_EQ(0u, layout.get_part(0).size);
  ASSERT_TRUE(!layout.is_big);

  layout = mtlink::PartPlanner::plan(10 << 20, 0, false).move_as_ok();
  ASSERT_EQ(160, layout.part_count);
  ASSERT_TRUE(!layout.is_big);

  layout = mtlink::PartPlanner::plan(50 << 20, 524288, false).move_as_ok();
  ASSERT_EQ(524288u, layout.part_size);
  ASSERT_EQ(100, layout.part_count);
  ASSERT_TRUE(layout.is_big);

  layout = mtlink::PartPlanner::plan(50 << 20, 0, false).move_as_ok();
  ASSERT_EQ(65536u, layout.part_size);
  ASSERT_EQ(800, layout.part_count);

  layout = mtlink::PartPlanner::plan(300 << 20, 0, false).move_as_ok();
  ASSERT_EQ(131072u, layout.part_size);
  ASSERT_EQ(2400, layout.part_count);

  // too small hint is increased
  layout = mtlink::PartPlanner::plan(100 << 20, 1024, false).move_as_ok();
  ASSERT_EQ(32768u, layout.part_size);
  ASSERT_EQ(3200, layout.part_count);
}

TEST(PartPlanner, limits) {
  auto max_size = mtlink::PartPlanner::get_max_file_size(false);
  ASSERT_EQ(2097152000ll, max_size);
  auto layout = mtlink::PartPlanner::plan(max_size, 0, false).move_as_ok();
  ASSERT_EQ(524288u, layout.part_size);
  ASSERT_EQ(4000, layout.part_count);

  auto r_layout = mtlink::PartPlanner::plan(max_size + 1, 0, false);
  ASSERT_TRUE(r_layout.is_error());
  ASSERT_EQ(400, r_layout.error().code());
  ASSERT_STREQ("File is too big", r_layout.error().message());

  layout = mtlink::PartPlanner::plan(max_size + 1, 0, true).move_as_ok();
  ASSERT_EQ(4001, layout.part_count);
  ASSERT_TRUE(mtlink::PartPlanner::plan(mtlink::PartPlanner::get_max_file_size(true) + 1, 0, true).is_error());
}

TEST(PartPlanner, invalid_part_size) {
  for (size_t part_size : {static_cast<size_t>(1000), static_cast<size_t>(3072), static_cast<size_t>(1048576)}) {
    auto r_layout = mtlink::PartPlanner::plan(100, part_size, false);
    ASSERT_TRUE(r_layout.is_error());
    ASSERT_EQ(400, r_layout.error().code());
  }
  ASSERT_TRUE(mtlink::PartPlanner::check_part_size(1024).is_ok());
  ASSERT_TRUE(mtlink::PartPlanner::check_part_size(131072).is_ok());
  ASSERT_TRUE(mtlink::PartPlanner::check_part_size(0).is_error());
}

TEST(PartPlanner, unknown_size) {
  auto layout = mtlink::PartPlanner::plan(-1, 0, false).move_as_ok();
  ASSERT_TRUE(!layout.is_size_known());
  ASSERT_TRUE(layout.is_big);
  ASSERT_EQ(-1, layout.part_count);
  ASSERT_EQ(524288u, layout.part_size);
  auto part = layout.get_part(3);
  ASSERT_EQ(3 * 524288ll, part.offset);
  ASSERT_EQ(524288u, part.size);

  layout = mtlink::PartPlanner::plan(-1, 4096, false).move_as_ok();
  ASSERT_EQ(4096u, layout.part_size);
}

TEST(PartsManager, acknowledgements) {
  mtlink::PartsManager parts_manager;
  ASSERT_TRUE(parts_manager.init(mtlink::PartPlanner::plan(2500, 1024, false).move_as_ok()).is_ok());
  ASSERT_EQ(3, parts_manager.get_part_count());
  ASSERT_TRUE(!parts_manager.ready());

  // acknowledgement of a part, which wasn't sent
  ASSERT_TRUE(parts_manager.on_part_ok(0, 1024).is_error());

  for (int i = 0; i < 3; i++) {
    auto part = parts_manager.start_part().move_as_ok();
    ASSERT_EQ(i, part.id);
    ASSERT_EQ(1024ll * i, part.offset);
  }
  ASSERT_EQ(-1, parts_manager.start_part().move_as_ok().id);
  ASSERT_EQ(3, parts_manager.get_pending_count());

  ASSERT_TRUE(parts_manager.on_part_ok(1, 1024).is_ok());
  ASSERT_TRUE(parts_manager.on_part_ok(1, 1024).is_ok());
  ASSERT_EQ(1, parts_manager.get_ready_count());
  ASSERT_EQ(1024, parts_manager.get_ready_size());
  ASSERT_TRUE(parts_manager.is_part_ready(1));

  ASSERT_TRUE(parts_manager.on_part_ok(2, 100).is_error());
  ASSERT_TRUE(parts_manager.on_part_ok(2, 452).is_ok());
  ASSERT_TRUE(parts_manager.on_part_ok(0, 1024).is_ok());
  ASSERT_TRUE(parts_manager.ready());
  ASSERT_TRUE(parts_manager.finish().is_ok());
  ASSERT_EQ(2500, parts_manager.get_ready_size());
  ASSERT_EQ(0, parts_manager.get_pending_count());

  ASSERT_TRUE(parts_manager.on_part_ok(2, 452).is_ok());
  ASSERT_EQ(3, parts_manager.get_ready_count());
}

TEST(PartsManager, unknown_size_part_limit) {
  for (auto is_premium : {false, true}) {
    auto layout = mtlink::PartPlanner::plan(-1, 0, is_premium).move_as_ok();
    auto max_part_count = mtlink::PartPlanner::get_max_part_count(is_premium);
    ASSERT_EQ(max_part_count, layout.max_part_count);

    mtlink::PartsManager parts_manager;
    ASSERT_TRUE(parts_manager.init(layout).is_ok());
    for (int i = 0; i < max_part_count; i++) {
      auto r_part = parts_manager.start_part();
      ASSERT_TRUE(r_part.is_ok());
      ASSERT_EQ(i, r_part.ok().id);
    }
    auto r_part = parts_manager.start_part();
    ASSERT_TRUE(r_part.is_error());
    ASSERT_EQ(400, r_part.error().code());
    ASSERT_EQ(max_part_count, parts_manager.get_part_count());
  }
}

TEST(PartsManager, unknown_size) {
  mtlink::PartsManager parts_manager;
  ASSERT_TRUE(parts_manager.init(mtlink::PartPlanner::plan(-1, 1024, false).move_as_ok()).is_ok());
  ASSERT_TRUE(!parts_manager.is_size_known());
  ASSERT_EQ(-1, parts_manager.get_size());

  auto part = parts_manager.start_part().move_as_ok();
  ASSERT_EQ(0, part.id);
  ASSERT_EQ(1024u, part.size);
  part = parts_manager.start_part().move_as_ok();
  ASSERT_EQ(1, part.id);
  ASSERT_EQ(2, parts_manager.get_part_count());
  ASSERT_TRUE(parts_manager.on_part_ok(0, 1024).is_ok());
  ASSERT_TRUE(!parts_manager.ready());

  ASSERT_TRUE(parts_manager.set_terminal_part(1, 1024).is_error());
  ASSERT_TRUE(parts_manager.set_terminal_part(1, 10).is_ok());
  ASSERT_TRUE(parts_manager.is_size_known());
  ASSERT_EQ(1034, parts_manager.get_size());
  ASSERT_EQ(-1, parts_manager.start_part().move_as_ok().id);
  ASSERT_TRUE(parts_manager.set_terminal_part(1, 10).is_error());

  ASSERT_TRUE(parts_manager.on_part_ok(1, 10).is_ok());
  ASSERT_TRUE(parts_manager.ready());
  ASSERT_EQ(1034, parts_manager.get_ready_size());
}

TEST(ByteSource, memory) {
  mtlink::MemoryByteSource source("data.bin", "0123456789");
  ASSERT_STREQ("data.bin", source.get_name());
  ASSERT_EQ(10, source.get_size());
  ASSERT_TRUE(source.is_seekable());
  ASSERT_STREQ("3456", source.read_range(3, 4).move_as_ok());
  ASSERT_STREQ("89", source.read_range(8, 4).move_as_ok());
  ASSERT_STREQ("", source.read_range(10, 4).move_as_ok());
  ASSERT_TRUE(source.read_range(-1, 4).is_error());
  ASSERT_STREQ("0123", source.read_next(4).move_as_ok());
  ASSERT_STREQ("456789", source.read_next(100).move_as_ok());
  ASSERT_STREQ("", source.read_next(100).move_as_ok());

  mtlink::MemoryByteSource declared_source("data.bin", "0123", 10);
  ASSERT_EQ(10, declared_source.get_size());
  ASSERT_STREQ("0123", declared_source.read_range(0, 10).move_as_ok());
}

TEST(ByteSource, stream) {
  mtlink::string data = "abcdefghijklmnopqrstuvwxyz";
  size_t position = 0;
  mtlink::StreamByteSource source("letters.txt", [&](size_t max_size) -> mtlink::Result<mtlink::string> {
    auto size = mtlink::min(max_size, static_cast<size_t>(7));
    auto result = mtlink::Slice(data).substr(position, size).str();
    position += result.size();
    return std::move(result);
  });
  ASSERT_EQ(-1, source.get_size());
  ASSERT_TRUE(!source.is_seekable());
  ASSERT_TRUE(source.read_range(0, 10).is_error());
  ASSERT_STREQ("abcdefghij", source.read_next(10).move_as_ok());
  ASSERT_STREQ("klmnopqrst", source.read_next(10).move_as_ok());
  ASSERT_STREQ("uvwxyz", source.read_next(10).move_as_ok());
  ASSERT_STREQ("", source.read_next(10).move_as_ok());
  ASSERT_EQ(26, source.get_read_size());

  mtlink::StreamByteSource failing_source("broken", [](size_t) -> mtlink::Result<mtlink::string> {
    return mtlink::Status::Error("Stream is broken");
  });
  ASSERT_TRUE(failing_source.read_next(10).is_error());
}

TEST(ByteSource, file) {
  mtlink::CSlice path("mtlink_test_source.bin");
  {
    auto fd = mtlink::FileFd::open(path, mtlink::FileFd::Write | mtlink::FileFd::Create | mtlink::FileFd::Truncate)
                  .move_as_ok();
    ASSERT_EQ(12u, fd.write("hello, world").move_as_ok());
    fd.close();
  }

  auto r_source = mtlink::FileByteSource::open(path);
  ASSERT_TRUE(r_source.is_ok());
  auto source = r_source.move_as_ok();
  ASSERT_STREQ("mtlink_test_source.bin", source.get_name());
  ASSERT_EQ(12, source.get_size());
  ASSERT_STREQ("world", source.read_range(7, 100).move_as_ok());
  ASSERT_STREQ("hello", source.read_next(5).move_as_ok());
  ASSERT_STREQ(", world", source.read_next(100).move_as_ok());
  std::remove(path.c_str());

  ASSERT_TRUE(mtlink::FileByteSource::open("/nonexistent/mtlink/file").is_error());
}
