#include <gtest/gtest.h>

#include "arc/binary.hpp"

using namespace arc;

TEST(Binary, RunStripsLeadingZeroBytes){
  std::vector<uint8_t> out;
  EXPECT_EQ(put_run(914433, out), 3u);
  EXPECT_EQ(out, (std::vector<uint8_t>{1, 244, 13}));
}

TEST(Binary, ZeroIsAnEmptyRun){
  std::vector<uint8_t> out;
  EXPECT_EQ(put_run(0, out), 0u);
  EXPECT_TRUE(out.empty());

  uint64_t v = 99;
  ASSERT_EQ(get_run(nullptr, 0, v), 0);
  EXPECT_EQ(v, 0u);
}

TEST(Binary, RunLengthBoundaries){
  EXPECT_EQ(run_len(0xff), 1u);
  EXPECT_EQ(run_len(0x100), 2u);
  EXPECT_EQ(run_len(0x00ffffffffffffffull), 7u);
  EXPECT_EQ(run_len(UINT64_MAX), 8u);
}

TEST(Binary, DecodeZeroExtendsShortRun){
  const uint8_t bytes[] = {0x01, 0xf4, 0x0d};
  uint64_t v = 0;
  ASSERT_EQ(get_run(bytes, sizeof(bytes), v), 0);
  EXPECT_EQ(v, 914433u);
}

TEST(Binary, DecodeHonoursStoredCountEvenWithZeroBytes){
  // A non-minimal run still decodes; the count is authoritative
  const uint8_t bytes[] = {0x05, 0x00, 0x00, 0x00};
  uint64_t v = 0;
  ASSERT_EQ(get_run(bytes, sizeof(bytes), v), 0);
  EXPECT_EQ(v, 5u);
}

TEST(Binary, RunLongerThanEightIsRejected){
  const uint8_t bytes[9] = {};
  uint64_t v = 0;
  EXPECT_NE(get_run(bytes, sizeof(bytes), v), 0);
}

TEST(Binary, FixedWidthHelpers){
  std::vector<uint8_t> out;
  put_be16(0x1234, out);
  EXPECT_EQ(out, (std::vector<uint8_t>{0x12, 0x34}));
  EXPECT_EQ(get_be16(out.data()), 0x1234);

  out.clear();
  put_le64(0x0102030405060708ull, out);
  EXPECT_EQ(out, (std::vector<uint8_t>{8, 7, 6, 5, 4, 3, 2, 1}));
  EXPECT_EQ(get_le64(out.data()), 0x0102030405060708ull);
}

TEST(Binary, FlagHelper){
  EXPECT_TRUE(is_flag_set(0xc0, 0x40));
  EXPECT_FALSE(is_flag_set(0x80, 0x40));
}
