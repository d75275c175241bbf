#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "arc/binary.hpp"
#include "arc/entry.hpp"
#include "stow/status.hpp"
#include "test_util.hpp"

using namespace arc;
using namespace stow;
using namespace testutil;

// Decode a metadata block with the field decoders, in stream order
static int decode_all(const std::vector<uint8_t>& b, Entry& e){
  size_t off = 0;
  uint16_t plen = decode_path_len(b.data());
  off += 2;
  int rc = decode_path(b.data() + off, plen, e);
  if (rc) return rc;
  off += plen;
  size_t slen = 0;
  rc = decode_type(b[off++], e, slen);
  if (rc) return rc;
  rc = decode_size(b.data() + off, slen, e);
  if (rc) return rc;
  off += slen;
  return decode_checksum(b.data() + off, b.size() - off, e);
}

TEST(Entry, EncodedLayout){
  Entry e;
  e.path = "root/a.txt";
  e.size = 914433;
  e.checksum.fill(0xab);

  std::vector<uint8_t> b;
  ASSERT_EQ(encode_entry(e, b), 0);
  ASSERT_EQ(b.size(), 2 + 10 + 1 + 3 + 16u);
  EXPECT_EQ(b[0], 0);
  EXPECT_EQ(b[1], 10);
  EXPECT_EQ(b[12], TYPE_FILE | 3);
  EXPECT_EQ(b[13], 1);
  EXPECT_EQ(b[15], 13);
  EXPECT_EQ(b.back(), 0xab);

  Entry d;
  ASSERT_EQ(decode_all(b, d), 0);
  EXPECT_EQ(d.path, e.path);
  EXPECT_EQ(d.size, e.size);
  EXPECT_EQ(d.checksum, e.checksum);
  EXPECT_EQ(d.type, EntryType::Regular);
}

TEST(Entry, EmptyFileHasNoSizeBytes){
  Entry e;
  e.path = "r/empty";
  std::vector<uint8_t> b;
  ASSERT_EQ(encode_entry(e, b), 0);
  EXPECT_EQ(b[2 + 7], TYPE_FILE);
  EXPECT_EQ(b.size(), 2 + 7 + 1 + 16u);
}

TEST(Entry, TypeByteNeedsExactlyOneBit){
  Entry e;
  size_t n = 0;
  EXPECT_EQ(decode_type(TYPE_DIR | 2, e, n), 0);
  EXPECT_EQ(e.type, EntryType::Directory);
  EXPECT_EQ(n, 2u);
  EXPECT_EQ(decode_type(TYPE_SYMLINK, e, n), 0);
  EXPECT_EQ(e.type, EntryType::Symlink);
  EXPECT_EQ(decode_type(0x01, e, n), ST_BAD_FIELD);
  EXPECT_EQ(decode_type(TYPE_FILE | TYPE_DIR, e, n), ST_BAD_FIELD);
  EXPECT_EQ(decode_type(TYPE_FILE | 9, e, n), ST_BAD_FIELD);
}

TEST(Entry, UnsafePathsAreRejected){
  Entry e;
  for (std::string p : std::initializer_list<std::string>{"/abs", "a/../../b", "a/./b", "", std::string("a\0b", 3)}){
    EXPECT_EQ(decode_path(reinterpret_cast<const uint8_t*>(p.data()), p.size(), e), ST_BAD_FIELD) << p;
  }
}

TEST(Entry, OversizedPathIsRefused){
  Entry e;
  e.path = std::string(MAX_PATH_LEN + 1, 'a');
  std::vector<uint8_t> b;
  EXPECT_EQ(encode_entry(e, b), ST_PATH_TOO_LONG);
}

class EntryFile : public TempTree {};

TEST_F(EntryFile, FromRegularFile){
  std::string data = pattern(1234, 1);
  write_file(at("d/f.bin"), data);

  Entry e;
  ASSERT_EQ(entry_from_file(at("d/f.bin"), "d/f.bin", e), 0);
  EXPECT_EQ(e.path, "d/f.bin");
  EXPECT_EQ(e.type, EntryType::Regular);
  EXPECT_EQ(e.size, 1234u);

  enc::Checksum want{};
  ASSERT_EQ(enc::digest_bytes(data.data(), data.size(), want), 0);
  EXPECT_EQ(e.checksum, want);
}

TEST_F(EntryFile, DirectoryAndSymlinkCarryNoChecksum){
  write_file(at("d/f"), "x");
  ASSERT_EQ(symlink("f", at("d/link").c_str()), 0);

  Entry e;
  ASSERT_EQ(entry_from_file(at("d"), "d", e), 0);
  EXPECT_EQ(e.type, EntryType::Directory);
  EXPECT_TRUE(enc::is_unset(e.checksum));

  ASSERT_EQ(entry_from_file(at("d/link"), "d/link", e), 0);
  EXPECT_EQ(e.type, EntryType::Symlink);
  EXPECT_EQ(e.size, 0u);
}
