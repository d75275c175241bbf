#include <cerrno>
#include <cstring>

#include <gtest/gtest.h>

#include "enc/crypto.hpp"
#include "test_util.hpp"

using namespace testutil;

namespace {

constexpr uint32_t SMALL = 64;

enc::Key test_key(){
  enc::Key k{};
  for (size_t i = 0; i < k.size(); i++) k[i] = static_cast<uint8_t>(i * 7 + 1);
  return k;
}

enc::Prefix test_prefix(){
  return enc::Prefix{1, 2, 3, 4, 5, 6, 7};
}

// Seal data the way the writer does: full chunks, then a closing chunk
std::vector<std::vector<uint8_t>> seal_all(const std::string& data, uint32_t c){
  enc::Encryptor e(test_key(), test_prefix(), c);
  std::vector<std::vector<uint8_t>> chunks;
  size_t off = 0;
  const uint8_t *p = reinterpret_cast<const uint8_t*>(data.data());
  while (data.size() - off > c){
    std::vector<uint8_t> out;
    EXPECT_EQ(e.encrypt_next(p + off, c, out), 0);
    chunks.push_back(out);
    off += c;
  }
  if (data.size() - off == c){
    std::vector<uint8_t> out;
    EXPECT_EQ(e.encrypt_next(p + off, c, out), 0);
    chunks.push_back(out);
    off += c;
  }
  std::vector<uint8_t> out;
  EXPECT_EQ(e.encrypt_last(p + off, data.size() - off, out), 0);
  chunks.push_back(out);
  EXPECT_TRUE(e.finished());
  return chunks;
}

int open_all(const std::vector<std::vector<uint8_t>>& chunks, uint32_t c, std::string& plain){
  enc::Decryptor d(test_key(), test_prefix(), c);
  plain.clear();
  for (size_t i = 0; i < chunks.size(); i++){
    std::vector<uint8_t> out;
    bool last = (i + 1 == chunks.size());
    int rc = last ? d.decrypt_last(chunks[i].data(), chunks[i].size(), out)
                  : d.decrypt_next(chunks[i].data(), chunks[i].size(), out);
    if (rc != 0) return rc;
    plain.append(out.begin(), out.end());
  }
  return 0;
}

}

TEST(Crypto, SealedLength){
  EXPECT_EQ(enc::sealed_len(0, SMALL), 16u);
  EXPECT_EQ(enc::sealed_len(SMALL - 1, SMALL), SMALL - 1 + 16u);
  EXPECT_EQ(enc::sealed_len(SMALL, SMALL), SMALL + 16u + 16u);
  EXPECT_EQ(enc::sealed_len(SMALL + 1, SMALL), SMALL + 16u + 1 + 16u);
  EXPECT_EQ(enc::sealed_len(3 * enc::CHUNK_SIZE + 5), 3ull * (enc::CHUNK_SIZE + 16) + 5 + 16);
}

TEST(Crypto, RoundTripAtChunkBoundaries){
  for (size_t n : {size_t(0), size_t(1), size_t(SMALL - 1), size_t(SMALL),
                   size_t(SMALL + 1), size_t(3 * SMALL)}){
    std::string data = pattern(n, static_cast<uint32_t>(n));
    auto chunks = seal_all(data, SMALL);

    uint64_t total = 0;
    for (auto &c : chunks) total += c.size();
    EXPECT_EQ(total, enc::sealed_len(n, SMALL)) << n;

    std::string back;
    ASSERT_EQ(open_all(chunks, SMALL, back), 0) << n;
    EXPECT_EQ(back, data) << n;
  }
}

TEST(Crypto, NextRequiresExactChunk){
  enc::Encryptor e(test_key(), test_prefix(), SMALL);
  std::vector<uint8_t> buf(SMALL + 1), out;
  EXPECT_EQ(e.encrypt_next(buf.data(), SMALL - 1, out), -EINVAL);
  EXPECT_EQ(e.encrypt_last(buf.data(), SMALL + 1, out), -EINVAL);
  EXPECT_FALSE(e.finished());
}

TEST(Crypto, NothingAfterLast){
  enc::Encryptor e(test_key(), test_prefix(), SMALL);
  std::vector<uint8_t> buf(SMALL), out;
  ASSERT_EQ(e.encrypt_last(buf.data(), 3, out), 0);
  EXPECT_EQ(e.encrypt_next(buf.data(), SMALL, out), -EINVAL);
  EXPECT_EQ(e.encrypt_last(buf.data(), 0, out), -EINVAL);
}

TEST(Crypto, TamperedChunkFailsAuthentication){
  auto chunks = seal_all(pattern(2 * SMALL + 9, 11), SMALL);
  chunks[1][5] ^= 0x01;
  std::string back;
  EXPECT_EQ(open_all(chunks, SMALL, back), -EBADMSG);
}

TEST(Crypto, TruncatedStreamIsDetected){
  // Closing chunk dropped; the last full chunk presented as final
  auto chunks = seal_all(pattern(2 * SMALL, 5), SMALL);
  chunks.pop_back();
  enc::Decryptor d(test_key(), test_prefix(), SMALL);
  std::vector<uint8_t> out;
  ASSERT_EQ(d.decrypt_next(chunks[0].data(), chunks[0].size(), out), 0);
  EXPECT_EQ(d.decrypt_last(chunks[1].data(), chunks[1].size(), out), -EBADMSG);
}

TEST(Crypto, ReorderedChunksFail){
  auto chunks = seal_all(pattern(3 * SMALL + 1, 9), SMALL);
  std::swap(chunks[0], chunks[1]);
  std::string back;
  EXPECT_EQ(open_all(chunks, SMALL, back), -EBADMSG);
}

TEST(Crypto, WrongKeyFails){
  auto chunks = seal_all("secret", SMALL);
  enc::Key other = test_key();
  other[0] ^= 0xff;
  enc::Decryptor d(other, test_prefix(), SMALL);
  std::vector<uint8_t> out;
  EXPECT_EQ(d.decrypt_last(chunks[0].data(), chunks[0].size(), out), -EBADMSG);
}

TEST(Crypto, ChunkNonceLayout){
  uint8_t n[enc::NONCE_SIZE];
  enc::make_chunk_nonce(test_prefix(), 0x01020304, true, n);
  const uint8_t want[] = {1, 2, 3, 4, 5, 6, 7, 0x01, 0x02, 0x03, 0x04, 0x01};
  EXPECT_EQ(std::memcmp(n, want, sizeof(want)), 0);

  enc::make_chunk_nonce(test_prefix(), 0, false, n);
  EXPECT_EQ(n[11], 0);
}

TEST(Crypto, KeyDerivationIsDeterministic){
  enc::Salt salt{};
  salt.fill(0x5a);
  enc::Key a{}, b{}, c{};
  ASSERT_EQ(enc::derive_key("pw", salt, a, 1000), 0);
  ASSERT_EQ(enc::derive_key("pw", salt, b, 1000), 0);
  ASSERT_EQ(enc::derive_key("pw2", salt, c, 1000), 0);
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
}

TEST(Crypto, RandomMaterialDiffers){
  enc::Salt s1{}, s2{};
  ASSERT_EQ(enc::make_salt(s1), 0);
  ASSERT_EQ(enc::make_salt(s2), 0);
  EXPECT_NE(s1, s2);
}
