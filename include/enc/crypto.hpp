#pragma once
#include <sys/types.h>
#include <cstdint>
#include <array>
#include <string>
#include <vector>

#include "params.hpp"

namespace enc {

using Key    = std::array<uint8_t,KEY_SIZE>;
using Salt   = std::array<uint8_t,SALT_SIZE>;
using Prefix = std::array<uint8_t,PREFIX_SIZE>;

// Derivations
// PBKDF2-HMAC-SHA256(password, salt) -> key. 0 on success.
int derive_key(const std::string& password, const Salt& salt, Key& key,
               uint32_t iterations = KDF_ITERATIONS);

int make_salt(Salt& salt);
int make_nonce(Prefix& prefix);

// Chunk nonce = prefix | be32(counter) | last
void make_chunk_nonce(const Prefix& prefix, uint32_t counter, bool last,
                      uint8_t out[NONCE_SIZE]);


// AES-GCM primitives (bufs may alias)
int aesgcm_encrypt(const uint8_t key[KEY_SIZE],
                   const uint8_t nonce[NONCE_SIZE],
                   const uint8_t* pt, size_t pt_len,
                   uint8_t* ct, uint8_t tag[TAG_SIZE]);

int aesgcm_decrypt(const uint8_t key[KEY_SIZE],
                   const uint8_t nonce[NONCE_SIZE],
                   const uint8_t* ct, size_t ct_len,
                   const uint8_t tag[TAG_SIZE],
                   uint8_t* pt);

// Ciphertext bytes produced for len plaintext bytes:
// (len / chunk) full chunks plus one closing chunk, each carrying a tag.
uint64_t sealed_len(uint64_t len, uint32_t chunk_sz = CHUNK_SIZE);


// Incremental STREAM encryptor. Every encrypt_next takes exactly chunk_sz
// bytes; encrypt_last takes the 0..chunk_sz remainder and closes the stream.
class Encryptor {
public:
  Encryptor(const Key& key, const Prefix& prefix, uint32_t chunk_sz = CHUNK_SIZE);
  ~Encryptor();

  Encryptor(const Encryptor&) = delete;
  Encryptor& operator=(const Encryptor&) = delete;

  // out receives ciphertext | tag
  int encrypt_next(const uint8_t* pt, size_t n, std::vector<uint8_t>& out);
  int encrypt_last(const uint8_t* pt, size_t n, std::vector<uint8_t>& out);

  uint32_t chunk_size() const { return chunk_sz_; }
  bool finished() const { return done_; }

private:
  int seal(const uint8_t* pt, size_t n, bool last, std::vector<uint8_t>& out);

  Key      key_{};
  Prefix   prefix_{};
  uint32_t chunk_sz_;
  uint32_t counter_{0};
  bool     done_{false};
};

// Mirror of Encryptor. decrypt_next takes chunk_sz + TAG_SIZE bytes,
// decrypt_last takes TAG_SIZE..chunk_sz + TAG_SIZE bytes.
class Decryptor {
public:
  Decryptor(const Key& key, const Prefix& prefix, uint32_t chunk_sz = CHUNK_SIZE);
  ~Decryptor();

  Decryptor(const Decryptor&) = delete;
  Decryptor& operator=(const Decryptor&) = delete;

  int decrypt_next(const uint8_t* ct, size_t n, std::vector<uint8_t>& out);
  int decrypt_last(const uint8_t* ct, size_t n, std::vector<uint8_t>& out);

  uint32_t chunk_size() const { return chunk_sz_; }
  bool finished() const { return done_; }

private:
  int open(const uint8_t* ct, size_t n, bool last, std::vector<uint8_t>& out);

  Key      key_{};
  Prefix   prefix_{};
  uint32_t chunk_sz_;
  uint32_t counter_{0};
  bool     done_{false};
};

}
