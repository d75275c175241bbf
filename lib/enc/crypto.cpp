#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/core_names.h>
#include <openssl/params.h>
#include <openssl/crypto.h>

#include "enc/params.hpp"
#include "enc/crypto.hpp"
#include "util.hpp"

namespace enc {

// PBKDF2 Context
int derive_key(const std::string& password, const Salt& salt, Key& key, uint32_t iterations){
  int rc = -1;
  EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "PBKDF2", nullptr);
  if (!kdf) return -1;
  EVP_KDF_CTX* kctx = EVP_KDF_CTX_new(kdf);
  EVP_KDF_free(kdf);
  if (!kctx) return -1;

  do {
    OSSL_PARAM params[5];
    OSSL_PARAM* p = params;
    *p++ = OSSL_PARAM_construct_octet_string(
      OSSL_KDF_PARAM_PASSWORD,
      const_cast<char*>(password.data()), password.size());
    *p++ = OSSL_PARAM_construct_octet_string(
      OSSL_KDF_PARAM_SALT,
      const_cast<uint8_t*>(salt.data()), salt.size());
    *p++ = OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &iterations);
    *p++ = OSSL_PARAM_construct_utf8_string(
      OSSL_KDF_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
    *p = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx, key.data(), key.size(), params) <= 0) break;
    rc = 0;
  } while(0);

  EVP_KDF_CTX_free(kctx);
  if (rc != 0) std::fprintf(stderr, "[CRYPT] key derivation failed\n");
  return rc;
}

int make_salt(Salt& salt){
  return util::enc::fill_rand(salt.data(), salt.size());
}

int make_nonce(Prefix& prefix){
  return util::enc::fill_rand(prefix.data(), prefix.size());
}

void make_chunk_nonce(const Prefix& prefix, uint32_t counter, bool last, uint8_t out[NONCE_SIZE]){
  std::memcpy(out, prefix.data(), PREFIX_SIZE);
  uint32_t be = util::enc::htobe_u32(counter);
  std::memcpy(out + PREFIX_SIZE, &be, 4);
  out[NONCE_SIZE - 1] = last ? 1 : 0;
}

int aesgcm_encrypt(const uint8_t key[KEY_SIZE],
                   const uint8_t nonce[NONCE_SIZE],
                   const uint8_t* pt, size_t pt_len,
                   uint8_t* ct, uint8_t tag[TAG_SIZE]) {
  int ok=-1, outl=0, tmplen=0;
  EVP_CIPHER_CTX* c = EVP_CIPHER_CTX_new();
  if (!c) return -1;
  do {
    // Init new context with key + iv
    if (EVP_EncryptInit_ex(c, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) break;
    if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1) break;
    if (EVP_EncryptInit_ex(c, nullptr, nullptr, key, nonce) != 1) break;

    if (pt_len > 0 && EVP_EncryptUpdate(c, ct, &outl, pt, (int)pt_len) != 1) break;
    if (EVP_EncryptFinal_ex(c, ct + outl, &tmplen) != 1) break;
    if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_GCM_GET_TAG, TAG_SIZE, tag) != 1) break;        // Export the tag per chunk
    ok = outl + tmplen;
  } while(0);
  EVP_CIPHER_CTX_free(c);             // Free the encryption context
  return (ok == (int)pt_len) ? 0 : -1;
}

int aesgcm_decrypt(const uint8_t key[KEY_SIZE],
                   const uint8_t nonce[NONCE_SIZE],
                   const uint8_t* ct, size_t ct_len,
                   const uint8_t tag[TAG_SIZE],
                   uint8_t* pt) {
  int outl=0, tmplen=0, ok=-1;
  EVP_CIPHER_CTX* c = EVP_CIPHER_CTX_new();
  if (!c) return -1;
  do {
    if (EVP_DecryptInit_ex(c, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) break;
    if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1) break;
    if (EVP_DecryptInit_ex(c, nullptr, nullptr, key, nonce) != 1) break;

    if (ct_len > 0 && EVP_DecryptUpdate(c, pt, &outl, ct, (int)ct_len) != 1) break;
    if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_GCM_SET_TAG, TAG_SIZE, (void*)tag) != 1) break;     // Verify the tag per encrypted chunk
    if (EVP_DecryptFinal_ex(c, pt + outl, &tmplen) != 1) break;
    ok = 0;
  } while(0);
  EVP_CIPHER_CTX_free(c);
  return ok;
}

uint64_t sealed_len(uint64_t len, uint32_t chunk_sz){
  uint64_t full = len / chunk_sz;
  uint64_t rem = len % chunk_sz;
  return full * (static_cast<uint64_t>(chunk_sz) + TAG_SIZE) + rem + TAG_SIZE;
}


Encryptor::Encryptor(const Key& key, const Prefix& prefix, uint32_t chunk_sz)
  : key_(key), prefix_(prefix), chunk_sz_(chunk_sz) {}

Encryptor::~Encryptor(){
  OPENSSL_cleanse(key_.data(), key_.size());
}

int Encryptor::encrypt_next(const uint8_t* pt, size_t n, std::vector<uint8_t>& out){
  if (n != chunk_sz_) return -EINVAL;
  return seal(pt, n, false, out);
}

int Encryptor::encrypt_last(const uint8_t* pt, size_t n, std::vector<uint8_t>& out){
  if (n > chunk_sz_) return -EINVAL;
  return seal(pt, n, true, out);
}

int Encryptor::seal(const uint8_t* pt, size_t n, bool last, std::vector<uint8_t>& out){
  if (done_) return -EINVAL;

  uint8_t nonce[NONCE_SIZE];
  make_chunk_nonce(prefix_, counter_, last, nonce);

  out.resize(n + TAG_SIZE);
  if (aesgcm_encrypt(key_.data(), nonce, pt, n, out.data(), out.data() + n) != 0){
    std::fprintf(stderr, "[CRYPT] encrypt failed at chunk %u\n", counter_);
    return -EIO;
  }

  if (last){
    done_ = true;
  } else {
    if (counter_ == UINT32_MAX) return -EOVERFLOW;
    counter_++;
  }
  return 0;
}


Decryptor::Decryptor(const Key& key, const Prefix& prefix, uint32_t chunk_sz)
  : key_(key), prefix_(prefix), chunk_sz_(chunk_sz) {}

Decryptor::~Decryptor(){
  OPENSSL_cleanse(key_.data(), key_.size());
}

int Decryptor::decrypt_next(const uint8_t* ct, size_t n, std::vector<uint8_t>& out){
  if (n != chunk_sz_ + TAG_SIZE) return -EINVAL;
  return open(ct, n, false, out);
}

int Decryptor::decrypt_last(const uint8_t* ct, size_t n, std::vector<uint8_t>& out){
  if (n < TAG_SIZE || n > chunk_sz_ + TAG_SIZE) return -EINVAL;
  return open(ct, n, true, out);
}

int Decryptor::open(const uint8_t* ct, size_t n, bool last, std::vector<uint8_t>& out){
  if (done_) return -EINVAL;

  uint8_t nonce[NONCE_SIZE];
  make_chunk_nonce(prefix_, counter_, last, nonce);

  const size_t plain = n - TAG_SIZE;
  out.resize(plain);
  uint8_t empty = 0;
  uint8_t *pt = plain ? out.data() : &empty;
  if (aesgcm_decrypt(key_.data(), nonce, ct, plain, ct + plain, pt) != 0){
    if (!out.empty()) OPENSSL_cleanse(out.data(), out.size());
    out.clear();
    return -EBADMSG;
  }

  if (last){
    done_ = true;
  } else {
    if (counter_ == UINT32_MAX) return -EOVERFLOW;
    counter_++;
  }
  return 0;
}

}
