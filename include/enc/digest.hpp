#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <openssl/evp.h>

#include "params.hpp"

namespace enc {

using Checksum = std::array<uint8_t,DIGEST_SIZE>;

// All-zero checksum means "not computed"
bool is_unset(const Checksum& c);

// Incremental MD5 over a byte stream
class Digest {
public:
  Digest();
  ~Digest();

  Digest(const Digest&) = delete;
  Digest& operator=(const Digest&) = delete;

  int update(const void* p, size_t n);
  int finish(Checksum& out);

private:
  EVP_MD_CTX* ctx_{nullptr};
  bool ok_{false};
};

// Hash from current position to EOF. 0 or -errno / -EIO.
int digest_fd(int fd, Checksum& out);
int digest_file(const std::string& path, Checksum& out);
int digest_bytes(const void* p, size_t n, Checksum& out);

}
