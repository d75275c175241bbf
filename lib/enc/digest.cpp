#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>
#include <vector>
#include <openssl/evp.h>

#include "enc/digest.hpp"
#include "util.hpp"

namespace enc {

static constexpr size_t HASH_CHUNK_SIZE = 64 * 1024;

bool is_unset(const Checksum& c){
  for (auto b : c) if (b != 0) return false;
  return true;
}

Digest::Digest(){
  ctx_ = EVP_MD_CTX_new();
  ok_ = ctx_ && EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) == 1;
}

Digest::~Digest(){
  EVP_MD_CTX_free(ctx_);
}

int Digest::update(const void *p, size_t n){
  if (!ok_) return -EIO;
  if (n == 0) return 0;
  if (EVP_DigestUpdate(ctx_, p, n) != 1){
    ok_ = false;
    return -EIO;
  }
  return 0;
}

int Digest::finish(Checksum& out){
  if (!ok_) return -EIO;
  unsigned int len = 0;
  int rc = EVP_DigestFinal_ex(ctx_, out.data(), &len);
  ok_ = false;
  return (rc == 1 && len == DIGEST_SIZE) ? 0 : -EIO;
}

int digest_fd(int fd, Checksum& out){
  Digest d;
  std::vector<uint8_t> buf(HASH_CHUNK_SIZE);
  for (;;){
    ssize_t n = util::fs::full_read(fd, buf.data(), buf.size());
    if (n < 0) return static_cast<int>(n);
    if (n == 0) break;
    if (int rc = d.update(buf.data(), static_cast<size_t>(n)); rc != 0) return rc;
  }
  return d.finish(out);
}

int digest_file(const std::string& path, Checksum& out){
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) return -errno;
  int rc = digest_fd(fd, out);
  close(fd);
  return rc;
}

int digest_bytes(const void *p, size_t n, Checksum& out){
  Digest d;
  if (int rc = d.update(p, n); rc != 0) return rc;
  return d.finish(out);
}

}
