#include <algorithm>
#include <cerrno>
#include <unistd.h>

#include "stow/pullbuf.hpp"
#include "stow/status.hpp"

namespace stow {

ssize_t FdSource::read_some(uint8_t *buf, size_t n){
  for (;;){
    ssize_t r = read(fd_, buf, n);
    if (r < 0){
      if (errno == EINTR) continue;
      return -errno;
    }
    return r;
  }
}

PullBuffer::PullBuffer(ByteSource& src, size_t fill_sz)
  : src_(src), scratch_(fill_sz ? fill_sz : FILL_SIZE) {}

ssize_t PullBuffer::fill(){
  ssize_t r = src_.read_some(scratch_.data(), scratch_.size());
  if (r > 0) q_.insert(q_.end(), scratch_.begin(), scratch_.begin() + r);
  return r;
}

int PullBuffer::pull(size_t n, std::vector<uint8_t>& out){
  while (q_.size() < n){
    ssize_t r = fill();
    if (r < 0) return static_cast<int>(r);
    if (r == 0) return ST_TRUNCATED;
  }
  out.assign(q_.begin(), q_.begin() + n);
  q_.erase(q_.begin(), q_.begin() + n);
  consumed_ += n;
  return 0;
}

ssize_t PullBuffer::pull_some(size_t max, std::vector<uint8_t>& out){
  out.clear();
  if (max == 0) return 0;
  if (q_.empty()){
    ssize_t r = fill();
    if (r <= 0) return r;
  }
  size_t n = std::min(max, q_.size());
  out.assign(q_.begin(), q_.begin() + n);
  q_.erase(q_.begin(), q_.begin() + n);
  consumed_ += n;
  return static_cast<ssize_t>(n);
}

void PullBuffer::pushback(const uint8_t *p, size_t n){
  q_.insert(q_.begin(), p, p + n);
  consumed_ -= std::min<uint64_t>(consumed_, n);
}

int PullBuffer::at_end(){
  if (!q_.empty()) return 0;
  ssize_t r = fill();
  if (r < 0) return static_cast<int>(r);
  return r == 0 ? 1 : 0;
}

}
