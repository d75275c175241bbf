#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <sys/types.h>
#include <vector>

namespace stow {

inline constexpr size_t FILL_SIZE = 64 * 1024;

// Chunked byte source with arbitrary read boundaries
class ByteSource {
public:
  virtual ~ByteSource() = default;
  // > 0 bytes read, 0 at end of stream, -errno on failure
  virtual ssize_t read_some(uint8_t* buf, size_t n) = 0;
};

class FdSource : public ByteSource {
public:
  explicit FdSource(int fd) : fd_(fd) {}
  ssize_t read_some(uint8_t* buf, size_t n) override;

private:
  int fd_;
};

// FIFO window between a ByteSource and the archive parser. Bytes leave
// only through pull/pull_some; pushback returns over-read bytes to the
// front so the next field sees them first.
class PullBuffer {
public:
  explicit PullBuffer(ByteSource& src, size_t fill_sz = FILL_SIZE);

  // One read from the source. New byte count, 0 at end, or -errno.
  ssize_t fill();

  // Exactly n bytes into out (replaced), or ST_TRUNCATED leaving the
  // window untouched.
  int pull(size_t n, std::vector<uint8_t>& out);

  // Up to max buffered bytes into out (replaced), filling once when the
  // window is empty. Byte count, 0 only at end of stream, or -errno.
  ssize_t pull_some(size_t max, std::vector<uint8_t>& out);

  void pushback(const uint8_t* p, size_t n);
  void pushback(const std::vector<uint8_t>& bytes){ pushback(bytes.data(), bytes.size()); }

  // Window empty and the source yields nothing more. 1, 0 or -errno.
  int at_end();

  size_t available() const { return q_.size(); }
  uint64_t consumed() const { return consumed_; }

private:
  ByteSource& src_;
  std::deque<uint8_t> q_;
  std::vector<uint8_t> scratch_;
  uint64_t consumed_{0};
};

}
