#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "arc/entry.hpp"
#include "arc/header.hpp"
#include "enc/crypto.hpp"
#include "fs/scratch.hpp"
#include "stow/options.hpp"
#include "stow/pullbuf.hpp"

namespace stow {

// Restores an archive produced by Writer. The source is consumed as an
// unbounded byte stream; nothing assumes a field arrives in one read.
// One pass per instance: either run() or list().
class Reader {
public:
  Reader(std::string archive, std::string dest_dir, Options opt,
         fs::ScratchDir* scratch = nullptr);
  // Caller-owned source, e.g. a pipe or a test double
  Reader(ByteSource& src, std::string dest_dir, Options opt,
         fs::ScratchDir* scratch = nullptr);
  ~Reader();

  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;

  void set_progress(ProgressFn fn){ progress_ = std::move(fn); }

  // Restore every entry below dest_dir and verify its checksum.
  // Stops at the first failure; files already restored stay in place.
  int run();

  // Walk header and metadata, skipping payloads. Writes nothing.
  int list(std::vector<arc::Entry>& out);

  const arc::Header& header() const { return header_; }
  const std::string& error() const { return err_; }
  uint64_t restored() const { return restored_; }

private:
  int fail(int rc, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

  int open_source();
  int read_header(bool need_key);
  int read_entry(arc::Entry& e, uint64_t index);
  int read_payload_prefix(const arc::Entry& e, uint64_t& len, bool with_cipher);
  int restore_entry(const arc::Entry& e);
  int copy_plain(int dst_fd, uint64_t len, const arc::Entry& e);
  int copy_sealed(int dst_fd, uint64_t len, const arc::Entry& e);
  int verify(const arc::Entry& e, const std::string& dest);
  int finish(uint64_t seen);

  std::string archive_;
  std::string dest_;
  Options opt_;
  fs::ScratchDir* scratch_;
  std::unique_ptr<fs::ScratchDir> owned_scratch_;
  ProgressFn progress_;

  int fd_{-1};
  std::unique_ptr<FdSource> owned_src_;
  ByteSource* src_{nullptr};
  std::unique_ptr<PullBuffer> buf_;

  arc::Header header_{};
  enc::Key key_{};
  std::unique_ptr<enc::Decryptor> cipher_;
  uint64_t restored_{0};
  std::string err_;
};

}
