#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "arc/entry.hpp"
#include "enc/crypto.hpp"
#include "fs/scratch.hpp"
#include "stow/options.hpp"

namespace stow {

// Serializes every regular file below src_root into one archive.
// Single pass: header, [salt], then per file metadata | [nonce] |
// [compressed length] | payload. Not reusable after run().
class Writer {
public:
  Writer(std::string src_root, std::string archive, Options opt,
         fs::ScratchDir* scratch = nullptr);
  ~Writer();

  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;

  void set_progress(ProgressFn fn){ progress_ = std::move(fn); }

  // 0, -errno or a negative Status; error() then describes the failure
  int run();

  const std::string& error() const { return err_; }
  uint64_t written() const { return written_; }

private:
  int fail(int rc, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

  int emit(const void* p, size_t n);
  int flush();
  int write_entry(const std::string& full, const std::string& rel);
  int write_payload(int src_fd, uint64_t len, const std::string& rel);

  std::string src_root_;
  std::string archive_;
  Options opt_;
  fs::ScratchDir* scratch_;
  std::unique_ptr<fs::ScratchDir> owned_scratch_;
  ProgressFn progress_;

  int fd_{-1};
  std::vector<uint8_t> pending_;
  enc::Key key_{};
  std::unique_ptr<enc::Encryptor> cipher_;
  uint64_t written_{0};
  uint64_t total_{0};
  std::string err_;
};

}
