#include <algorithm>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <openssl/crypto.h>

#include "arc/binary.hpp"
#include "arc/header.hpp"
#include "fs/compress.hpp"
#include "fs/list.hpp"
#include "stow/status.hpp"
#include "stow/writer.hpp"
#include "util.hpp"

namespace stow {

static constexpr size_t SINK_SIZE = 256 * 1024;

Writer::Writer(std::string src_root, std::string archive, Options opt, fs::ScratchDir* scratch)
  : src_root_(std::move(src_root)), archive_(std::move(archive)),
    opt_(std::move(opt)), scratch_(scratch) {}

Writer::~Writer(){
  OPENSSL_cleanse(key_.data(), key_.size());
  if (fd_ != -1) close(fd_);
}

int Writer::fail(int rc, const char* fmt, ...){
  char buf[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  err_ = buf;
  std::fprintf(stderr, "[WRITE] %s (%s)\n", buf, status_str(rc));
  return rc;
}

int Writer::emit(const void *p, size_t n){
  const uint8_t *b = static_cast<const uint8_t*>(p);
  pending_.insert(pending_.end(), b, b + n);
  if (pending_.size() >= SINK_SIZE) return flush();
  return 0;
}

int Writer::flush(){
  if (pending_.empty()) return 0;
  ssize_t w = util::fs::full_write(fd_, pending_.data(), pending_.size());
  if (w < 0) return static_cast<int>(w);
  pending_.clear();
  return 0;
}

int Writer::run(){
  if (opt_.encrypt && opt_.password.empty())
    return fail(ST_NO_PASSWORD, "encryption requested without a password");

  // Stored paths are relative to the root's parent, so they carry the
  // root directory's own name.
  char *real = realpath(src_root_.c_str(), nullptr);
  if (!real) return fail(-errno, "cannot resolve source '%s'", src_root_.c_str());
  std::string root = real;
  std::free(real);

  struct stat st{};
  if (stat(root.c_str(), &st) == -1) return fail(-errno, "cannot stat '%s'", root.c_str());
  if (!S_ISDIR(st.st_mode)) return fail(-ENOTDIR, "source '%s' is not a directory", root.c_str());
  const std::string base = root.substr(root.rfind('/') + 1);
  if (base.empty()) return fail(-EINVAL, "cannot archive the filesystem root");

  fd_ = open(archive_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd_ == -1) return fail(-errno, "cannot create archive '%s'", archive_.c_str());
  struct stat self{};
  if (fstat(fd_, &self) == -1) return fail(-errno, "cannot stat archive '%s'", archive_.c_str());

  std::vector<std::string> files;
  if (int rc = fs::list_files(root, files); rc != 0)
    return fail(rc, "cannot list '%s'", root.c_str());

  // The archive may live inside the tree it archives
  files.erase(std::remove_if(files.begin(), files.end(), [&](const std::string& f){
    struct stat fst{};
    return lstat(f.c_str(), &fst) == 0 && fst.st_dev == self.st_dev && fst.st_ino == self.st_ino;
  }), files.end());
  total_ = files.size();

  arc::Header h{};
  h.is_encrypted = opt_.encrypt;
  h.is_compressed = opt_.compress;
  h.file_count = total_;
  auto hdr = arc::encode_header(h);
  if (int rc = emit(hdr.data(), hdr.size()); rc != 0) return fail(rc, "header write failed");

  if (opt_.encrypt){
    enc::Salt salt{};
    if (enc::make_salt(salt) != 0) return fail(ST_CRYPTO, "cannot generate salt");
    if (enc::derive_key(opt_.password, salt, key_) != 0) return fail(ST_CRYPTO, "key derivation failed");
    if (int rc = emit(salt.data(), salt.size()); rc != 0) return fail(rc, "salt write failed");
  }

  if (opt_.compress && !scratch_){
    owned_scratch_ = std::make_unique<fs::ScratchDir>();
    scratch_ = owned_scratch_.get();
  }
  if (scratch_ && scratch_->status() != 0)
    return fail(scratch_->status(), "scratch directory unavailable");

  for (auto &full : files){
    std::string rel = base + full.substr(root.size());
    if (int rc = write_entry(full, rel); rc != 0) return rc;

    written_++;
    if (progress_){
      progress_("[" + std::to_string(written_) + "/" + std::to_string(total_) + "] " + rel);
    }
  }

  if (int rc = flush(); rc != 0) return fail(rc, "archive write failed");
  int rc = close(fd_);
  fd_ = -1;
  if (rc == -1) return fail(-errno, "closing archive '%s' failed", archive_.c_str());

  // Early returns leave the owned scratch directory to the destructor
  owned_scratch_.reset();
  return 0;
}

int Writer::write_entry(const std::string& full, const std::string& rel){
  arc::Entry e{};
  if (int rc = arc::entry_from_file(full, rel, e); rc != 0)
    return fail(rc, "cannot read '%s'", full.c_str());

  std::vector<uint8_t> meta;
  if (int rc = arc::encode_entry(e, meta); rc != 0)
    return fail(rc, "path of '%s' is %zu bytes, limit %zu", full.c_str(), rel.size(), arc::MAX_PATH_LEN);
  if (int rc = emit(meta.data(), meta.size()); rc != 0) return fail(rc, "metadata write failed");

  // Fresh nonce per entry; never reused under one key
  if (opt_.encrypt){
    enc::Prefix nonce{};
    if (enc::make_nonce(nonce) != 0) return fail(ST_CRYPTO, "cannot generate nonce");
    if (int rc = emit(nonce.data(), nonce.size()); rc != 0) return fail(rc, "nonce write failed");
    cipher_ = std::make_unique<enc::Encryptor>(key_, nonce);
  }

  std::string src = full;
  std::string tmp;
  uint64_t len = e.size;
  if (opt_.compress){
    if (int rc = fs::compress_file(full, scratch_->path(), tmp); rc != 0)
      return fail(rc, "cannot compress '%s'", full.c_str());

    struct stat st{};
    if (stat(tmp.c_str(), &st) == -1){
      int se = errno;
      unlink(tmp.c_str());
      return fail(-se, "cannot stat '%s'", tmp.c_str());
    }
    len = static_cast<uint64_t>(st.st_size);
    src = tmp;

    std::vector<uint8_t> prefix;
    arc::put_le64(len, prefix);
    if (int rc = emit(prefix.data(), prefix.size()); rc != 0){
      unlink(tmp.c_str());
      return fail(rc, "length write failed");
    }
  }

  int sfd = open(src.c_str(), O_RDONLY | O_CLOEXEC);
  if (sfd == -1){
    int se = errno;
    if (!tmp.empty()) unlink(tmp.c_str());
    return fail(-se, "cannot open '%s'", src.c_str());
  }
  int rc = write_payload(sfd, len, rel);
  close(sfd);
  if (!tmp.empty()) unlink(tmp.c_str());
  cipher_.reset();
  return rc;
}

int Writer::write_payload(int src_fd, uint64_t len, const std::string& rel){
  const size_t csz = enc::CHUNK_SIZE;
  std::vector<uint8_t> pbuf(csz);
  std::vector<uint8_t> cbuf;

  uint64_t left = len;
  while (left > 0){
    size_t want = static_cast<size_t>(std::min<uint64_t>(left, csz));
    ssize_t n = util::fs::full_read(src_fd, pbuf.data(), want);
    if (n < 0) return fail(static_cast<int>(n), "read of '%s' failed", rel.c_str());
    if (static_cast<size_t>(n) != want)
      return fail(-EIO, "'%s' shrank while archiving (%llu bytes missing)",
                  rel.c_str(), (unsigned long long)(left - n));

    int rc = 0;
    if (!cipher_){
      rc = emit(pbuf.data(), want);
    } else if (want == csz){
      rc = cipher_->encrypt_next(pbuf.data(), want, cbuf);
      if (rc == 0) rc = emit(cbuf.data(), cbuf.size());
    } else {
      // short tail: this is the closing chunk
      rc = cipher_->encrypt_last(pbuf.data(), want, cbuf);
      if (rc == 0) rc = emit(cbuf.data(), cbuf.size());
    }
    if (rc != 0) return fail(rc, "payload write of '%s' failed", rel.c_str());
    left -= want;
  }

  // Length was a chunk multiple (or zero): close with an empty chunk so
  // the stream still ends in a tagged last block.
  if (cipher_ && !cipher_->finished()){
    if (int rc = cipher_->encrypt_last(nullptr, 0, cbuf); rc != 0)
      return fail(rc, "closing chunk of '%s' failed", rel.c_str());
    if (int rc = emit(cbuf.data(), cbuf.size()); rc != 0)
      return fail(rc, "payload write of '%s' failed", rel.c_str());
  }
  return 0;
}

}
