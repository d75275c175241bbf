#include <algorithm>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <openssl/crypto.h>

#include "arc/binary.hpp"
#include "fs/compress.hpp"
#include "stow/reader.hpp"
#include "stow/status.hpp"
#include "util.hpp"

namespace stow {

Reader::Reader(std::string archive, std::string dest_dir, Options opt, fs::ScratchDir* scratch)
  : archive_(std::move(archive)), dest_(std::move(dest_dir)),
    opt_(std::move(opt)), scratch_(scratch) {}

Reader::Reader(ByteSource& src, std::string dest_dir, Options opt, fs::ScratchDir* scratch)
  : dest_(std::move(dest_dir)), opt_(std::move(opt)), scratch_(scratch), src_(&src) {}

Reader::~Reader(){
  OPENSSL_cleanse(key_.data(), key_.size());
  if (fd_ != -1) close(fd_);
}

int Reader::fail(int rc, const char* fmt, ...){
  char buf[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  err_ = buf;
  std::fprintf(stderr, "[READ] %s (%s)\n", buf, status_str(rc));
  return rc;
}

int Reader::open_source(){
  if (!src_){
    fd_ = open(archive_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ == -1) return fail(-errno, "cannot open archive '%s'", archive_.c_str());
    owned_src_ = std::make_unique<FdSource>(fd_);
    src_ = owned_src_.get();
  }
  buf_ = std::make_unique<PullBuffer>(*src_);
  return 0;
}

int Reader::read_header(bool need_key){
  std::vector<uint8_t> b;

  int rc = buf_->pull(arc::LABEL_SIZE, b);
  if (rc == ST_TRUNCATED) return fail(ST_BAD_LABEL, "archive is shorter than its label");
  if (rc != 0) return fail(rc, "header read failed");
  if (arc::decode_label(b.data(), b.size()) != 0)
    return fail(ST_BAD_LABEL, "expected label '%s', found bytes %s",
                arc::LABEL, util::to_hex(b.data(), b.size()).c_str());

  if ((rc = buf_->pull(arc::VERSION_SIZE, b)) != 0)
    return fail(rc == ST_TRUNCATED ? ST_BAD_VERSION_MARKER : rc, "archive ends before version");
  const arc::Version self = arc::current_version();
  switch (rc = arc::decode_version(b.data(), b.size(), header_, self)){
    case 0: break;
    case ST_BAD_VERSION_MARKER:
      return fail(rc, "expected version marker 0x%02x, found 0x%02x", arc::VERSION_MARKER, b[0]);
    case ST_VERSION_TOO_NEW:
      return fail(rc, "archive version %s is too new for reader %s",
                  header_.version.str().c_str(), self.str().c_str());
    case ST_VERSION_TOO_OLD:
      return fail(rc, "archive version %s is too old for reader %s",
                  header_.version.str().c_str(), self.str().c_str());
    default:
      return fail(rc, "archive version %s uses minor %u, reader %s supports up to %u",
                  header_.version.str().c_str(), header_.version.minor, self.str().c_str(), self.minor);
  }

  if ((rc = buf_->pull(1, b)) != 0) return fail(rc, "archive ends before flags");
  arc::decode_flags(b[0], header_);
  if (header_.is_compressed != opt_.compress)
    return fail(ST_OPTION_MISMATCH, "archive is %s but compression was %s",
                header_.is_compressed ? "compressed" : "not compressed",
                opt_.compress ? "requested" : "not requested");
  if (header_.is_encrypted != opt_.encrypt)
    return fail(ST_OPTION_MISMATCH, "archive is %s but encryption was %s",
                header_.is_encrypted ? "encrypted" : "not encrypted",
                opt_.encrypt ? "requested" : "not requested");
  if (header_.is_encrypted && need_key && opt_.password.empty())
    return fail(ST_NO_PASSWORD, "archive is encrypted and no password was supplied");

  size_t n = 0;
  if ((rc = buf_->pull(1, b)) != 0) return fail(rc, "archive ends before file count");
  if (arc::decode_file_count_len(b[0], n) != 0)
    return fail(ST_BAD_FIELD, "file count needs %u bytes, at most %zu allowed", b[0], arc::MAX_RUN);
  if ((rc = buf_->pull(n, b)) != 0) return fail(rc, "archive ends inside file count");
  arc::decode_file_count(b.data(), b.size(), header_);

  if (header_.is_encrypted){
    if ((rc = buf_->pull(enc::SALT_SIZE, b)) != 0) return fail(rc, "archive ends inside salt");
    if (need_key){
      enc::Salt salt{};
      std::copy(b.begin(), b.end(), salt.begin());
      if (enc::derive_key(opt_.password, salt, key_) != 0)
        return fail(ST_CRYPTO, "key derivation failed");
    }
  }
  return 0;
}

int Reader::read_entry(arc::Entry& e, uint64_t index){
  std::vector<uint8_t> b;
  const unsigned long long idx = index + 1;

  int rc = buf_->pull(2, b);
  if (rc != 0) return fail(rc, "archive ends inside metadata of entry %llu", idx);
  size_t plen = arc::decode_path_len(b.data());

  if ((rc = buf_->pull(plen, b)) != 0) return fail(rc, "archive ends inside path of entry %llu", idx);
  if (arc::decode_path(b.data(), b.size(), e) != 0)
    return fail(ST_BAD_FIELD, "entry %llu has an unsafe or invalid path '%.*s'",
                idx, static_cast<int>(std::min<size_t>(b.size(), 256)), reinterpret_cast<const char*>(b.data()));

  size_t slen = 0;
  if ((rc = buf_->pull(1, b)) != 0) return fail(rc, "archive ends inside metadata of '%s'", e.path.c_str());
  if (arc::decode_type(b[0], e, slen) != 0)
    return fail(ST_BAD_FIELD, "bad type/size byte 0x%02x for '%s'", b[0], e.path.c_str());

  if ((rc = buf_->pull(slen, b)) != 0) return fail(rc, "archive ends inside size of '%s'", e.path.c_str());
  arc::decode_size(b.data(), b.size(), e);

  if ((rc = buf_->pull(enc::DIGEST_SIZE, b)) != 0)
    return fail(rc, "archive ends inside checksum of '%s'", e.path.c_str());
  arc::decode_checksum(b.data(), b.size(), e);
  return 0;
}

// [nonce] | [compressed length]; len receives the payload length before
// encryption
int Reader::read_payload_prefix(const arc::Entry& e, uint64_t& len, bool with_cipher){
  std::vector<uint8_t> b;
  int rc = 0;

  cipher_.reset();
  if (header_.is_encrypted){
    if ((rc = buf_->pull(enc::PREFIX_SIZE, b)) != 0)
      return fail(rc, "archive ends inside nonce of '%s'", e.path.c_str());
    if (with_cipher){
      enc::Prefix nonce{};
      std::copy(b.begin(), b.end(), nonce.begin());
      cipher_ = std::make_unique<enc::Decryptor>(key_, nonce);
    }
  }

  len = e.size;
  if (header_.is_compressed){
    if ((rc = buf_->pull(8, b)) != 0)
      return fail(rc, "archive ends inside compressed length of '%s'", e.path.c_str());
    len = arc::get_le64(b.data());
  }
  return 0;
}

int Reader::copy_plain(int dst_fd, uint64_t len, const arc::Entry& e){
  std::vector<uint8_t> chunk;
  uint64_t left = len;
  while (left > 0){
    ssize_t n = buf_->pull_some(FILL_SIZE, chunk);
    if (n < 0) return fail(static_cast<int>(n), "archive read failed in '%s'", e.path.c_str());
    if (n == 0)
      return fail(ST_TRUNCATED, "archive ends %llu bytes into a %llu byte payload of '%s'",
                  (unsigned long long)(len - left), (unsigned long long)len, e.path.c_str());

    // Bytes past this payload belong to the next entry
    if (chunk.size() > left){
      buf_->pushback(chunk.data() + left, chunk.size() - static_cast<size_t>(left));
      chunk.resize(static_cast<size_t>(left));
    }
    if (dst_fd >= 0){
      ssize_t w = util::fs::full_write(dst_fd, chunk.data(), chunk.size());
      if (w < 0) return fail(static_cast<int>(w), "write of '%s' failed", e.path.c_str());
    }
    left -= chunk.size();
  }
  return 0;
}

int Reader::copy_sealed(int dst_fd, uint64_t len, const arc::Entry& e){
  const uint32_t csz = cipher_->chunk_size();
  const uint64_t full = len / csz;
  const size_t rem = static_cast<size_t>(len % csz);
  std::vector<uint8_t> cbuf, pbuf;

  for (uint64_t i = 0; i <= full; i++){
    const bool last = (i == full);
    const size_t want = (last ? rem : csz) + enc::TAG_SIZE;
    if (int rc = buf_->pull(want, cbuf); rc != 0)
      return fail(rc, "archive ends inside chunk %llu of '%s'", (unsigned long long)i, e.path.c_str());

    int rc = last ? cipher_->decrypt_last(cbuf.data(), cbuf.size(), pbuf)
                  : cipher_->decrypt_next(cbuf.data(), cbuf.size(), pbuf);
    if (rc == -EBADMSG)
      return fail(ST_AUTH, "chunk %llu of '%s' failed authentication", (unsigned long long)i, e.path.c_str());
    if (rc != 0) return fail(rc, "decrypt of '%s' failed", e.path.c_str());

    ssize_t w = util::fs::full_write(dst_fd, pbuf.data(), pbuf.size());
    OPENSSL_cleanse(pbuf.data(), pbuf.size());
    if (w < 0) return fail(static_cast<int>(w), "write of '%s' failed", e.path.c_str());
  }
  return 0;
}

int Reader::restore_entry(const arc::Entry& e){
  if (e.type != arc::EntryType::Regular)
    return fail(ST_UNSUPPORTED_ENTRY, "'%s' is not a regular file entry", e.path.c_str());

  const std::string dest = util::join_path(dest_, e.path);
  if (int rc = util::fs::make_dirs(util::parent_of(dest)); rc != 0)
    return fail(rc, "cannot create parent of '%s'", dest.c_str());

  int fd = open(dest.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW, 0644);
  if (fd == -1) return fail(-errno, "cannot create '%s'", dest.c_str());

  uint64_t len = 0;
  if (int rc = read_payload_prefix(e, len, true); rc != 0){
    close(fd);
    return rc;
  }

  if (!header_.is_compressed){
    int rc = cipher_ ? copy_sealed(fd, len, e) : copy_plain(fd, len, e);
    if (close(fd) == -1 && rc == 0) rc = fail(-errno, "closing '%s' failed", dest.c_str());
    if (rc != 0) return rc;
    return verify(e, dest);
  }
  // The decompressed file replaces dest, so it takes dest's create mode
  struct stat dst{};
  int se = (fstat(fd, &dst) == -1) ? errno : 0;
  close(fd);
  if (se) return fail(-se, "cannot stat '%s'", dest.c_str());

  // Compressed: payload -> scratch file -> decompress beside dest -> rename
  std::string tmp;
  if (int rc = scratch_->make_temp("payload", tmp); rc != 0)
    return fail(rc, "cannot create scratch file for '%s'", e.path.c_str());
  int tfd = open(tmp.c_str(), O_WRONLY | O_TRUNC | O_CLOEXEC);
  if (tfd == -1){
    int se = errno;
    unlink(tmp.c_str());
    return fail(-se, "cannot open scratch file '%s'", tmp.c_str());
  }
  int rc = cipher_ ? copy_sealed(tfd, len, e) : copy_plain(tfd, len, e);
  if (close(tfd) == -1 && rc == 0) rc = fail(-errno, "closing scratch file failed");
  if (rc != 0){
    unlink(tmp.c_str());
    return rc;
  }

  std::string out;
  rc = fs::decompress_file(tmp, util::parent_of(dest), out);
  unlink(tmp.c_str());
  if (rc != 0) return fail(rc, "cannot decompress '%s'", e.path.c_str());
  if (chmod(out.c_str(), dst.st_mode & 07777) == -1){
    int ce = errno;
    unlink(out.c_str());
    return fail(-ce, "cannot set mode of '%s'", out.c_str());
  }
  if (rename(out.c_str(), dest.c_str()) == -1){
    int se = errno;
    unlink(out.c_str());
    return fail(-se, "cannot move restored data over '%s'", dest.c_str());
  }
  return verify(e, dest);
}

int Reader::verify(const arc::Entry& e, const std::string& dest){
  struct stat st{};
  if (stat(dest.c_str(), &st) == -1) return fail(-errno, "cannot stat '%s'", dest.c_str());
  if (static_cast<uint64_t>(st.st_size) != e.size)
    return fail(ST_CHECKSUM_MISMATCH, "size mismatch for '%s': expected %llu, got %llu",
                e.path.c_str(), (unsigned long long)e.size, (unsigned long long)st.st_size);

  if (enc::is_unset(e.checksum)){
    std::fprintf(stderr, "[READ] '%s' carries no checksum, not verified\n", e.path.c_str());
    return 0;
  }

  enc::Checksum got{};
  if (int rc = enc::digest_file(dest, got); rc != 0)
    return fail(rc, "cannot hash '%s'", dest.c_str());
  if (got != e.checksum)
    return fail(ST_CHECKSUM_MISMATCH, "checksum mismatch for '%s': expected %s, got %s",
                e.path.c_str(),
                util::to_hex(e.checksum.data(), e.checksum.size()).c_str(),
                util::to_hex(got.data(), got.size()).c_str());
  return 0;
}

int Reader::finish(uint64_t seen){
  if (seen < header_.file_count)
    return fail(ST_COUNT_MISMATCH, "header declares %llu entries, archive holds %llu",
                (unsigned long long)header_.file_count, (unsigned long long)seen);

  int end = buf_->at_end();
  if (end < 0) return fail(end, "archive read failed");
  if (end == 0)
    return fail(ST_TRAILING_DATA, "%zu or more bytes follow the %llu declared entries",
                buf_->available(), (unsigned long long)header_.file_count);
  return 0;
}

int Reader::run(){
  if (int rc = open_source(); rc != 0) return rc;
  if (int rc = read_header(true); rc != 0) return rc;

  if (header_.is_compressed && !scratch_){
    owned_scratch_ = std::make_unique<fs::ScratchDir>();
    scratch_ = owned_scratch_.get();
  }
  if (scratch_ && scratch_->status() != 0)
    return fail(scratch_->status(), "scratch directory unavailable");
  if (int rc = util::fs::make_dirs(dest_); rc != 0)
    return fail(rc, "cannot create destination '%s'", dest_.c_str());

  uint64_t seen = 0;
  while (seen < header_.file_count){
    int end = buf_->at_end();
    if (end < 0) return fail(end, "archive read failed");
    if (end == 1) break;

    arc::Entry e{};
    if (int rc = read_entry(e, seen); rc != 0) return rc;
    if (int rc = restore_entry(e); rc != 0) return rc;

    seen++;
    restored_++;
    if (progress_){
      progress_("[" + std::to_string(seen) + "/" + std::to_string(header_.file_count) + "] " + e.path);
    }
  }
  int rc = finish(seen);
  owned_scratch_.reset();
  return rc;
}

int Reader::list(std::vector<arc::Entry>& out){
  out.clear();
  if (int rc = open_source(); rc != 0) return rc;
  if (int rc = read_header(false); rc != 0) return rc;

  uint64_t seen = 0;
  while (seen < header_.file_count){
    int end = buf_->at_end();
    if (end < 0) return fail(end, "archive read failed");
    if (end == 1) break;

    arc::Entry e{};
    if (int rc = read_entry(e, seen); rc != 0) return rc;
    uint64_t len = 0;
    if (int rc = read_payload_prefix(e, len, false); rc != 0) return rc;

    uint64_t wire = header_.is_encrypted ? enc::sealed_len(len) : len;
    if (int rc = copy_plain(-1, wire, e); rc != 0) return rc;

    out.push_back(e);
    seen++;
  }
  return finish(seen);
}

}
