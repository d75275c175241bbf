#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "arc/binary.hpp"
#include "arc/entry.hpp"
#include "stow/status.hpp"
#include "util.hpp"

using namespace stow;

namespace arc {

uint8_t type_bits(EntryType t){
  switch (t){
    case EntryType::Regular:   return TYPE_FILE;
    case EntryType::Directory: return TYPE_DIR;
    case EntryType::Symlink:   return TYPE_SYMLINK;
  }
  return 0;
}

int entry_from_file(const std::string& full, const std::string& rel, Entry& e){
  struct stat st{};
  if (lstat(full.c_str(), &st) == -1) return -errno;

  e.path = rel;
  if (S_ISREG(st.st_mode))      e.type = EntryType::Regular;
  else if (S_ISDIR(st.st_mode)) e.type = EntryType::Directory;
  else if (S_ISLNK(st.st_mode)) e.type = EntryType::Symlink;
  else return ST_UNSUPPORTED_ENTRY;

  e.checksum = {};
  e.size = 0;
  if (e.type != EntryType::Regular) return 0;

  int fd = open(full.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
  if (fd == -1) return -errno;
  // size from the same fd that is hashed
  if (fstat(fd, &st) == -1){
    int se = errno;
    close(fd);
    return -se;
  }
  e.size = static_cast<uint64_t>(st.st_size);
  int rc = enc::digest_fd(fd, e.checksum);
  close(fd);
  return rc;
}

int encode_entry(const Entry& e, std::vector<uint8_t>& out){
  if (e.path.size() > MAX_PATH_LEN) return ST_PATH_TOO_LONG;

  put_be16(static_cast<uint16_t>(e.path.size()), out);
  out.insert(out.end(), e.path.begin(), e.path.end());

  out.push_back(static_cast<uint8_t>(type_bits(e.type) | run_len(e.size)));
  put_run(e.size, out);

  out.insert(out.end(), e.checksum.begin(), e.checksum.end());
  return 0;
}

uint16_t decode_path_len(const uint8_t p[2]){
  return get_be16(p);
}

int decode_path(const uint8_t *p, size_t n, Entry& e){
  std::string path(reinterpret_cast<const char*>(p), n);
  if (path.find('\0') != std::string::npos) return ST_BAD_FIELD;
  if (util::fs::validate_rel_path(path) != 0) return ST_BAD_FIELD;
  e.path = std::move(path);
  return 0;
}

int decode_type(uint8_t b, Entry& e, size_t& size_len){
  switch (b & TYPE_MASK){
    case TYPE_FILE:    e.type = EntryType::Regular; break;
    case TYPE_DIR:     e.type = EntryType::Directory; break;
    case TYPE_SYMLINK: e.type = EntryType::Symlink; break;
    default: return ST_BAD_FIELD;    // none or several type bits
  }
  size_len = b & SIZE_LEN_MASK;
  if (size_len > MAX_RUN) return ST_BAD_FIELD;
  return 0;
}

int decode_size(const uint8_t *p, size_t n, Entry& e){
  uint64_t v = 0;
  if (get_run(p, n, v) != 0) return ST_BAD_FIELD;
  e.size = v;
  return 0;
}

int decode_checksum(const uint8_t *p, size_t n, Entry& e){
  if (n != enc::DIGEST_SIZE) return ST_BAD_FIELD;
  std::memcpy(e.checksum.data(), p, n);
  return 0;
}

}
