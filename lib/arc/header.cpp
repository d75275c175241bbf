#include <cstdio>
#include <cstring>

#include "arc/binary.hpp"
#include "arc/header.hpp"
#include "stow/status.hpp"

using namespace stow;

namespace arc {

std::string Version::str() const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%u.%u.%u", major, minor, patch);
  return buf;
}

Version current_version(){
  return Version{STOW_VERSION_MAJOR, STOW_VERSION_MINOR, STOW_VERSION_PATCH};
}

std::vector<uint8_t> encode_header(const Header& h){
  std::vector<uint8_t> out(LABEL, LABEL + LABEL_SIZE);

  out.push_back(VERSION_MARKER);
  out.push_back(h.version.major);
  out.push_back(h.version.minor);
  out.push_back(h.version.patch);

  uint8_t flags = 0;
  if (h.is_encrypted)  flags |= FLAG_ENCRYPTED;
  if (h.is_compressed) flags |= FLAG_COMPRESSED;
  out.push_back(flags);

  out.push_back(static_cast<uint8_t>(run_len(h.file_count)));
  put_run(h.file_count, out);
  return out;
}

int decode_label(const uint8_t *p, size_t n){
  if (n != LABEL_SIZE || std::memcmp(p, LABEL, LABEL_SIZE) != 0) return ST_BAD_LABEL;
  return 0;
}

int decode_version(const uint8_t *p, size_t n, Header& h, const Version& self){
  if (n != VERSION_SIZE || p[0] != VERSION_MARKER) return ST_BAD_VERSION_MARKER;

  h.version = Version{p[1], p[2], p[3]};
  if (h.version.major > self.major) return ST_VERSION_TOO_NEW;
  if (h.version.major < self.major) return ST_VERSION_TOO_OLD;
  if (h.version.minor > self.minor) return ST_MINOR_TOO_NEW;
  return 0;
}

int decode_flags(uint8_t b, Header& h){
  // Unknown bits are reserved and ignored
  h.is_encrypted  = is_flag_set(b, FLAG_ENCRYPTED);
  h.is_compressed = is_flag_set(b, FLAG_COMPRESSED);
  return 0;
}

int decode_file_count_len(uint8_t b, size_t& n){
  if (b > MAX_RUN) return ST_BAD_FIELD;
  n = b;
  return 0;
}

int decode_file_count(const uint8_t *p, size_t n, Header& h){
  uint64_t v = 0;
  if (get_run(p, n, v) != 0) return ST_BAD_FIELD;
  h.file_count = v;
  return 0;
}

}
