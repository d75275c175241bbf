#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fcntl.h>
#include <pwd.h>
#include <sys/random.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

#include "util.hpp"


namespace util {

std::string expand_args(const std::string& path) {
  if (path.empty() || path[0] != '~') return path;

  if (path.size() == 1 || path[1] == '/') {
      const char* h = std::getenv("HOME");
      if (!h) {
          if (auto* pw = getpwuid(getuid())) h = pw->pw_dir;
      }
      return (h ? std::string(h) : std::string()) + path.substr(1);
  }

  size_t slash = path.find('/');
  std::string user = path.substr(1, (slash == std::string::npos ? std::string::npos : slash - 1));
  if (auto* pw = getpwnam(user.c_str())) {
      std::string home = pw->pw_dir;
      return home + (slash == std::string::npos ? "" : path.substr(slash));
  }
  return path;
}

std::string rstrip_slash(std::string p) {
  while (p.size() > 1 && p.back() == '/') p.pop_back();
  return p;
}

std::string join_path(const std::string& a, const std::string& b){
  if (a.empty()) return b;
  if (b.empty()) return a;
  if (a.back() == '/') return a + b;
  return a + "/" + b;
}

std::string parent_of(const std::string& path){
  std::string p = rstrip_slash(path);
  size_t slash = p.rfind('/');
  if (slash == std::string::npos) return ".";
  if (slash == 0) return "/";
  return p.substr(0, slash);
}

std::string to_hex(const uint8_t *p, size_t n){
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(n * 2);
  for (size_t i = 0; i < n; i++){
    out.push_back(digits[p[i] >> 4]);
    out.push_back(digits[p[i] & 0x0f]);
  }
  return out;
}

}

namespace util::fs {

ssize_t full_read(int fd, void *buf, size_t n){
  uint8_t *p = static_cast<uint8_t*>(buf);

  size_t done = 0;
  while (done < n){
    ssize_t r = read(fd, p+done, n-done);
    if (r < 0){
      if (errno==EINTR) continue;
      return -errno;
    }
    if (r == 0) break; // EOF
    done += (size_t)r;
  }
  return (ssize_t)done;
}

ssize_t full_write(int fd, const void *buf, size_t n){
  const uint8_t *p = static_cast<const uint8_t*>(buf);

  size_t done = 0;
  while (done < n){
    ssize_t w = write(fd, p+done, n-done);
    if (w < 0){
      if (errno==EINTR) continue;
      return -errno;
    }
    if (w == 0) return -EIO;
    done += (size_t)w;
  }
  return (ssize_t)done;
}

static std::vector<std::string> split_components(const std::string& path){
  std::vector<std::string> out;
  const char *p = path.c_str();
  while (*p){
    const char *start = p;
    while (*p && *p != '/') ++p;
    out.emplace_back(start, p - start);
    if (*p == '/') ++p;
  }
  return out;
}

int make_dirs(const std::string& path, mode_t mode){
  if (path.empty()) return -EINVAL;

  std::string cur = (path[0] == '/') ? "/" : "";
  for (auto &s : split_components(path[0] == '/' ? path.substr(1) : path)){
    if (s.empty()) continue;
    cur = util::join_path(cur, s);
    if (mkdir(cur.c_str(), mode) == 0) continue;
    if (errno != EEXIST) return -errno;

    struct stat st{};
    if (stat(cur.c_str(), &st) == -1) return -errno;
    if (!S_ISDIR(st.st_mode)) return -ENOTDIR;
  }
  return 0;
}

int validate_rel_path(const std::string& rel){
  if (rel.empty() || rel[0] == '/') return -EINVAL;

  for (auto &s : split_components(rel)){
    if (s == "." || s == ".." || s.empty()) return -EINVAL;
  }
  return 0;
}

}

namespace util::enc {

int fill_rand(void *p, size_t n){
  uint8_t *out = static_cast<uint8_t*>(p);
  size_t off = 0;
  while(off < n){
    ssize_t m = getrandom(out + off, n - off, 0);
    if (m < 0){
      if (errno == EINTR) continue;
      return -1;
    }
    off += static_cast<size_t>(m);
  }
  return 0;
}

uint32_t htobe_u32(uint32_t x){
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
  return __builtin_bswap32(x);
#else
  return x;
#endif

}

}
