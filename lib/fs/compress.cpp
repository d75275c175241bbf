#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <vector>
#include <zlib.h>

#include "fs/compress.hpp"
#include "fs/scratch.hpp"
#include "stow/status.hpp"
#include "util.hpp"

namespace fs {

static constexpr size_t ZBUF_SIZE = 64 * 1024;

static std::string stem_of(const std::string& path){
  std::string p = util::rstrip_slash(path);
  size_t slash = p.rfind('/');
  std::string name = (slash == std::string::npos) ? p : p.substr(slash + 1);
  return name.empty() ? "stow" : name;
}

// Pump src_fd through an initialised z_stream into dst_fd.
// deflating selects deflate()/inflate() semantics.
static int pump(z_stream& zs, bool deflating, int src_fd, int dst_fd){
  std::vector<uint8_t> in(ZBUF_SIZE), out(ZBUF_SIZE);
  int zrc = Z_OK;
  bool eof = false;

  while (zrc != Z_STREAM_END){
    if (zs.avail_in == 0 && !eof){
      ssize_t n = util::fs::full_read(src_fd, in.data(), in.size());
      if (n < 0) return static_cast<int>(n);
      eof = (static_cast<size_t>(n) < in.size());
      zs.next_in = in.data();
      zs.avail_in = static_cast<uInt>(n);
    }

    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());
    if (deflating){
      zrc = deflate(&zs, eof ? Z_FINISH : Z_NO_FLUSH);
      if (zrc == Z_STREAM_ERROR) return stow::ST_COMPRESS;
    } else {
      zrc = inflate(&zs, Z_NO_FLUSH);
      if (zrc == Z_NEED_DICT || zrc == Z_DATA_ERROR || zrc == Z_MEM_ERROR || zrc == Z_STREAM_ERROR){
        std::fprintf(stderr, "[ZLIB] inflate failed: %s\n", zs.msg ? zs.msg : "unknown");
        return stow::ST_COMPRESS;
      }
      // no progress with input exhausted: stream is cut short
      if (zrc == Z_BUF_ERROR && eof && zs.avail_in == 0) return stow::ST_COMPRESS;
    }

    size_t have = out.size() - zs.avail_out;
    if (have > 0){
      ssize_t w = util::fs::full_write(dst_fd, out.data(), have);
      if (w < 0) return static_cast<int>(w);
    }

    if (!deflating && eof && zs.avail_in == 0 && zrc != Z_STREAM_END && have == 0)
      return stow::ST_COMPRESS;
  }
  return 0;
}

static int transform(const std::string& src, const std::string& dest_dir,
                     const char* suffix, bool deflating, std::string& out){
  int src_fd = open(src.c_str(), O_RDONLY | O_CLOEXEC);
  if (src_fd == -1) return -errno;

  std::string tmp;
  if (int rc = make_temp_in(dest_dir, stem_of(src) + suffix, tmp); rc != 0){
    close(src_fd);
    return rc;
  }
  int dst_fd = open(tmp.c_str(), O_WRONLY | O_TRUNC | O_CLOEXEC);
  if (dst_fd == -1){
    int se = errno;
    close(src_fd);
    unlink(tmp.c_str());
    return -se;
  }

  z_stream zs{};
  int zrc = deflating ? deflateInit(&zs, ZLIB_LEVEL) : inflateInit(&zs);
  int rc = (zrc == Z_OK) ? pump(zs, deflating, src_fd, dst_fd) : stow::ST_COMPRESS;
  if (zrc == Z_OK){
    if (deflating) deflateEnd(&zs);
    else inflateEnd(&zs);
  }

  close(src_fd);
  if (close(dst_fd) == -1 && rc == 0) rc = -errno;
  if (rc != 0){
    unlink(tmp.c_str());
    return rc;
  }
  out = tmp;
  return 0;
}

int compress_file(const std::string& src, const std::string& dest_dir, std::string& out){
  return transform(src, dest_dir, ".z", true, out);
}

int decompress_file(const std::string& src, const std::string& dest_dir, std::string& out){
  return transform(src, dest_dir, ".unz", false, out);
}

}
