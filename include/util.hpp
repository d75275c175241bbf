#pragma once
#include <cstddef>
#include <string>
#include <cstdint>
#include <unistd.h>

namespace util {

std::string expand_args(const std::string& path);

std::string rstrip_slash(std::string p);

// "a/b" + "c" -> "a/b/c"
std::string join_path(const std::string& a, const std::string& b);

std::string parent_of(const std::string& path);

std::string to_hex(const uint8_t* p, size_t n);

namespace enc {

// Ensure randomness has enough size
int fill_rand(void* p, size_t n);

uint32_t htobe_u32(uint32_t x);

}


namespace fs {

// Loop until n bytes moved, EOF or error. Returns bytes moved or -errno.
ssize_t full_read(int fd, void *buf, size_t n);
ssize_t full_write(int fd, const void *buf, size_t n);

// mkdir -p; 0 or -errno
int make_dirs(const std::string& path, mode_t mode = 0755);

// Rejects empty, absolute, "." and ".." components
int validate_rel_path(const std::string& rel);

}

}
