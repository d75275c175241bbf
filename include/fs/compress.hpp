#pragma once
#include <string>

namespace fs {

inline constexpr int ZLIB_LEVEL = 9;

// Whole-file zlib transforms. The result is a new temp file created in
// dest_dir; its path is returned through out. 0, -errno or
// stow::ST_COMPRESS. A failed call leaves no output file behind.
int compress_file(const std::string& src, const std::string& dest_dir, std::string& out);
int decompress_file(const std::string& src, const std::string& dest_dir, std::string& out);

}
