#pragma once
#include <string>

namespace fs {

// Private temp directory, removed with its contents on destruction.
// Owned by whoever runs the archive operation; never shared by path.
class ScratchDir {
public:
  // parent empty -> $TMPDIR or /tmp
  explicit ScratchDir(const std::string& parent = "");
  ~ScratchDir();

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  // 0 when the directory exists, else -errno from mkdtemp
  int status() const { return rc_; }
  const std::string& path() const { return path_; }

  // Unique empty file inside the directory. 0 or -errno.
  int make_temp(const std::string& stem, std::string& out) const;

private:
  std::string path_;
  int rc_{0};
};

// Unique empty file "<dir>/<stem>.XXXXXX". 0 or -errno.
int make_temp_in(const std::string& dir, const std::string& stem, std::string& out);

// rm -r; 0 or -errno
int remove_tree(const std::string& path);

}
