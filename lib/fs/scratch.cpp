#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include "fs/scratch.hpp"
#include "util.hpp"

namespace fs {

ScratchDir::ScratchDir(const std::string& parent){
  std::string base = parent;
  if (base.empty()){
    const char *t = std::getenv("TMPDIR");
    base = (t && *t) ? t : "/tmp";
  }
  std::string tmpl = util::join_path(util::rstrip_slash(base), "stow.XXXXXX");
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');

  if (mkdtemp(buf.data()) == nullptr){
    rc_ = -errno;
    std::fprintf(stderr, "[SCRATCH] mkdtemp in '%s' failed (%m)\n", base.c_str());
    return;
  }
  path_ = buf.data();
}

ScratchDir::~ScratchDir(){
  if (rc_ != 0 || path_.empty()) return;
  if (int rc = remove_tree(path_); rc != 0){
    std::fprintf(stderr, "[SCRATCH] cleanup of '%s' failed: %d\n", path_.c_str(), rc);
  }
}

int ScratchDir::make_temp(const std::string& stem, std::string& out) const {
  if (rc_ != 0) return rc_;
  return make_temp_in(path_, stem, out);
}

int make_temp_in(const std::string& dir, const std::string& stem, std::string& out){
  std::string tmpl = util::join_path(dir, stem + ".XXXXXX");
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');

  int fd = mkstemp(buf.data());
  if (fd == -1) return -errno;
  close(fd);
  out = buf.data();
  return 0;
}

int remove_tree(const std::string& path){
  struct stat st{};
  if (lstat(path.c_str(), &st) == -1) return (errno == ENOENT) ? 0 : -errno;
  if (!S_ISDIR(st.st_mode)) return (unlink(path.c_str()) == -1) ? -errno : 0;

  DIR *dp = opendir(path.c_str());
  if (!dp) return -errno;

  std::vector<std::string> names;
  errno = 0;
  for (;;){
    struct dirent *de = readdir(dp);
    if (!de) break;
    std::string n = de->d_name;
    if (n == "." || n == "..") continue;
    names.push_back(n);
  }
  int e = errno;
  closedir(dp);
  if (e) return -e;

  for (auto &n : names){
    if (int rc = remove_tree(util::join_path(path, n)); rc != 0) return rc;
  }
  return (rmdir(path.c_str()) == -1) ? -errno : 0;
}

}
