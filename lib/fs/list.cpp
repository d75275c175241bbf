#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "fs/list.hpp"
#include "util.hpp"

namespace fs {

static int walk(const std::string& dir, std::vector<std::string>& out){
  int dfd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC | O_NOFOLLOW);
  if (dfd == -1) return -errno;

  DIR *dp = fdopendir(dfd);
  if (!dp) {
    int e = errno;
    close(dfd);
    return -e;
  }

  std::vector<std::string> files, dirs;
  errno = 0;
  for (;;){
    struct dirent *de = readdir(dp);
    if (!de) break;
    if (de->d_name[0] == '.') continue;     // also covers "." and ".."

    unsigned char type = de->d_type;
    if (type == DT_UNKNOWN){
      struct stat st{};
      if (fstatat(dfd, de->d_name, &st, AT_SYMLINK_NOFOLLOW) == -1){
        if (errno == ENOENT) continue;
        int e = errno;
        closedir(dp);
        return -e;
      }
      if (S_ISREG(st.st_mode)) type = DT_REG;
      else if (S_ISDIR(st.st_mode)) type = DT_DIR;
    }

    switch (type){
      case DT_REG: files.emplace_back(de->d_name); break;
      case DT_DIR: dirs.emplace_back(de->d_name); break;
      default: break;   // symlinks, devices, fifos, sockets
    }
    errno = 0;
  }

  int e = errno;
  closedir(dp);
  if (e) return -e;

  std::sort(files.begin(), files.end());
  std::sort(dirs.begin(), dirs.end());

  for (auto &f : files) out.push_back(util::join_path(dir, f));
  for (auto &d : dirs){
    if (int rc = walk(util::join_path(dir, d), out); rc != 0) return rc;
  }
  return 0;
}

int list_files(const std::string& root, std::vector<std::string>& out){
  out.clear();
  struct stat st{};
  if (lstat(root.c_str(), &st) == -1) return -errno;
  if (!S_ISDIR(st.st_mode)) return -ENOTDIR;
  return walk(util::rstrip_slash(root), out);
}

}
