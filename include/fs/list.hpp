#pragma once
#include <string>
#include <vector>

namespace fs {

// Regular files below root, recursively. Names starting with '.' are
// skipped, symlinks are not followed, and each directory is visited in
// byte order of its entry names so the sequence is stable.
// Paths are returned as root + "/" + relative. 0 or -errno.
int list_files(const std::string& root, std::vector<std::string>& out);

}
