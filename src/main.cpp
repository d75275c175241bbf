#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>

#include "util.hpp"
#include "fs/scratch.hpp"
#include "stow/reader.hpp"
#include "stow/status.hpp"
#include "stow/writer.hpp"

static void usage(const char* prog){
  std::fprintf(stderr,
    "Usage: %s pack   <src-dir> <archive> [--compress] [--encrypt] [--scratch=<dir>] [-q]\n"
    "       %s unpack <archive> <dest-dir> [--compress] [--encrypt] [--scratch=<dir>] [-q]\n"
    "       %s list   <archive> [--compress] [--encrypt]\n"
    "Password for --encrypt is read from STOW_PASSWORD.\n", prog, prog, prog);
}

static int report(const char* what, int rc, const std::string& detail){
  if (rc == 0) return 0;
  std::fprintf(stderr, "%s failed: %s\n", what, stow::status_str(rc));
  if (!detail.empty()) std::fprintf(stderr, "  %s\n", detail.c_str());
  return 1;
}

int main(int argc, char* argv[]) {
  if (argc < 3) {
    usage(argv[0]);
    return 1;
  }

  const std::string cmd = argv[1];
  std::vector<std::string> pos;
  std::string scratch_parent;
  stow::Options opt;
  bool quiet = false;

  // Parse args: flags anywhere, the rest positional
  int i = 2;
  while (i < argc) {
    if (std::strcmp(argv[i], "--compress") == 0) {
      opt.with_compression(true);
      ++i;
    } else if (std::strcmp(argv[i], "--encrypt") == 0) {
      opt.encrypt = true;
      ++i;
    } else if (std::strcmp(argv[i], "-q") == 0) {
      quiet = true;
      ++i;
    } else if (std::strncmp(argv[i], "--scratch=", 10) == 0) {
      scratch_parent = util::rstrip_slash(util::expand_args(argv[i] + 10));
      ++i;
    } else if (std::strcmp(argv[i], "--scratch") == 0 && i + 1 < argc) {
      scratch_parent = util::rstrip_slash(util::expand_args(argv[i + 1]));
      i += 2;
    } else {
      pos.push_back(util::rstrip_slash(util::expand_args(argv[i])));
      ++i;
    }
  }

  if (opt.encrypt) {
    const char* pw = std::getenv("STOW_PASSWORD");
    if (!pw || !*pw) {
      // listing skips payloads and never needs the key
      if (cmd != "list") {
        std::fprintf(stderr, "STOW_PASSWORD not set\n");
        return 1;
      }
    } else {
      opt.with_password(pw);
    }
  }

  std::unique_ptr<fs::ScratchDir> scratch;
  if (!scratch_parent.empty()) {
    struct stat st{};
    if (stat(scratch_parent.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
      std::fprintf(stderr, "Invalid --scratch: '%s' is not a directory\n", scratch_parent.c_str());
      return 1;
    }
    scratch = std::make_unique<fs::ScratchDir>(scratch_parent);
    if (scratch->status() != 0) {
      std::perror("create scratch directory failed");
      return 1;
    }
  }

  auto progress = [quiet](const std::string& line) {
    if (!quiet) std::printf("%s\n", line.c_str());
  };

  if (cmd == "pack" && pos.size() == 2) {
    stow::Writer w(pos[0], pos[1], opt, scratch.get());
    w.set_progress(progress);
    return report("pack", w.run(), w.error());
  }

  if (cmd == "unpack" && pos.size() == 2) {
    stow::Reader r(pos[0], pos[1], opt, scratch.get());
    r.set_progress(progress);
    return report("unpack", r.run(), r.error());
  }

  if (cmd == "list" && pos.size() == 1) {
    stow::Reader r(pos[0], "", opt);
    std::vector<arc::Entry> entries;
    int rc = r.list(entries);
    if (rc != 0) return report("list", rc, r.error());

    std::printf("stow archive v%s, %llu entries%s%s\n",
      r.header().version.str().c_str(),
      (unsigned long long)r.header().file_count,
      r.header().is_compressed ? ", compressed" : "",
      r.header().is_encrypted ? ", encrypted" : "");
    for (auto &e : entries) {
      std::printf("%12llu  %s  %s\n", (unsigned long long)e.size,
        util::to_hex(e.checksum.data(), e.checksum.size()).c_str(), e.path.c_str());
    }
    return 0;
  }

  usage(argv[0]);
  return 1;
}
