#pragma once
#include <functional>
#include <string>

namespace stow {

struct Options {
  bool        encrypt{false};
  bool        compress{false};
  std::string password;

  Options& with_password(const std::string& pw){
    encrypt = true;
    password = pw;
    return *this;
  }
  Options& with_compression(bool on){
    compress = on;
    return *this;
  }
};

// One human-readable line per entry; purely observational
using ProgressFn = std::function<void(const std::string&)>;

}
