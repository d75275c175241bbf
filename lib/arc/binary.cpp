#include "arc/binary.hpp"

namespace arc {

size_t run_len(uint64_t v){
  size_t n = 0;
  while (v != 0){
    v >>= 8;
    n++;
  }
  return n;
}

size_t put_run(uint64_t v, std::vector<uint8_t>& out){
  size_t n = run_len(v);
  for (size_t i = 0; i < n; i++){
    out.push_back(static_cast<uint8_t>(v & 0xff));
    v >>= 8;
  }
  return n;
}

int get_run(const uint8_t *p, size_t n, uint64_t& v){
  if (n > MAX_RUN) return -1;
  v = 0;
  for (size_t i = 0; i < n; i++){
    v |= static_cast<uint64_t>(p[i]) << (8 * i);
  }
  return 0;
}

void put_be16(uint16_t v, std::vector<uint8_t>& out){
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v & 0xff));
}

uint16_t get_be16(const uint8_t *p){
  return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

void put_le64(uint64_t v, std::vector<uint8_t>& out){
  for (int i = 0; i < 8; i++){
    out.push_back(static_cast<uint8_t>(v & 0xff));
    v >>= 8;
  }
}

uint64_t get_le64(const uint8_t *p){
  uint64_t v = 0;
  for (int i = 7; i >= 0; i--){
    v = (v << 8) | p[i];
  }
  return v;
}

}
