#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace arc {

inline constexpr size_t MAX_RUN = 8;   // a u64 never needs more

inline bool is_flag_set(uint8_t data, uint8_t flag){ return (data & flag) != 0; }

// Minimal little-endian byte run: leading (big-endian) zero bytes are
// dropped, so 0 encodes as an empty run. Returns the run length.
size_t run_len(uint64_t v);
size_t put_run(uint64_t v, std::vector<uint8_t>& out);

// The byte count is authoritative; bytes beyond the run are zero.
// Returns -1 if n > MAX_RUN.
int get_run(const uint8_t* p, size_t n, uint64_t& v);

void put_be16(uint16_t v, std::vector<uint8_t>& out);
uint16_t get_be16(const uint8_t* p);

void put_le64(uint64_t v, std::vector<uint8_t>& out);
uint64_t get_le64(const uint8_t* p);

}
