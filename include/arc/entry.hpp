#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "enc/digest.hpp"

namespace arc {

inline constexpr size_t  MAX_PATH_LEN   = 0xffff;
inline constexpr uint8_t TYPE_FILE      = 0x80;
inline constexpr uint8_t TYPE_DIR       = 0x40;
inline constexpr uint8_t TYPE_SYMLINK   = 0x20;
inline constexpr uint8_t TYPE_MASK      = TYPE_FILE | TYPE_DIR | TYPE_SYMLINK;
inline constexpr uint8_t SIZE_LEN_MASK  = 0x0f;

enum class EntryType : uint8_t { Regular, Directory, Symlink };

uint8_t type_bits(EntryType t);

//  be16 path_len | path | type:3 _:1 size_len:4 | size[size_len] | md5[16]
struct Entry {
  std::string   path;                  // root-relative, '/' separated
  EntryType     type{EntryType::Regular};
  uint64_t      size{0};
  enc::Checksum checksum{};            // zero = not computed
};

// Build from an on-disk file: lstat + streamed digest. rel is the stored path.
int entry_from_file(const std::string& full, const std::string& rel, Entry& e);

// ST_PATH_TOO_LONG when the path does not fit the u16 length field
int encode_entry(const Entry& e, std::vector<uint8_t>& out);

// Field-granular decoders for a streaming reader. Each consumes exactly
// the bytes of its field and returns 0 or a negative stow::Status.
uint16_t decode_path_len(const uint8_t p[2]);
int decode_path(const uint8_t* p, size_t n, Entry& e);
// Sets type; size_len receives the byte count of the following size run
int decode_type(uint8_t b, Entry& e, size_t& size_len);
int decode_size(const uint8_t* p, size_t n, Entry& e);
int decode_checksum(const uint8_t* p, size_t n, Entry& e);

}
