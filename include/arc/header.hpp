#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace arc {

inline constexpr char     LABEL[]        = "STOW-ARCHIVE-FS";
inline constexpr size_t   LABEL_SIZE     = sizeof(LABEL) - 1;   // no terminator on disk
inline constexpr uint8_t  VERSION_MARKER = 0x56;                // 'V'
inline constexpr size_t   VERSION_SIZE   = 1 + 3;               // marker | major | minor | patch
inline constexpr uint8_t  FLAG_ENCRYPTED = 0x80;
inline constexpr uint8_t  FLAG_COMPRESSED = 0x40;

struct Version {
  uint8_t major{0};
  uint8_t minor{0};
  uint8_t patch{0};

  std::string str() const;
};

// Version this build writes and accepts
Version current_version();

//  label[15] | 'V' | major | minor | patch | flags | n | count[n]
struct Header {
  Version  version{current_version()};
  bool     is_encrypted{false};
  bool     is_compressed{false};
  uint64_t file_count{0};
};

std::vector<uint8_t> encode_header(const Header& h);

// Field-granular decoders; each takes exactly the bytes of its field.
// They return 0 or a negative stow::Status.
int decode_label(const uint8_t* p, size_t n);
int decode_version(const uint8_t* p, size_t n, Header& h,
                   const Version& self = current_version());
int decode_flags(uint8_t b, Header& h);
// Byte count of the file_count run; ST_BAD_FIELD when > 8.
int decode_file_count_len(uint8_t b, size_t& n);
int decode_file_count(const uint8_t* p, size_t n, Header& h);

} // namespace arc
