#pragma once
#include <cstdint>
#include <cstddef>

namespace enc {
inline constexpr uint32_t CHUNK_SIZE      = 64 * 1024; // 64 KiB plaintext per stream chunk
inline constexpr size_t   TAG_SIZE        = 16;        // GCM tag
inline constexpr size_t   SALT_SIZE       = 32;        // per-archive salt
inline constexpr size_t   KEY_SIZE        = 32;        // AES-256
inline constexpr size_t   NONCE_SIZE      = 12;        // GCM standard
inline constexpr size_t   PREFIX_SIZE     = NONCE_SIZE - 4 - 1;  // prefix | be32 counter | last flag
inline constexpr size_t   DIGEST_SIZE     = 16;        // MD5
inline constexpr uint32_t KDF_ITERATIONS  = 210000;    // PBKDF2-HMAC-SHA256
} // namespace enc
