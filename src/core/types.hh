#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace qx {

// ============================================================================
// Hash Constants
// ============================================================================

// BLAKE3 default output length
inline constexpr std::size_t DIGEST_SIZE = 32;

// SHA-256 output length (fingerprints)
inline constexpr std::size_t SHA256_SIZE = 32;

// Hex characters of SHA-256(public_key) kept as a user fingerprint
inline constexpr std::size_t FINGERPRINT_HEX_CHARS = 16;

// Random bytes behind a registration id
inline constexpr std::size_t REGISTRATION_ID_SIZE = 16;

// ============================================================================
// Chunking Constants
// ============================================================================

inline constexpr std::uint32_t KIB = 1024;
inline constexpr std::uint32_t MIB = 1024 * KIB;

inline constexpr std::uint32_t DEFAULT_CHUNK_SIZE = 4 * MIB;
inline constexpr std::uint32_t MAX_CHUNK_SIZE = 256 * MIB;

// ============================================================================
// Rendezvous Constants
// ============================================================================

inline constexpr std::size_t USERNAME_MIN_LENGTH = 3;
inline constexpr std::size_t USERNAME_MAX_LENGTH = 32;

inline constexpr std::chrono::seconds DEFAULT_TOKEN_TTL{3600};          // 1 hour
inline constexpr std::chrono::seconds MAX_TOKEN_TTL{24 * 3600};         // 24 hours
inline constexpr std::chrono::seconds DEFAULT_SWEEP_INTERVAL{60};

// ============================================================================
// FEC Constants
// ============================================================================

inline constexpr std::uint32_t DEFAULT_DATA_SHARDS = 8;
inline constexpr std::uint32_t DEFAULT_PARITY_SHARDS = 2;
inline constexpr std::uint32_t MIN_PARITY_SHARDS = 1;
inline constexpr std::uint32_t MAX_PARITY_SHARDS = 10;

// ============================================================================
// Core Type Aliases
// ============================================================================

using digest_t = std::array<std::uint8_t, DIGEST_SIZE>;
using sha256_t = std::array<std::uint8_t, SHA256_SIZE>;
using bytes_t = std::vector<std::uint8_t>;

// ============================================================================
// Time Utilities
// ============================================================================

using system_time_t = std::chrono::system_clock::time_point;
using steady_time_t = std::chrono::steady_clock::time_point;

// RFC 3339 UTC rendering, second precision ("2024-01-31T12:00:00Z")
[[nodiscard]] std::string format_utc(system_time_t t);

// ============================================================================
// Serialization Helpers
// ============================================================================

// Little-endian encoding
inline void encode_u32(std::uint8_t* dst, std::uint32_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
}

inline void encode_u64(std::uint8_t* dst, std::uint64_t val) {
    for (std::size_t i = 0; i < 8; ++i) {
        dst[i] = static_cast<std::uint8_t>(val >> (8 * i));
    }
}

[[nodiscard]] inline std::uint32_t decode_u32(const std::uint8_t* src) {
    return static_cast<std::uint32_t>(src[0]) |
           (static_cast<std::uint32_t>(src[1]) << 8) |
           (static_cast<std::uint32_t>(src[2]) << 16) |
           (static_cast<std::uint32_t>(src[3]) << 24);
}

[[nodiscard]] inline std::uint64_t decode_u64(const std::uint8_t* src) {
    std::uint64_t val = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        val |= static_cast<std::uint64_t>(src[i]) << (8 * i);
    }
    return val;
}

// Append helpers used by the manifest codec
void append_u32(bytes_t& out, std::uint32_t val);
void append_u64(bytes_t& out, std::uint64_t val);
void append_string(bytes_t& out, std::string_view str);

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::optional<bytes_t> hex_to_bytes(std::string_view hex);

}  // namespace qx
