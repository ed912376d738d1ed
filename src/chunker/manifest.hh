#pragma once

#include "core/types.hh"
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace qx {

// ============================================================================
// Hash Algorithm
// ============================================================================

// Wire values are stable; a new algorithm gets a new value
enum class HashAlgorithm : std::uint8_t {
    BLAKE3 = 1,
};

[[nodiscard]] inline std::string_view hash_algorithm_name(HashAlgorithm algo) {
    switch (algo) {
        case HashAlgorithm::BLAKE3: return "BLAKE3";
    }
    return "unknown";
}

// ============================================================================
// Chunk Descriptor
// ============================================================================

struct ChunkDescriptor {
    std::uint32_t index = 0;
    std::uint64_t offset = 0;
    std::uint32_t length = 0;
    digest_t hash{};

    bool operator==(const ChunkDescriptor&) const = default;

    static constexpr std::size_t SERIALIZED_SIZE =
        sizeof(std::uint32_t) +     // index
        sizeof(std::uint64_t) +     // offset
        sizeof(std::uint32_t) +     // length
        DIGEST_SIZE;                // hash
};

// ============================================================================
// Manifest
// ============================================================================

// Chunk verification outcome against a manifest
enum class ChunkCheck : std::uint8_t {
    OK,
    OUT_OF_RANGE,
    LENGTH_MISMATCH,
    HASH_MISMATCH,
};

[[nodiscard]] inline std::string_view chunk_check_string(ChunkCheck check) {
    switch (check) {
        case ChunkCheck::OK: return "ok";
        case ChunkCheck::OUT_OF_RANGE: return "out_of_range";
        case ChunkCheck::LENGTH_MISMATCH: return "length_mismatch";
        case ChunkCheck::HASH_MISMATCH: return "hash_mismatch";
    }
    return "unknown";
}

struct Manifest {
    std::string file_name;
    std::uint64_t file_size = 0;
    std::uint32_t chunk_size = 0;
    std::uint32_t chunk_count = 0;
    std::vector<ChunkDescriptor> chunks;
    HashAlgorithm hash_algorithm = HashAlgorithm::BLAKE3;
    digest_t merkle_root{};

    bool operator==(const Manifest&) const = default;

    // Structural invariants plus merkle_root == root(chunk hashes)
    [[nodiscard]] bool validate() const;

    // Length and BLAKE3 hash of a received chunk
    [[nodiscard]] ChunkCheck verify_chunk(std::uint32_t index,
                                          std::span<const std::uint8_t> data) const;

    // Inclusion proof of chunks[index].hash under merkle_root
    [[nodiscard]] std::vector<digest_t> chunk_proof(std::uint32_t index) const;

    // Digest of serialize(); the value senders register with the rendezvous service
    [[nodiscard]] digest_t manifest_hash() const;

    // Layout: "QXM1" | version u8 | algo u8 | name (u32 len + bytes) | file_size u64 |
    //         chunk_size u32 | chunk_count u32 | merkle_root | chunk_count * descriptor
    [[nodiscard]] bytes_t serialize() const;
    [[nodiscard]] static std::optional<Manifest> deserialize(std::span<const std::uint8_t> data);

    static constexpr std::uint8_t FORMAT_VERSION = 1;
};

// Expected number of chunks for a file: ceil(size / chunk_size), at least 1
[[nodiscard]] std::uint64_t expected_chunk_count(std::uint64_t file_size, std::uint32_t chunk_size);

}  // namespace qx
