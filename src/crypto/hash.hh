#pragma once

#include "core/types.hh"
#include <span>
#include <string_view>
#include <vector>

namespace qx {

// ============================================================================
// BLAKE3 Hashing
// ============================================================================

class Blake3Hasher {
public:
    Blake3Hasher();
    ~Blake3Hasher();

    Blake3Hasher(const Blake3Hasher&) = delete;
    Blake3Hasher& operator=(const Blake3Hasher&) = delete;
    Blake3Hasher(Blake3Hasher&&) noexcept;
    Blake3Hasher& operator=(Blake3Hasher&&) noexcept;

    void update(std::span<const std::uint8_t> data);
    void update(const void* data, std::size_t len);
    [[nodiscard]] digest_t finalize() const;

    void reset();

private:
    void* state_;
};

[[nodiscard]] digest_t blake3(std::span<const std::uint8_t> data);
[[nodiscard]] digest_t blake3(const void* data, std::size_t len);

// Version string reported by the linked BLAKE3 library
[[nodiscard]] std::string_view blake3_library_version();

// ============================================================================
// SHA-256 (OpenSSL EVP)
// ============================================================================

[[nodiscard]] sha256_t sha256(std::span<const std::uint8_t> data);
[[nodiscard]] sha256_t sha256(std::string_view data);

// ============================================================================
// Randomness (OpenSSL RAND)
// ============================================================================

// Fills buf from the OpenSSL CSPRNG; throws std::runtime_error on failure
void random_bytes(std::span<std::uint8_t> buf);

// Lowercase hex of REGISTRATION_ID_SIZE random bytes
[[nodiscard]] std::string random_id_hex();

// ============================================================================
// Merkle Tree Utilities
// ============================================================================

// Binary tree over an ordered leaf list. Parent = BLAKE3(left || right);
// an unpaired trailing node is hashed with itself. One leaf is its own root.
class MerkleTree {
public:
    explicit MerkleTree(std::vector<digest_t> leaves);

    [[nodiscard]] const digest_t& root() const { return root_; }
    [[nodiscard]] std::size_t leaf_count() const { return leaves_.size(); }

    // Sibling path from leaf to root; empty for an out-of-range index
    [[nodiscard]] std::vector<digest_t> proof(std::size_t index) const;
    [[nodiscard]] static bool verify(const digest_t& leaf, const std::vector<digest_t>& proof,
                                     std::size_t index, const digest_t& root);

    [[nodiscard]] static digest_t hash_pair(const digest_t& left, const digest_t& right);

private:
    std::vector<digest_t> leaves_;
    std::vector<std::vector<digest_t>> layers_;
    digest_t root_{};

    void build();
};

// Same root as MerkleTree(leaves).root() without keeping the layers
[[nodiscard]] digest_t compute_merkle_root(std::span<const digest_t> leaves);

}  // namespace qx
