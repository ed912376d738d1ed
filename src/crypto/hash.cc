#include "hash.hh"
#include "core/logging.hh"
#include <blake3.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace qx {

// ============================================================================
// Blake3Hasher Implementation
// ============================================================================

Blake3Hasher::Blake3Hasher()
    : state_(new blake3_hasher) {
    blake3_hasher_init(static_cast<blake3_hasher*>(state_));
}

Blake3Hasher::~Blake3Hasher() {
    delete static_cast<blake3_hasher*>(state_);
}

Blake3Hasher::Blake3Hasher(Blake3Hasher&& other) noexcept : state_(other.state_) {
    other.state_ = nullptr;
}

Blake3Hasher& Blake3Hasher::operator=(Blake3Hasher&& other) noexcept {
    if (this != &other) {
        delete static_cast<blake3_hasher*>(state_);
        state_ = other.state_;
        other.state_ = nullptr;
    }
    return *this;
}

void Blake3Hasher::update(std::span<const std::uint8_t> data) {
    update(data.data(), data.size());
}

void Blake3Hasher::update(const void* data, std::size_t len) {
    if (len == 0) {
        return;
    }
    blake3_hasher_update(static_cast<blake3_hasher*>(state_), data, len);
}

digest_t Blake3Hasher::finalize() const {
    digest_t result;
    blake3_hasher_finalize(static_cast<const blake3_hasher*>(state_), result.data(), result.size());
    return result;
}

void Blake3Hasher::reset() {
    blake3_hasher_init(static_cast<blake3_hasher*>(state_));
}

digest_t blake3(std::span<const std::uint8_t> data) {
    return blake3(data.data(), data.size());
}

digest_t blake3(const void* data, std::size_t len) {
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    if (len > 0) {
        blake3_hasher_update(&hasher, data, len);
    }
    digest_t result;
    blake3_hasher_finalize(&hasher, result.data(), result.size());
    return result;
}

std::string_view blake3_library_version() {
    return blake3_version();
}

// ============================================================================
// SHA-256
// ============================================================================

sha256_t sha256(std::span<const std::uint8_t> data) {
    sha256_t result;
    unsigned int out_len = static_cast<unsigned int>(result.size());
    if (EVP_Digest(data.data(), data.size(), result.data(), &out_len, EVP_sha256(), nullptr) != 1) {
        log::crypto.error("SHA-256 failed");
        throw std::runtime_error("SHA-256 failed");
    }
    return result;
}

sha256_t sha256(std::string_view data) {
    return sha256(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

// ============================================================================
// Randomness
// ============================================================================

void random_bytes(std::span<std::uint8_t> buf) {
    if (buf.empty()) {
        return;
    }
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        log::crypto.error("RAND_bytes failed");
        throw std::runtime_error("RAND_bytes failed");
    }
}

std::string random_id_hex() {
    std::array<std::uint8_t, REGISTRATION_ID_SIZE> id;
    random_bytes(id);
    return bytes_to_hex(id);
}

// ============================================================================
// Merkle Tree Implementation
// ============================================================================

MerkleTree::MerkleTree(std::vector<digest_t> leaves) : leaves_(std::move(leaves)) {
    if (!leaves_.empty()) {
        build();
    }
}

void MerkleTree::build() {
    layers_.clear();
    layers_.push_back(leaves_);

    while (layers_.back().size() > 1) {
        const auto& prev = layers_.back();
        std::vector<digest_t> next;
        next.reserve((prev.size() + 1) / 2);

        for (std::size_t i = 0; i < prev.size(); i += 2) {
            const digest_t& right = (i + 1 < prev.size()) ? prev[i + 1] : prev[i];
            next.push_back(hash_pair(prev[i], right));
        }
        layers_.push_back(std::move(next));
    }

    root_ = layers_.back()[0];
}

digest_t MerkleTree::hash_pair(const digest_t& left, const digest_t& right) {
    Blake3Hasher hasher;
    hasher.update(left);
    hasher.update(right);
    return hasher.finalize();
}

std::vector<digest_t> MerkleTree::proof(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }

    std::vector<digest_t> path;
    std::size_t idx = index;

    for (std::size_t layer = 0; layer + 1 < layers_.size(); ++layer) {
        const auto& current = layers_[layer];
        std::size_t sibling = (idx % 2 == 0) ? idx + 1 : idx - 1;
        path.push_back(sibling < current.size() ? current[sibling] : current[idx]);
        idx /= 2;
    }

    return path;
}

bool MerkleTree::verify(const digest_t& leaf, const std::vector<digest_t>& proof,
                        std::size_t index, const digest_t& root) {
    digest_t current = leaf;
    std::size_t idx = index;

    for (const auto& sibling : proof) {
        current = (idx % 2 == 0) ? hash_pair(current, sibling) : hash_pair(sibling, current);
        idx /= 2;
    }

    return idx == 0 && current == root;
}

digest_t compute_merkle_root(std::span<const digest_t> leaves) {
    if (leaves.empty()) {
        return {};
    }

    std::vector<digest_t> layer(leaves.begin(), leaves.end());
    while (layer.size() > 1) {
        std::vector<digest_t> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const digest_t& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(MerkleTree::hash_pair(layer[i], right));
        }
        layer = std::move(next);
    }

    return layer[0];
}

}  // namespace qx
