#include "chunker/manifest.hh"
#include "crypto/hash.hh"
#include <algorithm>

namespace qx {

namespace {

constexpr std::uint8_t MANIFEST_MAGIC[4] = {'Q', 'X', 'M', '1'};

// Bounds-checked reader over a serialized manifest
class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> data) : data_(data) {}

    bool read_u8(std::uint8_t& out) {
        if (!has(1)) return false;
        out = data_[pos_++];
        return true;
    }

    bool read_u32(std::uint32_t& out) {
        if (!has(4)) return false;
        out = decode_u32(data_.data() + pos_);
        pos_ += 4;
        return true;
    }

    bool read_u64(std::uint64_t& out) {
        if (!has(8)) return false;
        out = decode_u64(data_.data() + pos_);
        pos_ += 8;
        return true;
    }

    bool read_digest(digest_t& out) {
        if (!has(DIGEST_SIZE)) return false;
        std::copy_n(data_.begin() + pos_, DIGEST_SIZE, out.begin());
        pos_ += DIGEST_SIZE;
        return true;
    }

    bool read_string(std::string& out) {
        std::uint32_t len = 0;
        if (!read_u32(len) || !has(len)) return false;
        out.assign(reinterpret_cast<const char*>(data_.data() + pos_), len);
        pos_ += len;
        return true;
    }

    [[nodiscard]] std::size_t remaining() const { return data_.size() - pos_; }

private:
    [[nodiscard]] bool has(std::size_t n) const { return data_.size() - pos_ >= n; }

    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

}  // namespace

// ============================================================================
// Chunk Layout
// ============================================================================

std::uint64_t expected_chunk_count(std::uint64_t file_size, std::uint32_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    if (file_size == 0) {
        return 1;
    }
    return (file_size + chunk_size - 1) / chunk_size;
}

// ============================================================================
// Manifest Implementation
// ============================================================================

bool Manifest::validate() const {
    if (chunk_size == 0 || chunk_size > MAX_CHUNK_SIZE) {
        return false;
    }
    if (chunk_count != chunks.size()) {
        return false;
    }
    if (chunk_count != expected_chunk_count(file_size, chunk_size)) {
        return false;
    }

    std::uint64_t offset = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& c = chunks[i];
        if (c.index != i || c.offset != offset) {
            return false;
        }
        bool last = (i + 1 == chunks.size());
        if (!last && c.length != chunk_size) {
            return false;
        }
        if (last) {
            if (c.length > chunk_size) return false;
            if (file_size > 0 && c.length == 0) return false;
        }
        offset += c.length;
    }
    if (offset != file_size) {
        return false;
    }

    std::vector<digest_t> leaves;
    leaves.reserve(chunks.size());
    for (const auto& c : chunks) {
        leaves.push_back(c.hash);
    }
    return compute_merkle_root(leaves) == merkle_root;
}

ChunkCheck Manifest::verify_chunk(std::uint32_t index,
                                  std::span<const std::uint8_t> data) const {
    if (index >= chunks.size()) {
        return ChunkCheck::OUT_OF_RANGE;
    }
    const auto& desc = chunks[index];
    if (data.size() != desc.length) {
        return ChunkCheck::LENGTH_MISMATCH;
    }
    if (blake3(data) != desc.hash) {
        return ChunkCheck::HASH_MISMATCH;
    }
    return ChunkCheck::OK;
}

std::vector<digest_t> Manifest::chunk_proof(std::uint32_t index) const {
    std::vector<digest_t> leaves;
    leaves.reserve(chunks.size());
    for (const auto& c : chunks) {
        leaves.push_back(c.hash);
    }
    return MerkleTree(std::move(leaves)).proof(index);
}

digest_t Manifest::manifest_hash() const {
    return blake3(serialize());
}

bytes_t Manifest::serialize() const {
    bytes_t out;
    out.reserve(4 + 2 + 4 + file_name.size() + 8 + 4 + 4 + DIGEST_SIZE +
                chunks.size() * ChunkDescriptor::SERIALIZED_SIZE);

    out.insert(out.end(), std::begin(MANIFEST_MAGIC), std::end(MANIFEST_MAGIC));
    out.push_back(FORMAT_VERSION);
    out.push_back(static_cast<std::uint8_t>(hash_algorithm));
    append_string(out, file_name);
    append_u64(out, file_size);
    append_u32(out, chunk_size);
    append_u32(out, chunk_count);
    out.insert(out.end(), merkle_root.begin(), merkle_root.end());

    for (const auto& c : chunks) {
        append_u32(out, c.index);
        append_u64(out, c.offset);
        append_u32(out, c.length);
        out.insert(out.end(), c.hash.begin(), c.hash.end());
    }

    return out;
}

std::optional<Manifest> Manifest::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < sizeof(MANIFEST_MAGIC) ||
        !std::equal(std::begin(MANIFEST_MAGIC), std::end(MANIFEST_MAGIC), data.begin())) {
        return std::nullopt;
    }

    Reader reader(data.subspan(sizeof(MANIFEST_MAGIC)));
    Manifest m;

    std::uint8_t version = 0;
    std::uint8_t algo = 0;
    if (!reader.read_u8(version) || version != FORMAT_VERSION) return std::nullopt;
    if (!reader.read_u8(algo) || algo != static_cast<std::uint8_t>(HashAlgorithm::BLAKE3)) {
        return std::nullopt;
    }
    m.hash_algorithm = static_cast<HashAlgorithm>(algo);

    if (!reader.read_string(m.file_name) ||
        !reader.read_u64(m.file_size) ||
        !reader.read_u32(m.chunk_size) ||
        !reader.read_u32(m.chunk_count) ||
        !reader.read_digest(m.merkle_root)) {
        return std::nullopt;
    }

    // Reject counts the remaining bytes cannot hold before allocating
    if (reader.remaining() != static_cast<std::size_t>(m.chunk_count) * ChunkDescriptor::SERIALIZED_SIZE) {
        return std::nullopt;
    }

    m.chunks.resize(m.chunk_count);
    for (auto& c : m.chunks) {
        if (!reader.read_u32(c.index) ||
            !reader.read_u64(c.offset) ||
            !reader.read_u32(c.length) ||
            !reader.read_digest(c.hash)) {
            return std::nullopt;
        }
    }

    if (!m.validate()) {
        return std::nullopt;
    }
    return m;
}

}  // namespace qx
