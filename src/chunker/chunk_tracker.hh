#pragma once

#include "chunker/manifest.hh"
#include <mutex>
#include <span>
#include <vector>

namespace qx {

enum class AcceptResult : std::uint8_t {
    ACCEPTED,
    DUPLICATE,
    HASH_MISMATCH,
    LENGTH_MISMATCH,
    OUT_OF_RANGE,
};

[[nodiscard]] inline std::string_view accept_result_string(AcceptResult result) {
    switch (result) {
        case AcceptResult::ACCEPTED: return "accepted";
        case AcceptResult::DUPLICATE: return "duplicate";
        case AcceptResult::HASH_MISMATCH: return "hash_mismatch";
        case AcceptResult::LENGTH_MISMATCH: return "length_mismatch";
        case AcceptResult::OUT_OF_RANGE: return "out_of_range";
    }
    return "unknown";
}

// Receiver-side bookkeeping of verified chunks for one manifest
class ChunkTracker {
public:
    explicit ChunkTracker(Manifest manifest);

    // Verifies data against the manifest entry and marks it received.
    // A chunk that failed verification can be accepted later.
    [[nodiscard]] AcceptResult accept(std::uint32_t index, std::span<const std::uint8_t> data);

    [[nodiscard]] bool has(std::uint32_t index) const;
    [[nodiscard]] std::vector<std::uint32_t> missing() const;
    [[nodiscard]] std::uint32_t received_count() const;
    [[nodiscard]] std::uint64_t received_bytes() const;
    [[nodiscard]] bool is_complete() const;

    [[nodiscard]] const Manifest& manifest() const { return manifest_; }

private:
    const Manifest manifest_;

    mutable std::mutex mutex_;
    std::vector<bool> received_;
    std::uint32_t received_count_ = 0;
    std::uint64_t received_bytes_ = 0;
};

}  // namespace qx
