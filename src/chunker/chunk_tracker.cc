#include "chunker/chunk_tracker.hh"
#include "core/logging.hh"

namespace qx {

ChunkTracker::ChunkTracker(Manifest manifest)
    : manifest_(std::move(manifest))
    , received_(manifest_.chunks.size(), false) {}

AcceptResult ChunkTracker::accept(std::uint32_t index, std::span<const std::uint8_t> data) {
    // Hash outside the lock; the manifest is immutable
    switch (manifest_.verify_chunk(index, data)) {
        case ChunkCheck::OUT_OF_RANGE:
            return AcceptResult::OUT_OF_RANGE;
        case ChunkCheck::LENGTH_MISMATCH:
            QX_LOG_DEBUG(log::chunker) << "Chunk " << index << " length mismatch: got "
                                       << data.size() << ", want " << manifest_.chunks[index].length;
            return AcceptResult::LENGTH_MISMATCH;
        case ChunkCheck::HASH_MISMATCH:
            log::chunker.warn() << "Chunk " << index << " of " << manifest_.file_name
                                << " failed hash verification";
            return AcceptResult::HASH_MISMATCH;
        case ChunkCheck::OK:
            break;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (received_[index]) {
        return AcceptResult::DUPLICATE;
    }
    received_[index] = true;
    received_count_++;
    received_bytes_ += data.size();

    if (received_count_ == received_.size()) {
        QX_LOG_INFO(log::chunker) << "All " << received_count_ << " chunks of "
                                  << manifest_.file_name << " received";
    }
    return AcceptResult::ACCEPTED;
}

bool ChunkTracker::has(std::uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index < received_.size() && received_[index];
}

std::vector<std::uint32_t> ChunkTracker::missing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::uint32_t> out;
    out.reserve(received_.size() - received_count_);
    for (std::uint32_t i = 0; i < received_.size(); ++i) {
        if (!received_[i]) {
            out.push_back(i);
        }
    }
    return out;
}

std::uint32_t ChunkTracker::received_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_count_;
}

std::uint64_t ChunkTracker::received_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_bytes_;
}

bool ChunkTracker::is_complete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_count_ == received_.size();
}

}  // namespace qx
