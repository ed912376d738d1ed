#pragma once

#include "chunker/manifest.hh"
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace qx {

// ============================================================================
// Chunker Errors
// ============================================================================

enum class ChunkerError : std::uint8_t {
    NONE = 0,
    NOT_FOUND,       // Missing path, not a regular file, or cannot be opened
    IO_ERROR,        // Read failure or file changed size mid-scan
    CANCELLED,       // should_cancel() returned true
    INVALID_INPUT,   // Bad chunk size, thread count or chunk index
};

[[nodiscard]] inline std::string_view chunker_error_string(ChunkerError err) {
    switch (err) {
        case ChunkerError::NONE: return "none";
        case ChunkerError::NOT_FOUND: return "not_found";
        case ChunkerError::IO_ERROR: return "io_error";
        case ChunkerError::CANCELLED: return "cancelled";
        case ChunkerError::INVALID_INPUT: return "invalid_input";
    }
    return "unknown";
}

// ============================================================================
// Options
// ============================================================================

struct ChunkOptions {
    std::uint32_t chunk_size = DEFAULT_CHUNK_SIZE;

    // Chunks hashed concurrently per batch; 1 hashes inline on the calling thread
    std::uint32_t hash_threads = 1;

    // Polled between chunks; returning true aborts with CANCELLED
    std::function<bool()> should_cancel;
};

// ============================================================================
// Results
// ============================================================================

struct ManifestResult {
    ChunkerError error = ChunkerError::NONE;
    std::string detail;
    std::optional<Manifest> manifest;

    [[nodiscard]] bool ok() const { return error == ChunkerError::NONE && manifest.has_value(); }
};

struct ChunkReadResult {
    ChunkerError error = ChunkerError::NONE;
    std::string detail;
    bytes_t data;

    [[nodiscard]] bool ok() const { return error == ChunkerError::NONE; }
};

// ============================================================================
// Chunker Operations
// ============================================================================

// Builds the manifest of a file in one sequential pass. Never returns a
// partial manifest: any failure leaves result.manifest empty.
[[nodiscard]] ManifestResult compute_manifest(const std::filesystem::path& path,
                                              const ChunkOptions& options = ChunkOptions{});

// Re-reads bytes [index * chunk_size, (index + 1) * chunk_size) clamped to EOF.
// Index 0 of an empty file yields an empty buffer.
[[nodiscard]] ChunkReadResult read_chunk(const std::filesystem::path& path,
                                         std::uint32_t index,
                                         std::uint32_t chunk_size);

}  // namespace qx
