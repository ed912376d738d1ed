#include "chunker/chunker.hh"
#include "core/thread_group.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include <algorithm>
#include <cstdio>
#include <limits>
#include <memory>
#include <system_error>

namespace qx {

namespace {

struct FileCloser {
    void operator()(std::FILE* f) const {
        if (f != nullptr) {
            std::fclose(f);
        }
    }
};

using file_ptr = std::unique_ptr<std::FILE, FileCloser>;

// Result of resolving a path to an open regular file
struct OpenedFile {
    ChunkerError error = ChunkerError::NONE;
    std::string detail;
    file_ptr file;
    std::uint64_t size = 0;
};

OpenedFile open_regular_file(const std::filesystem::path& path) {
    OpenedFile out;
    std::error_code ec;

    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        out.error = ChunkerError::NOT_FOUND;
        out.detail = "no such file: " + path.string();
        return out;
    }
    if (!std::filesystem::is_regular_file(status)) {
        out.error = ChunkerError::NOT_FOUND;
        out.detail = "not a regular file: " + path.string();
        return out;
    }

    out.size = std::filesystem::file_size(path, ec);
    if (ec) {
        out.error = ChunkerError::IO_ERROR;
        out.detail = "cannot stat " + path.string() + ": " + ec.message();
        return out;
    }

    out.file.reset(std::fopen(path.c_str(), "rb"));
    if (!out.file) {
        out.error = ChunkerError::NOT_FOUND;
        out.detail = "cannot open " + path.string();
        return out;
    }
    return out;
}

// Reads exactly buf.size() bytes; a short read means the file shrank or failed
bool read_exact(std::FILE* f, std::span<std::uint8_t> buf) {
    if (buf.empty()) {
        return true;
    }
    return std::fread(buf.data(), 1, buf.size(), f) == buf.size();
}

bool valid_chunk_size(std::uint32_t chunk_size) {
    return chunk_size > 0 && chunk_size <= MAX_CHUNK_SIZE;
}

ManifestResult manifest_error(ChunkerError err, std::string detail) {
    ManifestResult result;
    result.error = err;
    result.detail = std::move(detail);
    return result;
}

}  // namespace

// ============================================================================
// compute_manifest
// ============================================================================

ManifestResult compute_manifest(const std::filesystem::path& path, const ChunkOptions& options) {
    if (!valid_chunk_size(options.chunk_size)) {
        return manifest_error(ChunkerError::INVALID_INPUT,
                              "chunk size must be in [1, " + std::to_string(MAX_CHUNK_SIZE) + "]");
    }
    if (options.hash_threads == 0) {
        return manifest_error(ChunkerError::INVALID_INPUT, "hash_threads must be at least 1");
    }

    auto opened = open_regular_file(path);
    if (opened.error != ChunkerError::NONE) {
        log::chunker.warn(opened.detail);
        return manifest_error(opened.error, std::move(opened.detail));
    }

    std::uint64_t count = expected_chunk_count(opened.size, options.chunk_size);
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        return manifest_error(ChunkerError::INVALID_INPUT, "file has too many chunks for chunk size");
    }

    Manifest manifest;
    manifest.file_name = path.filename().string();
    manifest.file_size = opened.size;
    manifest.chunk_size = options.chunk_size;
    manifest.chunk_count = static_cast<std::uint32_t>(count);
    manifest.hash_algorithm = HashAlgorithm::BLAKE3;
    manifest.chunks.resize(manifest.chunk_count);

    QX_LOG_DEBUG(log::chunker) << "Chunking " << path.string() << ": " << opened.size
                               << " bytes, " << manifest.chunk_count << " chunks of "
                               << options.chunk_size << ", " << options.hash_threads
                               << " hash threads";

    const std::uint32_t batch = std::min<std::uint32_t>(options.hash_threads, manifest.chunk_count);
    std::vector<bytes_t> buffers(batch);

    std::uint64_t offset = 0;
    for (std::uint32_t first = 0; first < manifest.chunk_count; first += batch) {
        const std::uint32_t n = std::min(batch, manifest.chunk_count - first);

        // Sequential read of the batch
        for (std::uint32_t j = 0; j < n; ++j) {
            if (options.should_cancel && options.should_cancel()) {
                QX_LOG_INFO(log::chunker) << "Chunking of " << path.string()
                                          << " cancelled at chunk " << (first + j);
                return manifest_error(ChunkerError::CANCELLED, "cancelled");
            }

            auto& desc = manifest.chunks[first + j];
            desc.index = first + j;
            desc.offset = offset;
            desc.length = static_cast<std::uint32_t>(
                std::min<std::uint64_t>(options.chunk_size, opened.size - offset));

            buffers[j].resize(desc.length);
            if (!read_exact(opened.file.get(), buffers[j])) {
                std::string detail = "read failed at offset " + std::to_string(offset) +
                                     " of " + path.string();
                log::chunker.error(detail);
                return manifest_error(ChunkerError::IO_ERROR, std::move(detail));
            }
            offset += desc.length;
        }

        // Hash the batch; chunk hashes land at fixed indices so order is stable
        if (n == 1) {
            manifest.chunks[first].hash = blake3(buffers[0]);
        } else {
            ThreadGroup workers;
            workers.reserve(n);
            bool started = true;
            for (std::uint32_t j = 0; j < n && started; ++j) {
                started = workers.spawn([&manifest, &buffers, first, j] {
                    manifest.chunks[first + j].hash = blake3(buffers[j]);
                });
            }
            workers.join_all();
            if (!started) {
                return manifest_error(ChunkerError::IO_ERROR,
                                      "could not start hash threads for " + path.string());
            }
        }
    }

    std::vector<digest_t> leaves;
    leaves.reserve(manifest.chunks.size());
    for (const auto& c : manifest.chunks) {
        leaves.push_back(c.hash);
    }
    manifest.merkle_root = compute_merkle_root(leaves);

    QX_LOG_INFO(log::chunker) << "Manifest for " << manifest.file_name << ": "
                              << manifest.chunk_count << " chunks, root "
                              << bytes_to_hex(manifest.merkle_root).substr(0, 16);

    ManifestResult result;
    result.manifest = std::move(manifest);
    return result;
}

// ============================================================================
// read_chunk
// ============================================================================

ChunkReadResult read_chunk(const std::filesystem::path& path,
                           std::uint32_t index,
                           std::uint32_t chunk_size) {
    ChunkReadResult result;

    if (!valid_chunk_size(chunk_size)) {
        result.error = ChunkerError::INVALID_INPUT;
        result.detail = "invalid chunk size";
        return result;
    }

    auto opened = open_regular_file(path);
    if (opened.error != ChunkerError::NONE) {
        result.error = opened.error;
        result.detail = std::move(opened.detail);
        return result;
    }

    const std::uint64_t offset = static_cast<std::uint64_t>(index) * chunk_size;
    if (opened.size == 0 && index == 0) {
        return result;
    }
    if (offset >= opened.size) {
        result.error = ChunkerError::INVALID_INPUT;
        result.detail = "chunk " + std::to_string(index) + " is past end of file";
        return result;
    }

    if (::fseeko(opened.file.get(), static_cast<off_t>(offset), SEEK_SET) != 0) {
        result.error = ChunkerError::IO_ERROR;
        result.detail = "seek failed at offset " + std::to_string(offset);
        log::chunker.error(result.detail);
        return result;
    }

    auto length = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size, opened.size - offset));
    result.data.resize(length);
    if (!read_exact(opened.file.get(), result.data)) {
        result.error = ChunkerError::IO_ERROR;
        result.detail = "short read of chunk " + std::to_string(index);
        result.data.clear();
        log::chunker.error(result.detail);
        return result;
    }

    QX_LOG_TRACE(log::chunker) << "Read chunk " << index << " (" << length << " bytes)";
    return result;
}

}  // namespace qx
