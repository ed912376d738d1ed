#include <gtest/gtest.h>
#include "chunker/chunker.hh"
#include "crypto/hash.hh"
#include <algorithm>
#include <atomic>
#include <fstream>
#include <unistd.h>

namespace qx {
namespace {

class ChunkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("qx_chunker_test_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write_file(const std::string& name, const bytes_t& data) {
        auto path = dir_ / name;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        return path;
    }

    static bytes_t pattern(std::size_t n, std::uint8_t seed = 0) {
        bytes_t data(n);
        std::uint32_t x = 0x9E3779B9u + seed;
        for (auto& b : data) {
            x ^= x << 13;
            x ^= x >> 17;
            x ^= x << 5;
            b = static_cast<std::uint8_t>(x);
        }
        return data;
    }

    std::filesystem::path dir_;
};

TEST_F(ChunkerTest, SplitsIntoFullChunksAndShortTail) {
    auto data = pattern(2 * MIB + MIB / 2);
    auto path = write_file("two_and_a_half.bin", data);

    ChunkOptions opts;
    opts.chunk_size = MIB;
    auto result = compute_manifest(path, opts);
    ASSERT_TRUE(result.ok()) << result.detail;

    const auto& m = *result.manifest;
    EXPECT_EQ(m.file_name, "two_and_a_half.bin");
    EXPECT_EQ(m.file_size, data.size());
    EXPECT_EQ(m.chunk_size, MIB);
    ASSERT_EQ(m.chunk_count, 3u);
    ASSERT_EQ(m.chunks.size(), 3u);
    EXPECT_EQ(m.chunks[0].length, MIB);
    EXPECT_EQ(m.chunks[1].length, MIB);
    EXPECT_EQ(m.chunks[2].length, MIB / 2);
    EXPECT_EQ(m.chunks[2].offset, 2u * MIB);
    EXPECT_EQ(m.hash_algorithm, HashAlgorithm::BLAKE3);

    EXPECT_EQ(m.chunks[0].hash, blake3(data.data(), MIB));
    EXPECT_EQ(m.chunks[2].hash, blake3(data.data() + 2 * MIB, MIB / 2));
    EXPECT_TRUE(m.validate());
}

TEST_F(ChunkerTest, SizeInvariantsAcrossChunkSizes) {
    auto data = pattern(100000, 3);
    auto path = write_file("sizes.bin", data);

    for (std::uint32_t chunk_size : {1u, 7u, 4096u, 99999u, 100000u, 100001u}) {
        ChunkOptions opts;
        opts.chunk_size = chunk_size;
        auto result = compute_manifest(path, opts);
        ASSERT_TRUE(result.ok()) << chunk_size;

        const auto& m = *result.manifest;
        EXPECT_EQ(m.chunk_count, (data.size() + chunk_size - 1) / chunk_size);
        std::uint64_t total = 0;
        for (const auto& c : m.chunks) {
            total += c.length;
        }
        EXPECT_EQ(total, data.size());
        EXPECT_TRUE(m.validate());
    }
}

TEST_F(ChunkerTest, EmptyFileHasOneEmptyChunk) {
    auto path = write_file("empty.bin", {});

    auto result = compute_manifest(path);
    ASSERT_TRUE(result.ok()) << result.detail;

    const auto& m = *result.manifest;
    EXPECT_EQ(m.file_size, 0u);
    ASSERT_EQ(m.chunk_count, 1u);
    EXPECT_EQ(m.chunks[0].length, 0u);
    EXPECT_EQ(m.chunks[0].hash, blake3(std::span<const std::uint8_t>{}));
    EXPECT_EQ(m.merkle_root, m.chunks[0].hash);
    EXPECT_EQ(m.chunk_size, DEFAULT_CHUNK_SIZE);
}

TEST_F(ChunkerTest, Deterministic) {
    auto data = pattern(300000, 9);
    auto path = write_file("det.bin", data);

    ChunkOptions opts;
    opts.chunk_size = 64 * KIB;
    auto first = compute_manifest(path, opts);
    auto second = compute_manifest(path, opts);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    EXPECT_EQ(*first.manifest, *second.manifest);
    EXPECT_EQ(first.manifest->serialize(), second.manifest->serialize());
}

TEST_F(ChunkerTest, ContentChangesRoot) {
    auto data = pattern(200000, 1);
    auto a = write_file("a.bin", data);
    data[150000] ^= 0x01;
    auto b = write_file("b.bin", data);

    ChunkOptions opts;
    opts.chunk_size = 64 * KIB;
    auto ma = compute_manifest(a, opts);
    auto mb = compute_manifest(b, opts);
    ASSERT_TRUE(ma.ok());
    ASSERT_TRUE(mb.ok());

    EXPECT_EQ(ma.manifest->chunks[0].hash, mb.manifest->chunks[0].hash);
    EXPECT_NE(ma.manifest->chunks[2].hash, mb.manifest->chunks[2].hash);
    EXPECT_NE(ma.manifest->merkle_root, mb.manifest->merkle_root);
}

TEST_F(ChunkerTest, ParallelHashingMatchesSerial) {
    auto data = pattern(1000003, 5);
    auto path = write_file("parallel.bin", data);

    ChunkOptions serial;
    serial.chunk_size = 32 * KIB;
    auto expected = compute_manifest(path, serial);
    ASSERT_TRUE(expected.ok());

    for (std::uint32_t threads : {2u, 3u, 8u, 64u}) {
        ChunkOptions parallel = serial;
        parallel.hash_threads = threads;
        auto result = compute_manifest(path, parallel);
        ASSERT_TRUE(result.ok()) << threads;
        EXPECT_EQ(*result.manifest, *expected.manifest) << threads;
    }
}

TEST_F(ChunkerTest, CancellationReturnsNoManifest) {
    auto path = write_file("cancel.bin", pattern(100000));

    std::atomic<int> polls{0};
    ChunkOptions opts;
    opts.chunk_size = 1000;
    opts.should_cancel = [&polls] { return ++polls > 5; };

    auto result = compute_manifest(path, opts);
    EXPECT_EQ(result.error, ChunkerError::CANCELLED);
    EXPECT_FALSE(result.manifest.has_value());
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(polls.load(), 6);
}

TEST_F(ChunkerTest, MissingFileIsNotFound) {
    auto result = compute_manifest(dir_ / "does_not_exist.bin");
    EXPECT_EQ(result.error, ChunkerError::NOT_FOUND);
    EXPECT_FALSE(result.manifest.has_value());
    EXPECT_FALSE(result.detail.empty());
}

TEST_F(ChunkerTest, DirectoryIsNotFound) {
    auto result = compute_manifest(dir_);
    EXPECT_EQ(result.error, ChunkerError::NOT_FOUND);
}

TEST_F(ChunkerTest, InvalidOptions) {
    auto path = write_file("opts.bin", pattern(10));

    ChunkOptions zero;
    zero.chunk_size = 0;
    EXPECT_EQ(compute_manifest(path, zero).error, ChunkerError::INVALID_INPUT);

    ChunkOptions huge;
    huge.chunk_size = MAX_CHUNK_SIZE + 1;
    EXPECT_EQ(compute_manifest(path, huge).error, ChunkerError::INVALID_INPUT);

    ChunkOptions no_threads;
    no_threads.hash_threads = 0;
    EXPECT_EQ(compute_manifest(path, no_threads).error, ChunkerError::INVALID_INPUT);

    EXPECT_EQ(chunker_error_string(ChunkerError::INVALID_INPUT), "invalid_input");
}

// ============================================================================
// read_chunk
// ============================================================================

TEST_F(ChunkerTest, ReadChunkMatchesManifest) {
    auto data = pattern(2500, 2);
    auto path = write_file("read.bin", data);

    ChunkOptions opts;
    opts.chunk_size = 1000;
    auto result = compute_manifest(path, opts);
    ASSERT_TRUE(result.ok());
    const auto& m = *result.manifest;

    for (std::uint32_t i = 0; i < m.chunk_count; ++i) {
        auto chunk = read_chunk(path, i, opts.chunk_size);
        ASSERT_TRUE(chunk.ok()) << chunk.detail;
        EXPECT_EQ(chunk.data.size(), m.chunks[i].length);
        EXPECT_EQ(m.verify_chunk(i, chunk.data), ChunkCheck::OK);
        EXPECT_TRUE(std::equal(chunk.data.begin(), chunk.data.end(),
                               data.begin() + static_cast<std::ptrdiff_t>(m.chunks[i].offset)));
    }
}

TEST_F(ChunkerTest, ReadChunkPastEndIsInvalid) {
    auto path = write_file("eof.bin", pattern(2000));

    EXPECT_TRUE(read_chunk(path, 1, 1000).ok());
    EXPECT_EQ(read_chunk(path, 2, 1000).error, ChunkerError::INVALID_INPUT);
    EXPECT_EQ(read_chunk(path, 100, 1000).error, ChunkerError::INVALID_INPUT);
}

TEST_F(ChunkerTest, ReadChunkOfEmptyFile) {
    auto path = write_file("empty.bin", {});

    auto first = read_chunk(path, 0, 1000);
    ASSERT_TRUE(first.ok());
    EXPECT_TRUE(first.data.empty());

    EXPECT_EQ(read_chunk(path, 1, 1000).error, ChunkerError::INVALID_INPUT);
}

TEST_F(ChunkerTest, ReadChunkErrors) {
    EXPECT_EQ(read_chunk(dir_ / "missing.bin", 0, 1000).error, ChunkerError::NOT_FOUND);

    auto path = write_file("x.bin", pattern(10));
    EXPECT_EQ(read_chunk(path, 0, 0).error, ChunkerError::INVALID_INPUT);
}

}  // namespace
}  // namespace qx
