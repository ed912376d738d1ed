#include <gtest/gtest.h>
#include "crypto/hash.hh"
#include <string>

using namespace qx;

namespace {

bytes_t as_bytes(std::string_view s) {
    return bytes_t(s.begin(), s.end());
}

digest_t leaf(std::uint8_t tag) {
    std::uint8_t data[1] = {tag};
    return blake3(data, 1);
}

}  // namespace

// ============================================================================
// BLAKE3 Tests
// ============================================================================

TEST(Blake3Test, EmptyInput) {
    auto hash = blake3(std::span<const std::uint8_t>{});
    EXPECT_EQ(bytes_to_hex(hash),
              "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(Blake3Test, KnownVector) {
    auto hash = blake3(as_bytes("abc"));
    EXPECT_EQ(bytes_to_hex(hash),
              "6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85");
}

TEST(Blake3Test, DifferentInputsDifferentHashes) {
    EXPECT_NE(blake3(bytes_t{1, 2, 3}), blake3(bytes_t{1, 2, 4}));
}

TEST(Blake3Test, LibraryVersionReported) {
    EXPECT_FALSE(blake3_library_version().empty());
}

TEST(Blake3HasherTest, IncrementalMatchesOneShot) {
    bytes_t input(10000);
    for (std::size_t i = 0; i < input.size(); ++i) {
        input[i] = static_cast<std::uint8_t>(i * 31);
    }

    Blake3Hasher hasher;
    hasher.update(std::span<const std::uint8_t>(input.data(), 4096));
    hasher.update(std::span<const std::uint8_t>(input.data() + 4096, input.size() - 4096));
    EXPECT_EQ(hasher.finalize(), blake3(input));
}

TEST(Blake3HasherTest, Reset) {
    Blake3Hasher hasher;
    hasher.update(as_bytes("garbage"));
    hasher.reset();
    hasher.update(as_bytes("abc"));
    EXPECT_EQ(hasher.finalize(), blake3(as_bytes("abc")));
}

TEST(Blake3HasherTest, MoveKeepsState) {
    Blake3Hasher a;
    a.update(as_bytes("ab"));
    Blake3Hasher b(std::move(a));
    b.update(as_bytes("c"));
    EXPECT_EQ(b.finalize(), blake3(as_bytes("abc")));
}

// ============================================================================
// SHA-256 Tests
// ============================================================================

TEST(Sha256Test, KnownVectors) {
    EXPECT_EQ(bytes_to_hex(sha256(std::string_view(""))),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(bytes_to_hex(sha256(std::string_view("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, SpanAndStringAgree) {
    EXPECT_EQ(sha256(as_bytes("key material")), sha256(std::string_view("key material")));
}

// ============================================================================
// Randomness
// ============================================================================

TEST(RandomTest, IdIsHexOfExpectedLength) {
    auto id = random_id_hex();
    EXPECT_EQ(id.size(), REGISTRATION_ID_SIZE * 2);
    EXPECT_TRUE(hex_to_bytes(id).has_value());
}

TEST(RandomTest, IdsDiffer) {
    EXPECT_NE(random_id_hex(), random_id_hex());
}

TEST(RandomTest, RandomBytesFillsBuffer) {
    std::array<std::uint8_t, 64> buf{};
    random_bytes(buf);
    std::array<std::uint8_t, 64> zero{};
    EXPECT_NE(buf, zero);
}

// ============================================================================
// Merkle Tree Tests
// ============================================================================

TEST(MerkleTreeTest, SingleLeafIsRoot) {
    digest_t a = leaf(1);
    MerkleTree tree(std::vector<digest_t>{a});
    EXPECT_EQ(tree.root(), a);
    EXPECT_EQ(tree.leaf_count(), 1u);
    EXPECT_TRUE(tree.proof(0).empty());
    EXPECT_TRUE(MerkleTree::verify(a, {}, 0, tree.root()));
}

TEST(MerkleTreeTest, TwoLeaves) {
    digest_t a = leaf(1);
    digest_t b = leaf(2);
    MerkleTree tree(std::vector<digest_t>{a, b});
    EXPECT_EQ(tree.root(), MerkleTree::hash_pair(a, b));
}

TEST(MerkleTreeTest, OddLeafPairedWithItself) {
    digest_t a = leaf(1);
    digest_t b = leaf(2);
    digest_t c = leaf(3);
    MerkleTree tree(std::vector<digest_t>{a, b, c});

    digest_t expected = MerkleTree::hash_pair(MerkleTree::hash_pair(a, b),
                                              MerkleTree::hash_pair(c, c));
    EXPECT_EQ(tree.root(), expected);
}

TEST(MerkleTreeTest, OrderSensitive) {
    digest_t a = leaf(1);
    digest_t b = leaf(2);
    EXPECT_NE(MerkleTree(std::vector<digest_t>{a, b}).root(), MerkleTree(std::vector<digest_t>{b, a}).root());
}

TEST(MerkleTreeTest, ProofVerification) {
    std::vector<digest_t> leaves;
    for (std::uint8_t i = 0; i < 7; ++i) {
        leaves.push_back(leaf(i));
    }
    MerkleTree tree(leaves);

    for (std::size_t i = 0; i < leaves.size(); ++i) {
        auto proof = tree.proof(i);
        EXPECT_TRUE(MerkleTree::verify(leaves[i], proof, i, tree.root())) << "leaf " << i;
    }
}

TEST(MerkleTreeTest, InvalidProofFails) {
    std::vector<digest_t> leaves = {leaf(0), leaf(1), leaf(2), leaf(3)};
    MerkleTree tree(leaves);

    auto proof = tree.proof(1);
    EXPECT_FALSE(MerkleTree::verify(leaves[2], proof, 1, tree.root()));
    EXPECT_FALSE(MerkleTree::verify(leaves[1], proof, 0, tree.root()));
    EXPECT_TRUE(tree.proof(4).empty());
}

TEST(MerkleTreeTest, ComputeRootMatchesTree) {
    std::vector<digest_t> leaves;
    for (std::uint8_t i = 0; i < 5; ++i) {
        leaves.push_back(leaf(i));
    }
    EXPECT_EQ(compute_merkle_root(leaves), MerkleTree(leaves).root());
    EXPECT_EQ(compute_merkle_root(std::span<const digest_t>{}), digest_t{});
}
