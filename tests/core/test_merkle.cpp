// STRATA - Merkle Tree Tests
// Copyright (c) 2024 STRATA Developers
// MIT License

#include <gtest/gtest.h>
#include "strata/core/merkle.h"
#include "strata/crypto/sha256.h"

namespace strata {
namespace test {

namespace {

Hash256 Leaf(uint8_t tag) {
    std::vector<Byte> data{tag};
    return DoubleSHA256(data);
}

} // namespace

TEST(MerkleTest, EmptyIsNull) {
    bool mutated = true;
    EXPECT_TRUE(ComputeMerkleRoot({}, &mutated).IsNull());
    EXPECT_FALSE(mutated);
}

TEST(MerkleTest, SingleLeafIsRoot) {
    EXPECT_EQ(ComputeMerkleRoot({Leaf(1)}), Leaf(1));
}

TEST(MerkleTest, PairHashesConcatenation) {
    std::vector<Byte> joined(Leaf(1).begin(), Leaf(1).end());
    const Hash256 right = Leaf(2);
    joined.insert(joined.end(), right.begin(), right.end());

    EXPECT_EQ(HashPair(Leaf(1), Leaf(2)), DoubleSHA256(joined));
    EXPECT_EQ(ComputeMerkleRoot({Leaf(1), Leaf(2)}), HashPair(Leaf(1), Leaf(2)));
}

TEST(MerkleTest, OddLevelDuplicatesLast) {
    const Hash256 expected = HashPair(HashPair(Leaf(1), Leaf(2)), HashPair(Leaf(3), Leaf(3)));
    EXPECT_EQ(ComputeMerkleRoot({Leaf(1), Leaf(2), Leaf(3)}), expected);
}

TEST(MerkleTest, OrderMatters) {
    EXPECT_NE(ComputeMerkleRoot({Leaf(1), Leaf(2)}), ComputeMerkleRoot({Leaf(2), Leaf(1)}));
}

TEST(MerkleTest, MutationDetected) {
    bool mutated = false;

    // Three leaves and the same three with the last repeated share a root
    const Hash256 odd = ComputeMerkleRoot({Leaf(1), Leaf(2), Leaf(3)}, &mutated);
    EXPECT_FALSE(mutated);
    const Hash256 padded = ComputeMerkleRoot({Leaf(1), Leaf(2), Leaf(3), Leaf(3)}, &mutated);
    EXPECT_TRUE(mutated);
    EXPECT_EQ(odd, padded);
}

} // namespace test
} // namespace strata
