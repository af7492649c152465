#include <gtest/gtest.h>
#include "common.h"
#include "transposition.h"

TEST(TranspositionTest, ForwardGathersByIndex) {
  const uint8_t in[4] = {'a', 'b', 'c', 'd'};
  uint8_t out[4];
  applyTransposition(in, out, {2, 0, 3, 1}, PermuteMode::Forward);
  EXPECT_EQ(std::string((const char*)out, 4), "cadb");
}

TEST(TranspositionTest, InverseUndoesForward) {
  std::vector<size_t> perm = {5, 3, 0, 7, 1, 6, 2, 4};
  std::vector<uint8_t> in = {10, 11, 12, 13, 14, 15, 16, 17};
  std::vector<uint8_t> fwd(8), back(8), viaInv(8);

  applyTransposition(in.data(), fwd.data(), perm, PermuteMode::Forward);
  applyTransposition(fwd.data(), back.data(), perm, PermuteMode::Inverse);
  EXPECT_EQ(back, in);

  // Forward with the inverted permutation is the same as Inverse mode
  applyTransposition(fwd.data(), viaInv.data(), invertPermutation(perm), PermuteMode::Forward);
  EXPECT_EQ(viaInv, in);
}

TEST(TranspositionTest, InvertPermutation) {
  std::vector<size_t> perm = {2, 0, 1};
  std::vector<size_t> inv = invertPermutation(perm);
  std::vector<size_t> expected = {1, 2, 0};
  EXPECT_EQ(inv, expected);
  EXPECT_EQ(invertPermutation(inv), perm);
}

TEST(TranspositionTest, RejectsNonBijections) {
  EXPECT_TRUE(isValidPermutation({}));
  EXPECT_TRUE(isValidPermutation({0}));
  EXPECT_FALSE(isValidPermutation({0, 0}));
  EXPECT_FALSE(isValidPermutation({0, 2}));

  uint8_t buf[2] = {1, 2}, out[2];
  EXPECT_THROW(applyTransposition(buf, out, {1, 1}, PermuteMode::Forward), ValidationError);
  EXPECT_THROW(invertPermutation({3, 0, 1}), ValidationError);
}
