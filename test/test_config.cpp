#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "chaos_params.h"
#include "common.h"

TEST(ChaosParamsTest, DefaultsMatchDocumentedValues) {
  ChaosParams p;
  EXPECT_DOUBLE_EQ(p.logisticR, 3.99);
  EXPECT_DOUBLE_EQ(p.henonA, 1.4);
  EXPECT_DOUBLE_EQ(p.henonB, 0.3);
  EXPECT_DOUBLE_EQ(p.lorenzSigma, 10.0);
  EXPECT_DOUBLE_EQ(p.lorenzRho, 28.0);
  EXPECT_DOUBLE_EQ(p.lorenzBeta, 8.0 / 3.0);
  EXPECT_DOUBLE_EQ(p.sineMu, 0.99);
  EXPECT_EQ(p.toMap().size(), 7u);
}

TEST(ChaosParamsTest, ParseOverridesOnlyNamedKeys) {
  ChaosParams p = parseChaosParams("logistic_r=3.97, lorenz_rho = 30");
  EXPECT_DOUBLE_EQ(p.logisticR, 3.97);
  EXPECT_DOUBLE_EQ(p.lorenzRho, 30.0);
  EXPECT_DOUBLE_EQ(p.henonA, 1.4);
  EXPECT_DOUBLE_EQ(p.sineMu, 0.99);
}

TEST(ChaosParamsTest, EmptyStringGivesDefaults) {
  ChaosParams p = parseChaosParams("");
  EXPECT_DOUBLE_EQ(p.logisticR, 3.99);
}

TEST(ChaosParamsTest, UnknownKeysAreIgnored) {
  ChaosParams p = chaosParamsFromMap({{"bogus", 1.0}, {"sine_mu", 0.9}});
  EXPECT_DOUBLE_EQ(p.sineMu, 0.9);
  EXPECT_DOUBLE_EQ(p.logisticR, 3.99);
}

TEST(ChaosParamsTest, MalformedInputThrows) {
  EXPECT_THROW(parseChaosParams("logistic_r"), ConfigurationError);
  EXPECT_THROW(parseChaosParams("logistic_r=abc"), ConfigurationError);
  EXPECT_THROW(parseChaosParams("logistic_r=3.9x"), ConfigurationError);
  EXPECT_THROW(parseChaosParams("henon_a=inf"), ConfigurationError);
}

TEST(ChaosParamsTest, NonFiniteValueRejected) {
  EXPECT_THROW(chaosParamsFromMap({{"henon_b", std::numeric_limits<double>::quiet_NaN()}}),
               ConfigurationError);
}

TEST(MixingTest, DefaultIsEqualWeights) {
  MixingCoefficients m;
  EXPECT_DOUBLE_EQ(m.alpha, 0.25);
  EXPECT_DOUBLE_EQ(m.delta, 0.25);
}

TEST(MixingTest, WeightsAreRenormalized) {
  MixingCoefficients m(1.0, 1.0, 2.0, 0.0);
  EXPECT_DOUBLE_EQ(m.alpha, 0.25);
  EXPECT_DOUBLE_EQ(m.beta, 0.25);
  EXPECT_DOUBLE_EQ(m.gamma, 0.5);
  EXPECT_DOUBLE_EQ(m.delta, 0.0);
  EXPECT_NEAR(m.alpha + m.beta + m.gamma + m.delta, 1.0, 1e-15);

  MixingCoefficients big(10, 20, 30, 40);
  EXPECT_NEAR(big.alpha + big.beta + big.gamma + big.delta, 1.0, 1e-15);
  EXPECT_DOUBLE_EQ(big.delta, 0.4);
}

TEST(MixingTest, InvalidWeightsThrow) {
  EXPECT_THROW(MixingCoefficients(0, 0, 0, 0), ConfigurationError);
  EXPECT_THROW(MixingCoefficients(-1, 1, 1, 1), ConfigurationError);
  EXPECT_THROW(parseMixing("1,2,3"), ConfigurationError);
}

TEST(MixingTest, ParseMixing) {
  MixingCoefficients m = parseMixing("1, 1, 1, 1");
  EXPECT_DOUBLE_EQ(m.gamma, 0.25);
}

TEST(HexTest, RoundTripAndErrors) {
  std::vector<uint8_t> bytes = {0x00, 0x0F, 0xA5, 0xFF};
  EXPECT_EQ(bytesToHex(bytes), "000FA5FF");
  EXPECT_EQ(hexToBytes("000fa5FF"), bytes);
  EXPECT_THROW(hexToBytes("abc"), ValidationError);
  EXPECT_THROW(hexToBytes("zz"), ValidationError);
}
