#include <gtest/gtest.h>
#include <string.h>
#include "common.h"
#include "crypto_kdf.h"
#include "hmac.h"

static const std::vector<uint8_t> kSalt = toBytes("random_salt_16++");

// ---------------- HKDF (RFC 5869) ----------------

TEST(HkdfTest, Rfc5869Case1) {
  std::vector<uint8_t> ikm(22, 0x0b);
  std::vector<uint8_t> salt = hexToBytes("000102030405060708090a0b0c");
  std::vector<uint8_t> info = hexToBytes("f0f1f2f3f4f5f6f7f8f9");

  uint8_t prk[32];
  ASSERT_TRUE(hkdf_extract(salt.data(), salt.size(), ikm.data(), ikm.size(), prk));
  EXPECT_EQ(std::vector<uint8_t>(prk, prk + 32),
            hexToBytes("077709362c2e32df0ddc3f0dc47bba6390b6c73bb50f9c3122ec844ad7c2b3e5"));

  std::vector<uint8_t> okm(42);
  ASSERT_TRUE(hkdf_expand(prk, info.data(), info.size(), okm.data(), okm.size()));
  EXPECT_EQ(okm, hexToBytes("3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf"
                            "34007208d5b887185865"));
}

TEST(HkdfTest, Rfc5869Case3EmptySaltAndInfo) {
  std::vector<uint8_t> ikm(22, 0x0b);
  std::vector<uint8_t> okm(42);
  ASSERT_TRUE(hkdf_sha256(nullptr, 0, ikm.data(), ikm.size(), nullptr, 0, okm.data(), okm.size()));
  EXPECT_EQ(okm, hexToBytes("8da4e775a563c18f715f802a063c5a31b8a11f5c5ee1879ec3454e5f3c738d2d"
                            "9d201395faa4b61a96c8"));
}

TEST(HkdfTest, ExpandLengthLimits) {
  uint8_t prk[32] = {0};
  std::vector<uint8_t> out(CHAOS_HKDF_MAX_OUTPUT + 1);
  EXPECT_FALSE(hkdf_expand(prk, nullptr, 0, out.data(), 0));
  EXPECT_FALSE(hkdf_expand(prk, nullptr, 0, out.data(), CHAOS_HKDF_MAX_OUTPUT + 1));
  EXPECT_TRUE(hkdf_expand(prk, nullptr, 0, out.data(), CHAOS_HKDF_MAX_OUTPUT));
}

// ---------------- Seeding ----------------

TEST(ChaoticKdfTest, ShortSaltRejected) {
  std::vector<uint8_t> salt(CHAOS_MIN_SALT_LEN - 1, 0x42);
  EXPECT_THROW(ChaoticKDF("secret", salt), ValidationError);
  EXPECT_THROW(ChaoticKDF("secret", std::vector<uint8_t>()), ValidationError);
  EXPECT_NO_THROW(ChaoticKDF("secret", std::vector<uint8_t>(CHAOS_MIN_SALT_LEN, 0x42)));
}

TEST(ChaoticKdfTest, PreseedMapsToDocumentedRanges) {
  uint8_t zeros[64] = {0};
  InitialConditions lo = ChaoticKDF::preseedToInitialConditions(zeros);
  EXPECT_DOUBLE_EQ(lo.logisticX, 0.1);
  EXPECT_DOUBLE_EQ(lo.henonX, -0.2);
  EXPECT_DOUBLE_EQ(lo.henonY, -0.2);
  EXPECT_DOUBLE_EQ(lo.lorenzX, -10.0);
  EXPECT_DOUBLE_EQ(lo.lorenzY, -10.0);
  EXPECT_DOUBLE_EQ(lo.lorenzZ, 5.0);
  EXPECT_DOUBLE_EQ(lo.sineX, 0.1);

  uint8_t ones[64];
  memset(ones, 0xFF, sizeof(ones));
  InitialConditions hi = ChaoticKDF::preseedToInitialConditions(ones);
  EXPECT_NEAR(hi.logisticX, 0.9, 1e-9);
  EXPECT_NEAR(hi.henonY, 0.2, 1e-9);
  EXPECT_NEAR(hi.lorenzX, 10.0, 1e-9);
  EXPECT_NEAR(hi.lorenzZ, 45.0, 1e-9);
  EXPECT_NEAR(hi.sineX, 0.9, 1e-9);

  // Words are big-endian: only the top byte of the first word set
  uint8_t top[64] = {0};
  top[0] = 0x80;
  EXPECT_DOUBLE_EQ(ChaoticKDF::preseedToInitialConditions(top).logisticX, 0.5);
}

TEST(ChaoticKdfTest, SeededFromHmacSha512Preseed) {
  const std::string secret = "my_super_secret_password";
  uint8_t preseed[64];
  ASSERT_TRUE(hmac_sha512_full(kSalt.data(), kSalt.size(),
                               (const uint8_t*)secret.data(), secret.size(), preseed));
  InitialConditions expected = ChaoticKDF::preseedToInitialConditions(preseed);

  ChaoticKDF kdf(secret, kSalt);
  const InitialConditions& ic = kdf.hybridMap().initialConditions();
  EXPECT_DOUBLE_EQ(ic.logisticX, expected.logisticX);
  EXPECT_DOUBLE_EQ(ic.henonX, expected.henonX);
  EXPECT_DOUBLE_EQ(ic.lorenzZ, expected.lorenzZ);
  EXPECT_DOUBLE_EQ(ic.sineX, expected.sineX);
}

// ---------------- derive_key ----------------

TEST(ChaoticKdfTest, DeriveKeyIsDeterministic) {
  ChaoticKDF a("my_super_secret_password", kSalt);
  ChaoticKDF b("my_super_secret_password", kSalt);
  std::vector<uint8_t> ka = a.deriveKey(32);
  std::vector<uint8_t> kb = b.deriveKey(32);
  ASSERT_EQ(ka.size(), 32u);
  EXPECT_EQ(ka, kb);
}

TEST(ChaoticKdfTest, DeriveKeyKnownAnswer) {
  ChaoticKDF kdf("my_super_secret_password", kSalt);
  EXPECT_EQ(bytesToHex(kdf.deriveKey(32)),
            "946B17B3509ADBD7274D92829EA131E5EE43E53F68F58472F9D63B85A118C233");
}

TEST(ChaoticKdfTest, OneCharacterChangesTheKey) {
  std::vector<uint8_t> ka = ChaoticKDF("my_super_secret_password", kSalt).deriveKey(32);
  std::vector<uint8_t> kb = ChaoticKDF("my_super_secret_passwore", kSalt).deriveKey(32);
  ASSERT_NE(ka, kb);
  size_t differing = 0;
  for (size_t i = 0; i < ka.size(); ++i) differing += (ka[i] != kb[i]);
  EXPECT_GT(differing, 16u);
}

TEST(ChaoticKdfTest, SaltAndInfoSeparateKeys) {
  std::vector<uint8_t> otherSalt = toBytes("another_salt_16!");
  EXPECT_NE(ChaoticKDF("pw", kSalt).deriveKey(32), ChaoticKDF("pw", otherSalt).deriveKey(32));
  EXPECT_NE(ChaoticKDF("pw", kSalt).deriveKey(32, "A"), ChaoticKDF("pw", kSalt).deriveKey(32, "B"));
}

TEST(ChaoticKdfTest, DeriveKeyWhitensDoubleLengthRawStream) {
  ChaoticKDF a("pw", kSalt), b("pw", kSalt);
  std::vector<uint8_t> key = a.deriveKey(32);

  std::vector<uint8_t> raw = b.deriveKeystream(64, true);
  std::vector<uint8_t> expected(32);
  const std::string info = "Butterfly-crypto-key";
  ASSERT_TRUE(hkdf_sha256(kSalt.data(), kSalt.size(), raw.data(), raw.size(),
                          (const uint8_t*)info.data(), info.size(), expected.data(), 32));
  EXPECT_EQ(key, expected);
}

TEST(ChaoticKdfTest, DeriveKeyLengthBounds) {
  ChaoticKDF kdf("pw", kSalt);
  EXPECT_THROW(kdf.deriveKey(0), ValidationError);
  EXPECT_THROW(kdf.deriveKey(CHAOS_HKDF_MAX_OUTPUT + 1), ValidationError);
  EXPECT_EQ(kdf.deriveKey(1).size(), 1u);
  EXPECT_EQ(kdf.deriveKey(64).size(), 64u);
}

// ---------------- derive_keystream ----------------

TEST(ChaoticKdfTest, KeystreamLengthsAndZeroLength) {
  ChaoticKDF kdf("pw", kSalt);
  EXPECT_TRUE(kdf.deriveKeystream(0).empty());
  EXPECT_TRUE(kdf.deriveKeystream(0, true).empty());
  EXPECT_EQ(kdf.deriveKeystream(100, true).size(), 100u);
  EXPECT_EQ(kdf.deriveKeystream(100).size(), 100u);
}

TEST(ChaoticKdfTest, LongKeystreamIsWhitenedInIndependentChunks) {
  const size_t len = 9000;
  ChaoticKDF a("chunked", kSalt), b("chunked", kSalt);
  std::vector<uint8_t> raw = a.deriveKeystream(len, true);
  std::vector<uint8_t> white = b.deriveKeystream(len);
  ASSERT_EQ(white.size(), len);

  const std::string info = "keystream";
  const size_t first = CHAOS_HKDF_MAX_OUTPUT;
  std::vector<uint8_t> expected(len);
  ASSERT_TRUE(hkdf_sha256(kSalt.data(), kSalt.size(), raw.data(), first,
                          (const uint8_t*)info.data(), info.size(), expected.data(), first));
  ASSERT_TRUE(hkdf_sha256(kSalt.data(), kSalt.size(), raw.data() + first, len - first,
                          (const uint8_t*)info.data(), info.size(),
                          expected.data() + first, len - first));
  EXPECT_EQ(white, expected);
}

TEST(ChaoticKdfTest, ResetReplaysOutput) {
  ChaoticKDF kdf("pw", kSalt);
  std::vector<uint8_t> first = kdf.deriveKeystream(48);
  std::vector<uint8_t> second = kdf.deriveKeystream(48);
  EXPECT_NE(first, second);

  kdf.reset();
  EXPECT_EQ(kdf.deriveKeystream(48), first);
  EXPECT_EQ(kdf.deriveKeystream(48), second);
}

TEST(ChaoticKdfTest, CustomBurnInChangesOutput) {
  ChaoticKDF a("pw", kSalt, ChaosParams(), MixingCoefficients(), 4096);
  ChaoticKDF b("pw", kSalt, ChaosParams(), MixingCoefficients(), 1024);
  EXPECT_EQ(b.burnIn(), 1024u);
  EXPECT_NE(a.deriveKeystream(32, true), b.deriveKeystream(32, true));
}
