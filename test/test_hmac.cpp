#include <gtest/gtest.h>
#include <string.h>
#include "common.h"
#include "hmac.h"

static std::vector<uint8_t> vec(const uint8_t* p, size_t n) { return std::vector<uint8_t>(p, p + n); }

// RFC 4231 test case 1
TEST(HmacTest, Sha256Rfc4231Case1) {
  std::vector<uint8_t> key(20, 0x0b);
  const char* data = "Hi There";
  uint8_t out[32];
  ASSERT_TRUE(hmac_sha256_full(key.data(), key.size(), (const uint8_t*)data, strlen(data), out));
  EXPECT_EQ(vec(out, 32),
            hexToBytes("b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7"));
}

// RFC 4231 test case 2
TEST(HmacTest, Sha256Rfc4231Case2) {
  const char* key = "Jefe";
  const char* data = "what do ya want for nothing?";
  uint8_t out[32];
  ASSERT_TRUE(hmac_sha256_full((const uint8_t*)key, 4, (const uint8_t*)data, strlen(data), out));
  EXPECT_EQ(vec(out, 32),
            hexToBytes("5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843"));
}

TEST(HmacTest, Sha512Rfc4231Case2) {
  const char* key = "Jefe";
  const char* data = "what do ya want for nothing?";
  uint8_t out[64];
  ASSERT_TRUE(hmac_sha512_full((const uint8_t*)key, 4, (const uint8_t*)data, strlen(data), out));
  EXPECT_EQ(vec(out, 64),
            hexToBytes("164b7a7bfcf819e2e395fbe73b56e0a387bd64222e831fd610270cd7ea250554"
                       "9758bf75c05a994a6d034f65f8f0e6fdcaeab1a34d4a6b4b636e070a38bce737"));
}

TEST(HmacTest, MultiPartEqualsSingleCall) {
  const char* key = "Jefe";
  const char* a = "what do ya ";
  const char* b = "want for nothing?";
  const uint8_t* parts[3] = {(const uint8_t*)a, nullptr, (const uint8_t*)b};
  const size_t lens[3] = {strlen(a), 0, strlen(b)};

  uint8_t multi[32];
  ASSERT_TRUE(hmac_sha256_multi((const uint8_t*)key, 4, parts, lens, 3, multi));
  EXPECT_EQ(vec(multi, 32),
            hexToBytes("5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843"));
}

TEST(HmacTest, EmptyKeyIsAccepted) {
  uint8_t a[32], b[32];
  ASSERT_TRUE(hmac_sha256_full(nullptr, 0, (const uint8_t*)"x", 1, a));
  ASSERT_TRUE(hmac_sha256_full((const uint8_t*)"", 0, (const uint8_t*)"x", 1, b));
  EXPECT_EQ(vec(a, 32), vec(b, 32));
  EXPECT_FALSE(hmac_sha256_full(nullptr, 4, (const uint8_t*)"x", 1, a));
}

TEST(Sha256Test, Fips180Vectors) {
  uint8_t out[32];
  ASSERT_TRUE(sha256_digest((const uint8_t*)"abc", 3, out));
  EXPECT_EQ(vec(out, 32),
            hexToBytes("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));

  ASSERT_TRUE(sha256_digest(nullptr, 0, out));
  EXPECT_EQ(vec(out, 32),
            hexToBytes("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
}

TEST(SecureMemzeroTest, ClearsBuffer) {
  uint8_t buf[16];
  memset(buf, 0xAB, sizeof(buf));
  secure_memzero(buf, sizeof(buf));
  for (uint8_t v : buf) EXPECT_EQ(v, 0);
}
