#include "hmac.h"
#include <mbedtls/md.h>
#include <mbedtls/platform_util.h>
#include <string.h>
#include <stdint.h>

void secure_memzero(void *v, size_t n) {
  mbedtls_platform_zeroize(v, n);
}

// HMAC over numParts buffers with the given digest. The mbedTLS context is freed on every path.
static bool hmac_md_multi(mbedtls_md_type_t type,
                          const uint8_t *key, size_t keyLen,
                          const uint8_t *const data[], const size_t dataLen[],
                          size_t numParts, uint8_t *out) {
  if (!out) return false;
  // Empty keys are legal for HMAC (HKDF-Extract uses them); mbedTLS wants a valid pointer
  static const uint8_t kEmpty[1] = {0};
  if (!key) {
    if (keyLen != 0) return false;
    key = kEmpty;
  }

  const mbedtls_md_info_t *info = mbedtls_md_info_from_type(type);
  if (!info) return false;

  mbedtls_md_context_t ctx;
  mbedtls_md_init(&ctx);

  int rc = mbedtls_md_setup(&ctx, info, 1); // HMAC enabled
  if (rc != 0) { mbedtls_md_free(&ctx); return false; }

  rc = mbedtls_md_hmac_starts(&ctx, key, keyLen);
  if (rc != 0) { mbedtls_md_free(&ctx); return false; }

  for (size_t i = 0; i < numParts; ++i) {
    if (data[i] && dataLen[i]) {
      rc = mbedtls_md_hmac_update(&ctx, data[i], dataLen[i]);
      if (rc != 0) { mbedtls_md_free(&ctx); return false; }
    }
  }

  rc = mbedtls_md_hmac_finish(&ctx, out);
  mbedtls_md_free(&ctx);
  return rc == 0;
}

bool hmac_sha256_full(const uint8_t *key, size_t keyLen,
                      const uint8_t *data, size_t dataLen,
                      uint8_t out32[32]) {
  const uint8_t *parts[1] = {data};
  const size_t lens[1] = {dataLen};
  return hmac_md_multi(MBEDTLS_MD_SHA256, key, keyLen, parts, lens, 1, out32);
}

bool hmac_sha256_multi(const uint8_t *key, size_t keyLen,
                       const uint8_t *const data[], const size_t dataLen[],
                       size_t numParts, uint8_t out32[32]) {
  return hmac_md_multi(MBEDTLS_MD_SHA256, key, keyLen, data, dataLen, numParts, out32);
}

bool hmac_sha512_full(const uint8_t *key, size_t keyLen,
                      const uint8_t *data, size_t dataLen,
                      uint8_t out64[64]) {
  const uint8_t *parts[1] = {data};
  const size_t lens[1] = {dataLen};
  return hmac_md_multi(MBEDTLS_MD_SHA512, key, keyLen, parts, lens, 1, out64);
}

bool sha256_digest(const uint8_t *data, size_t dataLen, uint8_t out32[32]) {
  if (!out32) return false;
  const mbedtls_md_info_t *info = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
  if (!info) return false;
  static const uint8_t kEmpty[1] = {0};
  return mbedtls_md(info, data ? data : kEmpty, dataLen, out32) == 0;
}
