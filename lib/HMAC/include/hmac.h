#pragma once
#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

/*
 * Keyed hashing and digests over mbedTLS.
 *
 * - HMAC-SHA512 turns a (secret, salt) pair into the 64-byte preseed that seeds the maps
 * - HMAC-SHA256 is the primitive behind HKDF (extract and expand)
 * - SHA-256 backs the default salt and the keystream fingerprint
 *
 * All functions return false on a backend failure; outputs are then unspecified.
 * Temporaries are zeroized before returning.
 */

bool hmac_sha256_full(const uint8_t *key, size_t keyLen,
                      const uint8_t *data, size_t dataLen,
                      uint8_t out32[32]);

// HMAC over several buffers without concatenating them
bool hmac_sha256_multi(const uint8_t *key, size_t keyLen,
                       const uint8_t *const data[], const size_t dataLen[],
                       size_t numParts, uint8_t out32[32]);

bool hmac_sha512_full(const uint8_t *key, size_t keyLen,
                      const uint8_t *data, size_t dataLen,
                      uint8_t out64[64]);

bool sha256_digest(const uint8_t *data, size_t dataLen, uint8_t out32[32]);

void secure_memzero(void *v, size_t n);
