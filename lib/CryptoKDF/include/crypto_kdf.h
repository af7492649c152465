#pragma once
#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>
#include <string>
#include <vector>

#include "chaos_params.h"
#include "common.h"
#include "hybrid_map.h"

/**
 * HKDF-SHA256 (RFC 5869) extract/expand helpers.
 * An empty salt extracts with HashLen zero bytes.
 * hkdf_expand fails when outLen is 0 or above CHAOS_HKDF_MAX_OUTPUT.
 */
bool hkdf_extract(const uint8_t *salt, size_t saltLen,
                  const uint8_t *ikm, size_t ikmLen,
                  uint8_t prk[32]);

bool hkdf_expand(const uint8_t prk[32],
                 const uint8_t *info, size_t infoLen,
                 uint8_t *out, size_t outLen);

// Extract then expand in one call
bool hkdf_sha256(const uint8_t *salt, size_t saltLen,
                 const uint8_t *ikm, size_t ikmLen,
                 const uint8_t *info, size_t infoLen,
                 uint8_t *out, size_t outLen);

/**
 * ChaoticKDF - derives keys and keystreams from a secret via the hybrid map.
 *
 * Construction:
 *   preseed = HMAC-SHA512(key = salt, data = secret)            (64 bytes)
 *   seven big-endian u64 words of the preseed, each / 2^64, mapped affinely:
 *     logistic x0, sine x0 -> [0.1, 0.9]
 *     henon x0, y0         -> [-0.2, 0.2]
 *     lorenz x0, y0        -> [-10, 10],  lorenz z0 -> [5, 45]
 *   the hybrid map is seeded with those conditions.
 *
 * Every deriveKey/deriveKeystream call burns in and consumes trajectory, so
 * repeated calls on one instance return different bytes; reset() rewinds to the
 * seeded state without recomputing the preseed. Not thread-safe.
 */
class ChaoticKDF {
public:
  // Throws ValidationError if salt is shorter than CHAOS_MIN_SALT_LEN
  ChaoticKDF(const std::vector<uint8_t>& secret, const std::vector<uint8_t>& salt,
             const ChaosParams& params = ChaosParams(),
             const MixingCoefficients& mixing = MixingCoefficients(),
             size_t burnIn = CHAOS_BURN_IN);
  ChaoticKDF(const std::string& secret, const std::vector<uint8_t>& salt,
             const ChaosParams& params = ChaosParams(),
             const MixingCoefficients& mixing = MixingCoefficients(),
             size_t burnIn = CHAOS_BURN_IN);

  // Raw keystream of 2*length bytes whitened by HKDF(salt, info) down to length bytes
  std::vector<uint8_t> deriveKey(size_t length, const std::string& info = CHAOS_INFO_KEY);

  // raw=true: chaotic bytes as-is. Otherwise HKDF-whitened in independent chunks of
  // at most CHAOS_HKDF_MAX_OUTPUT bytes (chunks are not linked to each other).
  std::vector<uint8_t> deriveKeystream(size_t length, bool raw = false);

  void reset() { hcm_.reset(); }

  HybridChaoticMap& hybridMap() { return hcm_; }
  const std::vector<uint8_t>& salt() const { return salt_; }
  size_t burnIn() const { return burnIn_; }
  std::vector<std::string> warnings() const { return hcm_.warnings(); }

  static InitialConditions preseedToInitialConditions(const uint8_t preseed[64]);

private:
  static InitialConditions seedConditions(const std::vector<uint8_t>& secret,
                                          const std::vector<uint8_t>& salt);

  std::vector<uint8_t> salt_;
  size_t burnIn_;
  HybridChaoticMap hcm_;
};
