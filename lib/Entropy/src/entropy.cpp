#include "entropy.h"
#include "common.h"
#include "hmac.h"
#include "logistic_map.h"
#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <cmath>
#include <random>
#include <string.h>

bool gatherSalt(uint8_t *out, size_t len, const char *personalization) {
  if (!out && len) return false;
  if (len == 0) return true;

  mbedtls_entropy_context entropy;
  mbedtls_ctr_drbg_context drbg;
  mbedtls_entropy_init(&entropy);
  mbedtls_ctr_drbg_init(&drbg);

  const char *pers = personalization ? personalization : "CHAOS-SALT";
  int rc = mbedtls_ctr_drbg_seed(&drbg, mbedtls_entropy_func, &entropy,
                                 (const unsigned char *)pers, strlen(pers));
  if (rc != 0) {
    log_error("CTR-DRBG seeding failed: " + std::to_string(rc));
    mbedtls_ctr_drbg_free(&drbg);
    mbedtls_entropy_free(&entropy);
    return false;
  }

  // The DRBG caps a single request; draw in pieces
  size_t produced = 0;
  while (produced < len) {
    size_t n = len - produced;
    if (n > MBEDTLS_CTR_DRBG_MAX_REQUEST) n = MBEDTLS_CTR_DRBG_MAX_REQUEST;
    rc = mbedtls_ctr_drbg_random(&drbg, out + produced, n);
    if (rc != 0) {
      log_error("CTR-DRBG generation failed: " + std::to_string(rc));
      secure_memzero(out, len);
      break;
    }
    produced += n;
  }

  mbedtls_ctr_drbg_free(&drbg);
  mbedtls_entropy_free(&entropy);
  return rc == 0;
}

double shannonEntropy(const uint8_t *data, size_t len) {
  if (!data || len == 0) return 0.0;
  size_t counts[256] = {0};
  for (size_t i = 0; i < len; ++i) counts[data[i]]++;

  double h = 0.0;
  for (size_t c : counts) {
    if (c == 0) continue;
    double p = (double)c / (double)len;
    h -= p * std::log2(p);
  }
  return h;
}

double shannonEntropy(const std::vector<uint8_t> &data) {
  return shannonEntropy(data.data(), data.size());
}

std::vector<double> entropyPerBlock(const std::vector<uint8_t> &data, size_t blockSize) {
  std::vector<double> out;
  if (blockSize == 0) return out;
  for (size_t off = 0; off + blockSize <= data.size(); off += blockSize) {
    out.push_back(shannonEntropy(data.data() + off, blockSize));
  }
  return out;
}

static inline size_t popcount8(uint8_t v) {
  size_t c = 0;
  while (v) { c += v & 1u; v >>= 1; }
  return c;
}

size_t hammingDistance(const std::vector<uint8_t> &a, const std::vector<uint8_t> &b) {
  if (a.size() != b.size()) {
    throw ValidationError("hammingDistance: sequences must have equal length");
  }
  size_t d = 0;
  for (size_t i = 0; i < a.size(); ++i) d += popcount8((uint8_t)(a[i] ^ b[i]));
  return d;
}

AvalancheReport avalancheTest(
    const std::function<std::vector<uint8_t>(const std::vector<uint8_t> &)> &encryptFn,
    const std::vector<uint8_t> &plaintext, size_t nTrials, uint32_t rngSeed) {
  if (plaintext.empty() || nTrials == 0) {
    throw ValidationError("avalancheTest needs a non-empty plaintext and at least one trial");
  }

  const std::vector<uint8_t> baseline = encryptFn(plaintext);
  std::mt19937 rng(rngSeed);
  std::uniform_int_distribution<size_t> bytePos(0, plaintext.size() - 1);
  std::uniform_int_distribution<int> bitPos(0, 7);

  AvalancheReport rep;
  rep.totalBits = baseline.size() * 8;
  rep.minFlip = (size_t)-1;
  rep.maxFlip = 0;

  double sum = 0.0, sumSq = 0.0;
  for (size_t t = 0; t < nTrials; ++t) {
    std::vector<uint8_t> modified = plaintext;
    modified[bytePos(rng)] ^= (uint8_t)(1u << bitPos(rng));
    std::vector<uint8_t> ct = encryptFn(modified);
    // Same plaintext length -> same padded length
    size_t flipped = hammingDistance(baseline, ct);

    double pct = rep.totalBits ? 100.0 * (double)flipped / (double)rep.totalBits : 0.0;
    sum += pct;
    sumSq += pct * pct;
    if (flipped < rep.minFlip) rep.minFlip = flipped;
    if (flipped > rep.maxFlip) rep.maxFlip = flipped;
  }
  rep.meanFlipPercentage = sum / (double)nTrials;
  double var = sumSq / (double)nTrials - rep.meanFlipPercentage * rep.meanFlipPercentage;
  rep.stdFlipPercentage = var > 0.0 ? std::sqrt(var) : 0.0;
  return rep;
}

double lyapunovLogistic(double r, double x0, size_t nIterations) {
  if (nIterations == 0) return 0.0;
  LogisticMap map(r, x0);
  std::vector<double> xs = map.trajectory(nIterations);

  double sum = 0.0;
  for (double x : xs) {
    double d = std::fabs(r - 2.0 * r * x);
    if (d > 1e-12) sum += std::log(d);
  }
  return sum / (double)nIterations;
}
