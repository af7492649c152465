/**
 * entropy.h - Random salt gathering and read-only byte-stream analyzers.
 *
 * gatherSalt draws from the platform entropy sources through mbedTLS
 * (entropy pool + CTR-DRBG). Use it whenever two encryptions under the same
 * secret must not be linkable; the default salt derived from the secret is
 * predictable.
 *
 * The analyzers only read produced bytes (keystreams, ciphertexts) and never
 * feed back into encryption or decryption.
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <vector>

/**
 * Fill out[0..len) with random bytes. Returns true on success.
 * personalization is mixed into the DRBG seed (may be NULL).
 */
bool gatherSalt(uint8_t *out, size_t len, const char *personalization = nullptr);

// Byte-wise Shannon entropy in bits per byte (8.0 is the maximum). 0 for empty input.
double shannonEntropy(const uint8_t *data, size_t len);
double shannonEntropy(const std::vector<uint8_t> &data);

// Entropy of each complete blockSize-byte block
std::vector<double> entropyPerBlock(const std::vector<uint8_t> &data, size_t blockSize = 16);

// Number of differing bits. Throws ValidationError on length mismatch.
size_t hammingDistance(const std::vector<uint8_t> &a, const std::vector<uint8_t> &b);

struct AvalancheReport {
  double meanFlipPercentage;
  double stdFlipPercentage;
  size_t minFlip;
  size_t maxFlip;
  size_t totalBits;
};

/**
 * Flip one random plaintext bit per trial and count ciphertext bit changes
 * against the unmodified encryption. encryptFn must be a pure function of its
 * input (e.g. build a fresh cipher per call). rngSeed makes the bit choice reproducible.
 */
AvalancheReport avalancheTest(
    const std::function<std::vector<uint8_t>(const std::vector<uint8_t> &)> &encryptFn,
    const std::vector<uint8_t> &plaintext, size_t nTrials = 100, uint32_t rngSeed = 1);

// Lyapunov exponent of the logistic map: mean of ln|r - 2rx| along the trajectory
double lyapunovLogistic(double r = 3.99, double x0 = 0.5, size_t nIterations = 10000);
