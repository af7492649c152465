/**
 * chaos_cipher.h - Block cipher over the chaotic KDF
 *
 * Per block (CHAOS_BLOCK_SIZE bytes by default):
 *   encrypt:  perm = hybrid Hénon permutation(n)
 *             block' = block[perm[i]]
 *             block' ^= whitened keystream(n)
 *   decrypt:  same perm, same keystream (same calls in the same order),
 *             XOR out, apply the inverse permutation
 *
 * Padding appends k bytes of value k (1 <= k <= block size), a full block when
 * the input is already aligned.
 *
 * Synchronization contract: encrypt() assumes the engine is at its initial
 * state, so use a freshly constructed engine (or call reset()) per message.
 * decrypt() always resets first, replaying the exact state transitions the
 * matching encryption went through.
 *
 * Wire format: raw padded blocks only. No header, salt, parameters or tag;
 * those travel out-of-band. There is no authentication: a wrong key decrypts
 * to garbage, and only an impossible pad length byte is detected.
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

#include "chaos_params.h"
#include "common.h"
#include "crypto_kdf.h"

/**
 * First 16 bytes of SHA-256(secret).
 * Predictable from the secret alone: two encryptions of the same message under
 * the same secret produce identical ciphertexts. Supply a random salt
 * (gatherSalt) whenever that matters.
 */
std::vector<uint8_t> defaultSaltFromSecret(const std::string& secret);

class ChaosCipher {
public:
  // Salt defaults to defaultSaltFromSecret(secret)
  explicit ChaosCipher(const std::string& secret,
                       const ChaosParams& params = ChaosParams(),
                       const MixingCoefficients& mixing = MixingCoefficients(),
                       size_t blockSize = CHAOS_BLOCK_SIZE);
  ChaosCipher(const std::string& secret, const std::vector<uint8_t>& salt,
              const ChaosParams& params = ChaosParams(),
              const MixingCoefficients& mixing = MixingCoefficients(),
              size_t blockSize = CHAOS_BLOCK_SIZE,
              size_t burnIn = CHAOS_BURN_IN);

  std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext);
  std::vector<uint8_t> encrypt(const std::string& plaintext);

  // Throws DecryptionError on empty/misaligned ciphertext or an out-of-range pad byte
  std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext);

  void reset() { kdf_.reset(); }

  // Hex SHA-256 of the next 32 raw keystream bytes. Consumes engine state.
  std::string keystreamFingerprint();

  ChaoticKDF& kdf() { return kdf_; }
  const std::vector<uint8_t>& salt() const { return kdf_.salt(); }
  size_t blockSize() const { return blockSize_; }
  std::vector<std::string> warnings() const { return kdf_.warnings(); }

  static std::vector<uint8_t> pad(const std::vector<uint8_t>& data, size_t blockSize);
  static std::vector<uint8_t> unpad(const std::vector<uint8_t>& data, size_t blockSize);

private:
  void encryptBlock(const uint8_t* in, uint8_t* out);
  void decryptBlock(const uint8_t* in, uint8_t* out);

  size_t blockSize_;
  ChaoticKDF kdf_;
};

// ---------------------------------------------------------------------------
// One-shot helpers. An empty salt means defaultSaltFromSecret(secret).
// ---------------------------------------------------------------------------
std::vector<uint8_t> chaosDeriveKey(const std::string& secret,
                                    const std::vector<uint8_t>& salt,
                                    size_t keyLength,
                                    const ChaosParams& params = ChaosParams(),
                                    const MixingCoefficients& mixing = MixingCoefficients());

std::vector<uint8_t> chaosEncrypt(const std::vector<uint8_t>& plaintext,
                                  const std::string& secret,
                                  const ChaosParams& params = ChaosParams(),
                                  const MixingCoefficients& mixing = MixingCoefficients(),
                                  const std::vector<uint8_t>& salt = std::vector<uint8_t>());

std::vector<uint8_t> chaosDecrypt(const std::vector<uint8_t>& ciphertext,
                                  const std::string& secret,
                                  const ChaosParams& params = ChaosParams(),
                                  const MixingCoefficients& mixing = MixingCoefficients(),
                                  const std::vector<uint8_t>& salt = std::vector<uint8_t>());

/**
 * Encrypt unrelated messages in parallel, one fresh engine per message.
 * Output order matches input order. The first failure is rethrown.
 * maxThreads = 0 picks std::thread::hardware_concurrency().
 */
std::vector<std::vector<uint8_t>> chaosEncryptBatch(
    const std::vector<std::vector<uint8_t>>& plaintexts,
    const std::string& secret,
    const std::vector<uint8_t>& salt,
    const ChaosParams& params = ChaosParams(),
    const MixingCoefficients& mixing = MixingCoefficients(),
    size_t maxThreads = 0);
