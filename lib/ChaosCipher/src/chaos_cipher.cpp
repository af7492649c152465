#include "chaos_cipher.h"
#include "hmac.h"
#include "transposition.h"
#include <algorithm>
#include <atomic>
#include <exception>
#include <string.h>
#include <system_error>
#include <thread>

static size_t checkedBlockSize(size_t blockSize) {
  // The pad length must fit in one byte
  if (blockSize == 0 || blockSize > 255) {
    throw ConfigurationError("Block size must be in [1, 255], got " + std::to_string(blockSize));
  }
  return blockSize;
}

std::vector<uint8_t> defaultSaltFromSecret(const std::string& secret) {
  uint8_t digest[32];
  if (!sha256_digest((const uint8_t*)secret.data(), secret.size(), digest)) {
    throw CryptoBackendError("SHA-256 of secret failed");
  }
  std::vector<uint8_t> salt(digest, digest + CHAOS_MIN_SALT_LEN);
  secure_memzero(digest, sizeof(digest));
  return salt;
}

ChaosCipher::ChaosCipher(const std::string& secret, const ChaosParams& params,
                         const MixingCoefficients& mixing, size_t blockSize)
  : ChaosCipher(secret, defaultSaltFromSecret(secret), params, mixing, blockSize) {}

ChaosCipher::ChaosCipher(const std::string& secret, const std::vector<uint8_t>& salt,
                         const ChaosParams& params, const MixingCoefficients& mixing,
                         size_t blockSize, size_t burnIn)
  : blockSize_(checkedBlockSize(blockSize)),
    kdf_(secret, salt, params, mixing, burnIn) {}

std::vector<uint8_t> ChaosCipher::pad(const std::vector<uint8_t>& data, size_t blockSize) {
  checkedBlockSize(blockSize);
  size_t padLen = blockSize - (data.size() % blockSize);
  std::vector<uint8_t> out(data);
  out.insert(out.end(), padLen, (uint8_t)padLen);
  return out;
}

std::vector<uint8_t> ChaosCipher::unpad(const std::vector<uint8_t>& data, size_t blockSize) {
  if (data.empty()) {
    throw DecryptionError("Cannot unpad empty data");
  }
  size_t padLen = data.back();
  if (padLen == 0 || padLen > blockSize || padLen > data.size()) {
    throw DecryptionError("Invalid pad length " + std::to_string(padLen) +
                          " (wrong key or corrupted ciphertext?)");
  }
  return std::vector<uint8_t>(data.begin(), data.end() - padLen);
}

void ChaosCipher::encryptBlock(const uint8_t* in, uint8_t* out) {
  // Order matters: permutation first, then keystream (decryptBlock mirrors it)
  std::vector<size_t> perm = kdf_.hybridMap().generatePermutation(blockSize_);
  applyTransposition(in, out, perm, PermuteMode::Forward);

  std::vector<uint8_t> ks = kdf_.deriveKeystream(blockSize_, false);
  for (size_t i = 0; i < blockSize_; ++i) out[i] ^= ks[i];
  secure_memzero(ks.data(), ks.size());
}

void ChaosCipher::decryptBlock(const uint8_t* in, uint8_t* out) {
  std::vector<size_t> perm = kdf_.hybridMap().generatePermutation(blockSize_);
  std::vector<uint8_t> ks = kdf_.deriveKeystream(blockSize_, false);

  std::vector<uint8_t> afterXor(blockSize_);
  for (size_t i = 0; i < blockSize_; ++i) afterXor[i] = (uint8_t)(in[i] ^ ks[i]);
  secure_memzero(ks.data(), ks.size());

  applyTransposition(afterXor.data(), out, perm, PermuteMode::Inverse);
}

std::vector<uint8_t> ChaosCipher::encrypt(const std::vector<uint8_t>& plaintext) {
  std::vector<uint8_t> padded = pad(plaintext, blockSize_);
  std::vector<uint8_t> ct(padded.size());
  for (size_t off = 0; off < padded.size(); off += blockSize_) {
    encryptBlock(padded.data() + off, ct.data() + off);
  }
  secure_memzero(padded.data(), padded.size());
  return ct;
}

std::vector<uint8_t> ChaosCipher::encrypt(const std::string& plaintext) {
  return encrypt(toBytes(plaintext));
}

std::vector<uint8_t> ChaosCipher::decrypt(const std::vector<uint8_t>& ciphertext) {
  if (ciphertext.empty() || ciphertext.size() % blockSize_ != 0) {
    throw DecryptionError("Ciphertext length " + std::to_string(ciphertext.size()) +
                          " is not a positive multiple of block size " +
                          std::to_string(blockSize_));
  }

  // Replay from the initial state used by the matching encryption
  kdf_.reset();

  std::vector<uint8_t> pt(ciphertext.size());
  for (size_t off = 0; off < ciphertext.size(); off += blockSize_) {
    decryptBlock(ciphertext.data() + off, pt.data() + off);
  }
  std::vector<uint8_t> out;
  try {
    out = unpad(pt, blockSize_);
  } catch (const DecryptionError&) {
    secure_memzero(pt.data(), pt.size());
    throw;
  }
  secure_memzero(pt.data(), pt.size());
  return out;
}

std::string ChaosCipher::keystreamFingerprint() {
  std::vector<uint8_t> sample = kdf_.deriveKeystream(32, true);
  uint8_t digest[32];
  if (!sha256_digest(sample.data(), sample.size(), digest)) {
    throw CryptoBackendError("SHA-256 of keystream sample failed");
  }
  return bytesToHex(digest, sizeof(digest));
}

// ---------------------------------------------------------------------------

static std::vector<uint8_t> effectiveSalt(const std::string& secret,
                                          const std::vector<uint8_t>& salt) {
  return salt.empty() ? defaultSaltFromSecret(secret) : salt;
}

std::vector<uint8_t> chaosDeriveKey(const std::string& secret,
                                    const std::vector<uint8_t>& salt,
                                    size_t keyLength,
                                    const ChaosParams& params,
                                    const MixingCoefficients& mixing) {
  ChaoticKDF kdf(secret, effectiveSalt(secret, salt), params, mixing);
  return kdf.deriveKey(keyLength);
}

std::vector<uint8_t> chaosEncrypt(const std::vector<uint8_t>& plaintext,
                                  const std::string& secret,
                                  const ChaosParams& params,
                                  const MixingCoefficients& mixing,
                                  const std::vector<uint8_t>& salt) {
  ChaosCipher cipher(secret, effectiveSalt(secret, salt), params, mixing);
  return cipher.encrypt(plaintext);
}

std::vector<uint8_t> chaosDecrypt(const std::vector<uint8_t>& ciphertext,
                                  const std::string& secret,
                                  const ChaosParams& params,
                                  const MixingCoefficients& mixing,
                                  const std::vector<uint8_t>& salt) {
  ChaosCipher cipher(secret, effectiveSalt(secret, salt), params, mixing);
  return cipher.decrypt(ciphertext);
}

std::vector<std::vector<uint8_t>> chaosEncryptBatch(
    const std::vector<std::vector<uint8_t>>& plaintexts,
    const std::string& secret,
    const std::vector<uint8_t>& salt,
    const ChaosParams& params,
    const MixingCoefficients& mixing,
    size_t maxThreads) {
  const size_t n = plaintexts.size();
  std::vector<std::vector<uint8_t>> results(n);
  if (n == 0) return results;

  const std::vector<uint8_t> useSalt = effectiveSalt(secret, salt);
  if (maxThreads == 0) maxThreads = std::max(1u, std::thread::hardware_concurrency());
  const size_t workers = std::min(maxThreads, n);

  std::atomic<size_t> next(0);
  std::vector<std::exception_ptr> errors(n);

  auto worker = [&]() {
    for (size_t i = next.fetch_add(1); i < n; i = next.fetch_add(1)) {
      try {
        // Engines are never shared between threads
        ChaosCipher cipher(secret, useSalt, params, mixing);
        results[i] = cipher.encrypt(plaintexts[i]);
      } catch (...) {
        errors[i] = std::current_exception();
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  try {
    for (size_t t = 0; t < workers; ++t) threads.emplace_back(worker);
  } catch (const std::system_error&) {
    // Started workers still drain the queue; join them before propagating
    for (std::thread& th : threads) th.join();
    throw;
  }
  for (std::thread& th : threads) th.join();

  for (const std::exception_ptr& e : errors) {
    if (e) std::rethrow_exception(e);
  }
  return results;
}
