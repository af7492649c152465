/**
 * common.h - Shared constants, error types, logging and hex helpers.
 *
 * Every default below can be overridden at compile time (-DCHAOS_BURN_IN=8192 ...).
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef CHAOS_BURN_IN
// Iterations discarded before every keystream generation
#define CHAOS_BURN_IN 4096
#endif

#ifndef CHAOS_BLOCK_SIZE
#define CHAOS_BLOCK_SIZE 16
#endif

#ifndef CHAOS_MIN_SALT_LEN
#define CHAOS_MIN_SALT_LEN 16
#endif

#ifndef CHAOS_LORENZ_DT
// Fixed RK4 step
#define CHAOS_LORENZ_DT 0.01
#endif

// HKDF-SHA256 single-call limit (255 * HashLen)
#define CHAOS_HKDF_HASH_LEN 32
#define CHAOS_HKDF_MAX_OUTPUT (255 * CHAOS_HKDF_HASH_LEN)

// HKDF context labels (domain separation)
#define CHAOS_INFO_KEY "Butterfly-crypto-key"
#define CHAOS_INFO_KEYSTREAM "keystream"

class ChaosError : public std::runtime_error {
public:
  explicit ChaosError(const std::string& msg) : std::runtime_error(msg) {}
};

// Invalid initial condition, parameter, mixing weights or block size
class ConfigurationError : public ChaosError {
public:
  explicit ConfigurationError(const std::string& msg) : ChaosError(msg) {}
};

// Caller-supplied input rejected (short salt, zero key length, ...)
class ValidationError : public ChaosError {
public:
  explicit ValidationError(const std::string& msg) : ChaosError(msg) {}
};

// Ciphertext cannot be decoded (bad length or padding)
class DecryptionError : public ChaosError {
public:
  explicit DecryptionError(const std::string& msg) : ChaosError(msg) {}
};

// mbedTLS reported a failure
class CryptoBackendError : public ChaosError {
public:
  explicit CryptoBackendError(const std::string& msg) : ChaosError(msg) {}
};

// Console logging: info -> stdout with a component tag, warnings/errors -> stderr with timestamp
void log_info(const std::string& tag, const std::string& msg);
void log_warning(const std::string& msg);
void log_error(const std::string& msg);

std::string bytesToHex(const uint8_t* data, size_t len);
std::string bytesToHex(const std::vector<uint8_t>& bytes);
// Throws ValidationError on odd length or non-hex characters
std::vector<uint8_t> hexToBytes(const std::string& hex);

std::vector<uint8_t> toBytes(const std::string& text);
