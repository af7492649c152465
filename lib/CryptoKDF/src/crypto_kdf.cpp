#include "crypto_kdf.h"
#include "hmac.h"
#include <string.h>
#include <stdint.h>

// -----------------------------------------------------------------------------
// HKDF Extract (PRK = HMAC(salt, IKM))
// If salt==NULL or saltLen==0, HashLen zero bytes are used (RFC 5869 2.2)
// -----------------------------------------------------------------------------
bool hkdf_extract(const uint8_t *salt, size_t saltLen,
                  const uint8_t *ikm, size_t ikmLen,
                  uint8_t prk[32]) {
    if (!prk || (!ikm && ikmLen)) return false;

    static const uint8_t zeroSalt[CHAOS_HKDF_HASH_LEN] = {0};
    if (!salt || saltLen == 0) {
        salt = zeroSalt;
        saltLen = sizeof(zeroSalt);
    }

    return hmac_sha256_full(salt, saltLen, ikm, ikmLen, prk);
}

// -----------------------------------------------------------------------------
// HKDF Expand - info-based expansion
// T(i) = HMAC(PRK, T(i-1) || info || i), outLen <= 255*HashLen
// -----------------------------------------------------------------------------
bool hkdf_expand(const uint8_t prk[32],
                 const uint8_t *info, size_t infoLen,
                 uint8_t *out, size_t outLen)
{
    if (!prk || !out || outLen == 0) return false;
    const size_t hashLen = CHAOS_HKDF_HASH_LEN;
    uint32_t n = (uint32_t)((outLen + hashLen - 1) / hashLen);
    if (n == 0 || n > 255) return false;

    uint8_t T[CHAOS_HKDF_HASH_LEN];
    uint8_t previous[CHAOS_HKDF_HASH_LEN];
    size_t produced = 0;
    uint8_t ctr = 1;

    memset(previous, 0, sizeof(previous));
    for (uint32_t i = 1; i <= n; ++i) {
        // data = previous || info || ctr, fed part by part
        const uint8_t *parts[3] = { previous, info, &ctr };
        const size_t lens[3] = { (i > 1) ? hashLen : 0, info ? infoLen : 0, 1 };
        if (!hmac_sha256_multi(prk, hashLen, parts, lens, 3, T)) {
            secure_memzero(T, sizeof(T));
            secure_memzero(previous, sizeof(previous));
            return false;
        }

        size_t copy = (produced + hashLen > outLen) ? (outLen - produced) : hashLen;
        memcpy(out + produced, T, copy);
        produced += copy;
        memcpy(previous, T, hashLen);
        ctr++;
    }

    // zero sensitive temporaries
    secure_memzero(T, sizeof(T));
    secure_memzero(previous, sizeof(previous));
    return true;
}

bool hkdf_sha256(const uint8_t *salt, size_t saltLen,
                 const uint8_t *ikm, size_t ikmLen,
                 const uint8_t *info, size_t infoLen,
                 uint8_t *out, size_t outLen) {
    uint8_t prk[CHAOS_HKDF_HASH_LEN];
    if (!hkdf_extract(salt, saltLen, ikm, ikmLen, prk)) {
        secure_memzero(prk, sizeof(prk));
        return false;
    }
    bool ok = hkdf_expand(prk, info, infoLen, out, outLen);
    secure_memzero(prk, sizeof(prk));
    return ok;
}

// -----------------------------------------------------------------------------
// ChaoticKDF
// -----------------------------------------------------------------------------
static inline uint64_t load64be(const uint8_t *p) {
    return ((uint64_t)p[0] << 56) | ((uint64_t)p[1] << 48) | ((uint64_t)p[2] << 40) |
           ((uint64_t)p[3] << 32) | ((uint64_t)p[4] << 24) | ((uint64_t)p[5] << 16) |
           ((uint64_t)p[6] << 8)  | ((uint64_t)p[7]);
}

// u64 / 2^64 in [0, 1)
static inline double unitFrom64(const uint8_t *p) {
    return (double)load64be(p) / 18446744073709551616.0;
}

InitialConditions ChaoticKDF::preseedToInitialConditions(const uint8_t preseed[64]) {
    InitialConditions ic;
    ic.logisticX = unitFrom64(preseed + 0)  * 0.8 + 0.1;   // [0.1, 0.9]
    ic.henonX    = unitFrom64(preseed + 8)  * 0.4 - 0.2;   // [-0.2, 0.2]
    ic.henonY    = unitFrom64(preseed + 16) * 0.4 - 0.2;
    ic.lorenzX   = unitFrom64(preseed + 24) * 20.0 - 10.0; // [-10, 10]
    ic.lorenzY   = unitFrom64(preseed + 32) * 20.0 - 10.0;
    ic.lorenzZ   = unitFrom64(preseed + 40) * 40.0 + 5.0;  // [5, 45]
    ic.sineX     = unitFrom64(preseed + 48) * 0.8 + 0.1;   // [0.1, 0.9]
    // preseed[56..63] is unused
    return ic;
}

InitialConditions ChaoticKDF::seedConditions(const std::vector<uint8_t>& secret,
                                             const std::vector<uint8_t>& salt) {
    if (salt.size() < CHAOS_MIN_SALT_LEN) {
        throw ValidationError("Salt must be at least " + std::to_string(CHAOS_MIN_SALT_LEN) +
                              " bytes, got " + std::to_string(salt.size()));
    }

    uint8_t preseed[64];
    if (!hmac_sha512_full(salt.data(), salt.size(), secret.data(), secret.size(), preseed)) {
        secure_memzero(preseed, sizeof(preseed));
        throw CryptoBackendError("HMAC-SHA512 preseed computation failed");
    }
    InitialConditions ic = preseedToInitialConditions(preseed);
    secure_memzero(preseed, sizeof(preseed));
    return ic;
}

ChaoticKDF::ChaoticKDF(const std::vector<uint8_t>& secret, const std::vector<uint8_t>& salt,
                       const ChaosParams& params, const MixingCoefficients& mixing,
                       size_t burnIn)
  : salt_(salt), burnIn_(burnIn), hcm_(params, mixing, seedConditions(secret, salt)) {}

ChaoticKDF::ChaoticKDF(const std::string& secret, const std::vector<uint8_t>& salt,
                       const ChaosParams& params, const MixingCoefficients& mixing,
                       size_t burnIn)
  : ChaoticKDF(toBytes(secret), salt, params, mixing, burnIn) {}

std::vector<uint8_t> ChaoticKDF::deriveKey(size_t length, const std::string& info) {
    if (length == 0 || length > CHAOS_HKDF_MAX_OUTPUT) {
        throw ValidationError("Key length must be in [1, " +
                              std::to_string(CHAOS_HKDF_MAX_OUTPUT) + "], got " +
                              std::to_string(length));
    }

    std::vector<uint8_t> raw = hcm_.generateKeystream(length * 2, burnIn_);
    std::vector<uint8_t> key(length);
    bool ok = hkdf_sha256(salt_.data(), salt_.size(), raw.data(), raw.size(),
                          (const uint8_t *)info.data(), info.size(),
                          key.data(), key.size());
    secure_memzero(raw.data(), raw.size());
    if (!ok) throw CryptoBackendError("HKDF key derivation failed");
    return key;
}

std::vector<uint8_t> ChaoticKDF::deriveKeystream(size_t length, bool raw) {
    std::vector<uint8_t> ks = hcm_.generateKeystream(length, burnIn_);
    if (raw || length == 0) return ks;

    static const char info[] = CHAOS_INFO_KEYSTREAM;
    const size_t infoLen = sizeof(info) - 1;

    std::vector<uint8_t> out(length);
    for (size_t start = 0; start < length; start += CHAOS_HKDF_MAX_OUTPUT) {
        size_t chunk = (length - start) < (size_t)CHAOS_HKDF_MAX_OUTPUT
                           ? (length - start) : (size_t)CHAOS_HKDF_MAX_OUTPUT;
        if (!hkdf_sha256(salt_.data(), salt_.size(), ks.data() + start, chunk,
                         (const uint8_t *)info, infoLen, out.data() + start, chunk)) {
            secure_memzero(ks.data(), ks.size());
            throw CryptoBackendError("HKDF keystream whitening failed");
        }
    }
    secure_memzero(ks.data(), ks.size());
    return out;
}
