#include "hybrid_map.h"
#include <cmath>

// roll(v, k)[i] = v[(i - k) mod n]
static std::vector<uint8_t> roll(const std::vector<uint8_t>& v, size_t k) {
  const size_t n = v.size();
  std::vector<uint8_t> out(n);
  if (n == 0) return out;
  k %= n;
  for (size_t i = 0; i < n; ++i) out[(i + k) % n] = v[i];
  return out;
}

HybridChaoticMap::HybridChaoticMap(const ChaosParams& params,
                                   const MixingCoefficients& mixing,
                                   const InitialConditions& ic)
  : params_(params), mixing_(mixing), ic_(ic),
    logistic_(params.logisticR, ic.logisticX),
    henon_(params.henonA, params.henonB, ic.henonX, ic.henonY),
    lorenz_(params.lorenzSigma, params.lorenzRho, params.lorenzBeta,
            ic.lorenzX, ic.lorenzY, ic.lorenzZ),
    sine_(params.sineMu, ic.sineX) {}

void HybridChaoticMap::advance(size_t n) {
  // Lock-step: one step of every map per iteration
  for (size_t i = 0; i < n; ++i) {
    logistic_.advance(1);
    henon_.advance(1);
    lorenz_.advance(1);
    sine_.advance(1);
  }
}

HybridState HybridChaoticMap::state() const {
  HybridState s;
  s.logistic = logistic_.x();
  s.henon = henon_.state();
  s.lorenz = lorenz_.state();
  s.sine = sine_.x();
  return s;
}

std::vector<uint8_t> HybridChaoticMap::generateKeystream(size_t nBytes, size_t burnIn) {
  if (nBytes == 0) return std::vector<uint8_t>();
  advance(burnIn);

  std::vector<uint8_t> logBytes  = logistic_.quantize(nBytes);
  std::vector<uint8_t> henBytes  = henon_.quantize(nBytes);
  std::vector<uint8_t> lorBytes  = lorenz_.quantize(nBytes);
  std::vector<uint8_t> sineBytes = sine_.quantize(nBytes);

  return mixBytes(logBytes, henBytes, lorBytes, sineBytes, mixing_);
}

std::vector<uint8_t> HybridChaoticMap::mixBytes(const std::vector<uint8_t>& b1,
                                                const std::vector<uint8_t>& b2,
                                                const std::vector<uint8_t>& b3,
                                                const std::vector<uint8_t>& b4,
                                                const MixingCoefficients& mixing) {
  const size_t n = b1.size();
  if (b2.size() != n || b3.size() != n || b4.size() != n) {
    throw ValidationError("mixBytes: sequences must have equal length");
  }

  // Layer 2 inputs
  std::vector<uint8_t> xor1(n), xor2(n);
  for (size_t i = 0; i < n; ++i) {
    xor1[i] = (uint8_t)(b1[i] ^ b2[i]);
    xor2[i] = (uint8_t)(b3[i] ^ b4[i]);
  }
  std::vector<uint8_t> rot1 = roll(xor1, 3);
  std::vector<uint8_t> rot2 = roll(xor2, 5);
  std::vector<uint8_t> b1r = roll(b1, 1);
  std::vector<uint8_t> b2r = roll(b2, 2);

  std::vector<uint8_t> out(n);
  for (size_t i = 0; i < n; ++i) {
    // Layer 1: weighted modular sum (kept in floating point, truncated once)
    double w1 = std::fmod(mixing.alpha * b1[i], 256.0);
    double w2 = std::fmod(mixing.beta  * b2[i], 256.0);
    double w3 = std::fmod(mixing.gamma * b3[i], 256.0);
    double w4 = std::fmod(mixing.delta * b4[i], 256.0);
    int add = (int)std::fmod(w1 + w2 + w3 + w4, 256.0);

    // Layer 2: multi-stage XOR with rotations
    int mixedXor = xor1[i] ^ xor2[i] ^ rot1[i] ^ rot2[i];

    // Layer 3
    uint8_t mid = (uint8_t)((add + mixedXor) % 256);

    // Layer 4: final whitening
    out[i] = (uint8_t)(mid ^ b1r[i] ^ b2r[i]);
  }
  return out;
}

std::vector<size_t> HybridChaoticMap::generatePermutation(size_t n) {
  return henon_.permutationIndices(n);
}

std::vector<LorenzState> HybridChaoticMap::attractorData(size_t nPoints) {
  LorenzState saved = lorenz_.state();
  std::vector<LorenzState> traj = lorenz_.trajectoryXYZ(nPoints);
  lorenz_.restore(saved);
  return traj;
}

void HybridChaoticMap::reset() {
  logistic_.reset();
  henon_.reset();
  lorenz_.reset();
  sine_.reset();
}

std::vector<std::string> HybridChaoticMap::warnings() const {
  std::vector<std::string> all;
  const ChaosMap* maps[4] = {&logistic_, &henon_, &lorenz_, &sine_};
  for (const ChaosMap* m : maps) {
    all.insert(all.end(), m->warnings().begin(), m->warnings().end());
  }
  return all;
}
