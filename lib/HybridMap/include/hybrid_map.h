/**
 * hybrid_map.h - Hybrid chaotic map: logistic + Hénon + Lorenz + sine in lock-step
 *
 * The four primitives evolve independently; coupling happens only when bytes
 * are produced. generateKeystream quantizes every primitive to n bytes and
 * combines the four sequences through a fixed four-layer mix:
 *
 *   L1  add  = floor((a*b1 mod 256 + b*b2 mod 256 + c*b3 mod 256 + d*b4 mod 256) mod 256)
 *   L2  x1 = b1^b2, x2 = b3^b4;  xor = x1 ^ x2 ^ roll(x1,3) ^ roll(x2,5)
 *   L3  mid  = (add + xor) mod 256
 *   L4  out  = mid ^ roll(b1,1) ^ roll(b2,2)
 *
 * where roll(v,k)[i] = v[(i - k) mod n]. The order is part of the output format.
 *
 * State contract: advance, generateKeystream and generatePermutation all consume
 * trajectory. Two callers that need identical output must start from identical
 * state and issue identical calls in identical order; reset() restores the
 * construction-time state. Not thread-safe.
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

#include "chaos_params.h"
#include "common.h"
#include "henon_map.h"
#include "logistic_map.h"
#include "lorenz_system.h"
#include "sine_map.h"

// Seven seeds, one per state component
struct InitialConditions {
  double logisticX = 0.5;
  double henonX    = 0.1;
  double henonY    = 0.1;
  double lorenzX   = 1.0;
  double lorenzY   = 1.0;
  double lorenzZ   = 1.0;
  double sineX     = 0.5;
};

struct HybridState {
  double logistic;
  HenonState henon;
  LorenzState lorenz;
  double sine;
};

class HybridChaoticMap {
public:
  HybridChaoticMap(const ChaosParams& params = ChaosParams(),
                   const MixingCoefficients& mixing = MixingCoefficients(),
                   const InitialConditions& ic = InitialConditions());

  // Step all four primitives `n` times; output is discarded
  void advance(size_t n);

  HybridState state() const;

  // Burn in, quantize each primitive to nBytes and mix
  std::vector<uint8_t> generateKeystream(size_t nBytes, size_t burnIn = CHAOS_BURN_IN);

  // Permutation of 0..n-1 from the Hénon x trajectory. Advances the Hénon map by n steps.
  std::vector<size_t> generatePermutation(size_t n);

  // Next nPoints of the Lorenz trajectory; the Lorenz state is restored afterwards
  std::vector<LorenzState> attractorData(size_t nPoints = 1000);

  void reset();

  static std::vector<uint8_t> mixBytes(const std::vector<uint8_t>& b1,
                                       const std::vector<uint8_t>& b2,
                                       const std::vector<uint8_t>& b3,
                                       const std::vector<uint8_t>& b4,
                                       const MixingCoefficients& mixing);

  // Diagnostics from all four primitives
  std::vector<std::string> warnings() const;

  const ChaosParams& params() const { return params_; }
  const MixingCoefficients& mixing() const { return mixing_; }
  const InitialConditions& initialConditions() const { return ic_; }

  LogisticMap& logistic() { return logistic_; }
  HenonMap& henon() { return henon_; }
  LorenzSystem& lorenz() { return lorenz_; }
  SineMap& sine() { return sine_; }

private:
  ChaosParams params_;
  MixingCoefficients mixing_;
  InitialConditions ic_;

  LogisticMap logistic_;
  HenonMap henon_;
  LorenzSystem lorenz_;
  SineMap sine_;
};
