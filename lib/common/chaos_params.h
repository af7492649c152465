/**
 * chaos_params.h - Map parameter set and mixing weights.
 *
 * Recognized option keys (defaults):
 *   logistic_r   3.99     henon_a      1.4     henon_b     0.3
 *   lorenz_sigma 10.0     lorenz_rho   28.0    lorenz_beta 8/3
 *   sine_mu      0.99
 */
#pragma once
#include <map>
#include <string>

struct ChaosParams {
  double logisticR   = 3.99;
  double henonA      = 1.4;
  double henonB      = 0.3;
  double lorenzSigma = 10.0;
  double lorenzRho   = 28.0;
  double lorenzBeta  = 8.0 / 3.0;
  double sineMu      = 0.99;

  // Throws ConfigurationError for non-finite values
  void validate() const;
  std::map<std::string, double> toMap() const;
};

/**
 * Normalized weights (alpha, beta, gamma, delta) for the four primitives.
 * Always sum to 1.0; the constructor re-normalizes whatever the caller passes.
 * Negative, non-finite or all-zero weights raise ConfigurationError.
 */
class MixingCoefficients {
public:
  MixingCoefficients() : alpha(0.25), beta(0.25), gamma(0.25), delta(0.25) {}
  MixingCoefficients(double a, double b, double c, double d);

  double alpha, beta, gamma, delta;
};

// Unspecified keys keep defaults; unknown keys are logged and ignored.
ChaosParams chaosParamsFromMap(const std::map<std::string, double>& overrides);

// "logistic_r=3.97,henon_a=1.39" -> ChaosParams. Empty string yields defaults.
ChaosParams parseChaosParams(const std::string& text);

// "1,1,2,0" -> normalized MixingCoefficients
MixingCoefficients parseMixing(const std::string& text);
