/**
 * sine_map.h - Nonlinear 1D sine map
 * x_{n+1} = mu * sin(pi * x_n), folded back into [0, 1] via |x| and mod 1
 *
 * The fold is a numerical guard, not part of the canonical map.
 * Chaotic regime: mu in [0.8, 1.0]. Initial state must lie in (0, 1).
 * Quantization: floor(255 * |x|).
 */
#pragma once
#include "chaos_map.h"

class SineMap : public ChaosMap {
public:
  explicit SineMap(double mu = 0.99, double x0 = 0.5);

  const char* name() const override { return "SineMap"; }
  size_t dimension() const override { return 1; }

  void advance(size_t steps) override;
  std::vector<double> trajectory(size_t length) override;
  std::vector<uint8_t> quantize(size_t length) override;
  void reset() override { x_ = x0_; }

  void resetTo(double x0);

  double x() const { return x_; }
  double mu() const { return mu_; }

private:
  double mu_;
  double x_;
  double x0_;
};
