/**
 * logistic_map.h - Discrete 1D logistic map
 * x_{n+1} = r * x_n * (1 - x_n)
 *
 * Chaotic regime: r in [3.57, 4.0] (outside it a warning is recorded).
 * Initial state must lie in (0, 1).
 * Quantization: floor(255 * x) per step.
 */
#pragma once
#include "chaos_map.h"

class LogisticMap : public ChaosMap {
public:
  explicit LogisticMap(double r = 3.99, double x0 = 0.5);

  const char* name() const override { return "LogisticMap"; }
  size_t dimension() const override { return 1; }

  void advance(size_t steps) override;
  std::vector<double> trajectory(size_t length) override;
  std::vector<uint8_t> quantize(size_t length) override;
  void reset() override { x_ = x0_; }

  // Explicit reset; x0 must be in (0, 1)
  void resetTo(double x0);

  double x() const { return x_; }
  double r() const { return r_; }

private:
  double r_;
  double x_;
  double x0_;
};
