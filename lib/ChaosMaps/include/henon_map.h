/**
 * henon_map.h - Discrete 2D Hénon map
 * x_{n+1} = 1 - a*x_n^2 + y_n
 * y_{n+1} = b*x_n
 *
 * Classic chaotic parameters a=1.4, b=0.3. Initial x0, y0 must lie in (-1.5, 1.5).
 *
 * Besides bytes, the map drives the cipher's permutation stage: the indices
 * that sort an n-step x trajectory ascending form a permutation of 0..n-1.
 * The permutation follows the order statistics of the trajectory and is not
 * uniform over all n! permutations.
 */
#pragma once
#include "chaos_map.h"

struct HenonState {
  double x, y;
};

class HenonMap : public ChaosMap {
public:
  HenonMap(double a = 1.4, double b = 0.3, double x0 = 0.1, double y0 = 0.1);

  const char* name() const override { return "HenonMap"; }
  size_t dimension() const override { return 2; }

  void advance(size_t steps) override;
  // Interleaved x0,y0,x1,y1,...
  std::vector<double> trajectory(size_t length) override;
  // floor(255 * minmax((|x|+|y|)/2)) over the generated window
  std::vector<uint8_t> quantize(size_t length) override;
  void reset() override { s_ = s0_; }

  void trajectoryXY(size_t length, std::vector<double>& xs, std::vector<double>& ys);

  // Indices sorting the next n x-values ascending (stable). Advances the state by n steps.
  std::vector<size_t> permutationIndices(size_t n);

  void resetTo(double x0, double y0);

  HenonState state() const { return s_; }
  double a() const { return a_; }
  double b() const { return b_; }

private:
  double a_, b_;
  HenonState s_;
  HenonState s0_;
};
