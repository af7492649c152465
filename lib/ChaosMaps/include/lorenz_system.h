/**
 * lorenz_system.h - Continuous 3D Lorenz system
 * dx/dt = sigma*(y - x)
 * dy/dt = x*(rho - z) - y
 * dz/dt = x*y - beta*z
 *
 * Integrated with fixed-step RK4 (dt = CHAOS_LORENZ_DT by default, never adaptive).
 * Classic parameters sigma=10, rho=28, beta=8/3. Initial coordinates must lie in (-100, 100).
 * Quantization: each coordinate min-max normalized over the window, mixed as
 * (0.5*x + 0.3*y + 0.2*z) mod 1, then floor-scaled to a byte.
 */
#pragma once
#include "chaos_map.h"
#include "common.h"

struct LorenzState {
  double x, y, z;
};

struct LorenzParams {
  double sigma, rho, beta;
};

// One RK4 step of the Lorenz field
LorenzState lorenz_rk4_step(const LorenzState& s, const LorenzParams& p, double dt);

class LorenzSystem : public ChaosMap {
public:
  LorenzSystem(double sigma = 10.0, double rho = 28.0, double beta = 8.0 / 3.0,
               double x0 = 1.0, double y0 = 1.0, double z0 = 1.0,
               double dt = CHAOS_LORENZ_DT);

  const char* name() const override { return "LorenzSystem"; }
  size_t dimension() const override { return 3; }

  void advance(size_t steps) override;
  // Interleaved x,y,z per step
  std::vector<double> trajectory(size_t length) override;
  std::vector<uint8_t> quantize(size_t length) override;
  void reset() override { s_ = s0_; }

  std::vector<LorenzState> trajectoryXYZ(size_t length);

  void resetTo(double x0, double y0, double z0);

  // Snapshot/restore of the running state (no domain check; for callers that
  // need to peek ahead without consuming trajectory)
  LorenzState state() const { return s_; }
  void restore(const LorenzState& s) { s_ = s; }

  const LorenzParams& params() const { return p_; }
  double dt() const { return dt_; }

private:
  LorenzParams p_;
  double dt_;
  LorenzState s_;
  LorenzState s0_;
};
