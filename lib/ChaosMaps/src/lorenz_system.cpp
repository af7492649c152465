#include "lorenz_system.h"
#include <cmath>
#include <sstream>

static inline LorenzState lorenz_derivatives(const LorenzState& s, const LorenzParams& p) {
  LorenzState d;
  d.x = p.sigma * (s.y - s.x);
  d.y = s.x * (p.rho - s.z) - s.y;
  d.z = s.x * s.y - p.beta * s.z;
  return d;
}

// s + h*k
static inline LorenzState axpy(const LorenzState& s, double h, const LorenzState& k) {
  LorenzState r;
  r.x = s.x + h * k.x;
  r.y = s.y + h * k.y;
  r.z = s.z + h * k.z;
  return r;
}

LorenzState lorenz_rk4_step(const LorenzState& s, const LorenzParams& p, double dt) {
  LorenzState k1 = lorenz_derivatives(s, p);
  LorenzState k2 = lorenz_derivatives(axpy(s, 0.5 * dt, k1), p);
  LorenzState k3 = lorenz_derivatives(axpy(s, 0.5 * dt, k2), p);
  LorenzState k4 = lorenz_derivatives(axpy(s, dt, k3), p);

  LorenzState r;
  r.x = s.x + (dt / 6.0) * (k1.x + 2.0 * k2.x + 2.0 * k3.x + k4.x);
  r.y = s.y + (dt / 6.0) * (k1.y + 2.0 * k2.y + 2.0 * k3.y + k4.y);
  r.z = s.z + (dt / 6.0) * (k1.z + 2.0 * k2.z + 2.0 * k3.z + k4.z);
  return r;
}

LorenzSystem::LorenzSystem(double sigma, double rho, double beta,
                           double x0, double y0, double z0, double dt)
  : dt_(dt) {
  requireFinite(sigma, "lorenz sigma");
  requireFinite(rho, "lorenz rho");
  requireFinite(beta, "lorenz beta");
  requireFinite(dt, "lorenz dt");
  if (dt <= 0.0) throw ConfigurationError("lorenz dt must be positive");
  requireOpenInterval(x0, -100.0, 100.0, "lorenz x0");
  requireOpenInterval(y0, -100.0, 100.0, "lorenz y0");
  requireOpenInterval(z0, -100.0, 100.0, "lorenz z0");

  p_.sigma = sigma;
  p_.rho = rho;
  p_.beta = beta;
  s_.x = x0;
  s_.y = y0;
  s_.z = z0;
  s0_ = s_;

  if (sigma <= 0.0 || beta <= 0.0 || rho < 24.74) {
    std::ostringstream os;
    os << "sigma=" << sigma << ", rho=" << rho << ", beta=" << beta
       << " may not be chaotic (needs sigma > 0, beta > 0, rho >= 24.74)";
    warnRegime(os.str());
  }
}

void LorenzSystem::advance(size_t steps) {
  for (size_t i = 0; i < steps; ++i) s_ = lorenz_rk4_step(s_, p_, dt_);
}

std::vector<LorenzState> LorenzSystem::trajectoryXYZ(size_t length) {
  std::vector<LorenzState> traj(length);
  for (size_t i = 0; i < length; ++i) {
    s_ = lorenz_rk4_step(s_, p_, dt_);
    traj[i] = s_;
  }
  return traj;
}

std::vector<double> LorenzSystem::trajectory(size_t length) {
  std::vector<LorenzState> traj = trajectoryXYZ(length);
  std::vector<double> out;
  out.reserve(3 * length);
  for (const LorenzState& s : traj) {
    out.push_back(s.x);
    out.push_back(s.y);
    out.push_back(s.z);
  }
  return out;
}

std::vector<uint8_t> LorenzSystem::quantize(size_t length) {
  std::vector<LorenzState> traj = trajectoryXYZ(length);
  std::vector<double> xs(length), ys(length), zs(length);
  for (size_t i = 0; i < length; ++i) {
    xs[i] = traj[i].x;
    ys[i] = traj[i].y;
    zs[i] = traj[i].z;
  }
  requireFiniteWindow(xs);
  requireFiniteWindow(ys);
  requireFiniteWindow(zs);
  normalizeWindow(xs);
  normalizeWindow(ys);
  normalizeWindow(zs);

  std::vector<uint8_t> out(length);
  for (size_t i = 0; i < length; ++i) {
    double mixed = std::fmod(0.5 * xs[i] + 0.3 * ys[i] + 0.2 * zs[i], 1.0);
    out[i] = scaleToByte(mixed);
  }
  return out;
}

void LorenzSystem::resetTo(double x0, double y0, double z0) {
  requireOpenInterval(x0, -100.0, 100.0, "lorenz x0");
  requireOpenInterval(y0, -100.0, 100.0, "lorenz y0");
  requireOpenInterval(z0, -100.0, 100.0, "lorenz z0");
  s_.x = x0;
  s_.y = y0;
  s_.z = z0;
}
