#include "sine_map.h"
#include <cmath>
#include <sstream>

static const double kPi = 3.14159265358979323846;

static inline double sine_step(double x, double mu) {
  x = std::fabs(mu * std::sin(kPi * x));
  if (x > 1.0) x = x - std::floor(x);
  return x;
}

SineMap::SineMap(double mu, double x0) : mu_(mu), x_(x0), x0_(x0) {
  requireFinite(mu, "sine mu");
  requireOpenInterval(x0, 0.0, 1.0, "sine x0");
  if (!(mu >= 0.8 && mu <= 1.0)) {
    std::ostringstream os;
    os << "mu=" << mu << " may not be in chaotic regime [0.8, 1.0]";
    warnRegime(os.str());
  }
}

void SineMap::advance(size_t steps) {
  for (size_t i = 0; i < steps; ++i) x_ = sine_step(x_, mu_);
}

std::vector<double> SineMap::trajectory(size_t length) {
  std::vector<double> seq(length);
  for (size_t i = 0; i < length; ++i) {
    x_ = sine_step(x_, mu_);
    seq[i] = x_;
  }
  return seq;
}

std::vector<uint8_t> SineMap::quantize(size_t length) {
  std::vector<double> seq = trajectory(length);
  requireFiniteWindow(seq);
  std::vector<uint8_t> out(length);
  for (size_t i = 0; i < length; ++i) {
    out[i] = scaleToByte(std::fabs(seq[i]));
  }
  return out;
}

void SineMap::resetTo(double x0) {
  requireOpenInterval(x0, 0.0, 1.0, "sine x0");
  x_ = x0;
}
