#include "logistic_map.h"
#include <cmath>
#include <sstream>

static inline double logistic_step(double x, double r) {
  return r * x * (1.0 - x);
}

// Fill out[0..n) with successive iterates; returns the last one
static double logistic_sequence(double x, double r, double* out, size_t n) {
  for (size_t i = 0; i < n; ++i) {
    x = logistic_step(x, r);
    out[i] = x;
  }
  return x;
}

LogisticMap::LogisticMap(double r, double x0) : r_(r), x_(x0), x0_(x0) {
  requireFinite(r, "logistic r");
  requireOpenInterval(x0, 0.0, 1.0, "logistic x0");
  if (!(r >= 3.57 && r <= 4.0)) {
    std::ostringstream os;
    os << "r=" << r << " may not be in chaotic regime [3.57, 4.0]";
    warnRegime(os.str());
  }
}

void LogisticMap::advance(size_t steps) {
  for (size_t i = 0; i < steps; ++i) x_ = logistic_step(x_, r_);
}

std::vector<double> LogisticMap::trajectory(size_t length) {
  std::vector<double> seq(length);
  if (length == 0) return seq;
  x_ = logistic_sequence(x_, r_, seq.data(), length);
  return seq;
}

std::vector<uint8_t> LogisticMap::quantize(size_t length) {
  std::vector<double> seq = trajectory(length);
  requireFiniteWindow(seq);
  std::vector<uint8_t> out(length);
  for (size_t i = 0; i < length; ++i) {
    out[i] = scaleToByte(seq[i]);
  }
  return out;
}

void LogisticMap::resetTo(double x0) {
  requireOpenInterval(x0, 0.0, 1.0, "logistic x0");
  x_ = x0;
}
