#include "henon_map.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

static inline HenonState henon_step(const HenonState& s, double a, double b) {
  HenonState n;
  n.x = 1.0 - a * (s.x * s.x) + s.y;
  n.y = b * s.x;
  return n;
}

static HenonState henon_trajectory(HenonState s, double a, double b,
                                   double* xs, double* ys, size_t n) {
  for (size_t i = 0; i < n; ++i) {
    s = henon_step(s, a, b);
    xs[i] = s.x;
    ys[i] = s.y;
  }
  return s;
}

HenonMap::HenonMap(double a, double b, double x0, double y0) : a_(a), b_(b) {
  requireFinite(a, "henon a");
  requireFinite(b, "henon b");
  requireOpenInterval(x0, -1.5, 1.5, "henon x0");
  requireOpenInterval(y0, -1.5, 1.5, "henon y0");
  s_.x = x0;
  s_.y = y0;
  s0_ = s_;
  if (!(a >= 1.0 && a <= 1.4) || !(b >= 0.2 && b <= 0.4)) {
    std::ostringstream os;
    os << "a=" << a << ", b=" << b << " may not be in chaotic regime a in [1.0, 1.4], b in [0.2, 0.4]";
    warnRegime(os.str());
  }
}

void HenonMap::advance(size_t steps) {
  for (size_t i = 0; i < steps; ++i) s_ = henon_step(s_, a_, b_);
}

void HenonMap::trajectoryXY(size_t length, std::vector<double>& xs, std::vector<double>& ys) {
  xs.assign(length, 0.0);
  ys.assign(length, 0.0);
  if (length == 0) return;
  s_ = henon_trajectory(s_, a_, b_, xs.data(), ys.data(), length);
}

std::vector<double> HenonMap::trajectory(size_t length) {
  std::vector<double> xs, ys;
  trajectoryXY(length, xs, ys);
  std::vector<double> out(2 * length);
  for (size_t i = 0; i < length; ++i) {
    out[2 * i] = xs[i];
    out[2 * i + 1] = ys[i];
  }
  return out;
}

std::vector<uint8_t> HenonMap::quantize(size_t length) {
  std::vector<double> xs, ys;
  trajectoryXY(length, xs, ys);
  requireFiniteWindow(xs);
  requireFiniteWindow(ys);
  std::vector<double> mixed(length);
  for (size_t i = 0; i < length; ++i) {
    mixed[i] = (std::fabs(xs[i]) + std::fabs(ys[i])) / 2.0;
  }
  normalizeWindow(mixed);
  std::vector<uint8_t> out(length);
  for (size_t i = 0; i < length; ++i) {
    out[i] = scaleToByte(mixed[i]);
  }
  return out;
}

std::vector<size_t> HenonMap::permutationIndices(size_t n) {
  std::vector<double> xs, ys;
  trajectoryXY(n, xs, ys);
  // NaN would break the strict weak ordering the sort relies on
  requireFiniteWindow(xs);
  std::vector<size_t> idx(n);
  std::iota(idx.begin(), idx.end(), (size_t)0);
  std::stable_sort(idx.begin(), idx.end(),
                   [&xs](size_t i, size_t j) { return xs[i] < xs[j]; });
  return idx;
}

void HenonMap::resetTo(double x0, double y0) {
  requireOpenInterval(x0, -1.5, 1.5, "henon x0");
  requireOpenInterval(y0, -1.5, 1.5, "henon y0");
  s_.x = x0;
  s_.y = y0;
}
