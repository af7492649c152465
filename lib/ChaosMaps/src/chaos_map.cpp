#include "chaos_map.h"
#include "common.h"
#include <algorithm>
#include <cmath>
#include <sstream>

void ChaosMap::warnRegime(const std::string& msg) {
  std::string full = std::string(name()) + ": " + msg;
  log_warning(full);
  warnings_.push_back(full);
}

void ChaosMap::requireFinite(double v, const char* what) {
  if (!std::isfinite(v)) {
    throw ConfigurationError(std::string(what) + " must be finite");
  }
}

void ChaosMap::requireOpenInterval(double v, double lo, double hi, const char* what) {
  requireFinite(v, what);
  if (!(v > lo && v < hi)) {
    std::ostringstream os;
    os << what << "=" << v << " must be in (" << lo << ", " << hi << ")";
    throw ConfigurationError(os.str());
  }
}

void ChaosMap::requireFiniteWindow(const std::vector<double>& values) const {
  for (size_t i = 0; i < values.size(); ++i) {
    if (!std::isfinite(values[i])) {
      std::ostringstream os;
      os << name() << ": trajectory diverged at step " << i
         << " of the window (parameters outside the bounded regime)";
      throw ConfigurationError(os.str());
    }
  }
}

void normalizeWindow(std::vector<double>& values) {
  if (values.empty()) return;
  auto mm = std::minmax_element(values.begin(), values.end());
  double lo = *mm.first;
  double span = *mm.second - lo + 1e-10;
  for (double& v : values) v = (v - lo) / span;
}

uint8_t scaleToByte(double v) {
  double s = std::floor(255.0 * v);
  if (!(s > 0.0)) return 0;
  if (s >= 255.0) return 255;
  return (uint8_t)s;
}
