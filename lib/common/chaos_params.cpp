#include "chaos_params.h"
#include "common.h"
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

static double parseNumber(const std::string& raw, const std::string& what) {
  const char* begin = raw.c_str();
  char* end = nullptr;
  double v = strtod(begin, &end);
  if (raw.empty() || end == begin || *end != '\0') {
    throw ConfigurationError("Invalid number for " + what + ": '" + raw + "'");
  }
  if (!std::isfinite(v)) {
    throw ConfigurationError(what + " must be finite");
  }
  return v;
}

static std::string trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return "";
  size_t e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

static std::vector<std::string> splitComma(const std::string& text) {
  std::vector<std::string> parts;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) parts.push_back(trim(item));
  return parts;
}

void ChaosParams::validate() const {
  for (const auto& kv : toMap()) {
    if (!std::isfinite(kv.second)) {
      throw ConfigurationError("Parameter " + kv.first + " must be finite");
    }
  }
}

std::map<std::string, double> ChaosParams::toMap() const {
  return {
    {"logistic_r", logisticR},
    {"henon_a", henonA},
    {"henon_b", henonB},
    {"lorenz_sigma", lorenzSigma},
    {"lorenz_rho", lorenzRho},
    {"lorenz_beta", lorenzBeta},
    {"sine_mu", sineMu},
  };
}

MixingCoefficients::MixingCoefficients(double a, double b, double c, double d) {
  const double w[4] = {a, b, c, d};
  double total = 0.0;
  for (double v : w) {
    if (!std::isfinite(v) || v < 0.0) {
      throw ConfigurationError("Mixing weights must be finite and non-negative");
    }
    total += v;
  }
  if (total <= 0.0) {
    throw ConfigurationError("Mixing weights must not all be zero");
  }
  alpha = a / total;
  beta  = b / total;
  gamma = c / total;
  delta = d / total;
}

ChaosParams chaosParamsFromMap(const std::map<std::string, double>& overrides) {
  ChaosParams p;
  for (const auto& kv : overrides) {
    const std::string& k = kv.first;
    if (k == "logistic_r") p.logisticR = kv.second;
    else if (k == "henon_a") p.henonA = kv.second;
    else if (k == "henon_b") p.henonB = kv.second;
    else if (k == "lorenz_sigma") p.lorenzSigma = kv.second;
    else if (k == "lorenz_rho") p.lorenzRho = kv.second;
    else if (k == "lorenz_beta") p.lorenzBeta = kv.second;
    else if (k == "sine_mu") p.sineMu = kv.second;
    else log_warning("Ignoring unknown chaos parameter '" + k + "'");
  }
  p.validate();
  return p;
}

ChaosParams parseChaosParams(const std::string& text) {
  std::map<std::string, double> overrides;
  if (trim(text).empty()) return ChaosParams();
  for (const std::string& item : splitComma(text)) {
    if (item.empty()) continue;
    size_t eq = item.find('=');
    if (eq == std::string::npos) {
      throw ConfigurationError("Expected key=value, got '" + item + "'");
    }
    std::string key = trim(item.substr(0, eq));
    overrides[key] = parseNumber(trim(item.substr(eq + 1)), key);
  }
  return chaosParamsFromMap(overrides);
}

MixingCoefficients parseMixing(const std::string& text) {
  std::vector<std::string> parts = splitComma(text);
  if (parts.size() != 4) {
    throw ConfigurationError("Mixing needs exactly 4 weights, got " + std::to_string(parts.size()));
  }
  return MixingCoefficients(parseNumber(parts[0], "alpha"), parseNumber(parts[1], "beta"),
                            parseNumber(parts[2], "gamma"), parseNumber(parts[3], "delta"));
}
