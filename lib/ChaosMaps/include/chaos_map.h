/**
 * chaos_map.h - Common interface of the chaotic map primitives.
 *
 * Every primitive is a small state machine: it owns a mutable state vector, an
 * immutable parameter set and the initial state it was constructed with.
 * advance/trajectory/quantize all consume trajectory (the state moves forward);
 * reset() returns to the initial state regardless of how many steps were taken.
 *
 * Instances are not thread-safe. Use one instance per thread.
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

class ChaosMap {
public:
  virtual ~ChaosMap() {}

  virtual const char* name() const = 0;

  // Number of state components (1, 2 or 3)
  virtual size_t dimension() const = 0;

  // Iterate `steps` times, discarding output
  virtual void advance(size_t steps) = 0;

  // Next `length` states, row-major (dimension() values per step).
  // The state ends on the last returned point.
  virtual std::vector<double> trajectory(size_t length) = 0;

  // Next `length` states quantized to one byte each
  virtual std::vector<uint8_t> quantize(size_t length) = 0;

  // Back to the construction-time state
  virtual void reset() = 0;

  // Parameter-regime diagnostics collected at construction (non-fatal)
  const std::vector<std::string>& warnings() const { return warnings_; }

protected:
  // Log and keep a diagnostic
  void warnRegime(const std::string& msg);

  // Throw ConfigurationError unless lo < v < hi
  static void requireOpenInterval(double v, double lo, double hi, const char* what);
  // Throw ConfigurationError for NaN/inf
  static void requireFinite(double v, const char* what);
  // Throw ConfigurationError if the trajectory has escaped to NaN/inf
  void requireFiniteWindow(const std::vector<double>& values) const;

private:
  std::vector<std::string> warnings_;
};

// Min-max normalization over one batch, with a 1e-10 guard on the denominator
void normalizeWindow(std::vector<double>& values);

// floor(255 * v) saturated to [0, 255]; NaN maps to 0
uint8_t scaleToByte(double v);
