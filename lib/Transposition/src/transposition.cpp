// transposition.cpp -- Permutation stage of the block cipher.
// Forward and Inverse consume the same permutation, so the same chaotic
// derivation on both sides yields exact invertibility.

#include "transposition.h"
#include "common.h"

bool isValidPermutation(const std::vector<size_t> &perm) {
  std::vector<bool> seen(perm.size(), false);
  for (size_t v : perm) {
    if (v >= perm.size() || seen[v]) return false;
    seen[v] = true;
  }
  return true;
}

std::vector<size_t> invertPermutation(const std::vector<size_t> &perm) {
  if (!isValidPermutation(perm)) {
    throw ValidationError("invertPermutation: not a permutation of 0.." +
                          std::to_string(perm.size()));
  }
  std::vector<size_t> inv(perm.size());
  for (size_t i = 0; i < perm.size(); ++i) inv[perm[i]] = i;
  return inv;
}

void applyTransposition(const uint8_t *in, uint8_t *out,
                        const std::vector<size_t> &perm, PermuteMode mode) {
  if (!isValidPermutation(perm)) {
    throw ValidationError("applyTransposition: invalid permutation");
  }
  const size_t n = perm.size();
  if (n == 0) return;
  if (!in || !out) {
    throw ValidationError("applyTransposition: null buffer");
  }

  if (mode == PermuteMode::Forward) {
    for (size_t i = 0; i < n; ++i) out[i] = in[perm[i]];
  } else {
    for (size_t i = 0; i < n; ++i) out[perm[i]] = in[i];
  }
}
