#pragma once
#include <stdint.h>
#include <stddef.h>
#include <vector>

// Permutation mode
enum class PermuteMode { Forward, Inverse };

/**
 * Block transposition driven by an index permutation.
 * - Forward: out[i] = in[perm[i]]
 * - Inverse: out[perm[i]] = in[i]   (undoes Forward)
 * in and out must not overlap; perm.size() bytes are read and written.
 * Throws ValidationError if perm is not a bijection over 0..n-1.
 */
void applyTransposition(const uint8_t *in, uint8_t *out,
                        const std::vector<size_t> &perm, PermuteMode mode);

// true when perm contains every value of 0..perm.size()-1 exactly once
bool isValidPermutation(const std::vector<size_t> &perm);

// inv[perm[i]] = i
std::vector<size_t> invertPermutation(const std::vector<size_t> &perm);
