#pragma once

#include <vector>

namespace rag_core {

// Sum of pairwise products. Throws DimensionMismatchError when the lengths differ.
float dot_product(const std::vector<float> &a, const std::vector<float> &b);

// Euclidean (L2) norm.
float magnitude(const std::vector<float> &a);

/**
 * @brief Cosine similarity in [-1, 1].
 *
 * Both vectors must have non-zero magnitude. The stores reject zero vectors before they
 * reach this function, so the division is not guarded here.
 */
float cosine(const std::vector<float> &a, const std::vector<float> &b);

// True when every component is zero (including the empty vector).
bool is_zero_vector(const std::vector<float> &a);

}  // namespace rag_core
