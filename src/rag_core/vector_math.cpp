#include "rag_core/vector_math.hpp"

#include <cmath>
#include <string>

#include "rag_core/errors.hpp"

namespace rag_core {

float dot_product(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.size() != b.size()) {
    throw DimensionMismatchError("Vectors must be of the same length. Got " +
                                 std::to_string(a.size()) + " and " + std::to_string(b.size()));
  }
  // Accumulate in double so long embeddings do not lose precision
  double sum = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return static_cast<float>(sum);
}

float magnitude(const std::vector<float> &a) {
  double sum = 0.0;
  for (float ai : a) {
    sum += static_cast<double>(ai) * static_cast<double>(ai);
  }
  return static_cast<float>(std::sqrt(sum));
}

float cosine(const std::vector<float> &a, const std::vector<float> &b) {
  return dot_product(a, b) / (magnitude(a) * magnitude(b));
}

bool is_zero_vector(const std::vector<float> &a) {
  for (float ai : a) {
    if (ai != 0.0f) {
      return false;
    }
  }
  return true;
}

}  // namespace rag_core
