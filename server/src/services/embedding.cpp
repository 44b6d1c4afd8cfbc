#include "services/embedding.h"

#include <cmath>

namespace walkplan {

std::optional<double> CosineSimilarity(std::span<const float> a, std::span<const float> b) {
  if (a.empty() || a.size() != b.size()) {
    return std::nullopt;
  }
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }
  if (norm_a == 0.0 || norm_b == 0.0) {
    return std::nullopt;
  }
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

}  // namespace walkplan
