#pragma once

#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "util/deadline.h"

namespace walkplan {

class EmbeddingService {
 public:
  virtual ~EmbeddingService() = default;

  // Throws ExternalServiceUnavailable when the model cannot be reached.
  virtual std::vector<float> Embed(std::string_view text, const Deadline& deadline) = 0;
};

// Cosine similarity in [-1, 1]. Nullopt for empty, zero-length or
// mismatched vectors.
std::optional<double> CosineSimilarity(std::span<const float> a, std::span<const float> b);

}  // namespace walkplan
