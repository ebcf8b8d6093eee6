#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace switchyard {

// Embedder turns request text into a dense vector for similarity lookups.
// Failures are reported by throwing std::exception.
class Embedder {
public:
  virtual ~Embedder() = default;

  virtual std::vector<float> Embed(const std::string &text) = 0;
  virtual std::string Name() const = 0;
};

// Cosine similarity in [-1, 1]; 0 when either vector is zero or the
// dimensions differ.
double CosineSimilarity(const std::vector<float> &a,
                        const std::vector<float> &b);

} // namespace switchyard
