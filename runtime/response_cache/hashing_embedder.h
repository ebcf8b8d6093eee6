#pragma once

#include "runtime/response_cache/embedder.h"

namespace switchyard {

// Deterministic local embedder: feature-hashes lower-cased word unigrams and
// bigrams into a fixed number of signed buckets and L2-normalises the
// result. Needs no model or network, so similarity caching works offline.
class HashingEmbedder : public Embedder {
public:
  explicit HashingEmbedder(std::size_t dimensions = 256);

  std::vector<float> Embed(const std::string &text) override;
  std::string Name() const override { return "hashing"; }

  std::size_t dimensions() const { return dimensions_; }

private:
  std::size_t dimensions_;
};

} // namespace switchyard
