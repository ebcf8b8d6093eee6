#include "runtime/response_cache/hashing_embedder.h"

#include <cctype>
#include <cmath>
#include <cstdint>

namespace switchyard {

namespace {

uint64_t Fnv1a(const std::string &s) {
  uint64_t hash = 1469598103934665603ULL;
  for (unsigned char c : s) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

std::vector<std::string> Words(const std::string &text) {
  std::vector<std::string> words;
  std::string current;
  for (unsigned char c : text) {
    if (std::isalnum(c)) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

} // namespace

double CosineSimilarity(const std::vector<float> &a,
                        const std::vector<float> &b) {
  if (a.size() != b.size() || a.empty()) {
    return 0.0;
  }
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;
  }
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

HashingEmbedder::HashingEmbedder(std::size_t dimensions)
    : dimensions_(dimensions == 0 ? 1 : dimensions) {}

std::vector<float> HashingEmbedder::Embed(const std::string &text) {
  std::vector<float> vec(dimensions_, 0.0f);
  auto words = Words(text);

  auto add = [&](const std::string &feature, float weight) {
    uint64_t h = Fnv1a(feature);
    float sign = (h >> 63) ? -1.0f : 1.0f;
    vec[h % dimensions_] += sign * weight;
  };
  for (std::size_t i = 0; i < words.size(); ++i) {
    add(words[i], 1.0f);
    if (i + 1 < words.size()) {
      add(words[i] + " " + words[i + 1], 0.5f);
    }
  }

  double norm = 0.0;
  for (float v : vec) {
    norm += static_cast<double>(v) * v;
  }
  if (norm > 0.0) {
    auto inv = static_cast<float>(1.0 / std::sqrt(norm));
    for (auto &v : vec) {
      v *= inv;
    }
  }
  return vec;
}

} // namespace switchyard
