#include "lucid_core/vector/similarity.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace lucid_core::similarity {

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size() || a.empty()) {
    return 0.0;
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
    return 0.0;
  }
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

double euclidean_distance(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size() || a.empty()) {
    return std::numeric_limits<double>::max();
  }

  double sum = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    const double diff = static_cast<double>(a[i]) - b[i];
    sum += diff * diff;
  }
  return std::sqrt(sum);
}

std::vector<float> normalize(const std::vector<float>& v) {
  if (v.empty()) {
    return v;
  }

  double norm = 0.0;
  for (float value : v) {
    norm += static_cast<double>(value) * value;
  }
  norm = std::sqrt(norm);
  if (norm == 0.0) {
    return v;
  }

  std::vector<float> result(v.size());
  for (size_t i = 0; i < v.size(); ++i) {
    result[i] = static_cast<float>(v[i] / norm);
  }
  return result;
}

std::vector<ScoredIndex> top_k_by_similarity(
    const std::vector<float>& query,
    size_t count,
    const std::function<const std::vector<float>&(size_t)>& vector_at,
    int k,
    double threshold) {
  if (k <= 0 || count == 0) {
    return {};
  }

  std::vector<ScoredIndex> scored;
  scored.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    const double score = cosine_similarity(query, vector_at(i));
    if (score >= threshold) {
      scored.push_back({i, score});
    }
  }

  std::sort(scored.begin(), scored.end(), [](const ScoredIndex& lhs, const ScoredIndex& rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    return lhs.index < rhs.index;
  });

  if (scored.size() > static_cast<size_t>(k)) {
    scored.resize(static_cast<size_t>(k));
  }
  return scored;
}

std::vector<ScoredIndex> top_k_by_similarity(const std::vector<float>& query,
                                             const std::vector<std::vector<float>>& vectors,
                                             int k,
                                             double threshold) {
  return top_k_by_similarity(
      query, vectors.size(),
      [&vectors](size_t i) -> const std::vector<float>& { return vectors[i]; }, k, threshold);
}

}  // namespace lucid_core::similarity
