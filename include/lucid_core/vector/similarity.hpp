#pragma once

#include <cstddef>
#include <functional>
#include <vector>

namespace lucid_core::similarity {

struct ScoredIndex {
  size_t index;
  double score;
};

/**
 * @brief Cosine of the angle between two vectors.
 * @return A value in [-1, 1], or 0 when the lengths differ, the vectors are
 *         empty, or either vector has zero magnitude.
 */
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

/**
 * @brief L2 distance between two vectors.
 * @return std::numeric_limits<double>::max() when the lengths differ or are 0.
 */
double euclidean_distance(const std::vector<float>& a, const std::vector<float>& b);

// Returns v scaled to unit length; empty and all-zero vectors come back unchanged.
std::vector<float> normalize(const std::vector<float>& v);

/**
 * @brief Ranks candidates by cosine similarity to the query.
 *
 * Candidates scoring below threshold are dropped. The rest are ordered by
 * descending score, ties broken by ascending candidate index, and cut to k.
 *
 * @param count Number of candidates.
 * @param vector_at Returns the embedding of candidate i, 0 <= i < count.
 * @return Empty when k <= 0 or there are no candidates.
 */
std::vector<ScoredIndex> top_k_by_similarity(
    const std::vector<float>& query,
    size_t count,
    const std::function<const std::vector<float>&(size_t)>& vector_at,
    int k,
    double threshold);

std::vector<ScoredIndex> top_k_by_similarity(const std::vector<float>& query,
                                             const std::vector<std::vector<float>>& vectors,
                                             int k,
                                             double threshold);

}  // namespace lucid_core::similarity
