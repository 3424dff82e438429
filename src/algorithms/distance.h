#pragma once

#include <cstddef>
#include <vector>

namespace viralclust {

// 1 - cosine similarity, in [0, 2].
// Two zero vectors are at distance 0; a zero vector is at distance 1 from
// anything else.
double cosine_distance(const float *a, const float *b, size_t dim);
double cosine_distance(const std::vector<float> &a, const std::vector<float> &b);

// Symmetric distance matrix over sequence ids, stored as a packed upper
// triangle: (i, j) and (j, i) share one cell. Unset cells read 0.
// Distinct pairs own distinct cells, so concurrent set() calls on
// different pairs do not race.
class DistanceMatrix {
public:
  explicit DistanceMatrix(size_t n = 0);

  size_t dim() const { return n_; }

  // Throws std::out_of_range for ids outside [0, dim)
  void set(int i, int j, double d);
  double get(int i, int j) const;

private:
  size_t cell(int i, int j) const;

  size_t n_;
  std::vector<float> cells_;
};

// Computes cosine distances for every unordered pair of a cluster's members
class PairwiseDistanceEngine {
public:
  explicit PairwiseDistanceEngine(int threads = 1) : threads_(threads) {}

  // profiles is indexed by sequence id. One task per pair on the worker pool.
  // Returns the number of pairs computed.
  size_t compute(const std::vector<int> &members,
                 const std::vector<std::vector<float>> &profiles,
                 DistanceMatrix &matrix);

  // Total pairs computed by this engine so far
  size_t pairs_computed() const { return pairs_computed_; }

private:
  int threads_;
  size_t pairs_computed_ = 0;
};

} // namespace viralclust
