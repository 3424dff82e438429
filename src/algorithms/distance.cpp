#include "distance.h"
#include "../util/parallel.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace viralclust {

double cosine_distance(const float *a, const float *b, size_t dim) {
  double dot = 0.0, na = 0.0, nb = 0.0;
  for (size_t i = 0; i < dim; ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    na += static_cast<double>(a[i]) * a[i];
    nb += static_cast<double>(b[i]) * b[i];
  }
  if (na == 0.0 && nb == 0.0)
    return 0.0;
  if (na == 0.0 || nb == 0.0)
    return 1.0;

  double sim = dot / (std::sqrt(na) * std::sqrt(nb));
  // Rounding can push identical vectors just past 1
  if (sim > 1.0)
    sim = 1.0;
  if (sim < -1.0)
    sim = -1.0;
  return 1.0 - sim;
}

double cosine_distance(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.size() != b.size()) {
    throw std::invalid_argument("cosine_distance: dimension mismatch");
  }
  return cosine_distance(a.data(), b.data(), a.size());
}

DistanceMatrix::DistanceMatrix(size_t n)
    : n_(n), cells_(n > 1 ? n * (n - 1) / 2 : 0, 0.0f) {}

size_t DistanceMatrix::cell(int i, int j) const {
  if (i < 0 || j < 0 || static_cast<size_t>(i) >= n_ ||
      static_cast<size_t>(j) >= n_) {
    throw std::out_of_range("DistanceMatrix: id out of range (" +
                            std::to_string(i) + ", " + std::to_string(j) + ")");
  }
  size_t lo = static_cast<size_t>(std::min(i, j));
  size_t hi = static_cast<size_t>(std::max(i, j));
  // Row `lo` of the strict upper triangle starts after lo rows of
  // decreasing length n-1, n-2, ...
  return lo * (2 * n_ - lo - 1) / 2 + (hi - lo - 1);
}

void DistanceMatrix::set(int i, int j, double d) {
  if (i == j)
    return;
  cells_[cell(i, j)] = static_cast<float>(d);
}

double DistanceMatrix::get(int i, int j) const {
  if (i == j) {
    cell(i, j);  // bounds check
    return 0.0;
  }
  return cells_[cell(i, j)];
}

size_t PairwiseDistanceEngine::compute(
    const std::vector<int> &members,
    const std::vector<std::vector<float>> &profiles,
    DistanceMatrix &matrix) {

  std::vector<std::pair<int, int>> pairs;
  if (members.size() > 1)
    pairs.reserve(members.size() * (members.size() - 1) / 2);
  for (size_t a = 0; a < members.size(); ++a) {
    for (size_t b = a + 1; b < members.size(); ++b) {
      pairs.emplace_back(members[a], members[b]);
    }
  }

  parallel_for(pairs.size(), threads_, [&](size_t p) {
    const auto &pr = pairs[p];
    matrix.set(pr.first, pr.second,
               cosine_distance(profiles.at(pr.first), profiles.at(pr.second)));
  });

  pairs_computed_ += pairs.size();
  return pairs.size();
}

} // namespace viralclust
