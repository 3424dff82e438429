#include "hdbscan.h"
#include "../util/parallel.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <set>
#include <stdexcept>

namespace viralclust::clustering {

namespace {

double euclidean(const std::vector<float>& a, const std::vector<float>& b) {
    double sum = 0.0;
    for (size_t d = 0; d < a.size(); ++d) {
        double diff = static_cast<double>(a[d]) - b[d];
        sum += diff * diff;
    }
    return std::sqrt(sum);
}

struct UnionFind {
    std::vector<int> parent;
    std::vector<int> size;

    explicit UnionFind(int n) : parent(2 * n - 1), size(2 * n - 1, 0) {
        std::iota(parent.begin(), parent.end(), 0);
        std::fill(size.begin(), size.begin() + n, 1);
    }

    int find(int x) {
        int root = x;
        while (parent[root] != root) root = parent[root];
        while (parent[x] != root) {
            int next = parent[x];
            parent[x] = root;
            x = next;
        }
        return root;
    }
};

}  // namespace

Hdbscan::Hdbscan(const HdbscanConfig& config) : config_(config) {
    if (config_.min_cluster_size < 2) {
        throw std::invalid_argument("min_cluster_size must be at least 2");
    }
}

std::vector<double> Hdbscan::core_distances(const std::vector<std::vector<float>>& points,
                                            int min_samples) const {
    const size_t n = points.size();
    std::vector<double> core(n, 0.0);
    // The point itself counts as its own nearest neighbour
    const size_t kth = static_cast<size_t>(std::min<int>(min_samples, static_cast<int>(n)) - 1);

    parallel_for(n, config_.threads, [&](size_t i) {
        std::vector<double> row(n);
        for (size_t j = 0; j < n; ++j) {
            row[j] = i == j ? 0.0 : euclidean(points[i], points[j]);
        }
        std::nth_element(row.begin(), row.begin() + kth, row.end());
        core[i] = row[kth];
    });
    return core;
}

std::vector<Hdbscan::MergeRow> Hdbscan::single_linkage(
    const std::vector<std::vector<float>>& points,
    const std::vector<double>& core) const {

    const int n = static_cast<int>(points.size());

    struct MstEdge { int u; int v; double w; };
    std::vector<MstEdge> mst;
    mst.reserve(n - 1);

    // Prim over mutual reachability distance, computed on the fly
    std::vector<bool> in_tree(n, false);
    std::vector<double> best(n, std::numeric_limits<double>::infinity());
    std::vector<int> from(n, -1);

    int current = 0;
    in_tree[0] = true;
    for (int added = 1; added < n; ++added) {
        parallel_for(static_cast<size_t>(n), config_.threads, [&](size_t j) {
            if (in_tree[j]) return;
            double mr = std::max({euclidean(points[current], points[j]), core[current], core[j]});
            if (mr < best[j]) {
                best[j] = mr;
                from[j] = current;
            }
        });

        int next = -1;
        for (int j = 0; j < n; ++j) {
            if (!in_tree[j] && (next < 0 || best[j] < best[next])) next = j;
        }
        in_tree[next] = true;
        mst.push_back({from[next], next, best[next]});
        current = next;
    }

    std::stable_sort(mst.begin(), mst.end(),
                     [](const MstEdge& a, const MstEdge& b) { return a.w < b.w; });

    std::vector<MergeRow> hierarchy;
    hierarchy.reserve(mst.size());
    UnionFind uf(n);
    int next_label = n;
    for (const auto& e : mst) {
        int a = uf.find(e.u);
        int b = uf.find(e.v);
        int merged = uf.size[a] + uf.size[b];
        hierarchy.push_back({a, b, e.w, merged});
        uf.parent[a] = next_label;
        uf.parent[b] = next_label;
        uf.size[next_label] = merged;
        next_label++;
    }
    return hierarchy;
}

namespace {

std::vector<int> bfs_hierarchy(const std::vector<int>& left, const std::vector<int>& right,
                               int root, int n_points) {
    std::vector<int> order;
    std::vector<int> frontier{root};
    while (!frontier.empty()) {
        order.insert(order.end(), frontier.begin(), frontier.end());
        std::vector<int> next;
        for (int x : frontier) {
            if (x >= n_points) {
                next.push_back(left[x - n_points]);
                next.push_back(right[x - n_points]);
            }
        }
        frontier.swap(next);
    }
    return order;
}

}  // namespace

std::vector<CondensedEdge> Hdbscan::condense(const std::vector<MergeRow>& hierarchy,
                                             int n_points) const {
    const int root = 2 * n_points - 2;
    const int mcs = config_.min_cluster_size;

    std::vector<int> left(hierarchy.size()), right(hierarchy.size());
    for (size_t r = 0; r < hierarchy.size(); ++r) {
        left[r] = hierarchy[r].left;
        right[r] = hierarchy[r].right;
    }
    auto count_of = [&](int node) {
        return node >= n_points ? hierarchy[node - n_points].size : 1;
    };

    std::vector<int> relabel(root + 1, 0);
    std::vector<bool> ignore(root + 1, false);
    relabel[root] = n_points;
    int next_label = n_points + 1;

    std::vector<CondensedEdge> result;
    result.reserve(n_points * 2);

    // Every point under `sub` falls out of `parent` at `lambda`
    auto drop_subtree = [&](int sub, int parent, double lambda) {
        for (int node : bfs_hierarchy(left, right, sub, n_points)) {
            if (node < n_points) result.push_back({parent, node, lambda, 1});
            ignore[node] = true;
        }
    };

    for (int node : bfs_hierarchy(left, right, root, n_points)) {
        if (node < n_points || ignore[node]) continue;

        const MergeRow& row = hierarchy[node - n_points];
        double lambda = row.distance > 0.0 ? 1.0 / row.distance
                                           : std::numeric_limits<double>::infinity();
        int lc = count_of(row.left);
        int rc = count_of(row.right);
        int parent = relabel[node];

        if (lc >= mcs && rc >= mcs) {
            relabel[row.left] = next_label++;
            result.push_back({parent, relabel[row.left], lambda, lc});
            relabel[row.right] = next_label++;
            result.push_back({parent, relabel[row.right], lambda, rc});
        } else if (lc < mcs && rc < mcs) {
            drop_subtree(row.left, parent, lambda);
            drop_subtree(row.right, parent, lambda);
        } else if (lc < mcs) {
            relabel[row.right] = parent;
            drop_subtree(row.left, parent, lambda);
        } else {
            relabel[row.left] = parent;
            drop_subtree(row.right, parent, lambda);
        }
    }
    return result;
}

ClusterAssignment Hdbscan::assign(const std::vector<std::vector<float>>& points) {
    const int n = static_cast<int>(points.size());
    ClusterAssignment out;
    out.labels.assign(n, NOISE_LABEL);
    out.probabilities.assign(n, 0.0);
    condensed_.clear();
    if (n < 2) return out;

    for (const auto& p : points) {
        if (p.size() != points[0].size()) {
            throw std::invalid_argument("Inconsistent point dimensions");
        }
    }

    int min_samples = config_.min_samples > 0 ? config_.min_samples : config_.min_cluster_size;
    auto core = core_distances(points, min_samples);
    auto hierarchy = single_linkage(points, core);
    condensed_ = condense(hierarchy, n);

    const int root = n;

    // Stability: sum over rows of (lambda - birth(parent)) * size
    std::map<int, double> births;
    std::map<int, double> stability;
    std::map<int, double> max_lambda;
    std::map<int, int> cluster_parent;
    std::map<int, std::vector<int>> cluster_children;
    births[root] = 0.0;
    stability[root] = 0.0;
    for (const auto& e : condensed_) {
        if (e.child >= n) {
            births[e.child] = e.lambda;
            cluster_parent[e.child] = e.parent;
            cluster_children[e.parent].push_back(e.child);
            stability.emplace(e.child, 0.0);
        }
    }
    for (const auto& e : condensed_) {
        double gain = (e.lambda - births[e.parent]) * e.size;
        if (!std::isnan(gain)) stability[e.parent] += gain;
        auto it = max_lambda.find(e.parent);
        if (it == max_lambda.end() || e.lambda > it->second) max_lambda[e.parent] = e.lambda;
    }

    // Excess of mass, leaves upward; the root is not a candidate
    std::set<int> selected;
    for (auto it = stability.rbegin(); it != stability.rend(); ++it) {
        int node = it->first;
        if (node == root) continue;
        selected.insert(node);
    }
    for (auto it = stability.rbegin(); it != stability.rend(); ++it) {
        int node = it->first;
        if (node == root) continue;
        double subtree = 0.0;
        auto ch = cluster_children.find(node);
        if (ch != cluster_children.end()) {
            for (int c : ch->second) subtree += stability[c];
        }
        if (subtree > stability[node]) {
            selected.erase(node);
            stability[node] = subtree;
        } else {
            std::vector<int> stack;
            if (ch != cluster_children.end()) stack = ch->second;
            while (!stack.empty()) {
                int sub = stack.back();
                stack.pop_back();
                selected.erase(sub);
                auto sc = cluster_children.find(sub);
                if (sc != cluster_children.end()) {
                    stack.insert(stack.end(), sc->second.begin(), sc->second.end());
                }
            }
        }
    }

    std::map<int, int> label_of;
    for (int c : selected) {
        int label = static_cast<int>(label_of.size());
        label_of[c] = label;
    }
    out.num_clusters = static_cast<int>(label_of.size());

    for (const auto& e : condensed_) {
        if (e.child >= n) continue;
        int c = e.parent;
        while (c != root && !selected.count(c)) c = cluster_parent.at(c);
        if (c == root) continue;

        out.labels[e.child] = label_of[c];
        double death = max_lambda[c];
        if (death == 0.0 || !std::isfinite(e.lambda)) {
            out.probabilities[e.child] = 1.0;
        } else {
            out.probabilities[e.child] = std::min(e.lambda, death) / death;
        }
    }
    return out;
}

std::unique_ptr<IClusterAssigner> create_cluster_assigner(const HdbscanConfig& config) {
    return std::make_unique<Hdbscan>(config);
}

}  // namespace viralclust::clustering
