#include "embedder.h"
#include "knn_index.h"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <random>
#include <stdexcept>

namespace viralclust::clustering {

namespace {

constexpr int kBisectionIterations = 64;
constexpr double kBisectionTolerance = 1e-5;
constexpr double kMinScale = 1e-3;
constexpr int kSpectralMaxPoints = 2048;
constexpr double kGradientClip = 4.0;

double clip(double v) {
    if (v > kGradientClip) return kGradientClip;
    if (v < -kGradientClip) return -kGradientClip;
    return v;
}

double squared_distance(const std::vector<double>& a, const std::vector<double>& b) {
    double sum = 0.0;
    for (size_t d = 0; d < a.size(); ++d) {
        double diff = a[d] - b[d];
        sum += diff * diff;
    }
    return sum;
}

// Stretch every coordinate to [0, 10]
void rescale_columns(std::vector<std::vector<double>>& layout) {
    if (layout.empty()) return;
    size_t dim = layout[0].size();
    for (size_t d = 0; d < dim; ++d) {
        double lo = std::numeric_limits<double>::infinity();
        double hi = -std::numeric_limits<double>::infinity();
        for (const auto& row : layout) {
            lo = std::min(lo, row[d]);
            hi = std::max(hi, row[d]);
        }
        double range = hi - lo;
        for (auto& row : layout) {
            row[d] = range > 0.0 ? 10.0 * (row[d] - lo) / range : 0.0;
        }
    }
}

}  // namespace

std::pair<double, double> FuzzyGraphEmbedder::fit_ab(double spread, double min_dist) {
    if (spread <= 0.0) {
        throw std::invalid_argument("spread must be positive");
    }

    const int n_samples = 300;
    std::vector<double> xs(n_samples), ys(n_samples);
    for (int i = 0; i < n_samples; ++i) {
        xs[i] = 3.0 * spread * i / (n_samples - 1);
        ys[i] = xs[i] < min_dist ? 1.0 : std::exp(-(xs[i] - min_dist) / spread);
    }

    auto cost_of = [&](double a, double b) {
        double c = 0.0;
        for (int i = 0; i < n_samples; ++i) {
            double f = 1.0 / (1.0 + a * std::pow(xs[i], 2.0 * b));
            c += (f - ys[i]) * (f - ys[i]);
        }
        return c;
    };

    // Levenberg-Marquardt on (a, b) from (1, 1)
    double a = 1.0, b = 1.0;
    double lambda = 1e-3;
    double cost = cost_of(a, b);

    for (int iter = 0; iter < 500; ++iter) {
        Eigen::Matrix2d jtj = Eigen::Matrix2d::Zero();
        Eigen::Vector2d jtr = Eigen::Vector2d::Zero();
        for (int i = 0; i < n_samples; ++i) {
            double x = xs[i];
            double p = x > 0.0 ? std::pow(x, 2.0 * b) : 0.0;
            double denom = 1.0 + a * p;
            double f = 1.0 / denom;
            double r = f - ys[i];
            double da = -p / (denom * denom);
            double db = x > 0.0 ? -a * p * 2.0 * std::log(x) / (denom * denom) : 0.0;
            Eigen::Vector2d j(da, db);
            jtj += j * j.transpose();
            jtr += j * r;
        }

        Eigen::Matrix2d damped = jtj;
        damped(0, 0) += lambda * jtj(0, 0);
        damped(1, 1) += lambda * jtj(1, 1);
        Eigen::Vector2d step = damped.ldlt().solve(-jtr);

        double na = a + step(0);
        double nb = b + step(1);
        double new_cost = (na > 0.0 && nb > 0.0) ? cost_of(na, nb)
                                                  : std::numeric_limits<double>::infinity();
        if (new_cost < cost) {
            double improvement = cost - new_cost;
            a = na;
            b = nb;
            cost = new_cost;
            lambda = std::max(lambda / 10.0, 1e-12);
            if (step.norm() < 1e-10 || improvement < 1e-15) break;
        } else {
            lambda *= 10.0;
            if (lambda > 1e12) break;
        }
    }

    return {a, b};
}

void FuzzyGraphEmbedder::smooth_knn_dist(const NeighborList& knn,
                                         std::vector<double>& sigmas,
                                         std::vector<double>& rhos) {
    const size_t n = knn.size();
    sigmas.assign(n, 0.0);
    rhos.assign(n, 0.0);
    if (n == 0) return;

    double mean_all = 0.0;
    size_t count_all = 0;
    for (const auto& row : knn.dists) {
        for (float d : row) { mean_all += d; count_all++; }
    }
    if (count_all) mean_all /= count_all;

    for (size_t i = 0; i < n; ++i) {
        const auto& dists = knn.dists[i];
        const size_t k = dists.size();
        const double target = k > 1 ? std::log2(static_cast<double>(k)) : 0.0;

        // Distance to the nearest distinct neighbour
        double rho = 0.0;
        for (float d : dists) {
            if (d > 0.0f) { rho = d; break; }
        }
        rhos[i] = rho;

        double lo = 0.0;
        double hi = std::numeric_limits<double>::infinity();
        double mid = 1.0;
        for (int iter = 0; iter < kBisectionIterations; ++iter) {
            double psum = 0.0;
            for (size_t j = 1; j < k; ++j) {
                double d = dists[j] - rho;
                psum += d > 0.0 ? std::exp(-d / mid) : 1.0;
            }
            if (std::fabs(psum - target) < kBisectionTolerance) break;
            if (psum > target) {
                hi = mid;
                mid = (lo + hi) / 2.0;
            } else {
                lo = mid;
                mid = std::isinf(hi) ? mid * 2.0 : (lo + hi) / 2.0;
            }
        }

        if (rho > 0.0) {
            double mean_i = 0.0;
            for (float d : dists) mean_i += d;
            mean_i /= static_cast<double>(k);
            mid = std::max(mid, kMinScale * mean_i);
        } else {
            mid = std::max(mid, kMinScale * mean_all);
        }
        sigmas[i] = mid;
    }
}

FuzzyGraph FuzzyGraphEmbedder::fuzzy_simplicial_set(const NeighborList& knn, int n_points) {
    std::vector<double> sigmas, rhos;
    smooth_knn_dist(knn, sigmas, rhos);

    std::map<std::pair<int, int>, double> directed;
    for (size_t i = 0; i < knn.size(); ++i) {
        for (size_t j = 0; j < knn.ids[i].size(); ++j) {
            int nb = knn.ids[i][j];
            if (nb < 0 || nb == static_cast<int>(i)) continue;
            double d = knn.dists[i][j] - rhos[i];
            double w = (d <= 0.0 || sigmas[i] == 0.0) ? 1.0 : std::exp(-d / sigmas[i]);
            if (w > 0.0) directed[{static_cast<int>(i), nb}] = w;
        }
    }

    FuzzyGraph graph;
    std::map<std::pair<int, int>, double> symmetric;
    for (const auto& [edge, w] : directed) {
        auto rev = directed.find({edge.second, edge.first});
        double w_rev = rev != directed.end() ? rev->second : 0.0;
        double u = w + w_rev - w * w_rev;
        symmetric[edge] = u;
        symmetric[{edge.second, edge.first}] = u;
    }

    graph.head.reserve(symmetric.size());
    graph.tail.reserve(symmetric.size());
    graph.weight.reserve(symmetric.size());
    for (const auto& [edge, w] : symmetric) {
        if (edge.first >= n_points || edge.second >= n_points) {
            throw std::out_of_range("Neighbour id outside point set");
        }
        graph.head.push_back(edge.first);
        graph.tail.push_back(edge.second);
        graph.weight.push_back(w);
    }
    return graph;
}

std::vector<std::vector<double>> FuzzyGraphEmbedder::initial_layout(
    const FuzzyGraph& graph, int n_points, int dim, int seed) {

    std::mt19937 rng(static_cast<unsigned>(seed));
    std::vector<std::vector<double>> layout(n_points, std::vector<double>(dim, 0.0));

    bool spectral = n_points <= kSpectralMaxPoints && dim + 1 < n_points;
    if (spectral) {
        // Eigenvectors of the normalized Laplacian, skipping the trivial one
        Eigen::MatrixXd w = Eigen::MatrixXd::Zero(n_points, n_points);
        for (size_t e = 0; e < graph.size(); ++e) {
            w(graph.head[e], graph.tail[e]) = graph.weight[e];
        }
        Eigen::VectorXd deg = w.rowwise().sum();
        Eigen::VectorXd inv_sqrt(n_points);
        for (int i = 0; i < n_points; ++i) {
            inv_sqrt(i) = deg(i) > 0.0 ? 1.0 / std::sqrt(deg(i)) : 0.0;
        }
        Eigen::MatrixXd lap = Eigen::MatrixXd::Identity(n_points, n_points)
            - inv_sqrt.asDiagonal() * w * inv_sqrt.asDiagonal();

        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(lap);
        if (solver.info() == Eigen::Success) {
            const Eigen::MatrixXd& vecs = solver.eigenvectors();
            double max_abs = 0.0;
            for (int i = 0; i < n_points; ++i) {
                for (int d = 0; d < dim; ++d) {
                    layout[i][d] = vecs(i, d + 1);
                    max_abs = std::max(max_abs, std::fabs(layout[i][d]));
                }
            }
            double expansion = max_abs > 0.0 ? 10.0 / max_abs : 1.0;
            std::normal_distribution<double> noise(0.0, 1e-4);
            for (auto& row : layout) {
                for (auto& v : row) v = v * expansion + noise(rng);
            }
        } else {
            spectral = false;
        }
    }

    if (!spectral) {
        std::uniform_real_distribution<double> uniform(-10.0, 10.0);
        for (auto& row : layout) {
            for (auto& v : row) v = uniform(rng);
        }
    }

    rescale_columns(layout);
    return layout;
}

void FuzzyGraphEmbedder::optimize_layout(
    std::vector<std::vector<double>>& layout,
    const FuzzyGraph& graph,
    int n_epochs,
    double a, double b,
    const EmbeddingConfig& config) {

    const size_t n_edges = graph.size();
    const int n_points = static_cast<int>(layout.size());
    if (n_edges == 0 || n_points < 2) return;

    double max_w = *std::max_element(graph.weight.begin(), graph.weight.end());

    // Strong edges are sampled every epoch, weak ones proportionally less.
    // Edges below max_w / n_epochs would never be sampled and are dropped.
    std::vector<double> per_sample(n_edges, -1.0);
    for (size_t e = 0; e < n_edges; ++e) {
        double w = graph.weight[e];
        if (w >= max_w / n_epochs && w > 0.0) per_sample[e] = max_w / w;
    }
    const double neg_rate = static_cast<double>(std::max(config.negative_sample_rate, 0));
    std::vector<double> next_sample = per_sample;
    std::vector<double> per_negative(n_edges), next_negative(n_edges);
    for (size_t e = 0; e < n_edges; ++e) {
        per_negative[e] = neg_rate > 0.0 ? per_sample[e] / neg_rate : 0.0;
        next_negative[e] = per_negative[e];
    }

    std::mt19937 rng(static_cast<unsigned>(config.random_seed));
    const size_t dim = layout[0].size();
    const double gamma = config.repulsion_strength;
    double alpha = config.learning_rate;

    for (int epoch = 0; epoch < n_epochs; ++epoch) {
        for (size_t e = 0; e < n_edges; ++e) {
            if (per_sample[e] <= 0.0 || next_sample[e] > epoch) continue;

            auto& current = layout[graph.head[e]];
            auto& other = layout[graph.tail[e]];

            double dist_sq = squared_distance(current, other);
            double attract = 0.0;
            if (dist_sq > 0.0) {
                double pb = std::pow(dist_sq, b);
                attract = -2.0 * a * b * std::pow(dist_sq, b - 1.0) / (a * pb + 1.0);
            }
            for (size_t d = 0; d < dim; ++d) {
                double grad = clip(attract * (current[d] - other[d]));
                current[d] += grad * alpha;
                other[d] -= grad * alpha;
            }
            next_sample[e] += per_sample[e];

            if (per_negative[e] <= 0.0) continue;
            int n_neg = static_cast<int>((epoch - next_negative[e]) / per_negative[e]);
            for (int p = 0; p < n_neg; ++p) {
                int k = static_cast<int>(rng() % static_cast<unsigned>(n_points));
                if (k == graph.head[e]) continue;
                const auto& negative = layout[k];
                double nd = squared_distance(current, negative);
                if (nd <= 0.0) continue;
                double repel = 2.0 * gamma * b / ((0.001 + nd) * (a * std::pow(nd, b) + 1.0));
                for (size_t d = 0; d < dim; ++d) {
                    current[d] += clip(repel * (current[d] - negative[d])) * alpha;
                }
            }
            if (n_neg > 0) next_negative[e] += n_neg * per_negative[e];
        }
        alpha = config.learning_rate * (1.0 - static_cast<double>(epoch) / n_epochs);
    }
}

std::vector<std::vector<float>> FuzzyGraphEmbedder::embed(
    const std::vector<std::vector<float>>& points,
    const EmbeddingConfig& config) {

    const int n = static_cast<int>(points.size());
    if (config.n_components < 1) {
        throw std::invalid_argument("n_components must be at least 1");
    }
    if (n == 0) return {};
    if (n == 1) return {std::vector<float>(config.n_components, 0.0f)};

    KnnConfig knn_config;
    // Neighbour lists include the point itself
    knn_config.k = std::max(1, std::min(config.n_neighbors, n - 1));
    knn_config.metric = config.metric;
    knn_config.random_seed = config.random_seed;
    knn_config.threads = config.threads;

    KnnIndex index(knn_config);
    index.build(points);
    NeighborList knn = index.query_all();

    FuzzyGraph graph = fuzzy_simplicial_set(knn, n);

    int n_epochs = config.n_epochs > 0 ? config.n_epochs : (n <= 10000 ? 500 : 200);
    auto [a, b] = fit_ab(config.spread, config.min_dist);

    auto layout = initial_layout(graph, n, config.n_components, config.random_seed);
    optimize_layout(layout, graph, n_epochs, a, b, config);

    std::vector<std::vector<float>> result(n, std::vector<float>(config.n_components));
    for (int i = 0; i < n; ++i) {
        for (int d = 0; d < config.n_components; ++d) {
            result[i][d] = static_cast<float>(layout[i][d]);
        }
    }
    return result;
}

std::unique_ptr<IEmbedder> create_embedder() {
    return std::make_unique<FuzzyGraphEmbedder>();
}

}  // namespace viralclust::clustering
