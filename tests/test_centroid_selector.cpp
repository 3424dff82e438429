// Unit tests for centroid selection rules

#include "pipeline/centroid_selector.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <random>
#include <unordered_set>
#include <vector>

using viralclust::CentroidSelection;
using viralclust::DistanceMatrix;
using viralclust::select_centroids;

static int brute_force_centroid(const std::vector<int>& members, const DistanceMatrix& m) {
    int best = -1;
    double best_avg = std::numeric_limits<double>::infinity();
    for (int a : members) {
        double sum = 0.0;
        for (int b : members) sum += m.get(a, b);
        double avg = sum / (members.size() - 1);
        if (avg < best_avg) {
            best_avg = avg;
            best = a;
        }
    }
    return best;
}

void test_minimal_average_distance() {
    std::cout << "Testing strict minimal average distance... ";
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    for (int round = 0; round < 20; ++round) {
        DistanceMatrix m(12);
        std::vector<int> members = {0, 2, 3, 5, 7, 8, 11};
        for (size_t a = 0; a < members.size(); ++a)
            for (size_t b = a + 1; b < members.size(); ++b)
                m.set(members[a], members[b], dist(rng));

        auto sel = select_centroids({{0, members}}, m, {});
        assert(sel.centroids.size() == 1);
        assert(sel.centroids[0] == brute_force_centroid(members, m));
        assert(sel.by_cluster.at(0).size() == 1);
    }
    std::cout << "PASSED\n";
}

void test_tie_first_wins() {
    std::cout << "Testing ties resolve to the first member... ";
    DistanceMatrix m(4);
    // Equidistant triangle: every member has the same average
    m.set(1, 2, 0.5);
    m.set(1, 3, 0.5);
    m.set(2, 3, 0.5);
    auto sel = select_centroids({{0, {1, 2, 3}}}, m, {});
    assert(sel.centroids.size() == 1 && sel.centroids[0] == 1);

    auto reordered = select_centroids({{0, {3, 2, 1}}}, m, {});
    assert(reordered.centroids[0] == 3);
    std::cout << "PASSED\n";
}

void test_singleton_skips_matrix() {
    std::cout << "Testing singleton clusters... ";
    // Any matrix access with id 9 would throw std::out_of_range
    DistanceMatrix empty;
    auto sel = select_centroids({{0, {9}}, {1, {4}}}, empty, {});
    assert(sel.centroids.size() == 2);
    assert(sel.centroids[0] == 9);
    assert(sel.centroids[1] == 4);
    std::cout << "PASSED\n";
}

void test_noise_only_goi() {
    std::cout << "Testing noise keeps only genomes of interest... ";
    DistanceMatrix empty;
    std::map<int, std::vector<int>> clusters = {{-1, {0, 1, 2, 3}}};
    auto none = select_centroids(clusters, empty, {});
    assert(none.centroids.empty());

    auto with_goi = select_centroids(clusters, empty, {1, 3});
    assert(with_goi.centroids.size() == 2);
    assert(with_goi.centroids[0] == 1 && with_goi.centroids[1] == 3);
    assert(with_goi.by_cluster.at(-1).size() == 2);
    std::cout << "PASSED\n";
}

void test_goi_forced_in() {
    std::cout << "Testing genomes of interest are always centroids... ";
    DistanceMatrix m(5);
    // 0,1,2 close together; 3 is a far outlier and a genome of interest
    m.set(0, 1, 0.1); m.set(0, 2, 0.1); m.set(1, 2, 0.2);
    m.set(0, 3, 0.9); m.set(1, 3, 0.9); m.set(2, 3, 0.9);
    auto sel = select_centroids({{0, {0, 1, 2, 3}}}, m, {3});
    assert(sel.centroids.size() == 2);
    assert(sel.contains(3));
    assert(sel.contains(0));
    // goi is appended while iterating, the natural centroid after
    assert(sel.centroids[0] == 3 && sel.centroids[1] == 0);
    std::cout << "PASSED\n";
}

void test_all_goi_cluster() {
    std::cout << "Testing cluster made only of genomes of interest... ";
    DistanceMatrix m(3);
    m.set(0, 1, 0.3); m.set(0, 2, 0.3); m.set(1, 2, 0.3);
    auto sel = select_centroids({{0, {0, 1, 2}}}, m, {0, 1, 2});
    assert(sel.centroids.size() == 3);
    std::cout << "PASSED\n";
}

void test_order_and_dedup() {
    std::cout << "Testing centroid order across labels... ";
    DistanceMatrix m(8);
    m.set(2, 3, 0.5); m.set(2, 4, 0.1); m.set(3, 4, 0.4);
    m.set(5, 6, 0.2);
    std::map<int, std::vector<int>> clusters = {
        {-1, {0, 7}},
        {0, {2, 3, 4}},
        {1, {5, 6}},
        {2, {1}},
    };
    auto sel = select_centroids(clusters, m, {7});
    std::vector<int> expected = {7, 4, 5, 1};
    assert(sel.centroids == expected);
    std::unordered_set<int> unique(sel.centroids.begin(), sel.centroids.end());
    assert(unique.size() == sel.centroids.size());
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Centroid Selector Tests ===\n\n";
    test_minimal_average_distance();
    test_tie_first_wins();
    test_singleton_skips_matrix();
    test_noise_only_goi();
    test_goi_forced_in();
    test_all_goi_cluster();
    test_order_and_dedup();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
