// Unit tests for HDBSCAN cluster assignment

#include "clustering/hdbscan.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <set>
#include <vector>

using namespace viralclust::clustering;

static void add_blob(std::vector<std::vector<float>>& points, float cx, float cy, int n) {
    for (int i = 0; i < n; ++i) {
        points.push_back({cx + 0.1f * (i % 5), cy + 0.1f * (i / 5)});
    }
}

void test_three_blobs_with_noise() {
    std::cout << "Testing separated blobs and outliers... ";
    std::vector<std::vector<float>> points;
    add_blob(points, 0, 0, 20);
    add_blob(points, 20, 0, 20);
    add_blob(points, 0, 20, 20);
    points.push_back({100, 100});
    points.push_back({-100, 60});
    points.push_back({60, -100});

    Hdbscan hdbscan;
    ClusterAssignment result = hdbscan.assign(points);
    assert(result.labels.size() == points.size());
    assert(result.probabilities.size() == points.size());
    assert(result.num_clusters == 3);

    for (int blob = 0; blob < 3; ++blob) {
        int label = result.labels[blob * 20];
        assert(label >= 0 && label < 3);
        for (int i = 0; i < 20; ++i) {
            assert(result.labels[blob * 20 + i] == label);
        }
    }
    std::set<int> blob_labels = {result.labels[0], result.labels[20], result.labels[40]};
    assert(blob_labels.size() == 3);

    for (size_t i = 60; i < points.size(); ++i) {
        assert(result.labels[i] == NOISE_LABEL);
        assert(result.probabilities[i] == 0.0);
    }
    assert(result.num_noise() == 3);

    for (size_t i = 0; i < 60; ++i) {
        assert(result.probabilities[i] > 0.0 && result.probabilities[i] <= 1.0);
    }
    std::cout << "PASSED\n";
}

void test_labels_dense() {
    std::cout << "Testing labels are dense from zero... ";
    std::vector<std::vector<float>> points;
    add_blob(points, 0, 0, 10);
    add_blob(points, 50, 50, 10);
    Hdbscan hdbscan;
    auto result = hdbscan.assign(points);
    std::set<int> labels(result.labels.begin(), result.labels.end());
    assert(labels == std::set<int>({0, 1}));
    std::cout << "PASSED\n";
}

void test_identical_points_no_structure() {
    std::cout << "Testing identical points give a single label... ";
    std::vector<std::vector<float>> points(30, std::vector<float>{1.0f, 2.0f, 3.0f});
    Hdbscan hdbscan;
    auto result = hdbscan.assign(points);
    std::set<int> labels(result.labels.begin(), result.labels.end());
    assert(labels.size() == 1);
    assert(result.num_clusters == 0);
    std::cout << "PASSED\n";
}

void test_duplicate_groups() {
    std::cout << "Testing groups of duplicated points... ";
    std::vector<std::vector<float>> points;
    for (int i = 0; i < 10; ++i) points.push_back({0.0f, 0.0f});
    for (int i = 0; i < 10; ++i) points.push_back({5.0f, 5.0f});
    Hdbscan hdbscan;
    auto result = hdbscan.assign(points);
    assert(result.num_clusters == 2);
    for (int i = 0; i < 10; ++i) {
        assert(result.labels[i] == result.labels[0]);
        assert(result.labels[10 + i] == result.labels[10]);
        assert(result.probabilities[i] == 1.0);
    }
    assert(result.labels[0] != result.labels[10]);
    std::cout << "PASSED\n";
}

void test_condensed_tree_sizes() {
    std::cout << "Testing condensed tree bookkeeping... ";
    std::vector<std::vector<float>> points;
    add_blob(points, 0, 0, 15);
    add_blob(points, 30, 0, 15);
    Hdbscan hdbscan;
    hdbscan.assign(points);
    const auto& tree = hdbscan.condensed_tree();
    int n = static_cast<int>(points.size());

    // Every point leaves the tree exactly once
    std::vector<int> seen(n, 0);
    for (const auto& e : tree) {
        assert(e.parent >= n);
        if (e.child < n) {
            seen[e.child]++;
            assert(e.size == 1);
        } else {
            assert(e.size >= 5);
        }
    }
    for (int c : seen) assert(c == 1);
    std::cout << "PASSED\n";
}

void test_small_inputs() {
    std::cout << "Testing inputs smaller than min_cluster_size... ";
    Hdbscan hdbscan;
    auto empty = hdbscan.assign({});
    assert(empty.labels.empty());
    auto few = hdbscan.assign({{0, 0}, {1, 1}, {2, 2}});
    for (int l : few.labels) assert(l == NOISE_LABEL);

    bool threw = false;
    try {
        HdbscanConfig bad;
        bad.min_cluster_size = 1;
        Hdbscan h(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== HDBSCAN Tests ===\n\n";
    test_three_blobs_with_noise();
    test_labels_dense();
    test_identical_points_no_structure();
    test_duplicate_groups();
    test_condensed_tree_sizes();
    test_small_inputs();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
