#include <chrono>
#include <iostream>
#include <random>
#include <span>
#include <string>
#include <vector>

#include "strata/index/bruteforce.hpp"
#include "strata/index/hnsw.hpp"

using namespace strata::index;

int main() {
    const std::size_t n = 5000;
    const std::size_t dim = 128;
    const std::size_t n_queries = 200;

    // Generate random data
    std::mt19937 gen(42);
    std::normal_distribution<float> dist(0.0f, 1.0f);

    std::vector<float> data(n * dim);
    std::vector<float> queries(n_queries * dim);
    for (auto& x : data) x = dist(gen);
    for (auto& x : queries) x = dist(gen);

    HnswBuildParams params;
    params.M = 16;
    params.ef_construction = 200;
    params.seed = 42;

    HnswIndex index;
    auto init_res = index.init(dim, params);
    if (!init_res.has_value()) {
        std::cerr << "init failed: " << init_res.error().message << "\n";
        return 1;
    }

    BruteForceIndex exact(dim);
    const std::span<const float> rows(data);

    auto t0 = std::chrono::high_resolution_clock::now();
    for (std::size_t i = 0; i < n; ++i) {
        const std::string id = "v" + std::to_string(i);
        auto add_res = index.add(id, rows.subspan(i * dim, dim));
        if (!add_res.has_value()) {
            std::cerr << "add failed: " << add_res.error().message << "\n";
            return 1;
        }
        if (!exact.add(id, rows.subspan(i * dim, dim)).has_value()) {
            std::cerr << "exact add failed\n";
            return 1;
        }
    }
    auto t1 = std::chrono::high_resolution_clock::now();

    double secs = std::chrono::duration<double>(t1 - t0).count();
    std::cout << "Built in " << secs << " sec (" << (n / secs) << " vec/s)\n";

    auto stats = index.get_stats();
    auto reachable = index.reachable_count_base_layer();
    double cov = (stats.n_nodes > 0) ? (100.0 * reachable / stats.n_nodes) : 0.0;

    std::cout << "Nodes=" << stats.n_nodes
              << " Levels=" << stats.n_levels
              << " AvgDegree=" << stats.avg_degree
              << " Reachable=" << reachable
              << " Coverage=" << cov << "%\n";

    std::vector<std::vector<std::string>> gt;
    gt.reserve(n_queries);
    const std::span<const float> qs(queries);
    for (std::size_t q = 0; q < n_queries; ++q) {
        auto ids = exact.ground_truth(qs.subspan(q * dim, dim), 10);
        if (!ids.has_value()) {
            std::cerr << "ground truth failed\n";
            return 1;
        }
        gt.push_back(std::move(*ids));
    }
    const float recall1 = compute_recall(index, queries, gt, 1);
    const float recall10 = compute_recall(index, queries, gt, 10);
    std::cout << "Recall@1=" << recall1 << " Recall@10=" << recall10 << "\n";

    if (reachable < n * 0.95) {
        std::cerr << "Connectivity < 95%\n";
        return 2;
    }
    if (recall1 < 0.9f) {
        std::cerr << "Recall@1 < 0.9\n";
        return 3;
    }
    std::cout << "Connectivity >= 95%\n";
    return 0;
}
