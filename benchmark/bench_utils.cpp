#include "bench_utils.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <set>
#include <stdexcept>
#include <utility>

namespace bench {

namespace {

float dot(const lshpp::DataPoint& a, const lshpp::DataPoint& b) {
    float sum = 0.0f;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

float similarity(const lshpp::DataPoint& q, float q_norm, const lshpp::DataPoint& x,
                 Metric metric) {
    switch (metric) {
    case Metric::kCosine: {
        float x_norm = std::sqrt(dot(x, x));
        if (q_norm == 0.0f || x_norm == 0.0f) {
            return 0.0f;
        }
        return dot(q, x) / (q_norm * x_norm);
    }
    case Metric::kL2: {
        float dist = 0.0f;
        for (size_t i = 0; i < q.size(); ++i) {
            float diff = q[i] - x[i];
            dist += diff * diff;
        }
        return -dist;
    }
    case Metric::kInnerProduct:
        return dot(q, x);
    }
    return 0.0f;
}

} // namespace

Metric metric_for_family(const std::string& family) {
    if (family == "srp") {
        return Metric::kCosine;
    }
    if (family == "l2") {
        return Metric::kL2;
    }
    if (family == "mips") {
        return Metric::kInnerProduct;
    }
    throw std::invalid_argument("Unknown hash family '" + family + "'");
}

const char* metric_name(Metric metric) {
    switch (metric) {
    case Metric::kCosine:
        return "cosine";
    case Metric::kL2:
        return "l2";
    case Metric::kInnerProduct:
        return "inner_product";
    }
    return "unknown";
}

std::vector<lshpp::DataPoint> read_fvecs(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file '" + filepath + "'");
    }

    // read input dimension
    int d;
    file.read(reinterpret_cast<char*>(&d), sizeof(int));
    if (!file || d <= 0) {
        throw std::runtime_error("Invalid fvecs header in '" + filepath + "'");
    }

    file.seekg(0, std::ios::end);
    std::streamsize file_size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::streamsize vector_size = sizeof(int) + d * sizeof(float);
    size_t n_vecs = static_cast<size_t>(file_size / vector_size);

    std::vector<lshpp::DataPoint> data(n_vecs, lshpp::DataPoint(d));
    for (size_t i = 0; i < n_vecs; ++i) {
        int dim;
        file.read(reinterpret_cast<char*>(&dim), sizeof(int));
        if (dim != d) {
            throw std::runtime_error("Inconsistent dimensions in file");
        }

        file.read(reinterpret_cast<char*>(data[i].data()), d * sizeof(float));
    }

    return data;
}

std::vector<int> get_gt_top_k_indices(const lshpp::DataPoint& q,
                                      const std::vector<lshpp::DataPoint>& X, int k,
                                      Metric metric) {
    float q_norm = std::sqrt(dot(q, q));

    std::vector<std::pair<float, int>> sim_idx;
    sim_idx.reserve(X.size());
    for (size_t i = 0; i < X.size(); ++i) {
        sim_idx.push_back({similarity(q, q_norm, X[i], metric), static_cast<int>(i)});
    }

    int top = std::min(k, static_cast<int>(sim_idx.size()));
    std::partial_sort(sim_idx.begin(), sim_idx.begin() + top, sim_idx.end(),
                      std::greater<std::pair<float, int>>());

    std::vector<int> top_k;
    for (int i = 0; i < top; ++i) {
        top_k.push_back(sim_idx[i].second);
    }

    return top_k;
}

double calculate_recall(const std::vector<int>& lsh_indices, const std::vector<int>& gt_indices) {
    std::set<int> lsh_set(lsh_indices.begin(), lsh_indices.end());
    std::set<int> gt_set(gt_indices.begin(), gt_indices.end());
    if (gt_set.empty()) {
        return 0.0;
    }

    std::set<int> intersection;
    std::set_intersection(lsh_set.begin(), lsh_set.end(), gt_set.begin(), gt_set.end(),
                          std::inserter(intersection, intersection.begin()));

    return static_cast<double>(intersection.size()) / gt_set.size();
}

RecallResults evaluate_recall(const std::vector<lshpp::DataPoint>& queries,
                              const std::vector<lshpp::DataPoint>& X,
                              const std::vector<std::vector<lshpp::PointIndex>>& candidates,
                              Metric metric, bool verbose) {
    RecallResults results;
    results.n_eval_queries = static_cast<int>(candidates.size());
    results.queries_with_candidates = 0;
    results.avg_recall = 0.0;
    results.avg_candidates = 0.0;

    double total_recall = 0.0;
    size_t total_candidates = 0;

    if (verbose) {
        std::cout << "\nRecall evaluation (" << results.n_eval_queries << " queries, "
                  << metric_name(metric) << "):" << std::endl;
    }

    for (size_t q = 0; q < candidates.size(); ++q) {
        size_t count = candidates[q].size();
        results.per_query_candidates.push_back(count);
        total_candidates += count;

        if (count > 0) {
            std::vector<int> lsh_indices(candidates[q].begin(), candidates[q].end());
            std::vector<int> gt_indices =
                get_gt_top_k_indices(queries[q], X, static_cast<int>(count), metric);
            double recall = calculate_recall(lsh_indices, gt_indices);

            results.per_query_recall.push_back(recall);
            total_recall += recall;
            results.queries_with_candidates++;

            if (verbose) {
                std::cout << "  Query " << q << ": recall=" << std::fixed << std::setprecision(4)
                          << recall << " (candidates=" << count << ")" << std::endl;
            }
        } else {
            results.per_query_recall.push_back(0.0);
            if (verbose) {
                std::cout << "  Query " << q << ": no candidates" << std::endl;
            }
        }
    }

    results.avg_recall =
        (results.queries_with_candidates > 0) ? total_recall / results.queries_with_candidates : 0.0;
    results.avg_candidates = candidates.empty()
                                 ? 0.0
                                 : static_cast<double>(total_candidates) / candidates.size();

    if (verbose) {
        std::cout << "\nAverage recall: " << std::fixed << std::setprecision(4) << results.avg_recall
                  << " (" << results.queries_with_candidates << "/" << results.n_eval_queries
                  << " queries with candidates)" << std::endl;
    }

    return results;
}

} // namespace bench
