#pragma once

#include <lshpp/types.hpp>

#include <string>
#include <vector>

namespace bench {

/**
 * @brief Similarity used for the brute-force ground truth. Larger is closer for all three.
 */
enum class Metric { kCosine, kL2, kInnerProduct };

Metric metric_for_family(const std::string& family);

const char* metric_name(Metric metric);

struct RecallResults {
    int n_eval_queries;
    int queries_with_candidates;
    double avg_recall;
    double avg_candidates;
    std::vector<double> per_query_recall;
    std::vector<size_t> per_query_candidates;
};

std::vector<lshpp::DataPoint> read_fvecs(const std::string& filepath);

std::vector<int> get_gt_top_k_indices(const lshpp::DataPoint& q,
                                      const std::vector<lshpp::DataPoint>& X, int k,
                                      Metric metric);

double calculate_recall(const std::vector<int>& lsh_indices, const std::vector<int>& gt_indices);

/*
 * Recall of each candidate set against the exact top-k with k = number of candidates.
 * Queries without candidates count as recall 0 but are excluded from the average.
 */
RecallResults evaluate_recall(const std::vector<lshpp::DataPoint>& queries,
                              const std::vector<lshpp::DataPoint>& X,
                              const std::vector<std::vector<lshpp::PointIndex>>& candidates,
                              Metric metric, bool verbose = true);

} // namespace bench
