#include "MetricEvaluator.hpp"
#include <algorithm>
#include <cmath>

namespace {

const double RECALL_EPSILON = 1e-9;

double clamp_unit(double value) {
    return std::max(0.0, std::min(1.0, value));
}

bool ranks_before(const RankedDocument& a, const RankedDocument& b) {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    return a.doc_id < b.doc_id;
}

}

MetricEvaluator::MetricEvaluator() {}

RankedList MetricEvaluator::rank(
    const WeightVector& query_vector,
    const std::vector<int>& doc_ids,
    const std::vector<WeightVector>& doc_vectors,
    SimilarityKind kind
) const {
    RankedList ranking;
    ranking.reserve(doc_vectors.size());

    for (size_t i = 0; i < doc_vectors.size(); ++i) {
        ranking.push_back({doc_ids[i], similarity_engine_.similarity(query_vector, doc_vectors[i], kind)});
    }

    std::sort(ranking.begin(), ranking.end(), ranks_before);
    return ranking;
}

bool MetricEvaluator::evaluate(const Query& query, const RankedList& ranking, QueryMetrics& metrics) const {
    if (query.relevant.empty()) {
        return false;
    }

    const std::set<int>& rel = query.relevant;

    metrics.precision_at_025 = precision_at_recall(0.25, ranking, rel);
    metrics.precision_at_05 = precision_at_recall(0.5, ranking, rel);
    metrics.precision_at_075 = precision_at_recall(0.75, ranking, rel);
    metrics.precision_at_1 = precision_at_recall(1.0, ranking, rel);

    metrics.mean_precision_1 = (metrics.precision_at_025 + metrics.precision_at_05 +
                                metrics.precision_at_075 + metrics.precision_at_1) / 4.0;
    metrics.mean_precision_2 = average_precision(ranking, rel);

    metrics.precision_normalization = normalized_precision(ranking, rel);
    metrics.recall_normalization = normalized_recall(ranking, rel);
    return true;
}

double MetricEvaluator::precision_at_recall(double recall, const RankedList& ranking, const std::set<int>& relevant) const {
    if (relevant.empty()) return 0.0;

    double needed = recall * static_cast<double>(relevant.size());
    double best = 0.0;
    size_t hits = 0;

    // Precision only rises at a relevant document, so those ranks are the only candidates
    for (size_t k = 0; k < ranking.size(); ++k) {
        if (relevant.count(ranking[k].doc_id) == 0) continue;
        hits++;
        if (static_cast<double>(hits) + RECALL_EPSILON < needed) continue;

        double precision = static_cast<double>(hits) / static_cast<double>(k + 1);
        best = std::max(best, precision);
    }

    return best;
}

double MetricEvaluator::average_precision(const RankedList& ranking, const std::set<int>& relevant) const {
    if (relevant.empty()) return 0.0;

    double sum = 0.0;
    size_t hits = 0;
    for (size_t k = 0; k < ranking.size(); ++k) {
        if (relevant.count(ranking[k].doc_id) == 0) continue;
        hits++;
        sum += static_cast<double>(hits) / static_cast<double>(k + 1);
    }

    // Relevant documents missing from the ranking contribute 0
    return clamp_unit(sum / static_cast<double>(relevant.size()));
}

// Rnorm = 1 - (sum r_i - sum i) / (n (N - n))
double MetricEvaluator::normalized_recall(const RankedList& ranking, const std::set<int>& relevant) const {
    std::vector<size_t> ranks = relevant_ranks(ranking, relevant);
    size_t n = ranks.size();
    size_t total = ranking.size();

    if (n == 0) return 0.0;
    if (n == total) return 1.0;

    double rank_sum = 0.0;
    double ideal_sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        rank_sum += static_cast<double>(ranks[i]);
        ideal_sum += static_cast<double>(i + 1);
    }

    double worst = static_cast<double>(n) * static_cast<double>(total - n);
    return clamp_unit(1.0 - (rank_sum - ideal_sum) / worst);
}

// Pnorm = 1 - (sum ln r_i - sum ln i) / ln(N! / (n! (N - n)!))
double MetricEvaluator::normalized_precision(const RankedList& ranking, const std::set<int>& relevant) const {
    std::vector<size_t> ranks = relevant_ranks(ranking, relevant);
    size_t n = ranks.size();
    size_t total = ranking.size();

    if (n == 0) return 0.0;
    if (n == total) return 1.0;

    double log_rank_sum = 0.0;
    double log_ideal_sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        log_rank_sum += std::log(static_cast<double>(ranks[i]));
        log_ideal_sum += std::log(static_cast<double>(i + 1));
    }

    double big_n = static_cast<double>(total);
    double small_n = static_cast<double>(n);
    double log_binomial = std::lgamma(big_n + 1.0) - std::lgamma(small_n + 1.0) - std::lgamma(big_n - small_n + 1.0);
    if (log_binomial <= 0.0) return 1.0;

    return clamp_unit(1.0 - (log_rank_sum - log_ideal_sum) / log_binomial);
}

std::vector<size_t> MetricEvaluator::relevant_ranks(const RankedList& ranking, const std::set<int>& relevant) const {
    std::vector<size_t> ranks;
    for (size_t k = 0; k < ranking.size(); ++k) {
        if (relevant.count(ranking[k].doc_id) > 0) {
            ranks.push_back(k + 1);
        }
    }
    return ranks;
}

MetricAggregator::MetricAggregator() : count_(0) {}

void MetricAggregator::add(const QueryMetrics& metrics) {
    sum_.precision_at_025 += metrics.precision_at_025;
    sum_.precision_at_05 += metrics.precision_at_05;
    sum_.precision_at_075 += metrics.precision_at_075;
    sum_.precision_at_1 += metrics.precision_at_1;
    sum_.mean_precision_1 += metrics.mean_precision_1;
    sum_.mean_precision_2 += metrics.mean_precision_2;
    sum_.precision_normalization += metrics.precision_normalization;
    sum_.recall_normalization += metrics.recall_normalization;
    count_++;
}

QueryMetrics MetricAggregator::mean() const {
    QueryMetrics avg;
    if (count_ == 0) return avg;

    double n = static_cast<double>(count_);
    avg.precision_at_025 = clamp_unit(sum_.precision_at_025 / n);
    avg.precision_at_05 = clamp_unit(sum_.precision_at_05 / n);
    avg.precision_at_075 = clamp_unit(sum_.precision_at_075 / n);
    avg.precision_at_1 = clamp_unit(sum_.precision_at_1 / n);
    avg.mean_precision_1 = clamp_unit(sum_.mean_precision_1 / n);
    avg.mean_precision_2 = clamp_unit(sum_.mean_precision_2 / n);
    avg.precision_normalization = clamp_unit(sum_.precision_normalization / n);
    avg.recall_normalization = clamp_unit(sum_.recall_normalization / n);
    return avg;
}
