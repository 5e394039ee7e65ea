#pragma once
// MetricEvaluator.hpp
// Ranks documents for a query and derives precision/recall metrics from the ranking
//
// Recall-level precisions are interpolated: the precision at recall r is the best
// precision reached at any rank whose recall is at least r. Normalized recall and
// precision (Salton & McGill) compare the ranks of the relevant documents with
// the ideal ranking where they occupy the top positions.

#include <set>
#include <vector>
#include "Corpus.hpp"
#include "SimilarityEngine.hpp"
#include "TermWeighting.hpp"

struct RankedDocument {
    int doc_id;
    double score;
};

// Descending score, ties by ascending doc id
using RankedList = std::vector<RankedDocument>;

struct QueryMetrics {
    double precision_at_025;
    double precision_at_05;
    double precision_at_075;
    double precision_at_1;
    double mean_precision_1;        // mean of the four recall-level precisions
    double mean_precision_2;        // average precision over the relevant documents
    double precision_normalization;
    double recall_normalization;

    QueryMetrics() : precision_at_025(0), precision_at_05(0), precision_at_075(0), precision_at_1(0),
                     mean_precision_1(0), mean_precision_2(0),
                     precision_normalization(0), recall_normalization(0) {}
};

class MetricEvaluator {
public:
    MetricEvaluator();

    // doc_ids[i] identifies doc_vectors[i]
    RankedList rank(
        const WeightVector& query_vector,
        const std::vector<int>& doc_ids,
        const std::vector<WeightVector>& doc_vectors,
        SimilarityKind kind
    ) const;

    // Returns false (and leaves metrics untouched) for a query without relevance judgments
    bool evaluate(const Query& query, const RankedList& ranking, QueryMetrics& metrics) const;

    double precision_at_recall(double recall, const RankedList& ranking, const std::set<int>& relevant) const;
    double average_precision(const RankedList& ranking, const std::set<int>& relevant) const;
    double normalized_recall(const RankedList& ranking, const std::set<int>& relevant) const;
    double normalized_precision(const RankedList& ranking, const std::set<int>& relevant) const;

private:
    SimilarityEngine similarity_engine_;

    // 1-based ranks of the relevant documents present in the ranking, ascending
    std::vector<size_t> relevant_ranks(const RankedList& ranking, const std::set<int>& relevant) const;
};

// Arithmetic mean of per-query metrics within one configuration
class MetricAggregator {
public:
    MetricAggregator();

    void add(const QueryMetrics& metrics);

    // Number of queries added so far
    size_t count() const { return count_; }

    // All zero when nothing was added
    QueryMetrics mean() const;

private:
    QueryMetrics sum_;
    size_t count_;
};
