#pragma once
// PermutationDriver.hpp
// Enumerates the configuration space and evaluates every configuration
//
// Preprocessing runs once per (removeStopwords, stem) pair before any
// configuration is dispatched. Configurations then run in parallel on a
// SweepWorkerPool and their rows are returned in enumeration order. A failing
// configuration yields a failed row; it never stops the sweep.
//
// run_sweep() and explain() must not be called concurrently on one driver.

#include <atomic>
#include <vector>
#include "Configuration.hpp"
#include "Corpus.hpp"
#include "MetricEvaluator.hpp"
#include "PreprocessCache.hpp"
#include "Preprocessor.hpp"
#include "SweepWorkerPool.hpp"
#include "TermWeighting.hpp"

struct ExplainedDocument {
    int doc_id;
    double score;
    bool relevant;
};

class PermutationDriver {
public:
    // The corpus and preprocessor must outlive the driver
    PermutationDriver(const Corpus& corpus, const Preprocessor& preprocessor);

    // One row per configuration of the Cartesian product, in enumeration order
    std::vector<MetricRow> run_sweep(const SweepDimensions& dimensions, size_t num_threads);

    // Evaluate one configuration. Never throws for a bad configuration; the row
    // is marked failed instead. Requires its preprocessing pair to be built.
    MetricRow evaluate(const ConfigurationTags& tags) const;

    // Top-k of the ranking for one query under one configuration
    // Throws std::invalid_argument for an unknown query id
    std::vector<ExplainedDocument> explain(const Configuration& config, int query_id, size_t top_k);

    // Stop dispatching: configurations not yet started come back as cancelled rows.
    // Stays in effect for later sweeps until reset_cancel().
    void cancel() { cancel_requested_ = true; }
    void reset_cancel() { cancel_requested_ = false; }
    bool cancelled() const { return cancel_requested_; }

    // Statistics of the most recent sweep's worker pool
    SweepWorkerPool::Stats last_pool_stats() const { return last_pool_stats_; }

    const PreprocessCache& cache() const { return cache_; }

private:
    const Corpus& corpus_;
    PreprocessCache cache_;
    TermWeighter weighter_;
    MetricEvaluator evaluator_;
    std::atomic<bool> cancel_requested_{false};
    SweepWorkerPool::Stats last_pool_stats_{};

    MetricRow evaluate_configuration(const Configuration& config) const;

    std::vector<WeightVector> weight_documents(const Configuration& config, const PreprocessedCorpus& pc) const;
};

// Convenience wrapper: builds a driver for a single sweep
std::vector<MetricRow> run_sweep(
    const Corpus& corpus,
    const Preprocessor& preprocessor,
    const SweepDimensions& dimensions,
    size_t num_threads
);
