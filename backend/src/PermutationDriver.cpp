#include "PermutationDriver.hpp"
#include "EvaluationErrors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

std::string describe(const ConfigurationTags& tags) {
    std::ostringstream ss;
    ss << tags.scheme << "/" << tags.similarity
       << " stop=" << (tags.remove_stopwords ? "true" : "false")
       << " stem=" << (tags.stem ? "true" : "false")
       << " profile=(" << tags.profile.w1 << "," << tags.profile.w2 << ","
       << tags.profile.w3 << "," << tags.profile.w4 << ")";
    return ss.str();
}

MetricRow failed_row(const ConfigurationTags& tags, const std::string& reason) {
    MetricRow row;
    row.config = tags;
    row.status = MetricRow::Status::Failed;
    row.error = reason;

    std::ostringstream line;
    line << "[Sweep] Skipping " << describe(tags) << ": " << reason << "\n";
    std::cerr << line.str();
    return row;
}

}

PermutationDriver::PermutationDriver(const Corpus& corpus, const Preprocessor& preprocessor)
    : corpus_(corpus), cache_(preprocessor) {
}

std::vector<MetricRow> PermutationDriver::run_sweep(const SweepDimensions& dimensions, size_t num_threads) {
    auto start = std::chrono::steady_clock::now();

    std::vector<ConfigurationTags> configs = dimensions.enumerate();

    // Populate the cache completely before any worker reads it
    cache_.build(corpus_, dimensions.preprocess_keys());

    std::cout << "[Sweep] Evaluating " << configs.size() << " configurations on "
              << num_threads << " workers" << std::endl;

    std::vector<std::future<MetricRow>> futures;
    futures.reserve(configs.size());

    std::vector<MetricRow> rows;
    rows.reserve(configs.size());

    {
        SweepWorkerPool pool(num_threads);

        for (const auto& tags : configs) {
            futures.push_back(pool.submit([this, tags]() {
                if (cancel_requested_) {
                    MetricRow row;
                    row.config = tags;
                    row.status = MetricRow::Status::Cancelled;
                    return row;
                }
                return evaluate(tags);
            }));
        }

        // Collect by enumeration index, not by completion order
        for (size_t i = 0; i < futures.size(); ++i) {
            try {
                rows.push_back(futures[i].get());
            } catch (const std::exception& e) {
                rows.push_back(failed_row(configs[i], e.what()));
            }
        }

        last_pool_stats_ = pool.get_stats();
    }

    size_t ok = 0;
    size_t failed = 0;
    size_t cancelled = 0;
    for (const auto& row : rows) {
        switch (row.status) {
            case MetricRow::Status::Ok: ok++; break;
            case MetricRow::Status::Failed: failed++; break;
            case MetricRow::Status::Cancelled: cancelled++; break;
        }
    }

    auto end = std::chrono::steady_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    std::cout << "[Sweep] Done: " << ok << " ok, " << failed << " failed, "
              << cancelled << " cancelled in " << duration_ms << "ms" << std::endl;

    return rows;
}

MetricRow PermutationDriver::evaluate(const ConfigurationTags& tags) const {
    try {
        Configuration config = Configuration::from_tags(tags);
        MetricRow row = evaluate_configuration(config);
        row.config = tags;
        return row;
    } catch (const EvaluationError& e) {
        return failed_row(tags, e.what());
    } catch (const std::exception& e) {
        return failed_row(tags, std::string("unexpected error: ") + e.what());
    }
}

MetricRow PermutationDriver::evaluate_configuration(const Configuration& config) const {
    const PreprocessedCorpus& pc = cache_.get(config.preprocess_key());
    const std::vector<Query>& queries = corpus_.queries();

    // Fresh vectors per configuration
    std::vector<WeightVector> doc_vectors = weight_documents(config, pc);

    MetricAggregator aggregator;
    for (size_t i = 0; i < queries.size(); ++i) {
        // Queries without judgments are excluded from the aggregate
        if (queries[i].relevant.empty()) continue;

        WeightVector query_vector = weighter_.weight(pc.query_terms[i], config.scheme(), config.profile(), pc.stats);
        RankedList ranking = evaluator_.rank(query_vector, pc.doc_ids, doc_vectors, config.similarity());

        QueryMetrics metrics;
        if (evaluator_.evaluate(queries[i], ranking, metrics)) {
            aggregator.add(metrics);
        }
    }

    MetricRow row;
    row.config = config.tags();
    row.status = MetricRow::Status::Ok;
    row.evaluated_queries = aggregator.count();
    row.metrics = aggregator.mean();

    if (aggregator.count() == 0) {
        std::ostringstream line;
        line << "[Sweep] Warning: no judged queries for " << describe(row.config) << "\n";
        std::cerr << line.str();
    }
    return row;
}

std::vector<WeightVector> PermutationDriver::weight_documents(const Configuration& config, const PreprocessedCorpus& pc) const {
    std::vector<WeightVector> vectors;
    vectors.reserve(pc.doc_terms.size());
    for (const auto& terms : pc.doc_terms) {
        vectors.push_back(weighter_.weight(terms, config.scheme(), config.profile(), pc.stats));
    }
    return vectors;
}

std::vector<ExplainedDocument> PermutationDriver::explain(const Configuration& config, int query_id, size_t top_k) {
    const std::vector<Query>& queries = corpus_.queries();
    auto it = std::find_if(queries.begin(), queries.end(),
                           [query_id](const Query& q) { return q.query_id == query_id; });
    if (it == queries.end()) {
        throw std::invalid_argument("unknown query id " + std::to_string(query_id));
    }
    size_t query_pos = static_cast<size_t>(std::distance(queries.begin(), it));

    cache_.build(corpus_, {config.preprocess_key()});
    const PreprocessedCorpus& pc = cache_.get(config.preprocess_key());

    std::vector<WeightVector> doc_vectors = weight_documents(config, pc);
    WeightVector query_vector = weighter_.weight(pc.query_terms[query_pos], config.scheme(), config.profile(), pc.stats);
    RankedList ranking = evaluator_.rank(query_vector, pc.doc_ids, doc_vectors, config.similarity());

    std::vector<ExplainedDocument> top;
    for (size_t k = 0; k < ranking.size() && k < top_k; ++k) {
        top.push_back({ranking[k].doc_id, ranking[k].score, it->relevant.count(ranking[k].doc_id) > 0});
    }
    return top;
}

std::vector<MetricRow> run_sweep(
    const Corpus& corpus,
    const Preprocessor& preprocessor,
    const SweepDimensions& dimensions,
    size_t num_threads
) {
    PermutationDriver driver(corpus, preprocessor);
    return driver.run_sweep(dimensions, num_threads);
}
