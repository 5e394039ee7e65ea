#include "SweepSession.hpp"
#include <iostream>

SweepSession::SweepSession(const SweepSettings& settings) : settings_(settings), ready_(true) {
    std::cout << "[Session] Initializing evaluation session...\n";

    if (!corpus_.load(settings_.corpus_path)) {
        std::cerr << "[Session] CRITICAL: Could not load corpus " << settings_.corpus_path << "\n";
        ready_ = false;
    }

    if (ready_ && !settings_.relevance_path.empty()) {
        if (!corpus_.load_relevance(settings_.relevance_path)) {
            std::cerr << "[Session] CRITICAL: Could not load relevance judgments\n";
            ready_ = false;
        }
    }

    if (!settings_.stopwords_path.empty()) {
        if (!stopwords_.load_from_file(settings_.stopwords_path)) {
            std::cerr << "[Session] CRITICAL: Could not load stopwords\n";
            ready_ = false;
        }
    } else {
        std::cout << "[Session] Using built-in stopword list (" << stopwords_.size() << " words)\n";
    }

    preprocessor_ = std::make_unique<Preprocessor>(stopwords_, stemmer_);
    driver_ = std::make_unique<PermutationDriver>(corpus_, *preprocessor_);

    if (ready_) {
        std::cout << "[Session] Ready: " << corpus_.num_documents() << " documents, "
                  << corpus_.num_queries() << " queries\n";
    }
}

std::vector<MetricRow> SweepSession::run() {
    return run(settings_.dimensions);
}

std::vector<MetricRow> SweepSession::run(const SweepDimensions& dimensions) {
    return driver_->run_sweep(dimensions, settings_.worker_count());
}
