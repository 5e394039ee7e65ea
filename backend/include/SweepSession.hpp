#pragma once
// SweepSession.hpp
// Loads everything a sweep needs (corpus, judgments, stopwords, stemmer) once
// and owns the driver that evaluates against it

#include <memory>
#include <string>
#include <vector>
#include "Corpus.hpp"
#include "PermutationDriver.hpp"
#include "Preprocessor.hpp"
#include "Stemmer.hpp"
#include "Stopwords.hpp"
#include "SweepSettings.hpp"

class SweepSession {
public:
    explicit SweepSession(const SweepSettings& settings);

    // False if the corpus, relevance or stopword file could not be loaded
    bool is_ready() const { return ready_; }

    const SweepSettings& settings() const { return settings_; }
    const Corpus& corpus() const { return corpus_; }
    const Preprocessor& preprocessor() const { return *preprocessor_; }
    PermutationDriver& driver() { return *driver_; }

    // Sweep over the configured dimensions
    std::vector<MetricRow> run();

    // Sweep over explicit dimensions
    std::vector<MetricRow> run(const SweepDimensions& dimensions);

private:
    SweepSettings settings_;
    Corpus corpus_;
    StopwordSet stopwords_;
    LightEnglishStemmer stemmer_;
    std::unique_ptr<Preprocessor> preprocessor_;
    std::unique_ptr<PermutationDriver> driver_;
    bool ready_;
};
