#pragma once
// Configuration.hpp
// One point of the evaluation sweep and the dimensions it is drawn from

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "MetricEvaluator.hpp"
#include "PreprocessCache.hpp"
#include "SimilarityEngine.hpp"
#include "TermWeighting.hpp"

using json = nlohmann::json;

// Configuration as enumerated, before the tags are parsed and the profile validated
struct ConfigurationTags {
    std::string scheme;
    std::string similarity;
    bool remove_stopwords = false;
    bool stem = false;
    WeightProfile profile;
};

// Validated, immutable configuration
class Configuration {
public:
    // Throws InvalidProfile for a negative coefficient
    Configuration(WeightingScheme scheme, SimilarityKind similarity,
                  bool remove_stopwords, bool stem, const WeightProfile& profile);

    // Throws InvalidConfiguration for an unknown tag, InvalidProfile for a bad profile
    static Configuration from_tags(const ConfigurationTags& tags);

    WeightingScheme scheme() const { return scheme_; }
    SimilarityKind similarity() const { return similarity_; }
    bool remove_stopwords() const { return remove_stopwords_; }
    bool stem() const { return stem_; }
    const WeightProfile& profile() const { return profile_; }

    PreprocessKey preprocess_key() const { return {remove_stopwords_, stem_}; }

    ConfigurationTags tags() const;

private:
    WeightingScheme scheme_;
    SimilarityKind similarity_;
    bool remove_stopwords_;
    bool stem_;
    WeightProfile profile_;
};

// Values of each sweep dimension, enumerated in the order given
struct SweepDimensions {
    std::vector<std::string> schemes;
    std::vector<std::string> similarities;
    std::vector<bool> remove_stopwords;
    std::vector<bool> stem;
    std::vector<WeightProfile> weight_profiles;

    // tf/tfidf/boolean x all similarities x both flags x three profiles
    static SweepDimensions defaults();

    // Missing keys keep the current values. Throws ConfigError on a malformed value.
    void merge_json(const json& j);

    // Number of configurations in the Cartesian product
    size_t size() const;

    // Nesting order: scheme, similarity, removeStopwords, stem, profile
    std::vector<ConfigurationTags> enumerate() const;

    // Distinct (removeStopwords, stem) pairs, in enumeration order
    std::vector<PreprocessKey> preprocess_keys() const;
};

struct MetricRow {
    enum class Status {
        Ok,
        Failed,
        Cancelled
    };

    ConfigurationTags config;
    Status status = Status::Ok;
    std::string error;              // Set for failed rows
    size_t evaluated_queries = 0;   // Judged queries averaged into metrics
    QueryMetrics metrics;

    // "ok", "failed: <reason>", "cancelled"
    std::string status_text() const;
};
