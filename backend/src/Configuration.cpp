#include "Configuration.hpp"
#include "EvaluationErrors.hpp"

Configuration::Configuration(WeightingScheme scheme, SimilarityKind similarity,
                             bool remove_stopwords, bool stem, const WeightProfile& profile)
    : scheme_(scheme),
      similarity_(similarity),
      remove_stopwords_(remove_stopwords),
      stem_(stem),
      profile_(profile) {
    profile_.validate();
}

Configuration Configuration::from_tags(const ConfigurationTags& tags) {
    return Configuration(
        parse_weighting_scheme(tags.scheme),
        parse_similarity_kind(tags.similarity),
        tags.remove_stopwords,
        tags.stem,
        tags.profile
    );
}

ConfigurationTags Configuration::tags() const {
    ConfigurationTags t;
    t.scheme = weighting_scheme_name(scheme_);
    t.similarity = similarity_kind_name(similarity_);
    t.remove_stopwords = remove_stopwords_;
    t.stem = stem_;
    t.profile = profile_;
    return t;
}

SweepDimensions SweepDimensions::defaults() {
    SweepDimensions dims;
    dims.schemes = {"tf", "tfidf", "boolean"};
    dims.similarities = {"cosine", "jaccard", "dice", "overlap"};
    dims.remove_stopwords = {false, true};
    dims.stem = {false, true};
    dims.weight_profiles = {
        WeightProfile(1, 1, 1, 1),
        WeightProfile(1, 3, 4, 1),
        WeightProfile(1, 1, 1, 4)
    };
    return dims;
}

namespace {

std::vector<std::string> read_tags(const json& j, const char* key) {
    const json& value = j.at(key);
    if (!value.is_array()) {
        throw ConfigError(std::string("'") + key + "' must be an array of strings");
    }
    std::vector<std::string> tags;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw ConfigError(std::string("'") + key + "' must be an array of strings");
        }
        tags.push_back(item.get<std::string>());
    }
    return tags;
}

std::vector<bool> read_flags(const json& j, const char* key) {
    const json& value = j.at(key);
    if (!value.is_array()) {
        throw ConfigError(std::string("'") + key + "' must be an array of booleans");
    }
    std::vector<bool> flags;
    for (const auto& item : value) {
        if (!item.is_boolean()) {
            throw ConfigError(std::string("'") + key + "' must be an array of booleans");
        }
        flags.push_back(item.get<bool>());
    }
    return flags;
}

WeightProfile read_profile(const json& item) {
    if (!item.is_array() || item.size() != 4) {
        throw ConfigError("each weight profile must be an array of 4 numbers");
    }
    for (const auto& c : item) {
        if (!c.is_number()) {
            throw ConfigError("each weight profile must be an array of 4 numbers");
        }
    }
    return WeightProfile(item[0].get<double>(), item[1].get<double>(),
                         item[2].get<double>(), item[3].get<double>());
}

}

void SweepDimensions::merge_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("sweep dimensions must be a JSON object");
    }

    if (j.contains("schemes")) schemes = read_tags(j, "schemes");
    if (j.contains("similarities")) similarities = read_tags(j, "similarities");
    if (j.contains("remove_stopwords")) remove_stopwords = read_flags(j, "remove_stopwords");
    if (j.contains("stem")) stem = read_flags(j, "stem");

    if (j.contains("weight_profiles")) {
        const json& value = j["weight_profiles"];
        if (!value.is_array()) {
            throw ConfigError("'weight_profiles' must be an array");
        }
        weight_profiles.clear();
        for (const auto& item : value) {
            weight_profiles.push_back(read_profile(item));
        }
    }
}

size_t SweepDimensions::size() const {
    return schemes.size() * similarities.size() * remove_stopwords.size() *
           stem.size() * weight_profiles.size();
}

std::vector<ConfigurationTags> SweepDimensions::enumerate() const {
    std::vector<ConfigurationTags> configs;
    configs.reserve(size());

    for (const auto& scheme : schemes) {
        for (const auto& similarity : similarities) {
            for (bool remove : remove_stopwords) {
                for (bool stemming : stem) {
                    for (const auto& profile : weight_profiles) {
                        ConfigurationTags tags;
                        tags.scheme = scheme;
                        tags.similarity = similarity;
                        tags.remove_stopwords = remove;
                        tags.stem = stemming;
                        tags.profile = profile;
                        configs.push_back(tags);
                    }
                }
            }
        }
    }
    return configs;
}

std::vector<PreprocessKey> SweepDimensions::preprocess_keys() const {
    std::vector<PreprocessKey> keys;
    if (size() == 0) return keys;

    for (bool remove : remove_stopwords) {
        for (bool stemming : stem) {
            PreprocessKey key{remove, stemming};
            bool seen = false;
            for (const auto& k : keys) {
                if (k.remove_stopwords == key.remove_stopwords && k.stem == key.stem) seen = true;
            }
            if (!seen) keys.push_back(key);
        }
    }
    return keys;
}

std::string MetricRow::status_text() const {
    switch (status) {
        case Status::Ok: return "ok";
        case Status::Failed: return "failed: " + error;
        case Status::Cancelled: return "cancelled";
    }
    return "unknown";
}
