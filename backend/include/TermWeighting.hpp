#pragma once
// TermWeighting.hpp
// Sparse term weight vectors for the boolean, tf and tf-idf schemes
// A 4-coefficient weight profile scales the raw frequency, the idf factor and
// the two length-normalization terms

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

enum class WeightingScheme {
    Boolean,
    Tf,
    Tfidf
};

// "boolean", "tf", "tfidf"
const char* weighting_scheme_name(WeightingScheme scheme);

// Throws InvalidConfiguration for an unknown tag
WeightingScheme parse_weighting_scheme(const std::string& tag);

struct WeightProfile {
    double w1;  // raw frequency multiplier
    double w2;  // idf multiplier
    double w3;  // document length normalization
    double w4;  // distinct-term normalization

    WeightProfile() : w1(1.0), w2(1.0), w3(1.0), w4(1.0) {}
    WeightProfile(double a, double b, double c, double d) : w1(a), w2(b), w3(c), w4(d) {}

    // Throws InvalidProfile if any coefficient is negative (or NaN)
    void validate() const;

    bool operator==(const WeightProfile& other) const {
        return w1 == other.w1 && w2 == other.w2 && w3 == other.w3 && w4 == other.w4;
    }
};

// Term -> weight. Zero weights are never stored, so the keys are the term support.
// Ordered so that sums and output are reproducible.
using WeightVector = std::map<std::string, double>;

// Collection statistics for one (removeStopwords, stem) preprocessing of the corpus
struct CorpusStats {
    size_t num_documents = 0;
    std::unordered_map<std::string, int> document_frequency;
    double avg_length = 0.0;
    double avg_unique_terms = 0.0;

    static CorpusStats compute(const std::vector<std::vector<std::string>>& documents);

    // log(N / df), 0 for a term that occurs in no document
    double idf(const std::string& term) const;
};

class TermWeighter {
public:
    TermWeighter();

    // An empty term sequence yields an empty vector
    WeightVector weight(
        const std::vector<std::string>& terms,
        WeightingScheme scheme,
        const WeightProfile& profile,
        const CorpusStats& stats
    ) const;

private:
    double length_normalization(
        size_t length,
        size_t unique_terms,
        const WeightProfile& profile,
        const CorpusStats& stats
    ) const;
};
