#include "TermWeighting.hpp"
#include "EvaluationErrors.hpp"
#include <cmath>
#include <sstream>
#include <unordered_set>

const char* weighting_scheme_name(WeightingScheme scheme) {
    switch (scheme) {
        case WeightingScheme::Boolean: return "boolean";
        case WeightingScheme::Tf: return "tf";
        case WeightingScheme::Tfidf: return "tfidf";
    }
    return "unknown";
}

WeightingScheme parse_weighting_scheme(const std::string& tag) {
    if (tag == "boolean") return WeightingScheme::Boolean;
    if (tag == "tf") return WeightingScheme::Tf;
    if (tag == "tfidf") return WeightingScheme::Tfidf;
    throw InvalidConfiguration("unknown weighting scheme '" + tag + "'");
}

void WeightProfile::validate() const {
    const double coefficients[] = {w1, w2, w3, w4};
    for (int i = 0; i < 4; ++i) {
        if (!std::isfinite(coefficients[i]) || coefficients[i] < 0.0) {
            std::ostringstream msg;
            msg << "coefficient w" << (i + 1) << " = " << coefficients[i] << " is not a finite non-negative number";
            throw InvalidProfile(msg.str());
        }
    }
}

CorpusStats CorpusStats::compute(const std::vector<std::vector<std::string>>& documents) {
    CorpusStats stats;
    stats.num_documents = documents.size();
    if (documents.empty()) return stats;

    size_t total_length = 0;
    size_t total_unique = 0;

    for (const auto& terms : documents) {
        std::unordered_set<std::string> seen;
        for (const auto& term : terms) {
            if (seen.insert(term).second) stats.document_frequency[term]++;
        }
        total_length += terms.size();
        total_unique += seen.size();
    }

    double n = static_cast<double>(documents.size());
    stats.avg_length = static_cast<double>(total_length) / n;
    stats.avg_unique_terms = static_cast<double>(total_unique) / n;
    return stats;
}

double CorpusStats::idf(const std::string& term) const {
    auto it = document_frequency.find(term);
    if (it == document_frequency.end() || it->second <= 0) {
        return 0.0;
    }
    return std::log(static_cast<double>(num_documents) / static_cast<double>(it->second));
}

TermWeighter::TermWeighter() {}

WeightVector TermWeighter::weight(
    const std::vector<std::string>& terms,
    WeightingScheme scheme,
    const WeightProfile& profile,
    const CorpusStats& stats
) const {
    WeightVector vec;
    if (terms.empty()) return vec;

    std::map<std::string, int> counts;
    for (const auto& term : terms) counts[term]++;

    double norm = length_normalization(terms.size(), counts.size(), profile, stats);

    for (const auto& [term, count] : counts) {
        double w = 0.0;
        switch (scheme) {
            case WeightingScheme::Boolean:
                w = profile.w1;
                break;
            case WeightingScheme::Tf:
                w = profile.w1 * count / norm;
                break;
            case WeightingScheme::Tfidf:
                w = profile.w1 * count * (profile.w2 * stats.idf(term)) / norm;
                break;
        }
        if (w > 0.0) vec.emplace(term, w);
    }

    return vec;
}

// L(d) = 1 + w3 * |d| / avgLen + w4 * unique(d) / avgUnique, always >= 1
double TermWeighter::length_normalization(
    size_t length,
    size_t unique_terms,
    const WeightProfile& profile,
    const CorpusStats& stats
) const {
    double norm = 1.0;
    if (stats.avg_length > 0.0) {
        norm += profile.w3 * static_cast<double>(length) / stats.avg_length;
    }
    if (stats.avg_unique_terms > 0.0) {
        norm += profile.w4 * static_cast<double>(unique_terms) / stats.avg_unique_terms;
    }
    return norm;
}
