#include "SimilarityEngine.hpp"
#include "EvaluationErrors.hpp"
#include <algorithm>
#include <cmath>

const char* similarity_kind_name(SimilarityKind kind) {
    switch (kind) {
        case SimilarityKind::Cosine: return "cosine";
        case SimilarityKind::Jaccard: return "jaccard";
        case SimilarityKind::Dice: return "dice";
        case SimilarityKind::Overlap: return "overlap";
    }
    return "unknown";
}

SimilarityKind parse_similarity_kind(const std::string& tag) {
    if (tag == "cosine") return SimilarityKind::Cosine;
    if (tag == "jaccard") return SimilarityKind::Jaccard;
    if (tag == "dice") return SimilarityKind::Dice;
    if (tag == "overlap") return SimilarityKind::Overlap;
    throw InvalidConfiguration("unknown similarity '" + tag + "'");
}

SimilarityEngine::SimilarityEngine() {}

double SimilarityEngine::similarity(const WeightVector& query, const WeightVector& doc, SimilarityKind kind) const {
    switch (kind) {
        case SimilarityKind::Cosine: return cosine(query, doc);
        case SimilarityKind::Jaccard: return jaccard(query, doc);
        case SimilarityKind::Dice: return dice(query, doc);
        case SimilarityKind::Overlap: return overlap(query, doc);
    }
    return 0.0;
}

double SimilarityEngine::cosine(const WeightVector& query, const WeightVector& doc) const {
    double norm_q = l2_norm(query);
    double norm_d = l2_norm(doc);

    if (norm_q == 0.0 || norm_d == 0.0) {
        return 0.0;
    }

    double similarity = dot(query, doc) / (norm_q * norm_d);
    // Rounding can push an identical pair slightly above 1
    return std::max(0.0, std::min(1.0, similarity));
}

double SimilarityEngine::jaccard(const WeightVector& query, const WeightVector& doc) const {
    size_t shared = shared_terms(query, doc);
    size_t union_size = support_size(query) + support_size(doc) - shared;
    if (union_size == 0) return 0.0;
    return static_cast<double>(shared) / static_cast<double>(union_size);
}

double SimilarityEngine::dice(const WeightVector& query, const WeightVector& doc) const {
    size_t total = support_size(query) + support_size(doc);
    if (total == 0) return 0.0;
    return 2.0 * static_cast<double>(shared_terms(query, doc)) / static_cast<double>(total);
}

double SimilarityEngine::overlap(const WeightVector& query, const WeightVector& doc) const {
    size_t smaller = std::min(support_size(query), support_size(doc));
    if (smaller == 0) return 0.0;
    return static_cast<double>(shared_terms(query, doc)) / static_cast<double>(smaller);
}

// Both maps are sorted by term, so a single merge pass finds the common keys
size_t SimilarityEngine::shared_terms(const WeightVector& a, const WeightVector& b) const {
    size_t shared = 0;
    auto it_a = a.begin();
    auto it_b = b.begin();

    while (it_a != a.end() && it_b != b.end()) {
        if (it_a->first < it_b->first) {
            ++it_a;
        } else if (it_b->first < it_a->first) {
            ++it_b;
        } else {
            if (it_a->second > 0.0 && it_b->second > 0.0) ++shared;
            ++it_a;
            ++it_b;
        }
    }
    return shared;
}

// Terms with a stored zero weight are not part of the support
size_t SimilarityEngine::support_size(const WeightVector& v) const {
    size_t count = 0;
    for (const auto& [term, w] : v) {
        if (w > 0.0) ++count;
    }
    return count;
}

double SimilarityEngine::dot(const WeightVector& a, const WeightVector& b) const {
    double sum = 0.0;
    auto it_a = a.begin();
    auto it_b = b.begin();

    while (it_a != a.end() && it_b != b.end()) {
        if (it_a->first < it_b->first) {
            ++it_a;
        } else if (it_b->first < it_a->first) {
            ++it_b;
        } else {
            sum += it_a->second * it_b->second;
            ++it_a;
            ++it_b;
        }
    }
    return sum;
}

double SimilarityEngine::l2_norm(const WeightVector& v) const {
    double sum = 0.0;
    for (const auto& [term, w] : v) {
        sum += w * w;
    }
    return std::sqrt(sum);
}
