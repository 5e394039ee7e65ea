#pragma once
// SimilarityEngine.hpp
// Query/document similarity over sparse weight vectors
//
// Cosine uses the numeric weights. Jaccard, Dice and overlap use the unweighted
// term support (terms with nonzero weight). Every measure returns a value in
// [0, 1] and returns 0 when its denominator would be 0.

#include <string>
#include "TermWeighting.hpp"

enum class SimilarityKind {
    Cosine,
    Jaccard,
    Dice,
    Overlap
};

// "cosine", "jaccard", "dice", "overlap"
const char* similarity_kind_name(SimilarityKind kind);

// Throws InvalidConfiguration for an unknown tag
SimilarityKind parse_similarity_kind(const std::string& tag);

class SimilarityEngine {
public:
    SimilarityEngine();

    double similarity(const WeightVector& query, const WeightVector& doc, SimilarityKind kind) const;

    double cosine(const WeightVector& query, const WeightVector& doc) const;
    double jaccard(const WeightVector& query, const WeightVector& doc) const;
    double dice(const WeightVector& query, const WeightVector& doc) const;
    double overlap(const WeightVector& query, const WeightVector& doc) const;

private:
    // Size of the intersection of the two term supports
    size_t shared_terms(const WeightVector& a, const WeightVector& b) const;
    size_t support_size(const WeightVector& v) const;

    double dot(const WeightVector& a, const WeightVector& b) const;
    double l2_norm(const WeightVector& v) const;
};
