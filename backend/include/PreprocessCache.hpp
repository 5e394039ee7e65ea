#pragma once
// PreprocessCache.hpp
// Preprocessed corpus and its collection statistics, one entry per
// (removeStopwords, stem) pair. Built completely before any worker reads it.

#include <map>
#include <string>
#include <vector>
#include "Corpus.hpp"
#include "Preprocessor.hpp"
#include "TermWeighting.hpp"

struct PreprocessKey {
    bool remove_stopwords;
    bool stem;

    bool operator<(const PreprocessKey& other) const {
        if (remove_stopwords != other.remove_stopwords) return remove_stopwords < other.remove_stopwords;
        return stem < other.stem;
    }
};

struct PreprocessedCorpus {
    std::vector<int> doc_ids;                           // parallel to doc_terms
    std::vector<std::vector<std::string>> doc_terms;
    std::vector<std::vector<std::string>> query_terms;  // parallel to Corpus::queries()
    CorpusStats stats;
};

class PreprocessCache {
public:
    explicit PreprocessCache(const Preprocessor& preprocessor);

    // Computes each missing pair once; existing entries are kept
    void build(const Corpus& corpus, const std::vector<PreprocessKey>& keys);

    // Throws std::out_of_range for a pair that was never built
    const PreprocessedCorpus& get(const PreprocessKey& key) const;

    bool contains(const PreprocessKey& key) const { return entries_.count(key) > 0; }
    size_t size() const { return entries_.size(); }

    void clear() { entries_.clear(); }

private:
    const Preprocessor& preprocessor_;
    std::map<PreprocessKey, PreprocessedCorpus> entries_;

    PreprocessedCorpus preprocess_corpus(const Corpus& corpus, const PreprocessKey& key) const;
};
