#include "PreprocessCache.hpp"
#include <iostream>
#include <stdexcept>

PreprocessCache::PreprocessCache(const Preprocessor& preprocessor) : preprocessor_(preprocessor) {}

void PreprocessCache::build(const Corpus& corpus, const std::vector<PreprocessKey>& keys) {
    for (const auto& key : keys) {
        if (entries_.count(key)) continue;

        entries_.emplace(key, preprocess_corpus(corpus, key));

        const PreprocessedCorpus& entry = entries_.at(key);
        std::cout << "[Preprocess] removeStopwords=" << (key.remove_stopwords ? "true" : "false")
                  << " stem=" << (key.stem ? "true" : "false")
                  << ": " << entry.stats.document_frequency.size() << " distinct terms, avg length "
                  << entry.stats.avg_length << std::endl;
    }
}

const PreprocessedCorpus& PreprocessCache::get(const PreprocessKey& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        throw std::out_of_range("preprocessing pair was not built");
    }
    return it->second;
}

PreprocessedCorpus PreprocessCache::preprocess_corpus(const Corpus& corpus, const PreprocessKey& key) const {
    PreprocessedCorpus result;
    result.doc_ids.reserve(corpus.num_documents());
    result.doc_terms.reserve(corpus.num_documents());
    result.query_terms.reserve(corpus.num_queries());

    for (const auto& doc : corpus.documents()) {
        result.doc_ids.push_back(doc.doc_id);
        result.doc_terms.push_back(preprocessor_.preprocess(doc.tokens, key.remove_stopwords, key.stem));
    }
    for (const auto& query : corpus.queries()) {
        result.query_terms.push_back(preprocessor_.preprocess(query.tokens, key.remove_stopwords, key.stem));
    }

    // Statistics are scoped to this pair only
    result.stats = CorpusStats::compute(result.doc_terms);
    return result;
}
