#include "Preprocessor.hpp"

Preprocessor::Preprocessor(const StopwordSet& stopwords, const Stemmer& stemmer)
    : stopwords_(stopwords), stemmer_(stemmer) {
}

std::vector<std::string> Preprocessor::preprocess(
    const std::vector<std::string>& raw_tokens,
    bool remove_stopwords,
    bool stem
) const {
    std::vector<std::string> terms;
    terms.reserve(raw_tokens.size());

    for (const auto& token : raw_tokens) {
        if (remove_stopwords && stopwords_.contains(token)) continue;
        terms.push_back(stem ? stemmer_.stem(token) : token);
    }

    return terms;
}
