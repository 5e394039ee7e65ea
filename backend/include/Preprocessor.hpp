#pragma once
// Preprocessor.hpp
// Turns raw tokens into index terms under the stopword / stemming switches
// Order and duplicates are preserved, term frequencies depend on it

#include <string>
#include <vector>
#include "Stopwords.hpp"
#include "Stemmer.hpp"

class Preprocessor {
public:
    // The stopword set and stemmer must outlive the preprocessor
    Preprocessor(const StopwordSet& stopwords, const Stemmer& stemmer);

    // Pure function of its inputs: stopwords are removed first, then survivors are stemmed
    std::vector<std::string> preprocess(
        const std::vector<std::string>& raw_tokens,
        bool remove_stopwords,
        bool stem
    ) const;

private:
    const StopwordSet& stopwords_;
    const Stemmer& stemmer_;
};
