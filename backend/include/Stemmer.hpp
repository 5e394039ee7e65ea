#pragma once
// Stemmer.hpp
// Token stemming used by the preprocessor
// Implementations must be pure: the same token always maps to the same stem

#include <string>

class Stemmer {
public:
    virtual ~Stemmer() = default;

    virtual std::string stem(const std::string& token) const = 0;
};

// Suffix-stripping stemmer for lowercase English tokens
// Strips one of -ing, -ed, -ly, -es, -s while keeping at least two characters of stem
class LightEnglishStemmer : public Stemmer {
public:
    std::string stem(const std::string& token) const override;
};
