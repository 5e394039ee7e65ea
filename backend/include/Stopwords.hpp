#pragma once
// Stopwords.hpp
// Fixed stopword set used by the preprocessor
// Membership is case-insensitive

#include <string>
#include <unordered_set>
#include <vector>

class StopwordSet {
public:
    // Starts with the built-in English list
    StopwordSet();

    explicit StopwordSet(const std::vector<std::string>& words);

    // Replace the set with the words of a one-word-per-line file
    bool load_from_file(const std::string& path);

    bool contains(const std::string& token) const;

    size_t size() const { return stop_words_.size(); }

private:
    std::unordered_set<std::string> stop_words_;

    void load_default_stopwords();
};
