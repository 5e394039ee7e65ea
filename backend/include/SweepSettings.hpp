#pragma once
// SweepSettings.hpp
// Run settings for the sweep, read from a JSON file
// Every key is optional; missing keys keep the defaults below

#include <string>
#include <nlohmann/json.hpp>
#include "Configuration.hpp"

using json = nlohmann::json;

struct SweepSettings {
    std::string corpus_path = "data/sample_corpus.json";
    std::string relevance_path;         // Optional "queryId docId" file
    std::string stopwords_path;         // Optional; built-in list when empty
    std::string output_path = "output.tsv";
    size_t threads = 0;                 // 0 = hardware concurrency
    SweepDimensions dimensions = SweepDimensions::defaults();

    // Throws ConfigError if the file cannot be read or holds invalid values
    static SweepSettings load(const std::string& settings_path);

    static SweepSettings from_json(const json& j);

    // Parses a thread count given on the command line. Throws ConfigError
    // unless the text is a non-negative integer.
    static size_t parse_thread_count(const std::string& text);

    // Resolves threads == 0 to the machine's concurrency (4 if unknown)
    size_t worker_count() const;
};
