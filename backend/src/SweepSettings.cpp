#include "SweepSettings.hpp"
#include "EvaluationErrors.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

std::string read_string(const json& j, const char* key, const std::string& fallback) {
    if (!j.contains(key)) return fallback;
    if (!j[key].is_string()) {
        throw ConfigError(std::string("'") + key + "' must be a string");
    }
    return j[key].get<std::string>();
}

}

SweepSettings SweepSettings::load(const std::string& settings_path) {
    std::ifstream in(settings_path);
    if (!in.is_open()) {
        throw ConfigError("could not open settings file: " + settings_path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("could not parse " + settings_path + ": " + e.what());
    }

    SweepSettings settings = from_json(j);
    std::cout << "[Settings] Loaded " << settings_path << " ("
              << settings.dimensions.size() << " configurations)" << std::endl;
    return settings;
}

SweepSettings SweepSettings::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("settings must be a JSON object");
    }

    SweepSettings settings;
    settings.corpus_path = read_string(j, "corpus", settings.corpus_path);
    settings.relevance_path = read_string(j, "relevance", settings.relevance_path);
    settings.stopwords_path = read_string(j, "stopwords", settings.stopwords_path);
    settings.output_path = read_string(j, "output", settings.output_path);

    if (j.contains("threads")) {
        if (!j["threads"].is_number_integer() || j["threads"].get<long long>() < 0) {
            throw ConfigError("'threads' must be a non-negative integer");
        }
        settings.threads = j["threads"].get<size_t>();
    }

    settings.dimensions.merge_json(j);
    return settings;
}

size_t SweepSettings::parse_thread_count(const std::string& text) {
    size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("thread count '" + text + "' is not an integer");
    }
    if (consumed != text.size()) {
        throw ConfigError("thread count '" + text + "' is not an integer");
    }
    if (value < 0) {
        throw ConfigError("thread count must be >= 0, got " + text);
    }
    return static_cast<size_t>(value);
}

size_t SweepSettings::worker_count() const {
    if (threads > 0) return threads;
    size_t hw = std::thread::hardware_concurrency();
    return hw == 0 ? 4 : hw;
}
