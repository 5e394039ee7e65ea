#include "Stopwords.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

}

StopwordSet::StopwordSet() {
    load_default_stopwords();
}

StopwordSet::StopwordSet(const std::vector<std::string>& words) {
    for (const auto& w : words) {
        if (!w.empty()) stop_words_.insert(to_lower(w));
    }
}

void StopwordSet::load_default_stopwords() {
    static const char* defaults[] = {
        "a","about","above","after","again","against","all","am","an","and","any","are","as","at",
        "be","because","been","before","being","below","between","both","but","by","can","could",
        "did","do","does","doing","down","during","each","few","for","from","further","had","has",
        "have","having","he","her","here","hers","herself","him","himself","his","how","i","if",
        "in","into","is","it","its","itself","just","me","more","most","my","myself","no","nor",
        "not","now","of","off","on","once","only","or","other","our","ours","ourselves","out",
        "over","own","same","she","should","so","some","such","than","that","the","their",
        "theirs","them","themselves","then","there","these","they","this","those","through","to",
        "too","under","until","up","very","was","we","were","what","when","where","which","while",
        "who","whom","why","will","with","would","you","your","yours","yourself","yourselves"
    };
    stop_words_.clear();
    for (const auto& w : defaults) stop_words_.insert(std::string(w));
}

bool StopwordSet::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[Stopwords] Error: Could not open stopword file: " << path << std::endl;
        return false;
    }

    stop_words_.clear();
    std::string line;
    while (std::getline(in, line)) {
        auto start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) continue;
        auto end = line.find_last_not_of(" \t\r\n");
        stop_words_.insert(to_lower(line.substr(start, end - start + 1)));
    }

    std::cout << "[Stopwords] Loaded " << stop_words_.size() << " stopwords from " << path << std::endl;
    return true;
}

bool StopwordSet::contains(const std::string& token) const {
    return stop_words_.count(to_lower(token)) > 0;
}
