#include "Stemmer.hpp"
#include <cctype>
#include <cstring>

std::string LightEnglishStemmer::stem(const std::string& token) const {
    std::string w = token;
    if (w.size() < 4) return w;

    for (unsigned char c : w) {
        if (!std::isalpha(c)) return w;   // numbers, mixed tokens, non-ASCII are left alone
    }

    auto ends_with = [&](const char* suf) {
        size_t ls = std::strlen(suf);
        return (w.size() > ls + 1) && (w.compare(w.size() - ls, ls, suf) == 0);
    };
    auto cut = [&](size_t n) { w.resize(w.size() - n); };

    if (ends_with("ing")) cut(3);
    else if (ends_with("ed")) cut(2);
    else if (ends_with("ly")) cut(2);
    else if (ends_with("es")) cut(2);
    else if (ends_with("ss")) return w;
    else if (ends_with("s")) cut(1);

    return w;
}
