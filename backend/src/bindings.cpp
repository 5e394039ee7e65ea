#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <stdexcept>
#include "SweepSession.hpp"
#include "ResultTable.hpp"
#include "SimilarityEngine.hpp"

namespace py = pybind11;

namespace {

// Runs the sweep described by a settings file and returns the results table
std::string run_sweep_from_settings(const std::string& settings_path) {
    SweepSettings settings = SweepSettings::load(settings_path);
    SweepSession session(settings);
    if (!session.is_ready()) {
        throw std::runtime_error("could not load the inputs named in " + settings_path);
    }
    return ResultTable::to_tsv(session.run());
}

double similarity(const WeightVector& query, const WeightVector& doc, const std::string& kind) {
    SimilarityEngine engine;
    return engine.similarity(query, doc, parse_similarity_kind(kind));
}

std::vector<std::string> preprocess(const std::vector<std::string>& tokens, bool remove_stopwords, bool stem) {
    static const StopwordSet stopwords;
    static const LightEnglishStemmer stemmer;
    Preprocessor preprocessor(stopwords, stemmer);
    return preprocessor.preprocess(tokens, remove_stopwords, stem);
}

}

PYBIND11_MODULE(permeval, m) {
    m.def("run_sweep", &run_sweep_from_settings, "Runs a sweep from a settings file and returns the TSV table");
    m.def("similarity", &similarity, "Similarity of two {term: weight} vectors (cosine, jaccard, dice, overlap)");
    m.def("preprocess", &preprocess, "Stopword removal and stemming with the built-in list and stemmer");
}
