#include <catch2/catch.hpp>
#include "Preprocessor.hpp"
#include "PreprocessCache.hpp"
#include "test_helpers.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace {

// Marks stemmed tokens so tests can see which ones went through the stemmer
class SuffixStemmer : public Stemmer {
public:
    std::string stem(const std::string& token) const override { return token + "~"; }
};

}

TEST_CASE("stopword membership ignores case", "[preprocess]") {
    StopwordSet defaults;
    CHECK(defaults.contains("the"));
    CHECK(defaults.contains("The"));
    CHECK(defaults.contains("THE"));
    CHECK_FALSE(defaults.contains("cat"));

    StopwordSet custom({"Cat", "dog"});
    CHECK(custom.size() == 2);
    CHECK(custom.contains("cat"));
    CHECK(custom.contains("DOG"));
    CHECK_FALSE(custom.contains("the"));
}

TEST_CASE("stopwords load from a one-word-per-line file", "[preprocess]") {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "permeval_stopwords_test.txt";
    {
        std::ofstream out(path);
        out << "  Alpha \n\nbeta\r\n";
    }

    StopwordSet set;
    REQUIRE(set.load_from_file(path.string()));
    CHECK(set.size() == 2);
    CHECK(set.contains("alpha"));
    CHECK(set.contains("BETA"));
    CHECK_FALSE(set.contains("the"));

    std::remove(path.string().c_str());

    StopwordSet missing;
    CHECK_FALSE(missing.load_from_file("/nonexistent/permeval/stopwords"));
}

TEST_CASE("light stemmer strips common English suffixes", "[preprocess]") {
    LightEnglishStemmer stemmer;
    CHECK(stemmer.stem("cats") == "cat");
    CHECK(stemmer.stem("jumped") == "jump");
    CHECK(stemmer.stem("quickly") == "quick");
    CHECK(stemmer.stem("boxes") == "box");
    CHECK(stemmer.stem("running") == "runn");
    CHECK(stemmer.stem("class") == "class");
    CHECK(stemmer.stem("is") == "is");
    CHECK(stemmer.stem("1990s") == "1990s");
}

TEST_CASE("preprocessing keeps order and duplicates", "[preprocess]") {
    StopwordSet stopwords;
    SuffixStemmer stemmer;
    Preprocessor pre(stopwords, stemmer);
    std::vector<std::string> tokens = {"The", "cat", "and", "the", "cat"};

    CHECK(pre.preprocess(tokens, false, false) == tokens);

    std::vector<std::string> no_stop = {"cat", "cat"};
    CHECK(pre.preprocess(tokens, true, false) == no_stop);

    std::vector<std::string> stemmed = {"The~", "cat~", "and~", "the~", "cat~"};
    CHECK(pre.preprocess(tokens, false, true) == stemmed);
}

TEST_CASE("stopwords are removed before stemming", "[preprocess]") {
    StopwordSet stopwords({"cats"});
    LightEnglishStemmer stemmer;
    Preprocessor pre(stopwords, stemmer);

    // "cats" would stem to the non-stopword "cat" if stemming ran first
    std::vector<std::string> expected = {"dog"};
    CHECK(pre.preprocess({"cats", "dogs"}, true, true) == expected);
}

TEST_CASE("preprocessing is deterministic", "[preprocess]") {
    StopwordSet stopwords;
    LightEnglishStemmer stemmer;
    Preprocessor pre(stopwords, stemmer);
    std::vector<std::string> tokens = {"Running", "dogs", "of", "the", "valley", "jumped"};

    for (bool remove : {false, true}) {
        for (bool stem : {false, true}) {
            CHECK(pre.preprocess(tokens, remove, stem) == pre.preprocess(tokens, remove, stem));
        }
    }
}

TEST_CASE("a document can be reduced to nothing", "[preprocess]") {
    StopwordSet stopwords;
    LightEnglishStemmer stemmer;
    Preprocessor pre(stopwords, stemmer);
    CHECK(pre.preprocess({"the", "of", "and"}, true, true).empty());
}

TEST_CASE("cache holds one entry per preprocessing pair", "[preprocess]") {
    Corpus corpus = make_small_corpus();
    StopwordSet stopwords;
    LightEnglishStemmer stemmer;
    Preprocessor pre(stopwords, stemmer);
    PreprocessCache cache(pre);

    PreprocessKey raw{false, false};
    PreprocessKey clean{true, false};
    cache.build(corpus, {raw, clean, raw});

    CHECK(cache.size() == 2);
    CHECK(cache.contains(raw));
    CHECK(cache.contains(clean));
    CHECK_FALSE(cache.contains(PreprocessKey{true, true}));
    CHECK_THROWS_AS(cache.get(PreprocessKey{true, true}), std::out_of_range);

    const PreprocessedCorpus& raw_entry = cache.get(raw);
    const PreprocessedCorpus& clean_entry = cache.get(clean);

    std::vector<int> expected_ids = {1, 2, 3, 4, 5};
    CHECK(raw_entry.doc_ids == expected_ids);
    CHECK(raw_entry.query_terms.size() == corpus.num_queries());

    // Statistics belong to their own pair
    CHECK(raw_entry.stats.document_frequency.count("the") == 1);
    CHECK(clean_entry.stats.document_frequency.count("the") == 0);
    CHECK(clean_entry.stats.avg_length < raw_entry.stats.avg_length);
    CHECK(clean_entry.doc_terms[3].empty());
}
