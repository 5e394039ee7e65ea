#include <catch2/catch.hpp>
#include "Configuration.hpp"
#include "Corpus.hpp"
#include "EvaluationErrors.hpp"
#include "ResultTable.hpp"
#include "SweepSettings.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace {

std::string write_temp_file(const std::string& name, const std::string& contents) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path.string();
}

MetricRow ok_row() {
    MetricRow row;
    row.config.scheme = "tfidf";
    row.config.similarity = "cosine";
    row.config.remove_stopwords = true;
    row.config.stem = false;
    row.config.profile = WeightProfile(1, 3, 4, 1);
    row.status = MetricRow::Status::Ok;
    row.evaluated_queries = 2;
    row.metrics.precision_at_025 = 1.0;
    row.metrics.precision_at_05 = 0.5;
    row.metrics.precision_at_075 = 0.123456;
    row.metrics.precision_at_1 = 0.0;
    row.metrics.mean_precision_1 = 0.66666;
    row.metrics.mean_precision_2 = 0.25;
    row.metrics.precision_normalization = 0.9;
    row.metrics.recall_normalization = 0.75;
    return row;
}

}

TEST_CASE("settings fall back to defaults for missing keys", "[config]") {
    SweepSettings settings = SweepSettings::from_json(json::object());

    CHECK(settings.corpus_path == "data/sample_corpus.json");
    CHECK(settings.output_path == "output.tsv");
    CHECK(settings.relevance_path.empty());
    CHECK(settings.threads == 0);
    CHECK(settings.worker_count() > 0);
    CHECK(settings.dimensions.size() == 144);
}

TEST_CASE("settings override only the keys they name", "[config]") {
    json j = json::parse(R"({
        "corpus": "corpus.json",
        "threads": 3,
        "schemes": ["boolean"],
        "weight_profiles": [[1, 0, 0, 0], [2, 2, 2, 2]]
    })");

    SweepSettings settings = SweepSettings::from_json(j);

    CHECK(settings.corpus_path == "corpus.json");
    CHECK(settings.output_path == "output.tsv");
    CHECK(settings.worker_count() == 3);
    REQUIRE(settings.dimensions.schemes.size() == 1);
    CHECK(settings.dimensions.schemes[0] == "boolean");
    CHECK(settings.dimensions.similarities.size() == 4);
    REQUIRE(settings.dimensions.weight_profiles.size() == 2);
    CHECK(settings.dimensions.weight_profiles[1] == WeightProfile(2, 2, 2, 2));
    CHECK(settings.dimensions.size() == 1 * 4 * 2 * 2 * 2);
}

TEST_CASE("malformed settings are rejected", "[config]") {
    SECTION("profile with three coefficients") {
        json j = json::parse(R"({"weight_profiles": [[1, 1, 1]]})");
        CHECK_THROWS_AS(SweepSettings::from_json(j), ConfigError);
    }
    SECTION("negative thread count") {
        json j = json::parse(R"({"threads": -2})");
        CHECK_THROWS_AS(SweepSettings::from_json(j), ConfigError);
    }
    SECTION("schemes given as a string") {
        json j = json::parse(R"({"schemes": "tf"})");
        CHECK_THROWS_AS(SweepSettings::from_json(j), ConfigError);
    }
    SECTION("flags given as strings") {
        json j = json::parse(R"({"stem": ["yes"]})");
        CHECK_THROWS_AS(SweepSettings::from_json(j), ConfigError);
    }
    SECTION("top level is not an object") {
        CHECK_THROWS_AS(SweepSettings::from_json(json::array()), ConfigError);
    }
}

TEST_CASE("command-line thread counts must be non-negative integers", "[config]") {
    CHECK(SweepSettings::parse_thread_count("0") == 0);
    CHECK(SweepSettings::parse_thread_count("8") == 8);
    CHECK_THROWS_AS(SweepSettings::parse_thread_count("-3"), ConfigError);
    CHECK_THROWS_AS(SweepSettings::parse_thread_count("four"), ConfigError);
    CHECK_THROWS_AS(SweepSettings::parse_thread_count("2x"), ConfigError);
}

TEST_CASE("missing settings file raises ConfigError", "[config]") {
    CHECK_THROWS_AS(SweepSettings::load("/nonexistent/sweep.json"), ConfigError);
}

TEST_CASE("enumeration nests profile innermost and scheme outermost", "[config]") {
    SweepDimensions dims;
    dims.schemes = {"tf", "boolean"};
    dims.similarities = {"dice"};
    dims.remove_stopwords = {false, true};
    dims.stem = {true};
    dims.weight_profiles = {WeightProfile(1, 1, 1, 1), WeightProfile(1, 0, 0, 0)};

    std::vector<ConfigurationTags> configs = dims.enumerate();
    REQUIRE(configs.size() == 8);

    CHECK(configs[0].scheme == "tf");
    CHECK_FALSE(configs[0].remove_stopwords);
    CHECK(configs[0].profile == WeightProfile(1, 1, 1, 1));
    CHECK(configs[1].profile == WeightProfile(1, 0, 0, 0));
    CHECK(configs[2].remove_stopwords);
    CHECK(configs[4].scheme == "boolean");
    CHECK_FALSE(configs[4].remove_stopwords);
}

TEST_CASE("preprocess keys are distinct pairs", "[config]") {
    SweepDimensions dims = SweepDimensions::defaults();
    dims.stem = {true, true, false};

    std::vector<PreprocessKey> keys = dims.preprocess_keys();
    REQUIRE(keys.size() == 4);
    CHECK_FALSE(keys[0].remove_stopwords);
    CHECK(keys[0].stem);
    CHECK_FALSE(keys[1].stem);

    dims.weight_profiles.clear();
    CHECK(dims.preprocess_keys().empty());
}

TEST_CASE("configurations validate their tags", "[config]") {
    ConfigurationTags tags;
    tags.scheme = "tfidf";
    tags.similarity = "jaccard";
    tags.profile = WeightProfile(1, 2, 3, 4);

    Configuration config = Configuration::from_tags(tags);
    CHECK(config.scheme() == WeightingScheme::Tfidf);
    CHECK(config.similarity() == SimilarityKind::Jaccard);
    CHECK(config.tags().scheme == "tfidf");

    tags.similarity = "euclid";
    CHECK_THROWS_AS(Configuration::from_tags(tags), InvalidConfiguration);

    tags.similarity = "dice";
    tags.profile = WeightProfile(1, 1, -0.5, 1);
    CHECK_THROWS_AS(Configuration::from_tags(tags), InvalidProfile);
}

TEST_CASE("result table header lists the fixed columns", "[results]") {
    CHECK(ResultTable::header_line() ==
          "scheme\tsimilarity\tremoveStopwords\tstem\tw1\tw2\tw3\tw4\t"
          "precision@0.25\tprecision@0.5\tprecision@0.75\tprecision@1.0\t"
          "mean_precision_1\tmean_precision_2\t"
          "precision_normalization\trecall_normalization\tstatus");
}

TEST_CASE("ok rows print metrics with four decimals", "[results]") {
    CHECK(ResultTable::format_row(ok_row()) ==
          "tfidf\tcosine\ttrue\tfalse\t1\t3\t4\t1\t"
          "1.0000\t0.5000\t0.1235\t0.0000\t0.6667\t0.2500\t0.9000\t0.7500\tok");
}

TEST_CASE("failed rows print NA and a single-line reason", "[results]") {
    MetricRow row = ok_row();
    row.status = MetricRow::Status::Failed;
    row.config.scheme = "bm25";
    row.error = "InvalidConfiguration: unknown\tscheme";

    CHECK(ResultTable::format_row(row) ==
          "bm25\tcosine\ttrue\tfalse\t1\t3\t4\t1\t"
          "NA\tNA\tNA\tNA\tNA\tNA\tNA\tNA\tfailed: InvalidConfiguration: unknown scheme");
}

TEST_CASE("tsv output ends every line with a newline", "[results]") {
    std::vector<MetricRow> rows = {ok_row(), ok_row()};
    std::string tsv = ResultTable::to_tsv(rows);

    CHECK(std::count(tsv.begin(), tsv.end(), '\n') == 3);
    CHECK(tsv.back() == '\n');

    json j = ResultTable::to_json(rows);
    REQUIRE(j.size() == 2);
    CHECK(j[0]["status"].get<std::string>() == "ok");
    CHECK(j[0]["evaluated_queries"].get<size_t>() == 2);
}

TEST_CASE("corpus loads documents queries and relevance files", "[corpus]") {
    std::string corpus_path = write_temp_file("permeval_test_corpus.json", R"({
        "documents": [
            {"id": 1, "tokens": ["cat", "sat"]},
            {"id": 2, "tokens": ["dog"]}
        ],
        "queries": [
            {"id": 7, "tokens": ["cat"], "relevant": [1]},
            {"id": 8, "tokens": ["dog"]}
        ]
    })");
    std::string rels_path = write_temp_file("permeval_test_query.rels", "7 2\n\n8 2\n99 1\n");

    Corpus corpus;
    REQUIRE(corpus.load(corpus_path));
    CHECK(corpus.num_documents() == 2);
    CHECK(corpus.num_queries() == 2);

    REQUIRE(corpus.load_relevance(rels_path));
    const Query* q7 = corpus.find_query(7);
    const Query* q8 = corpus.find_query(8);
    REQUIRE(q7 != nullptr);
    REQUIRE(q8 != nullptr);
    CHECK(q7->relevant.size() == 2);
    CHECK(q8->relevant.count(2) == 1);
    CHECK(corpus.find_query(99) == nullptr);

    std::remove(corpus_path.c_str());
    std::remove(rels_path.c_str());
}

TEST_CASE("corpus load reports unreadable input", "[corpus]") {
    std::string bad_path = write_temp_file("permeval_test_bad.json", "{ not json");
    std::string bad_rels = write_temp_file("permeval_test_bad.rels", "7 x\n");

    Corpus corpus;
    CHECK_FALSE(corpus.load("/nonexistent/corpus.json"));
    CHECK_FALSE(corpus.load(bad_path));
    CHECK_FALSE(corpus.load_relevance(bad_rels));

    std::remove(bad_path.c_str());
    std::remove(bad_rels.c_str());
}

TEST_CASE("corpus load rejects duplicate ids", "[corpus]") {
    std::string dup_docs = write_temp_file("permeval_test_dup_docs.json", R"({
        "documents": [
            {"id": 1, "tokens": ["cat"]},
            {"id": 1, "tokens": ["cat"]}
        ],
        "queries": [{"id": 1, "tokens": ["cat"], "relevant": [1]}]
    })");
    std::string dup_queries = write_temp_file("permeval_test_dup_queries.json", R"({
        "documents": [{"id": 1, "tokens": ["cat"]}],
        "queries": [
            {"id": 5, "tokens": ["cat"], "relevant": [1]},
            {"id": 5, "tokens": ["dog"]}
        ]
    })");

    Corpus corpus;
    CHECK_FALSE(corpus.load(dup_docs));
    CHECK(corpus.num_documents() == 0);

    CHECK_FALSE(corpus.load(dup_queries));
    CHECK(corpus.num_queries() == 0);
    CHECK(corpus.find_query(5) == nullptr);

    std::remove(dup_docs.c_str());
    std::remove(dup_queries.c_str());
}
