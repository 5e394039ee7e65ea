#include <catch2/catch.hpp>
#include "MetricEvaluator.hpp"
#include <cmath>

namespace {

// Ranking in the given order with strictly decreasing scores
RankedList make_ranking(const std::vector<int>& doc_ids) {
    RankedList ranking;
    double score = 1.0;
    for (int id : doc_ids) {
        ranking.push_back({id, score});
        score -= 0.1;
    }
    return ranking;
}

}

TEST_CASE("ranking sorts by score and breaks ties by doc id", "[metrics]") {
    MetricEvaluator evaluator;
    WeightVector query = {{"cat", 1.0}};
    std::vector<int> ids = {3, 1, 2, 7};
    std::vector<WeightVector> docs = {
        {{"cat", 1.0}},
        {{"cat", 1.0}},
        {{"dog", 1.0}},
        {{"cat", 1.0}, {"dog", 1.0}}
    };

    RankedList ranking = evaluator.rank(query, ids, docs, SimilarityKind::Jaccard);

    REQUIRE(ranking.size() == 4);
    CHECK(ranking[0].doc_id == 1);
    CHECK(ranking[1].doc_id == 3);
    CHECK(ranking[2].doc_id == 7);
    CHECK(ranking[3].doc_id == 2);
    CHECK(ranking[2].score == Approx(0.5));
    CHECK(ranking[3].score == 0.0);
}

TEST_CASE("recall-level precision is interpolated", "[metrics]") {
    MetricEvaluator evaluator;
    RankedList ranking = make_ranking({1, 2, 3, 4, 5});
    std::set<int> relevant = {1, 3, 5};

    // Relevant at ranks 1, 3, 5: precisions 1, 2/3, 3/5
    CHECK(evaluator.precision_at_recall(0.25, ranking, relevant) == Approx(1.0));
    CHECK(evaluator.precision_at_recall(0.5, ranking, relevant) == Approx(2.0 / 3.0));
    CHECK(evaluator.precision_at_recall(0.75, ranking, relevant) == Approx(0.6));
    CHECK(evaluator.precision_at_recall(1.0, ranking, relevant) == Approx(0.6));
}

TEST_CASE("interpolation takes the best precision at or beyond the recall level", "[metrics]") {
    MetricEvaluator evaluator;
    // Relevant at ranks 2 and 3: precisions 1/2 then 2/3
    RankedList ranking = make_ranking({9, 1, 2, 8});
    std::set<int> relevant = {1, 2};

    CHECK(evaluator.precision_at_recall(0.5, ranking, relevant) == Approx(2.0 / 3.0));
    CHECK(evaluator.precision_at_recall(1.0, ranking, relevant) == Approx(2.0 / 3.0));
}

TEST_CASE("unreachable recall levels have precision 0", "[metrics]") {
    MetricEvaluator evaluator;
    RankedList ranking = make_ranking({1, 2, 3, 4, 5});
    std::set<int> relevant = {1, 99};

    CHECK(evaluator.precision_at_recall(0.5, ranking, relevant) == Approx(1.0));
    CHECK(evaluator.precision_at_recall(0.75, ranking, relevant) == 0.0);
    CHECK(evaluator.precision_at_recall(1.0, ranking, relevant) == 0.0);
    CHECK(evaluator.average_precision(ranking, relevant) == Approx(0.5));
}

TEST_CASE("the two mean precisions use different averaging", "[metrics]") {
    MetricEvaluator evaluator;
    Query query(1, {"q"}, {1, 3, 5});
    QueryMetrics m;

    REQUIRE(evaluator.evaluate(query, make_ranking({1, 2, 3, 4, 5}), m));

    CHECK(m.mean_precision_1 == Approx((1.0 + 2.0 / 3.0 + 0.6 + 0.6) / 4.0));
    CHECK(m.mean_precision_2 == Approx((1.0 + 2.0 / 3.0 + 0.6) / 3.0));
    CHECK(m.mean_precision_1 != Approx(m.mean_precision_2));
}

TEST_CASE("normalized recall and precision follow rank displacement", "[metrics]") {
    MetricEvaluator evaluator;
    RankedList ranking = make_ranking({1, 2, 3, 4, 5});

    SECTION("ideal ranking") {
        std::set<int> relevant = {1, 2};
        CHECK(evaluator.normalized_recall(ranking, relevant) == Approx(1.0));
        CHECK(evaluator.normalized_precision(ranking, relevant) == Approx(1.0));
    }

    SECTION("worst ranking") {
        std::set<int> relevant = {4, 5};
        CHECK(evaluator.normalized_recall(ranking, relevant) == Approx(0.0).margin(1e-12));
        CHECK(evaluator.normalized_precision(ranking, relevant) == Approx(0.0).margin(1e-12));
    }

    SECTION("in between") {
        std::set<int> relevant = {1, 3, 5};
        // (9 - 6) / (3 * 2)
        CHECK(evaluator.normalized_recall(ranking, relevant) == Approx(0.5));
        // 1 - ln(15 / 6) / ln(C(5, 3))
        CHECK(evaluator.normalized_precision(ranking, relevant) == Approx(1.0 - std::log(2.5) / std::log(10.0)));
    }

    SECTION("every document relevant") {
        std::set<int> relevant = {1, 2, 3, 4, 5};
        CHECK(evaluator.normalized_recall(ranking, relevant) == 1.0);
        CHECK(evaluator.normalized_precision(ranking, relevant) == 1.0);
    }

    SECTION("no relevant document ranked") {
        std::set<int> relevant = {42};
        CHECK(evaluator.normalized_recall(ranking, relevant) == 0.0);
        CHECK(evaluator.normalized_precision(ranking, relevant) == 0.0);
    }
}

TEST_CASE("a query without judgments is not evaluated", "[metrics]") {
    MetricEvaluator evaluator;
    Query query(1, {"q"}, {});
    QueryMetrics m;
    m.mean_precision_2 = 0.42;

    CHECK_FALSE(evaluator.evaluate(query, make_ranking({1, 2}), m));
    CHECK(m.mean_precision_2 == 0.42);
}

TEST_CASE("aggregation averages per metric", "[metrics]") {
    MetricAggregator aggregator;
    CHECK(aggregator.count() == 0);
    CHECK(aggregator.mean().precision_at_1 == 0.0);

    QueryMetrics a;
    a.precision_at_025 = 1.0;
    a.recall_normalization = 0.5;
    QueryMetrics b;
    b.precision_at_025 = 0.5;
    b.recall_normalization = 0.0;

    aggregator.add(a);
    aggregator.add(b);

    QueryMetrics avg = aggregator.mean();
    CHECK(aggregator.count() == 2);
    CHECK(avg.precision_at_025 == Approx(0.75));
    CHECK(avg.recall_normalization == Approx(0.25));
    CHECK(avg.mean_precision_1 == 0.0);
}
