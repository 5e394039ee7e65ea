#pragma once
// ResultTable.hpp
// Renders sweep rows as the tab-separated results table (output.tsv)
//
// Column order is fixed: scheme, similarity, removeStopwords, stem, w1..w4,
// the eight metrics, then status. Metrics have 4 decimals; rows that did not
// evaluate print NA in the metric columns.

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Configuration.hpp"

using json = nlohmann::json;

class ResultTable {
public:
    static const std::vector<std::string>& columns();

    static std::string header_line();
    static std::string format_row(const MetricRow& row);

    // Header plus one line per row, each terminated by '\n'
    static std::string to_tsv(const std::vector<MetricRow>& rows);

    static json to_json(const std::vector<MetricRow>& rows);

    // Write through a temporary file and rename it into place
    static bool save(const std::vector<MetricRow>& rows, const std::string& output_path);
};
