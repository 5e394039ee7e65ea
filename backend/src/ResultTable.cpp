#include "ResultTable.hpp"
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <locale>
#include <sstream>

namespace {

std::string format_weight(double value) {
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << value;
    return ss.str();
}

std::string format_metric(double value) {
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::fixed << std::setprecision(4) << value;
    return ss.str();
}

// Tabs and newlines inside an error message would break the table
std::string sanitize(std::string text) {
    for (char& c : text) {
        if (c == '\t' || c == '\n' || c == '\r') c = ' ';
    }
    return text;
}

}

const std::vector<std::string>& ResultTable::columns() {
    static const std::vector<std::string> cols = {
        "scheme", "similarity", "removeStopwords", "stem",
        "w1", "w2", "w3", "w4",
        "precision@0.25", "precision@0.5", "precision@0.75", "precision@1.0",
        "mean_precision_1", "mean_precision_2",
        "precision_normalization", "recall_normalization",
        "status"
    };
    return cols;
}

std::string ResultTable::header_line() {
    std::string line;
    const auto& cols = columns();
    for (size_t i = 0; i < cols.size(); ++i) {
        if (i > 0) line += '\t';
        line += cols[i];
    }
    return line;
}

std::string ResultTable::format_row(const MetricRow& row) {
    const ConfigurationTags& c = row.config;
    std::vector<std::string> cells = {
        sanitize(c.scheme),
        sanitize(c.similarity),
        c.remove_stopwords ? "true" : "false",
        c.stem ? "true" : "false",
        format_weight(c.profile.w1),
        format_weight(c.profile.w2),
        format_weight(c.profile.w3),
        format_weight(c.profile.w4)
    };

    if (row.status == MetricRow::Status::Ok) {
        const QueryMetrics& m = row.metrics;
        cells.push_back(format_metric(m.precision_at_025));
        cells.push_back(format_metric(m.precision_at_05));
        cells.push_back(format_metric(m.precision_at_075));
        cells.push_back(format_metric(m.precision_at_1));
        cells.push_back(format_metric(m.mean_precision_1));
        cells.push_back(format_metric(m.mean_precision_2));
        cells.push_back(format_metric(m.precision_normalization));
        cells.push_back(format_metric(m.recall_normalization));
    } else {
        for (int i = 0; i < 8; ++i) cells.push_back("NA");
    }
    cells.push_back(sanitize(row.status_text()));

    std::string line;
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) line += '\t';
        line += cells[i];
    }
    return line;
}

std::string ResultTable::to_tsv(const std::vector<MetricRow>& rows) {
    std::string out = header_line() + "\n";
    for (const auto& row : rows) {
        out += format_row(row);
        out += '\n';
    }
    return out;
}

json ResultTable::to_json(const std::vector<MetricRow>& rows) {
    json result = json::array();
    for (const auto& row : rows) {
        const ConfigurationTags& c = row.config;
        json item;
        item["scheme"] = c.scheme;
        item["similarity"] = c.similarity;
        item["removeStopwords"] = c.remove_stopwords;
        item["stem"] = c.stem;
        item["weights"] = {c.profile.w1, c.profile.w2, c.profile.w3, c.profile.w4};
        item["status"] = row.status_text();
        item["evaluated_queries"] = row.evaluated_queries;

        if (row.status == MetricRow::Status::Ok) {
            const QueryMetrics& m = row.metrics;
            item["precision@0.25"] = m.precision_at_025;
            item["precision@0.5"] = m.precision_at_05;
            item["precision@0.75"] = m.precision_at_075;
            item["precision@1.0"] = m.precision_at_1;
            item["mean_precision_1"] = m.mean_precision_1;
            item["mean_precision_2"] = m.mean_precision_2;
            item["precision_normalization"] = m.precision_normalization;
            item["recall_normalization"] = m.recall_normalization;
        }
        result.push_back(item);
    }
    return result;
}

bool ResultTable::save(const std::vector<MetricRow>& rows, const std::string& output_path) {
    std::string temp_path = output_path + ".tmp";
    std::ofstream out(temp_path, std::ios::trunc | std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "[Results] Error: Could not open file for writing: " << temp_path << std::endl;
        return false;
    }

    out << to_tsv(rows);
    out.flush();

    if (!out.good()) {
        std::cerr << "[Results] Error: Write failed for: " << temp_path << std::endl;
        out.close();
        return false;
    }

    out.close();

    if (std::rename(temp_path.c_str(), output_path.c_str()) != 0) {
        std::cerr << "[Results] Error: Could not rename temp file to " << output_path << std::endl;
        return false;
    }

    std::cout << "[Results] Wrote " << rows.size() << " rows to " << output_path << std::endl;
    return true;
}
