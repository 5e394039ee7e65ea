#include "SweepSession.hpp"
#include "ResultTable.hpp"
#include "EvaluationErrors.hpp"
#include <iomanip>
#include <iostream>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config <path>     Sweep settings JSON (default: config/sweep.json)\n"
              << "  --corpus <path>     Override the corpus file\n"
              << "  --output <path>     Override the output table (default: output.tsv)\n"
              << "  --threads <n>       Worker threads, 0 = all cores\n"
              << "  --explain <query>   Print the top-ranked documents of one query for the\n"
              << "                      first configuration instead of sweeping\n"
              << "  --top <k>           Documents shown by --explain (default: 10)\n";
}

int explain_query(SweepSession& session, int query_id, size_t top_k) {
    std::vector<ConfigurationTags> configs = session.settings().dimensions.enumerate();
    if (configs.empty()) {
        std::cerr << "[Main] Error: the sweep has no configurations\n";
        return 1;
    }

    const ConfigurationTags& tags = configs.front();
    std::vector<ExplainedDocument> top;
    try {
        Configuration config = Configuration::from_tags(tags);
        top = session.driver().explain(config, query_id, top_k);
    } catch (const std::exception& e) {
        std::cerr << "[Main] Error: " << e.what() << "\n";
        return 1;
    }

    const Query* query = session.corpus().find_query(query_id);
    std::cout << "\nQuery " << query_id << " (" << query->relevant.size() << " relevant) under "
              << tags.scheme << "/" << tags.similarity << "\n";
    std::cout << std::string(40, '-') << "\n";
    std::cout << std::left
              << std::setw(8) << "Rank"
              << std::setw(12) << "Doc ID"
              << std::setw(12) << "Score"
              << "Relevant\n";
    std::cout << std::string(40, '-') << "\n";

    for (size_t i = 0; i < top.size(); ++i) {
        std::cout << std::left
                  << std::setw(8) << (i + 1)
                  << std::setw(12) << top[i].doc_id
                  << std::setw(12) << std::fixed << std::setprecision(4) << top[i].score
                  << (top[i].relevant ? "yes" : "") << "\n";
    }
    std::cout << std::string(40, '-') << "\n";
    return 0;
}

}

int main(int argc, char* argv[]) {
    std::string config_path = "config/sweep.json";
    std::string corpus_override;
    std::string output_override;
    long long threads_override = -1;
    int explain_id = -1;
    bool explain = false;
    size_t top_k = 10;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--config" && has_value) {
                config_path = argv[++i];
            } else if (arg == "--corpus" && has_value) {
                corpus_override = argv[++i];
            } else if (arg == "--output" && has_value) {
                output_override = argv[++i];
            } else if (arg == "--threads" && has_value) {
                threads_override = static_cast<long long>(SweepSettings::parse_thread_count(argv[++i]));
            } else if (arg == "--explain" && has_value) {
                explain_id = std::stoi(argv[++i]);
                explain = true;
            } else if (arg == "--top" && has_value) {
                top_k = static_cast<size_t>(std::stoul(argv[++i]));
            } else {
                std::cerr << "[Main] Unknown or incomplete argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[Main] Invalid numeric argument: " << e.what() << "\n";
        return 1;
    }

    SweepSettings settings;
    try {
        settings = SweepSettings::load(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "[Main] Error: " << e.what() << "\n";
        return 1;
    }

    if (!corpus_override.empty()) settings.corpus_path = corpus_override;
    if (!output_override.empty()) settings.output_path = output_override;
    if (threads_override >= 0) settings.threads = static_cast<size_t>(threads_override);

    SweepSession session(settings);
    if (!session.is_ready()) {
        return 1;
    }

    if (explain) {
        return explain_query(session, explain_id, top_k);
    }

    std::vector<MetricRow> rows = session.run();
    if (!ResultTable::save(rows, settings.output_path)) {
        return 1;
    }
    return 0;
}
