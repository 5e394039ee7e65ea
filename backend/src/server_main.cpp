#include <httplib.h>
#include "SweepSession.hpp"
#include "ResultTable.hpp"
#include "EvaluationErrors.hpp"
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

// Parses "w1,w2,w3,w4"
WeightProfile parse_profile_param(const std::string& text) {
    std::vector<double> values;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, ',')) {
        values.push_back(std::stod(part));
    }
    if (values.size() != 4) {
        throw std::invalid_argument("profile needs 4 comma-separated coefficients");
    }
    return WeightProfile(values[0], values[1], values[2], values[3]);
}

bool parse_flag_param(const std::string& text) {
    return text == "1" || text == "true" || text == "yes";
}

void send_error(httplib::Response& res, int status, const std::string& message) {
    json body;
    body["error"] = message;
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

}

int main(int argc, char* argv[]) {
    std::string config_path = "config/sweep.json";
    int port = 8080;
    if (argc >= 2) config_path = argv[1];
    if (argc >= 3) {
        try {
            port = std::stoi(argv[2]);
        } catch (const std::exception&) {
            std::cerr << "[Server] Invalid port: " << argv[2] << std::endl;
            return 1;
        }
    }

    SweepSettings settings;
    try {
        settings = SweepSettings::load(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "[Server] Error: " << e.what() << std::endl;
        return 1;
    }

    SweepSession session(settings);
    if (!session.is_ready()) {
        return 1;
    }

    // One sweep or explain at a time: the driver's cache is not shared across calls
    std::mutex session_mutex;

    httplib::Server svr;

    svr.set_post_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    svr.Options(".*", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    svr.Get("/api", [&session](const httplib::Request&, httplib::Response& res) {
        json status;
        status["status"] = "ok";
        status["documents"] = session.corpus().num_documents();
        status["queries"] = session.corpus().num_queries();
        status["configurations"] = session.settings().dimensions.size();
        status["columns"] = ResultTable::columns();
        res.set_content(status.dump(2), "application/json");
    });

    // Body: optional JSON object overriding any sweep dimension
    svr.Post("/sweep", [&session, &session_mutex](const httplib::Request& req, httplib::Response& res) {
        SweepDimensions dims = session.settings().dimensions;

        if (!req.body.empty()) {
            try {
                dims.merge_json(json::parse(req.body));
            } catch (const json::parse_error& e) {
                send_error(res, 400, std::string("Invalid JSON body: ") + e.what());
                return;
            } catch (const ConfigError& e) {
                send_error(res, 400, e.what());
                return;
            }
        }

        std::vector<MetricRow> rows;
        {
            std::lock_guard<std::mutex> lock(session_mutex);
            rows = session.run(dims);
        }

        if (req.has_param("format") && req.get_param_value("format") == "json") {
            res.set_content(ResultTable::to_json(rows).dump(2), "application/json");
        } else {
            res.set_content(ResultTable::to_tsv(rows), "text/tab-separated-values");
        }
    });

    svr.Get("/explain", [&session, &session_mutex](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_param("query")) {
            send_error(res, 400, "Missing 'query' parameter");
            return;
        }

        try {
            int query_id = std::stoi(req.get_param_value("query"));

            ConfigurationTags tags;
            tags.scheme = req.has_param("scheme") ? req.get_param_value("scheme") : "tfidf";
            tags.similarity = req.has_param("similarity") ? req.get_param_value("similarity") : "cosine";
            tags.remove_stopwords = req.has_param("stop") && parse_flag_param(req.get_param_value("stop"));
            tags.stem = req.has_param("stem") && parse_flag_param(req.get_param_value("stem"));
            if (req.has_param("profile")) {
                tags.profile = parse_profile_param(req.get_param_value("profile"));
            }

            size_t top_k = 10;
            if (req.has_param("k")) {
                int k = std::stoi(req.get_param_value("k"));
                if (k < 1) k = 1;
                if (k > 100) k = 100;
                top_k = static_cast<size_t>(k);
            }

            Configuration config = Configuration::from_tags(tags);

            std::vector<ExplainedDocument> top;
            {
                std::lock_guard<std::mutex> lock(session_mutex);
                top = session.driver().explain(config, query_id, top_k);
            }

            json body;
            body["query"] = query_id;
            body["scheme"] = tags.scheme;
            body["similarity"] = tags.similarity;
            body["results"] = json::array();
            for (const auto& doc : top) {
                body["results"].push_back({
                    {"docId", doc.doc_id},
                    {"score", doc.score},
                    {"relevant", doc.relevant}
                });
            }
            res.set_content(body.dump(), "application/json");

        } catch (const std::exception& e) {
            send_error(res, 400, e.what());
        }
    });

    svr.Get("/stats", [&session, &session_mutex](const httplib::Request&, httplib::Response& res) {
        SweepWorkerPool::Stats pool_stats;
        size_t cached_pairs = 0;
        {
            std::lock_guard<std::mutex> lock(session_mutex);
            pool_stats = session.driver().last_pool_stats();
            cached_pairs = session.driver().cache().size();
        }

        json stats_json;
        stats_json["worker_pool"] = {
            {"active_workers", pool_stats.active_workers},
            {"queue_size", pool_stats.queue_size},
            {"completed_tasks", pool_stats.completed_tasks},
            {"failed_tasks", pool_stats.failed_tasks}
        };
        stats_json["preprocess_cache_pairs"] = cached_pairs;
        res.set_content(stats_json.dump(2), "application/json");
    });

    std::cout << "======================================" << std::endl;
    std::cout << "   permeval - Evaluation Server" << std::endl;
    std::cout << "======================================" << std::endl;
    std::cout << "API Endpoints:" << std::endl;
    std::cout << "  - GET  /api" << std::endl;
    std::cout << "  - POST /sweep[?format=json]" << std::endl;
    std::cout << "  - GET  /explain?query=<id>&scheme=&similarity=&stop=&stem=&profile=&k=" << std::endl;
    std::cout << "  - GET  /stats" << std::endl;
    std::cout << "======================================" << std::endl;
    std::cout << "Workers per sweep: " << settings.worker_count() << std::endl;
    std::cout << "Listening on port " << port << std::endl;

    if (!svr.listen("0.0.0.0", port)) {
        std::cerr << "[Server] Failed to start server!" << std::endl;
        return 1;
    }

    return 0;
}
