#include "Corpus.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <unordered_set>

Corpus::Corpus() {}

Corpus::Corpus(std::vector<Document> documents, std::vector<Query> queries)
    : documents_(std::move(documents)), queries_(std::move(queries)) {
    rebuild_query_index();
}

bool Corpus::load(const std::string& corpus_path) {
    std::ifstream in(corpus_path);
    if (!in.is_open()) {
        std::cerr << "[Corpus] Error: Could not open corpus file: " << corpus_path << std::endl;
        return false;
    }

    try {
        json j;
        in >> j;

        documents_.clear();
        queries_.clear();

        std::unordered_set<int> doc_ids;
        std::unordered_set<int> query_ids;

        if (j.contains("documents") && j["documents"].is_array()) {
            for (auto& item : j["documents"]) {
                Document doc;
                doc.doc_id = item.at("id").get<int>();
                if (!doc_ids.insert(doc.doc_id).second) {
                    std::cerr << "[Corpus] Error: Duplicate document id " << doc.doc_id
                              << " in " << corpus_path << std::endl;
                    documents_.clear();
                    rebuild_query_index();
                    return false;
                }
                if (item.contains("tokens")) {
                    doc.tokens = item["tokens"].get<std::vector<std::string>>();
                }
                documents_.push_back(std::move(doc));
            }
        }

        if (j.contains("queries") && j["queries"].is_array()) {
            for (auto& item : j["queries"]) {
                Query query;
                query.query_id = item.at("id").get<int>();
                if (!query_ids.insert(query.query_id).second) {
                    std::cerr << "[Corpus] Error: Duplicate query id " << query.query_id
                              << " in " << corpus_path << std::endl;
                    documents_.clear();
                    queries_.clear();
                    rebuild_query_index();
                    return false;
                }
                if (item.contains("tokens")) {
                    query.tokens = item["tokens"].get<std::vector<std::string>>();
                }
                if (item.contains("relevant") && item["relevant"].is_array()) {
                    for (auto& rel : item["relevant"]) {
                        query.relevant.insert(rel.get<int>());
                    }
                }
                queries_.push_back(std::move(query));
            }
        }

        rebuild_query_index();

        std::cout << "[Corpus] Loaded " << documents_.size() << " documents and "
                  << queries_.size() << " queries" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[Corpus] Error parsing corpus file: " << e.what() << std::endl;
        return false;
    }
}

bool Corpus::load_relevance(const std::string& rels_path) {
    std::ifstream in(rels_path);
    if (!in.is_open()) {
        std::cerr << "[Corpus] Error: Could not open relevance file: " << rels_path << std::endl;
        return false;
    }

    int pairs_loaded = 0;
    int unknown_queries = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

        std::istringstream ss(line);
        int query_id;
        int doc_id;
        if (!(ss >> query_id >> doc_id)) {
            std::cerr << "[Corpus] Error: Malformed relevance line: " << line << std::endl;
            return false;
        }

        auto it = query_index_.find(query_id);
        if (it == query_index_.end()) {
            unknown_queries++;
            continue;
        }
        queries_[it->second].relevant.insert(doc_id);
        pairs_loaded++;
    }

    std::cout << "[Corpus] Loaded " << pairs_loaded << " relevance judgments" << std::endl;
    if (unknown_queries > 0) {
        std::cerr << "[Corpus] Warning: " << unknown_queries
                  << " judgments reference unknown queries" << std::endl;
    }
    return true;
}

const Query* Corpus::find_query(int query_id) const {
    auto it = query_index_.find(query_id);
    if (it == query_index_.end()) {
        return nullptr;
    }
    return &queries_[it->second];
}

void Corpus::rebuild_query_index() {
    query_index_.clear();
    for (size_t i = 0; i < queries_.size(); ++i) {
        query_index_[queries_[i].query_id] = i;
    }
}
