#pragma once
// Corpus.hpp
// Documents, queries and relevance judgments for one evaluation run
// Loaded once up front and read-only afterwards

#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct Document {
    int doc_id;
    std::vector<std::string> tokens;

    Document() : doc_id(-1) {}
    Document(int id, std::vector<std::string> toks) : doc_id(id), tokens(std::move(toks)) {}
};

struct Query {
    int query_id;
    std::vector<std::string> tokens;
    std::set<int> relevant;     // Relevant doc ids (ground truth)

    Query() : query_id(-1) {}
    Query(int id, std::vector<std::string> toks, std::set<int> rel)
        : query_id(id), tokens(std::move(toks)), relevant(std::move(rel)) {}
};

class Corpus {
public:
    Corpus();
    Corpus(std::vector<Document> documents, std::vector<Query> queries);

    // Load documents and queries from a JSON file
    // Expected format: {"documents": [{"id", "tokens"}], "queries": [{"id", "tokens", "relevant"}]}
    bool load(const std::string& corpus_path);

    // Merge "queryId docId" pairs (one per line) into the query relevance sets
    bool load_relevance(const std::string& rels_path);

    const std::vector<Document>& documents() const { return documents_; }
    const std::vector<Query>& queries() const { return queries_; }

    // Returns nullptr if the query id is unknown
    const Query* find_query(int query_id) const;

    size_t num_documents() const { return documents_.size(); }
    size_t num_queries() const { return queries_.size(); }

private:
    std::vector<Document> documents_;
    std::vector<Query> queries_;
    std::unordered_map<int, size_t> query_index_;   // query_id -> position in queries_

    void rebuild_query_index();
};
