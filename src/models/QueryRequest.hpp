#ifndef QUERYREQUEST_HPP
#define QUERYREQUEST_HPP

#include <chrono>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

// --- One query as issued by the query-execution path ---
class QueryRequest {
public:
    std::string connection_id;
    std::string query;
    std::optional<std::string> database;
    nlohmann::json params = nullptr; // Object of named parameters, or null
    std::optional<std::chrono::milliseconds> ttl;

    std::string to_string() const {
        std::ostringstream oss;
        oss << "QueryRequest {\n";
        oss << "  Connection: " << connection_id << "\n";
        oss << "  Query: " << query << "\n";
        if (database) {
            oss << "  Database: " << *database << "\n";
        }
        if (!params.is_null()) {
            oss << "  Params: " << params.dump() << "\n";
        }
        if (ttl) {
            oss << "  TTL (ms): " << ttl->count() << "\n";
        }
        oss << "}";
        return oss.str();
    }
};

#endif // QUERYREQUEST_HPP
