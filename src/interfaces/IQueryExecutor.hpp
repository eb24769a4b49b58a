#pragma once

#include <nlohmann/json.hpp>

#include "../models/QueryRequest.hpp"

// Runs a query against the remote database. Throws on failure.
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;
    virtual nlohmann::json execute(const QueryRequest& request) = 0;
};
