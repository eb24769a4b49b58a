#include "FixtureQueryExecutor.hpp"

#include <stdexcept>
#include <utility>

#include "../cache/CacheKeyBuilder.hpp"

FixtureQueryExecutor::FixtureQueryExecutor(std::istream& fixtures, std::shared_ptr<ILogger> logger)
    : logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for FixtureQueryExecutor");
    }

    nlohmann::json document;
    try {
        fixtures >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid fixture JSON: " + std::string(e.what()));
    }
    if (!document.is_object()) {
        throw std::runtime_error("Fixture document must be a JSON object of query -> result");
    }
    for (const auto& item : document.items()) {
        results_[CacheKeyBuilder::normalizeQuery(item.key())] = item.value();
    }
    logger_->setup("Loaded " + std::to_string(results_.size()) + " query fixtures");
}

nlohmann::json FixtureQueryExecutor::execute(const QueryRequest& request) {
    ++execution_count_;
    auto it = results_.find(CacheKeyBuilder::normalizeQuery(request.query));
    if (it == results_.end()) {
        throw std::out_of_range("No recorded result for query: " + request.query);
    }
    return it->second;
}
