#include "CachedQueryRunner.hpp"

#include <stdexcept>
#include <utility>

#include "../config/AppConfig.hpp"

CachedQueryRunner::CachedQueryRunner(std::shared_ptr<QueryCacheInterface> cache,
                                     std::shared_ptr<IQueryExecutor> executor,
                                     std::shared_ptr<IStatsDClient> statsd_client,
                                     std::shared_ptr<ILogger> logger)
    : cache_(std::move(cache)),
      executor_(std::move(executor)),
      statsd_client_(std::move(statsd_client)),
      logger_(std::move(logger)) {
    if (!cache_) {
        throw std::invalid_argument("Cache pointer cannot be null");
    }
    if (!executor_) {
        throw std::invalid_argument("Query executor pointer cannot be null");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
}

QueryResult CachedQueryRunner::run(const QueryRequest& request) {
    // --- Check Cache ---
    if (auto cached = cache_->get(request.connection_id, request.query, request.database, request.params)) {
        return QueryResult{std::move(*cached), true};
    }

    // --- Execute against the database ---
    nlohmann::json result;
    try {
        result = executor_->execute(request);
    } catch (const std::exception& e) {
        statsd_client_->increment(MetricsDefinitions::QUERY_FAILED);
        logger_->warn("Query failed on connection " + request.connection_id + ": " + e.what());
        throw;
    }
    statsd_client_->increment(MetricsDefinitions::QUERY_EXECUTED);

    // --- Write back ---
    if (result.is_null()) {
        logger_->debug("Not caching null result for connection " + request.connection_id);
    } else {
        cache_->set(request.connection_id, request.query, result, request.database, request.params, request.ttl);
    }
    return QueryResult{std::move(result), false};
}

std::size_t CachedQueryRunner::invalidateConnection(const std::string& connection_id) {
    return cache_->clearByConnection(connection_id);
}
