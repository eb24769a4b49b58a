#ifndef CACHEDQUERYRUNNER_HPP
#define CACHEDQUERYRUNNER_HPP

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IQueryExecutor.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../interfaces/QueryCacheInterface.hpp"
#include "../models/QueryRequest.hpp"

struct QueryResult {
    nlohmann::json value;
    bool from_cache = false;
};

// Query path with the cache in front of the executor:
// look up, execute on miss, write the result back.
class CachedQueryRunner {
public:
    CachedQueryRunner(std::shared_ptr<QueryCacheInterface> cache,
                      std::shared_ptr<IQueryExecutor> executor,
                      std::shared_ptr<IStatsDClient> statsd_client,
                      std::shared_ptr<ILogger> logger);

    CachedQueryRunner(const CachedQueryRunner&) = delete;
    CachedQueryRunner& operator=(const CachedQueryRunner&) = delete;

    // Executor exceptions propagate and nothing is cached for the request.
    // Null results are returned but not cached.
    QueryResult run(const QueryRequest& request);

    // Called when a connection is closed or reset.
    std::size_t invalidateConnection(const std::string& connection_id);

private:
    std::shared_ptr<QueryCacheInterface> cache_;
    std::shared_ptr<IQueryExecutor> executor_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<ILogger> logger_;
};

#endif // CACHEDQUERYRUNNER_HPP
