#ifndef FIXTUREQUERYEXECUTOR_HPP
#define FIXTUREQUERYEXECUTOR_HPP

#include <atomic>
#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IQueryExecutor.hpp"

// Answers queries from recorded results instead of a live database.
// The fixture document maps query text to its result:
//   {"select * from cpu": {"rows": [1, 2, 3]}, ...}
// Lookups use the same normalization as the cache key (trim + lower case).
class FixtureQueryExecutor : public IQueryExecutor {
public:
    // Throws std::runtime_error when the fixture is not a JSON object.
    FixtureQueryExecutor(std::istream& fixtures, std::shared_ptr<ILogger> logger);

    // Throws std::out_of_range for a query without a recorded result.
    nlohmann::json execute(const QueryRequest& request) override;

    std::uint64_t executionCount() const { return execution_count_; }
    std::size_t fixtureCount() const { return results_.size(); }

private:
    std::map<std::string, nlohmann::json> results_;
    std::shared_ptr<ILogger> logger_;
    std::atomic<std::uint64_t> execution_count_{0};
};

#endif // FIXTUREQUERYEXECUTOR_HPP
