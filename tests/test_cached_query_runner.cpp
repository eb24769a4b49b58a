// tests/test_cached_query_runner.cpp
#include <chrono>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "mocks/Mocks.hpp"
#include "../src/cache/QueryCache.hpp"
#include "../src/config/AppConfig.hpp"
#include "../src/core/CachedQueryRunner.hpp"
#include "../src/core/FixtureQueryExecutor.hpp"

using json = nlohmann::json;
using ::testing::_;
using ::testing::Eq;
using ::testing::Field;
using ::testing::NiceMock;
using ::testing::Optional;
using ::testing::Return;
using ::testing::Throw;

class CachedQueryRunnerTest : public ::testing::Test {
protected:
    std::shared_ptr<MockQueryCache> mock_cache_ = std::make_shared<MockQueryCache>();
    std::shared_ptr<MockQueryExecutor> mock_executor_ = std::make_shared<MockQueryExecutor>();
    std::shared_ptr<NiceMock<MockStatsDClient>> mock_statsd_ = std::make_shared<NiceMock<MockStatsDClient>>();
    std::shared_ptr<NiceMock<MockLogger>> mock_logger_ = std::make_shared<NiceMock<MockLogger>>();

    static QueryRequest makeRequest() {
        QueryRequest request;
        request.connection_id = "conn1";
        request.query = "SELECT * FROM cpu";
        request.database = "mydb";
        request.params = {{"limit", 10}};
        request.ttl = std::chrono::milliseconds(500);
        return request;
    }
};

TEST_F(CachedQueryRunnerTest, CacheHitSkipsExecutor) {
    CachedQueryRunner runner(mock_cache_, mock_executor_, mock_statsd_, mock_logger_);
    QueryRequest request = makeRequest();
    json cached = {{"rows", {1, 2, 3}}};

    EXPECT_CALL(*mock_cache_, get("conn1", "SELECT * FROM cpu", Optional(std::string("mydb")), request.params))
        .WillOnce(Return(std::optional<json>(cached)));
    EXPECT_CALL(*mock_executor_, execute(_)).Times(0);
    EXPECT_CALL(*mock_cache_, set(_, _, _, _, _, _)).Times(0);

    QueryResult result = runner.run(request);
    EXPECT_TRUE(result.from_cache);
    EXPECT_EQ(result.value, cached);
}

TEST_F(CachedQueryRunnerTest, CacheMissExecutesAndWritesBack) {
    CachedQueryRunner runner(mock_cache_, mock_executor_, mock_statsd_, mock_logger_);
    QueryRequest request = makeRequest();
    json fresh = {{"rows", {4, 5}}};

    EXPECT_CALL(*mock_cache_, get(_, _, _, _)).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*mock_executor_, execute(Field(&QueryRequest::query, Eq("SELECT * FROM cpu"))))
        .WillOnce(Return(fresh));
    EXPECT_CALL(*mock_cache_, set("conn1", "SELECT * FROM cpu", fresh, Optional(std::string("mydb")), request.params,
                                  Optional(std::chrono::milliseconds(500))))
        .Times(1);
    EXPECT_CALL(*mock_statsd_, increment(MetricsDefinitions::QUERY_EXECUTED, 1)).Times(1);

    QueryResult result = runner.run(request);
    EXPECT_FALSE(result.from_cache);
    EXPECT_EQ(result.value, fresh);
}

TEST_F(CachedQueryRunnerTest, ExecutorFailurePropagatesAndIsNotCached) {
    CachedQueryRunner runner(mock_cache_, mock_executor_, mock_statsd_, mock_logger_);

    EXPECT_CALL(*mock_cache_, get(_, _, _, _)).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*mock_executor_, execute(_)).WillOnce(Throw(std::runtime_error("connection refused")));
    EXPECT_CALL(*mock_cache_, set(_, _, _, _, _, _)).Times(0);
    EXPECT_CALL(*mock_statsd_, increment(MetricsDefinitions::QUERY_FAILED, 1)).Times(1);

    EXPECT_THROW(runner.run(makeRequest()), std::runtime_error);
}

TEST_F(CachedQueryRunnerTest, NullResultIsReturnedButNotCached) {
    CachedQueryRunner runner(mock_cache_, mock_executor_, mock_statsd_, mock_logger_);

    EXPECT_CALL(*mock_cache_, get(_, _, _, _)).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*mock_executor_, execute(_)).WillOnce(Return(json(nullptr)));
    EXPECT_CALL(*mock_cache_, set(_, _, _, _, _, _)).Times(0);

    QueryResult result = runner.run(makeRequest());
    EXPECT_FALSE(result.from_cache);
    EXPECT_TRUE(result.value.is_null());
}

TEST_F(CachedQueryRunnerTest, InvalidateConnectionClearsOnlyThatConnection) {
    CachedQueryRunner runner(mock_cache_, mock_executor_, mock_statsd_, mock_logger_);
    EXPECT_CALL(*mock_cache_, clearByConnection("conn7")).WillOnce(Return(3u));
    EXPECT_EQ(runner.invalidateConnection("conn7"), 3u);
}

TEST_F(CachedQueryRunnerTest, ConstructorRejectsNullCollaborators) {
    EXPECT_THROW(std::make_unique<CachedQueryRunner>(nullptr, mock_executor_, mock_statsd_, mock_logger_), std::invalid_argument);
    EXPECT_THROW(std::make_unique<CachedQueryRunner>(mock_cache_, nullptr, mock_statsd_, mock_logger_), std::invalid_argument);
    EXPECT_THROW(std::make_unique<CachedQueryRunner>(mock_cache_, mock_executor_, nullptr, mock_logger_), std::invalid_argument);
    EXPECT_THROW(std::make_unique<CachedQueryRunner>(mock_cache_, mock_executor_, mock_statsd_, nullptr), std::invalid_argument);
}

// --- Runner over a real cache and recorded results ---
TEST(CachedQueryRunnerIntegrationTest, SecondIdenticalQueryIsServedFromCache) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    auto statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    boost::asio::io_context ioc; // Janitor never fires: nothing runs this context

    std::istringstream fixtures(R"({"SELECT * FROM cpu": {"rows": [1, 2, 3]}})");
    auto executor = std::make_shared<FixtureQueryExecutor>(fixtures, logger);
    CacheConfig config;
    auto cache = std::make_shared<QueryCache>(ioc, config, statsd, logger);
    CachedQueryRunner runner(cache, executor, statsd, logger);

    QueryRequest request;
    request.connection_id = "conn1";
    request.query = "SELECT * FROM cpu";
    request.database = "mydb";

    QueryResult first = runner.run(request);
    request.query = "select * from cpu "; // Same query after normalization
    QueryResult second = runner.run(request);

    EXPECT_FALSE(first.from_cache);
    EXPECT_TRUE(second.from_cache);
    EXPECT_EQ(first.value, second.value);
    EXPECT_EQ(executor->executionCount(), 1u);

    EXPECT_EQ(runner.invalidateConnection("conn1"), 1u);
    QueryResult third = runner.run(request);
    EXPECT_FALSE(third.from_cache);
    EXPECT_EQ(executor->executionCount(), 2u);

    CacheStats stats = cache->stats();
    EXPECT_EQ(stats.total_hits, 1u);
    EXPECT_EQ(stats.total_misses, 2u);
}
