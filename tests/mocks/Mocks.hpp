// tests/mocks/Mocks.hpp
#ifndef TEST_MOCKS_HPP
#define TEST_MOCKS_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "gmock/gmock.h"

#include "../../src/interfaces/ILogger.hpp"
#include "../../src/interfaces/IQueryExecutor.hpp"
#include "../../src/interfaces/IStatsDClient.hpp"
#include "../../src/interfaces/QueryCacheInterface.hpp"

// Mock class for StatsDClient
class MockStatsDClient : public IStatsDClient {
public:
    MOCK_METHOD(void, increment, (const std::string& key, int value), (override));
    MOCK_METHOD(void, decrement, (const std::string& key, int value), (override));
    MOCK_METHOD(void, gauge, (const std::string& key, double value), (override));
    MOCK_METHOD(void, timing, (const std::string& key, std::chrono::microseconds value), (override));
    MOCK_METHOD(void, set, (const std::string& key, const std::string& value), (override));
};

// --- Mock Logger ---
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, setup, (const std::string& message), (override));
    MOCK_METHOD(int, getLogLevel, (), (const, override));
};

// --- Mock Cache ---
class MockQueryCache : public QueryCacheInterface {
public:
    MOCK_METHOD(std::optional<nlohmann::json>, get,
                (const std::string& connection_id, const std::string& query,
                 const std::optional<std::string>& database, const nlohmann::json& params),
                (override));
    MOCK_METHOD(void, set,
                (const std::string& connection_id, const std::string& query, const nlohmann::json& value,
                 const std::optional<std::string>& database, const nlohmann::json& params,
                 std::optional<std::chrono::milliseconds> ttl),
                (override));
    MOCK_METHOD(void, clearAll, (), (override));
    MOCK_METHOD(std::size_t, clearByConnection, (const std::string& connection_id), (override));
    MOCK_METHOD(CacheStats, stats, (), (override));
    MOCK_METHOD(void, configure, (const CacheConfigUpdate& update), (override));
};

// --- Mock Executor ---
class MockQueryExecutor : public IQueryExecutor {
public:
    MOCK_METHOD(nlohmann::json, execute, (const QueryRequest& request), (override));
};

#endif // TEST_MOCKS_HPP
