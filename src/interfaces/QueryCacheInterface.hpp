#ifndef QUERYCACHEINTERFACE_HPP
#define QUERYCACHEINTERFACE_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../config/CacheConfig.hpp"
#include "../models/CacheStats.hpp"

// Key-based access to cached query results. Callers never see entries directly.
class QueryCacheInterface {
public:
    virtual ~QueryCacheInterface() = default;

    virtual std::optional<nlohmann::json> get(const std::string& connection_id,
                                              const std::string& query,
                                              const std::optional<std::string>& database = std::nullopt,
                                              const nlohmann::json& params = nullptr) = 0;

    virtual void set(const std::string& connection_id,
                     const std::string& query,
                     const nlohmann::json& value,
                     const std::optional<std::string>& database = std::nullopt,
                     const nlohmann::json& params = nullptr,
                     std::optional<std::chrono::milliseconds> ttl = std::nullopt) = 0;

    virtual void clearAll() = 0;
    virtual std::size_t clearByConnection(const std::string& connection_id) = 0;
    virtual CacheStats stats() = 0;
    virtual void configure(const CacheConfigUpdate& update) = 0;
};

#endif // QUERYCACHEINTERFACE_HPP
