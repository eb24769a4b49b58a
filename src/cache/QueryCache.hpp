#ifndef QUERYCACHE_HPP
#define QUERYCACHE_HPP

#include <chrono>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "CacheJanitor.hpp"
#include "CacheStatsTracker.hpp"
#include "../config/CacheConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../interfaces/QueryCacheInterface.hpp"
#include "../models/CacheEntry.hpp"

namespace net = boost::asio;

// Bounded, TTL-aware cache of query results.
//
// Two bounds are enforced on insertion: total estimated bytes and entry count.
// When either would be exceeded, expired entries are purged first, then least
// recently used entries are evicted one at a time. A single value larger than the
// byte bound is still accepted once the store has been emptied.
//
// A CacheJanitor on the supplied io_context purges expired entries every
// janitor_interval; get() also drops an expired entry it runs into.
//
// All state sits behind one mutex. get() mutates recency metadata, so it takes it
// exclusively like every other call.
//
// After destroy() (also run by the destructor) every call is a no-op: get()
// returns std::nullopt without touching the stats and stats() is all zeroes.
class QueryCache : public QueryCacheInterface {
public:
    QueryCache(net::io_context& ioc,
               const CacheConfig& config,
               std::shared_ptr<IStatsDClient> statsd_client,
               std::shared_ptr<ILogger> logger);
    ~QueryCache() override;

    QueryCache(const QueryCache&) = delete;
    QueryCache& operator=(const QueryCache&) = delete;
    QueryCache(QueryCache&&) = delete;
    QueryCache& operator=(QueryCache&&) = delete;

    std::optional<nlohmann::json> get(const std::string& connection_id,
                                      const std::string& query,
                                      const std::optional<std::string>& database = std::nullopt,
                                      const nlohmann::json& params = nullptr) override;

    // Replaces any entry with the same key. ttl <= 0 or unset means default_ttl.
    void set(const std::string& connection_id,
             const std::string& query,
             const nlohmann::json& value,
             const std::optional<std::string>& database = std::nullopt,
             const nlohmann::json& params = nullptr,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt) override;

    // Drops every entry and resets the stats.
    void clearAll() override;
    // Drops the entries of one connection; stats are kept. Returns the number removed.
    std::size_t clearByConnection(const std::string& connection_id) override;
    CacheStats stats() override;
    void configure(const CacheConfigUpdate& update) override;

    CacheConfig getConfig() const;
    // Interval the janitor is currently armed with.
    std::chrono::milliseconds janitorInterval() const;
    void resetStats();
    // Removes expired entries now. Returns the number removed.
    std::size_t sweepExpired();
    void destroy();
    bool isDestroyed() const;

    // Serialized length of value. Values that cannot be serialized (invalid UTF-8)
    // are estimated at twice the length of a lossy serialization.
    static std::size_t estimateSize(const nlohmann::json& value, bool* used_fallback = nullptr);

private:
    using LruList = std::list<std::string>;

    struct StoredEntry {
        CacheEntry entry;
        LruList::iterator lru_position; // front = most recently used
    };
    using EntryMap = std::unordered_map<std::string, StoredEntry>;

    EntryMap::iterator eraseLocked(EntryMap::iterator it);
    std::size_t removeExpiredLocked(std::chrono::steady_clock::time_point now);
    bool evictLeastRecentlyUsedLocked();
    bool fitsLocked(std::size_t required_bytes, std::size_t incoming_entries) const;
    void ensureSpaceLocked(std::size_t required_bytes, std::size_t incoming_entries);
    void publishGaugesLocked();

    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<CacheJanitor> janitor_;

    // Taken before mutex_, never while holding it.
    std::mutex configure_mutex_;
    mutable std::mutex mutex_;
    CacheConfig config_;
    EntryMap entries_;
    LruList lru_list_;
    std::size_t total_size_ = 0;
    CacheStatsTracker stats_;
    bool destroyed_ = false;
};

#endif // QUERYCACHE_HPP
