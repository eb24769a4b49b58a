#include "QueryCache.hpp"

#include <stdexcept>
#include <utility>

#include "CacheKeyBuilder.hpp"
#include "../config/AppConfig.hpp"

using namespace std::chrono;

namespace {
    std::string queryPrefix(const std::string& query) {
        return query.substr(0, Constants::LOGGED_QUERY_PREFIX);
    }
}

QueryCache::QueryCache(net::io_context& ioc,
                       const CacheConfig& config,
                       std::shared_ptr<IStatsDClient> statsd_client,
                       std::shared_ptr<ILogger> logger)
    : statsd_client_(std::move(statsd_client)),
      logger_(std::move(logger)),
      config_(config) {
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (config_.max_entry_count == 0) {
        throw std::invalid_argument("CacheConfig.max_entry_count must be positive");
    }
    if (config_.default_ttl <= milliseconds::zero()) {
        throw std::invalid_argument("CacheConfig.default_ttl must be positive");
    }
    if (config_.janitor_interval <= milliseconds::zero()) {
        throw std::invalid_argument("CacheConfig.janitor_interval must be positive");
    }

    // The janitor never outlives the callback target: destroy() stops it first.
    janitor_ = CacheJanitor::create(ioc, config_.janitor_interval, [this]() { sweepExpired(); }, logger_);
    janitor_->start();
    logger_->debug("QueryCache created: " + config_.to_string());
}

QueryCache::~QueryCache() {
    destroy();
}

std::size_t QueryCache::estimateSize(const nlohmann::json& value, bool* used_fallback) {
    if (used_fallback) {
        *used_fallback = false;
    }
    try {
        return value.dump().size();
    } catch (const nlohmann::json::type_error&) {
        if (used_fallback) {
            *used_fallback = true;
        }
        return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).size() * 2;
    }
}

std::optional<nlohmann::json> QueryCache::get(const std::string& connection_id,
                                              const std::string& query,
                                              const std::optional<std::string>& database,
                                              const nlohmann::json& params) {
    const auto start = steady_clock::now();
    const std::string key = CacheKeyBuilder::buildKey(connection_id, query, database, params);

    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
        logger_->debug("QueryCache::get called after destroy");
        return std::nullopt;
    }

    const auto now = steady_clock::now();
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.entry.isExpired(now)) {
        if (it != entries_.end()) {
            eraseLocked(it);
            statsd_client_->increment(MetricsDefinitions::CACHE_EVICTION_EXPIRED);
            publishGaugesLocked();
        }
        const auto latency = steady_clock::now() - start;
        stats_.recordMiss(latency);
        statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
        statsd_client_->timing(MetricsDefinitions::CACHE_LOOKUP_TIME, duration_cast<microseconds>(latency));
        logger_->debug("Cache miss for " + connection_id + ": " + queryPrefix(query));
        return std::nullopt;
    }

    StoredEntry& stored = it->second;
    stored.entry.access_count++;
    stored.entry.last_accessed_at = now;
    lru_list_.splice(lru_list_.begin(), lru_list_, stored.lru_position);

    const auto latency = steady_clock::now() - start;
    stats_.recordHit(latency);
    statsd_client_->increment(MetricsDefinitions::CACHE_HIT);
    statsd_client_->timing(MetricsDefinitions::CACHE_LOOKUP_TIME, duration_cast<microseconds>(latency));
    logger_->debug("Cache hit for " + connection_id + ": " + queryPrefix(query));
    return stored.entry.value;
}

void QueryCache::set(const std::string& connection_id,
                     const std::string& query,
                     const nlohmann::json& value,
                     const std::optional<std::string>& database,
                     const nlohmann::json& params,
                     std::optional<milliseconds> ttl) {
    std::string key = CacheKeyBuilder::buildKey(connection_id, query, database, params);
    bool used_fallback = false;
    const std::size_t size = estimateSize(value, &used_fallback);
    if (used_fallback) {
        logger_->warn("Cache value for " + connection_id + " is not serializable; using estimated size " +
                      std::to_string(size));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
        logger_->debug("QueryCache::set called after destroy");
        return;
    }

    // Last writer wins: the old entry must not count against the bounds.
    auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        eraseLocked(existing);
    }

    ensureSpaceLocked(size, 1);

    const auto now = steady_clock::now();
    StoredEntry stored;
    stored.entry.key = key;
    stored.entry.connection_id = connection_id;
    stored.entry.value = value;
    stored.entry.created_at = now;
    stored.entry.last_accessed_at = now;
    stored.entry.ttl = (ttl && ttl->count() > 0) ? *ttl : config_.default_ttl;
    stored.entry.access_count = 1;
    stored.entry.estimated_size = size;

    lru_list_.push_front(key);
    stored.lru_position = lru_list_.begin();
    entries_.emplace(std::move(key), std::move(stored));
    total_size_ += size;

    statsd_client_->increment(MetricsDefinitions::CACHE_SET);
    publishGaugesLocked();
    logger_->debug("Cached " + std::to_string(size) + " bytes for " + connection_id + ": " + queryPrefix(query));
}

void QueryCache::clearAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
        logger_->debug("QueryCache::clearAll called after destroy");
        return;
    }
    const std::size_t cleared = entries_.size();
    entries_.clear();
    lru_list_.clear();
    total_size_ = 0;
    stats_.reset();

    statsd_client_->increment(MetricsDefinitions::CACHE_CLEAR, static_cast<int>(cleared));
    publishGaugesLocked();
    logger_->info("Query cache cleared, " + std::to_string(cleared) + " entries dropped");
}

std::size_t QueryCache::clearByConnection(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
        logger_->debug("QueryCache::clearByConnection called after destroy");
        return 0;
    }
    std::size_t cleared = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (it->second.entry.connection_id == connection_id) {
            it = eraseLocked(it);
            ++cleared;
        } else {
            ++it;
        }
    }

    statsd_client_->increment(MetricsDefinitions::CACHE_CLEAR_CONNECTION, static_cast<int>(cleared));
    publishGaugesLocked();
    logger_->info("Cleared " + std::to_string(cleared) + " cached results of connection " + connection_id);
    return cleared;
}

CacheStats QueryCache::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
        return CacheStats{};
    }
    return stats_.snapshot(entries_.size(), total_size_);
}

void QueryCache::configure(const CacheConfigUpdate& update) {
    // Commit and janitor restart happen as one step, so the janitor ends on the committed interval.
    std::lock_guard<std::mutex> configure_lock(configure_mutex_);
    std::optional<milliseconds> new_interval;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (destroyed_) {
            logger_->debug("QueryCache::configure called after destroy");
            return;
        }

        if (update.max_size_mb) {
            if (*update.max_size_mb > 0) {
                config_.max_total_size_bytes = *update.max_size_mb * CacheConfig::BYTES_PER_MB;
            } else {
                logger_->warn("Ignoring non-positive max_size_mb");
            }
        }
        if (update.default_ttl) {
            if (*update.default_ttl > milliseconds::zero()) {
                config_.default_ttl = *update.default_ttl;
            } else {
                logger_->warn("Ignoring non-positive default_ttl");
            }
        }
        if (update.max_entries) {
            if (*update.max_entries > 0) {
                config_.max_entry_count = *update.max_entries;
            } else {
                logger_->warn("Ignoring non-positive max_entries");
            }
        }
        if (update.janitor_interval) {
            if (*update.janitor_interval <= milliseconds::zero()) {
                logger_->warn("Ignoring non-positive janitor_interval");
            } else if (*update.janitor_interval != config_.janitor_interval) {
                config_.janitor_interval = *update.janitor_interval;
                new_interval = config_.janitor_interval;
            }
        }

        // Shrunk limits apply now rather than at the next insertion.
        ensureSpaceLocked(0, 0);
        publishGaugesLocked();
        logger_->info("QueryCache reconfigured: " + config_.to_string());
    }

    // Outside the store lock: a running sweep holds the janitor lock and waits for ours.
    if (new_interval) {
        janitor_->restart(*new_interval);
    }
}

milliseconds QueryCache::janitorInterval() const {
    return janitor_->interval();
}

CacheConfig QueryCache::getConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void QueryCache::resetStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.reset();
}

std::size_t QueryCache::sweepExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
        return 0;
    }
    const std::size_t removed = removeExpiredLocked(steady_clock::now());
    if (removed > 0) {
        publishGaugesLocked();
    }
    return removed;
}

void QueryCache::destroy() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (destroyed_) {
            return;
        }
        destroyed_ = true;
    }

    // Blocks until an in-flight sweep has finished; no sweep runs afterwards.
    janitor_->stop();

    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t dropped = entries_.size();
    entries_.clear();
    lru_list_.clear();
    total_size_ = 0;
    stats_.reset();
    logger_->debug("QueryCache destroyed, " + std::to_string(dropped) + " entries dropped");
}

bool QueryCache::isDestroyed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return destroyed_;
}

QueryCache::EntryMap::iterator QueryCache::eraseLocked(EntryMap::iterator it) {
    total_size_ -= it->second.entry.estimated_size;
    lru_list_.erase(it->second.lru_position);
    return entries_.erase(it);
}

std::size_t QueryCache::removeExpiredLocked(steady_clock::time_point now) {
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (it->second.entry.isExpired(now)) {
            it = eraseLocked(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        statsd_client_->increment(MetricsDefinitions::CACHE_EVICTION_EXPIRED, static_cast<int>(removed));
        logger_->debug("Removed " + std::to_string(removed) + " expired cache entries");
    }
    return removed;
}

// The back of the recency list is the entry with the oldest last_accessed_at.
// Entries touched within the same clock tick keep their touch order.
bool QueryCache::evictLeastRecentlyUsedLocked() {
    if (lru_list_.empty()) {
        return false;
    }
    auto it = entries_.find(lru_list_.back());
    if (it == entries_.end()) {
        // Recency list and map out of step; drop the dangling key.
        logger_->error("QueryCache recency list references a missing key");
        lru_list_.pop_back();
        return true;
    }
    const std::size_t freed = it->second.entry.estimated_size;
    eraseLocked(it);
    statsd_client_->increment(MetricsDefinitions::CACHE_EVICTION_LRU);
    logger_->debug("Evicted least recently used cache entry (" + std::to_string(freed) + " bytes)");
    return true;
}

bool QueryCache::fitsLocked(std::size_t required_bytes, std::size_t incoming_entries) const {
    return total_size_ + required_bytes <= config_.max_total_size_bytes &&
           entries_.size() + incoming_entries <= config_.max_entry_count;
}

void QueryCache::ensureSpaceLocked(std::size_t required_bytes, std::size_t incoming_entries) {
    if (fitsLocked(required_bytes, incoming_entries)) {
        return;
    }

    removeExpiredLocked(steady_clock::now());

    while (!fitsLocked(required_bytes, incoming_entries) && !entries_.empty()) {
        if (!evictLeastRecentlyUsedLocked()) {
            break;
        }
    }

    if (!fitsLocked(required_bytes, incoming_entries)) {
        logger_->warn("Cache value of " + std::to_string(required_bytes) +
                      " bytes exceeds max_total_size_bytes " + std::to_string(config_.max_total_size_bytes) +
                      "; accepting it anyway");
    }
}

void QueryCache::publishGaugesLocked() {
    statsd_client_->gauge(MetricsDefinitions::CACHE_SIZE_BYTES, static_cast<double>(total_size_));
    statsd_client_->gauge(MetricsDefinitions::CACHE_ENTRIES, static_cast<double>(entries_.size()));
}
