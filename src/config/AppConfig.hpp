#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <chrono>
#include <iostream>
#include <string>
#include <sstream>

#include "CacheConfig.hpp"

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string CODE_EXCEPTION = "code.exception";

    // Lookups
    static std::string CACHE_HIT = "query_cache.hit";
    static std::string CACHE_MISS = "query_cache.miss";
    static std::string CACHE_LOOKUP_TIME = "query_cache.lookup_time";
    static std::string CACHE_SET = "query_cache.set";

    // Removals
    static std::string CACHE_EVICTION_EXPIRED = "query_cache.eviction.expired";
    static std::string CACHE_EVICTION_LRU = "query_cache.eviction.lru";
    static std::string CACHE_CLEAR = "query_cache.clear";
    static std::string CACHE_CLEAR_CONNECTION = "query_cache.clear_connection";

    // Gauges
    static std::string CACHE_SIZE_BYTES = "query_cache.size_bytes";
    static std::string CACHE_ENTRIES = "query_cache.entries";

    static std::string QUERY_EXECUTED = "query_runner.executed";
    static std::string QUERY_FAILED = "query_runner.failed";
}

namespace Constants {
    static constexpr auto CONFIG_FILE_NAME = "querycache.config";
    // Longest query prefix written to log lines.
    static constexpr std::size_t LOGGED_QUERY_PREFIX = 100;
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Logging Level
    LogUtils::LogLevel log_level;

    // Query cache configuration
    int query_cache_max_size_mb;
    int query_cache_default_ttl_ms;
    int query_cache_max_entries;
    int query_cache_janitor_interval_ms;

    // Metrics
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    // Replay inputs
    std::string workload_path;
    std::string fixtures_path;
    unsigned int num_io_threads;

    AppConfig() {
        // --- Set Defaults  ---
        num_io_threads = 1;

        // Configurable from Config
        log_level = LogUtils::LogLevel::CERROR; // Default log level
        query_cache_max_size_mb = 100;
        query_cache_default_ttl_ms = 5 * 60 * 1000; // 5 minutes
        query_cache_max_entries = 1000;
        query_cache_janitor_interval_ms = 60 * 1000; // 1 minute
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;
    }

    CacheConfig cacheConfig() const {
        CacheConfig cache_config;
        cache_config.max_total_size_bytes = static_cast<std::size_t>(query_cache_max_size_mb) * CacheConfig::BYTES_PER_MB;
        cache_config.default_ttl = std::chrono::milliseconds(query_cache_default_ttl_ms);
        cache_config.max_entry_count = static_cast<std::size_t>(query_cache_max_entries);
        cache_config.janitor_interval = std::chrono::milliseconds(query_cache_janitor_interval_ms);
        return cache_config;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Query Cache Configuration --- //" << std::endl
            << "query_cache_max_size_mb: " << query_cache_max_size_mb << std::endl
            << "query_cache_default_ttl_ms: " << query_cache_default_ttl_ms << std::endl
            << "query_cache_max_entries: " << query_cache_max_entries << std::endl
            << "query_cache_janitor_interval_ms: " << query_cache_janitor_interval_ms << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl  // Cast enum to int
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl
            << "// --- Replay --- //" << std::endl
            << "workload: " << workload_path << std::endl
            << "fixtures: " << fixtures_path << std::endl
            << "num_io_threads: " << num_io_threads << std::endl;
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
