#ifndef CACHECONFIG_HPP
#define CACHECONFIG_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <sstream>
#include <string>

// Live limits of a QueryCache. Mutable at runtime through QueryCache::configure.
struct CacheConfig {
    static constexpr std::size_t BYTES_PER_MB = 1024 * 1024;

    std::size_t max_total_size_bytes = 100 * BYTES_PER_MB;
    std::chrono::milliseconds default_ttl = std::chrono::minutes(5);
    std::size_t max_entry_count = 1000;
    std::chrono::milliseconds janitor_interval = std::chrono::minutes(1);

    std::string to_string() const {
        std::ostringstream oss;
        oss << "CacheConfig {"
            << " max_total_size_bytes: " << max_total_size_bytes
            << ", default_ttl_ms: " << default_ttl.count()
            << ", max_entry_count: " << max_entry_count
            << ", janitor_interval_ms: " << janitor_interval.count()
            << " }";
        return oss.str();
    }
};

// Partial update merged into the live CacheConfig; unset fields are left alone.
struct CacheConfigUpdate {
    std::optional<std::size_t> max_size_mb;
    std::optional<std::chrono::milliseconds> default_ttl;
    std::optional<std::size_t> max_entries;
    std::optional<std::chrono::milliseconds> janitor_interval;
};

#endif // CACHECONFIG_HPP
