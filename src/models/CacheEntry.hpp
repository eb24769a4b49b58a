#ifndef CACHEENTRY_HPP
#define CACHEENTRY_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

// One cached query result, owned by QueryCache.
struct CacheEntry {
    std::string key;           // Immutable once inserted
    std::string connection_id; // Connection the key was built with, for clearByConnection
    nlohmann::json value;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::milliseconds ttl{0};
    std::uint64_t access_count = 0;
    std::chrono::steady_clock::time_point last_accessed_at; // LRU ordering key
    std::size_t estimated_size = 0;

    bool isExpired(std::chrono::steady_clock::time_point now) const {
        return now - created_at > ttl;
    }
};

#endif // CACHEENTRY_HPP
