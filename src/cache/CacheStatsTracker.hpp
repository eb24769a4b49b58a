#ifndef CACHESTATSTRACKER_HPP
#define CACHESTATSTRACKER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "../models/CacheStats.hpp"

// Running hit/miss/latency counters of a QueryCache.
// Not synchronized on its own: the owning cache calls it under its store mutex.
class CacheStatsTracker {
public:
    void recordHit(std::chrono::nanoseconds latency);
    void recordMiss(std::chrono::nanoseconds latency);

    // Derives rates and averages; entry count and size come from the live store.
    CacheStats snapshot(std::size_t total_entries, std::size_t total_size) const;

    void reset();

private:
    void recordAccess(std::chrono::nanoseconds latency);

    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
    std::chrono::nanoseconds total_access_time_{0};
    std::uint64_t access_count_ = 0;
};

#endif // CACHESTATSTRACKER_HPP
