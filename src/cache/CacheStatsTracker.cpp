#include "CacheStatsTracker.hpp"

void CacheStatsTracker::recordHit(std::chrono::nanoseconds latency) {
    ++hits_;
    recordAccess(latency);
}

void CacheStatsTracker::recordMiss(std::chrono::nanoseconds latency) {
    ++misses_;
    recordAccess(latency);
}

void CacheStatsTracker::recordAccess(std::chrono::nanoseconds latency) {
    total_access_time_ += latency;
    ++access_count_;
}

CacheStats CacheStatsTracker::snapshot(std::size_t total_entries, std::size_t total_size) const {
    CacheStats stats;
    stats.total_entries = total_entries;
    stats.total_size = total_size;
    stats.total_hits = hits_;
    stats.total_misses = misses_;

    const std::uint64_t total_requests = hits_ + misses_;
    if (total_requests > 0) {
        stats.hit_rate = static_cast<double>(hits_) / static_cast<double>(total_requests);
        stats.miss_rate = 1.0 - stats.hit_rate;
    }
    if (access_count_ > 0) {
        std::chrono::duration<double, std::milli> total_ms = total_access_time_;
        stats.average_access_time_ms = total_ms.count() / static_cast<double>(access_count_);
    }
    return stats;
}

void CacheStatsTracker::reset() {
    hits_ = 0;
    misses_ = 0;
    total_access_time_ = std::chrono::nanoseconds(0);
    access_count_ = 0;
}
