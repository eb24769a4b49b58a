#ifndef CACHESTATS_HPP
#define CACHESTATS_HPP

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

// Point-in-time report of a QueryCache. Not persisted.
class CacheStats {
public:
    std::size_t total_entries = 0;
    std::size_t total_size = 0;
    double hit_rate = 0.0;
    double miss_rate = 0.0;
    std::uint64_t total_hits = 0;
    std::uint64_t total_misses = 0;
    double average_access_time_ms = 0.0;

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"totalEntries", total_entries},
            {"totalSize", total_size},
            {"hitRate", hit_rate},
            {"missRate", miss_rate},
            {"totalHits", total_hits},
            {"totalMisses", total_misses},
            {"averageAccessTime", average_access_time_ms}
        };
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "CacheStats {\n";
        oss << "  Entries: " << total_entries << "\n";
        oss << "  Size (bytes): " << total_size << "\n";
        oss << std::fixed << std::setprecision(4);
        oss << "  Hit Rate: " << hit_rate << "\n";
        oss << "  Miss Rate: " << miss_rate << "\n";
        oss << "  Hits: " << total_hits << "\n";
        oss << "  Misses: " << total_misses << "\n";
        oss << "  Average Access Time (ms): " << average_access_time_ms << "\n";
        oss << "}";
        return oss.str();
    }
};

#endif // CACHESTATS_HPP
