#ifndef CACHEKEYBUILDER_HPP
#define CACHEKEYBUILDER_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

// Derives cache keys from query identity.
//
// The key is the base64 of the CBOR encoding of a canonical JSON document:
//   {"connectionId": ..., "database": ..., "params": {...}, "query": ...}
// nlohmann::json keeps object members sorted, so the encoding does not depend on
// the order in which parameters were inserted. Strings are encoded byte for byte,
// so values that are not valid UTF-8 never collide. The query is trimmed and
// lower-cased, so "SELECT 1" and "  select 1 " share a key.
class CacheKeyBuilder {
public:
    static std::string buildKey(const std::string& connection_id,
                                const std::string& query,
                                const std::optional<std::string>& database = std::nullopt,
                                const nlohmann::json& params = nullptr);

    static std::string normalizeQuery(const std::string& query);

private:
    CacheKeyBuilder() = delete;
};

#endif // CACHEKEYBUILDER_HPP
