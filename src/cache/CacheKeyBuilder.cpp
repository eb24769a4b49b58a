#include "CacheKeyBuilder.hpp"

#include <cstdint>
#include <vector>

#include "../utils/Utils.hpp"

std::string CacheKeyBuilder::normalizeQuery(const std::string& query) {
    return Utils::toLower(Utils::trim(query));
}

std::string CacheKeyBuilder::buildKey(const std::string& connection_id,
                                      const std::string& query,
                                      const std::optional<std::string>& database,
                                      const nlohmann::json& params) {
    nlohmann::json key_data = nlohmann::json::object();
    key_data["connectionId"] = connection_id;
    key_data["query"] = normalizeQuery(query);

    // Absent and empty are the same request.
    if (database && !database->empty()) {
        key_data["database"] = *database;
    }
    if (!params.is_null() && !(params.is_object() && params.empty())) {
        key_data["params"] = params;
    }

    // CBOR copies string bytes verbatim, so invalid UTF-8 still yields distinct keys.
    const std::vector<std::uint8_t> encoded = nlohmann::json::to_cbor(key_data);
    return Utils::base64Encode(std::string(encoded.begin(), encoded.end()));
}
