#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace rulecast {

// Current view of authenticated principals, keyed by their `id` field.
// Consulted at delivery time when subscriptions use live auth refresh.
class PrincipalDirectory {
public:
    // Returns false when principal is not an object with a non-empty id.
    bool upsert(const nlohmann::json &principal);
    bool remove(const std::string &id);
    std::optional<nlohmann::json> find(const std::string &id) const;
    std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, nlohmann::json> m_principals;
};

} // namespace rulecast
