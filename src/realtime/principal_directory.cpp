#include "realtime/principal_directory.hpp"

#include "common/json_utils.hpp"

namespace rulecast {

bool PrincipalDirectory::upsert(const nlohmann::json &principal)
{
    if (!principal.is_object()) {
        return false;
    }
    const auto id = recordIdOf(principal);
    if (!id || id->empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_principals[*id] = principal;
    return true;
}

bool PrincipalDirectory::remove(const std::string &id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_principals.erase(id) > 0;
}

std::optional<nlohmann::json> PrincipalDirectory::find(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_principals.find(id);
    if (it == m_principals.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t PrincipalDirectory::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_principals.size();
}

} // namespace rulecast
