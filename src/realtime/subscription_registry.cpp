#include "realtime/subscription_registry.hpp"

#include <algorithm>

#include <QUuid>

#include "common/logging.hpp"
#include "rules/filter_matcher.hpp"

namespace rulecast {

namespace {

std::string generateSubscriptionId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

void eraseFrom(std::unordered_map<std::string, std::vector<SubscriptionRegistry::SubscriptionPtr>> &index,
               const std::string &key,
               const std::string &subscriptionId)
{
    auto it = index.find(key);
    if (it == index.end()) {
        return;
    }
    auto &entries = it->second;
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&subscriptionId](const SubscriptionRegistry::SubscriptionPtr &entry) {
                                     return entry->id == subscriptionId;
                                 }),
                  entries.end());
    if (entries.empty()) {
        index.erase(it);
    }
}

} // namespace

SubscriptionRegistry::SubscriptionRegistry()
    : m_clock([] { return std::chrono::system_clock::now(); })
{
}

SubscriptionRegistry::SubscriptionRegistry(Clock clock)
    : m_clock(std::move(clock))
{
}

SubscriptionRegistry::SubscriptionPtr SubscriptionRegistry::subscribe(
    const std::string &clientId,
    const std::string &collection,
    const std::optional<std::string> &recordId,
    const std::optional<std::string> &filterExpr,
    const std::optional<nlohmann::json> &authContext)
{
    if (clientId.empty()) {
        throw SubscriptionValidationError("clientId is required");
    }
    if (collection.empty()) {
        throw SubscriptionValidationError("collection is required");
    }

    auto subscription = std::make_shared<Subscription>();
    subscription->id = generateSubscriptionId();
    subscription->clientId = clientId;
    subscription->collection = collection;
    subscription->recordId = recordId;
    subscription->authContext = authContext;

    // Filters are compiled here, before anything is stored, so a bad filter
    // is reported to the subscriber instead of failing on every event.
    if (filterExpr && !filterExpr->empty()) {
        std::string error;
        subscription->filter = FilterMatcher::compile(*filterExpr, &error);
        if (!subscription->filter) {
            RLOG_WARN(QStringLiteral("SubscriptionRegistry"),
                      QStringLiteral("subscribe"),
                      QStringLiteral("subscription_rejected"),
                      QStringLiteral("invalid_filter"),
                      QStringLiteral("expression_parser"),
                      rulecast::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"clientId", clientId},
                                      {"collection", collection},
                                      {"error", error}}));
            throw SubscriptionValidationError("invalid filter: " + error);
        }
        subscription->filterExpr = filterExpr;
    }

    SubscriptionPtr stored;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        subscription->createdAt = m_clock();
        stored = subscription;
        m_byId.emplace(stored->id, stored);
        m_byClient[clientId].push_back(stored);
        m_byCollection[collection].push_back(stored);
        m_lastActivity[clientId] = stored->createdAt;
    }

    RLOG_INFO(QStringLiteral("SubscriptionRegistry"),
              QStringLiteral("subscribe"),
              QStringLiteral("subscription_created"),
              QStringLiteral("client_request"),
              QStringLiteral("registry_insert"),
              rulecast::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"subscriptionId", stored->id},
                              {"clientId", clientId},
                              {"collection", collection},
                              {"hasFilter", stored->filter != nullptr}}));
    return stored;
}

bool SubscriptionRegistry::unsubscribe(const std::string &subscriptionId)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_byId.find(subscriptionId);
        if (it == m_byId.end()) {
            return false;
        }
        removeLocked(it->second);
    }

    RLOG_INFO(QStringLiteral("SubscriptionRegistry"),
              QStringLiteral("unsubscribe"),
              QStringLiteral("subscription_removed"),
              QStringLiteral("client_request"),
              QStringLiteral("registry_erase"),
              rulecast::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"subscriptionId", subscriptionId}}));
    return true;
}

std::size_t SubscriptionRegistry::unsubscribeClient(const std::string &clientId)
{
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_byClient.find(clientId);
        if (it != m_byClient.end()) {
            const std::vector<SubscriptionPtr> owned = it->second;
            for (const auto &subscription : owned) {
                removeLocked(subscription);
                ++removed;
            }
        }
        m_lastActivity.erase(clientId);
    }

    if (removed > 0) {
        RLOG_INFO(QStringLiteral("SubscriptionRegistry"),
                  QStringLiteral("unsubscribeClient"),
                  QStringLiteral("client_subscriptions_removed"),
                  QStringLiteral("client_disconnect"),
                  QStringLiteral("registry_cascade"),
                  rulecast::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"clientId", clientId}, {"removed", removed}}));
    }
    return removed;
}

std::vector<SubscriptionRegistry::SubscriptionPtr> SubscriptionRegistry::listByClient(
    const std::string &clientId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_byClient.find(clientId);
    if (it == m_byClient.end()) {
        return {};
    }
    return it->second;
}

std::vector<SubscriptionRegistry::SubscriptionPtr> SubscriptionRegistry::listByCollection(
    const std::string &collection) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_byCollection.find(collection);
    if (it == m_byCollection.end()) {
        return {};
    }
    return it->second;
}

bool SubscriptionRegistry::isActive(const std::string &subscriptionId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_byId.count(subscriptionId) > 0;
}

void SubscriptionRegistry::markActive(const std::string &clientId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_byClient.count(clientId) == 0) {
        return;
    }
    m_lastActivity[clientId] = m_clock();
}

std::size_t SubscriptionRegistry::cleanup(std::chrono::milliseconds maxAge)
{
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = m_clock();

        std::vector<SubscriptionPtr> stale;
        for (const auto &entry : m_byId) {
            const SubscriptionPtr &subscription = entry.second;
            if (now - subscription->createdAt <= maxAge) {
                continue;
            }
            auto activity = m_lastActivity.find(subscription->clientId);
            if (activity != m_lastActivity.end() && now - activity->second <= maxAge) {
                continue;
            }
            stale.push_back(subscription);
        }

        for (const auto &subscription : stale) {
            removeLocked(subscription);
            ++removed;
        }
    }

    RLOG_INFO(QStringLiteral("SubscriptionRegistry"),
              QStringLiteral("cleanup"),
              QStringLiteral("stale_subscriptions_swept"),
              QStringLiteral("periodic_cleanup"),
              QStringLiteral("registry_sweep"),
              rulecast::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"removed", removed},
                              {"maxAgeMs", maxAge.count()}}));
    return removed;
}

std::size_t SubscriptionRegistry::subscriptionCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_byId.size();
}

std::size_t SubscriptionRegistry::clientCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_byClient.size();
}

void SubscriptionRegistry::removeLocked(const SubscriptionPtr &subscription)
{
    // Hold a reference: the index entries being erased may be the last owners.
    const SubscriptionPtr keep = subscription;
    m_byId.erase(keep->id);
    eraseFrom(m_byCollection, keep->collection, keep->id);
    if (m_byClient.count(keep->clientId) > 0) {
        eraseFrom(m_byClient, keep->clientId, keep->id);
        if (m_byClient.count(keep->clientId) == 0) {
            m_lastActivity.erase(keep->clientId);
        }
    }
}

} // namespace rulecast
