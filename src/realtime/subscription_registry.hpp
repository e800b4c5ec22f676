#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace rulecast {

// Thrown by SubscriptionRegistry::subscribe when a request cannot be accepted.
// No subscription exists when this is thrown.
class SubscriptionValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * SubscriptionRegistry is the single owner of active subscriptions.
 *
 * Every mutation and every read goes through one mutex. Reads hand back
 * copies of immutable shared subscriptions, so callers evaluate rules and
 * write to sockets without holding the lock, and a concurrent unsubscribe
 * never leaves them with a half-removed entry.
 */
class SubscriptionRegistry {
public:
    using SubscriptionPtr = std::shared_ptr<const Subscription>;
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    SubscriptionRegistry();
    explicit SubscriptionRegistry(Clock clock);

    SubscriptionPtr subscribe(const std::string &clientId,
                              const std::string &collection,
                              const std::optional<std::string> &recordId,
                              const std::optional<std::string> &filterExpr,
                              const std::optional<nlohmann::json> &authContext);

    bool unsubscribe(const std::string &subscriptionId);
    std::size_t unsubscribeClient(const std::string &clientId);

    std::vector<SubscriptionPtr> listByClient(const std::string &clientId) const;
    std::vector<SubscriptionPtr> listByCollection(const std::string &collection) const;
    bool isActive(const std::string &subscriptionId) const;

    // Records activity for a client that owns subscriptions. The transport
    // calls this after every successful write.
    void markActive(const std::string &clientId);

    // Removes subscriptions older than maxAge whose client has shown no
    // activity within maxAge. Returns the number removed.
    std::size_t cleanup(std::chrono::milliseconds maxAge);

    std::size_t subscriptionCount() const;
    std::size_t clientCount() const;

private:
    void removeLocked(const SubscriptionPtr &subscription);

    Clock m_clock;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, SubscriptionPtr> m_byId;
    std::unordered_map<std::string, std::vector<SubscriptionPtr>> m_byClient;
    std::unordered_map<std::string, std::vector<SubscriptionPtr>> m_byCollection;
    std::unordered_map<std::string, std::chrono::system_clock::time_point> m_lastActivity;
};

} // namespace rulecast
