#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace rulecast {

class PrincipalDirectory;
class RulesEngine;
class SubscriptionRegistry;
class TransportManager;

struct DispatchReport {
    std::size_t candidates = 0;
    std::size_t delivered = 0;
    std::size_t denied = 0;
    std::size_t filtered = 0;
    std::size_t failed = 0;
};

/**
 * EventDispatcher fans a record change out to the subscriptions watching it.
 *
 * The view rule is evaluated per subscription at delivery time, against the
 * record as it is now, so a subscription never receives a record its
 * principal could not read directly. A failure for one subscription is
 * counted and logged and never stops delivery to the rest.
 */
class EventDispatcher {
public:
    EventDispatcher(const RulesEngine &rules,
                    SubscriptionRegistry &registry,
                    TransportManager &transport,
                    AuthRefreshPolicy authRefresh = AuthRefreshPolicy::Snapshot,
                    const PrincipalDirectory *principals = nullptr);

    DispatchReport emitRecordEvent(const std::string &collection,
                                   RecordAction action,
                                   const nlohmann::json &record);

    AuthRefreshPolicy authRefreshPolicy() const { return m_authRefresh; }

private:
    std::optional<nlohmann::json> resolveAuth(const Subscription &subscription) const;

    const RulesEngine &m_rules;
    SubscriptionRegistry &m_registry;
    TransportManager &m_transport;
    AuthRefreshPolicy m_authRefresh;
    const PrincipalDirectory *m_principals;
};

} // namespace rulecast
