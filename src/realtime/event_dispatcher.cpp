#include "realtime/event_dispatcher.hpp"

#include <chrono>
#include <exception>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "realtime/principal_directory.hpp"
#include "realtime/subscription_registry.hpp"
#include "realtime/transport_manager.hpp"
#include "rules/filter_matcher.hpp"
#include "rules/rules_engine.hpp"

namespace rulecast {

EventDispatcher::EventDispatcher(const RulesEngine &rules,
                                 SubscriptionRegistry &registry,
                                 TransportManager &transport,
                                 AuthRefreshPolicy authRefresh,
                                 const PrincipalDirectory *principals)
    : m_rules(rules)
    , m_registry(registry)
    , m_transport(transport)
    , m_authRefresh(authRefresh)
    , m_principals(principals)
{
}

DispatchReport EventDispatcher::emitRecordEvent(const std::string &collection,
                                                RecordAction action,
                                                const nlohmann::json &record)
{
    DispatchReport report;

    const nlohmann::json message{
        {"action", toActionString(action)},
        {"record", record},
        {"collection", collection},
        {"timestamp", toIso8601Utc(std::chrono::system_clock::now())},
    };
    const std::optional<std::string> recordId = recordIdOf(record);

    for (const auto &subscription : m_registry.listByCollection(collection)) {
        if (subscription->recordId && subscription->recordId != recordId) {
            continue;
        }
        ++report.candidates;

        try {
            RuleContext context;
            context.auth = resolveAuth(*subscription);
            context.record = record;

            if (!m_rules.checkRule(collection, RuleType::View, context)) {
                ++report.denied;
                continue;
            }
            if (subscription->filter && !subscription->filter->matches(record)) {
                ++report.filtered;
                continue;
            }
            if (m_transport.send(subscription->clientId, message, subscription->id)) {
                ++report.delivered;
            } else {
                ++report.failed;
            }
        } catch (const std::exception &ex) {
            ++report.failed;
            RLOG_ERROR(QStringLiteral("EventDispatcher"),
                       QStringLiteral("emitRecordEvent"),
                       QStringLiteral("delivery_failed"),
                       QStringLiteral("exception"),
                       QStringLiteral("per_subscription"),
                       rulecast::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"subscriptionId", subscription->id},
                                       {"clientId", subscription->clientId},
                                       {"what", ex.what()}}));
        }
    }

    RLOG_DEBUG(QStringLiteral("EventDispatcher"),
               QStringLiteral("emitRecordEvent"),
               QStringLiteral("record_event_dispatched"),
               QStringLiteral("record_change"),
               QStringLiteral("view_rule_fanout"),
               rulecast::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"collection", collection},
                               {"action", toActionString(action)},
                               {"candidates", report.candidates},
                               {"delivered", report.delivered},
                               {"denied", report.denied},
                               {"filtered", report.filtered},
                               {"failed", report.failed}}));
    return report;
}

std::optional<nlohmann::json> EventDispatcher::resolveAuth(const Subscription &subscription) const
{
    if (!subscription.authContext || subscription.authContext->is_null()) {
        return std::nullopt;
    }
    if (m_authRefresh == AuthRefreshPolicy::Snapshot || !m_principals) {
        return subscription.authContext;
    }

    // A principal that no longer exists is treated as unauthenticated.
    const auto id = recordIdOf(*subscription.authContext);
    if (!id) {
        return std::nullopt;
    }
    return m_principals->find(*id);
}

} // namespace rulecast
