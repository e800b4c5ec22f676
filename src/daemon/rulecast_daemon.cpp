#include "daemon/rulecast_daemon.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/rulecast_version.hpp"
#include "daemon/rulecast_api_server.hpp"
#include "realtime/event_dispatcher.hpp"
#include "realtime/principal_directory.hpp"
#include "realtime/subscription_registry.hpp"
#include "realtime/transport_manager.hpp"
#include "rules/rule_store.hpp"
#include "rules/rules_engine.hpp"

namespace rulecast {

RulecastDaemon::RulecastDaemon(RulecastConfig config, QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_store(std::make_unique<RuleStore>())
    , m_rules(std::make_unique<RulesEngine>())
    , m_registry(std::make_unique<SubscriptionRegistry>())
    , m_principals(std::make_unique<PrincipalDirectory>())
{
    TransportManager::Options options;
    options.heartbeatInterval = m_config.heartbeatInterval;
    options.queueCapacity = m_config.sendQueueCapacity;
    options.overflowPolicy = m_config.overflowPolicy;
    m_transport = std::make_unique<TransportManager>(*m_registry, options);
    m_dispatcher = std::make_unique<EventDispatcher>(*m_rules, *m_registry, *m_transport,
                                                     m_config.authRefresh, m_principals.get());

    std::string integrityMessage;
    if (!m_store->integrityCheck(&integrityMessage)) {
        qWarning() << "Rulecast: SQLite integrity check failed, rules will not be persisted:"
                   << QString::fromStdString(integrityMessage);
        m_persistenceEnabled = false;
    }

    loadRulesFromStore();

    m_cleanupTimer.setInterval(static_cast<int>(
        std::min<qint64>(m_config.cleanupInterval.count(), std::numeric_limits<int>::max())));
    connect(&m_cleanupTimer, &QTimer::timeout, this, &RulecastDaemon::runCleanupCycle);
}

RulecastDaemon::~RulecastDaemon()
{
    // The server and transport reference the registry; release them first.
    m_apiServer.reset();
    m_dispatcher.reset();
    m_transport.reset();
}

bool RulecastDaemon::start()
{
    qInfo() << "Rulecast: daemon starting (version" << RULECAST_VERSION << ")";

    if (!m_apiServer) {
        ApiServices services{*m_rules, *m_registry, *m_dispatcher, *m_transport, *m_principals,
                             m_persistenceEnabled ? m_store.get() : nullptr};
        m_apiServer = std::make_unique<RulecastApiServer>(services);
        if (!m_apiServer->start(m_config.socketName)) {
            return false;
        }
    }

    m_transport->start();
    if (m_config.cleanupInterval.count() > 0) {
        m_cleanupTimer.start();
    }

    RLOG_INFO(QStringLiteral("RulecastDaemon"),
              QStringLiteral("start"),
              QStringLiteral("daemon_ready"),
              QStringLiteral("startup"),
              QStringLiteral("qt_event_loop"),
              rulecast::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"heartbeatMs", m_config.heartbeatInterval.count()},
                              {"cleanupMs", m_config.cleanupInterval.count()},
                              {"queueCapacity", m_config.sendQueueCapacity},
                              {"persistence", m_persistenceEnabled}}));
    return true;
}

void RulecastDaemon::runCleanupCycle()
{
    m_registry->cleanup(m_config.subscriptionMaxAge);
}

void RulecastDaemon::loadRulesFromStore()
{
    if (!m_persistenceEnabled) {
        return;
    }

    int loaded = 0;
    for (const auto &rules : m_store->listCollectionRules()) {
        std::string error;
        if (!m_rules->setCollectionRules(rules, &error)) {
            qWarning() << "Rulecast: skipping stored rules for" << QString::fromStdString(rules.name)
                       << QString::fromStdString(error);
            continue;
        }
        ++loaded;
    }
    qInfo() << "Rulecast: loaded rules for" << loaded << "collections";
}

} // namespace rulecast
