#pragma once

#include <memory>

#include <QObject>
#include <QTimer>

#include "common/config.hpp"

namespace rulecast {

class EventDispatcher;
class PrincipalDirectory;
class RuleStore;
class RulecastApiServer;
class RulesEngine;
class SubscriptionRegistry;
class TransportManager;

/**
 * RulecastDaemon coordinates:
 * - loading persisted collection rules into the RulesEngine
 * - the subscription registry, transport and dispatcher
 * - the local API server
 * - the periodic stale-subscription sweep
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class RulecastDaemon : public QObject
{
    Q_OBJECT
public:
    explicit RulecastDaemon(RulecastConfig config, QObject *parent = nullptr);
    ~RulecastDaemon() override;

    // Call this after constructing the daemon to start the server and timers.
    bool start();

private slots:
    void runCleanupCycle();

private:
    void loadRulesFromStore();

    RulecastConfig m_config;
    std::unique_ptr<RuleStore> m_store;
    std::unique_ptr<RulesEngine> m_rules;
    std::unique_ptr<SubscriptionRegistry> m_registry;
    std::unique_ptr<PrincipalDirectory> m_principals;
    std::unique_ptr<TransportManager> m_transport;
    std::unique_ptr<EventDispatcher> m_dispatcher;
    std::unique_ptr<RulecastApiServer> m_apiServer;
    QTimer m_cleanupTimer;
    bool m_persistenceEnabled = true;
};

} // namespace rulecast
