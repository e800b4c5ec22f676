#pragma once

#include <chrono>
#include <string>

#include <QByteArray>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <QString>

#include <nlohmann/json.hpp>

namespace rulecast {

class EventDispatcher;
class PrincipalDirectory;
class RuleStore;
class RulesEngine;
class SubscriptionRegistry;
class TransportManager;

// The components the API server drives. ruleStore may be null, in which case
// rule changes are applied in memory only.
struct ApiServices {
    RulesEngine &rules;
    SubscriptionRegistry &registry;
    EventDispatcher &dispatcher;
    TransportManager &transport;
    PrincipalDirectory &principals;
    RuleStore *ruleStore = nullptr;
};

/**
 * RulecastApiServer exposes the engine over a local UNIX socket using a
 * minimal JSON-RPC-like protocol, one request object per line.
 *
 * A `connect` request turns its socket into that client's event stream:
 * the transport owns the outbound side from then on and further input on
 * the socket is ignored.
 */
class RulecastApiServer : public QObject
{
    Q_OBJECT
public:
    explicit RulecastApiServer(ApiServices services, QObject *parent = nullptr);
    ~RulecastApiServer() override;

    // Listen on socketName, or on $XDG_RUNTIME_DIR/rulecast.sock when empty.
    bool start(const QString &socketName = QString());
    QString serverName() const;

    // Process a single JSON-RPC payload without a socket round-trip.
    QByteArray handleRequestPayload(const QByteArray &payload);

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    // Returns false, after replying with an error, when the request names no clientId.
    bool attachStream(QLocalSocket *socket, const nlohmann::json &request);
    void logCompleted(const std::string &method,
                      const QString &corrId,
                      std::chrono::steady_clock::time_point start) const;
    QByteArray makeErrorResponse(const QString &message, int id = -1) const;
    QByteArray makeResultResponse(const nlohmann::json &result, int id) const;

    ApiServices m_services;
    QLocalServer m_server;
};

} // namespace rulecast
