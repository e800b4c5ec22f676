#include "daemon/rulecast_api_server.hpp"

#include <memory>
#include <optional>
#include <stdexcept>

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QUuid>

#include "common/config.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "realtime/event_dispatcher.hpp"
#include "realtime/local_socket_sink.hpp"
#include "realtime/principal_directory.hpp"
#include "realtime/subscription_registry.hpp"
#include "realtime/transport_manager.hpp"
#include "rules/rule_store.hpp"
#include "rules/rules_engine.hpp"

namespace rulecast {

namespace {

constexpr qint64 kMaxRequestBytes = 1024 * 1024;
constexpr qint64 kMaxStreamBacklogBytes = 1024 * 1024;

bool isConnectRequest(const nlohmann::json &request)
{
    if (!request.is_object()) {
        return false;
    }
    auto it = request.find("method");
    return it != request.end() && it->is_string() && it->get<std::string>() == "connect";
}

std::string requiredString(const nlohmann::json &params, const char *key)
{
    auto it = params.find(key);
    if (it == params.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw std::invalid_argument(std::string("Missing ") + key);
    }
    return it->get<std::string>();
}

std::optional<std::string> optionalString(const nlohmann::json &params, const char *key)
{
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("Invalid ") + key);
    }
    return it->get<std::string>();
}

std::optional<nlohmann::json> optionalObject(const nlohmann::json &params, const char *key)
{
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("Invalid ") + key);
    }
    return *it;
}

RuleContext readRuleContext(const nlohmann::json &params)
{
    RuleContext context;
    context.auth = optionalObject(params, "auth");
    context.record = optionalObject(params, "record");
    context.data = optionalObject(params, "data");
    auto admin = params.find("admin");
    if (admin != params.end() && !admin->is_null()) {
        if (!admin->is_boolean()) {
            throw std::invalid_argument("Invalid admin");
        }
        context.admin = admin->get<bool>();
    }
    return context;
}

nlohmann::json toJson(const DispatchReport &report)
{
    return nlohmann::json{{"candidates", report.candidates},
                          {"delivered", report.delivered},
                          {"denied", report.denied},
                          {"filtered", report.filtered},
                          {"failed", report.failed}};
}

} // namespace

RulecastApiServer::RulecastApiServer(ApiServices services, QObject *parent)
    : QObject(parent)
    , m_services(services)
{
}

RulecastApiServer::~RulecastApiServer() = default;

bool RulecastApiServer::start(const QString &socketName)
{
    const QString socketPath = socketName.isEmpty() ? defaultSocketPath() : socketName;
    if (socketPath.contains('/')) {
        const QFileInfo socketInfo(socketPath);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            qWarning() << "Failed to create runtime socket directory"
                       << socketInfo.absolutePath();
            return false;
        }

        if (QFile::exists(socketPath)) {
            if (!QLocalServer::removeServer(socketPath)) {
                qWarning() << "Failed to remove existing Rulecast socket" << socketPath;
                return false;
            }
        }
    } else {
        QLocalServer::removeServer(socketPath);
    }

    if (!m_server.listen(socketPath)) {
        qWarning() << "Failed to listen on Rulecast socket" << socketPath
                   << m_server.errorString();
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &RulecastApiServer::handleNewConnection);

    qInfo() << "Rulecast API server listening on" << socketPath;
    return true;
}

QString RulecastApiServer::serverName() const
{
    return m_server.fullServerName();
}

void RulecastApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &RulecastApiServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected,
                socket, &QObject::deleteLater);
    }
}

void RulecastApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    while (socket->canReadLine()) {
        const QByteArray line = socket->readLine().trimmed();
        if (line.isEmpty()) {
            continue;
        }

        const auto parsed = nlohmann::json::parse(line.toStdString(), nullptr, false);
        if (isConnectRequest(parsed)) {
            if (attachStream(socket, parsed)) {
                return;
            }
            continue;
        }

        socket->write(handleRequestPayload(line) + '\n');
        socket->flush();
    }

    if (socket->bytesAvailable() > kMaxRequestBytes) {
        socket->write(makeErrorResponse(QStringLiteral("Request too large")) + '\n');
        socket->flush();
        socket->disconnectFromServer();
    }
}

bool RulecastApiServer::attachStream(QLocalSocket *socket, const nlohmann::json &request)
{
    int id = -1;
    if (request.contains("id") && request["id"].is_number_integer()) {
        id = request["id"].get<int>();
    }

    std::string clientId;
    auto params = request.find("params");
    if (params != request.end() && params->is_object()) {
        auto it = params->find("clientId");
        if (it != params->end() && it->is_string()) {
            clientId = it->get<std::string>();
        }
    }
    if (clientId.empty()) {
        // The socket stays a request socket; the client may retry.
        socket->write(makeErrorResponse(QStringLiteral("Invalid clientId"), id) + '\n');
        socket->flush();
        return false;
    }

    // The socket is now write-only from the server's point of view.
    disconnect(socket, &QLocalSocket::readyRead,
               this, &RulecastApiServer::handleClientReadyRead);
    socket->readAll();

    std::shared_ptr<StreamSink> sink(new LocalSocketSink(socket, kMaxStreamBacklogBytes),
                                     [](StreamSink *ptr) { ptr->deleteLater(); });
    m_services.transport.createConnection(clientId, std::move(sink));
    return true;
}

QByteArray RulecastApiServer::handleRequestPayload(const QByteArray &payload)
{
    // JSON-RPC-style request handler. All requests are local-only via UNIX socket.
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    rulecast::logging::CorrelationScope corrScope(corrId);
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        RLOG_WARN(QStringLiteral("RulecastApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("parse_payload"),
                  QStringLiteral("json_parse"),
                  rulecast::logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        return makeErrorResponse("Invalid JSON payload");
    }

    int id = -1;
    if (parsed.contains("id") && parsed["id"].is_number_integer()) {
        id = parsed["id"].get<int>();
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        RLOG_WARN(QStringLiteral("RulecastApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("missing_method"),
                  QStringLiteral("json_parse"),
                  rulecast::logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        return makeErrorResponse("Missing method", id);
    }

    const std::string method = parsed["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params")) {
        if (!parsed["params"].is_object()) {
            return makeErrorResponse("Invalid params", id);
        }
        params = parsed["params"];
    }

    nlohmann::json paramKeys = nlohmann::json::array();
    for (auto it = params.begin(); it != params.end(); ++it) {
        paramKeys.push_back(it.key());
    }
    RLOG_INFO(QStringLiteral("RulecastApiServer"),
              QStringLiteral("handleRequest"),
              QStringLiteral("api_request_received"),
              QStringLiteral("client_call"),
              QStringLiteral("json_rpc"),
              rulecast::logging::defaultWho(),
              corrId,
              (nlohmann::json{{"method", method},
                              {"paramKeys", paramKeys}}));

    auto start = std::chrono::steady_clock::now();
    try {
        nlohmann::json result = nlohmann::json::object();

        if (method == "connect") {
            return makeErrorResponse("connect requires a stream socket", id);
        } else if (method == "subscribe") {
            const auto subscription = m_services.registry.subscribe(
                requiredString(params, "clientId"),
                requiredString(params, "collection"),
                optionalString(params, "recordId"),
                optionalString(params, "filter"),
                optionalObject(params, "auth"));
            result["subscription"] = *subscription;
        } else if (method == "unsubscribe") {
            result["removed"] = m_services.registry.unsubscribe(requiredString(params, "subscriptionId"));
        } else if (method == "unsubscribe_client") {
            result["removed"] = m_services.registry.unsubscribeClient(requiredString(params, "clientId"));
        } else if (method == "emit_record_event") {
            const std::string collection = requiredString(params, "collection");
            const auto action = parseActionString(requiredString(params, "action"));
            if (!action) {
                return makeErrorResponse("Invalid action", id);
            }
            const auto record = optionalObject(params, "record");
            if (!record) {
                return makeErrorResponse("Missing record", id);
            }
            result["report"] = toJson(m_services.dispatcher.emitRecordEvent(collection, *action, *record));
        } else if (method == "check_rule") {
            const std::string collection = requiredString(params, "collection");
            const auto ruleType = parseRuleTypeString(requiredString(params, "ruleType"));
            if (!ruleType) {
                return makeErrorResponse("Invalid ruleType", id);
            }
            result["allowed"] = m_services.rules.checkRule(collection, *ruleType, readRuleContext(params));
        } else if (method == "generate_filter") {
            const std::string collection = requiredString(params, "collection");
            const auto fragment = m_services.rules.generateFilter(collection, readRuleContext(params));
            result["filter"] = fragment ? nlohmann::json(*fragment) : nlohmann::json(nullptr);
        } else if (method == "list_collection_rules") {
            result["collections"] = m_services.rules.listCollections();
        } else if (method == "upsert_collection_rules") {
            const auto rulesJson = optionalObject(params, "rules");
            if (!rulesJson) {
                return makeErrorResponse("Missing rules object", id);
            }
            const CollectionRules rules = rulesJson->get<CollectionRules>();
            if (rules.name.empty()) {
                return makeErrorResponse("Missing collection name", id);
            }
            std::string error;
            if (!m_services.rules.validateCollectionRules(rules, &error)) {
                return makeErrorResponse(QString::fromStdString("Invalid rule: " + error), id);
            }
            // Persist before installing so a storage failure changes nothing.
            if (m_services.ruleStore) {
                m_services.ruleStore->upsertCollectionRules(rules);
            }
            if (!m_services.rules.setCollectionRules(rules, &error)) {
                return makeErrorResponse(QString::fromStdString("Invalid rule: " + error), id);
            }
            result["ok"] = true;
        } else if (method == "delete_collection_rules") {
            const std::string name = requiredString(params, "name");
            bool removed = false;
            if (m_services.ruleStore) {
                removed = m_services.ruleStore->deleteCollectionRules(name);
            }
            removed = m_services.rules.removeCollection(name) || removed;
            result["removed"] = removed;
        } else if (method == "upsert_principal") {
            const auto principal = optionalObject(params, "principal");
            if (!principal || !m_services.principals.upsert(*principal)) {
                return makeErrorResponse("Missing principal id", id);
            }
            result["ok"] = true;
        } else if (method == "remove_principal") {
            result["removed"] = m_services.principals.remove(requiredString(params, "id"));
        } else if (method == "get_stats") {
            const TransportManager::Stats transport = m_services.transport.stats();
            result["subscriptions"] = m_services.registry.subscriptionCount();
            result["clients"] = m_services.registry.clientCount();
            result["connections"] = transport.connections;
            result["framesSent"] = transport.framesSent;
            result["framesDropped"] = transport.framesDropped;
            result["overflowDisconnects"] = transport.overflowDisconnects;
            result["collections"] = m_services.rules.listCollections().size();
            result["principals"] = m_services.principals.size();
        } else {
            RLOG_WARN(QStringLiteral("RulecastApiServer"),
                      QStringLiteral("handleRequest"),
                      QStringLiteral("api_request_error"),
                      QStringLiteral("unknown_method"),
                      QStringLiteral("json_rpc"),
                      rulecast::logging::defaultWho(),
                      corrId,
                      (nlohmann::json{{"method", method}}));
            return makeErrorResponse("Unknown method", id);
        }

        logCompleted(method, corrId, start);
        return makeResultResponse(result, id);
    } catch (const SubscriptionValidationError &ex) {
        RLOG_WARN(QStringLiteral("RulecastApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("subscription_rejected"),
                  QStringLiteral("json_rpc"),
                  rulecast::logging::defaultWho(),
                  corrId,
                  (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QString::fromUtf8(ex.what()), id);
    } catch (const std::invalid_argument &ex) {
        return makeErrorResponse(QString::fromUtf8(ex.what()), id);
    } catch (const std::exception &ex) {
        RLOG_ERROR(QStringLiteral("RulecastApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("exception"),
                   QStringLiteral("json_rpc"),
                   rulecast::logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"what", ex.what()}}));
        return makeErrorResponse(QString::fromUtf8(ex.what()), id);
    }
}

void RulecastApiServer::logCompleted(const std::string &method,
                                     const QString &corrId,
                                     std::chrono::steady_clock::time_point start) const
{
    RLOG_INFO(QStringLiteral("RulecastApiServer"),
              QStringLiteral("handleRequest"),
              QStringLiteral("api_request_completed"),
              QStringLiteral("client_call"),
              QStringLiteral("json_rpc"),
              rulecast::logging::defaultWho(),
              corrId,
              (nlohmann::json{{"method", method},
                              {"durationMs",
                               std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now() - start).count()}}));
}

QByteArray RulecastApiServer::makeErrorResponse(const QString &message, int id) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

QByteArray RulecastApiServer::makeResultResponse(const nlohmann::json &result,
                                                 int id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

} // namespace rulecast
