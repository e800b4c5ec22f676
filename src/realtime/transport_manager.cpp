#include "realtime/transport_manager.hpp"

#include <algorithm>
#include <limits>
#include <utility>
#include <vector>

#include <QMetaObject>
#include <QThread>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "realtime/subscription_registry.hpp"

namespace rulecast {

namespace {

QByteArray encodeFrame(const nlohmann::json &message)
{
    QByteArray frame = QByteArray::fromStdString(message.dump());
    frame.append('\n');
    return frame;
}

nlohmann::json makeHandshake(const std::string &clientId)
{
    return nlohmann::json{{"type", "connected"},
                          {"clientId", clientId},
                          {"timestamp", toIso8601Utc(std::chrono::system_clock::now())}};
}

nlohmann::json makeHeartbeat()
{
    return nlohmann::json{{"type", "heartbeat"},
                          {"timestamp", toIso8601Utc(std::chrono::system_clock::now())}};
}

} // namespace

TransportManager::TransportManager(SubscriptionRegistry &registry, Options options, QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_options(options)
{
    if (m_options.queueCapacity == 0) {
        m_options.queueCapacity = 1;
    }
    m_heartbeatTimer.setInterval(static_cast<int>(
        std::min<qint64>(m_options.heartbeatInterval.count(), std::numeric_limits<int>::max())));
    connect(&m_heartbeatTimer, &QTimer::timeout, this, &TransportManager::sendHeartbeats);
}

TransportManager::~TransportManager()
{
    m_heartbeatTimer.stop();

    std::vector<ConnectionPtr> remaining;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &entry : m_connections) {
            remaining.push_back(entry.second);
        }
    }
    for (const auto &connection : remaining) {
        teardown(connection, QStringLiteral("shutdown"));
    }
}

void TransportManager::start()
{
    if (m_options.heartbeatInterval.count() > 0) {
        m_heartbeatTimer.start();
    }
}

void TransportManager::createConnection(const std::string &clientId,
                                        std::shared_ptr<StreamSink> sink)
{
    if (ConnectionPtr previous = find(clientId)) {
        teardown(previous, QStringLiteral("replaced"));
    }

    auto connection = std::make_shared<ClientConnection>();
    connection->clientId = clientId;
    connection->sink = std::move(sink);
    connection->lastHeartbeat = std::chrono::system_clock::now();

    const std::weak_ptr<ClientConnection> weak = connection;
    connect(connection->sink.get(), &StreamSink::closed, this, [this, weak]() {
        if (ConnectionPtr current = weak.lock()) {
            teardown(current, QStringLiteral("peer_closed"));
        }
    });
    connect(connection->sink.get(), &StreamSink::writable, this, [this, weak]() {
        if (ConnectionPtr current = weak.lock()) {
            scheduleFlush(current);
        }
    });

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_connections[clientId] = connection;
    }
    {
        std::lock_guard<std::mutex> lock(connection->queueMutex);
        connection->queue.push_back(Frame{encodeFrame(makeHandshake(clientId)), {}});
    }

    ConnectionState expected = ConnectionState::Connecting;
    connection->state.compare_exchange_strong(expected, ConnectionState::Open);

    RLOG_INFO(QStringLiteral("TransportManager"),
              QStringLiteral("createConnection"),
              QStringLiteral("connection_opened"),
              QStringLiteral("client_connect"),
              QStringLiteral("stream_sink"),
              rulecast::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"clientId", clientId}}));

    scheduleFlush(connection);
}

bool TransportManager::send(const std::string &clientId,
                            const nlohmann::json &message,
                            const std::string &subscriptionId)
{
    ConnectionPtr connection = find(clientId);
    if (!connection || connection->state.load() != ConnectionState::Open) {
        return false;
    }
    return enqueue(connection, Frame{encodeFrame(message), subscriptionId});
}

void TransportManager::closeConnection(const std::string &clientId)
{
    if (ConnectionPtr connection = find(clientId)) {
        teardown(connection, QStringLiteral("server_close"));
    }
}

void TransportManager::sendHeartbeats()
{
    std::vector<ConnectionPtr> open;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &entry : m_connections) {
            if (entry.second->state.load() == ConnectionState::Open) {
                open.push_back(entry.second);
            }
        }
    }

    for (const auto &connection : open) {
        {
            std::lock_guard<std::mutex> lock(connection->queueMutex);
            connection->lastHeartbeat = std::chrono::system_clock::now();
        }
        enqueue(connection, Frame{encodeFrame(makeHeartbeat()), {}});
    }

    RLOG_DEBUG(QStringLiteral("TransportManager"),
               QStringLiteral("sendHeartbeats"),
               QStringLiteral("heartbeat_round"),
               QStringLiteral("heartbeat_timer"),
               QStringLiteral("stream_sink"),
               rulecast::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"connections", open.size()}}));
}

bool TransportManager::isConnected(const std::string &clientId) const
{
    ConnectionPtr connection = find(clientId);
    return connection && connection->state.load() == ConnectionState::Open;
}

std::optional<ConnectionState> TransportManager::connectionState(const std::string &clientId) const
{
    ConnectionPtr connection = find(clientId);
    if (!connection) {
        return std::nullopt;
    }
    return connection->state.load();
}

std::size_t TransportManager::connectionCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connections.size();
}

TransportManager::Stats TransportManager::stats() const
{
    Stats stats;
    stats.connections = connectionCount();
    stats.framesSent = m_framesSent.load();
    stats.framesDropped = m_framesDropped.load();
    stats.overflowDisconnects = m_overflowDisconnects.load();
    return stats;
}

TransportManager::ConnectionPtr TransportManager::find(const std::string &clientId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_connections.find(clientId);
    if (it == m_connections.end()) {
        return nullptr;
    }
    return it->second;
}

bool TransportManager::enqueue(const ConnectionPtr &connection, Frame frame)
{
    bool overflow = false;
    {
        std::lock_guard<std::mutex> lock(connection->queueMutex);
        if (connection->queue.size() >= m_options.queueCapacity) {
            if (m_options.overflowPolicy == OverflowPolicy::DropOldest) {
                connection->queue.pop_front();
                ++m_framesDropped;
            } else {
                overflow = true;
            }
        }
        if (!overflow) {
            connection->queue.push_back(std::move(frame));
        }
    }

    if (overflow) {
        ++m_overflowDisconnects;
        RLOG_WARN(QStringLiteral("TransportManager"),
                  QStringLiteral("send"),
                  QStringLiteral("send_queue_overflow"),
                  QStringLiteral("slow_consumer"),
                  QStringLiteral("bounded_queue"),
                  rulecast::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"clientId", connection->clientId},
                                  {"capacity", m_options.queueCapacity}}));
        teardown(connection, QStringLiteral("send_queue_overflow"));
        return false;
    }

    scheduleFlush(connection);
    return true;
}

void TransportManager::scheduleFlush(const ConnectionPtr &connection)
{
    if (QThread::currentThread() == thread()) {
        flush(connection);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(connection->queueMutex);
        if (connection->flushScheduled) {
            return;
        }
        connection->flushScheduled = true;
    }

    const std::weak_ptr<ClientConnection> weak = connection;
    QMetaObject::invokeMethod(
        this,
        [this, weak]() {
            if (ConnectionPtr current = weak.lock()) {
                flush(current);
            }
        },
        Qt::QueuedConnection);
}

void TransportManager::flush(const ConnectionPtr &connection)
{
    {
        std::lock_guard<std::mutex> lock(connection->queueMutex);
        connection->flushScheduled = false;
    }

    while (connection->state.load() == ConnectionState::Open) {
        Frame frame;
        {
            std::lock_guard<std::mutex> lock(connection->queueMutex);
            if (connection->queue.empty()) {
                return;
            }
            frame = std::move(connection->queue.front());
            connection->queue.pop_front();
        }

        if (!frame.subscriptionId.empty() && !m_registry.isActive(frame.subscriptionId)) {
            ++m_framesDropped;
            continue;
        }

        const SinkWriteStatus status = connection->sink->write(frame.payload);
        if (status == SinkWriteStatus::Busy) {
            std::lock_guard<std::mutex> lock(connection->queueMutex);
            connection->queue.push_front(std::move(frame));
            return;
        }
        if (status == SinkWriteStatus::Failed) {
            teardown(connection, QStringLiteral("write_failed"));
            return;
        }

        ++m_framesSent;
        m_registry.markActive(connection->clientId);
    }
}

void TransportManager::teardown(const ConnectionPtr &connection, const QString &reason)
{
    ConnectionState current = connection->state.load();
    do {
        if (current == ConnectionState::Closing || current == ConnectionState::Closed) {
            return;
        }
    } while (!connection->state.compare_exchange_weak(current, ConnectionState::Closing));

    bool wasRegistered = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(connection->clientId);
        if (it != m_connections.end() && it->second == connection) {
            m_connections.erase(it);
            wasRegistered = true;
        }
    }

    std::size_t pending = 0;
    {
        std::lock_guard<std::mutex> lock(connection->queueMutex);
        pending = connection->queue.size();
        connection->queue.clear();
    }

    const std::size_t removed = wasRegistered ? m_registry.unsubscribeClient(connection->clientId) : 0;
    connection->sink->close();
    connection->state.store(ConnectionState::Closed);

    RLOG_INFO(QStringLiteral("TransportManager"),
              QStringLiteral("teardown"),
              QStringLiteral("connection_closed"),
              reason,
              QStringLiteral("stream_sink"),
              rulecast::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"clientId", connection->clientId},
                              {"pendingFrames", pending},
                              {"subscriptionsRemoved", removed}}));

    emit connectionClosed(QString::fromStdString(connection->clientId));
}

} // namespace rulecast
