#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"
#include "realtime/stream_sink.hpp"

namespace rulecast {

class SubscriptionRegistry;

/**
 * TransportManager owns one persistent stream per connected client.
 *
 * send() may be called from any thread. Frames go into a bounded per-client
 * queue and are written to the sink on the manager's own thread, in order.
 * A client whose queue overflows is either disconnected or loses its oldest
 * frames, depending on the overflow policy; either way other clients are
 * unaffected. Closing a connection runs exactly once and removes all of the
 * client's subscriptions.
 */
class TransportManager : public QObject
{
    Q_OBJECT
public:
    struct Options {
        std::chrono::milliseconds heartbeatInterval{30000};
        std::size_t queueCapacity = 256;
        OverflowPolicy overflowPolicy = OverflowPolicy::Disconnect;
    };

    struct Stats {
        std::size_t connections = 0;
        std::uint64_t framesSent = 0;
        std::uint64_t framesDropped = 0;
        std::uint64_t overflowDisconnects = 0;
    };

    TransportManager(SubscriptionRegistry &registry, Options options, QObject *parent = nullptr);
    ~TransportManager() override;

    // Starts the heartbeat timer.
    void start();

    // Registers sink as the stream for clientId and queues the "connected"
    // handshake. An existing connection for the same client is closed first.
    void createConnection(const std::string &clientId, std::shared_ptr<StreamSink> sink);

    // Queues message for clientId. When subscriptionId is set the frame is
    // discarded at write time if that subscription no longer exists.
    bool send(const std::string &clientId,
              const nlohmann::json &message,
              const std::string &subscriptionId = std::string());

    void closeConnection(const std::string &clientId);

    // Queues a heartbeat frame on every open connection.
    void sendHeartbeats();

    bool isConnected(const std::string &clientId) const;
    std::optional<ConnectionState> connectionState(const std::string &clientId) const;
    std::size_t connectionCount() const;
    Stats stats() const;

signals:
    void connectionClosed(const QString &clientId);

private:
    struct Frame {
        QByteArray payload;
        std::string subscriptionId;
    };

    struct ClientConnection {
        std::string clientId;
        std::shared_ptr<StreamSink> sink;
        std::atomic<ConnectionState> state{ConnectionState::Connecting};

        std::mutex queueMutex;
        std::deque<Frame> queue;
        bool flushScheduled = false;
        std::chrono::system_clock::time_point lastHeartbeat;
    };
    using ConnectionPtr = std::shared_ptr<ClientConnection>;

    ConnectionPtr find(const std::string &clientId) const;
    bool enqueue(const ConnectionPtr &connection, Frame frame);
    void scheduleFlush(const ConnectionPtr &connection);
    void flush(const ConnectionPtr &connection);
    void teardown(const ConnectionPtr &connection, const QString &reason);

    SubscriptionRegistry &m_registry;
    Options m_options;
    QTimer m_heartbeatTimer;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, ConnectionPtr> m_connections;

    std::atomic<std::uint64_t> m_framesSent{0};
    std::atomic<std::uint64_t> m_framesDropped{0};
    std::atomic<std::uint64_t> m_overflowDisconnects{0};
};

} // namespace rulecast
