#include "realtime/local_socket_sink.hpp"

#include <QMetaObject>

namespace rulecast {

LocalSocketSink::LocalSocketSink(QLocalSocket *socket, qint64 maxBacklogBytes, QObject *parent)
    : StreamSink(parent)
    , m_socket(socket)
    , m_maxBacklogBytes(maxBacklogBytes)
{
    if (!socket) {
        return;
    }
    connect(socket, &QLocalSocket::disconnected, this, &StreamSink::closed);
    connect(socket, &QLocalSocket::errorOccurred, this, [this](QLocalSocket::LocalSocketError) {
        emit closed();
    });
    connect(socket, &QLocalSocket::bytesWritten, this, [this](qint64) {
        if (m_socket && m_socket->bytesToWrite() <= m_maxBacklogBytes) {
            emit writable();
        }
    });
}

LocalSocketSink::~LocalSocketSink() = default;

SinkWriteStatus LocalSocketSink::write(const QByteArray &frame)
{
    if (!m_socket || m_socket->state() != QLocalSocket::ConnectedState) {
        return SinkWriteStatus::Failed;
    }
    if (m_socket->bytesToWrite() > m_maxBacklogBytes) {
        return SinkWriteStatus::Busy;
    }
    if (m_socket->write(frame) != frame.size()) {
        return SinkWriteStatus::Failed;
    }
    return SinkWriteStatus::Written;
}

void LocalSocketSink::close()
{
    // The socket is driven by its own thread; hop there before touching it.
    QPointer<QLocalSocket> socket = m_socket;
    if (!socket) {
        return;
    }
    QMetaObject::invokeMethod(
        socket.data(),
        [socket]() {
            if (socket && socket->state() != QLocalSocket::UnconnectedState) {
                socket->disconnectFromServer();
            }
        },
        Qt::QueuedConnection);
}

} // namespace rulecast
