#pragma once

#include <QLocalSocket>
#include <QPointer>

#include "realtime/stream_sink.hpp"

namespace rulecast {

// StreamSink over an accepted QLocalSocket. The socket stays owned by its
// server; the sink only writes to it and disconnects it.
class LocalSocketSink : public StreamSink
{
    Q_OBJECT
public:
    LocalSocketSink(QLocalSocket *socket, qint64 maxBacklogBytes, QObject *parent = nullptr);
    ~LocalSocketSink() override;

    SinkWriteStatus write(const QByteArray &frame) override;
    void close() override;

private:
    QPointer<QLocalSocket> m_socket;
    qint64 m_maxBacklogBytes;
};

} // namespace rulecast
