#pragma once

#include <QByteArray>
#include <QObject>

namespace rulecast {

enum class SinkWriteStatus {
    Written,
    // The peer is not draining; retry after writable() is emitted.
    Busy,
    Failed
};

/**
 * StreamSink is one client's outbound byte stream.
 *
 * write() is only called from the thread that owns the TransportManager.
 * close() may be called from any thread and is idempotent. Implementations
 * emit closed() when the peer goes away and writable() when a Busy sink has
 * drained enough to accept more frames.
 */
class StreamSink : public QObject
{
    Q_OBJECT
public:
    explicit StreamSink(QObject *parent = nullptr)
        : QObject(parent)
    {
    }
    ~StreamSink() override = default;

    virtual SinkWriteStatus write(const QByteArray &frame) = 0;
    virtual void close() = 0;

signals:
    void closed();
    void writable();
};

} // namespace rulecast
