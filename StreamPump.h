#ifndef STREAMPUMP_H
#define STREAMPUMP_H

#include <QThread>
#include <QByteArray>
#include "FrameExtractor.h"

class ByteTransport;

// Worker that drains the transport and hands frames to the GUI thread.
// Signals are delivered queued, so the receiver sees them in production order.
class StreamPump : public QThread
{
    Q_OBJECT

public:
    explicit StreamPump(ByteTransport *transport, QObject *parent = nullptr);
    ~StreamPump();

    // Asks the loop to finish and waits for it; a read in progress completes first
    void stop();

signals:
    void rawReceived(const QByteArray &chunk);
    void frameReceived(const QByteArray &frame);

protected:
    void run() override;

private:
    ByteTransport *m_transport;
    FrameExtractor m_extractor; // touched only from run()
};

#endif // STREAMPUMP_H
