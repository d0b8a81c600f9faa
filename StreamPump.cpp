#include "StreamPump.h"
#include "ByteTransport.h"
#include "ProtocolTables.h"
#include <QDebug>

StreamPump::StreamPump(ByteTransport *transport, QObject *parent)
    : QThread(parent), m_transport(transport)
{
}

StreamPump::~StreamPump()
{
    stop();
}

void StreamPump::stop()
{
    if (!isRunning()) return;

    requestInterruption();
    wait();
}

void StreamPump::run()
{
    qDebug() << "StreamPump started";
    m_extractor.reset();

    while (!isInterruptionRequested()) {
        const qint64 n = m_transport->bytesAvailable();

        if (n > 0) {
            const QByteArray data = m_transport->read(n);
            if (!data.isEmpty()) {
                emit rawReceived(data);

                const QList<QByteArray> frames = m_extractor.feed(data);
                for (const QByteArray &frame : frames)
                    emit frameReceived(frame);
            }
        } else {
            msleep(HhtProtocol::PumpIdleSleepMs);
        }
    }

    qDebug() << "StreamPump stopped, dropped" << m_extractor.pendingBytes() << "pending byte(s)";
}
