#ifndef BYTETRANSPORT_H
#define BYTETRANSPORT_H

#include <QByteArray>
#include <QString>

// Byte source/sink the stream pump and the command path talk to.
// bytesAvailable() and read() are called from the pump thread,
// write() from the GUI thread.
class ByteTransport
{
public:
    virtual ~ByteTransport() = default;

    virtual qint64 bytesAvailable() const = 0;
    virtual QByteArray read(qint64 maxSize) = 0;
    virtual bool write(const QByteArray &data) = 0;

    virtual bool isOpen() const = 0;
    virtual QString errorString() const = 0;
};

#endif // BYTETRANSPORT_H
