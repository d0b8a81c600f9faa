#ifndef FRAMEEXTRACTOR_H
#define FRAMEEXTRACTOR_H

#include <QByteArray>
#include <QList>

// Cuts 0x7E delimited frames out of an arbitrarily chunked byte stream.
// Not thread safe, owned by whichever thread feeds it.
class FrameExtractor
{
public:
    FrameExtractor() = default;

    QList<QByteArray> feed(const QByteArray &chunk);
    void reset();

    bool isArmed() const { return m_armed; }
    int pendingBytes() const { return m_buffer.size(); }

private:
    QByteArray m_buffer;
    bool m_armed = false;
};

#endif // FRAMEEXTRACTOR_H
