#include "FrameExtractor.h"
#include "ProtocolTables.h"

QList<QByteArray> FrameExtractor::feed(const QByteArray &chunk)
{
    QList<QByteArray> frames;

    for (char c : chunk) {
        const quint8 b = static_cast<quint8>(c);

        if (b == HhtProtocol::FrameDelimiter) {
            if (m_armed && !m_buffer.isEmpty()) {
                // closing delimiter
                frames.append(m_buffer);
                m_buffer.clear();
                m_armed = false;
            } else {
                // opening delimiter, or "7E 7E" with nothing in between
                m_buffer.clear();
                m_armed = true;
            }
        } else if (m_armed) {
            m_buffer.append(c);
        }
        // noise outside of a frame is dropped
    }

    return frames;
}

void FrameExtractor::reset()
{
    m_buffer.clear();
    m_armed = false;
}
