#include "RawLogFormat.h"

QString hexDump(const QByteArray &data)
{
    return QString::fromLatin1(data.toHex(' ').toUpper());
}

QString formatRawChunk(const QByteArray &chunk, bool hex, bool timestamp, const QTime &now)
{
    const QString ts = timestamp ? now.toString("HH:mm:ss ") : QString();
    return ts + (hex ? hexDump(chunk) : QString::fromUtf8(chunk));
}
