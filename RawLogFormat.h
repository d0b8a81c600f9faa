#ifndef RAWLOGFORMAT_H
#define RAWLOGFORMAT_H

#include <QByteArray>
#include <QString>
#include <QTime>

// "7E 41 C0" style dump used by the raw log and the TX lines
QString hexDump(const QByteArray &data);

// One raw log line for a received chunk. Text mode decodes UTF-8,
// invalid sequences show up as U+FFFD.
QString formatRawChunk(const QByteArray &chunk, bool hex, bool timestamp,
                       const QTime &now = QTime::currentTime());

#endif // RAWLOGFORMAT_H
