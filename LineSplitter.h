#ifndef LINESPLITTER_H
#define LINESPLITTER_H

#include <QByteArray>
#include <QString>
#include <QStringList>

// Turns one frame into the LCD lines it carries.
class LineSplitter
{
public:
    // Never returns blank lines. A frame of only control bytes gives an empty list.
    static QStringList split(const QByteArray &frame);

    // Glyph bytes map to their glyph, printable bytes to ASCII, anything else is dropped.
    static QString decode(const QByteArray &raw);
};

#endif // LINESPLITTER_H
