#include "LineSplitter.h"
#include "ProtocolTables.h"
#include <utility>

QStringList LineSplitter::split(const QByteArray &frame)
{
    QByteArray filtered = frame;
    filtered.removeIf([](char c) {
        return static_cast<quint8>(c) == HhtProtocol::PaddingByte;
    });

    QStringList lines;
    QByteArray buf;

    auto flush = [&]() {
        if (buf.isEmpty()) return;
        const QString line = decode(buf).trimmed();
        if (!line.isEmpty())
            lines.append(line);
        buf.clear();
    };

    for (char c : std::as_const(filtered)) {
        const quint8 b = static_cast<quint8>(c);

        // terminators win over the glyph table (0xD4 is in both)
        if (HhtProtocol::isLineTerminator(b)) {
            flush();
        } else if (HhtProtocol::isPrintable(b) || HhtProtocol::hasGlyph(b)) {
            buf.append(c);
        }
    }
    flush();

    return lines;
}

QString LineSplitter::decode(const QByteArray &raw)
{
    QString out;
    out.reserve(raw.size());

    for (char c : raw) {
        const quint8 b = static_cast<quint8>(c);
        const QChar glyph = HhtProtocol::glyphFor(b);

        if (!glyph.isNull()) {
            out.append(glyph);
        } else if (HhtProtocol::isPrintable(b)) {
            out.append(QLatin1Char(c));
        }
    }

    return out;
}
