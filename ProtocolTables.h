#ifndef PROTOCOLTABLES_H
#define PROTOCOLTABLES_H

#include <QChar>
#include <QString>
#include <QtGlobal>

// Byte level surface of the HHT serial port.
namespace HhtProtocol {

constexpr quint8 FrameDelimiter = 0x7E;
constexpr quint8 PaddingByte = 0x80;

constexpr quint8 PrintableMin = 32;
constexpr quint8 PrintableMax = 126;

// Outbound navigation commands
enum class Command : quint8 {
    Escape = 0x04,
    Up = 0x08,
    Down = 0x01,
    Enter = 0x02
};

constexpr bool isLineTerminator(quint8 b)
{
    return b == 0xC0 || b == 0x94 || b == 0xD4;
}

constexpr bool isPrintable(quint8 b)
{
    return b >= PrintableMin && b <= PrintableMax;
}

// Glyph for a non printable LCD byte, or a null QChar if the byte has none.
// 0xD4 is listed by the device tables but always terminates a line first.
inline QChar glyphFor(quint8 b)
{
    switch (b) {
    case 0xA3: return QChar(0x2191); // ↑
    case 0xA4: return QChar(0x2193); // ↓
    case 0xD4: return QChar(0x25CF); // ●
    case 0xE4: return QChar(0x25CB); // ○
    default:   return QChar();
    }
}

inline bool hasGlyph(quint8 b)
{
    return !glyphFor(b).isNull();
}

// Selection marker drawn in front of the current line
inline QString cursorMarker()
{
    return QStringLiteral("▶ ");
}

constexpr int BlinkIntervalMs = 500;
constexpr int AcknowledgeMs = 500;
constexpr int PumpIdleSleepMs = 5;

} // namespace HhtProtocol

#endif // PROTOCOLTABLES_H
