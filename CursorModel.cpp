#include "CursorModel.h"

CursorModel::CursorModel(QObject *parent) : QObject(parent)
{
}

void CursorModel::setLines(const QStringList &lines)
{
    // Transient empty frames must not blank the display
    if (lines.isEmpty()) return;

    m_lines = lines;
    m_cursorIndex %= m_lines.size();

    emitRender();
}

std::optional<CursorModel::Command> CursorModel::moveUp()
{
    if (m_lines.isEmpty()) return std::nullopt;

    const int count = m_lines.size();
    m_cursorIndex = (m_cursorIndex - 1 + count) % count;
    emitRender();

    return issue(Command::Up);
}

std::optional<CursorModel::Command> CursorModel::moveDown()
{
    if (m_lines.isEmpty()) return std::nullopt;

    m_cursorIndex = (m_cursorIndex + 1) % m_lines.size();
    emitRender();

    return issue(Command::Down);
}

CursorModel::Command CursorModel::confirm()
{
    emit acknowledged();
    return issue(Command::Enter);
}

CursorModel::Command CursorModel::escape()
{
    return issue(Command::Escape);
}

void CursorModel::tickBlink()
{
    m_blinkVisible = !m_blinkVisible;
    emitRender();
}

QString CursorModel::render() const
{
    QStringList rows;
    rows.reserve(m_lines.size());

    for (int i = 0; i < m_lines.size(); ++i) {
        const bool marked = (i == m_cursorIndex && m_blinkVisible);
        rows.append((marked ? HhtProtocol::cursorMarker() : QStringLiteral("  ")) + m_lines.at(i));
    }

    return rows.join('\n');
}

void CursorModel::emitRender()
{
    // nothing to draw while idle
    if (m_lines.isEmpty()) return;

    emit stateChanged(m_lines, m_cursorIndex, m_blinkVisible);
    emit rendered(render());
}

CursorModel::Command CursorModel::issue(Command cmd)
{
    emit commandReady(static_cast<quint8>(cmd));
    return cmd;
}
