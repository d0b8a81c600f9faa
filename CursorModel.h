#ifndef CURSORMODEL_H
#define CURSORMODEL_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <optional>
#include "ProtocolTables.h"

// Menu cursor over the decoded LCD lines.
// Lives on the GUI thread, only fed with complete line sets.
class CursorModel : public QObject
{
    Q_OBJECT

public:
    using Command = HhtProtocol::Command;

    explicit CursorModel(QObject *parent = nullptr);

    void setLines(const QStringList &lines);

    std::optional<Command> moveUp();
    std::optional<Command> moveDown();
    Command confirm();
    Command escape();

    void tickBlink();

    QString render() const;

    const QStringList &lines() const { return m_lines; }
    int cursorIndex() const { return m_cursorIndex; }
    bool isBlinkVisible() const { return m_blinkVisible; }
    bool isIdle() const { return m_lines.isEmpty(); }

signals:
    void rendered(const QString &text);
    void stateChanged(const QStringList &lines, int cursorIndex, bool blinkVisible);
    void commandReady(quint8 command);
    void acknowledged();

private:
    void emitRender();
    Command issue(Command cmd);

    QStringList m_lines;
    int m_cursorIndex = 0;
    bool m_blinkVisible = true;
};

#endif // CURSORMODEL_H
