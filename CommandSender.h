#ifndef COMMANDSENDER_H
#define COMMANDSENDER_H

#include <QObject>
#include <QByteArray>
#include <QString>

class ByteTransport;
class LuaFilter;

// Outbound path for navigation command bytes. GUI thread only.
// A failed write is reported once and never retried.
class CommandSender : public QObject
{
    Q_OBJECT

public:
    explicit CommandSender(ByteTransport *transport, LuaFilter *lua = nullptr, QObject *parent = nullptr);

    void setFilterEnabled(bool enabled) { m_filterEnabled = enabled; }
    bool isFilterEnabled() const { return m_filterEnabled; }

public slots:
    bool sendCommand(quint8 command);
    bool sendRaw(const QByteArray &data);

signals:
    void logLine(const QString &line);

private:
    ByteTransport *m_transport;
    LuaFilter *m_lua;
    bool m_filterEnabled = false;
};

#endif // COMMANDSENDER_H
