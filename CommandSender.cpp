#include "CommandSender.h"
#include "ByteTransport.h"
#include "LuaFilter.h"
#include "RawLogFormat.h"
#include <QDebug>

CommandSender::CommandSender(ByteTransport *transport, LuaFilter *lua, QObject *parent)
    : QObject(parent), m_transport(transport), m_lua(lua)
{
}

bool CommandSender::sendCommand(quint8 command)
{
    QByteArray data(1, static_cast<char>(command));

    if (m_lua && m_filterEnabled) {
        // the script may rewrite or swallow the command
        data = m_lua->processTx(data);
        if (data.isEmpty()) return false;
    }

    return sendRaw(data);
}

bool CommandSender::sendRaw(const QByteArray &data)
{
    if (data.isEmpty()) return false;

    if (!m_transport->write(data)) {
        const QString reason = m_transport->errorString();
        qWarning() << "TX failed:" << reason;
        emit logLine("[TX ERROR] " + reason);
        return false;
    }

    emit logLine("[TX] " + hexDump(data));
    return true;
}
