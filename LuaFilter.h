#ifndef LUAFILTER_H
#define LUAFILTER_H

#include <QObject>
#include <QString>
#include <QByteArray>
#include "lua.hpp"

// Optional user script sitting between the pump and the decoder, and in
// front of outgoing commands. GUI thread only.
class LuaFilter : public QObject
{
    Q_OBJECT

public:
    explicit LuaFilter(QObject *parent = nullptr);
    ~LuaFilter();

    bool loadScript(const QString &filePath);
    bool isLoaded() const { return m_scriptLoaded; }
    QString getLastError() const { return m_lastError; }

    QByteArray processFrame(const QByteArray &frame);
    QByteArray processTx(const QByteArray &inputData);
    QByteArray triggerTick(int deltaMs);

    void setGlobalInt(const QString &name, int value);
    void updateCursorState(int lineCount, int cursorIndex);

signals:
    void statusMessageRequested(QString msg, int timeout);
    void logRequested(QString text);

private:
    void initLua();
    void closeLua();
    bool callFilter(const char *name, const QByteArray &input, QByteArray &result);

    lua_State *L = nullptr;
    QString m_lastError;
    bool m_scriptLoaded = false;
};

#endif // LUAFILTER_H
