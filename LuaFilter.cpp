#include "LuaFilter.h"
#include <QDebug>

static int panic_handler(lua_State *L) {
    const char* msg = lua_tostring(L, -1);
    qCritical() << "LUA PANIC:" << (msg ? msg : "Unknown error");
    return 0;
}

// print_status(msg, [timeout])
static int l_print_status(lua_State *L) {
    LuaFilter* self = static_cast<LuaFilter*>(lua_touserdata(L, lua_upvalueindex(1)));

    const char* msg = lua_tostring(L, 1);
    int timeout = static_cast<int>(luaL_optinteger(L, 2, 0));

    if (self && msg) {
        emit self->statusMessageRequested(QString::fromUtf8(msg), timeout);
    }
    return 0;
}

// print_log(msg) - line in the raw log pane
static int l_print_log(lua_State *L) {
    LuaFilter* self = static_cast<LuaFilter*>(lua_touserdata(L, lua_upvalueindex(1)));

    size_t len;
    const char* msg = lua_tolstring(L, 1, &len);

    if (self && msg) {
        emit self->logRequested(QString::fromUtf8(msg, static_cast<qsizetype>(len)));
    }
    return 0;
}

LuaFilter::LuaFilter(QObject *parent) : QObject(parent)
{
    initLua();
}

LuaFilter::~LuaFilter()
{
    closeLua();
}

void LuaFilter::initLua()
{
    closeLua();
    L = luaL_newstate();
    lua_atpanic(L, panic_handler);

    // no io / os for scripts
    static const luaL_Reg safe_libs[] = {
        {LUA_GNAME, luaopen_base},
        {LUA_TABLIBNAME, luaopen_table},
        {LUA_STRLIBNAME, luaopen_string},
        {LUA_MATHLIBNAME, luaopen_math},
        {LUA_UTF8LIBNAME, luaopen_utf8},
        {NULL, NULL}
    };

    for (const luaL_Reg *lib = safe_libs; lib->func; lib++) {
        luaL_requiref(L, lib->name, lib->func, 1);
        lua_pop(L, 1);
    }

    lua_pushlightuserdata(L, this);
    lua_pushcclosure(L, l_print_status, 1);
    lua_setglobal(L, "print_status");

    lua_pushlightuserdata(L, this);
    lua_pushcclosure(L, l_print_log, 1);
    lua_setglobal(L, "print_log");

    // command byte names for tx() scripts
    setGlobalInt("CMD_ESC", 0x04);
    setGlobalInt("CMD_UP", 0x08);
    setGlobalInt("CMD_DOWN", 0x01);
    setGlobalInt("CMD_ENT", 0x02);
}

void LuaFilter::closeLua()
{
    if (L) {
        lua_close(L);
        L = nullptr;
    }
    m_scriptLoaded = false;
}

bool LuaFilter::loadScript(const QString &filePath)
{
    m_scriptLoaded = false;
    m_lastError.clear();

    initLua();

    if (filePath.isEmpty()) {
        m_lastError = "No script selected";
        return false;
    }

    qDebug() << "LUA LOAD:" << filePath;

    if (luaL_dofile(L, filePath.toLocal8Bit().constData()) != LUA_OK) {
        m_lastError = QString::fromUtf8(lua_tostring(L, -1));
        lua_pop(L, 1);
        qWarning() << "LUA LOAD ERROR:" << m_lastError;
        return false;
    }

    m_scriptLoaded = true;
    return true;
}

// Calls name(input). Returns false if the hook is missing or failed,
// otherwise result holds the string it returned (empty for nil).
bool LuaFilter::callFilter(const char *name, const QByteArray &input, QByteArray &result)
{
    if (!L || !m_scriptLoaded) return false;

    lua_getglobal(L, name);
    if (!lua_isfunction(L, -1)) {
        lua_pop(L, 1);
        return false;
    }

    lua_pushlstring(L, input.constData(), input.size());

    if (lua_pcall(L, 1, 1, 0) != LUA_OK) {
        m_lastError = QString::fromUtf8(lua_tostring(L, -1));
        lua_pop(L, 1);
        qWarning() << "LUA" << name << "ERROR:" << m_lastError;
        return false;
    }

    result.clear();
    if (lua_isstring(L, -1)) {
        size_t len;
        const char* str = lua_tolstring(L, -1, &len);
        result = QByteArray(str, static_cast<qsizetype>(len));
    }

    lua_pop(L, 1);
    return true;
}

QByteArray LuaFilter::processFrame(const QByteArray &frame)
{
    QByteArray result;
    if (!callFilter("frame", frame, result))
        return frame; // no hook or broken hook: pass through

    return result;
}

QByteArray LuaFilter::processTx(const QByteArray &inputData)
{
    QByteArray result;
    if (!callFilter("tx", inputData, result))
        return inputData;

    return result;
}

QByteArray LuaFilter::triggerTick(int deltaMs)
{
    if (!L || !m_scriptLoaded) return QByteArray();

    lua_getglobal(L, "on_tick");

    if (!lua_isfunction(L, -1)) {
        lua_pop(L, 1);
        return QByteArray();
    }

    lua_pushinteger(L, deltaMs);

    if (lua_pcall(L, 1, 1, 0) != LUA_OK) {
        m_lastError = QString::fromUtf8(lua_tostring(L, -1));
        lua_pop(L, 1);
        qWarning() << "LUA TICK ERROR:" << m_lastError;
        return QByteArray();
    }

    QByteArray result;
    if (lua_isstring(L, -1)) {
        size_t len;
        const char* str = lua_tolstring(L, -1, &len);
        result = QByteArray(str, static_cast<qsizetype>(len));
    }

    lua_pop(L, 1);
    return result;
}

void LuaFilter::setGlobalInt(const QString &name, int value)
{
    if (!L) return;

    lua_pushinteger(L, value);
    lua_setglobal(L, name.toUtf8().constData());
}

void LuaFilter::updateCursorState(int lineCount, int cursorIndex)
{
    setGlobalInt("LCD_LINES", lineCount);
    setGlobalInt("CURSOR_INDEX", cursorIndex);
}
