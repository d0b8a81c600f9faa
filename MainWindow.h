#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QComboBox>
#include <QPushButton>
#include <QCheckBox>
#include <QPlainTextEdit>
#include <QTimer>
#include <QElapsedTimer>
#include "LcdWidget.h"
#include "CursorModel.h"
#include "SerialTransport.h"
#include "StreamPump.h"
#include "LuaFilter.h"
#include "CommandSender.h"


// Port picker that lets the window rescan devices right before the list opens
class PortSelector : public QComboBox
{
    Q_OBJECT
public:
    using QComboBox::QComboBox;

signals:
    void aboutToPopup();

protected:
    void showPopup() override {
        emit aboutToPopup();
        QComboBox::showPopup();
    }
};

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(QWidget *parent = nullptr);
    ~MainWindow();
protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void refreshPorts();
    void toggleConnection();
    void onRawReceived(const QByteArray &chunk);
    void onFrameReceived(const QByteArray &frame);

    void restorePortProfile();
    void onTransportError(const QString &message);
    void onScriptButtonClicked();
    void onLuaTick();

private:
    void loadSettings();
    void saveSettings();

    void connectPort();
    void disconnectPort();
    void setConnectedUi(bool connected);
    void appendLog(const QString &line);

    LcdWidget *m_lcd;
    QPlainTextEdit *m_log;
    CursorModel *m_cursor;

    SerialTransport *m_transport;
    CommandSender *m_sender;
    StreamPump *m_pump = nullptr;

    PortSelector *m_portCombo;
    QComboBox *m_baudCombo;
    QComboBox *m_frameCombo;
    QPushButton *m_connectBtn;

    QCheckBox *m_tsCheck;
    QCheckBox *m_hexCheck;

    QPushButton *m_escBtn;
    QPushButton *m_upBtn;
    QPushButton *m_dnBtn;
    QPushButton *m_entBtn;

    QTimer *m_blinkTimer;

    LuaFilter m_lua;
    QPushButton *m_btnLoadScript;
    QCheckBox *m_scriptCheck;
    QTimer *m_luaTimer;
    QElapsedTimer m_luaStatsTimer;
};

#endif // MAINWINDOW_H
