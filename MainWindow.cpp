/* MainWindow.cpp*/
#include "MainWindow.h"
#include "LineSplitter.h"
#include "ProtocolTables.h"
#include "RawLogFormat.h"
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QSerialPortInfo>
#include <QMessageBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QDir>
#include <QSplitter>
#include <QSettings>
#include <QCloseEvent>
#include <QStatusBar>
#include <QDebug>
#include <QHash>
#include <QSet>
#include <QSignalBlocker>
#include <utility>

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent),
      m_cursor(new CursorModel(this)),
      m_transport(new SerialTransport(this))
{
    m_sender = new CommandSender(m_transport, &m_lua, this);

    setWindowTitle("hhtQterm - RS232 HHT Terminal");

    QWidget *centralWidget = new QWidget(this);
    setCentralWidget(centralWidget);
    QVBoxLayout *mainLayout = new QVBoxLayout(centralWidget);

    // --- PORT BAR ---
    QHBoxLayout *controlsLayout = new QHBoxLayout();

    m_portCombo = new PortSelector();
    m_portCombo->setMaxVisibleItems(15);

    m_baudCombo = new QComboBox();
    QList<qint32> baudRates = {1200, 2400, 4800, 9600, 19200, 38400, 57600, 115200, 230400, 921600};
    for (qint32 baud : baudRates) {
        m_baudCombo->addItem(QString::number(baud), baud);
    }
    m_baudCombo->setCurrentText("115200"); // Default

    // Frame selection (Data Bits / Parity / Stop Bits)
    m_frameCombo = new QComboBox();
    m_frameCombo->addItem("8N1 (Standard)", "8N1");
    m_frameCombo->addItem("8E1 (8bit Even 1stop)", "8E1");
    m_frameCombo->addItem("8O1 (8bit Odd  1stop)", "8O1");
    m_frameCombo->addItem("8M1 (8bit Mark 1stop)", "8M1");
    m_frameCombo->addItem("8S1 (8bit Space 1stop)", "8S1");
    m_frameCombo->addItem("8N1.5 (8bit None 1.5stop)", "8N1.5");
    m_frameCombo->addItem("8N2 (8bit None 2stop)", "8N2");
    m_frameCombo->addItem("7E1 (7bit Even 1stop)", "7E1");
    m_frameCombo->addItem("7O1 (7bit Odd  1stop)", "7O1");
    m_frameCombo->addItem("7N1 (7bit None 1stop)", "7N1");
    m_frameCombo->addItem("7N2 (Teletype)", "7N2");
    m_frameCombo->setToolTip("Frame format: Data bits / Parity / Stop bits");

    m_connectBtn = new QPushButton("Connect");
    m_connectBtn->setFocusPolicy(Qt::NoFocus);

    m_btnLoadScript = new QPushButton("Script...");
    m_btnLoadScript->setFocusPolicy(Qt::NoFocus);

    m_scriptCheck = new QCheckBox("Filter");
    m_scriptCheck->setToolTip("Activate Lua filter");
    m_scriptCheck->setFocusPolicy(Qt::NoFocus);
    connect(m_scriptCheck, &QCheckBox::toggled, m_sender, &CommandSender::setFilterEnabled);

    controlsLayout->addWidget(new QLabel("Port:"));
    controlsLayout->addWidget(m_portCombo, 1);
    controlsLayout->addWidget(new QLabel("Baud:"));
    controlsLayout->addWidget(m_baudCombo);
    controlsLayout->addWidget(m_frameCombo);
    controlsLayout->addSpacing(10);
    controlsLayout->addWidget(m_connectBtn);
    controlsLayout->addStretch();
    controlsLayout->addWidget(m_btnLoadScript);
    controlsLayout->addWidget(m_scriptCheck);

    mainLayout->addLayout(controlsLayout);

    // --- LOG + LCD ---
    QSplitter *split = new QSplitter(Qt::Horizontal);

    QWidget *left = new QWidget();
    QVBoxLayout *leftLayout = new QVBoxLayout(left);
    leftLayout->setContentsMargins(0, 0, 0, 0);

    QHBoxLayout *logOpts = new QHBoxLayout();
    m_tsCheck = new QCheckBox("Timestamp");
    m_tsCheck->setChecked(true);
    m_hexCheck = new QCheckBox("HEX view");
    m_hexCheck->setChecked(true);
    logOpts->addWidget(m_tsCheck);
    logOpts->addWidget(m_hexCheck);
    logOpts->addStretch(1);
    leftLayout->addLayout(logOpts);

    m_log = new QPlainTextEdit();
    m_log->setReadOnly(true);
    m_log->setMaximumBlockCount(5000);
    m_log->setFocusPolicy(Qt::NoFocus);
    leftLayout->addWidget(m_log, 1);
    split->addWidget(left);

    QWidget *right = new QWidget();
    QVBoxLayout *rightLayout = new QVBoxLayout(right);
    rightLayout->setContentsMargins(0, 0, 0, 0);
    rightLayout->addWidget(new QLabel("LCD Terminal"));
    m_lcd = new LcdWidget();
    rightLayout->addWidget(m_lcd, 1);
    split->addWidget(right);
    split->setStretchFactor(1, 3);

    mainLayout->addWidget(split, 1);

    // --- NAVIGATION BUTTONS ---
    QHBoxLayout *btnLayout = new QHBoxLayout();
    m_escBtn = new QPushButton("ESC");
    m_upBtn = new QPushButton("UP");
    m_dnBtn = new QPushButton("DN");
    m_entBtn = new QPushButton("ENT");

    m_escBtn->setShortcut(QKeySequence(Qt::Key_Escape));
    m_upBtn->setShortcut(QKeySequence(Qt::Key_Up));
    m_dnBtn->setShortcut(QKeySequence(Qt::Key_Down));
    m_entBtn->setShortcut(QKeySequence(Qt::Key_Return));

    for (QPushButton *b : {m_escBtn, m_upBtn, m_dnBtn, m_entBtn}) {
        b->setFixedHeight(50);
        b->setStyleSheet("font-size:16px;font-weight:bold;");
        b->setFocusPolicy(Qt::NoFocus);
        btnLayout->addWidget(b, 1);
    }
    mainLayout->addLayout(btnLayout);

    // --- WIRING ---
    connect(m_portCombo, &PortSelector::aboutToPopup, this, &MainWindow::refreshPorts);
    connect(m_portCombo, &QComboBox::currentIndexChanged, this, &MainWindow::restorePortProfile);
    connect(m_connectBtn, &QPushButton::clicked, this, &MainWindow::toggleConnection);

    connect(m_transport, &SerialTransport::errorOccurred, this, &MainWindow::onTransportError);

    connect(m_escBtn, &QPushButton::clicked, m_cursor, [this](){ m_cursor->escape(); });
    connect(m_upBtn, &QPushButton::clicked, m_cursor, [this](){ m_cursor->moveUp(); });
    connect(m_dnBtn, &QPushButton::clicked, m_cursor, [this](){ m_cursor->moveDown(); });
    connect(m_entBtn, &QPushButton::clicked, m_cursor, [this](){ m_cursor->confirm(); });

    connect(m_cursor, &CursorModel::rendered, m_lcd, &LcdWidget::setText);
    connect(m_cursor, &CursorModel::commandReady, m_sender, &CommandSender::sendCommand);
    connect(m_sender, &CommandSender::logLine, this, &MainWindow::appendLog);
    connect(m_cursor, &CursorModel::acknowledged, this, [this](){
        m_lcd->setHighlighted(true);
        QTimer::singleShot(HhtProtocol::AcknowledgeMs, m_lcd, [this](){
            m_lcd->setHighlighted(false);
        });
    });
    connect(m_cursor, &CursorModel::stateChanged, this, [this](const QStringList &lines, int index, bool){
        m_lua.updateCursorState(lines.size(), index);
    });

    m_blinkTimer = new QTimer(this);
    m_blinkTimer->setInterval(HhtProtocol::BlinkIntervalMs);
    connect(m_blinkTimer, &QTimer::timeout, m_cursor, &CursorModel::tickBlink);
    m_blinkTimer->start();

    // scripting
    connect(&m_lua, &LuaFilter::statusMessageRequested, this, [this](QString msg, int timeout){
        statusBar()->showMessage(msg, timeout);
    });
    connect(&m_lua, &LuaFilter::logRequested, this, &MainWindow::appendLog);
    connect(m_btnLoadScript, &QPushButton::clicked, this, &MainWindow::onScriptButtonClicked);

    m_luaTimer = new QTimer(this);
    m_luaTimer->setInterval(100); // 100 ms period
    connect(m_luaTimer, &QTimer::timeout, this, &MainWindow::onLuaTick);
    m_luaTimer->start();
    m_luaStatsTimer.start();

    refreshPorts();
    resize(1280, 800);
    loadSettings();

    statusBar()->showMessage("Disconnected");
}

MainWindow::~MainWindow()
{
    disconnectPort();
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    disconnectPort();
    saveSettings();
    QMainWindow::closeEvent(event);
}

static QString profileKey(const QString &port, const char *field)
{
    return QString("PortSettings/%1_%2").arg(port, QLatin1String(field));
}

void MainWindow::restorePortProfile()
{
    const QString port = m_portCombo->currentData().toString();
    if (port.isEmpty()) return;

    QSettings settings("hhtQterm", "hhtQterm");

    const int baud = settings.value(profileKey(port, "Baud"), 115200).toInt();
    const int baudIdx = m_baudCombo->findData(baud);
    if (baudIdx != -1)
        m_baudCombo->setCurrentIndex(baudIdx);

    // unknown or stale codes fall back to the factory 8N1
    int frameIdx = m_frameCombo->findData(settings.value(profileKey(port, "Frame")).toString());
    if (frameIdx == -1)
        frameIdx = m_frameCombo->findData("8N1");
    m_frameCombo->setCurrentIndex(frameIdx);
}

void MainWindow::saveSettings()
{
    QSettings settings("hhtQterm", "hhtQterm");

    settings.setValue("geometry", saveGeometry());
    settings.setValue("windowState", saveState());

    settings.setValue("log/timestamp", m_tsCheck->isChecked());
    settings.setValue("log/hex", m_hexCheck->isChecked());

    QString currentPort = m_portCombo->currentData().toString();
    settings.setValue("lastPort", currentPort);

    if (!currentPort.isEmpty()) {
        settings.setValue(profileKey(currentPort, "Baud"), m_baudCombo->currentData().toInt());
        settings.setValue(profileKey(currentPort, "Frame"), m_frameCombo->currentData().toString());
    }
}

void MainWindow::loadSettings()
{
    QSettings settings("hhtQterm", "hhtQterm");

    if (settings.contains("geometry")) {
        restoreGeometry(settings.value("geometry").toByteArray());
    }
    if (settings.contains("windowState")) {
        restoreState(settings.value("windowState").toByteArray());
    }

    m_tsCheck->setChecked(settings.value("log/timestamp", true).toBool());
    m_hexCheck->setChecked(settings.value("log/hex", true).toBool());

    const int lastIdx = m_portCombo->findData(settings.value("lastPort").toString());
    if (lastIdx != -1)
        m_portCombo->setCurrentIndex(lastIdx);

    restorePortProfile();
}

void MainWindow::refreshPorts()
{
    const QString selected = m_portCombo->currentData().toString();

    QHash<QString, QString> descriptions;
    const QList<QSerialPortInfo> infos = QSerialPortInfo::availablePorts();
    for (const QSerialPortInfo &info : infos)
        descriptions.insert(info.portName(), info.description());

    QSet<QString> remembered;
    QSettings settings("hhtQterm", "hhtQterm");
    for (auto it = descriptions.cbegin(); it != descriptions.cend(); ++it) {
        if (settings.contains(profileKey(it.key(), "Baud")))
            remembered.insert(it.key());
    }

    const QSignalBlocker blocker(m_portCombo);
    m_portCombo->clear();

    const QStringList ranked = rankPortNames(descriptions.keys(), remembered);
    for (const QString &name : ranked) {
        const QString desc = descriptions.value(name);
        m_portCombo->addItem(desc.isEmpty() ? name : QString("%1 (%2)").arg(name, desc), name);
    }

    const int idx = m_portCombo->findData(selected);
    m_portCombo->setCurrentIndex(idx != -1 ? idx : 0);
}

void MainWindow::toggleConnection()
{
    if (m_transport->isOpen()) {
        disconnectPort();
    } else {
        connectPort();
    }
}

void MainWindow::connectPort()
{
    SerialSettings cfg;
    cfg.portName = m_portCombo->currentData().toString();
    if (cfg.portName.isEmpty()) return;

    cfg.baudRate = m_baudCombo->currentData().toInt();
    if (!cfg.setFrameCode(m_frameCombo->currentData().toString())) {
        QMessageBox::warning(this, "Frame", "Invalid frame format");
        return;
    }

    if (!m_transport->open(cfg)) {
        QMessageBox::critical(this, "Open Port", "Can't open port:\n" + m_transport->errorString());
        return;
    }

    // fresh pump, fresh frame state
    m_pump = new StreamPump(m_transport, this);
    connect(m_pump, &StreamPump::rawReceived, this, &MainWindow::onRawReceived);
    connect(m_pump, &StreamPump::frameReceived, this, &MainWindow::onFrameReceived);
    m_pump->start();

    setConnectedUi(true);
    statusBar()->showMessage("Connected: " + cfg.portName + " " + QString::number(cfg.baudRate) + " " + cfg.frameCode());
}

void MainWindow::disconnectPort()
{
    if (m_pump) {
        m_pump->stop();
        delete m_pump;
        m_pump = nullptr;
    }

    if (m_transport->isOpen()) {
        m_transport->close();
        statusBar()->showMessage("Disconnected");
    }

    setConnectedUi(false);
}

void MainWindow::setConnectedUi(bool connected)
{
    m_connectBtn->setText(connected ? "Disconnect" : "Connect");
    m_portCombo->setEnabled(!connected);
    m_baudCombo->setEnabled(!connected);
    m_frameCombo->setEnabled(!connected);
}

void MainWindow::onTransportError(const QString &message)
{
    // open() failures are reported by connectPort()
    if (!m_pump) return;

    disconnectPort();
    appendLog("[PORT ERROR] " + message);
    statusBar()->showMessage("Port error: " + message);
}

void MainWindow::appendLog(const QString &line)
{
    m_log->appendPlainText(line);
}

void MainWindow::onRawReceived(const QByteArray &chunk)
{
    appendLog(formatRawChunk(chunk, m_hexCheck->isChecked(), m_tsCheck->isChecked()));
}

void MainWindow::onFrameReceived(const QByteArray &frame)
{
    QByteArray data = frame;

    if (m_scriptCheck->isChecked()) {
        data = m_lua.processFrame(frame);
        if (data.isEmpty()) return; // dropped by script
    }

    m_cursor->setLines(LineSplitter::split(data));
}

void MainWindow::onScriptButtonClicked()
{
    QSettings settings("hhtQterm", "hhtQterm");
    QString lastDir = settings.value("scripts/lastDir", QDir::homePath()).toString();

    QString fileName = QFileDialog::getOpenFileName(this, "Select Lua Script",
                                                    lastDir, "Lua Scripts (*.lua)");

    if (fileName.isEmpty()) return;

    settings.setValue("scripts/lastDir", QFileInfo(fileName).absolutePath());

    if (m_lua.loadScript(fileName)) {
        statusBar()->showMessage("Script loaded: " + QFileInfo(fileName).fileName(), 3000);
        m_scriptCheck->setChecked(true);
        m_lua.updateCursorState(m_cursor->lines().size(), m_cursor->cursorIndex());
    } else {
        QMessageBox::critical(this, "Error", m_lua.getLastError());
    }
}

void MainWindow::onLuaTick()
{
    qint64 realDelta = m_luaStatsTimer.restart();
    if (realDelta > 1000) realDelta = 1000;

    if (!m_scriptCheck->isChecked()) return;

    QByteArray dataToSend = m_lua.triggerTick(static_cast<int>(realDelta));
    if (dataToSend.isEmpty() || !m_transport->isOpen()) return;

    m_sender->sendRaw(dataToSend);
}
