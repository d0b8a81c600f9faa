#include "SerialTransport.h"
#include <QMutexLocker>
#include <QDebug>
#include <QRegularExpression>
#include <algorithm>

bool SerialSettings::setFrameCode(const QString &code)
{
    if (code.size() < 3) return false;

    // 1. Data Bits (First character)
    switch (code.at(0).toLatin1()) {
    case '5': dataBits = QSerialPort::Data5; break;
    case '6': dataBits = QSerialPort::Data6; break;
    case '7': dataBits = QSerialPort::Data7; break;
    case '8': dataBits = QSerialPort::Data8; break;
    default: return false;
    }

    // 2. Parity (Second character)
    switch (code.at(1).toUpper().toLatin1()) {
    case 'N': parity = QSerialPort::NoParity;    break;
    case 'E': parity = QSerialPort::EvenParity;  break;
    case 'O': parity = QSerialPort::OddParity;   break;
    case 'M': parity = QSerialPort::MarkParity;  break;
    case 'S': parity = QSerialPort::SpaceParity; break;
    default: return false;
    }

    // 3. Stop Bits (rest)
    const QString stop = code.mid(2);
    if (stop == "1") {
        stopBits = QSerialPort::OneStop;
    } else if (stop == "1.5") {
        stopBits = QSerialPort::OneAndHalfStop;
    } else if (stop == "2") {
        stopBits = QSerialPort::TwoStop;
    } else {
        return false;
    }

    return true;
}

QString SerialSettings::frameCode() const
{
    QString code = QString::number(static_cast<int>(dataBits));

    switch (parity) {
    case QSerialPort::EvenParity:  code += 'E'; break;
    case QSerialPort::OddParity:   code += 'O'; break;
    case QSerialPort::MarkParity:  code += 'M'; break;
    case QSerialPort::SpaceParity: code += 'S'; break;
    default:                       code += 'N'; break;
    }

    switch (stopBits) {
    case QSerialPort::OneAndHalfStop: code += "1.5"; break;
    case QSerialPort::TwoStop:        code += "2";   break;
    default:                          code += "1";   break;
    }

    return code;
}

QStringList rankPortNames(const QStringList &names, const QSet<QString> &remembered)
{
    static const QRegularExpression phantomUart("^ttyS([4-9]|\\d{2,})$");

    QStringList ranked;
    for (const QString &name : names) {
        if (!phantomUart.match(name).hasMatch())
            ranked.append(name);
    }

    auto rank = [&](const QString &name) {
        if (remembered.contains(name)) return 0;
        if (name.contains("USB") || name.contains("ACM")) return 1;
        return 2;
    };

    std::sort(ranked.begin(), ranked.end(), [&](const QString &a, const QString &b) {
        const int ra = rank(a);
        const int rb = rank(b);
        return ra != rb ? ra < rb : a < b;
    });

    return ranked;
}

SerialTransport::SerialTransport(QObject *parent)
    : QObject(parent), m_serial(new QSerialPort(this))
{
    connect(m_serial, &QSerialPort::readyRead, this, &SerialTransport::onReadyRead);
    connect(m_serial, &QSerialPort::errorOccurred, this, &SerialTransport::onPortError);
}

SerialTransport::~SerialTransport()
{
    if (m_serial->isOpen())
        m_serial->close();
}

bool SerialTransport::open(const SerialSettings &settings)
{
    if (m_serial->isOpen())
        close();

    m_serial->setPortName(settings.portName);
    m_serial->setBaudRate(settings.baudRate);
    m_serial->setDataBits(settings.dataBits);
    m_serial->setParity(settings.parity);
    m_serial->setStopBits(settings.stopBits);
    m_serial->setFlowControl(QSerialPort::NoFlowControl);

    {
        QMutexLocker locker(&m_rxLock);
        m_rxBuffer.clear();
    }

    if (!m_serial->open(QIODevice::ReadWrite)) {
        m_lastError = m_serial->errorString();
        qWarning() << "Can't open" << settings.portName << ":" << m_lastError;
        return false;
    }

    m_lastError.clear();
    qDebug() << "Opened" << settings.portName << settings.baudRate << settings.frameCode();
    return true;
}

void SerialTransport::close()
{
    if (m_serial->isOpen())
        m_serial->close();

    QMutexLocker locker(&m_rxLock);
    m_rxBuffer.clear();
}

qint64 SerialTransport::bytesAvailable() const
{
    QMutexLocker locker(&m_rxLock);
    return m_rxBuffer.size();
}

QByteArray SerialTransport::read(qint64 maxSize)
{
    QMutexLocker locker(&m_rxLock);

    const qsizetype n = qMin<qsizetype>(maxSize, m_rxBuffer.size());
    QByteArray chunk = m_rxBuffer.left(n);
    m_rxBuffer.remove(0, n);
    return chunk;
}

bool SerialTransport::write(const QByteArray &data)
{
    if (!m_serial->isOpen()) {
        m_lastError = "Port not open";
        return false;
    }

    const qint64 written = m_serial->write(data);
    if (written != data.size()) {
        m_lastError = m_serial->errorString();
        return false;
    }

    return true;
}

bool SerialTransport::isOpen() const
{
    return m_serial->isOpen();
}

QString SerialTransport::errorString() const
{
    return m_lastError;
}

void SerialTransport::onReadyRead()
{
    const QByteArray data = m_serial->readAll();
    if (data.isEmpty()) return;

    QMutexLocker locker(&m_rxLock);
    m_rxBuffer.append(data);
}

void SerialTransport::onPortError(QSerialPort::SerialPortError error)
{
    if (error == QSerialPort::NoError) return;

    m_lastError = m_serial->errorString();

    if (error == QSerialPort::ResourceError || error == QSerialPort::PermissionError
        || error == QSerialPort::DeviceNotFoundError) {
        qCritical() << "Serial port error:" << m_lastError;
        emit errorOccurred(m_lastError);
    } else {
        qWarning() << "Serial port warning:" << m_lastError;
    }
}
