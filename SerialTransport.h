#ifndef SERIALTRANSPORT_H
#define SERIALTRANSPORT_H

#include <QObject>
#include <QSerialPort>
#include <QMutex>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QSet>
#include "ByteTransport.h"

struct SerialSettings
{
    QString portName;
    qint32 baudRate = 115200;
    QSerialPort::DataBits dataBits = QSerialPort::Data8;
    QSerialPort::Parity parity = QSerialPort::NoParity;
    QSerialPort::StopBits stopBits = QSerialPort::OneStop;

    // "8N1", "7E1", "8M1", "8N1.5", "8N2" ...
    bool setFrameCode(const QString &code);
    QString frameCode() const;
};

// Port picker order: ports with a stored profile, then USB/ACM adapters,
// then everything else by name. On-board ttyS4 and up are hidden.
QStringList rankPortNames(const QStringList &names, const QSet<QString> &remembered);

// QSerialPort backed transport.
// The port stays on the GUI thread; received bytes are parked in a locked
// buffer which the pump thread drains through bytesAvailable()/read().
class SerialTransport : public QObject, public ByteTransport
{
    Q_OBJECT

public:
    explicit SerialTransport(QObject *parent = nullptr);
    ~SerialTransport();

    bool open(const SerialSettings &settings);
    void close();

    qint64 bytesAvailable() const override;
    QByteArray read(qint64 maxSize) override;
    bool write(const QByteArray &data) override;

    bool isOpen() const override;
    QString errorString() const override;

signals:
    void errorOccurred(const QString &message);

private slots:
    void onReadyRead();
    void onPortError(QSerialPort::SerialPortError error);

private:
    QSerialPort *m_serial;

    mutable QMutex m_rxLock;
    QByteArray m_rxBuffer;

    QString m_lastError;
};

#endif // SERIALTRANSPORT_H
