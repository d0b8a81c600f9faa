#include <QtTest>
#include "StreamPump.h"
#include "FakeTransport.h"

static QByteArray frameOf(const QByteArray &payload)
{
    QByteArray out;
    out.append(static_cast<char>(0x7E));
    out.append(payload);
    out.append(static_cast<char>(0x7E));
    return out;
}

// Stands in for the GUI side: lives on the test thread and collects
// whatever the pump hands over through queued delivery.
class FrameSink : public QObject
{
    Q_OBJECT

public:
    void attach(StreamPump *pump)
    {
        connect(pump, &StreamPump::frameReceived, this, [this](const QByteArray &frame) {
            if (QThread::currentThread() != thread())
                wrongThread = true;
            frames.append(frame);
        });
        connect(pump, &StreamPump::rawReceived, this, [this](const QByteArray &chunk) {
            if (QThread::currentThread() != thread())
                wrongThread = true;
            raw.append(chunk);
        });
    }

    QList<QByteArray> frames;
    QByteArray raw;
    bool wrongThread = false;
};

class TestStreamPump : public QObject
{
    Q_OBJECT

private slots:
    void deliversFramesInOrderOnConsumerThread();
    void forwardsRawChunks();
    void reassemblesFramesFedLater();
    void stopEndsTheLoop();
};

void TestStreamPump::deliversFramesInOrderOnConsumerThread()
{
    FakeTransport transport;
    StreamPump pump(&transport);
    FrameSink sink;
    sink.attach(&pump);

    QList<QByteArray> expected;
    QByteArray stream;
    for (int i = 0; i < 50; ++i) {
        const QByteArray payload = "F" + QByteArray::number(i);
        expected.append(payload);
        stream += frameOf(payload);
    }
    transport.push(stream);

    pump.start();
    QTRY_COMPARE(sink.frames.size(), 50);
    pump.stop();

    QCOMPARE(sink.frames, expected);
    QVERIFY(!sink.wrongThread);
}

void TestStreamPump::forwardsRawChunks()
{
    FakeTransport transport;
    StreamPump pump(&transport);
    FrameSink sink;
    sink.attach(&pump);

    pump.start();
    transport.push("noise");
    QTRY_COMPARE(sink.raw, QByteArray("noise"));
    pump.stop();

    QVERIFY(sink.frames.isEmpty());
    QVERIFY(!sink.wrongThread);
}

void TestStreamPump::reassemblesFramesFedLater()
{
    FakeTransport transport;
    StreamPump pump(&transport);
    FrameSink sink;
    sink.attach(&pump);

    pump.start();
    transport.push(QByteArray(1, static_cast<char>(0x7E)) + "MEN");
    QTRY_COMPARE(sink.raw.size(), 4);
    QVERIFY(sink.frames.isEmpty());

    transport.push(QByteArray("U") + static_cast<char>(0x7E));
    QTRY_COMPARE(sink.frames.size(), 1);
    pump.stop();

    QCOMPARE(sink.frames.first(), QByteArray("MENU"));
    QVERIFY(!sink.wrongThread);
}

void TestStreamPump::stopEndsTheLoop()
{
    FakeTransport transport;
    StreamPump pump(&transport);

    pump.start();
    QVERIFY(pump.isRunning());
    pump.stop();

    QVERIFY(pump.isFinished());
    pump.stop(); // second stop is harmless
}

QTEST_GUILESS_MAIN(TestStreamPump)
#include "tst_streampump.moc"
