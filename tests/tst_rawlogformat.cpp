#include <QtTest>
#include "RawLogFormat.h"

class TestRawLogFormat : public QObject
{
    Q_OBJECT

private slots:
    void hexWithTimestamp();
    void textIsDecodedAsUtf8();
    void invalidUtf8IsReplaced();
};

void TestRawLogFormat::hexWithTimestamp()
{
    QByteArray chunk;
    chunk.append(static_cast<char>(0x7E));
    chunk.append("A");
    chunk.append(static_cast<char>(0xC0));

    QCOMPARE(formatRawChunk(chunk, true, true, QTime(9, 5, 7)), QString("09:05:07 7E 41 C0"));
    QCOMPARE(formatRawChunk(chunk, true, false), QString("7E 41 C0"));
}

void TestRawLogFormat::textIsDecodedAsUtf8()
{
    const QByteArray chunk("\xE2\x86\x91 OK");
    QCOMPARE(formatRawChunk(chunk, false, false), QString::fromUtf8("↑ OK"));
}

void TestRawLogFormat::invalidUtf8IsReplaced()
{
    QByteArray chunk("A");
    chunk.append(static_cast<char>(0xC0));
    chunk.append("B");

    const QString text = formatRawChunk(chunk, false, false);
    QVERIFY(text.startsWith('A'));
    QVERIFY(text.endsWith('B'));
    QVERIFY(text.contains(QChar(QChar::ReplacementCharacter)));
}

QTEST_APPLESS_MAIN(TestRawLogFormat)
#include "tst_rawlogformat.moc"
