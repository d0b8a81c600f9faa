#include <QtTest>
#include "CursorModel.h"
#include "LineSplitter.h"

using Command = HhtProtocol::Command;

class TestCursorModel : public QObject
{
    Q_OBJECT

private slots:
    void startsIdle();
    void navigationIsNoOpWhenIdle();
    void moveUpWrapsToLastLine();
    void moveDownWrapsToFirstLine();
    void setLinesReducesIndexByModulo();
    void emptyLineSetKeepsStaleLines();
    void escapeLeavesStateAlone();
    void confirmPulsesAcknowledge();
    void blinkPairRestoresVisibility();
    void renderMarksSelectedLine();
    void glyphSurvivesToRenderedLine();
};

void TestCursorModel::startsIdle()
{
    CursorModel model;
    QVERIFY(model.isIdle());
    QCOMPARE(model.cursorIndex(), 0);
    QVERIFY(model.isBlinkVisible());
    QCOMPARE(model.render(), QString());
}

void TestCursorModel::navigationIsNoOpWhenIdle()
{
    CursorModel model;
    QSignalSpy commands(&model, &CursorModel::commandReady);
    QSignalSpy renders(&model, &CursorModel::rendered);

    QVERIFY(!model.moveUp().has_value());
    QVERIFY(!model.moveDown().has_value());
    model.tickBlink();

    QCOMPARE(commands.count(), 0);
    QCOMPARE(renders.count(), 0);
    QCOMPARE(model.cursorIndex(), 0);
}

void TestCursorModel::moveUpWrapsToLastLine()
{
    CursorModel model;
    model.setLines({"A", "B", "C"});
    QSignalSpy commands(&model, &CursorModel::commandReady);
    QSignalSpy renders(&model, &CursorModel::rendered);

    const std::optional<Command> cmd = model.moveUp();

    QVERIFY(cmd.has_value());
    QCOMPARE(static_cast<int>(*cmd), 0x08);
    QCOMPARE(model.cursorIndex(), 2);
    QCOMPARE(commands.count(), 1);
    QCOMPARE(commands.first().first().value<quint8>(), quint8(0x08));
    QCOMPARE(renders.count(), 1);
}

void TestCursorModel::moveDownWrapsToFirstLine()
{
    CursorModel model;
    model.setLines({"A", "B", "C"});
    model.moveDown();
    model.moveDown();
    QCOMPARE(model.cursorIndex(), 2);

    const std::optional<Command> cmd = model.moveDown();
    QVERIFY(cmd.has_value());
    QCOMPARE(static_cast<int>(*cmd), 0x01);
    QCOMPARE(model.cursorIndex(), 0);
}

void TestCursorModel::setLinesReducesIndexByModulo()
{
    CursorModel model;
    model.setLines({"0", "1", "2", "3", "4", "5", "6", "7"});
    model.moveUp(); // 0 -> 7
    QCOMPARE(model.cursorIndex(), 7);

    QSignalSpy states(&model, &CursorModel::stateChanged);
    model.setLines({"X", "Y", "Z"});

    // modulo, not clamp (clamping would give 2)
    QCOMPARE(model.cursorIndex(), 1);
    QCOMPARE(states.count(), 1);
    QCOMPARE(states.first().at(1).toInt(), 1);
}

void TestCursorModel::emptyLineSetKeepsStaleLines()
{
    CursorModel model;
    model.setLines({"A", "B"});
    model.moveDown();

    QSignalSpy renders(&model, &CursorModel::rendered);
    model.setLines({});

    QCOMPARE(renders.count(), 0);
    QCOMPARE(model.lines(), (QStringList{"A", "B"}));
    QCOMPARE(model.cursorIndex(), 1);
}

void TestCursorModel::escapeLeavesStateAlone()
{
    CursorModel model;
    model.setLines({"A", "B", "C"});
    model.moveDown();

    QSignalSpy commands(&model, &CursorModel::commandReady);
    QSignalSpy renders(&model, &CursorModel::rendered);

    QCOMPARE(static_cast<int>(model.escape()), 0x04);
    QCOMPARE(model.cursorIndex(), 1);
    QCOMPARE(model.lines().size(), 3);
    QCOMPARE(commands.count(), 1);
    QCOMPARE(renders.count(), 0);
}

void TestCursorModel::confirmPulsesAcknowledge()
{
    CursorModel model;
    QSignalSpy acks(&model, &CursorModel::acknowledged);
    QSignalSpy commands(&model, &CursorModel::commandReady);

    // ENT is sent even with nothing on screen
    QCOMPARE(static_cast<int>(model.confirm()), 0x02);
    QCOMPARE(acks.count(), 1);
    QCOMPARE(commands.count(), 1);
    QCOMPARE(commands.first().first().value<quint8>(), quint8(0x02));
}

void TestCursorModel::blinkPairRestoresVisibility()
{
    CursorModel model;
    model.setLines({"A"});
    QSignalSpy renders(&model, &CursorModel::rendered);

    const bool before = model.isBlinkVisible();
    model.tickBlink();
    QCOMPARE(model.isBlinkVisible(), !before);
    model.tickBlink();
    QCOMPARE(model.isBlinkVisible(), before);
    QCOMPARE(renders.count(), 2);
}

void TestCursorModel::renderMarksSelectedLine()
{
    CursorModel model;
    QSignalSpy renders(&model, &CursorModel::rendered);

    model.setLines({"MENU", "SETUP"});
    model.moveDown();

    const QString expected = QString::fromUtf8("  MENU\n▶ SETUP");
    QCOMPARE(model.render(), expected);
    QCOMPARE(renders.last().first().toString(), expected);

    model.tickBlink();
    QCOMPARE(model.render(), QString("  MENU\n  SETUP"));
}

void TestCursorModel::glyphSurvivesToRenderedLine()
{
    QByteArray frame;
    frame.append("FLOOR");
    frame.append(static_cast<char>(0xC0));
    frame.append(static_cast<char>(0xA3));
    frame.append(" 12");

    CursorModel model;
    model.setLines(LineSplitter::split(frame));
    model.tickBlink(); // hide marker

    const QStringList rows = model.render().split('\n');
    QCOMPARE(rows.size(), 2);
    QCOMPARE(rows.at(1).at(2), QChar(0x2191));
    QCOMPARE(rows.at(1), QString::fromUtf8("  ↑ 12"));
}

QTEST_GUILESS_MAIN(TestCursorModel)
#include "tst_cursormodel.moc"
