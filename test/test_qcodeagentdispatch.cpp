// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/qcodemode.h"
#include "agent/qcodetool.h"
#include "agent/qcodetooldispatcher.h"
#include "agent/tool/qcodetoolmode.h"
#include "qcode_test.h"

#include <QSignalSpy>
#include <QtCore>
#include <QtTest>

namespace {

QCodeToolCall makeCall(const QString &id, const QString &name, const json &arguments = json::object())
{
    QCodeToolCall call;
    call.id        = id;
    call.name      = name;
    call.arguments = arguments;
    return call;
}

} // namespace

class Test : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() { TestApp::instance(); }

    void testOneResultPerCallInOrder()
    {
        QCodeToolRegistry registry;
        QCodeModeGate     gate;
        QCodeTestLog      log;
        registry.registerTool(new QCodeTestTool(&registry, "slow", false, &log, 150));
        registry.registerTool(new QCodeTestTool(&registry, "fast", false, &log, 0));

        QCodeToolDispatcher          dispatcher(nullptr, &registry, &gate);
        const QList<QCodeToolResult> results = dispatcher.dispatch(
            {makeCall("a", "slow", {{"value", "1"}}),
             makeCall("b", "fast", {{"value", "2"}}),
             makeCall("c", "slow", {{"value", "3"}})});

        QCOMPARE(results.size(), 3);
        QCOMPARE(results[0].callId, QString("a"));
        QCOMPARE(results[0].content, QString("slow:1"));
        QCOMPARE(results[1].callId, QString("b"));
        QCOMPARE(results[1].content, QString("fast:2"));
        QCOMPARE(results[2].callId, QString("c"));
        QCOMPARE(results[2].content, QString("slow:3"));
    }

    void testReadOnlyCallsRunConcurrently()
    {
        QCodeToolRegistry registry;
        QCodeModeGate     gate;
        QCodeTestLog      log;
        registry.registerTool(new QCodeTestTool(&registry, "look", false, &log, 300));

        QCodeToolDispatcher dispatcher(nullptr, &registry, &gate);
        dispatcher.setMaxParallelTools(3);

        QElapsedTimer timer;
        timer.start();
        const QList<QCodeToolResult> results = dispatcher.dispatch(
            {makeCall("1", "look"), makeCall("2", "look"), makeCall("3", "look")});

        QCOMPARE(results.size(), 3);
        QVERIFY(log.peak.load() >= 2);
        QVERIFY(timer.elapsed() < 850);
    }

    void testParallelismIsBounded()
    {
        QCodeToolRegistry registry;
        QCodeModeGate     gate;
        QCodeTestLog      log;
        registry.registerTool(new QCodeTestTool(&registry, "look", false, &log, 50));

        QCodeToolDispatcher dispatcher(nullptr, &registry, &gate);
        dispatcher.setMaxParallelTools(2);
        QCOMPARE(dispatcher.maxParallelTools(), 2);

        QList<QCodeToolCall> calls;
        for (int i = 0; i < 6; ++i) {
            calls.append(makeCall(QString::number(i), "look"));
        }
        QCOMPARE(dispatcher.dispatch(calls).size(), 6);
        QVERIFY(log.peak.load() <= 2);
    }

    void testMutatingCallIsBarrier()
    {
        QCodeToolRegistry registry;
        QCodeModeGate     gate;
        QCodeTestLog      log;
        registry.registerTool(new QCodeTestTool(&registry, "r1", false, &log, 150));
        registry.registerTool(new QCodeTestTool(&registry, "r2", false, &log, 150));
        registry.registerTool(new QCodeTestTool(&registry, "w", true, &log, 50));
        registry.registerTool(new QCodeTestTool(&registry, "r3", false, &log, 0));

        QCodeToolDispatcher dispatcher(nullptr, &registry, &gate);
        const QList<QCodeToolResult> results = dispatcher.dispatch(
            {makeCall("1", "r1"), makeCall("2", "r2"), makeCall("3", "w"), makeCall("4", "r3")});

        QCOMPARE(results.size(), 4);
        for (const QCodeToolResult &result : results) {
            QVERIFY(result.isSuccess());
        }

        /* Every earlier call finishes before the write starts, later calls start after it ends */
        QVERIFY(log.indexOf("end:r1") < log.indexOf("start:w"));
        QVERIFY(log.indexOf("end:r2") < log.indexOf("start:w"));
        QVERIFY(log.indexOf("end:w") < log.indexOf("start:r3"));
    }

    void testUnknownTool()
    {
        QCodeToolRegistry registry;
        QCodeModeGate     gate;
        registry.registerTool(new QCodeTestTool(&registry, "known", false));

        QCodeToolDispatcher          dispatcher(nullptr, &registry, &gate);
        const QList<QCodeToolResult> results
            = dispatcher.dispatch({makeCall("x", "mystery"), makeCall("y", "known")});

        QCOMPARE(results[0].errorKind, QCodeToolErrorKind::UnknownTool);
        QCOMPARE(results[0].toMessageContent(), QString("Error [UnknownTool]: Tool 'mystery' not found"));
        QVERIFY(results[1].isSuccess());
    }

    void testInvalidArgumentsNotExecuted()
    {
        QCodeToolRegistry registry;
        QCodeModeGate     gate;
        auto             *tool = new QCodeTestTool(&registry, "sample", false);
        registry.registerTool(tool);

        QCodeToolDispatcher          dispatcher(nullptr, &registry, &gate);
        const QList<QCodeToolResult> results
            = dispatcher.dispatch({makeCall("1", "sample", {{"count", "three"}})});

        QCOMPARE(results[0].errorKind, QCodeToolErrorKind::InvalidArguments);
        QVERIFY(results[0].content.contains("'count' must be of type integer"));
        QCOMPARE(tool->executions.load(), 0);
    }

    void testPlanModeDeniesWithoutExecuting()
    {
        QCodeToolRegistry registry;
        QCodeModeGate     gate(nullptr, QCodeMode::Plan);
        auto             *writer = new QCodeTestTool(&registry, "writer", true);
        auto             *reader = new QCodeTestTool(&registry, "reader", false);
        registry.registerTool(writer);
        registry.registerTool(reader);

        QCodeToolDispatcher          dispatcher(nullptr, &registry, &gate);
        const QList<QCodeToolResult> results
            = dispatcher.dispatch({makeCall("1", "writer"), makeCall("2", "reader")});

        QCOMPARE(results[0].outcome, QCodeToolResult::Outcome::Denied);
        QVERIFY(results[0].toMessageContent().startsWith("PermissionDenied: Tool 'writer' denied"));
        QCOMPARE(writer->executions.load(), 0);
        QVERIFY(results[1].isSuccess());
        QCOMPARE(reader->executions.load(), 1);
    }

    void testModeSwitchInBatchAffectsLaterCalls()
    {
        QCodeToolRegistry registry;
        QCodeModeGate     gate;
        auto             *writer = new QCodeTestTool(&registry, "writer", true);
        registry.registerTool(writer);
        registry.registerTool(new QCodeToolSetMode(&registry, &gate));

        QCodeToolDispatcher          dispatcher(nullptr, &registry, &gate);
        const QList<QCodeToolResult> results = dispatcher.dispatch(
            {makeCall("1", "writer"), makeCall("2", "set_mode", {{"mode", "plan"}}), makeCall("3", "writer")});

        QVERIFY(results[0].isSuccess());
        QVERIFY(results[1].isSuccess());
        QCOMPARE(results[2].outcome, QCodeToolResult::Outcome::Denied);
        QCOMPARE(writer->executions.load(), 1);
        QCOMPARE(gate.mode(), QCodeMode::Plan);
    }

    void testCancelStopsBatch()
    {
        QCodeToolRegistry registry;
        QCodeModeGate     gate;
        QCodeTestLog      log;
        auto             *slow  = new QCodeTestTool(&registry, "slow", true, &log, 5000);
        auto             *after = new QCodeTestTool(&registry, "after", false, &log, 0);
        registry.registerTool(slow);
        registry.registerTool(after);

        QCodeToolDispatcher dispatcher(nullptr, &registry, &gate);
        QTimer::singleShot(100, &dispatcher, [&dispatcher]() { dispatcher.cancel(); });

        QElapsedTimer timer;
        timer.start();
        const QList<QCodeToolResult> results
            = dispatcher.dispatch({makeCall("1", "slow"), makeCall("2", "after")});

        QVERIFY(timer.elapsed() < 3000);
        QCOMPARE(results.size(), 2);
        QCOMPARE(results[0].errorKind, QCodeToolErrorKind::Cancelled);
        QCOMPARE(results[1].errorKind, QCodeToolErrorKind::Cancelled);
        QCOMPARE(after->executions.load(), 0);
        QVERIFY(dispatcher.isCancelled());

        dispatcher.resetCancel();
        QVERIFY(!dispatcher.isCancelled());
    }

    void testCancelFromOtherThread()
    {
        QCodeToolRegistry registry;
        QCodeModeGate     gate;
        QCodeTestLog      log;
        registry.registerTool(new QCodeTestTool(&registry, "slow", false, &log, 5000));

        QCodeToolDispatcher dispatcher(nullptr, &registry, &gate);
        QThread            *canceller = QThread::create([&dispatcher]() {
            QThread::msleep(100);
            dispatcher.cancel();
        });
        canceller->start();

        const QList<QCodeToolResult> results
            = dispatcher.dispatch({makeCall("1", "slow"), makeCall("2", "slow")});

        canceller->wait();
        delete canceller;

        QCOMPARE(results.size(), 2);
        QCOMPARE(results[0].errorKind, QCodeToolErrorKind::Cancelled);
        QCOMPARE(results[1].errorKind, QCodeToolErrorKind::Cancelled);
    }

    void testThrowingToolBecomesError()
    {
        QCodeToolRegistry registry;
        QCodeModeGate     gate;
        auto             *tool = new QCodeTestTool(&registry, "boom", false);
        tool->throwOnExecute   = true;
        registry.registerTool(tool);

        QCodeToolDispatcher          dispatcher(nullptr, &registry, &gate);
        const QList<QCodeToolResult> results = dispatcher.dispatch({makeCall("1", "boom")});

        QCOMPARE(results[0].errorKind, QCodeToolErrorKind::ProcessError);
        QVERIFY(results[0].content.contains("tool exploded"));
    }

    void testSignalsPerCall()
    {
        QCodeToolRegistry registry;
        QCodeModeGate     gate;
        registry.registerTool(new QCodeTestTool(&registry, "sample", false));

        QCodeToolDispatcher dispatcher(nullptr, &registry, &gate);
        QSignalSpy          called(&dispatcher, &QCodeToolDispatcher::toolCalled);
        QSignalSpy          finished(&dispatcher, &QCodeToolDispatcher::toolResult);

        dispatcher.dispatch({makeCall("1", "sample", {{"value", "v"}}), makeCall("2", "missing")});

        QCOMPARE(called.count(), 2);
        QCOMPARE(finished.count(), 2);
        QCOMPARE(called.at(0).at(0).toString(), QString("sample"));
    }

    void testEmptyBatch()
    {
        QCodeToolRegistry   registry;
        QCodeToolDispatcher dispatcher(nullptr, &registry, nullptr);
        QVERIFY(dispatcher.dispatch({}).isEmpty());
    }
};

QTEST_APPLESS_MAIN(Test)
#include "test_qcodeagentdispatch.moc"
