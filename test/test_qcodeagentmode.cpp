// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/qcodemode.h"
#include "agent/qcodetool.h"
#include "agent/tool/qcodetoolmode.h"
#include "qcode_test.h"

#include <QSignalSpy>
#include <QtConcurrent/QtConcurrent>
#include <QtCore>
#include <QtTest>

class Test : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() { TestApp::instance(); }

    void testModeNames()
    {
        QCOMPARE(qcodeModeName(QCodeMode::Plan), QString("plan"));
        QCOMPARE(qcodeModeName(QCodeMode::Execute), QString("execute"));
    }

    void testParseMode()
    {
        bool ok = false;
        QCOMPARE(qcodeParseMode("plan", &ok), QCodeMode::Plan);
        QVERIFY(ok);
        QCOMPARE(qcodeParseMode(" EXECUTE ", &ok), QCodeMode::Execute);
        QVERIFY(ok);
        QCOMPARE(qcodeParseMode("exec", &ok), QCodeMode::Execute);
        QVERIFY(ok);
        qcodeParseMode("readonly", &ok);
        QVERIFY(!ok);
    }

    void testDefaultModeIsExecute()
    {
        QCodeModeGate gate;
        QCOMPARE(gate.mode(), QCodeMode::Execute);
        QVERIFY(gate.check("bash", true).allowed);
        QVERIFY(gate.check("read", false).allowed);
    }

    void testPlanModeDeniesMutatingTools()
    {
        QCodeModeGate         gate(nullptr, QCodeMode::Plan);
        const QCodePermission permission = gate.check("write", true);

        QVERIFY(!permission.allowed);
        QCOMPARE(
            permission.reason,
            QString("Tool 'write' denied: read-only mode active (current mode: plan)"));
    }

    void testPlanModeAllowsReadOnlyTools()
    {
        QCodeModeGate gate(nullptr, QCodeMode::Plan);
        QVERIFY(gate.check("read", false).allowed);
        QVERIFY(gate.check("lsp_definition", false).allowed);
        QVERIFY(gate.check("read", false).reason.isEmpty());
    }

    void testSetModeEmitsOnlyOnChange()
    {
        QCodeModeGate gate;
        QSignalSpy    spy(&gate, &QCodeModeGate::modeChanged);

        gate.setMode(QCodeMode::Execute);
        QCOMPARE(spy.count(), 0);

        gate.setMode(QCodeMode::Plan);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).value<QCodeMode>(), QCodeMode::Plan);

        gate.setMode(QCodeMode::Plan);
        QCOMPARE(spy.count(), 1);
    }

    void testToggle()
    {
        QCodeModeGate gate;
        QSignalSpy    spy(&gate, &QCodeModeGate::modeChanged);

        QCOMPARE(gate.toggle(), QCodeMode::Plan);
        QCOMPARE(gate.mode(), QCodeMode::Plan);
        QCOMPARE(gate.toggle(), QCodeMode::Execute);
        QCOMPARE(gate.mode(), QCodeMode::Execute);
        QCOMPARE(spy.count(), 2);
    }

    void testConcurrentTogglesAreNotLost()
    {
        QCodeModeGate gate;
        QThreadPool   pool;
        pool.setMaxThreadCount(4);

        /* An even number of toggles returns to the starting mode */
        QList<QFuture<void>> futures;
        for (int worker = 0; worker < 4; ++worker) {
            futures.append(QtConcurrent::run(&pool, [&gate]() {
                for (int i = 0; i < 250; ++i) {
                    gate.toggle();
                }
            }));
        }
        for (auto &future : futures) {
            future.waitForFinished();
        }

        QCOMPARE(gate.mode(), QCodeMode::Execute);
    }

    void testCheckSeesModeChangeImmediately()
    {
        QCodeModeGate gate;
        QVERIFY(gate.check("edit", true).allowed);
        gate.setMode(QCodeMode::Plan);
        QVERIFY(!gate.check("edit", true).allowed);
        gate.setMode(QCodeMode::Execute);
        QVERIFY(gate.check("edit", true).allowed);
    }

    void testDeniedResultText()
    {
        QCodeModeGate gate(nullptr, QCodeMode::Plan);
        const QCodeToolResult result = QCodeToolResult::denied(gate.check("bash", true).reason);

        QCOMPARE(result.outcome, QCodeToolResult::Outcome::Denied);
        QCOMPARE(
            result.toMessageContent(),
            QString("PermissionDenied: Tool 'bash' denied: read-only mode active (current mode: plan)"));
    }

    void testSetModeToolEntersPlan()
    {
        QCodeModeGate    gate;
        QCodeToolSetMode tool(nullptr, &gate);

        QVERIFY(tool.isMutating());
        const QCodeToolResult result = tool.execute({{"mode", "plan"}});
        QVERIFY(result.isSuccess());
        QCOMPARE(result.content, QString("Mode changed from execute to plan"));
        QCOMPARE(gate.mode(), QCodeMode::Plan);

        /* The tool is itself gated, so the model cannot leave plan mode */
        QVERIFY(!gate.check(tool.getName(), tool.isMutating()).allowed);
    }

    void testSetModeToolRejectsUnknownMode()
    {
        QCodeModeGate    gate;
        QCodeToolSetMode tool(nullptr, &gate);

        const QCodeToolResult result = tool.execute({{"mode", "yolo"}});
        QCOMPARE(result.outcome, QCodeToolResult::Outcome::Error);
        QCOMPARE(result.errorKind, QCodeToolErrorKind::InvalidArguments);
        QCOMPARE(gate.mode(), QCodeMode::Execute);
    }

    void testSetModeToolAlreadyInMode()
    {
        QCodeModeGate    gate;
        QCodeToolSetMode tool(nullptr, &gate);

        const QCodeToolResult result = tool.execute({{"mode", "execute"}});
        QVERIFY(result.isSuccess());
        QCOMPARE(result.content, QString("Mode is already execute"));
    }
};

QTEST_APPLESS_MAIN(Test)
#include "test_qcodeagentmode.moc"
