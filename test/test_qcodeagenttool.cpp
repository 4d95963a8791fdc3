// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/qcodemode.h"
#include "agent/qcodetool.h"
#include "agent/tool/qcodetoolfile.h"
#include "agent/tool/qcodetoolgit.h"
#include "agent/tool/qcodetoolsearch.h"
#include "agent/tool/qcodetoolshell.h"
#include "common/qcodeprocess.h"
#include "qcode_test.h"

#include <limits>

#include <QDir>
#include <QFile>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QtCore>
#include <QtTest>

namespace {

bool writeFile(const QString &path, const QByteArray &content)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    return file.write(content) == content.size();
}

QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

qint64 readPidFile(const QString &path)
{
    bool         ok  = false;
    const qint64 pid = readFile(path).trimmed().toLongLong(&ok);
    return ok ? pid : -1;
}

/* A reaped or zombie process counts as gone */
bool processAlive(qint64 pid)
{
    const QByteArray stat = readFile(QString("/proc/%1/stat").arg(pid));
    if (stat.isEmpty()) {
        return false;
    }
    const int close = stat.lastIndexOf(')');
    return close < 0 || stat.mid(close + 2, 1) != "Z";
}

} // namespace

class Test : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir tempDir;
    QString       projectPath;

private slots:
    void initTestCase()
    {
        TestApp::instance();
        QVERIFY(tempDir.isValid());
        projectPath = tempDir.path();

        QVERIFY(writeFile(projectPath + "/src/main.cpp", "int main()\n{\n    return helper();\n}\n"));
        QVERIFY(writeFile(projectPath + "/src/helper.cpp", "int helper()\n{\n    return 42;\n}\n"));
        QVERIFY(writeFile(projectPath + "/src/helper.h", "int helper();\n"));
        QVERIFY(writeFile(projectPath + "/README.md", "# Demo\nCall helper() to get 42.\n"));
        QVERIFY(writeFile(projectPath + "/.git/config", "helper = not a match target\n"));
    }

    /* Registry */

    void testRegistryRegisterAndGet()
    {
        QCodeToolRegistry registry;
        auto             *tool = new QCodeTestTool(&registry, "sample", false);

        QCOMPARE(registry.registerTool(tool), QCodeRegistryStatus::Registered);
        QCOMPARE(registry.count(), 1);
        QCOMPARE(registry.getTool("sample"), static_cast<QCodeTool *>(tool));
        QVERIFY(registry.getTool("nonexistent") == nullptr);
        QVERIFY(registry.hasTool("sample"));
        QVERIFY(!registry.hasTool("nonexistent"));
    }

    void testRegistryRejectsDuplicates()
    {
        QCodeToolRegistry registry;
        auto             *first  = new QCodeTestTool(&registry, "sample", false);
        auto             *second = new QCodeTestTool(&registry, "sample", true);

        QCOMPARE(registry.registerTool(first), QCodeRegistryStatus::Registered);
        QCOMPARE(registry.registerTool(second), QCodeRegistryStatus::DuplicateTool);
        QCOMPARE(registry.count(), 1);
        QCOMPARE(registry.getTool("sample"), static_cast<QCodeTool *>(first));
    }

    void testRegistryRejectsNullTool()
    {
        QCodeToolRegistry registry;
        QCOMPARE(registry.registerTool(nullptr), QCodeRegistryStatus::NullTool);
        QCOMPARE(registry.count(), 0);
    }

    void testValidateSchema()
    {
        QVERIFY(QCodeToolRegistry::validateSchema({{"type", "object"}, {"properties", json::object()}})
                    .isEmpty());
        QVERIFY(!QCodeToolRegistry::validateSchema(json::array()).isEmpty());
        QVERIFY(!QCodeToolRegistry::validateSchema({{"type", "string"}}).isEmpty());
        QVERIFY(!QCodeToolRegistry::validateSchema(
                     {{"type", "object"},
                      {"properties", {{"a", {{"type", "string"}}}}},
                      {"required", json::array({"b"})}})
                     .isEmpty());
    }

    void testToolDefinitionsFollowMode()
    {
        QCodeToolRegistry registry;
        QCodeModeGate     gate;
        registry.registerTool(new QCodeTestTool(&registry, "look", false));
        registry.registerTool(new QCodeTestTool(&registry, "change", true));

        QCOMPARE(qcodeToolNames(registry.getToolDefinitions()).size(), 2);
        QCOMPARE(qcodeToolNames(registry.getToolDefinitions(&gate)).size(), 2);

        gate.setMode(QCodeMode::Plan);
        const QStringList names = qcodeToolNames(registry.getToolDefinitions(&gate));
        QCOMPARE(names, QStringList({"look"}));

        const json definition = registry.getTool("look")->getDefinition();
        QCOMPARE(definition["type"].get<std::string>(), std::string("function"));
        QVERIFY(definition["function"]["parameters"].is_object());
    }

    void testValidateArguments()
    {
        const json schema
            = {{"type", "object"},
               {"properties",
                {{"path", {{"type", "string"}}},
                 {"line", {{"type", "integer"}}},
                 {"flag", {{"type", "boolean"}}}}},
               {"required", json::array({"path", "line"})}};

        QVERIFY(QCodeToolRegistry::validateArguments(schema, {{"path", "a"}, {"line", 3}}).isEmpty());
        QVERIFY(QCodeToolRegistry::validateArguments(schema, {{"path", "a"}, {"line", 3.0}}).isEmpty());
        QVERIFY(QCodeToolRegistry::validateArguments(schema, {{"path", "a"}, {"line", 3}, {"extra", 1}})
                    .isEmpty());

        QVERIFY(QCodeToolRegistry::validateArguments(schema, {{"path", "a"}})
                    .contains("missing required parameter 'line'"));
        QVERIFY(QCodeToolRegistry::validateArguments(schema, {{"path", 1}, {"line", 3}})
                    .contains("'path' must be of type string"));
        QVERIFY(!QCodeToolRegistry::validateArguments(schema, {{"path", "a"}, {"line", 2.5}}).isEmpty());
        QVERIFY(!QCodeToolRegistry::validateArguments(schema, {{"path", "a"}, {"line", 1}, {"flag", "yes"}})
                     .isEmpty());
        QVERIFY(!QCodeToolRegistry::validateArguments(schema, json::array()).isEmpty());

        /* Integral values beyond the 64-bit range are still integers */
        QVERIFY(QCodeToolRegistry::validateArguments(schema, {{"path", "a"}, {"line", 1e300}}).isEmpty());
        QVERIFY(!QCodeToolRegistry::validateArguments(
                     schema, {{"path", "a"}, {"line", std::numeric_limits<double>::infinity()}})
                     .isEmpty());
    }

    void testResultMessageContent()
    {
        QCOMPARE(QCodeToolResult::success("fine").toMessageContent(), QString("fine"));
        QCOMPARE(
            QCodeToolResult::error(QCodeToolErrorKind::Timeout, "too slow").toMessageContent(),
            QString("Error [Timeout]: too slow"));
        QCOMPARE(
            QCodeToolResult::denied("no").toMessageContent(), QString("PermissionDenied: no"));
    }

    void testAbortAllSetsFlags()
    {
        QCodeToolRegistry registry;
        auto             *tool = new QCodeTestTool(&registry, "sample", false);
        registry.registerTool(tool);

        registry.abortAll();
        QVERIFY(tool->isAborted());
        registry.resetAbortAll();
        QVERIFY(!tool->isAborted());
    }

    /* File tools */

    void testFileReadNumbersLines()
    {
        QCodeToolFileRead     tool(nullptr, projectPath);
        const QCodeToolResult result = tool.execute({{"file_path", "src/helper.cpp"}});

        QVERIFY(result.isSuccess());
        QVERIFY(result.content.contains("     1\tint helper()"));
        QVERIFY(result.content.contains("     3\t    return 42;"));
        QVERIFY(!tool.isMutating());
    }

    void testFileReadOffsetAndLimit()
    {
        QCodeToolFileRead     tool(nullptr, projectPath);
        const QCodeToolResult result
            = tool.execute({{"file_path", "src/helper.cpp"}, {"offset", 2}, {"limit", 2}});

        QVERIFY(result.isSuccess());
        QVERIFY(!result.content.contains("int helper()"));
        QVERIFY(result.content.contains("     2\t{"));
        QVERIFY(result.content.contains("     3\t"));
        QVERIFY(!result.content.contains("     4\t"));
    }

    void testFileReadMissingFile()
    {
        QCodeToolFileRead     tool(nullptr, projectPath);
        const QCodeToolResult result = tool.execute({{"file_path", "src/nope.cpp"}});

        QCOMPARE(result.outcome, QCodeToolResult::Outcome::Error);
        QCOMPARE(result.errorKind, QCodeToolErrorKind::IoError);
    }

    void testFileWriteCreatesDirectories()
    {
        QCodeToolFileWrite    tool(nullptr, projectPath);
        const QCodeToolResult result
            = tool.execute({{"file_path", "out/deep/new.txt"}, {"content", "hello\n"}});

        QVERIFY(result.isSuccess());
        QVERIFY(tool.isMutating());
        QCOMPARE(readFile(projectPath + "/out/deep/new.txt"), QByteArray("hello\n"));
    }

    void testFileWriteOutsideProjectDenied()
    {
        QTemporaryDir         outside;
        QCodeToolFileWrite    tool(nullptr, projectPath);
        const QString         target = outside.path() + "/escape.txt";
        const QCodeToolResult result = tool.execute({{"file_path", target.toStdString()}, {"content", "x"}});

        QCOMPARE(result.errorKind, QCodeToolErrorKind::IoError);
        QVERIFY(result.content.contains("outside the project"));
        QVERIFY(!QFile::exists(target));

        const QCodeToolResult dotdot = tool.execute({{"file_path", "../escape.txt"}, {"content", "x"}});
        QCOMPARE(dotdot.errorKind, QCodeToolErrorKind::IoError);
    }

    void testPathInside()
    {
        QVERIFY(qcodeIsPathInside(projectPath, "src/main.cpp"));
        QVERIFY(qcodeIsPathInside(projectPath, "not/created/yet.txt"));
        QVERIFY(!qcodeIsPathInside(projectPath, "../other"));
        QVERIFY(!qcodeIsPathInside(projectPath, "/etc/passwd"));
    }

    void testFileEditUniqueMatch()
    {
        QVERIFY(writeFile(projectPath + "/edit.txt", "alpha\nbeta\ngamma\n"));
        QCodeToolFileEdit     tool(nullptr, projectPath);
        const QCodeToolResult result = tool.execute(
            {{"file_path", "edit.txt"}, {"old_string", "beta"}, {"new_string", "BETA"}});

        QVERIFY(result.isSuccess());
        QCOMPARE(readFile(projectPath + "/edit.txt"), QByteArray("alpha\nBETA\ngamma\n"));
    }

    void testFileEditAmbiguousMatch()
    {
        QVERIFY(writeFile(projectPath + "/edit2.txt", "x = 1\nx = 2\n"));
        QCodeToolFileEdit tool(nullptr, projectPath);

        const QCodeToolResult ambiguous
            = tool.execute({{"file_path", "edit2.txt"}, {"old_string", "x ="}, {"new_string", "y ="}});
        QCOMPARE(ambiguous.errorKind, QCodeToolErrorKind::InvalidArguments);
        QVERIFY(ambiguous.content.contains("2 times"));
        QCOMPARE(readFile(projectPath + "/edit2.txt"), QByteArray("x = 1\nx = 2\n"));

        const QCodeToolResult all = tool.execute(
            {{"file_path", "edit2.txt"},
             {"old_string", "x ="},
             {"new_string", "y ="},
             {"replace_all", true}});
        QVERIFY(all.isSuccess());
        QCOMPARE(readFile(projectPath + "/edit2.txt"), QByteArray("y = 1\ny = 2\n"));
    }

    void testFileEditNotFound()
    {
        QCodeToolFileEdit     tool(nullptr, projectPath);
        const QCodeToolResult result = tool.execute(
            {{"file_path", "src/helper.h"}, {"old_string", "absent"}, {"new_string", "x"}});
        QCOMPARE(result.errorKind, QCodeToolErrorKind::InvalidArguments);
    }

    /* Search tools */

    void testGlobToRegularExpression()
    {
        QVERIFY(qcodeGlobToRegularExpression("*.cpp").match("main.cpp").hasMatch());
        QVERIFY(!qcodeGlobToRegularExpression("*.cpp").match("src/main.cpp").hasMatch());
        QVERIFY(qcodeGlobToRegularExpression("**/*.cpp").match("src/main.cpp").hasMatch());
        QVERIFY(qcodeGlobToRegularExpression("**/*.cpp").match("main.cpp").hasMatch());
        QVERIFY(qcodeGlobToRegularExpression("src/*.{h,cpp}").match("src/helper.h").hasMatch());
        QVERIFY(!qcodeGlobToRegularExpression("src/*.{h,cpp}").match("src/helper.hpp").hasMatch());
        QVERIFY(qcodeGlobToRegularExpression("file?.txt").match("file1.txt").hasMatch());
        QVERIFY(qcodeGlobToRegularExpression("[!a]*.md").match("README.md").hasMatch());
    }

    void testGlobFindsFiles()
    {
        QCodeToolGlob         tool(nullptr, projectPath);
        const QCodeToolResult result = tool.execute({{"pattern", "src/*.cpp"}});

        QVERIFY(result.isSuccess());
        QVERIFY(result.content.startsWith("Found 2 files"));
        QVERIFY(result.content.contains("src/helper.cpp"));
        QVERIFY(result.content.contains("src/main.cpp"));
    }

    void testGlobNoMatch()
    {
        QCodeToolGlob         tool(nullptr, projectPath);
        const QCodeToolResult result = tool.execute({{"pattern", "**/*.rs"}});

        QVERIFY(result.isSuccess());
        QCOMPARE(result.content, QString("No files found matching the pattern"));
    }

    void testGrepFindsLines()
    {
        QCodeToolGrep         tool(nullptr, projectPath);
        const QCodeToolResult result = tool.execute({{"pattern", "helper\\("}, {"glob", "*.cpp"}});

        QVERIFY(result.isSuccess());
        QVERIFY(result.content.contains("src/main.cpp:3:    return helper();"));
        QVERIFY(result.content.contains("src/helper.cpp:1:int helper()"));
        QVERIFY(!result.content.contains("README.md"));
        QVERIFY(!result.content.contains(".git"));
    }

    void testGrepInvalidRegex()
    {
        QCodeToolGrep         tool(nullptr, projectPath);
        const QCodeToolResult result = tool.execute({{"pattern", "("}});
        QCOMPARE(result.errorKind, QCodeToolErrorKind::InvalidArguments);
    }

    void testGrepCaseInsensitive()
    {
        QCodeToolGrep         tool(nullptr, projectPath);
        const QCodeToolResult result
            = tool.execute({{"pattern", "CALL HELPER"}, {"case_insensitive", true}});
        QVERIFY(result.content.contains("README.md:2:"));
    }

    /* Shell tool */

    void testBashSuccess()
    {
        QCodeToolShellBash    tool(nullptr, projectPath);
        const QCodeToolResult result = tool.execute({{"command", "echo hello && pwd"}});

        QVERIFY(result.isSuccess());
        QVERIFY(result.content.contains("hello"));
        QVERIFY(result.content.contains(QFileInfo(projectPath).fileName()));
        QVERIFY(tool.isMutating());
    }

    void testBashNonZeroExit()
    {
        QCodeToolShellBash    tool(nullptr, projectPath);
        const QCodeToolResult result = tool.execute({{"command", "echo failing >&2; exit 3"}});

        QCOMPARE(result.errorKind, QCodeToolErrorKind::NonZeroExit);
        QVERIFY(result.content.contains("code 3"));
        QVERIFY(result.content.contains("failing"));
    }

    void testBashTimeoutKillsProcess()
    {
        QTemporaryDir scratch;
        QVERIFY(scratch.isValid());
        const QString pidFile = scratch.filePath("sleeper.pid");

        QCodeToolShellBash tool(nullptr, projectPath);
        QElapsedTimer      timer;
        timer.start();

        const QCodeToolResult result = tool.execute(
            {{"command", QString("sleep 30 & echo $! > %1; wait").arg(pidFile).toStdString()},
             {"timeout", 1}});

        QCOMPARE(result.errorKind, QCodeToolErrorKind::Timeout);
        QVERIFY(timer.elapsed() < 4000);

        /* The background child of bash must be gone too */
        const qint64 pid = readPidFile(pidFile);
        QVERIFY(pid > 0);
        QVERIFY(!processAlive(pid));
    }

    void testBashAbortKillsChildren()
    {
        QTemporaryDir scratch;
        QVERIFY(scratch.isValid());
        const QString pidFile = scratch.filePath("aborted.pid");

        QCodeToolShellBash tool(nullptr, projectPath);
        QTimer::singleShot(500, [&tool]() { tool.abort(); });

        const QCodeToolResult result = tool.execute(
            {{"command", QString("sleep 30 & echo $! > %1; wait").arg(pidFile).toStdString()}});

        QCOMPARE(result.errorKind, QCodeToolErrorKind::Cancelled);
        const qint64 pid = readPidFile(pidFile);
        QVERIFY(pid > 0);
        QVERIFY(!processAlive(pid));
    }

    void testBashHugeTimeoutIsClamped()
    {
        QCodeToolShellBash    tool(nullptr, projectPath);
        const QCodeToolResult result
            = tool.execute({{"command", "echo still-running"}, {"timeout", 3000000}});

        QVERIFY(result.isSuccess());
        QVERIFY(result.content.contains("still-running"));

        const QCodeToolResult larger
            = tool.execute({{"command", "echo larger"}, {"timeout", 1e300}});
        QVERIFY(larger.isSuccess());
    }

    void testBashWorkingDir()
    {
        QCodeToolShellBash    tool(nullptr, projectPath);
        const QCodeToolResult result = tool.execute({{"command", "ls"}, {"working_dir", "src"}});

        QVERIFY(result.isSuccess());
        QVERIFY(result.content.contains("helper.h"));

        const QCodeToolResult missing
            = tool.execute({{"command", "ls"}, {"working_dir", "does/not/exist"}});
        QCOMPARE(missing.errorKind, QCodeToolErrorKind::IoError);
    }

    void testBashAbort()
    {
        QCodeToolShellBash tool(nullptr, projectPath);
        QTimer::singleShot(200, [&tool]() { tool.abort(); });

        /* The runner polls the abort flag from its own event loop */
        const QCodeToolResult result = tool.execute({{"command", "sleep 30"}});
        QCOMPARE(result.errorKind, QCodeToolErrorKind::Cancelled);
    }

    void testTruncateOutput()
    {
        const QString longText(60000, QChar('x'));
        const QString truncated = QCodeProcessRunner::truncateOutput(longText);
        QVERIFY(truncated.startsWith(QString(50000, QChar('x'))));
        QVERIFY(truncated.endsWith("... (output truncated)"));
        QCOMPARE(QCodeProcessRunner::truncateOutput("short"), QString("short"));
    }

    void testProcessRunnerMissingProgram()
    {
        const QCodeProcessResult result
            = QCodeProcessRunner::run("/nonexistent/qcode-binary", {}, projectPath, 1000);
        QVERIFY(!result.started);
        QVERIFY(!result.errorString.isEmpty());
    }

    /* Git tools */

    void testGitWorkflow()
    {
        if (QStandardPaths::findExecutable("git").isEmpty()) {
            QSKIP("git is not installed");
        }

        QTemporaryDir repo;
        QVERIFY(repo.isValid());
        const QCodeProcessResult init = QCodeProcessRunner::run(
            "/bin/bash",
            {"-c",
             "git init -q && git config user.email test@example.com && git config user.name Test"},
            repo.path(),
            10000);
        QCOMPARE(init.exitCode, 0);

        QCodeToolGitStatus status(nullptr, repo.path());
        QCodeToolGitAdd    add(nullptr, repo.path());
        QCodeToolGitCommit commit(nullptr, repo.path());
        QCodeToolGitLog    log(nullptr, repo.path());
        QCodeToolGitDiff   diff(nullptr, repo.path());

        QVERIFY(!status.isMutating());
        QVERIFY(add.isMutating());
        QVERIFY(commit.isMutating());

        QCOMPARE(status.execute(json::object()).content, QString("Working tree clean"));

        QVERIFY(writeFile(repo.path() + "/a.txt", "one\n"));
        QVERIFY(status.execute(json::object()).content.contains("?? a.txt"));

        const QCodeToolResult added = add.execute({{"files", json::array({"a.txt"})}});
        QVERIFY(added.isSuccess());
        QCOMPARE(added.content, QString("Added 1 file(s)"));

        QVERIFY(diff.execute({{"staged", true}}).content.contains("+one"));

        QVERIFY(commit.execute({{"message", "first commit"}}).isSuccess());
        QVERIFY(log.execute({{"oneline", true}}).content.contains("first commit"));
        QCOMPARE(diff.execute(json::object()).content, QString("No changes"));

        const QCodeToolResult empty = commit.execute({{"message", "nothing"}});
        QCOMPARE(empty.errorKind, QCodeToolErrorKind::NonZeroExit);
    }
};

QTEST_APPLESS_MAIN(Test)
#include "test_qcodeagenttool.moc"
