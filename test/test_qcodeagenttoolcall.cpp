// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/qcodetoolcall.h"
#include "qcode_test.h"

#include <QtCore>
#include <QtTest>

namespace {

json assistant(const std::string &content)
{
    return {{"role", "assistant"}, {"content", content}};
}

} // namespace

class Test : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() { TestApp::instance(); }

    void testPlainText()
    {
        const QCodeParsedReply reply = QCodeToolCallParser::parse(assistant("All done, nothing to run."));

        QCOMPARE(reply.kind, QCodeParsedReply::Kind::PlainText);
        QCOMPARE(reply.text, QString("All done, nothing to run."));
        QVERIFY(reply.calls.isEmpty());
    }

    void testFencedJsonCall()
    {
        const QCodeParsedReply reply = QCodeToolCallParser::parse(assistant(
            "Let me look.\n```json\n{\"tool\": \"read\", \"params\": {\"file_path\": \"a.rs\"}}\n```\n"));

        QCOMPARE(reply.kind, QCodeParsedReply::Kind::ToolCalls);
        QCOMPARE(reply.calls.size(), 1);
        QCOMPARE(reply.calls[0].name, QString("read"));
        QCOMPARE(reply.calls[0].id, QString("call_0"));
        QVERIFY(!reply.calls[0].native);
        QCOMPARE(reply.calls[0].arguments["file_path"].get<std::string>(), std::string("a.rs"));
        QCOMPARE(reply.text, QString("Let me look."));
    }

    void testMultipleFencedCallsKeepOrder()
    {
        const QCodeParsedReply reply = QCodeToolCallParser::parseText(
            "```json\n{\"tool\": \"glob\", \"params\": {\"pattern\": \"*.rs\"}}\n```\n"
            "and\n"
            "```\n{\"tool\": \"grep\", \"params\": {\"pattern\": \"fn main\"}}\n```");

        QCOMPARE(reply.kind, QCodeParsedReply::Kind::ToolCalls);
        QCOMPARE(reply.calls.size(), 2);
        QCOMPARE(reply.calls[0].name, QString("glob"));
        QCOMPARE(reply.calls[1].name, QString("grep"));
        QCOMPARE(reply.calls[1].id, QString("call_1"));
        QCOMPARE(reply.text, QString("and"));
    }

    void testFencedNonToolBlockIsIgnored()
    {
        const QString          content = "Example:\n```json\n{\"name\": \"value\"}\n```";
        const QCodeParsedReply reply   = QCodeToolCallParser::parseText(content);

        QCOMPARE(reply.kind, QCodeParsedReply::Kind::PlainText);
        QCOMPARE(reply.text, content);
    }

    void testBareObject()
    {
        const QCodeParsedReply reply = QCodeToolCallParser::parseText(
            "Running it: {\"tool\": \"bash\", \"params\": {\"command\": \"echo {}\"}} now");

        QCOMPARE(reply.kind, QCodeParsedReply::Kind::ToolCalls);
        QCOMPARE(reply.calls.size(), 1);
        QCOMPARE(reply.calls[0].arguments["command"].get<std::string>(), std::string("echo {}"));
        QCOMPARE(reply.text, QString("Running it:  now"));
    }

    void testMissingParamsIsEmptyObject()
    {
        const QCodeParsedReply reply
            = QCodeToolCallParser::parseText("```json\n{\"tool\": \"git_status\"}\n```");

        QCOMPARE(reply.kind, QCodeParsedReply::Kind::ToolCalls);
        QVERIFY(reply.calls[0].arguments.is_object());
        QVERIFY(reply.calls[0].arguments.empty());
    }

    void testMalformedJsonInFence()
    {
        const QCodeParsedReply reply = QCodeToolCallParser::parseText(
            "```json\n{\"tool\": \"read\", \"params\": {\"file_path\": }\n```");

        QCOMPARE(reply.kind, QCodeParsedReply::Kind::Malformed);
        QVERIFY(reply.error.contains("invalid tool call JSON"));
    }

    void testUnterminatedBareObject()
    {
        const QCodeParsedReply reply
            = QCodeToolCallParser::parseText("{\"tool\": \"read\", \"params\": {\"file_path\": \"x\"}");

        QCOMPARE(reply.kind, QCodeParsedReply::Kind::Malformed);
        QVERIFY(reply.error.contains("unterminated"));
    }

    void testParamsNotObject()
    {
        const QCodeParsedReply reply
            = QCodeToolCallParser::parseText("```json\n{\"tool\": \"read\", \"params\": [1, 2]}\n```");

        QCOMPARE(reply.kind, QCodeParsedReply::Kind::Malformed);
    }

    void testNativeToolCalls()
    {
        const json message
            = {{"role", "assistant"},
               {"content", nullptr},
               {"tool_calls",
                json::array(
                    {{{"id", "call_abc"},
                      {"type", "function"},
                      {"function", {{"name", "read"}, {"arguments", "{\"file_path\": \"x.rs\"}"}}}},
                     {{"id", "call_def"},
                      {"type", "function"},
                      {"function", {{"name", "glob"}, {"arguments", {{"pattern", "*.rs"}}}}}}})}};

        const QCodeParsedReply reply = QCodeToolCallParser::parse(message);

        QCOMPARE(reply.kind, QCodeParsedReply::Kind::ToolCalls);
        QCOMPARE(reply.calls.size(), 2);
        QCOMPARE(reply.calls[0].id, QString("call_abc"));
        QVERIFY(reply.calls[0].native);
        QCOMPARE(reply.calls[0].arguments["file_path"].get<std::string>(), std::string("x.rs"));
        QCOMPARE(reply.calls[1].arguments["pattern"].get<std::string>(), std::string("*.rs"));
    }

    void testNativeTakesPrecedenceOverText()
    {
        const json message
            = {{"role", "assistant"},
               {"content", "```json\n{\"tool\": \"bash\", \"params\": {\"command\": \"ls\"}}\n```"},
               {"tool_calls",
                json::array({{{"id", "n1"}, {"function", {{"name", "read"}, {"arguments", "{}"}}}}})}};

        const QCodeParsedReply reply = QCodeToolCallParser::parse(message);

        QCOMPARE(reply.calls.size(), 1);
        QCOMPARE(reply.calls[0].name, QString("read"));
    }

    void testNativeIdsNormalized()
    {
        const json message
            = {{"role", "assistant"},
               {"tool_calls",
                json::array(
                    {{{"function", {{"name", "read"}, {"arguments", ""}}}},
                     {{"id", "dup"}, {"function", {{"name", "glob"}, {"arguments", "{}"}}}},
                     {{"id", "dup"}, {"function", {{"name", "grep"}, {"arguments", "{}"}}}}})}};

        const QCodeParsedReply reply = QCodeToolCallParser::parse(message);

        QCOMPARE(reply.kind, QCodeParsedReply::Kind::ToolCalls);
        QCOMPARE(reply.calls[0].id, QString("call_0"));
        QVERIFY(reply.calls[0].arguments.is_object());
        QCOMPARE(reply.calls[1].id, QString("dup"));
        QCOMPARE(reply.calls[2].id, QString("dup_2"));
    }

    void testNativeBadArguments()
    {
        const json message
            = {{"role", "assistant"},
               {"tool_calls",
                json::array({{{"id", "a"}, {"function", {{"name", "read"}, {"arguments", "{not json"}}}}})}};

        const QCodeParsedReply reply = QCodeToolCallParser::parse(message);
        QCOMPARE(reply.kind, QCodeParsedReply::Kind::Malformed);
        QVERIFY(reply.error.contains("not valid JSON"));

        const json arrayArgs
            = {{"role", "assistant"},
               {"tool_calls",
                json::array({{{"id", "a"}, {"function", {{"name", "read"}, {"arguments", "[1]"}}}}})}};
        QCOMPARE(QCodeToolCallParser::parse(arrayArgs).kind, QCodeParsedReply::Kind::Malformed);
    }

    void testNativeMissingName()
    {
        const json message
            = {{"role", "assistant"},
               {"tool_calls", json::array({{{"id", "a"}, {"function", {{"arguments", "{}"}}}}})}};

        QCOMPARE(QCodeToolCallParser::parse(message).kind, QCodeParsedReply::Kind::Malformed);
    }

    void testHasToolCall()
    {
        QVERIFY(QCodeToolCallParser::hasToolCall("x {\"tool\": \"read\"}"));
        QVERIFY(QCodeToolCallParser::hasToolCall("{ \"tool\"  :"));
        QVERIFY(!QCodeToolCallParser::hasToolCall("a tool for reading"));
    }

    void testEmptyMessage()
    {
        const QCodeParsedReply reply = QCodeToolCallParser::parse(json::object());
        QCOMPARE(reply.kind, QCodeParsedReply::Kind::PlainText);
        QVERIFY(reply.text.isEmpty());
    }
};

QTEST_APPLESS_MAIN(Test)
#include "test_qcodeagenttoolcall.moc"
