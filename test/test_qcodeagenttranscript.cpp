// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/qcodetranscript.h"
#include "qcode_test.h"

#include <QtCore>
#include <QtTest>

namespace {

json nativeRequest(const QString &id, const QString &name)
{
    return json::array(
        {{{"id", id.toStdString()},
          {"type", "function"},
          {"function", {{"name", name.toStdString()}, {"arguments", "{}"}}}}});
}

QString text(const json &value)
{
    return QString::fromStdString(value.get<std::string>());
}

} // namespace

class Test : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() { TestApp::instance(); }

    void testAppendAssignsIncreasingOrdinals()
    {
        QCodeTranscript transcript;
        transcript.append(QCodeMessage::user("one"));
        transcript.append(QCodeMessage::assistant("two"));
        transcript.appendBatch({QCodeMessage::user("three"), QCodeMessage::user("four")});

        const QList<QCodeMessage> messages = transcript.messages();
        QCOMPARE(messages.size(), 4);
        for (int i = 1; i < messages.size(); ++i) {
            QVERIFY(messages[i].ordinal > messages[i - 1].ordinal);
        }
    }

    void testEvictionDropsOldestUnpinned()
    {
        QCodeTranscript transcript(4);
        transcript.setSystemPrompt("system");
        for (int i = 0; i < 6; ++i) {
            transcript.append(QCodeMessage::user(QString("m%1").arg(i)));
        }

        const QList<QCodeMessage> messages = transcript.messages();
        QCOMPARE(messages.size(), 4);
        QVERIFY(messages[0].role == QCodeMessage::Role::System);
        QCOMPARE(messages[1].content, QString("m3"));
        QCOMPARE(messages[3].content, QString("m5"));
    }

    void testPinnedMessagesSurvive()
    {
        QCodeTranscript transcript(3);
        transcript.append(QCodeMessage::user("first"));
        transcript.pin(QCodeMessage::user("remember me"));
        for (int i = 0; i < 5; ++i) {
            transcript.append(QCodeMessage::user(QString("m%1").arg(i)));
        }

        const QList<QCodeMessage> messages = transcript.messages();
        QCOMPARE(messages.size(), 3);
        QCOMPARE(messages[0].content, QString("remember me"));
        QVERIFY(messages[0].pinned);
    }

    void testBatchEvictedOnce()
    {
        QCodeTranscript transcript(3);
        transcript.append(QCodeMessage::user("old"));
        transcript.appendBatch(
            {QCodeMessage::assistant("calls"),
             QCodeMessage::toolResult("a", "read", "A", false),
             QCodeMessage::toolResult("b", "read", "B", false)});

        const QList<QCodeMessage> messages = transcript.messages();
        QCOMPARE(messages.size(), 3);
        QCOMPARE(messages[0].content, QString("calls"));
        QCOMPARE(messages[2].content, QString("B"));
    }

    void testSetSystemPromptReplaces()
    {
        QCodeTranscript transcript;
        transcript.setSystemPrompt("first");
        transcript.append(QCodeMessage::user("hello"));
        transcript.setSystemPrompt("second");

        QCOMPARE(transcript.systemPrompt(), QString("second"));
        QCOMPARE(transcript.size(), 2);
        QCOMPARE(transcript.messages().first().content, QString("second"));

        transcript.setSystemPrompt(QString());
        QVERIFY(transcript.systemPrompt().isEmpty());
        QCOMPARE(transcript.size(), 1);
    }

    void testClearKeepsPinned()
    {
        QCodeTranscript transcript;
        transcript.setSystemPrompt("system");
        transcript.append(QCodeMessage::user("a"));
        transcript.append(QCodeMessage::assistant("b"));
        transcript.clear();

        QCOMPARE(transcript.size(), 1);
        QCOMPARE(transcript.systemPrompt(), QString("system"));
    }

    void testSetMaxMessagesEvicts()
    {
        QCodeTranscript transcript(10);
        for (int i = 0; i < 8; ++i) {
            transcript.append(QCodeMessage::user(QString::number(i)));
        }
        transcript.setMaxMessages(2);
        QCOMPARE(transcript.size(), 2);
        QCOMPARE(transcript.maxMessages(), 2);
        QCOMPARE(transcript.messages().last().content, QString("7"));
    }

    void testChatMessagesNativePairing()
    {
        QCodeTranscript transcript;
        transcript.setSystemPrompt("sys");
        transcript.append(QCodeMessage::user("go"));
        transcript.appendBatch(
            {QCodeMessage::assistant(QString(), nativeRequest("call_1", "read")),
             QCodeMessage::toolResult("call_1", "read", "contents", true)});

        const json chat = transcript.toChatMessages();
        QCOMPARE(static_cast<int>(chat.size()), 4);
        QCOMPARE(text(chat[0]["role"]), QString("system"));
        QCOMPARE(text(chat[2]["role"]), QString("assistant"));
        QCOMPARE(static_cast<int>(chat[2]["tool_calls"].size()), 1);
        QCOMPARE(text(chat[3]["role"]), QString("tool"));
        QCOMPARE(text(chat[3]["tool_call_id"]), QString("call_1"));
        QCOMPARE(text(chat[3]["content"]), QString("contents"));
    }

    void testChatMessagesOrphanedResultFallsBackToUser()
    {
        /* The window drops the request but keeps its result */
        QCodeTranscript transcript(2);
        transcript.appendBatch(
            {QCodeMessage::assistant(QString(), nativeRequest("call_9", "grep")),
             QCodeMessage::toolResult("call_9", "grep", "match", true),
             QCodeMessage::user("next")});

        const json chat = transcript.toChatMessages();
        QCOMPARE(static_cast<int>(chat.size()), 2);
        QCOMPARE(text(chat[0]["role"]), QString("user"));
        QCOMPARE(text(chat[0]["content"]), QString("Tool result (grep, call_9):\nmatch"));
        QVERIFY(!chat[0].contains("tool_call_id"));
    }

    void testChatMessagesDropUnansweredRequests()
    {
        QCodeTranscript transcript;
        transcript.append(QCodeMessage::assistant("thinking", nativeRequest("call_2", "read")));

        const json chat = transcript.toChatMessages();
        QCOMPARE(static_cast<int>(chat.size()), 1);
        QVERIFY(!chat[0].contains("tool_calls"));
        QCOMPARE(text(chat[0]["content"]), QString("thinking"));
    }

    void testTextProtocolResultsAreUserMessages()
    {
        QCodeTranscript transcript;
        transcript.appendBatch(
            {QCodeMessage::assistant("```json\n{\"tool\": \"read\"}\n```"),
             QCodeMessage::toolResult("call_0", "read", "Error [InvalidArguments]: bad", false)});

        const json chat = transcript.toChatMessages();
        QCOMPARE(text(chat[1]["role"]), QString("user"));
        QVERIFY(text(chat[1]["content"]).contains("Error [InvalidArguments]: bad"));
    }

    void testJsonRestore()
    {
        QCodeTranscript source;
        source.setSystemPrompt("sys");
        source.append(QCodeMessage::user("question"));
        source.appendBatch(
            {QCodeMessage::assistant(QString(), nativeRequest("c1", "read")),
             QCodeMessage::toolResult("c1", "read", "data", true)});

        QCodeTranscript restored;
        QVERIFY(restored.fromJson(source.toJson()));
        QCOMPARE(restored.size(), 4);
        QCOMPARE(restored.systemPrompt(), QString("sys"));
        QVERIFY(restored.toChatMessages() == source.toChatMessages());

        const QList<QCodeMessage> messages = restored.messages();
        QCOMPARE(messages[3].toolName, QString("read"));
        QVERIFY(messages[3].native);
    }

    void testJsonRestoreRejectsBadInput()
    {
        QCodeTranscript transcript;
        transcript.append(QCodeMessage::user("keep"));

        QVERIFY(!transcript.fromJson(json::object()));
        QVERIFY(!transcript.fromJson(json::array({{{"role", "wizard"}, {"content", "x"}}})));
        QVERIFY(!transcript.fromJson(json::array({{{"content", "no role"}}})));
        QCOMPARE(transcript.size(), 1);
        QCOMPARE(transcript.messages().first().content, QString("keep"));
    }

    void testRoleNames()
    {
        QCOMPARE(QCodeTranscript::roleName(QCodeMessage::Role::System), QString("system"));
        QCOMPARE(QCodeTranscript::roleName(QCodeMessage::Role::ToolResult), QString("tool"));
    }
};

QTEST_APPLESS_MAIN(Test)
#include "test_qcodeagenttranscript.moc"
