// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODETRANSCRIPT_H
#define QCODETRANSCRIPT_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <QList>
#include <QString>

using json = nlohmann::json;

/**
 * @brief One transcript entry
 */
struct QCodeMessage
{
    enum class Role : std::uint8_t { System, User, Assistant, ToolResult };

    Role    role = Role::User;
    QString content;
    json    toolCalls;  /* Native tool_calls of an assistant message, null otherwise */
    QString toolCallId; /* ToolResult: id of the request it answers */
    QString toolName;   /* ToolResult: tool that produced it */
    bool    native = false;
    bool    pinned = false;
    qint64  ordinal = 0; /* Assigned on append */

    static QCodeMessage system(const QString &content);
    static QCodeMessage user(const QString &content);
    static QCodeMessage assistant(const QString &content, const json &toolCalls = json());
    static QCodeMessage toolResult(
        const QString &callId, const QString &toolName, const QString &content, bool native);
};

/**
 * @brief Bounded conversation window
 * @details Messages keep their append order. When the window is over its limit the oldest
 *          non-pinned messages are evicted; pinned messages (the system prompt) never are.
 */
class QCodeTranscript
{
public:
    explicit QCodeTranscript(int maxMessages = 100);

    /**
     * @brief Append a message and evict down to the limit
     */
    void append(const QCodeMessage &message);

    /**
     * @brief Append several messages with a single eviction pass
     * @details Used for an assistant message together with its tool results.
     */
    void appendBatch(const QList<QCodeMessage> &batch);

    /**
     * @brief Append a pinned message
     */
    void pin(const QCodeMessage &message);

    /**
     * @brief Replace the pinned system prompt
     * @details The prompt is kept at the front. An empty text removes it.
     */
    void setSystemPrompt(const QString &text);
    QString systemPrompt() const;

    /**
     * @brief Remove every non-pinned message
     */
    void clear();

    QList<QCodeMessage> messages() const;
    int                 size() const;
    bool                isEmpty() const;

    int  maxMessages() const;
    void setMaxMessages(int maxMessages);

    /**
     * @brief Serialize to OpenAI chat messages
     * @details Native tool results whose request was evicted, and text-encoded results,
     *          are sent as user messages prefixed with "Tool result (<name>, <id>):".
     */
    json toChatMessages() const;

    /**
     * @brief Serialize for session save
     */
    json toJson() const;

    /**
     * @brief Restore from toJson() output
     * @param data JSON array of messages
     * @return false if the data is not a valid message array, the transcript is unchanged
     */
    bool fromJson(const json &data);

    static QString roleName(QCodeMessage::Role role);

private:
    QList<QCodeMessage> entries;
    int                 limit       = 100;
    qint64              nextOrdinal = 1;

    void evict();
};

#endif // QCODETRANSCRIPT_H
