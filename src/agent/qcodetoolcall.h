// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODETOOLCALL_H
#define QCODETOOLCALL_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <QList>
#include <QString>

using json = nlohmann::json;

/**
 * @brief One tool invocation requested by the model
 */
struct QCodeToolCall
{
    QString id;
    QString name;
    json    arguments = json::object();
    bool    native    = false; /* From the backend's tool_calls field rather than text */
};

/**
 * @brief Parsed form of one assistant reply
 */
struct QCodeParsedReply
{
    enum class Kind : std::uint8_t {
        PlainText, /* Final answer, no tool calls */
        ToolCalls, /* One or more tool calls, in order */
        Malformed  /* Looked like a tool call but could not be parsed */
    };

    Kind                 kind = Kind::PlainText;
    QString              text;  /* Content with tool-call blocks removed */
    QList<QCodeToolCall> calls;
    QString              error; /* Set for Malformed */
};

/**
 * @brief Extracts tool calls from assistant replies
 * @details Native OpenAI tool_calls take precedence. Without them the content is scanned
 *          for fenced JSON blocks of the form {"tool": "...", "params": {...}}, or a single
 *          bare object of that form when there are no fences. Ids are unique per reply.
 */
class QCodeToolCallParser
{
public:
    /**
     * @brief Parse an assistant message object
     * @param message Message with "content" and optional "tool_calls"
     */
    static QCodeParsedReply parse(const json &message);

    /**
     * @brief Parse reply text using the fenced/bare JSON grammar
     * @param content Reply text
     */
    static QCodeParsedReply parseText(const QString &content);

    /**
     * @brief Check whether text contains something shaped like a tool call
     */
    static bool hasToolCall(const QString &content);

private:
    static QCodeParsedReply parseNative(const json &toolCalls, const QString &content);
    static int              findObjectEnd(const QString &text, int start);
};

#endif // QCODETOOLCALL_H
