// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/qcodetranscript.h"

#include <QDebug>
#include <QSet>

/* QCodeMessage Implementation */

QCodeMessage QCodeMessage::system(const QString &content)
{
    QCodeMessage message;
    message.role    = Role::System;
    message.content = content;
    message.pinned  = true;
    return message;
}

QCodeMessage QCodeMessage::user(const QString &content)
{
    QCodeMessage message;
    message.role    = Role::User;
    message.content = content;
    return message;
}

QCodeMessage QCodeMessage::assistant(const QString &content, const json &toolCalls)
{
    QCodeMessage message;
    message.role      = Role::Assistant;
    message.content   = content;
    message.toolCalls = toolCalls;
    message.native    = toolCalls.is_array() && !toolCalls.empty();
    return message;
}

QCodeMessage QCodeMessage::toolResult(
    const QString &callId, const QString &toolName, const QString &content, bool native)
{
    QCodeMessage message;
    message.role       = Role::ToolResult;
    message.toolCallId = callId;
    message.toolName   = toolName;
    message.content    = content;
    message.native     = native;
    return message;
}

/* QCodeTranscript Implementation */

QCodeTranscript::QCodeTranscript(int maxMessages)
    : limit(qMax(1, maxMessages))
{}

void QCodeTranscript::append(const QCodeMessage &message)
{
    QCodeMessage entry = message;
    entry.ordinal      = nextOrdinal++;
    entries.append(entry);
    evict();
}

void QCodeTranscript::appendBatch(const QList<QCodeMessage> &batch)
{
    for (const QCodeMessage &message : batch) {
        QCodeMessage entry = message;
        entry.ordinal      = nextOrdinal++;
        entries.append(entry);
    }
    evict();
}

void QCodeTranscript::pin(const QCodeMessage &message)
{
    QCodeMessage entry = message;
    entry.pinned       = true;
    append(entry);
}

void QCodeTranscript::setSystemPrompt(const QString &text)
{
    for (int i = 0; i < entries.size(); ++i) {
        if (entries.at(i).role == QCodeMessage::Role::System && entries.at(i).pinned) {
            entries.removeAt(i);
            break;
        }
    }

    if (text.isEmpty()) {
        return;
    }

    QCodeMessage prompt = QCodeMessage::system(text);
    prompt.ordinal      = nextOrdinal++;
    entries.prepend(prompt);
    evict();
}

QString QCodeTranscript::systemPrompt() const
{
    for (const QCodeMessage &message : entries) {
        if (message.role == QCodeMessage::Role::System && message.pinned) {
            return message.content;
        }
    }
    return QString();
}

void QCodeTranscript::clear()
{
    QList<QCodeMessage> kept;
    for (const QCodeMessage &message : entries) {
        if (message.pinned) {
            kept.append(message);
        }
    }
    entries = kept;
}

QList<QCodeMessage> QCodeTranscript::messages() const
{
    return entries;
}

int QCodeTranscript::size() const
{
    return static_cast<int>(entries.size());
}

bool QCodeTranscript::isEmpty() const
{
    return entries.isEmpty();
}

int QCodeTranscript::maxMessages() const
{
    return limit;
}

void QCodeTranscript::setMaxMessages(int maxMessages)
{
    limit = qMax(1, maxMessages);
    evict();
}

void QCodeTranscript::evict()
{
    int excess = size() - limit;
    if (excess <= 0) {
        return;
    }

    QList<QCodeMessage> kept;
    kept.reserve(entries.size());
    for (const QCodeMessage &message : entries) {
        if (excess > 0 && !message.pinned) {
            --excess;
            continue;
        }
        kept.append(message);
    }
    entries = kept;
}

QString QCodeTranscript::roleName(QCodeMessage::Role role)
{
    switch (role) {
    case QCodeMessage::Role::System:
        return "system";
    case QCodeMessage::Role::User:
        return "user";
    case QCodeMessage::Role::Assistant:
        return "assistant";
    case QCodeMessage::Role::ToolResult:
        return "tool";
    }
    return "user";
}

json QCodeTranscript::toChatMessages() const
{
    /* Ids of native requests and native results still in the window */
    QSet<QString> requestIds;
    QSet<QString> resultIds;
    for (const QCodeMessage &message : entries) {
        if (message.role == QCodeMessage::Role::Assistant && message.toolCalls.is_array()) {
            for (const auto &call : message.toolCalls) {
                if (call.contains("id") && call["id"].is_string()) {
                    requestIds.insert(QString::fromStdString(call["id"].get<std::string>()));
                }
            }
        } else if (message.role == QCodeMessage::Role::ToolResult && message.native) {
            resultIds.insert(message.toolCallId);
        }
    }

    json chat = json::array();
    for (const QCodeMessage &message : entries) {
        switch (message.role) {
        case QCodeMessage::Role::System:
        case QCodeMessage::Role::User:
            chat.push_back(
                {{"role", roleName(message.role).toStdString()},
                 {"content", message.content.toStdString()}});
            break;

        case QCodeMessage::Role::Assistant: {
            json entry = {{"role", "assistant"}, {"content", message.content.toStdString()}};
            /* Only requests that still have their answer in the window are sent */
            if (message.toolCalls.is_array()) {
                json calls = json::array();
                for (const auto &call : message.toolCalls) {
                    if (call.contains("id") && call["id"].is_string()
                        && resultIds.contains(QString::fromStdString(call["id"].get<std::string>()))) {
                        calls.push_back(call);
                    }
                }
                if (!calls.empty()) {
                    entry["tool_calls"] = calls;
                }
            }
            chat.push_back(entry);
            break;
        }

        case QCodeMessage::Role::ToolResult:
            if (message.native && requestIds.contains(message.toolCallId)) {
                chat.push_back(
                    {{"role", "tool"},
                     {"tool_call_id", message.toolCallId.toStdString()},
                     {"content", message.content.toStdString()}});
            } else {
                const QString text = QString("Tool result (%1, %2):\n%3")
                                         .arg(message.toolName, message.toolCallId, message.content);
                chat.push_back({{"role", "user"}, {"content", text.toStdString()}});
            }
            break;
        }
    }

    return chat;
}

json QCodeTranscript::toJson() const
{
    json data = json::array();
    for (const QCodeMessage &message : entries) {
        json entry = {
            {"role", roleName(message.role).toStdString()},
            {"content", message.content.toStdString()},
            {"native", message.native},
            {"pinned", message.pinned}};
        if (!message.toolCalls.is_null()) {
            entry["tool_calls"] = message.toolCalls;
        }
        if (message.role == QCodeMessage::Role::ToolResult) {
            entry["tool_call_id"] = message.toolCallId.toStdString();
            entry["name"]         = message.toolName.toStdString();
        }
        data.push_back(entry);
    }
    return data;
}

bool QCodeTranscript::fromJson(const json &data)
{
    if (!data.is_array()) {
        return false;
    }

    QList<QCodeMessage> restored;
    for (const auto &entry : data) {
        if (!entry.is_object() || !entry.contains("role") || !entry["role"].is_string()) {
            qWarning() << "Invalid transcript entry, restore aborted";
            return false;
        }

        QCodeMessage  message;
        const QString role = QString::fromStdString(entry["role"].get<std::string>());
        if (role == "system") {
            message.role = QCodeMessage::Role::System;
        } else if (role == "user") {
            message.role = QCodeMessage::Role::User;
        } else if (role == "assistant") {
            message.role = QCodeMessage::Role::Assistant;
        } else if (role == "tool") {
            message.role = QCodeMessage::Role::ToolResult;
        } else {
            qWarning() << "Unknown transcript role" << role << ", restore aborted";
            return false;
        }

        if (entry.contains("content") && entry["content"].is_string()) {
            message.content = QString::fromStdString(entry["content"].get<std::string>());
        }
        if (entry.contains("tool_calls")) {
            message.toolCalls = entry["tool_calls"];
        }
        if (entry.contains("tool_call_id") && entry["tool_call_id"].is_string()) {
            message.toolCallId = QString::fromStdString(entry["tool_call_id"].get<std::string>());
        }
        if (entry.contains("name") && entry["name"].is_string()) {
            message.toolName = QString::fromStdString(entry["name"].get<std::string>());
        }
        message.native = entry.value("native", false);
        message.pinned = entry.value("pinned", message.role == QCodeMessage::Role::System);

        restored.append(message);
    }

    entries.clear();
    nextOrdinal = 1;
    appendBatch(restored);
    return true;
}
