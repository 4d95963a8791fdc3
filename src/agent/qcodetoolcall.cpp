// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/qcodetoolcall.h"

#include <QRegularExpression>
#include <QSet>

namespace {

const QRegularExpression &fencedBlockPattern()
{
    static const QRegularExpression pattern(QStringLiteral("```(?:json)?[ \\t]*\\n?([\\s\\S]*?)```"));
    return pattern;
}

const QRegularExpression &toolCallStartPattern()
{
    static const QRegularExpression pattern(QStringLiteral("\\{\\s*\"tool\"\\s*:"));
    return pattern;
}

QString messageContent(const json &message)
{
    if (message.is_object() && message.contains("content") && message["content"].is_string()) {
        return QString::fromStdString(message["content"].get<std::string>());
    }
    return QString();
}

QCodeParsedReply malformed(const QString &text, const QString &error)
{
    QCodeParsedReply reply;
    reply.kind  = QCodeParsedReply::Kind::Malformed;
    reply.text  = text;
    reply.error = error;
    return reply;
}

/* Parse one {"tool": ..., "params": ...} object; returns an error message on failure */
QString parseTextCall(const QString &block, QCodeToolCall &call, bool &isToolCall)
{
    const bool looksLikeCall = toolCallStartPattern().match(block).hasMatch();
    isToolCall               = looksLikeCall;

    json value;
    try {
        value = json::parse(block.toStdString());
    } catch (const json::parse_error &e) {
        return looksLikeCall ? QString("invalid tool call JSON: %1").arg(e.what()) : QString();
    }

    if (!value.is_object() || !value.contains("tool")) {
        isToolCall = false;
        return QString();
    }

    isToolCall = true;
    if (!value["tool"].is_string() || value["tool"].get<std::string>().empty()) {
        return "tool call has no tool name";
    }

    call.name      = QString::fromStdString(value["tool"].get<std::string>());
    call.arguments = json::object();
    if (value.contains("params") && !value["params"].is_null()) {
        if (!value["params"].is_object()) {
            return QString("params of tool call '%1' is not an object").arg(call.name);
        }
        call.arguments = value["params"];
    }

    return QString();
}

} // namespace

QCodeParsedReply QCodeToolCallParser::parse(const json &message)
{
    const QString content = messageContent(message);

    if (message.is_object() && message.contains("tool_calls") && message["tool_calls"].is_array()
        && !message["tool_calls"].empty()) {
        return parseNative(message["tool_calls"], content);
    }

    return parseText(content);
}

QCodeParsedReply QCodeToolCallParser::parseNative(const json &toolCalls, const QString &content)
{
    QCodeParsedReply reply;
    reply.kind = QCodeParsedReply::Kind::ToolCalls;
    reply.text = content.trimmed();

    QSet<QString> seenIds;
    int           index = 0;

    for (const auto &entry : toolCalls) {
        QCodeToolCall call;
        call.native = true;

        if (!entry.is_object() || !entry.contains("function") || !entry["function"].is_object()) {
            return malformed(reply.text, QString("tool call %1 has no function").arg(index));
        }

        const json &function = entry["function"];
        if (!function.contains("name") || !function["name"].is_string()
            || function["name"].get<std::string>().empty()) {
            return malformed(reply.text, QString("tool call %1 has no function name").arg(index));
        }
        call.name = QString::fromStdString(function["name"].get<std::string>());

        /* Arguments arrive as a JSON string, some servers send an object */
        if (function.contains("arguments")) {
            const json &arguments = function["arguments"];
            if (arguments.is_string()) {
                const std::string raw = arguments.get<std::string>();
                if (!QString::fromStdString(raw).trimmed().isEmpty()) {
                    try {
                        call.arguments = json::parse(raw);
                    } catch (const json::parse_error &e) {
                        return malformed(
                            reply.text,
                            QString("arguments of tool call '%1' are not valid JSON: %2")
                                .arg(call.name, e.what()));
                    }
                }
            } else if (!arguments.is_null()) {
                call.arguments = arguments;
            }
        }

        if (!call.arguments.is_object()) {
            return malformed(
                reply.text, QString("arguments of tool call '%1' are not an object").arg(call.name));
        }

        if (entry.contains("id") && entry["id"].is_string() && !entry["id"].get<std::string>().empty()) {
            call.id = QString::fromStdString(entry["id"].get<std::string>());
        } else {
            call.id = QString("call_%1").arg(index);
        }
        if (seenIds.contains(call.id)) {
            call.id = QString("%1_%2").arg(call.id).arg(index);
        }
        seenIds.insert(call.id);

        reply.calls.append(call);
        ++index;
    }

    return reply;
}

QCodeParsedReply QCodeToolCallParser::parseText(const QString &content)
{
    QCodeParsedReply reply;
    QString          remaining = content;
    bool             hasFences = false;

    /* Fenced blocks, removed from the text back to front so offsets stay valid */
    QList<QPair<int, int>> removals;
    auto                   iter = fencedBlockPattern().globalMatch(content);
    while (iter.hasNext()) {
        const QRegularExpressionMatch match = iter.next();
        hasFences                           = true;

        QCodeToolCall call;
        bool          isToolCall = false;
        const QString error      = parseTextCall(match.captured(1).trimmed(), call, isToolCall);
        if (!isToolCall) {
            continue;
        }
        if (!error.isEmpty()) {
            return malformed(content.trimmed(), error);
        }

        call.id = QString("call_%1").arg(reply.calls.size());
        reply.calls.append(call);
        removals.append({static_cast<int>(match.capturedStart(0)),
                         static_cast<int>(match.capturedLength(0))});
    }

    /* A single bare object when the reply has no fences at all */
    if (!hasFences) {
        const QRegularExpressionMatch match = toolCallStartPattern().match(content);
        if (match.hasMatch()) {
            const int start = static_cast<int>(match.capturedStart(0));
            const int end   = findObjectEnd(content, start);
            if (end < 0) {
                return malformed(content.trimmed(), "unterminated tool call object");
            }

            QCodeToolCall call;
            bool          isToolCall = false;
            const QString error = parseTextCall(content.mid(start, end - start + 1), call, isToolCall);
            if (!error.isEmpty()) {
                return malformed(content.trimmed(), error);
            }
            if (isToolCall) {
                call.id = "call_0";
                reply.calls.append(call);
                removals.append({start, end - start + 1});
            }
        }
    }

    for (int i = static_cast<int>(removals.size()) - 1; i >= 0; --i) {
        remaining.remove(removals.at(i).first, removals.at(i).second);
    }

    reply.text = remaining.trimmed();
    reply.kind = reply.calls.isEmpty() ? QCodeParsedReply::Kind::PlainText
                                       : QCodeParsedReply::Kind::ToolCalls;
    if (reply.kind == QCodeParsedReply::Kind::PlainText) {
        reply.text = content;
    }
    return reply;
}

bool QCodeToolCallParser::hasToolCall(const QString &content)
{
    return toolCallStartPattern().match(content).hasMatch();
}

int QCodeToolCallParser::findObjectEnd(const QString &text, int start)
{
    int  depth    = 0;
    bool inString = false;
    bool escaped  = false;

    for (int i = start; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (ch == '\\') {
                escaped = true;
            } else if (ch == '"') {
                inString = false;
            }
            continue;
        }

        if (ch == '"') {
            inString = true;
        } else if (ch == '{') {
            ++depth;
        } else if (ch == '}') {
            if (--depth == 0) {
                return i;
            }
        }
    }

    return -1;
}
