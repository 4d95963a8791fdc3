// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/qcodeagent.h"
#include "agent/qcodemode.h"
#include "agent/qcodetooldispatcher.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QEventLoop>
#include <QTimer>

QString qcodeRunStatusName(QCodeRunResult::Status status)
{
    switch (status) {
    case QCodeRunResult::Status::Completed:
        return "Completed";
    case QCodeRunResult::Status::BackendUnavailable:
        return "BackendUnavailable";
    case QCodeRunResult::Status::BackendError:
        return "BackendError";
    case QCodeRunResult::Status::TurnLimitExceeded:
        return "TurnLimitExceeded";
    case QCodeRunResult::Status::Cancelled:
        return "Cancelled";
    case QCodeRunResult::Status::NotConfigured:
        return "NotConfigured";
    }
    return "Unknown";
}

QCodeAgent::QCodeAgent(
    QObject           *parent,
    QCodeBackend      *backend,
    QCodeToolRegistry *toolRegistry,
    QCodeModeGate     *modeGate,
    QCodeAgentConfig   config)
    : QObject(parent)
    , backend(backend)
    , toolRegistry(toolRegistry)
    , modeGate(modeGate)
    , dispatcher(new QCodeToolDispatcher(this, toolRegistry, modeGate))
    , agentConfig(std::move(config))
    , history(agentConfig.maxMessages)
{
    history.setSystemPrompt(composeSystemPrompt());
    dispatcher->setMaxParallelTools(agentConfig.maxParallelTools);

    connect(dispatcher, &QCodeToolDispatcher::toolCalled, this, &QCodeAgent::toolCalled);
    connect(dispatcher, &QCodeToolDispatcher::toolResult, this, &QCodeAgent::toolResult);
}

QCodeAgent::~QCodeAgent() = default;

QCodeRunResult QCodeAgent::run(const QString &operatorMessage)
{
    QCodeRunResult result;

    if (!backend || !toolRegistry || !modeGate) {
        result.status = QCodeRunResult::Status::NotConfigured;
        result.error  = "Backend, tool registry or mode gate not configured";
        qWarning() << result.error;
        emit runError(result.error);
        return result;
    }

    running        = true;
    abortRequested = false;
    dispatcher->resetCancel();
    toolRegistry->resetAbortAll();

    history.append(QCodeMessage::user(operatorMessage));

    QElapsedTimer turnTimer;
    turnTimer.start();

    while (true) {
        if (abortRequested) {
            result.status = QCodeRunResult::Status::Cancelled;
            return finishRun(result);
        }

        if (result.iterations >= agentConfig.maxIterations) {
            result.status = QCodeRunResult::Status::TurnLimitExceeded;
            result.error  = QString("Iteration limit reached (%1 iterations)")
                               .arg(agentConfig.maxIterations);
            return finishRun(result);
        }

        if (agentConfig.maxTurnSeconds > 0
            && turnTimer.elapsed() >= static_cast<qint64>(agentConfig.maxTurnSeconds) * 1000) {
            result.status = QCodeRunResult::Status::TurnLimitExceeded;
            result.error  = QString("Turn time limit reached (%1 s)").arg(agentConfig.maxTurnSeconds);
            return finishRun(result);
        }

        if (agentConfig.verbose) {
            emit verboseOutput(QString("[Iteration %1 | Mode: %2 | Messages: %3/%4]")
                                   .arg(result.iterations + 1)
                                   .arg(qcodeModeName(modeGate->mode()))
                                   .arg(history.size())
                                   .arg(history.maxMessages()));
        }

        const QCodeBackendReply reply = requestWithRetry(result);

        if (abortRequested || reply.status == QCodeBackendStatus::Aborted) {
            result.status = QCodeRunResult::Status::Cancelled;
            return finishRun(result);
        }

        if (!reply.isOk()) {
            result.status = reply.status == QCodeBackendStatus::Transient
                                ? QCodeRunResult::Status::BackendUnavailable
                                : QCodeRunResult::Status::BackendError;
            result.error = reply.errorMessage;
            return finishRun(result);
        }

        result.iterations++;

        const QCodeParsedReply parsed = QCodeToolCallParser::parse(reply.message);

        switch (parsed.kind) {
        case QCodeParsedReply::Kind::PlainText:
            history.append(QCodeMessage::assistant(parsed.text));
            if (agentConfig.verbose) {
                emit verboseOutput(QString("[Assistant]: %1").arg(parsed.text));
            }
            result.status  = QCodeRunResult::Status::Completed;
            result.content = parsed.text;
            return finishRun(result);

        case QCodeParsedReply::Kind::ToolCalls:
            if (agentConfig.verbose) {
                emit verboseOutput(
                    QString("[Assistant requesting %1 tool call(s)]").arg(parsed.calls.size()));
            }
            appendToolRound(reply.message, parsed);
            break;

        case QCodeParsedReply::Kind::Malformed:
            if (agentConfig.verbose) {
                emit verboseOutput(QString("[Malformed tool call: %1]").arg(parsed.error));
            }
            appendMalformedRound(reply.message, parsed, result.iterations);
            break;
        }
    }
}

QCodeBackendReply QCodeAgent::requestWithRetry(QCodeRunResult &result)
{
    const QCodeRetryPolicy &policy      = agentConfig.retry;
    const int               maxAttempts = qMax(1, policy.maxAttempts);

    QCodeBackendReply reply;
    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        /* The tool list follows the mode at the time of each request */
        const json tools = toolRegistry->getToolDefinitions(modeGate);

        result.attempts++;
        reply = backend->complete(history.toChatMessages(), tools, agentConfig.temperature);

        if (reply.status != QCodeBackendStatus::Transient || abortRequested) {
            return reply;
        }

        qWarning() << "Backend request failed, attempt" << attempt + 1 << "of" << maxAttempts
                   << ":" << reply.errorMessage;

        if (attempt + 1 >= maxAttempts) {
            break;
        }

        const int delayMs = policy.delayForAttempt(attempt);
        emit      retrying(attempt + 1, maxAttempts, delayMs, reply.errorMessage);
        if (agentConfig.verbose) {
            emit verboseOutput(QString("[Retry %1/%2 in %3 ms: %4]")
                                   .arg(attempt + 1)
                                   .arg(maxAttempts)
                                   .arg(delayMs)
                                   .arg(reply.errorMessage));
        }

        if (!waitBackoff(delayMs)) {
            reply.status       = QCodeBackendStatus::Aborted;
            reply.errorMessage = "Aborted during retry backoff";
            return reply;
        }
    }

    reply.errorMessage = QString("Backend unavailable after %1 attempts: %2")
                             .arg(maxAttempts)
                             .arg(reply.errorMessage);
    return reply;
}

bool QCodeAgent::waitBackoff(int delayMs)
{
    if (abortRequested) {
        return false;
    }
    if (delayMs <= 0) {
        return true;
    }

    QEventLoop loop;
    QTimer     timer;
    timer.setSingleShot(true);
    connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(delayMs);

    backoffLoop = &loop;
    if (!abortRequested) {
        loop.exec();
    }
    backoffLoop = nullptr;

    return !abortRequested;
}

void QCodeAgent::appendToolRound(const json &message, const QCodeParsedReply &parsed)
{
    const QList<QCodeToolResult> results = dispatcher->dispatch(parsed.calls);

    const bool native = !parsed.calls.isEmpty() && parsed.calls.first().native;

    /* Native requests are stored with the normalized ids so results pair up */
    json toolCalls;
    if (native) {
        toolCalls = json::array();
        for (const QCodeToolCall &call : parsed.calls) {
            toolCalls.push_back(
                {{"id", call.id.toStdString()},
                 {"type", "function"},
                 {"function",
                  {{"name", call.name.toStdString()}, {"arguments", call.arguments.dump()}}}});
        }
    }

    QString content;
    if (message.contains("content") && message["content"].is_string()) {
        content = QString::fromStdString(message["content"].get<std::string>());
    }

    QList<QCodeMessage> batch;
    batch.append(QCodeMessage::assistant(content, toolCalls));
    for (const QCodeToolResult &toolResult : results) {
        batch.append(QCodeMessage::toolResult(
            toolResult.callId, toolResult.toolName, toolResult.toMessageContent(), native));

        if (agentConfig.verbose) {
            const QString text = toolResult.toMessageContent();
            emit verboseOutput(QString("  -> %1: %2")
                                   .arg(toolResult.toolName)
                                   .arg(text.length() > 200 ? text.left(200) + "... (truncated)"
                                                            : text));
        }
    }

    history.appendBatch(batch);
}

void QCodeAgent::appendMalformedRound(
    const json &message, const QCodeParsedReply &parsed, int iteration)
{
    QString content = parsed.text;
    if (message.contains("content") && message["content"].is_string()) {
        content = QString::fromStdString(message["content"].get<std::string>());
    }

    const QCodeToolResult error = QCodeToolResult::error(
        QCodeToolErrorKind::MalformedToolCall,
        QString("%1. Use {\"tool\": \"<name>\", \"params\": {...}} with valid JSON.").arg(parsed.error));

    QList<QCodeMessage> batch;
    batch.append(QCodeMessage::assistant(content));
    batch.append(QCodeMessage::toolResult(
        QString("malformed_%1").arg(iteration), "tool_call", error.toMessageContent(), false));
    history.appendBatch(batch);
}

QCodeRunResult QCodeAgent::finishRun(QCodeRunResult result)
{
    running = false;

    switch (result.status) {
    case QCodeRunResult::Status::Completed:
        emit runComplete(result.content);
        break;
    case QCodeRunResult::Status::Cancelled:
        result.error = "Aborted by user";
        emit runAborted(result.content);
        break;
    default:
        qWarning() << "Agent turn ended:" << qcodeRunStatusName(result.status) << result.error;
        emit runError(result.error);
        break;
    }

    return result;
}

void QCodeAgent::abort()
{
    abortRequested = true;

    if (backend) {
        backend->abort();
    }
    dispatcher->cancel();
    if (toolRegistry) {
        toolRegistry->abortAll();
    }

    /* Interrupt a backoff sleep on the agent's thread */
    QMetaObject::invokeMethod(
        this,
        [this]() {
            if (backoffLoop) {
                backoffLoop->quit();
            }
        },
        Qt::QueuedConnection);
}

bool QCodeAgent::isRunning() const
{
    return running.load();
}

void QCodeAgent::clearHistory()
{
    history.clear();
}

QString QCodeAgent::findProjectContextFile(const QString &projectPath)
{
    static const QStringList candidates = {"agent.md", "AGENT.md", "CLAUDE.md", "claude.md"};

    const QDir root(projectPath);
    for (const QString &name : candidates) {
        /* Case-insensitive file systems report every spelling, take the first */
        const QFileInfo info(root.filePath(name));
        if (info.isFile()) {
            return info.absoluteFilePath();
        }
    }
    return QString();
}

bool QCodeAgent::loadProjectContext(const QString &projectPath)
{
    projectRoot = QDir(projectPath).absolutePath();
    contextFile.clear();
    projectContext.clear();

    const QString path = findProjectContextFile(projectRoot);
    if (!path.isEmpty()) {
        QFile file(path);
        if (file.open(QIODevice::ReadOnly)) {
            contextFile    = path;
            projectContext = QString::fromUtf8(file.readAll()).trimmed();
            qInfo() << "Loaded project context from" << path;
        } else {
            qWarning() << "Cannot read project context" << path << ":" << file.errorString();
        }
    }

    history.setSystemPrompt(composeSystemPrompt());
    return !contextFile.isEmpty();
}

QString QCodeAgent::projectContextFile() const
{
    return contextFile;
}

QString QCodeAgent::composeSystemPrompt() const
{
    QString prompt = agentConfig.systemPrompt;

    if (!projectRoot.isEmpty()) {
        prompt += QString("\n\n# Working Directory\n"
                          "You are working in: %1\n"
                          "Relative paths given to tools resolve against this directory.")
                      .arg(projectRoot);
    }

    if (!projectContext.isEmpty()) {
        prompt += QString("\n\n# Project Context\n"
                          "The following instructions come from the project's %1 file:\n\n%2")
                      .arg(QFileInfo(contextFile).fileName(), projectContext);
    }

    return prompt.trimmed();
}

void QCodeAgent::setBackend(QCodeBackend *backend)
{
    this->backend = backend;
}

void QCodeAgent::setToolRegistry(QCodeToolRegistry *toolRegistry)
{
    this->toolRegistry = toolRegistry;
    dispatcher->setToolRegistry(toolRegistry);
}

void QCodeAgent::setModeGate(QCodeModeGate *modeGate)
{
    this->modeGate = modeGate;
    dispatcher->setModeGate(modeGate);
}

void QCodeAgent::setConfig(const QCodeAgentConfig &config)
{
    agentConfig = config;
    history.setMaxMessages(agentConfig.maxMessages);
    history.setSystemPrompt(composeSystemPrompt());
    dispatcher->setMaxParallelTools(agentConfig.maxParallelTools);
}

QCodeAgentConfig QCodeAgent::getConfig() const
{
    return agentConfig;
}

const QCodeTranscript &QCodeAgent::transcript() const
{
    return history;
}

json QCodeAgent::getMessages() const
{
    return history.toJson();
}

bool QCodeAgent::setMessages(const json &msgs)
{
    if (!history.fromJson(msgs)) {
        return false;
    }
    history.setMaxMessages(agentConfig.maxMessages);
    if (history.systemPrompt().isEmpty()) {
        history.setSystemPrompt(composeSystemPrompt());
    }
    return true;
}
