// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODEAGENT_H
#define QCODEAGENT_H

#include "agent/qcodeagentconfig.h"
#include "agent/qcodetool.h"
#include "agent/qcodetoolcall.h"
#include "agent/qcodetranscript.h"
#include "common/qcodebackend.h"

#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <QObject>
#include <QString>

using json = nlohmann::json;

class QCodeModeGate;
class QCodeToolDispatcher;
class QEventLoop;

/**
 * @brief How an operator turn ended
 */
struct QCodeRunResult
{
    enum class Status : std::uint8_t {
        Completed,          /* Model gave a final answer */
        BackendUnavailable, /* Transient failures exhausted the retry budget */
        BackendError,       /* Non-transient backend failure */
        TurnLimitExceeded,  /* Iteration or wall-clock limit hit */
        Cancelled,          /* abort() was called */
        NotConfigured       /* Backend, registry or gate missing */
    };

    Status  status = Status::Completed;
    QString content;        /* Final answer when Completed */
    QString error;          /* Reason otherwise */
    int     iterations = 0; /* Backend round-trips that produced a reply */
    int     attempts   = 0; /* Backend requests sent, retries included */

    bool isCompleted() const { return status == Status::Completed; }
};

QString qcodeRunStatusName(QCodeRunResult::Status status);

/**
 * @brief The QCodeAgent class drives one conversation with the model
 * @details Each operator message starts a turn: the transcript is sent to the backend,
 *          tool calls in the reply are dispatched and their results appended, and the
 *          loop repeats until the model answers in plain text or a limit is reached.
 *          Transient backend failures are retried with exponential backoff.
 */
class QCodeAgent : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructor
     * @param parent Parent QObject
     * @param backend Inference backend
     * @param toolRegistry Registry of available tools
     * @param modeGate Shared mode cell
     * @param config Agent configuration
     */
    explicit QCodeAgent(
        QObject           *parent       = nullptr,
        QCodeBackend      *backend      = nullptr,
        QCodeToolRegistry *toolRegistry = nullptr,
        QCodeModeGate     *modeGate     = nullptr,
        QCodeAgentConfig   config       = QCodeAgentConfig());

    ~QCodeAgent() override;

    /**
     * @brief Run one operator turn
     * @details Blocks until the turn ends. The event loop of the calling thread keeps
     *          running, so abort() may be delivered from a signal handler or timer.
     * @param operatorMessage The operator's input
     * @return How the turn ended
     */
    QCodeRunResult run(const QString &operatorMessage);

    /**
     * @brief Abort the current turn
     * @details Thread-safe. Cancels the backend request, running tools and any backoff
     *          wait. run() returns Cancelled once everything has stopped.
     */
    void abort();

    bool isRunning() const;

    /**
     * @brief Clear the conversation, keeping the system prompt
     */
    void clearHistory();

    /**
     * @brief Prime the pinned system prompt with the project
     * @details Adds a working directory section and, when the project root holds one of
     *          agent.md, AGENT.md, CLAUDE.md or claude.md (first match wins), its content
     *          as a project context section. The prompt stays pinned for the session.
     * @param projectPath Project root directory
     * @return true if a context file was loaded
     */
    bool loadProjectContext(const QString &projectPath);

    /**
     * @brief Context file found by loadProjectContext(), empty if none
     */
    QString projectContextFile() const;

    /**
     * @brief First context file present in a project root
     * @return Absolute path, or empty when the project has none
     */
    static QString findProjectContextFile(const QString &projectPath);

    void setBackend(QCodeBackend *backend);
    void setToolRegistry(QCodeToolRegistry *toolRegistry);
    void setModeGate(QCodeModeGate *modeGate);

    void             setConfig(const QCodeAgentConfig &config);
    QCodeAgentConfig getConfig() const;

    const QCodeTranscript &transcript() const;

    /**
     * @brief Get the conversation history for saving
     * @return JSON array of messages
     */
    json getMessages() const;

    /**
     * @brief Restore the conversation history
     * @param msgs JSON array produced by getMessages()
     * @return false if the data was rejected
     */
    bool setMessages(const json &msgs);

signals:
    void toolCalled(const QString &toolName, const QString &arguments);
    void toolResult(const QString &toolName, const QString &result);
    void verboseOutput(const QString &message);

    /**
     * @brief Signal emitted before waiting to retry a failed backend request
     * @param attempt Failed attempt number (1-based)
     * @param maxAttempts Total attempts allowed
     * @param delayMs Backoff before the next attempt
     * @param error The error that triggered the retry
     */
    void retrying(int attempt, int maxAttempts, int delayMs, const QString &error);

    void runComplete(const QString &response);
    void runError(const QString &error);
    void runAborted(const QString &partialResult);

private:
    QCodeBackend        *backend      = nullptr;
    QCodeToolRegistry   *toolRegistry = nullptr;
    QCodeModeGate       *modeGate     = nullptr;
    QCodeToolDispatcher *dispatcher   = nullptr;
    QCodeAgentConfig     agentConfig;
    QCodeTranscript      history;

    std::atomic<bool> abortRequested{false};
    std::atomic<bool> running{false};
    QEventLoop       *backoffLoop = nullptr;

    QString projectRoot;
    QString contextFile;
    QString projectContext;

    /**
     * @brief Configured prompt plus the working directory and project context sections
     */
    QString composeSystemPrompt() const;

    /**
     * @brief Send the transcript, retrying transient failures
     * @param result Attempt counter is updated
     */
    QCodeBackendReply requestWithRetry(QCodeRunResult &result);

    /**
     * @brief Sleep in a local event loop
     * @return false if interrupted by abort()
     */
    bool waitBackoff(int delayMs);

    void appendToolRound(const json &message, const QCodeParsedReply &parsed);
    void appendMalformedRound(const json &message, const QCodeParsedReply &parsed, int iteration);

    QCodeRunResult finishRun(QCodeRunResult result);
};

#endif // QCODEAGENT_H
