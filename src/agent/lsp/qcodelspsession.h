// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODELSPSESSION_H
#define QCODELSPSESSION_H

#include "agent/lsp/qcodelspframing.h"
#include "agent/lsp/qcodelsppending.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <QByteArray>
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>
#include <QThread>
#include <QWaitCondition>

using json = nlohmann::json;

/**
 * @brief Lifecycle of a language server session
 */
enum class QCodeLspState : std::uint8_t {
    Uninitialized, /* Created, start() not called */
    Starting,      /* Process spawned, initialize in flight */
    Ready,         /* Accepting queries */
    Degraded,      /* Process exited or stream closed, queries fail */
    Terminated     /* Shut down or failed to start */
};

QString qcodeLspStateName(QCodeLspState state);

/**
 * @brief How to launch one language server
 */
struct QCodeLspServerSpec
{
    QString     language; /* Session key, e.g. "rust" */
    QString     program;
    QStringList arguments;
    QString     rootPath; /* Workspace root sent in initialize */
};

class QCodeLspSession;

/**
 * @brief Owns the server process on the session's I/O thread
 * @details Its stdout handler is the session's background reader: every decoded frame
 *          is handed to QCodeLspSession::handleMessage().
 */
class QCodeLspConnection : public QObject
{
    Q_OBJECT

public:
    explicit QCodeLspConnection(QCodeLspSession *session);
    ~QCodeLspConnection() override;

    bool startProcess(
        const QString     &program,
        const QStringList &arguments,
        const QString     &workingDirectory,
        QString           *errorString);
    void write(const QByteArray &data);
    void stopProcess();

private slots:
    void onReadyReadStandardOutput();
    void onReadyReadStandardError();
    void onFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onErrorOccurred(QProcess::ProcessError error);

private:
    QCodeLspSession     *session = nullptr;
    QProcess            *process = nullptr;
    QCodeLspFrameDecoder decoder;
    bool                 stopping = false;
};

/**
 * @brief One live language server
 * @details Queries block the calling thread until the reply arrives or the request
 *          deadline passes; they may be issued from several threads at once. Replies
 *          are matched to waiters by request id, so they may arrive in any order.
 *          Diagnostics are pushed by the server and cached per file, the latest
 *          notification replacing the previous snapshot.
 */
class QCodeLspSession : public QObject
{
    Q_OBJECT

public:
    explicit QCodeLspSession(QObject *parent = nullptr, const QCodeLspServerSpec &spec = {});
    ~QCodeLspSession() override;

    /**
     * @brief Spawn the server and run the initialize handshake
     * @return Unavailable if the process cannot be started or initialize fails
     */
    QCodeLspReply start();

    /**
     * @brief Send shutdown and exit, then stop the process and the I/O thread
     */
    void shutdown();

    QCodeLspState      state() const;
    QCodeLspServerSpec serverSpec() const;
    qint64             processId() const;

    void setRequestTimeout(int timeoutMs);
    int  requestTimeout() const;
    void setInitializeTimeout(int timeoutMs);
    void setDiagnosticsSettleTime(int settleMs);

    /**
     * @brief Locations of the definition of the symbol at a position
     * @param filePath File containing the symbol
     * @param line 0-based line
     * @param character 0-based column
     * @return Array of {path, line, character, endLine, endCharacter}, possibly empty
     */
    QCodeLspReply definition(const QString &filePath, int line, int character);

    /**
     * @brief Locations referencing the symbol at a position, declaration included
     */
    QCodeLspReply references(const QString &filePath, int line, int character);

    /**
     * @brief Latest diagnostics published for a file
     * @details Synchronizes the document first. When it was opened or changed, waits up
     *          to the settle time for the server to publish fresh diagnostics.
     * @return Array of LSP Diagnostic objects, empty if none were published
     */
    QCodeLspReply diagnostics(const QString &filePath);

    /**
     * @brief Send a request and wait for its reply
     */
    QCodeLspReply request(const QString &method, const json &params);

    void notify(const QString &method, const json &params);

    /**
     * @brief Release every waiter with Cancelled, the session stays usable
     */
    void cancelPending();

    int pendingCount() const;

    /**
     * @brief Route one message received from the server
     */
    void handleMessage(const json &message);

    static QString languageIdForPath(const QString &filePath);
    static QString pathToUri(const QString &filePath);
    static QString uriToPath(const QString &uri);

    /**
     * @brief Normalize a definition/references result
     * @details Accepts null, a Location, a Location array or a LocationLink array.
     */
    static json parseLocations(const json &result);

    /**
     * @brief Read an integer member of a server-supplied object
     * @return The value, or fallback when the member is missing, not an integer or out of range
     */
    static int intMember(const json &object, const char *key, int fallback = 0);

    /**
     * @brief Read a string member of a server-supplied object
     * @return The value, or fallback when the member is missing or not a string
     */
    static QString stringMember(const json &object, const char *key, const QString &fallback = QString());

signals:
    void stateChanged(QCodeLspState state);
    void diagnosticsUpdated(const QString &filePath, int count);

private:
    friend class QCodeLspConnection;

    struct Document
    {
        int        version = 0;
        QByteArray text;
    };

    struct DiagnosticsSnapshot
    {
        json   items      = json::array();
        qint64 generation = 0;
    };

    QCodeLspServerSpec                  spec;
    QThread                             ioThread;
    std::unique_ptr<QCodeLspConnection> connection;
    QCodeLspPendingRegistry             pending;

    std::atomic<QCodeLspState> currentState{QCodeLspState::Uninitialized};
    std::atomic<qint64>        pid{0};
    std::atomic<int>           requestTimeoutMs{10000};
    std::atomic<int>           initializeTimeoutMs{30000};
    std::atomic<int>           diagnosticsSettleMs{500};

    /* Serializes start() and shutdown() */
    QMutex lifecycleMutex;

    QMutex                  documentMutex;
    QHash<QString, Document> documents;

    mutable QMutex                      diagnosticsMutex;
    QWaitCondition                      diagnosticsChanged;
    QHash<QString, DiagnosticsSnapshot> diagnosticsCache;
    qint64                              diagnosticsGeneration = 0;
    qint64                              cancelGeneration      = 0;

    void          setState(QCodeLspState state);
    void          markLost(const QString &reason);
    void          send(const json &message);
    void          stopIo();
    QCodeLspReply ensureReady() const;
    QCodeLspReply sendRequest(const QString &method, const json &params, int timeoutMs);
    QCodeLspReply syncDocument(const QString &filePath, bool *changed);
    QCodeLspReply positionRequest(
        const QString &method, const QString &filePath, int line, int character, const json &extra);
};

#endif // QCODELSPSESSION_H
