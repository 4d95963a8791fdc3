// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODELSPMANAGER_H
#define QCODELSPMANAGER_H

#include "agent/lsp/qcodelspsession.h"

#include <memory>
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QString>

class QCodeConfig;

/**
 * @brief Owns one language server session per language
 * @details The language of a query is taken from the file extension. Sessions are
 *          started on first use. A session found Degraded fails the query that found it
 *          and is discarded, so the following query starts a fresh server.
 */
class QCodeLspManager : public QObject
{
    Q_OBJECT

public:
    explicit QCodeLspManager(
        QObject *parent = nullptr, QCodeConfig *config = nullptr, const QString &rootPath = QString());
    ~QCodeLspManager() override;

    void    setRootPath(const QString &rootPath);
    QString rootPath() const;

    void setRequestTimeout(int timeoutMs);
    void setDiagnosticsSettleTime(int settleMs);

    /**
     * @brief Bound the initialize handshake of newly started servers
     */
    void setInitializeTimeout(int timeoutMs);

    /**
     * @brief Override the server used for a language
     */
    void setServerCommand(const QString &language, const QString &program, const QStringList &arguments);

    /**
     * @brief Session key for a file, empty when no server handles it
     * @return "rust", "cpp", "python", "go" or "typescript"
     */
    static QString languageForPath(const QString &filePath);

    /**
     * @brief Launch settings for a language: override, then config, then built-in default
     */
    QCodeLspServerSpec serverSpec(const QString &language) const;

    QCodeLspReply definition(const QString &filePath, int line, int character);
    QCodeLspReply references(const QString &filePath, int line, int character);
    QCodeLspReply diagnostics(const QString &filePath);

    /**
     * @brief Live session of a language, nullptr if none
     */
    std::shared_ptr<QCodeLspSession> session(const QString &language) const;

    /**
     * @brief Shut down and forget the session of a language
     */
    void resetSession(const QString &language);

    void shutdownAll();

    /**
     * @brief Release every blocked query with Cancelled
     */
    void cancelPending();

private:
    QCodeConfig *config = nullptr;
    QString      root;
    int          requestTimeoutMs    = 10000;
    int          diagnosticsSettleMs = 500;
    int          initializeTimeoutMs = 30000;

    mutable QMutex                                   mutex;
    QHash<QString, std::shared_ptr<QCodeLspSession>> sessions;
    QHash<QString, QCodeLspServerSpec>               overrides;

    /* One start-up lock per language, so a slow server never delays another language */
    QHash<QString, std::shared_ptr<QMutex>> startLocks;

    /**
     * @brief Get or start the session for a file
     * @param reply Filled with the failure when nullptr is returned
     */
    std::shared_ptr<QCodeLspSession> acquire(const QString &filePath, QCodeLspReply &reply);
};

#endif // QCODELSPMANAGER_H
