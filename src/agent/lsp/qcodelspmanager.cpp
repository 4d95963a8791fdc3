// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/lsp/qcodelspmanager.h"
#include "common/qcodeconfig.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>

QCodeLspManager::QCodeLspManager(QObject *parent, QCodeConfig *config, const QString &rootPath)
    : QObject(parent)
    , config(config)
    , root(rootPath)
{}

QCodeLspManager::~QCodeLspManager()
{
    shutdownAll();
}

void QCodeLspManager::setRootPath(const QString &rootPath)
{
    QMutexLocker locker(&mutex);
    root = rootPath;
}

QString QCodeLspManager::rootPath() const
{
    QMutexLocker locker(&mutex);
    return root;
}

void QCodeLspManager::setRequestTimeout(int timeoutMs)
{
    QMutexLocker locker(&mutex);
    requestTimeoutMs = qMax(1, timeoutMs);
    for (const auto &session : sessions) {
        session->setRequestTimeout(requestTimeoutMs);
    }
}

void QCodeLspManager::setDiagnosticsSettleTime(int settleMs)
{
    QMutexLocker locker(&mutex);
    diagnosticsSettleMs = qMax(0, settleMs);
    for (const auto &session : sessions) {
        session->setDiagnosticsSettleTime(diagnosticsSettleMs);
    }
}

void QCodeLspManager::setInitializeTimeout(int timeoutMs)
{
    QMutexLocker locker(&mutex);
    initializeTimeoutMs = qMax(1, timeoutMs);
}

void QCodeLspManager::setServerCommand(
    const QString &language, const QString &program, const QStringList &arguments)
{
    QMutexLocker       locker(&mutex);
    QCodeLspServerSpec spec;
    spec.language       = language;
    spec.program        = program;
    spec.arguments      = arguments;
    overrides[language] = spec;
}

QString QCodeLspManager::languageForPath(const QString &filePath)
{
    const QString languageId = QCodeLspSession::languageIdForPath(filePath);

    if (languageId == "rust") {
        return "rust";
    }
    if (languageId == "c" || languageId == "cpp") {
        return "cpp";
    }
    if (languageId == "python") {
        return "python";
    }
    if (languageId == "go") {
        return "go";
    }
    if (languageId == "typescript" || languageId == "typescriptreact" || languageId == "javascript"
        || languageId == "javascriptreact") {
        return "typescript";
    }
    return QString();
}

QCodeLspServerSpec QCodeLspManager::serverSpec(const QString &language) const
{
    QMutexLocker locker(&mutex);

    QCodeLspServerSpec spec;
    if (overrides.contains(language)) {
        spec = overrides.value(language);
    } else {
        static const QHash<QString, QStringList> defaults
            = {{"rust", {"rust-analyzer"}},
               {"cpp", {"clangd"}},
               {"python", {"pyright-langserver", "--stdio"}},
               {"go", {"gopls"}},
               {"typescript", {"typescript-language-server", "--stdio"}}};

        QStringList command = defaults.value(language);
        if (config) {
            const QString program = config->getValue(QString("lsp.%1.command").arg(language));
            if (!program.isEmpty()) {
                command = QStringList{program};
                const QString args = config->getValue(QString("lsp.%1.args").arg(language));
                command += args.split(' ', Qt::SkipEmptyParts);
            }
        }

        spec.language = language;
        if (!command.isEmpty()) {
            spec.program   = command.takeFirst();
            spec.arguments = command;
        }
    }

    spec.rootPath = root.isEmpty() ? QDir::currentPath() : root;
    return spec;
}

std::shared_ptr<QCodeLspSession> QCodeLspManager::acquire(const QString &filePath, QCodeLspReply &reply)
{
    const QString language = languageForPath(filePath);
    if (language.isEmpty()) {
        reply = QCodeLspReply::failure(
            QCodeLspError::Unavailable,
            QString("No language server available for '%1'").arg(QFileInfo(filePath).fileName()));
        return nullptr;
    }

    {
        QMutexLocker locker(&mutex);
        auto         existing = sessions.value(language);
        if (existing) {
            if (existing->state() == QCodeLspState::Degraded) {
                /* Report the loss once; the next query starts a new server */
                sessions.remove(language);
                locker.unlock();
                existing->shutdown();
                reply = QCodeLspReply::failure(
                    QCodeLspError::SessionLost,
                    QString("Language server for %1 was lost; it will be restarted on the next "
                            "request")
                        .arg(language));
                return nullptr;
            }
            if (existing->state() == QCodeLspState::Ready) {
                return existing;
            }
        }
    }

    std::shared_ptr<QMutex> startLock;
    {
        QMutexLocker locker(&mutex);
        startLock = startLocks.value(language);
        if (!startLock) {
            startLock = std::make_shared<QMutex>();
            startLocks.insert(language, startLock);
        }
    }
    QMutexLocker startLocker(startLock.get());

    /* Another thread may have started it while we waited */
    {
        QMutexLocker locker(&mutex);
        auto         existing = sessions.value(language);
        if (existing && existing->state() == QCodeLspState::Ready) {
            return existing;
        }
    }

    const QCodeLspServerSpec spec = serverSpec(language);
    if (spec.program.isEmpty()) {
        reply = QCodeLspReply::failure(
            QCodeLspError::Unavailable, QString("No language server configured for %1").arg(language));
        return nullptr;
    }

    auto session = std::make_shared<QCodeLspSession>(nullptr, spec);
    {
        QMutexLocker locker(&mutex);
        session->setRequestTimeout(requestTimeoutMs);
        session->setDiagnosticsSettleTime(diagnosticsSettleMs);
        session->setInitializeTimeout(initializeTimeoutMs);
    }

    reply = session->start();
    if (!reply.isOk()) {
        return nullptr;
    }

    QMutexLocker locker(&mutex);
    sessions.insert(language, session);
    return session;
}

QCodeLspReply QCodeLspManager::definition(const QString &filePath, int line, int character)
{
    QCodeLspReply reply;
    auto          session = acquire(filePath, reply);
    return session ? session->definition(filePath, line, character) : reply;
}

QCodeLspReply QCodeLspManager::references(const QString &filePath, int line, int character)
{
    QCodeLspReply reply;
    auto          session = acquire(filePath, reply);
    return session ? session->references(filePath, line, character) : reply;
}

QCodeLspReply QCodeLspManager::diagnostics(const QString &filePath)
{
    QCodeLspReply reply;
    auto          session = acquire(filePath, reply);
    return session ? session->diagnostics(filePath) : reply;
}

std::shared_ptr<QCodeLspSession> QCodeLspManager::session(const QString &language) const
{
    QMutexLocker locker(&mutex);
    return sessions.value(language);
}

void QCodeLspManager::resetSession(const QString &language)
{
    std::shared_ptr<QCodeLspSession> session;
    {
        QMutexLocker locker(&mutex);
        session = sessions.take(language);
    }
    if (session) {
        session->shutdown();
    }
}

void QCodeLspManager::shutdownAll()
{
    QHash<QString, std::shared_ptr<QCodeLspSession>> taken;
    {
        QMutexLocker locker(&mutex);
        taken.swap(sessions);
    }
    for (const auto &session : taken) {
        session->shutdown();
    }
}

void QCodeLspManager::cancelPending()
{
    QList<std::shared_ptr<QCodeLspSession>> live;
    {
        QMutexLocker locker(&mutex);
        live = sessions.values();
    }
    for (const auto &session : live) {
        session->cancelPending();
    }
}
