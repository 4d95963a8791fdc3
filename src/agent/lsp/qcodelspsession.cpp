// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/lsp/qcodelspsession.h"

#include <cstdint>
#include <limits>

#include <QCoreApplication>
#include <QDeadlineTimer>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QUrl>

namespace {

/* Grace periods while stopping the server */
constexpr int kShutdownRequestMs = 2000;
constexpr int kExitWaitMs        = 2000;
constexpr int kTerminateWaitMs   = 1000;

json toJsonString(const QString &text)
{
    return text.toStdString();
}

} // namespace

QString qcodeLspStateName(QCodeLspState state)
{
    switch (state) {
    case QCodeLspState::Uninitialized:
        return "Uninitialized";
    case QCodeLspState::Starting:
        return "Starting";
    case QCodeLspState::Ready:
        return "Ready";
    case QCodeLspState::Degraded:
        return "Degraded";
    case QCodeLspState::Terminated:
        return "Terminated";
    }
    return "Unknown";
}

/* QCodeLspConnection Implementation */

QCodeLspConnection::QCodeLspConnection(QCodeLspSession *session)
    : session(session)
{}

QCodeLspConnection::~QCodeLspConnection() = default;

bool QCodeLspConnection::startProcess(
    const QString     &program,
    const QStringList &arguments,
    const QString     &workingDirectory,
    QString           *errorString)
{
    process = new QProcess(this);
    process->setProcessChannelMode(QProcess::SeparateChannels);
    if (!workingDirectory.isEmpty()) {
        process->setWorkingDirectory(workingDirectory);
    }

    connect(
        process,
        &QProcess::readyReadStandardOutput,
        this,
        &QCodeLspConnection::onReadyReadStandardOutput);
    connect(
        process,
        &QProcess::readyReadStandardError,
        this,
        &QCodeLspConnection::onReadyReadStandardError);
    connect(
        process,
        QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
        this,
        &QCodeLspConnection::onFinished);
    connect(process, &QProcess::errorOccurred, this, &QCodeLspConnection::onErrorOccurred);

    process->start(program, arguments);
    if (!process->waitForStarted(5000)) {
        if (errorString) {
            *errorString = process->errorString();
        }
        stopping = true;
        delete process;
        process = nullptr;
        return false;
    }

    session->pid = process->processId();
    return true;
}

void QCodeLspConnection::write(const QByteArray &data)
{
    if (process && process->state() == QProcess::Running) {
        process->write(data);
    }
}

void QCodeLspConnection::stopProcess()
{
    stopping = true;
    if (!process) {
        return;
    }

    if (process->state() != QProcess::NotRunning) {
        process->closeWriteChannel();
        if (!process->waitForFinished(kExitWaitMs)) {
            process->terminate();
            if (!process->waitForFinished(kTerminateWaitMs)) {
                process->kill();
                process->waitForFinished(-1);
            }
        }
    }

    delete process;
    process = nullptr;
}

void QCodeLspConnection::onReadyReadStandardOutput()
{
    if (!process) {
        return;
    }

    decoder.feed(process->readAllStandardOutput());
    const QList<json> messages = decoder.takeMessages();
    for (const json &message : messages) {
        session->handleMessage(message);
    }

    if (decoder.hasError()) {
        qWarning() << "Language server" << session->spec.language << "sent a bad frame:"
                   << decoder.errorString();
        decoder.clearError();
    }
}

void QCodeLspConnection::onReadyReadStandardError()
{
    if (!process) {
        return;
    }

    const QList<QByteArray> lines = process->readAllStandardError().split('\n');
    for (const QByteArray &line : lines) {
        if (!line.trimmed().isEmpty()) {
            qDebug().noquote() << "[lsp" << session->spec.language << "]" << line.trimmed();
        }
    }
}

void QCodeLspConnection::onFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    if (stopping) {
        return;
    }

    session->markLost(
        exitStatus == QProcess::CrashExit
            ? QString("Language server crashed")
            : QString("Language server exited with code %1").arg(exitCode));
}

void QCodeLspConnection::onErrorOccurred(QProcess::ProcessError error)
{
    if (stopping || error == QProcess::FailedToStart) {
        return;
    }

    if (error == QProcess::Crashed || error == QProcess::WriteError
        || error == QProcess::ReadError) {
        session->markLost(QString("Language server stream lost: %1")
                              .arg(process ? process->errorString() : QString()));
    }
}

/* QCodeLspSession Implementation */

QCodeLspSession::QCodeLspSession(QObject *parent, const QCodeLspServerSpec &spec)
    : QObject(parent)
    , spec(spec)
{
    ioThread.setObjectName(QString("lsp-%1").arg(spec.language));
}

QCodeLspSession::~QCodeLspSession()
{
    shutdown();
}

QCodeLspReply QCodeLspSession::start()
{
    QMutexLocker locker(&lifecycleMutex);

    const QCodeLspState initial = currentState.load();
    if (initial == QCodeLspState::Ready) {
        return QCodeLspReply::ok(json());
    }
    if (initial != QCodeLspState::Uninitialized) {
        return QCodeLspReply::failure(
            QCodeLspError::Unavailable,
            QString("Language server session is %1").arg(qcodeLspStateName(initial)));
    }

    setState(QCodeLspState::Starting);

    connection = std::make_unique<QCodeLspConnection>(this);
    connection->moveToThread(&ioThread);
    ioThread.start();

    bool                started = false;
    QString             errorString;
    QCodeLspConnection *target = connection.get();
    QMetaObject::invokeMethod(
        target,
        [&]() {
            started = target->startProcess(spec.program, spec.arguments, spec.rootPath, &errorString);
        },
        Qt::BlockingQueuedConnection);

    if (!started) {
        stopIo();
        setState(QCodeLspState::Terminated);
        qWarning() << "Failed to start language server" << spec.program << ":" << errorString;
        return QCodeLspReply::failure(
            QCodeLspError::Unavailable,
            QString("Failed to start language server '%1': %2").arg(spec.program, errorString));
    }

    const QString rootPath = spec.rootPath.isEmpty() ? QDir::currentPath() : spec.rootPath;
    const json    rootUri  = toJsonString(pathToUri(rootPath));

    const json params
        = {{"processId", QCoreApplication::applicationPid()},
           {"clientInfo", {{"name", "qcode"}}},
           {"rootPath", toJsonString(rootPath)},
           {"rootUri", rootUri},
           {"workspaceFolders",
            json::array({{{"uri", rootUri}, {"name", toJsonString(QFileInfo(rootPath).fileName())}}})},
           {"capabilities",
            {{"textDocument",
              {{"synchronization", {{"didSave", false}, {"dynamicRegistration", false}}},
               {"definition", {{"linkSupport", true}}},
               {"references", json::object()},
               {"publishDiagnostics", {{"relatedInformation", false}}}}},
             {"workspace", {{"configuration", true}, {"workspaceFolders", true}}}}}};

    const QCodeLspReply reply = sendRequest("initialize", params, initializeTimeoutMs.load());
    if (!reply.isOk()) {
        stopIo();
        setState(QCodeLspState::Terminated);
        qWarning() << "Language server" << spec.program << "failed to initialize:" << reply.message;
        return QCodeLspReply::failure(
            QCodeLspError::Unavailable,
            QString("Language server '%1' failed to initialize: %2").arg(spec.program, reply.message));
    }

    send({{"jsonrpc", "2.0"}, {"method", "initialized"}, {"params", json::object()}});

    /* The process may have died during the handshake */
    QCodeLspState expected = QCodeLspState::Starting;
    if (!currentState.compare_exchange_strong(expected, QCodeLspState::Ready)) {
        return QCodeLspReply::failure(
            QCodeLspError::Unavailable, "Language server exited during initialization");
    }
    emit stateChanged(QCodeLspState::Ready);

    qDebug() << "Language server" << spec.program << "ready for" << spec.language;
    return reply;
}

void QCodeLspSession::shutdown()
{
    QMutexLocker locker(&lifecycleMutex);

    const QCodeLspState state = currentState.load();
    if (state == QCodeLspState::Terminated) {
        return;
    }
    if (state == QCodeLspState::Uninitialized) {
        setState(QCodeLspState::Terminated);
        return;
    }

    if (state == QCodeLspState::Ready) {
        const QCodeLspReply reply = sendRequest(
            "shutdown", json(), qMin(requestTimeoutMs.load(), kShutdownRequestMs));
        if (!reply.isOk()) {
            qDebug() << "Language server shutdown request failed:" << reply.message;
        }
        send({{"jsonrpc", "2.0"}, {"method", "exit"}});
    }

    setState(QCodeLspState::Terminated);
    pending.failAll(QCodeLspError::SessionLost, "Language server session shut down");
    {
        QMutexLocker diagnosticsLocker(&diagnosticsMutex);
        diagnosticsChanged.wakeAll();
    }

    stopIo();
}

void QCodeLspSession::stopIo()
{
    if (connection && ioThread.isRunning()) {
        QCodeLspConnection *target = connection.get();
        QMetaObject::invokeMethod(target, [target]() { target->stopProcess(); }, Qt::BlockingQueuedConnection);
    }
    ioThread.quit();
    ioThread.wait();
}

QCodeLspState QCodeLspSession::state() const
{
    return currentState.load();
}

QCodeLspServerSpec QCodeLspSession::serverSpec() const
{
    return spec;
}

qint64 QCodeLspSession::processId() const
{
    return pid.load();
}

void QCodeLspSession::setRequestTimeout(int timeoutMs)
{
    requestTimeoutMs = qMax(1, timeoutMs);
}

int QCodeLspSession::requestTimeout() const
{
    return requestTimeoutMs.load();
}

void QCodeLspSession::setInitializeTimeout(int timeoutMs)
{
    initializeTimeoutMs = qMax(1, timeoutMs);
}

void QCodeLspSession::setDiagnosticsSettleTime(int settleMs)
{
    diagnosticsSettleMs = qMax(0, settleMs);
}

void QCodeLspSession::setState(QCodeLspState state)
{
    if (currentState.exchange(state) != state) {
        emit stateChanged(state);
    }
}

void QCodeLspSession::markLost(const QString &reason)
{
    QCodeLspState state = currentState.load();
    while (state == QCodeLspState::Ready || state == QCodeLspState::Starting) {
        if (currentState.compare_exchange_weak(state, QCodeLspState::Degraded)) {
            emit stateChanged(QCodeLspState::Degraded);
            break;
        }
    }

    qWarning() << "Language server" << spec.language << "lost:" << reason;
    pending.failAll(QCodeLspError::SessionLost, reason);

    QMutexLocker locker(&diagnosticsMutex);
    diagnosticsChanged.wakeAll();
}

void QCodeLspSession::send(const json &message)
{
    if (!connection) {
        return;
    }

    const QByteArray    frame  = QCodeLspFraming::encode(message);
    QCodeLspConnection *target = connection.get();
    QMetaObject::invokeMethod(target, [target, frame]() { target->write(frame); }, Qt::QueuedConnection);
}

QCodeLspReply QCodeLspSession::ensureReady() const
{
    switch (currentState.load()) {
    case QCodeLspState::Ready:
        return QCodeLspReply::ok(json());
    case QCodeLspState::Degraded:
        return QCodeLspReply::failure(QCodeLspError::SessionLost, "Language server session lost");
    case QCodeLspState::Terminated:
        return QCodeLspReply::failure(QCodeLspError::Unavailable, "Language server session terminated");
    case QCodeLspState::Uninitialized:
    case QCodeLspState::Starting:
    default:
        return QCodeLspReply::failure(QCodeLspError::Unavailable, "Language server not started");
    }
}

QCodeLspReply QCodeLspSession::sendRequest(const QString &method, const json &params, int timeoutMs)
{
    const qint64 id   = pending.nextId();
    auto         slot = pending.insert(id);

    /* A loss before insert() would not reach this slot */
    if (currentState.load() == QCodeLspState::Degraded) {
        pending.abandon(id);
        return QCodeLspReply::failure(QCodeLspError::SessionLost, "Language server session lost");
    }

    json message = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method.toStdString()}};
    if (!params.is_null()) {
        message["params"] = params;
    }
    send(message);

    if (!slot->wait(timeoutMs)) {
        pending.abandon(id);
        if (slot->isDone()) {
            return slot->reply();
        }
        return QCodeLspReply::failure(
            QCodeLspError::Timeout,
            QString("LSP request '%1' timed out after %2 ms").arg(method).arg(timeoutMs));
    }

    return slot->reply();
}

QCodeLspReply QCodeLspSession::request(const QString &method, const json &params)
{
    const QCodeLspReply ready = ensureReady();
    if (!ready.isOk()) {
        return ready;
    }
    return sendRequest(method, params, requestTimeoutMs.load());
}

void QCodeLspSession::notify(const QString &method, const json &params)
{
    json message = {{"jsonrpc", "2.0"}, {"method", method.toStdString()}};
    if (!params.is_null()) {
        message["params"] = params;
    }
    send(message);
}

void QCodeLspSession::cancelPending()
{
    pending.failAll(QCodeLspError::Cancelled, "LSP request cancelled");

    QMutexLocker locker(&diagnosticsMutex);
    cancelGeneration++;
    diagnosticsChanged.wakeAll();
}

int QCodeLspSession::pendingCount() const
{
    return pending.size();
}

void QCodeLspSession::handleMessage(const json &message)
{
    if (!message.is_object()) {
        return;
    }

    const bool hasMethod = message.contains("method") && message["method"].is_string();

    /* Response to one of our requests */
    if (!hasMethod && message.contains("id")) {
        const json &rawId = message["id"];
        qint64      id    = -1;
        if (rawId.is_number_integer()) {
            id = rawId.get<qint64>();
        } else if (rawId.is_string()) {
            bool ok = false;
            id      = QString::fromStdString(rawId.get<std::string>()).toLongLong(&ok);
            if (!ok) {
                id = -1;
            }
        }
        if (id < 0) {
            qDebug() << "Dropping LSP response with unusable id" << QString::fromStdString(rawId.dump());
            return;
        }

        if (message.contains("error")) {
            /* Servers do not always follow the ResponseError shape */
            const json   &error = message["error"];
            const QString text  = stringMember(error, "message", "unknown error");
            QString       code  = "unknown";
            if (error.is_object() && error.contains("code")) {
                if (error["code"].is_number_integer()) {
                    code = QString::number(error["code"].get<qint64>());
                } else if (error["code"].is_string()) {
                    code = QString::fromStdString(error["code"].get<std::string>());
                }
            }
            pending.fulfill(
                id,
                QCodeLspReply::failure(
                    QCodeLspError::ProtocolError, QString("%1 (code %2)").arg(text, code)));
        } else {
            pending.fulfill(id, QCodeLspReply::ok(message.value("result", json())));
        }
        return;
    }

    if (!hasMethod) {
        return;
    }

    const std::string method = message["method"].get<std::string>();

    /* Server-to-client request: answer so the server does not stall */
    if (message.contains("id")) {
        json result = nullptr;
        if (method == "workspace/configuration" && message.contains("params")
            && message["params"].contains("items") && message["params"]["items"].is_array()) {
            result = json::array();
            for (size_t i = 0; i < message["params"]["items"].size(); ++i) {
                result.push_back(nullptr);
            }
        }
        send({{"jsonrpc", "2.0"}, {"id", message["id"]}, {"result", result}});
        return;
    }

    if (method == "textDocument/publishDiagnostics") {
        if (!message.contains("params") || !message["params"].is_object()) {
            return;
        }
        const json &params = message["params"];
        if (!params.contains("uri") || !params["uri"].is_string()) {
            return;
        }

        const QString path  = uriToPath(QString::fromStdString(params["uri"].get<std::string>()));
        json          items = json::array();
        if (params.contains("diagnostics") && params["diagnostics"].is_array()) {
            for (const auto &item : params["diagnostics"]) {
                if (item.is_object()) {
                    items.push_back(item);
                }
            }
        }
        const int count = static_cast<int>(items.size());

        {
            QMutexLocker locker(&diagnosticsMutex);
            DiagnosticsSnapshot &snapshot = diagnosticsCache[path];
            snapshot.items                = items;
            snapshot.generation           = ++diagnosticsGeneration;
            diagnosticsChanged.wakeAll();
        }

        emit diagnosticsUpdated(path, count);
    }
}

QCodeLspReply QCodeLspSession::syncDocument(const QString &filePath, bool *changed)
{
    *changed = false;

    const QString path = QDir::cleanPath(QFileInfo(filePath).absoluteFilePath());
    QFile         file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QCodeLspReply::failure(
            QCodeLspError::IoError, QString("Cannot read file '%1': %2").arg(path, file.errorString()));
    }
    const QByteArray text = file.readAll();
    file.close();

    const json uri = toJsonString(pathToUri(path));

    /* Held while sending so notifications for a document keep their order */
    QMutexLocker locker(&documentMutex);
    auto         iter = documents.find(path);
    if (iter == documents.end()) {
        documents.insert(path, Document{1, text});
        notify(
            "textDocument/didOpen",
            {{"textDocument",
              {{"uri", uri},
               {"languageId", toJsonString(languageIdForPath(path))},
               {"version", 1},
               {"text", text.toStdString()}}}});
        *changed = true;
    } else if (iter->text != text) {
        iter->version++;
        iter->text = text;
        notify(
            "textDocument/didChange",
            {{"textDocument", {{"uri", uri}, {"version", iter->version}}},
             {"contentChanges", json::array({{{"text", text.toStdString()}}})}});
        *changed = true;
    }

    return QCodeLspReply::ok(json());
}

QCodeLspReply QCodeLspSession::positionRequest(
    const QString &method, const QString &filePath, int line, int character, const json &extra)
{
    QCodeLspReply reply = ensureReady();
    if (!reply.isOk()) {
        return reply;
    }

    bool changed = false;
    reply        = syncDocument(filePath, &changed);
    if (!reply.isOk()) {
        return reply;
    }

    json params
        = {{"textDocument", {{"uri", toJsonString(pathToUri(QFileInfo(filePath).absoluteFilePath()))}}},
           {"position", {{"line", qMax(0, line)}, {"character", qMax(0, character)}}}};
    for (auto iter = extra.begin(); iter != extra.end(); ++iter) {
        params[iter.key()] = iter.value();
    }

    reply = sendRequest(method, params, requestTimeoutMs.load());
    if (!reply.isOk()) {
        return reply;
    }

    return QCodeLspReply::ok(parseLocations(reply.result));
}

QCodeLspReply QCodeLspSession::definition(const QString &filePath, int line, int character)
{
    return positionRequest("textDocument/definition", filePath, line, character, json::object());
}

QCodeLspReply QCodeLspSession::references(const QString &filePath, int line, int character)
{
    return positionRequest(
        "textDocument/references",
        filePath,
        line,
        character,
        {{"context", {{"includeDeclaration", true}}}});
}

QCodeLspReply QCodeLspSession::diagnostics(const QString &filePath)
{
    QCodeLspReply reply = ensureReady();
    if (!reply.isOk()) {
        return reply;
    }

    const QString path = QDir::cleanPath(QFileInfo(filePath).absoluteFilePath());

    qint64 before      = 0;
    bool   hasSnapshot = false;
    qint64 cancelMark  = 0;
    {
        QMutexLocker locker(&diagnosticsMutex);
        auto         iter = diagnosticsCache.constFind(path);
        hasSnapshot       = iter != diagnosticsCache.constEnd();
        before            = hasSnapshot ? iter->generation : 0;
        cancelMark        = cancelGeneration;
    }

    bool changed = false;
    reply        = syncDocument(path, &changed);
    if (!reply.isOk()) {
        return reply;
    }

    QMutexLocker   locker(&diagnosticsMutex);
    QDeadlineTimer deadline(diagnosticsSettleMs.load());
    if (changed || !hasSnapshot) {
        while (diagnosticsCache.value(path).generation <= before
               && currentState.load() == QCodeLspState::Ready && cancelGeneration == cancelMark) {
            if (!diagnosticsChanged.wait(&diagnosticsMutex, deadline)) {
                break;
            }
        }
    }

    if (cancelGeneration != cancelMark) {
        return QCodeLspReply::failure(QCodeLspError::Cancelled, "LSP request cancelled");
    }
    if (currentState.load() != QCodeLspState::Ready) {
        return ensureReady();
    }

    auto iter = diagnosticsCache.constFind(path);
    return QCodeLspReply::ok(iter != diagnosticsCache.constEnd() ? iter->items : json::array());
}

QString QCodeLspSession::languageIdForPath(const QString &filePath)
{
    const QString suffix = QFileInfo(filePath).suffix().toLower();

    static const QHash<QString, QString> table
        = {{"rs", "rust"},
           {"ts", "typescript"},
           {"tsx", "typescriptreact"},
           {"js", "javascript"},
           {"jsx", "javascriptreact"},
           {"py", "python"},
           {"go", "go"},
           {"java", "java"},
           {"c", "c"},
           {"cc", "cpp"},
           {"cpp", "cpp"},
           {"cxx", "cpp"},
           {"h", "cpp"},
           {"hpp", "cpp"},
           {"json", "json"},
           {"toml", "toml"},
           {"md", "markdown"},
           {"yml", "yaml"},
           {"yaml", "yaml"}};

    return table.value(suffix, "plaintext");
}

QString QCodeLspSession::pathToUri(const QString &filePath)
{
    return QUrl::fromLocalFile(QDir::cleanPath(QFileInfo(filePath).absoluteFilePath()))
        .toString(QUrl::FullyEncoded);
}

QString QCodeLspSession::uriToPath(const QString &uri)
{
    const QUrl url(uri);
    if (!url.isLocalFile()) {
        return uri;
    }
    return QDir::cleanPath(url.toLocalFile());
}

json QCodeLspSession::parseLocations(const json &result)
{
    json locations = json::array();
    if (result.is_null()) {
        return locations;
    }

    const json entries = result.is_array() ? result : json::array({result});
    for (const auto &entry : entries) {
        if (!entry.is_object()) {
            continue;
        }

        json uri;
        json range;
        if (entry.contains("targetUri")) {
            uri   = entry["targetUri"];
            range = entry.contains("targetSelectionRange") ? entry["targetSelectionRange"]
                                                           : entry.value("targetRange", json());
        } else {
            uri   = entry.value("uri", json());
            range = entry.value("range", json());
        }

        if (!uri.is_string() || !range.is_object() || !range.contains("start")
            || !range["start"].is_object()) {
            continue;
        }

        const json &start = range["start"];
        const json &end   = range.contains("end") && range["end"].is_object() ? range["end"] : start;
        locations.push_back(
            {{"path", toJsonString(uriToPath(QString::fromStdString(uri.get<std::string>())))},
             {"line", intMember(start, "line")},
             {"character", intMember(start, "character")},
             {"endLine", intMember(end, "line")},
             {"endCharacter", intMember(end, "character")}});
    }

    return locations;
}

int QCodeLspSession::intMember(const json &object, const char *key, int fallback)
{
    if (!object.is_object() || !object.contains(key)) {
        return fallback;
    }
    const json &value = object[key];
    if (value.is_number_unsigned()) {
        const auto number = value.get<std::uint64_t>();
        return number > static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                   ? fallback
                   : static_cast<int>(number);
    }
    if (value.is_number_integer()) {
        const auto number = value.get<std::int64_t>();
        return number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()
                   ? fallback
                   : static_cast<int>(number);
    }
    return fallback;
}

QString QCodeLspSession::stringMember(const json &object, const char *key, const QString &fallback)
{
    if (!object.is_object() || !object.contains(key) || !object[key].is_string()) {
        return fallback;
    }
    return QString::fromStdString(object[key].get<std::string>());
}
