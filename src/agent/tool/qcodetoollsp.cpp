// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/tool/qcodetoollsp.h"
#include "agent/tool/qcodetoolfile.h"

#include <limits>

#include <QDir>

namespace {

/* Largest 1-based position accepted, LSP positions are 32-bit */
constexpr double kMaxPosition = std::numeric_limits<int>::max();

/* 1-based position arguments */
bool readPosition(const json &arguments, int &line, int &character, QString &error)
{
    if (!arguments.contains("line") || !arguments["line"].is_number()
        || !arguments.contains("character") || !arguments["character"].is_number()) {
        error = "line and character are required";
        return false;
    }
    const double lineValue      = arguments["line"].get<double>();
    const double characterValue = arguments["character"].get<double>();
    if (lineValue < 1 || characterValue < 1 || lineValue > kMaxPosition
        || characterValue > kMaxPosition) {
        error = QString("line and character must be between 1 and %1 (got %2:%3)")
                    .arg(std::numeric_limits<int>::max())
                    .arg(arguments["line"].dump().c_str(), arguments["character"].dump().c_str());
        return false;
    }
    line      = static_cast<int>(lineValue);
    character = static_cast<int>(characterValue);
    return true;
}

} // namespace

/* QCodeToolLsp Implementation */

QCodeToolLsp::QCodeToolLsp(QObject *parent, QCodeLspManager *lspManager)
    : QCodeTool(parent)
    , lspManager(lspManager)
{}

QCodeToolLsp::~QCodeToolLsp() = default;

bool QCodeToolLsp::isMutating() const
{
    return false;
}

void QCodeToolLsp::abort()
{
    QCodeTool::abort();
    if (lspManager) {
        lspManager->cancelPending();
    }
}

void QCodeToolLsp::setLspManager(QCodeLspManager *lspManager)
{
    this->lspManager = lspManager;
}

QCodeToolResult QCodeToolLsp::errorFromReply(const QCodeLspReply &reply)
{
    switch (reply.error) {
    case QCodeLspError::Unavailable:
        return QCodeToolResult::error(QCodeToolErrorKind::LspUnavailable, reply.message);
    case QCodeLspError::SessionLost:
        return QCodeToolResult::error(QCodeToolErrorKind::LspSessionLost, reply.message);
    case QCodeLspError::Timeout:
        return QCodeToolResult::error(QCodeToolErrorKind::Timeout, reply.message);
    case QCodeLspError::ProtocolError:
        return QCodeToolResult::error(QCodeToolErrorKind::LspProtocolError, reply.message);
    case QCodeLspError::IoError:
        return QCodeToolResult::error(QCodeToolErrorKind::IoError, reply.message);
    case QCodeLspError::Cancelled:
        return QCodeToolResult::error(QCodeToolErrorKind::Cancelled, reply.message);
    case QCodeLspError::None:
        break;
    }
    return QCodeToolResult::error(QCodeToolErrorKind::LspProtocolError, reply.message);
}

QString QCodeToolLsp::resolveFile(const json &arguments) const
{
    QString filePath;
    if (arguments.contains("file_path") && arguments["file_path"].is_string()) {
        filePath = QString::fromStdString(arguments["file_path"].get<std::string>());
    }
    return qcodeResolvePath(lspManager ? lspManager->rootPath() : QString(), filePath);
}

QString QCodeToolLsp::formatLocations(const json &locations) const
{
    const QString root = lspManager ? QDir::cleanPath(lspManager->rootPath()) : QString();
    QStringList   lines;

    for (const auto &location : locations) {
        QString path = QCodeLspSession::stringMember(location, "path");
        if (!root.isEmpty() && path.startsWith(root + "/")) {
            path = QDir(root).relativeFilePath(path);
        }
        lines << QString("%1:%2:%3")
                     .arg(path)
                     .arg(QCodeLspSession::intMember(location, "line") + 1)
                     .arg(QCodeLspSession::intMember(location, "character") + 1);
    }
    return lines.join('\n');
}

json QCodeToolLsp::positionSchema()
{
    return {
        {"type", "object"},
        {"properties",
         {{"file_path",
           {{"type", "string"},
            {"description", "Source file containing the symbol (relative to project or absolute)"}}},
          {"line", {{"type", "integer"}, {"description", "Line of the symbol (1-based)"}}},
          {"character",
           {{"type", "integer"}, {"description", "Column of the symbol (1-based)"}}}}},
        {"required", json::array({"file_path", "line", "character"})}};
}

/* QCodeToolLspDefinition Implementation */

QString QCodeToolLspDefinition::getName() const
{
    return "lsp_definition";
}

QString QCodeToolLspDefinition::getDescription() const
{
    return "Find where the symbol at a position is defined, using the language server. "
           "Returns path:line:col lines (1-based).";
}

json QCodeToolLspDefinition::getParametersSchema() const
{
    return positionSchema();
}

QCodeToolResult QCodeToolLspDefinition::execute(const json &arguments)
{
    if (!lspManager) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::LspUnavailable, "Language server support is not configured");
    }

    int     line      = 0;
    int     character = 0;
    QString error;
    if (!readPosition(arguments, line, character, error)) {
        return QCodeToolResult::error(QCodeToolErrorKind::InvalidArguments, error);
    }

    const QCodeLspReply reply = lspManager->definition(resolveFile(arguments), line - 1, character - 1);
    if (!reply.isOk()) {
        return errorFromReply(reply);
    }
    if (reply.result.empty()) {
        return QCodeToolResult::success("No definition found");
    }
    return QCodeToolResult::success(formatLocations(reply.result));
}

/* QCodeToolLspReferences Implementation */

QString QCodeToolLspReferences::getName() const
{
    return "lsp_references";
}

QString QCodeToolLspReferences::getDescription() const
{
    return "List all references to the symbol at a position, including its declaration. "
           "Returns path:line:col lines (1-based).";
}

json QCodeToolLspReferences::getParametersSchema() const
{
    return positionSchema();
}

QCodeToolResult QCodeToolLspReferences::execute(const json &arguments)
{
    if (!lspManager) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::LspUnavailable, "Language server support is not configured");
    }

    int     line      = 0;
    int     character = 0;
    QString error;
    if (!readPosition(arguments, line, character, error)) {
        return QCodeToolResult::error(QCodeToolErrorKind::InvalidArguments, error);
    }

    const QCodeLspReply reply = lspManager->references(resolveFile(arguments), line - 1, character - 1);
    if (!reply.isOk()) {
        return errorFromReply(reply);
    }
    if (reply.result.empty()) {
        return QCodeToolResult::success("No references found");
    }
    return QCodeToolResult::success(
        QString("Found %1 references:\n%2").arg(reply.result.size()).arg(formatLocations(reply.result)));
}

/* QCodeToolLspDiagnostics Implementation */

QString QCodeToolLspDiagnostics::getName() const
{
    return "lsp_diagnostics";
}

QString QCodeToolLspDiagnostics::getDescription() const
{
    return "Get compiler errors and warnings for a file from the language server. "
           "Returns 'severity line:col message' lines (1-based).";
}

json QCodeToolLspDiagnostics::getParametersSchema() const
{
    return {
        {"type", "object"},
        {"properties",
         {{"file_path",
           {{"type", "string"},
            {"description", "Source file to check (relative to project or absolute)"}}}}},
        {"required", json::array({"file_path"})}};
}

QString QCodeToolLspDiagnostics::severityName(int severity)
{
    switch (severity) {
    case 1:
        return "error";
    case 2:
        return "warning";
    case 3:
        return "info";
    case 4:
        return "hint";
    default:
        return "error";
    }
}

QCodeToolResult QCodeToolLspDiagnostics::execute(const json &arguments)
{
    if (!lspManager) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::LspUnavailable, "Language server support is not configured");
    }

    const QString       filePath = resolveFile(arguments);
    const QCodeLspReply reply    = lspManager->diagnostics(filePath);
    if (!reply.isOk()) {
        return errorFromReply(reply);
    }

    if (!reply.result.is_array() || reply.result.empty()) {
        return QCodeToolResult::success(QString("No diagnostics for %1").arg(filePath));
    }

    QStringList lines;
    for (const auto &item : reply.result) {
        if (!item.is_object()) {
            continue;
        }
        json start = json::object();
        if (item.contains("range") && item["range"].is_object() && item["range"].contains("start")) {
            start = item["range"]["start"];
        }
        lines << QString("%1 %2:%3 %4")
                     .arg(severityName(QCodeLspSession::intMember(item, "severity", 1)))
                     .arg(QCodeLspSession::intMember(start, "line") + 1)
                     .arg(QCodeLspSession::intMember(start, "character") + 1)
                     .arg(QCodeLspSession::stringMember(item, "message"));
    }

    if (lines.isEmpty()) {
        return QCodeToolResult::success(QString("No diagnostics for %1").arg(filePath));
    }
    return QCodeToolResult::success(lines.join('\n'));
}
