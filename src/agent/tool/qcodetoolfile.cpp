// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/tool/qcodetoolfile.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

QString qcodeResolvePath(const QString &projectPath, const QString &filePath)
{
    const QString root = projectPath.isEmpty() ? QDir::currentPath() : projectPath;
    if (QFileInfo(filePath).isAbsolute()) {
        return QDir::cleanPath(filePath);
    }
    return QDir::cleanPath(QDir(root).absoluteFilePath(filePath));
}

bool qcodeIsPathInside(const QString &projectPath, const QString &filePath)
{
    const QString root          = projectPath.isEmpty() ? QDir::currentPath() : projectPath;
    const QString canonicalRoot = QDir(root).canonicalPath();
    if (canonicalRoot.isEmpty()) {
        return false;
    }

    /* Walk up to the nearest existing ancestor for paths not created yet */
    QFileInfo info(qcodeResolvePath(root, filePath));
    QString   canonicalPath = info.canonicalFilePath();
    while (canonicalPath.isEmpty()) {
        const QString parent = info.absolutePath();
        if (parent == info.absoluteFilePath()) {
            return false;
        }
        info          = QFileInfo(parent);
        canonicalPath = info.canonicalFilePath();
    }

    return canonicalPath == canonicalRoot || canonicalPath.startsWith(canonicalRoot + "/");
}

namespace {

QString stringArgument(const json &arguments, const char *name)
{
    if (arguments.contains(name) && arguments[name].is_string()) {
        return QString::fromStdString(arguments[name].get<std::string>());
    }
    return QString();
}

} // namespace

/* QCodeToolFileRead Implementation */

QCodeToolFileRead::QCodeToolFileRead(QObject *parent, const QString &projectPath)
    : QCodeTool(parent)
    , projectPath(projectPath)
{}

QCodeToolFileRead::~QCodeToolFileRead() = default;

QString QCodeToolFileRead::getName() const
{
    return "read";
}

QString QCodeToolFileRead::getDescription() const
{
    return "Read a text file. Lines are returned numbered from 1. "
           "Relative paths are resolved against the project root.";
}

json QCodeToolFileRead::getParametersSchema() const
{
    return {
        {"type", "object"},
        {"properties",
         {{"file_path",
           {{"type", "string"},
            {"description", "Path to the file to read (relative to project or absolute)"}}},
          {"offset",
           {{"type", "integer"},
            {"description", "Line number to start reading from (1-based, default: 1)"}}},
          {"limit",
           {{"type", "integer"}, {"description", "Maximum number of lines to read (default: 2000)"}}}}},
        {"required", json::array({"file_path"})}};
}

bool QCodeToolFileRead::isMutating() const
{
    return false;
}

QCodeToolResult QCodeToolFileRead::execute(const json &arguments)
{
    const QString   filePath = qcodeResolvePath(projectPath, stringArgument(arguments, "file_path"));
    const QFileInfo fileInfo(filePath);

    if (!fileInfo.exists()) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::IoError, QString("File not found: %1").arg(filePath));
    }
    if (!fileInfo.isFile()) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::IoError, QString("Path is not a file: %1").arg(filePath));
    }

    int offset = 1;
    int limit  = 2000;
    if (arguments.contains("offset") && arguments["offset"].is_number_integer()) {
        offset = qMax(1, arguments["offset"].get<int>());
    }
    if (arguments.contains("limit") && arguments["limit"].is_number_integer()) {
        limit = arguments["limit"].get<int>();
        if (limit <= 0) {
            limit = 2000;
        }
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::IoError,
            QString("Cannot open file: %1: %2").arg(filePath, file.errorString()));
    }

    QTextStream in(&file);
    QString     result;
    int         lineNum   = 0;
    int         linesRead = 0;

    while (!in.atEnd() && linesRead < limit) {
        const QString line = in.readLine();
        lineNum++;
        if (lineNum >= offset) {
            result += QString("%1\t%2\n").arg(lineNum, 6).arg(line);
            linesRead++;
        }
        if (isAborted()) {
            return QCodeToolResult::error(QCodeToolErrorKind::Cancelled, "Read cancelled");
        }
    }

    if (result.isEmpty()) {
        return QCodeToolResult::success(
            QString("File is empty or offset beyond file length: %1").arg(filePath));
    }

    return QCodeToolResult::success(result);
}

void QCodeToolFileRead::setProjectPath(const QString &projectPath)
{
    this->projectPath = projectPath;
}

/* QCodeToolFileWrite Implementation */

QCodeToolFileWrite::QCodeToolFileWrite(QObject *parent, const QString &projectPath)
    : QCodeTool(parent)
    , projectPath(projectPath)
{}

QCodeToolFileWrite::~QCodeToolFileWrite() = default;

QString QCodeToolFileWrite::getName() const
{
    return "write";
}

QString QCodeToolFileWrite::getDescription() const
{
    return "Write content to a file within the project directory. "
           "Creates the file if it doesn't exist, overwrites if it does.";
}

json QCodeToolFileWrite::getParametersSchema() const
{
    return {
        {"type", "object"},
        {"properties",
         {{"file_path",
           {{"type", "string"},
            {"description", "Path to the file to write (relative to project or absolute)"}}},
          {"content", {{"type", "string"}, {"description", "Content to write to the file"}}}}},
        {"required", json::array({"file_path", "content"})}};
}

bool QCodeToolFileWrite::isMutating() const
{
    return true;
}

QCodeToolResult QCodeToolFileWrite::execute(const json &arguments)
{
    const QString filePath = qcodeResolvePath(projectPath, stringArgument(arguments, "file_path"));
    const QString content  = stringArgument(arguments, "content");

    if (!qcodeIsPathInside(projectPath, filePath)) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::IoError,
            QString("Access denied: %1 is outside the project directory").arg(filePath));
    }

    const QDir parentDir = QFileInfo(filePath).absoluteDir();
    if (!parentDir.exists() && !parentDir.mkpath(".")) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::IoError,
            QString("Cannot create directory: %1").arg(parentDir.absolutePath()));
    }

    QSaveFile  file(filePath);
    QByteArray data = content.toUtf8();
    if (!file.open(QIODevice::WriteOnly) || file.write(data) != data.size() || !file.commit()) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::IoError,
            QString("Cannot write file: %1: %2").arg(filePath, file.errorString()));
    }

    return QCodeToolResult::success(
        QString("Successfully wrote %1 bytes to: %2").arg(data.size()).arg(filePath));
}

void QCodeToolFileWrite::setProjectPath(const QString &projectPath)
{
    this->projectPath = projectPath;
}

/* QCodeToolFileEdit Implementation */

QCodeToolFileEdit::QCodeToolFileEdit(QObject *parent, const QString &projectPath)
    : QCodeTool(parent)
    , projectPath(projectPath)
{}

QCodeToolFileEdit::~QCodeToolFileEdit() = default;

QString QCodeToolFileEdit::getName() const
{
    return "edit";
}

QString QCodeToolFileEdit::getDescription() const
{
    return "Edit a file by replacing a specific string with new content. "
           "The old_string must be unique in the file unless replace_all is set.";
}

json QCodeToolFileEdit::getParametersSchema() const
{
    return {
        {"type", "object"},
        {"properties",
         {{"file_path",
           {{"type", "string"},
            {"description", "Path to the file to edit (relative to project or absolute)"}}},
          {"old_string", {{"type", "string"}, {"description", "The text to replace"}}},
          {"new_string", {{"type", "string"}, {"description", "The replacement text"}}},
          {"replace_all",
           {{"type", "boolean"},
            {"description", "Replace all occurrences (default: false, requires unique match)"}}}}},
        {"required", json::array({"file_path", "old_string", "new_string"})}};
}

bool QCodeToolFileEdit::isMutating() const
{
    return true;
}

QCodeToolResult QCodeToolFileEdit::execute(const json &arguments)
{
    const QString filePath  = qcodeResolvePath(projectPath, stringArgument(arguments, "file_path"));
    const QString oldString = stringArgument(arguments, "old_string");
    const QString newString = stringArgument(arguments, "new_string");
    const bool    replaceAll = arguments.contains("replace_all") && arguments["replace_all"].is_boolean()
                               && arguments["replace_all"].get<bool>();

    if (!qcodeIsPathInside(projectPath, filePath)) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::IoError,
            QString("Access denied: %1 is outside the project directory").arg(filePath));
    }
    if (oldString.isEmpty()) {
        return QCodeToolResult::error(QCodeToolErrorKind::InvalidArguments, "old_string is empty");
    }
    if (oldString == newString) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::InvalidArguments, "old_string and new_string are identical");
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::IoError,
            QString("Cannot open file: %1: %2").arg(filePath, file.errorString()));
    }
    QString content = QString::fromUtf8(file.readAll());
    file.close();

    const int count = static_cast<int>(content.count(oldString));
    if (count == 0) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::InvalidArguments, QString("old_string not found in %1").arg(filePath));
    }
    if (count > 1 && !replaceAll) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::InvalidArguments,
            QString("old_string found %1 times in %2. Use replace_all or provide more context.")
                .arg(count)
                .arg(filePath));
    }

    if (replaceAll) {
        content.replace(oldString, newString);
    } else {
        content.replace(content.indexOf(oldString), oldString.size(), newString);
    }

    QSaveFile        output(filePath);
    const QByteArray data = content.toUtf8();
    if (!output.open(QIODevice::WriteOnly) || output.write(data) != data.size() || !output.commit()) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::IoError,
            QString("Cannot write file: %1: %2").arg(filePath, output.errorString()));
    }

    return QCodeToolResult::success(
        QString("Replaced %1 occurrence(s) in: %2").arg(replaceAll ? count : 1).arg(filePath));
}

void QCodeToolFileEdit::setProjectPath(const QString &projectPath)
{
    this->projectPath = projectPath;
}
