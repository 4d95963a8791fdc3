// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/tool/qcodetoolshell.h"
#include "common/qcodeprocess.h"

#include <QDir>
#include <QFileInfo>

namespace {

/* Upper bound for a model-supplied timeout, keeps the millisecond value in range */
constexpr int kMaxTimeoutSeconds = 24 * 60 * 60;

} // namespace

QCodeToolShellBash::QCodeToolShellBash(
    QObject *parent, const QString &projectPath, int defaultTimeoutSeconds)
    : QCodeTool(parent)
    , projectPath(projectPath)
    , defaultTimeoutSeconds(
          defaultTimeoutSeconds > 0 ? qMin(defaultTimeoutSeconds, kMaxTimeoutSeconds) : 120)
{}

QCodeToolShellBash::~QCodeToolShellBash() = default;

QString QCodeToolShellBash::getName() const
{
    return "bash";
}

QString QCodeToolShellBash::getDescription() const
{
    return "Execute a bash command and return its combined output. "
           "Use for builds, tests and other shell operations.";
}

json QCodeToolShellBash::getParametersSchema() const
{
    return {
        {"type", "object"},
        {"properties",
         {{"command", {{"type", "string"}, {"description", "The bash command to execute"}}},
          {"timeout",
           {{"type", "integer"},
            {"description",
             QString("Timeout in seconds (default: %1). The command is killed on timeout.")
                 .arg(defaultTimeoutSeconds)
                 .toStdString()}}},
          {"working_dir",
           {{"type", "string"},
            {"description", "Working directory for the command (default: project directory)"}}}}},
        {"required", json::array({"command"})}};
}

bool QCodeToolShellBash::isMutating() const
{
    return true;
}

QCodeToolResult QCodeToolShellBash::execute(const json &arguments)
{
    if (!arguments.contains("command") || !arguments["command"].is_string()) {
        return QCodeToolResult::error(QCodeToolErrorKind::InvalidArguments, "command is required");
    }

    const QString command = QString::fromStdString(arguments["command"].get<std::string>());
    if (command.trimmed().isEmpty()) {
        return QCodeToolResult::error(QCodeToolErrorKind::InvalidArguments, "command is empty");
    }

    /* Get timeout */
    int timeoutSeconds = defaultTimeoutSeconds;
    if (arguments.contains("timeout") && arguments["timeout"].is_number()) {
        const double requested = arguments["timeout"].get<double>();
        if (requested >= 1.0) {
            timeoutSeconds = static_cast<int>(qMin(requested, double(kMaxTimeoutSeconds)));
        }
    }

    /* Get working directory */
    QString workingDir;
    if (arguments.contains("working_dir") && arguments["working_dir"].is_string()) {
        workingDir = QString::fromStdString(arguments["working_dir"].get<std::string>());
    }
    const QString root = projectPath.isEmpty() ? QDir::currentPath() : projectPath;
    if (workingDir.isEmpty()) {
        workingDir = root;
    } else if (QFileInfo(workingDir).isRelative()) {
        workingDir = QDir(root).absoluteFilePath(workingDir);
    }
    if (!QFileInfo(workingDir).isDir()) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::IoError,
            QString("Working directory does not exist: %1").arg(workingDir));
    }

    const QCodeProcessResult run = QCodeProcessRunner::run(
        "/bin/bash",
        QStringList() << "-c" << command,
        workingDir,
        timeoutSeconds * 1000,
        [this]() { return isAborted(); });

    if (!run.started) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::ProcessError,
            QString("Failed to start bash process: %1").arg(run.errorString));
    }

    const QString output = QCodeProcessRunner::truncateOutput(run.output);

    if (run.aborted) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::Cancelled, QString("Command aborted: %1").arg(command));
    }
    if (run.timedOut) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::Timeout,
            QString("Command timed out after %1s and was killed: %2\n%3")
                .arg(timeoutSeconds)
                .arg(command, output));
    }
    if (!run.errorString.isEmpty()) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::ProcessError, QString("%1\n%2").arg(run.errorString, output));
    }
    if (run.exitCode != 0) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::NonZeroExit,
            QString("Command exited with code %1:\n%2").arg(run.exitCode).arg(output));
    }

    return QCodeToolResult::success(output.isEmpty() ? "(no output)" : output);
}

void QCodeToolShellBash::setProjectPath(const QString &projectPath)
{
    this->projectPath = projectPath;
}

void QCodeToolShellBash::setDefaultTimeout(int seconds)
{
    if (seconds > 0) {
        defaultTimeoutSeconds = qMin(seconds, kMaxTimeoutSeconds);
    }
}

int QCodeToolShellBash::defaultTimeout() const
{
    return defaultTimeoutSeconds;
}
