// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/tool/qcodetoolgit.h"
#include "agent/tool/qcodetoolfile.h"

#include <QDir>
#include <QFileInfo>

/* QCodeToolGit Implementation */

QCodeToolGit::QCodeToolGit(QObject *parent, const QString &projectPath)
    : QCodeTool(parent)
    , projectPath(projectPath)
{}

QCodeToolGit::~QCodeToolGit() = default;

void QCodeToolGit::setProjectPath(const QString &projectPath)
{
    this->projectPath = projectPath;
}

json QCodeToolGit::pathProperty()
{
    return {{"type", "string"}, {"description", "Repository path (default: project directory)"}};
}

QCodeToolResult QCodeToolGit::runGit(
    const QStringList &arguments, const json &callArguments, const QString &emptyText) const
{
    QString repoPath = projectPath.isEmpty() ? QDir::currentPath() : projectPath;
    if (callArguments.contains("path") && callArguments["path"].is_string()) {
        repoPath = qcodeResolvePath(
            projectPath, QString::fromStdString(callArguments["path"].get<std::string>()));
    }
    if (!QFileInfo(repoPath).isDir()) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::IoError, QString("Repository path not found: %1").arg(repoPath));
    }

    const QCodeProcessResult run = QCodeProcessRunner::run(
        "git", arguments, repoPath, gitTimeoutMs, [this]() { return isAborted(); });

    if (!run.started) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::ProcessError, QString("Failed to start git: %1").arg(run.errorString));
    }
    if (run.aborted) {
        return QCodeToolResult::error(QCodeToolErrorKind::Cancelled, "git command aborted");
    }
    if (run.timedOut) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::Timeout,
            QString("git %1 timed out after %2s").arg(arguments.value(0)).arg(gitTimeoutMs / 1000));
    }

    const QString output = QCodeProcessRunner::truncateOutput(run.output.trimmed());
    if (run.exitCode != 0) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::NonZeroExit,
            QString("git %1 exited with code %2:\n%3").arg(arguments.value(0)).arg(run.exitCode).arg(output));
    }

    return QCodeToolResult::success(output.isEmpty() ? emptyText : output);
}

/* QCodeToolGitStatus Implementation */

QString QCodeToolGitStatus::getName() const
{
    return "git_status";
}

QString QCodeToolGitStatus::getDescription() const
{
    return "Show the working tree status in short format.";
}

json QCodeToolGitStatus::getParametersSchema() const
{
    return {{"type", "object"}, {"properties", {{"path", pathProperty()}}}};
}

bool QCodeToolGitStatus::isMutating() const
{
    return false;
}

QCodeToolResult QCodeToolGitStatus::execute(const json &arguments)
{
    return runGit({"status", "--short"}, arguments, "Working tree clean");
}

/* QCodeToolGitDiff Implementation */

QString QCodeToolGitDiff::getName() const
{
    return "git_diff";
}

QString QCodeToolGitDiff::getDescription() const
{
    return "Show changes in the working tree, or staged changes when staged is true.";
}

json QCodeToolGitDiff::getParametersSchema() const
{
    return {
        {"type", "object"},
        {"properties",
         {{"path", pathProperty()},
          {"staged", {{"type", "boolean"}, {"description", "Show staged changes"}}},
          {"file", {{"type", "string"}, {"description", "Specific file to diff"}}}}}};
}

bool QCodeToolGitDiff::isMutating() const
{
    return false;
}

QCodeToolResult QCodeToolGitDiff::execute(const json &arguments)
{
    QStringList args = {"diff"};
    if (arguments.contains("staged") && arguments["staged"].is_boolean()
        && arguments["staged"].get<bool>()) {
        args << "--staged";
    }
    if (arguments.contains("file") && arguments["file"].is_string()) {
        args << "--" << QString::fromStdString(arguments["file"].get<std::string>());
    }
    return runGit(args, arguments, "No changes");
}

/* QCodeToolGitLog Implementation */

QString QCodeToolGitLog::getName() const
{
    return "git_log";
}

QString QCodeToolGitLog::getDescription() const
{
    return "Show recent commits.";
}

json QCodeToolGitLog::getParametersSchema() const
{
    return {
        {"type", "object"},
        {"properties",
         {{"path", pathProperty()},
          {"count",
           {{"type", "integer"}, {"description", "Number of commits to show (default: 10)"}}},
          {"oneline", {{"type", "boolean"}, {"description", "Show one line per commit"}}}}}};
}

bool QCodeToolGitLog::isMutating() const
{
    return false;
}

QCodeToolResult QCodeToolGitLog::execute(const json &arguments)
{
    int count = 10;
    if (arguments.contains("count") && arguments["count"].is_number_integer()) {
        count = qBound(1, arguments["count"].get<int>(), 1000);
    }

    QStringList args = {"log", QString("-%1").arg(count)};
    if (arguments.contains("oneline") && arguments["oneline"].is_boolean()
        && arguments["oneline"].get<bool>()) {
        args << "--oneline";
    }
    return runGit(args, arguments, "No commits");
}

/* QCodeToolGitAdd Implementation */

QString QCodeToolGitAdd::getName() const
{
    return "git_add";
}

QString QCodeToolGitAdd::getDescription() const
{
    return "Stage files for the next commit.";
}

json QCodeToolGitAdd::getParametersSchema() const
{
    return {
        {"type", "object"},
        {"properties",
         {{"path", pathProperty()},
          {"files",
           {{"type", "array"},
            {"items", {{"type", "string"}}},
            {"description", "Files to add"}}}}},
        {"required", json::array({"files"})}};
}

bool QCodeToolGitAdd::isMutating() const
{
    return true;
}

QCodeToolResult QCodeToolGitAdd::execute(const json &arguments)
{
    QStringList files;
    if (arguments.contains("files") && arguments["files"].is_array()) {
        for (const auto &file : arguments["files"]) {
            if (!file.is_string()) {
                return QCodeToolResult::error(
                    QCodeToolErrorKind::InvalidArguments, "files must contain only strings");
            }
            files << QString::fromStdString(file.get<std::string>());
        }
    }
    if (files.isEmpty()) {
        return QCodeToolResult::error(QCodeToolErrorKind::InvalidArguments, "files is empty");
    }

    QCodeToolResult result = runGit(QStringList{"add", "--"} + files, arguments, QString());
    if (result.isSuccess()) {
        result.content = QString("Added %1 file(s)").arg(files.size());
    }
    return result;
}

/* QCodeToolGitCommit Implementation */

QString QCodeToolGitCommit::getName() const
{
    return "git_commit";
}

QString QCodeToolGitCommit::getDescription() const
{
    return "Commit staged changes with a message.";
}

json QCodeToolGitCommit::getParametersSchema() const
{
    return {
        {"type", "object"},
        {"properties",
         {{"path", pathProperty()},
          {"message", {{"type", "string"}, {"description", "Commit message"}}}}},
        {"required", json::array({"message"})}};
}

bool QCodeToolGitCommit::isMutating() const
{
    return true;
}

QCodeToolResult QCodeToolGitCommit::execute(const json &arguments)
{
    if (!arguments.contains("message") || !arguments["message"].is_string()
        || arguments["message"].get<std::string>().empty()) {
        return QCodeToolResult::error(QCodeToolErrorKind::InvalidArguments, "message is required");
    }
    const QString message = QString::fromStdString(arguments["message"].get<std::string>());
    return runGit({"commit", "-m", message}, arguments, "Committed");
}
