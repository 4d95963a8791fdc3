// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/tool/qcodetoolsearch.h"
#include "agent/tool/qcodetoolfile.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

namespace {

/* Files larger than this are skipped by grep */
constexpr qint64 kMaxGrepFileSize = 4 * 1024 * 1024;

/* Directories never descended into */
bool isSkippedDirectory(const QString &relativePath)
{
    static const QStringList skipped = {".git", "node_modules", "target", "build"};
    const QStringList        parts   = relativePath.split('/', Qt::SkipEmptyParts);
    for (const QString &part : parts.mid(0, parts.size() - 1)) {
        if (skipped.contains(part)) {
            return true;
        }
    }
    return false;
}

bool looksBinary(QFile &file)
{
    const QByteArray head = file.peek(8192);
    return head.contains('\0');
}

} // namespace

QRegularExpression qcodeGlobToRegularExpression(const QString &pattern)
{
    QString regex;
    int     braceDepth = 0;

    for (int i = 0; i < pattern.size(); ++i) {
        const QChar c = pattern.at(i);
        if (c == '*') {
            if (i + 1 < pattern.size() && pattern.at(i + 1) == '*') {
                /* '**' optionally followed by a separator spans directories */
                ++i;
                if (i + 1 < pattern.size() && pattern.at(i + 1) == '/') {
                    ++i;
                    regex += "(?:.*/)?";
                } else {
                    regex += ".*";
                }
            } else {
                regex += "[^/]*";
            }
        } else if (c == '?') {
            regex += "[^/]";
        } else if (c == '[') {
            const int close = pattern.indexOf(']', i + 1);
            if (close < 0) {
                regex += "\\[";
                continue;
            }
            QString cls = pattern.mid(i + 1, close - i - 1);
            if (cls.startsWith('!')) {
                cls[0] = '^';
            }
            regex += "[" + cls + "]";
            i = close;
        } else if (c == '{') {
            ++braceDepth;
            regex += "(?:";
        } else if (c == '}' && braceDepth > 0) {
            --braceDepth;
            regex += ")";
        } else if (c == ',' && braceDepth > 0) {
            regex += "|";
        } else {
            regex += QRegularExpression::escape(QString(c));
        }
    }

    return QRegularExpression(QRegularExpression::anchoredPattern(regex));
}

/* QCodeToolGlob Implementation */

QCodeToolGlob::QCodeToolGlob(QObject *parent, const QString &projectPath)
    : QCodeTool(parent)
    , projectPath(projectPath)
{}

QCodeToolGlob::~QCodeToolGlob() = default;

QString QCodeToolGlob::getName() const
{
    return "glob";
}

QString QCodeToolGlob::getDescription() const
{
    return "Find files matching a glob pattern such as '**/*.cpp' or 'src/*.{h,cpp}'. "
           "Patterns are matched against paths relative to the search directory.";
}

json QCodeToolGlob::getParametersSchema() const
{
    return {
        {"type", "object"},
        {"properties",
         {{"pattern", {{"type", "string"}, {"description", "Glob pattern to match (e.g., '**/*.rs')"}}},
          {"path",
           {{"type", "string"},
            {"description", "Base directory to search in (default: project directory)"}}}}},
        {"required", json::array({"pattern"})}};
}

bool QCodeToolGlob::isMutating() const
{
    return false;
}

QCodeToolResult QCodeToolGlob::execute(const json &arguments)
{
    if (!arguments.contains("pattern") || !arguments["pattern"].is_string()) {
        return QCodeToolResult::error(QCodeToolErrorKind::InvalidArguments, "pattern is required");
    }
    const QString pattern = QString::fromStdString(arguments["pattern"].get<std::string>());

    QString basePath = projectPath.isEmpty() ? QDir::currentPath() : projectPath;
    if (arguments.contains("path") && arguments["path"].is_string()) {
        basePath = qcodeResolvePath(projectPath, QString::fromStdString(arguments["path"].get<std::string>()));
    }
    if (!QFileInfo(basePath).isDir()) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::IoError, QString("Directory not found: %1").arg(basePath));
    }

    const QRegularExpression regex = qcodeGlobToRegularExpression(pattern);
    if (!regex.isValid()) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::InvalidArguments,
            QString("Invalid glob pattern: %1: %2").arg(pattern, regex.errorString()));
    }

    const QDir   baseDir(basePath);
    QStringList  matches;
    bool         truncated = false;
    QDirIterator iterator(basePath, QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);

    while (iterator.hasNext()) {
        const QString filePath     = iterator.next();
        const QString relativePath = baseDir.relativeFilePath(filePath);
        if (isSkippedDirectory(relativePath)) {
            continue;
        }
        if (regex.match(relativePath).hasMatch()) {
            if (matches.size() >= maxResults) {
                truncated = true;
                break;
            }
            matches.append(relativePath);
        }
        if (isAborted()) {
            return QCodeToolResult::error(QCodeToolErrorKind::Cancelled, "Search cancelled");
        }
    }

    if (matches.isEmpty()) {
        return QCodeToolResult::success("No files found matching the pattern");
    }

    matches.sort();
    return QCodeToolResult::success(QString("Found %1 files%2:\n%3")
                                        .arg(matches.size())
                                        .arg(truncated ? " (truncated)" : "")
                                        .arg(matches.join('\n')));
}

void QCodeToolGlob::setProjectPath(const QString &projectPath)
{
    this->projectPath = projectPath;
}

/* QCodeToolGrep Implementation */

QCodeToolGrep::QCodeToolGrep(QObject *parent, const QString &projectPath)
    : QCodeTool(parent)
    , projectPath(projectPath)
{}

QCodeToolGrep::~QCodeToolGrep() = default;

QString QCodeToolGrep::getName() const
{
    return "grep";
}

QString QCodeToolGrep::getDescription() const
{
    return "Search file contents for a regular expression. "
           "Returns matching lines as path:line:text (lines are 1-based).";
}

json QCodeToolGrep::getParametersSchema() const
{
    return {
        {"type", "object"},
        {"properties",
         {{"pattern",
           {{"type", "string"}, {"description", "Regular expression pattern to search for"}}},
          {"path",
           {{"type", "string"},
            {"description", "File or directory to search in (default: project directory)"}}},
          {"glob",
           {{"type", "string"}, {"description", "Glob pattern to filter files (e.g., '*.rs')"}}},
          {"case_insensitive",
           {{"type", "boolean"}, {"description", "Ignore case when matching (default: false)"}}}}},
        {"required", json::array({"pattern"})}};
}

bool QCodeToolGrep::isMutating() const
{
    return false;
}

bool QCodeToolGrep::searchFile(
    const QString            &filePath,
    const QString            &displayPath,
    const QRegularExpression &regex,
    QStringList              &results) const
{
    QFile file(filePath);
    if (file.size() > kMaxGrepFileSize || !file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return true;
    }
    if (looksBinary(file)) {
        return true;
    }

    QTextStream in(&file);
    int         lineNum = 0;
    while (!in.atEnd()) {
        const QString line = in.readLine();
        lineNum++;
        if (regex.match(line).hasMatch()) {
            results.append(QString("%1:%2:%3").arg(displayPath).arg(lineNum).arg(line));
            if (results.size() >= maxMatches) {
                return false;
            }
        }
    }
    return true;
}

QCodeToolResult QCodeToolGrep::execute(const json &arguments)
{
    if (!arguments.contains("pattern") || !arguments["pattern"].is_string()) {
        return QCodeToolResult::error(QCodeToolErrorKind::InvalidArguments, "pattern is required");
    }
    const QString pattern = QString::fromStdString(arguments["pattern"].get<std::string>());

    QRegularExpression::PatternOptions options = QRegularExpression::NoPatternOption;
    if (arguments.contains("case_insensitive") && arguments["case_insensitive"].is_boolean()
        && arguments["case_insensitive"].get<bool>()) {
        options |= QRegularExpression::CaseInsensitiveOption;
    }
    const QRegularExpression regex(pattern, options);
    if (!regex.isValid()) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::InvalidArguments,
            QString("Invalid regex: %1: %2").arg(pattern, regex.errorString()));
    }

    QString searchPath = projectPath.isEmpty() ? QDir::currentPath() : projectPath;
    if (arguments.contains("path") && arguments["path"].is_string()) {
        searchPath = qcodeResolvePath(projectPath, QString::fromStdString(arguments["path"].get<std::string>()));
    }

    QRegularExpression fileFilter;
    bool               filterByName = false;
    if (arguments.contains("glob") && arguments["glob"].is_string()) {
        const QString glob = QString::fromStdString(arguments["glob"].get<std::string>());
        fileFilter         = qcodeGlobToRegularExpression(glob);
        filterByName       = !glob.contains('/');
    }

    QStringList     results;
    const QFileInfo searchInfo(searchPath);

    if (searchInfo.isFile()) {
        searchFile(searchPath, searchPath, regex, results);
    } else if (searchInfo.isDir()) {
        const QDir   baseDir(searchPath);
        QDirIterator iterator(searchPath, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
        while (iterator.hasNext()) {
            const QString filePath     = iterator.next();
            const QString relativePath = baseDir.relativeFilePath(filePath);
            if (isSkippedDirectory(relativePath)) {
                continue;
            }
            if (fileFilter.isValid() && !fileFilter.pattern().isEmpty()) {
                const QString subject = filterByName ? iterator.fileName() : relativePath;
                if (!fileFilter.match(subject).hasMatch()) {
                    continue;
                }
            }
            if (isAborted()) {
                return QCodeToolResult::error(QCodeToolErrorKind::Cancelled, "Search cancelled");
            }
            if (!searchFile(filePath, relativePath, regex, results)) {
                break;
            }
        }
    } else {
        return QCodeToolResult::error(
            QCodeToolErrorKind::IoError, QString("Path not found: %1").arg(searchPath));
    }

    if (results.isEmpty()) {
        return QCodeToolResult::success("No matches found");
    }

    return QCodeToolResult::success(QString("Found %1 matches%2:\n%3")
                                        .arg(results.size())
                                        .arg(results.size() >= maxMatches ? " (truncated)" : "")
                                        .arg(results.join('\n')));
}

void QCodeToolGrep::setProjectPath(const QString &projectPath)
{
    this->projectPath = projectPath;
}
