// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODETOOLSEARCH_H
#define QCODETOOLSEARCH_H

#include "agent/qcodetool.h"

#include <QRegularExpression>

/**
 * @brief Convert a shell glob to an anchored regular expression
 * @details Supports '*' and '?' within one path segment, '**' across segments, character
 *          classes and {a,b} alternatives.
 */
QRegularExpression qcodeGlobToRegularExpression(const QString &pattern);

/**
 * @brief Tool to find files by glob pattern
 */
class QCodeToolGlob : public QCodeTool
{
    Q_OBJECT

public:
    explicit QCodeToolGlob(QObject *parent = nullptr, const QString &projectPath = QString());
    ~QCodeToolGlob() override;

    QString         getName() const override;
    QString         getDescription() const override;
    json            getParametersSchema() const override;
    bool            isMutating() const override;
    QCodeToolResult execute(const json &arguments) override;

    void setProjectPath(const QString &projectPath);

    static constexpr int maxResults = 1000;

private:
    QString projectPath;
};

/**
 * @brief Tool to search file contents with a regular expression
 */
class QCodeToolGrep : public QCodeTool
{
    Q_OBJECT

public:
    explicit QCodeToolGrep(QObject *parent = nullptr, const QString &projectPath = QString());
    ~QCodeToolGrep() override;

    QString         getName() const override;
    QString         getDescription() const override;
    json            getParametersSchema() const override;
    bool            isMutating() const override;
    QCodeToolResult execute(const json &arguments) override;

    void setProjectPath(const QString &projectPath);

    static constexpr int maxMatches = 100;

private:
    QString projectPath;

    /**
     * @brief Search one file, appending "path:line:text" entries
     * @return false once the match cap is reached
     */
    bool searchFile(
        const QString &filePath, const QString &displayPath, const QRegularExpression &regex,
        QStringList &results) const;
};

#endif // QCODETOOLSEARCH_H
