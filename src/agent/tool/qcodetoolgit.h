// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODETOOLGIT_H
#define QCODETOOLGIT_H

#include "agent/qcodetool.h"
#include "common/qcodeprocess.h"

/**
 * @brief Common base for tools that drive the git command line
 */
class QCodeToolGit : public QCodeTool
{
    Q_OBJECT

public:
    explicit QCodeToolGit(QObject *parent = nullptr, const QString &projectPath = QString());
    ~QCodeToolGit() override;

    void setProjectPath(const QString &projectPath);

protected:
    /**
     * @brief Run git with the given arguments
     * @param arguments Arguments after "git"
     * @param callArguments Tool call arguments; an optional "path" selects the repository
     * @param emptyText Reported when git succeeds without output
     * @return Success with git output, or a typed error
     */
    QCodeToolResult runGit(
        const QStringList &arguments, const json &callArguments, const QString &emptyText) const;

    /* Schema property for the optional repository path */
    static json pathProperty();

    QString projectPath;

    static constexpr int gitTimeoutMs = 60000;
};

/**
 * @brief Tool to show working tree status
 */
class QCodeToolGitStatus : public QCodeToolGit
{
    Q_OBJECT

public:
    using QCodeToolGit::QCodeToolGit;

    QString         getName() const override;
    QString         getDescription() const override;
    json            getParametersSchema() const override;
    bool            isMutating() const override;
    QCodeToolResult execute(const json &arguments) override;
};

/**
 * @brief Tool to show unstaged or staged changes
 */
class QCodeToolGitDiff : public QCodeToolGit
{
    Q_OBJECT

public:
    using QCodeToolGit::QCodeToolGit;

    QString         getName() const override;
    QString         getDescription() const override;
    json            getParametersSchema() const override;
    bool            isMutating() const override;
    QCodeToolResult execute(const json &arguments) override;
};

/**
 * @brief Tool to show recent commits
 */
class QCodeToolGitLog : public QCodeToolGit
{
    Q_OBJECT

public:
    using QCodeToolGit::QCodeToolGit;

    QString         getName() const override;
    QString         getDescription() const override;
    json            getParametersSchema() const override;
    bool            isMutating() const override;
    QCodeToolResult execute(const json &arguments) override;
};

/**
 * @brief Tool to stage files
 */
class QCodeToolGitAdd : public QCodeToolGit
{
    Q_OBJECT

public:
    using QCodeToolGit::QCodeToolGit;

    QString         getName() const override;
    QString         getDescription() const override;
    json            getParametersSchema() const override;
    bool            isMutating() const override;
    QCodeToolResult execute(const json &arguments) override;
};

/**
 * @brief Tool to record staged changes
 */
class QCodeToolGitCommit : public QCodeToolGit
{
    Q_OBJECT

public:
    using QCodeToolGit::QCodeToolGit;

    QString         getName() const override;
    QString         getDescription() const override;
    json            getParametersSchema() const override;
    bool            isMutating() const override;
    QCodeToolResult execute(const json &arguments) override;
};

#endif // QCODETOOLGIT_H
