// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODETOOLSHELL_H
#define QCODETOOLSHELL_H

#include "agent/qcodetool.h"

/**
 * @brief Tool to execute shell commands
 * @details Commands run through /bin/bash -c in the project directory. A command that
 *          outlives its timeout, or whose call is aborted, is terminated and reaped before
 *          execute() returns.
 */
class QCodeToolShellBash : public QCodeTool
{
    Q_OBJECT

public:
    /**
     * @brief Constructor
     * @param parent Parent object
     * @param projectPath Working directory for commands
     * @param defaultTimeoutSeconds Timeout used when a call gives none, clamped to one day
     */
    explicit QCodeToolShellBash(
        QObject *parent = nullptr, const QString &projectPath = QString(), int defaultTimeoutSeconds = 120);
    ~QCodeToolShellBash() override;

    /**
     * @brief Get the tool name
     * @return "bash"
     */
    QString getName() const override;

    /**
     * @brief Get the tool description shown to the model
     * @return Description text
     */
    QString getDescription() const override;

    /**
     * @brief Get the JSON schema of the arguments
     * @return Object schema with a required "command" and an optional "timeout"
     */
    json getParametersSchema() const override;

    /**
     * @brief Whether the tool can change the project
     * @return Always true, so plan mode denies it
     */
    bool isMutating() const override;

    /**
     * @brief Run a shell command
     * @param arguments Object with "command" and optional "timeout" in seconds
     * @return Combined output with the exit code, or Timeout, Cancelled or ExecutionFailed
     */
    QCodeToolResult execute(const json &arguments) override;

    /**
     * @brief Set the working directory for commands
     * @param projectPath Project directory
     */
    void setProjectPath(const QString &projectPath);

    /**
     * @brief Set the timeout used when a call gives none
     * @param seconds Timeout in seconds, clamped to one day; non-positive values are ignored
     */
    void setDefaultTimeout(int seconds);

    /**
     * @brief Get the timeout used when a call gives none
     * @return Timeout in seconds
     */
    int defaultTimeout() const;

private:
    QString projectPath;
    int     defaultTimeoutSeconds = 120;
};

#endif // QCODETOOLSHELL_H
