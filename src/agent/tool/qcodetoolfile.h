// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODETOOLFILE_H
#define QCODETOOLFILE_H

#include "agent/qcodetool.h"

/**
 * @brief Resolve a tool path against the project root
 * @param projectPath Project root, the current directory when empty
 * @param filePath Absolute or root-relative path
 * @return Absolute, cleaned path
 */
QString qcodeResolvePath(const QString &projectPath, const QString &filePath);

/**
 * @brief Check that a path lies inside the project root
 * @details Symlinks are resolved. A path that does not exist yet is judged by its
 *          nearest existing parent.
 */
bool qcodeIsPathInside(const QString &projectPath, const QString &filePath);

/**
 * @brief Tool to read files
 */
class QCodeToolFileRead : public QCodeTool
{
    Q_OBJECT

public:
    explicit QCodeToolFileRead(QObject *parent = nullptr, const QString &projectPath = QString());
    ~QCodeToolFileRead() override;

    QString         getName() const override;
    QString         getDescription() const override;
    json            getParametersSchema() const override;
    bool            isMutating() const override;
    QCodeToolResult execute(const json &arguments) override;

    void setProjectPath(const QString &projectPath);

private:
    QString projectPath;
};

/**
 * @brief Tool to write files (restricted to project directory)
 */
class QCodeToolFileWrite : public QCodeTool
{
    Q_OBJECT

public:
    explicit QCodeToolFileWrite(QObject *parent = nullptr, const QString &projectPath = QString());
    ~QCodeToolFileWrite() override;

    QString         getName() const override;
    QString         getDescription() const override;
    json            getParametersSchema() const override;
    bool            isMutating() const override;
    QCodeToolResult execute(const json &arguments) override;

    void setProjectPath(const QString &projectPath);

private:
    QString projectPath;
};

/**
 * @brief Tool to edit files by string replacement (restricted to project directory)
 */
class QCodeToolFileEdit : public QCodeTool
{
    Q_OBJECT

public:
    explicit QCodeToolFileEdit(QObject *parent = nullptr, const QString &projectPath = QString());
    ~QCodeToolFileEdit() override;

    QString         getName() const override;
    QString         getDescription() const override;
    json            getParametersSchema() const override;
    bool            isMutating() const override;
    QCodeToolResult execute(const json &arguments) override;

    void setProjectPath(const QString &projectPath);

private:
    QString projectPath;
};

#endif // QCODETOOLFILE_H
