// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODETOOLLSP_H
#define QCODETOOLLSP_H

#include "agent/lsp/qcodelspmanager.h"
#include "agent/qcodetool.h"

#include <QPointer>

/**
 * @brief Common base for language server query tools
 * @details Positions taken from and shown to the model are 1-based. They are converted
 *          to the 0-based protocol positions here.
 */
class QCodeToolLsp : public QCodeTool
{
    Q_OBJECT

public:
    explicit QCodeToolLsp(QObject *parent = nullptr, QCodeLspManager *lspManager = nullptr);
    ~QCodeToolLsp() override;

    bool isMutating() const override;
    void abort() override;

    void setLspManager(QCodeLspManager *lspManager);

    /**
     * @brief Map an LSP failure to a tool error
     */
    static QCodeToolResult errorFromReply(const QCodeLspReply &reply);

protected:
    /* Resolved absolute path of the "file_path" argument */
    QString resolveFile(const json &arguments) const;

    /* Render a location array as "path:line:col" lines */
    QString formatLocations(const json &locations) const;

    /* Shared schema for position based queries */
    static json positionSchema();

    QPointer<QCodeLspManager> lspManager;
};

/**
 * @brief Tool to jump to the definition of a symbol
 */
class QCodeToolLspDefinition : public QCodeToolLsp
{
    Q_OBJECT

public:
    using QCodeToolLsp::QCodeToolLsp;

    QString         getName() const override;
    QString         getDescription() const override;
    json            getParametersSchema() const override;
    QCodeToolResult execute(const json &arguments) override;
};

/**
 * @brief Tool to list references to a symbol
 */
class QCodeToolLspReferences : public QCodeToolLsp
{
    Q_OBJECT

public:
    using QCodeToolLsp::QCodeToolLsp;

    QString         getName() const override;
    QString         getDescription() const override;
    json            getParametersSchema() const override;
    QCodeToolResult execute(const json &arguments) override;
};

/**
 * @brief Tool to fetch compiler diagnostics for a file
 */
class QCodeToolLspDiagnostics : public QCodeToolLsp
{
    Q_OBJECT

public:
    using QCodeToolLsp::QCodeToolLsp;

    QString         getName() const override;
    QString         getDescription() const override;
    json            getParametersSchema() const override;
    QCodeToolResult execute(const json &arguments) override;

    /**
     * @brief Severity label for an LSP severity code
     * @return "error", "warning", "info" or "hint"
     */
    static QString severityName(int severity);
};

#endif // QCODETOOLLSP_H
