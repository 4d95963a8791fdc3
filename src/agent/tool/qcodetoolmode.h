// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODETOOLMODE_H
#define QCODETOOLMODE_H

#include "agent/qcodemode.h"
#include "agent/qcodetool.h"

#include <QPointer>

/**
 * @brief Tool that lets the model switch the session mode
 * @details The tool is mutating, so it is itself denied in plan mode. The model can
 *          enter plan mode but never leave it; only the user can.
 */
class QCodeToolSetMode : public QCodeTool
{
    Q_OBJECT

public:
    /**
     * @brief Constructor
     * @param parent Parent object
     * @param modeGate Gate whose mode the tool changes
     */
    explicit QCodeToolSetMode(QObject *parent = nullptr, QCodeModeGate *modeGate = nullptr);
    ~QCodeToolSetMode() override;

    /**
     * @brief Get the tool name
     * @return "set_mode"
     */
    QString getName() const override;

    /**
     * @brief Get the tool description shown to the model
     * @return Description text
     */
    QString getDescription() const override;

    /**
     * @brief Get the JSON schema of the arguments
     * @return Object schema with a required "mode"
     */
    json getParametersSchema() const override;

    /**
     * @brief Whether the tool can change the project
     * @return Always true, so plan mode denies it
     */
    bool isMutating() const override;

    /**
     * @brief Switch the session mode
     * @param arguments Object with "mode"
     * @return Confirmation text, or an error when no gate is set or the mode is unknown
     */
    QCodeToolResult execute(const json &arguments) override;

    /**
     * @brief Set the gate whose mode the tool changes
     * @param modeGate Mode gate, not owned
     */
    void setModeGate(QCodeModeGate *modeGate);

private:
    QPointer<QCodeModeGate> modeGate;
};

#endif // QCODETOOLMODE_H
