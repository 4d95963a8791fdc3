// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/tool/qcodetoolmode.h"

QCodeToolSetMode::QCodeToolSetMode(QObject *parent, QCodeModeGate *modeGate)
    : QCodeTool(parent)
    , modeGate(modeGate)
{}

QCodeToolSetMode::~QCodeToolSetMode() = default;

QString QCodeToolSetMode::getName() const
{
    return "set_mode";
}

QString QCodeToolSetMode::getDescription() const
{
    return "Switch the session mode. Use 'plan' before exploring a change you have not "
           "agreed with the user yet; only read-only tools are available in plan mode.";
}

json QCodeToolSetMode::getParametersSchema() const
{
    return {
        {"type", "object"},
        {"properties",
         {{"mode",
           {{"type", "string"},
            {"enum", json::array({"plan", "execute"})},
            {"description", "Target mode: plan or execute"}}}}},
        {"required", json::array({"mode"})}};
}

bool QCodeToolSetMode::isMutating() const
{
    return true;
}

QCodeToolResult QCodeToolSetMode::execute(const json &arguments)
{
    if (!modeGate) {
        return QCodeToolResult::error(QCodeToolErrorKind::ProcessError, "No mode gate attached");
    }

    QString text;
    if (arguments.contains("mode") && arguments["mode"].is_string()) {
        text = QString::fromStdString(arguments["mode"].get<std::string>());
    }

    bool            ok   = false;
    const QCodeMode mode = qcodeParseMode(text, &ok);
    if (!ok) {
        return QCodeToolResult::error(
            QCodeToolErrorKind::InvalidArguments,
            QString("Unknown mode '%1' (expected plan or execute)").arg(text));
    }

    const QCodeMode previous = modeGate->mode();
    modeGate->setMode(mode);
    if (previous == mode) {
        return QCodeToolResult::success(QString("Mode is already %1").arg(qcodeModeName(mode)));
    }
    return QCodeToolResult::success(
        QString("Mode changed from %1 to %2").arg(qcodeModeName(previous), qcodeModeName(mode)));
}

void QCodeToolSetMode::setModeGate(QCodeModeGate *modeGate)
{
    this->modeGate = modeGate;
}
