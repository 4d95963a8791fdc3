// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/qcodemode.h"

QString qcodeModeName(QCodeMode mode)
{
    return mode == QCodeMode::Plan ? QStringLiteral("plan") : QStringLiteral("execute");
}

QCodeMode qcodeParseMode(const QString &text, bool *ok)
{
    const QString name = text.trimmed().toLower();

    if (ok) {
        *ok = true;
    }
    if (name == "plan") {
        return QCodeMode::Plan;
    }
    if (name == "execute" || name == "exec") {
        return QCodeMode::Execute;
    }

    if (ok) {
        *ok = false;
    }
    return QCodeMode::Execute;
}

QCodeModeGate::QCodeModeGate(QObject *parent, QCodeMode initialMode)
    : QObject(parent)
    , currentMode(initialMode)
{}

QCodeModeGate::~QCodeModeGate() = default;

QCodeMode QCodeModeGate::mode() const
{
    return currentMode.load();
}

void QCodeModeGate::setMode(QCodeMode mode)
{
    if (currentMode.exchange(mode) != mode) {
        emit modeChanged(mode);
    }
}

QCodeMode QCodeModeGate::toggle()
{
    QCodeMode expected = currentMode.load();
    QCodeMode next     = QCodeMode::Execute;
    do {
        next = expected == QCodeMode::Plan ? QCodeMode::Execute : QCodeMode::Plan;
    } while (!currentMode.compare_exchange_weak(expected, next));

    emit modeChanged(next);
    return next;
}

QCodePermission QCodeModeGate::check(const QString &toolName, bool mutating) const
{
    QCodePermission permission;
    const QCodeMode snapshot = currentMode.load();

    if (snapshot == QCodeMode::Plan && mutating) {
        permission.allowed = false;
        permission.reason  = QString("Tool '%1' denied: read-only mode active (current mode: %2)")
                                .arg(toolName, qcodeModeName(snapshot));
    }

    return permission;
}
