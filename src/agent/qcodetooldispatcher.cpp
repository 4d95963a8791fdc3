// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/qcodetooldispatcher.h"
#include "agent/qcodemode.h"

#include <QDebug>
#include <QEventLoop>
#include <QFutureWatcher>
#include <QMutexLocker>
#include <QtConcurrent/QtConcurrent>

QCodeToolDispatcher::QCodeToolDispatcher(
    QObject *parent, QCodeToolRegistry *registry, QCodeModeGate *gate)
    : QObject(parent)
    , registry(registry)
    , gate(gate)
{
    pool.setMaxThreadCount(4);
}

QCodeToolDispatcher::~QCodeToolDispatcher()
{
    cancel();
    pool.waitForDone();
}

void QCodeToolDispatcher::setToolRegistry(QCodeToolRegistry *registry)
{
    this->registry = registry;
}

void QCodeToolDispatcher::setModeGate(QCodeModeGate *gate)
{
    this->gate = gate;
}

void QCodeToolDispatcher::setMaxParallelTools(int count)
{
    pool.setMaxThreadCount(qMax(1, count));
}

int QCodeToolDispatcher::maxParallelTools() const
{
    return pool.maxThreadCount();
}

void QCodeToolDispatcher::cancel()
{
    cancelRequested = true;

    {
        QMutexLocker locker(&runningMutex);
        for (QCodeTool *tool : running) {
            tool->abort();
        }
    }

    /* Wake dispatch() so it stops starting new calls */
    QMetaObject::invokeMethod(
        this,
        [this]() {
            if (activeLoop) {
                activeLoop->quit();
            }
        },
        Qt::QueuedConnection);
}

void QCodeToolDispatcher::resetCancel()
{
    cancelRequested = false;
}

bool QCodeToolDispatcher::isCancelled() const
{
    return cancelRequested.load();
}

QList<QCodeToolResult> QCodeToolDispatcher::dispatch(const QList<QCodeToolCall> &calls)
{
    results.clear();
    results.reserve(calls.size());
    inFlight = 0;

    for (const QCodeToolCall &call : calls) {
        QCodeToolResult placeholder;
        placeholder.callId   = call.id;
        placeholder.toolName = call.name;
        results.append(placeholder);
    }

    const int parallel = pool.maxThreadCount();

    for (int index = 0; index < calls.size(); ++index) {
        const QCodeToolCall &call = calls.at(index);

        emit toolCalled(call.name, QString::fromStdString(call.arguments.dump()));

        if (cancelRequested) {
            finish(index, QCodeToolResult::error(QCodeToolErrorKind::Cancelled, "Cancelled"));
            continue;
        }

        /* A mutating call waits for every earlier call before it is even checked */
        QCodeTool *candidate = registry ? registry->getTool(call.name) : nullptr;
        const bool barrier   = candidate && candidate->isMutating();
        waitUntilInFlightBelow(barrier ? 1 : parallel);

        if (cancelRequested) {
            finish(index, QCodeToolResult::error(QCodeToolErrorKind::Cancelled, "Cancelled"));
            continue;
        }

        QCodeToolResult rejected;
        QCodeTool      *tool = prepare(call, rejected);
        if (!tool) {
            finish(index, rejected);
            continue;
        }

        start(index, tool, call);

        if (barrier) {
            waitUntilInFlightBelow(1);
        }
    }

    waitUntilInFlightBelow(1);

    QList<QCodeToolResult> batch = results;
    results.clear();
    return batch;
}

QCodeTool *QCodeToolDispatcher::prepare(const QCodeToolCall &call, QCodeToolResult &result) const
{
    QCodeTool *tool = registry ? registry->getTool(call.name) : nullptr;
    if (!tool) {
        result = QCodeToolResult::error(
            QCodeToolErrorKind::UnknownTool, QString("Tool '%1' not found").arg(call.name));
        return nullptr;
    }

    if (gate) {
        const QCodePermission permission = gate->check(call.name, tool->isMutating());
        if (!permission.allowed) {
            result = QCodeToolResult::denied(permission.reason);
            return nullptr;
        }
    }

    const QString error = QCodeToolRegistry::validateArguments(tool->getParametersSchema(), call.arguments);
    if (!error.isEmpty()) {
        result = QCodeToolResult::error(
            QCodeToolErrorKind::InvalidArguments,
            QString("Invalid arguments for '%1': %2").arg(call.name, error));
        return nullptr;
    }

    return tool;
}

void QCodeToolDispatcher::start(int index, QCodeTool *tool, const QCodeToolCall &call)
{
    {
        QMutexLocker locker(&runningMutex);
        running.append(tool);
        if (cancelRequested) {
            tool->abort();
        }
    }
    ++inFlight;

    const json arguments = call.arguments;
    auto      *watcher   = new QFutureWatcher<QCodeToolResult>(this);

    connect(watcher, &QFutureWatcher<QCodeToolResult>::finished, this, [this, watcher, tool, index]() {
        {
            QMutexLocker locker(&runningMutex);
            running.removeOne(tool);
        }
        --inFlight;
        finish(index, watcher->result());
        watcher->deleteLater();

        if (activeLoop) {
            activeLoop->quit();
        }
    });

    watcher->setFuture(QtConcurrent::run(&pool, [tool, arguments]() -> QCodeToolResult {
        try {
            return tool->execute(arguments);
        } catch (const std::exception &e) {
            qWarning() << "Tool" << tool->getName() << "threw:" << e.what();
            return QCodeToolResult::error(
                QCodeToolErrorKind::ProcessError,
                QString("Tool '%1' failed: %2").arg(tool->getName(), e.what()));
        }
    }));
}

void QCodeToolDispatcher::finish(int index, const QCodeToolResult &result)
{
    QCodeToolResult &slot = results[index];
    slot.outcome          = result.outcome;
    slot.errorKind        = result.errorKind;
    slot.content          = result.content;

    emit toolResult(slot.toolName, slot.toMessageContent());
}

void QCodeToolDispatcher::waitUntilInFlightBelow(int count)
{
    while (inFlight >= count && inFlight > 0) {
        QEventLoop loop;
        activeLoop = &loop;
        loop.exec();
        activeLoop = nullptr;
    }
}
