// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODETOOLDISPATCHER_H
#define QCODETOOLDISPATCHER_H

#include "agent/qcodetool.h"
#include "agent/qcodetoolcall.h"

#include <atomic>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QPointer>
#include <QThreadPool>

class QCodeModeGate;
class QEventLoop;

/**
 * @brief Executes the tool calls of one assistant reply
 * @details Each call goes through lookup, permission check, argument validation and
 *          execution. Read-only calls run concurrently on a private thread pool; a
 *          mutating call waits for everything before it, runs alone, and only then are
 *          later calls checked. Results always come back one per call, in call order.
 */
class QCodeToolDispatcher : public QObject
{
    Q_OBJECT

public:
    explicit QCodeToolDispatcher(
        QObject           *parent   = nullptr,
        QCodeToolRegistry *registry = nullptr,
        QCodeModeGate     *gate     = nullptr);
    ~QCodeToolDispatcher() override;

    void setToolRegistry(QCodeToolRegistry *registry);
    void setModeGate(QCodeModeGate *gate);

    /**
     * @brief Set how many read-only calls may run at once
     * @param count Worker count, at least 1
     */
    void setMaxParallelTools(int count);
    int  maxParallelTools() const;

    /**
     * @brief Run a batch of tool calls
     * @details Blocks in a local event loop until every call has a result.
     * @param calls Calls in request order
     * @return One result per call, same order
     */
    QList<QCodeToolResult> dispatch(const QList<QCodeToolCall> &calls);

    /**
     * @brief Cancel the running batch
     * @details Thread-safe. Calls not started yet resolve to Cancelled and running
     *          tools are aborted. dispatch() still returns a full result list.
     */
    void cancel();

    /**
     * @brief Clear a previous cancel before the next batch
     */
    void resetCancel();
    bool isCancelled() const;

signals:
    void toolCalled(const QString &toolName, const QString &arguments);
    void toolResult(const QString &toolName, const QString &result);

private:
    QPointer<QCodeToolRegistry> registry;
    QPointer<QCodeModeGate>     gate;
    QThreadPool                 pool;
    std::atomic<bool>           cancelRequested{false};

    /* Dispatch-thread state */
    QEventLoop            *activeLoop = nullptr;
    QList<QCodeToolResult> results;
    int                    inFlight = 0;

    /* Tools currently executing, aborted on cancel */
    QMutex             runningMutex;
    QList<QCodeTool *> running;

    /**
     * @brief Lookup, gate and validate one call
     * @return nullptr with result filled when the call must not run
     */
    QCodeTool *prepare(const QCodeToolCall &call, QCodeToolResult &result) const;

    void start(int index, QCodeTool *tool, const QCodeToolCall &call);
    void finish(int index, const QCodeToolResult &result);
    void waitUntilInFlightBelow(int count);
};

#endif // QCODETOOLDISPATCHER_H
