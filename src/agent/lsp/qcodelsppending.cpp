// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/lsp/qcodelsppending.h"

#include <QDeadlineTimer>
#include <QDebug>
#include <QMutexLocker>

/* QCodeLspReply Implementation */

QCodeLspReply QCodeLspReply::ok(const json &result)
{
    QCodeLspReply reply;
    reply.result = result;
    return reply;
}

QCodeLspReply QCodeLspReply::failure(QCodeLspError error, const QString &message)
{
    QCodeLspReply reply;
    reply.error   = error;
    reply.message = message;
    return reply;
}

/* QCodeLspPendingSlot Implementation */

bool QCodeLspPendingSlot::complete(const QCodeLspReply &reply)
{
    QMutexLocker locker(&mutex);
    if (done) {
        return false;
    }
    done  = true;
    value = reply;
    condition.wakeAll();
    return true;
}

bool QCodeLspPendingSlot::wait(int timeoutMs)
{
    QMutexLocker   locker(&mutex);
    QDeadlineTimer deadline(qMax(0, timeoutMs));
    while (!done) {
        if (!condition.wait(&mutex, deadline)) {
            break;
        }
    }
    return done;
}

bool QCodeLspPendingSlot::isDone() const
{
    QMutexLocker locker(&mutex);
    return done;
}

QCodeLspReply QCodeLspPendingSlot::reply() const
{
    QMutexLocker locker(&mutex);
    return value;
}

/* QCodeLspPendingRegistry Implementation */

qint64 QCodeLspPendingRegistry::nextId()
{
    QMutexLocker locker(&mutex);
    return ++lastId;
}

std::shared_ptr<QCodeLspPendingSlot> QCodeLspPendingRegistry::insert(qint64 id)
{
    auto         slot = std::make_shared<QCodeLspPendingSlot>();
    QMutexLocker locker(&mutex);
    waiters.insert(id, slot);
    return slot;
}

bool QCodeLspPendingRegistry::fulfill(qint64 id, const QCodeLspReply &reply)
{
    std::shared_ptr<QCodeLspPendingSlot> slot;
    {
        QMutexLocker locker(&mutex);
        slot = waiters.take(id);
    }

    if (!slot) {
        qDebug() << "Dropping LSP reply for unknown request id" << id;
        return false;
    }
    return slot->complete(reply);
}

void QCodeLspPendingRegistry::abandon(qint64 id)
{
    QMutexLocker locker(&mutex);
    waiters.remove(id);
}

void QCodeLspPendingRegistry::failAll(QCodeLspError error, const QString &message)
{
    QHash<qint64, std::shared_ptr<QCodeLspPendingSlot>> taken;
    {
        QMutexLocker locker(&mutex);
        taken.swap(waiters);
    }

    for (const auto &slot : taken) {
        slot->complete(QCodeLspReply::failure(error, message));
    }
}

int QCodeLspPendingRegistry::size() const
{
    QMutexLocker locker(&mutex);
    return static_cast<int>(waiters.size());
}
