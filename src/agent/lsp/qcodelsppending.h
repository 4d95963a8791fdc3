// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODELSPPENDING_H
#define QCODELSPPENDING_H

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <QHash>
#include <QMutex>
#include <QString>
#include <QWaitCondition>

using json = nlohmann::json;

/**
 * @brief Failure categories of an LSP operation
 */
enum class QCodeLspError : std::uint8_t {
    None,
    Unavailable,   /* Server could not be started or initialized */
    SessionLost,   /* Server exited or its stream closed */
    Timeout,       /* No reply within the deadline */
    ProtocolError, /* Error response or unusable reply */
    IoError,       /* Document could not be read */
    Cancelled      /* Waiter was released by a cancel */
};

/**
 * @brief Outcome of an LSP request
 */
struct QCodeLspReply
{
    QCodeLspError error = QCodeLspError::None;
    QString       message;
    json          result;

    bool isOk() const { return error == QCodeLspError::None; }

    static QCodeLspReply ok(const json &result);
    static QCodeLspReply failure(QCodeLspError error, const QString &message);
};

/**
 * @brief One-shot completion for a single outstanding request
 */
class QCodeLspPendingSlot
{
public:
    /**
     * @brief Complete the slot; later completions are ignored
     * @return true if this call completed it
     */
    bool complete(const QCodeLspReply &reply);

    /**
     * @brief Block until completed or the timeout expires
     * @return true if completed
     */
    bool wait(int timeoutMs);

    bool          isDone() const;
    QCodeLspReply reply() const;

private:
    mutable QMutex mutex;
    QWaitCondition condition;
    bool           done = false;
    QCodeLspReply  value;
};

/**
 * @brief Request id to waiter table
 * @details Ids are allocated from a counter and never reused. A reply whose id has
 *          no slot, because it timed out or was never sent, is dropped.
 */
class QCodeLspPendingRegistry
{
public:
    qint64 nextId();

    std::shared_ptr<QCodeLspPendingSlot> insert(qint64 id);

    /**
     * @brief Deliver a reply to its waiter
     * @return false if no waiter holds that id
     */
    bool fulfill(qint64 id, const QCodeLspReply &reply);

    /**
     * @brief Forget a waiter, its reply will be dropped
     */
    void abandon(qint64 id);

    /**
     * @brief Complete every waiter with the same failure
     */
    void failAll(QCodeLspError error, const QString &message);

    int size() const;

private:
    mutable QMutex                                      mutex;
    QHash<qint64, std::shared_ptr<QCodeLspPendingSlot>> waiters;
    qint64                                              lastId = 0;
};

#endif // QCODELSPPENDING_H
