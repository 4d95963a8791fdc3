// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODEPROCESS_H
#define QCODEPROCESS_H

#include <atomic>
#include <functional>
#include <QString>
#include <QStringList>

/**
 * @brief Outcome of a supervised subprocess run
 */
struct QCodeProcessResult
{
    bool    started  = false; /* Process was spawned */
    bool    finished = false; /* Process exited on its own before the deadline */
    bool    timedOut = false; /* Deadline hit, process was terminated */
    bool    aborted  = false; /* Cancelled, process was terminated */
    int     exitCode = -1;
    qint64  elapsedMs = 0;
    qint64  processId = 0;
    QString output;      /* Merged stdout and stderr */
    QString errorString; /* Spawn failure description */
};

/**
 * @brief Runs a subprocess with a hard deadline
 * @details The process is driven by a local event loop so the call works from any thread
 *          that may run one, including QThreadPool workers. The child leads its own
 *          process group. On timeout or abort the whole group is sent SIGTERM, then
 *          SIGKILL, and the runner waits for it to be gone before returning, so nothing
 *          the command spawned outlives run().
 */
class QCodeProcessRunner
{
public:
    /**
     * @brief Run a program and collect its output
     * @param program Executable path or name
     * @param arguments Program arguments
     * @param workingDirectory Working directory, empty for the current one
     * @param timeoutMs Deadline in milliseconds
     * @param cancelled Polled while waiting; returning true terminates the process
     * @return Collected result
     */
    static QCodeProcessResult run(
        const QString               &program,
        const QStringList           &arguments,
        const QString               &workingDirectory,
        int                          timeoutMs,
        const std::function<bool()> &cancelled = {});

    /**
     * @brief Truncate long tool output
     * @param output Output text
     * @param maxSize Maximum characters kept
     */
    static QString truncateOutput(const QString &output, int maxSize = 50000);
};

#endif // QCODEPROCESS_H
