// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "common/qcodeprocess.h"

#include <csignal>
#include <sys/types.h>
#include <unistd.h>

#include <QDebug>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QProcess>
#include <QTimer>

namespace {

/* Grace period between SIGTERM and SIGKILL */
constexpr int kTerminateGraceMs = 2000;
/* How often the cancel predicate is polled */
constexpr int kCancelPollMs = 50;
/* How long to wait for the rest of the process group after SIGKILL */
constexpr int kGroupReapMs = 1000;

bool groupAlive(pid_t group)
{
    return ::kill(-group, 0) == 0;
}

/* The child leads its own process group, so signals reach everything it spawned */
void stopProcess(QProcess &process, pid_t group)
{
    if (process.state() != QProcess::NotRunning) {
        if (group > 0) {
            ::kill(-group, SIGTERM);
        } else {
            process.terminate();
        }
        if (!process.waitForFinished(kTerminateGraceMs)) {
            process.kill();
            process.waitForFinished(-1);
        }
    }

    if (group <= 0) {
        return;
    }

    /* Descendants may ignore SIGTERM or outlive the leader */
    ::kill(-group, SIGKILL);

    QElapsedTimer reap;
    reap.start();
    while (groupAlive(group) && reap.elapsed() < kGroupReapMs) {
        ::usleep(10000);
    }
    if (groupAlive(group)) {
        qWarning() << "Process group" << group << "still present after SIGKILL";
    }
}

} // namespace

QCodeProcessResult QCodeProcessRunner::run(
    const QString               &program,
    const QStringList           &arguments,
    const QString               &workingDirectory,
    int                          timeoutMs,
    const std::function<bool()> &cancelled)
{
    QCodeProcessResult result;
    QElapsedTimer      elapsed;
    elapsed.start();

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.setChildProcessModifier([]() { ::setpgid(0, 0); });
    if (!workingDirectory.isEmpty()) {
        process.setWorkingDirectory(workingDirectory);
    }

    QByteArray output;
    QObject::connect(&process, &QProcess::readyRead, &process, [&process, &output]() {
        output += process.readAll();
    });

    process.start(program, arguments);
    if (!process.waitForStarted(5000)) {
        result.errorString = process.errorString();
        result.elapsedMs   = elapsed.elapsed();
        return result;
    }
    result.started   = true;
    result.processId = process.processId();
    const auto group = static_cast<pid_t>(result.processId);

    QEventLoop loop;
    bool       finished = false;
    bool       aborted  = false;

    QObject::connect(
        &process,
        QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
        &loop,
        [&finished, &loop](int, QProcess::ExitStatus) {
            finished = true;
            loop.quit();
        });

    QTimer deadline;
    deadline.setSingleShot(true);
    QObject::connect(&deadline, &QTimer::timeout, &loop, &QEventLoop::quit);
    deadline.start(timeoutMs > 0 ? timeoutMs : 0);

    QTimer poll;
    if (cancelled) {
        QObject::connect(&poll, &QTimer::timeout, &loop, [&cancelled, &aborted, &loop]() {
            if (cancelled()) {
                aborted = true;
                loop.quit();
            }
        });
        poll.start(kCancelPollMs);
    }

    if (!(cancelled && cancelled())) {
        loop.exec();
    } else {
        aborted = true;
    }

    poll.stop();
    deadline.stop();

    if (!finished) {
        stopProcess(process, group);
        result.timedOut = !aborted;
        result.aborted  = aborted;
    }

    output += process.readAll();

    result.finished  = finished;
    result.exitCode  = finished ? process.exitCode() : -1;
    result.output    = QString::fromUtf8(output);
    result.elapsedMs = elapsed.elapsed();

    if (finished && process.exitStatus() == QProcess::CrashExit) {
        result.errorString = QString("Process crashed: %1").arg(process.errorString());
    }

    return result;
}

QString QCodeProcessRunner::truncateOutput(const QString &output, int maxSize)
{
    if (output.size() <= maxSize) {
        return output;
    }
    return output.left(maxSize) + "\n... (output truncated)";
}
