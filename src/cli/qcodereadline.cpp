// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "cli/qcodereadline.h"

#include <cerrno>
#include <unistd.h>

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QProcessEnvironment>

#include <replxx.hxx>

QCodeReadline::QCodeReadline(QObject *parent)
    : QObject(parent)
    , replxxInstance(std::make_unique<replxx::Replxx>())
{
    replxxInstance->set_max_history_size(1000);
    replxxInstance->set_unique_history(true);
    replxxInstance->set_word_break_characters(" \t\n\r\v\f!\"#$%&'()*+,-.:;<=>?@[\\]^`{|}~");

    replxxInstance->set_double_tab_completion(false);
    replxxInstance->set_complete_on_empty(false);
    replxxInstance->set_beep_on_ambiguous_completion(false);
    replxxInstance->set_no_color(!terminalSupportsColor());

    replxxInstance->bind_key_internal(replxx::Replxx::KEY::control('L'), "clear_screen");
    replxxInstance->bind_key_internal(replxx::Replxx::KEY::control('W'), "kill_to_begining_of_word");

    replxxInstance->install_window_change_handler();
}

QCodeReadline::~QCodeReadline()
{
    if (!historyFilePath.isEmpty()) {
        saveHistory();
    }
}

QString QCodeReadline::readLine(const QString &prompt)
{
    eofFlag = false;

    errno              = 0;
    const char *result = replxxInstance->input(prompt.toStdString());
    if (result == nullptr) {
        /* Ctrl-C discards the line and reports EAGAIN, anything else is EOF */
        eofFlag = errno != EAGAIN;
        return QString();
    }

    const QString line = QString::fromUtf8(result);
    if (!line.trimmed().isEmpty()) {
        addHistory(line);
    }
    return line;
}

bool QCodeReadline::isEof() const
{
    return eofFlag;
}

void QCodeReadline::setHistoryFile(const QString &path)
{
    historyFilePath = path;

    const QDir directory = QFileInfo(path).dir();
    if (!directory.exists() && !directory.mkpath(".")) {
        qWarning() << "Cannot create history directory" << directory.path();
    }

    loadHistory();
}

bool QCodeReadline::loadHistory()
{
    if (historyFilePath.isEmpty()) {
        return false;
    }
    return replxxInstance->history_load(historyFilePath.toStdString());
}

bool QCodeReadline::saveHistory()
{
    if (historyFilePath.isEmpty()) {
        return false;
    }
    return replxxInstance->history_save(historyFilePath.toStdString());
}

void QCodeReadline::addHistory(const QString &line)
{
    replxxInstance->history_add(line.toStdString());

    if (!historyFilePath.isEmpty()) {
        replxxInstance->history_sync(historyFilePath.toStdString());
    }
}

void QCodeReadline::setCompletionCallback(CompletionCallback callback)
{
    completionCallback = std::move(callback);
    if (!completionCallback) {
        return;
    }

    replxxInstance->set_completion_callback(
        [this](const std::string &input, int &contextLen) -> replxx::Replxx::completions_t {
            replxx::Replxx::completions_t completions;
            const QStringList results = completionCallback(QString::fromStdString(input), contextLen);
            for (const QString &result : results) {
                completions.emplace_back(result.toStdString());
            }
            return completions;
        });
}

bool QCodeReadline::terminalSupportsColor()
{
    if (::isatty(STDOUT_FILENO) == 0) {
        return false;
    }

    const QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    if (env.contains("NO_COLOR")) {
        return false;
    }
    const QString term = env.value("TERM");
    return !term.isEmpty() && term != "dumb";
}
