// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODEREADLINE_H
#define QCODEREADLINE_H

#include <functional>
#include <memory>
#include <QObject>
#include <QString>
#include <QStringList>

namespace replxx {
class Replxx;
}

/**
 * @brief Line editor for the interactive prompt
 * @details Wraps replxx: line editing, history browsing and search (Ctrl+R), tab
 *          completion, and history persisted to a file.
 */
class QCodeReadline : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Completion callback type
     * @param input Current input text
     * @param contextLen Set to the length of the text being completed
     * @return Completion candidates
     */
    using CompletionCallback = std::function<QStringList(const QString &input, int &contextLen)>;

    explicit QCodeReadline(QObject *parent = nullptr);
    ~QCodeReadline() override;

    /**
     * @brief Read a line of input with the given prompt
     * @return User input; empty on EOF or when the line was cancelled with Ctrl-C
     */
    QString readLine(const QString &prompt);

    /**
     * @brief Whether the last readLine() hit EOF (Ctrl-D)
     */
    bool isEof() const;

    /**
     * @brief Set the history file and load it
     * @param path History file, created with its directory if missing
     */
    void setHistoryFile(const QString &path);

    bool loadHistory();
    bool saveHistory();
    void addHistory(const QString &line);

    void setCompletionCallback(CompletionCallback callback);

    /**
     * @brief Whether stdout is a terminal that understands colors
     */
    static bool terminalSupportsColor();

private:
    std::unique_ptr<replxx::Replxx> replxxInstance;
    QString                         historyFilePath;
    bool                            eofFlag = false;
    CompletionCallback              completionCallback;
};

#endif // QCODEREADLINE_H
