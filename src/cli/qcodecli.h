// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODECLI_H
#define QCODECLI_H

#include <memory>
#include <QCommandLineParser>
#include <QObject>
#include <QStringList>
#include <QTextStream>

class QCodeAgent;
class QCodeConfig;
class QCodeLspManager;
class QCodeModeGate;
class QCodeReadline;
class QCodeSessionStore;
class QCodeToolRegistry;
class QLLMService;
class QSocketNotifier;

/**
 * @brief Interactive command line front end
 * @details Builds the agent stack from configuration and runs a read-eval loop on
 *          stdin. Lines starting with '/' are session commands, everything else is sent
 *          to the agent. SIGINT aborts the run in progress.
 */
class QCodeCliWorker : public QObject
{
    Q_OBJECT

public:
    explicit QCodeCliWorker(QObject *parent = nullptr);
    ~QCodeCliWorker() override;

    /**
     * @brief Parse arguments and run the session
     * @param appArguments Application arguments including the program name
     * @return Process exit code
     */
    int run(const QStringList &appArguments);

private slots:
    void handleInterrupt();

private:
    QCommandLineParser parser;
    QTextStream        qout;
    QTextStream        qerr;

    QCodeConfig       *config       = nullptr;
    QLLMService       *llmService   = nullptr;
    QCodeToolRegistry *toolRegistry = nullptr;
    QCodeModeGate     *modeGate     = nullptr;
    QCodeLspManager   *lspManager   = nullptr;
    QCodeAgent        *agent        = nullptr;
    QSocketNotifier   *sigintNotifier = nullptr;
    QCodeReadline     *readline       = nullptr;

    std::unique_ptr<QCodeSessionStore> sessionStore;

    bool verbose = false;

    static int sigintFd[2];
    static void sigintHandler(int signal);

    bool setupSignalHandler();
    void setupAgent(const QString &projectPath);
    void registerTools(const QString &projectPath, int bashTimeoutSeconds);
    void connectAgentSignals();

    /**
     * @brief Run one operator message through the agent and print the outcome
     * @return true if the run completed
     */
    bool runQuery(const QString &query);

    /**
     * @brief Handle a slash command
     * @return false when the session should end
     */
    bool handleCommand(const QString &input);

    /**
     * @brief Set up line editing with history in <project>/.qcode/history
     */
    void setupReadline(const QString &projectPath);

    /**
     * @brief Save or restore the conversation through the session store
     * @param name Session name, or a file path
     */
    bool saveTranscript(const QString &name);
    bool loadTranscript(const QString &name);
    void listSessions();
    void printStatus();
    void printHelp();
};

#endif // QCODECLI_H
