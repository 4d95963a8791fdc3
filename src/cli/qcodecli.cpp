// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "cli/qcodecli.h"
#include "cli/qcodereadline.h"
#include "agent/lsp/qcodelspmanager.h"
#include "agent/qcodeagent.h"
#include "agent/qcodeagentconfig.h"
#include "agent/qcodemode.h"
#include "agent/qcodesessionstore.h"
#include "agent/qcodetool.h"
#include "agent/tool/qcodetoolfile.h"
#include "agent/tool/qcodetoolgit.h"
#include "agent/tool/qcodetoollsp.h"
#include "agent/tool/qcodetoolmode.h"
#include "agent/tool/qcodetoolsearch.h"
#include "agent/tool/qcodetoolshell.h"
#include "common/qcodeconfig.h"
#include "common/qllmservice.h"

#include <csignal>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <unistd.h>

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSocketNotifier>

using json = nlohmann::json;

int QCodeCliWorker::sigintFd[2] = {-1, -1};

QCodeCliWorker::QCodeCliWorker(QObject *parent)
    : QObject(parent)
    , qout(stdout)
    , qerr(stderr)
{}

QCodeCliWorker::~QCodeCliWorker()
{
    if (lspManager) {
        lspManager->shutdownAll();
    }
    if (sigintFd[0] >= 0) {
        std::signal(SIGINT, SIG_DFL);
        ::close(sigintFd[0]);
        ::close(sigintFd[1]);
        sigintFd[0] = -1;
        sigintFd[1] = -1;
    }
}

void QCodeCliWorker::sigintHandler(int)
{
    const char byte = 1;
    /* Only async-signal-safe calls here */
    [[maybe_unused]] const ssize_t written = ::write(sigintFd[1], &byte, sizeof(byte));
}

bool QCodeCliWorker::setupSignalHandler()
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, sigintFd) != 0) {
        qWarning() << "Cannot create signal socket pair, Ctrl-C will terminate the process";
        return false;
    }

    sigintNotifier = new QSocketNotifier(sigintFd[0], QSocketNotifier::Read, this);
    connect(sigintNotifier, &QSocketNotifier::activated, this, &QCodeCliWorker::handleInterrupt);

    struct sigaction action = {};
    action.sa_handler       = QCodeCliWorker::sigintHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    if (sigaction(SIGINT, &action, nullptr) != 0) {
        qWarning() << "Cannot install SIGINT handler";
        return false;
    }
    return true;
}

void QCodeCliWorker::handleInterrupt()
{
    sigintNotifier->setEnabled(false);
    char byte = 0;
    [[maybe_unused]] const ssize_t readBytes = ::read(sigintFd[0], &byte, sizeof(byte));

    if (agent && agent->isRunning()) {
        qerr << Qt::endl << "Interrupted, aborting the current run..." << Qt::endl;
        agent->abort();
    }

    sigintNotifier->setEnabled(true);
}

void QCodeCliWorker::registerTools(const QString &projectPath, int bashTimeoutSeconds)
{
    const QList<QCodeTool *> tools
        = {new QCodeToolFileRead(toolRegistry, projectPath),
           new QCodeToolFileWrite(toolRegistry, projectPath),
           new QCodeToolFileEdit(toolRegistry, projectPath),
           new QCodeToolGlob(toolRegistry, projectPath),
           new QCodeToolGrep(toolRegistry, projectPath),
           new QCodeToolShellBash(toolRegistry, projectPath, bashTimeoutSeconds),
           new QCodeToolGitStatus(toolRegistry, projectPath),
           new QCodeToolGitDiff(toolRegistry, projectPath),
           new QCodeToolGitLog(toolRegistry, projectPath),
           new QCodeToolGitAdd(toolRegistry, projectPath),
           new QCodeToolGitCommit(toolRegistry, projectPath),
           new QCodeToolLspDefinition(toolRegistry, lspManager),
           new QCodeToolLspReferences(toolRegistry, lspManager),
           new QCodeToolLspDiagnostics(toolRegistry, lspManager),
           new QCodeToolSetMode(toolRegistry, modeGate)};

    for (QCodeTool *tool : tools) {
        const QCodeRegistryStatus status = toolRegistry->registerTool(tool);
        if (status != QCodeRegistryStatus::Registered) {
            qWarning() << "Failed to register tool" << tool->getName();
        }
    }
}

void QCodeCliWorker::setupAgent(const QString &projectPath)
{
    QCodeAgentConfig agentConfig = QCodeAgentConfig::fromConfig(config);
    if (parser.isSet("mode")) {
        bool            ok   = false;
        const QCodeMode mode = qcodeParseMode(parser.value("mode"), &ok);
        if (ok) {
            agentConfig.initialMode = mode;
        } else {
            qWarning() << "Unknown mode" << parser.value("mode") << "- using"
                       << qcodeModeName(agentConfig.initialMode);
        }
    }
    verbose             = parser.isSet("verbose");
    agentConfig.verbose = verbose;

    llmService   = new QLLMService(this, config);
    modeGate     = new QCodeModeGate(this, agentConfig.initialMode);
    toolRegistry = new QCodeToolRegistry(this);
    lspManager   = new QCodeLspManager(this, config, projectPath);
    lspManager->setRequestTimeout(agentConfig.lspRequestTimeoutMs);
    lspManager->setDiagnosticsSettleTime(agentConfig.lspDiagnosticsSettleMs);

    registerTools(projectPath, agentConfig.bashTimeoutSeconds);
    sessionStore = std::make_unique<QCodeSessionStore>(QDir(projectPath).filePath(".qcode/sessions"));

    agent = new QCodeAgent(this, llmService, toolRegistry, modeGate, agentConfig);
    if (agent->loadProjectContext(projectPath) && verbose) {
        qerr << "Project context: " << agent->projectContextFile() << Qt::endl;
    }
    connectAgentSignals();
}

void QCodeCliWorker::connectAgentSignals()
{
    connect(agent, &QCodeAgent::verboseOutput, this, [this](const QString &message) {
        qerr << "[agent] " << message << Qt::endl;
    });
    connect(agent, &QCodeAgent::toolCalled, this, [this](const QString &toolName, const QString &arguments) {
        qout << "[tool] " << toolName << " " << arguments.left(200) << Qt::endl;
    });
    connect(agent, &QCodeAgent::toolResult, this, [this](const QString &toolName, const QString &result) {
        if (verbose) {
            qout << "[tool] " << toolName << " -> " << result.left(500) << Qt::endl;
        }
    });
    connect(
        agent,
        &QCodeAgent::retrying,
        this,
        [this](int attempt, int maxAttempts, int delayMs, const QString &error) {
            qerr << QString("Backend unavailable (%1), retrying %2/%3 in %4 ms")
                        .arg(error)
                        .arg(attempt)
                        .arg(maxAttempts)
                        .arg(delayMs)
                 << Qt::endl;
        });
    connect(modeGate, &QCodeModeGate::modeChanged, this, [this](QCodeMode mode) {
        qout << "[mode] " << qcodeModeName(mode) << Qt::endl;
    });
}

bool QCodeCliWorker::runQuery(const QString &query)
{
    /* Drop interrupts that arrived while idle at the prompt */
    QCoreApplication::processEvents();

    const QCodeRunResult result = agent->run(query);
    switch (result.status) {
    case QCodeRunResult::Status::Completed:
        qout << result.content << Qt::endl;
        return true;
    case QCodeRunResult::Status::Cancelled:
        qout << "(aborted)" << Qt::endl;
        return false;
    default:
        qerr << QString("Error [%1]: %2").arg(qcodeRunStatusName(result.status), result.error)
             << Qt::endl;
        return false;
    }
}

bool QCodeCliWorker::saveTranscript(const QString &name)
{
    QString error;
    if (!sessionStore->save(name, agent->getMessages(), &error)) {
        qerr << "Error: " << error << Qt::endl;
        return false;
    }
    qout << "Saved " << agent->transcript().size() << " messages to " << sessionStore->pathFor(name)
         << Qt::endl;
    return true;
}

bool QCodeCliWorker::loadTranscript(const QString &name)
{
    json    messages;
    QString error;
    if (!sessionStore->load(name, messages, &error)) {
        qerr << "Error: " << error << Qt::endl;
        return false;
    }

    if (!agent->setMessages(messages)) {
        qerr << "Error: " << sessionStore->pathFor(name) << " is not a saved transcript" << Qt::endl;
        return false;
    }
    qout << "Loaded " << agent->transcript().size() << " messages from " << sessionStore->pathFor(name)
         << Qt::endl;
    return true;
}

void QCodeCliWorker::listSessions()
{
    const QList<QCodeSavedSession> sessions = sessionStore->list();
    if (sessions.isEmpty()) {
        qout << "No saved conversations in " << sessionStore->directory() << Qt::endl;
        return;
    }

    qout << "Saved conversations in " << sessionStore->directory() << ":" << Qt::endl;
    for (const QCodeSavedSession &session : sessions) {
        const QString count = session.messageCount < 0 ? QString("unreadable")
                                                        : QString("%1 messages").arg(session.messageCount);
        qout << QString("  %1  %2  (%3)")
                    .arg(session.savedAt.toString("yyyy-MM-dd HH:mm"), session.name.leftJustified(24), count)
             << Qt::endl;
    }
}

void QCodeCliWorker::printStatus()
{
    const QString model = llmService->model();
    qout << "Mode:      " << qcodeModeName(modeGate->mode()) << Qt::endl;
    qout << "Model:     " << (model.isEmpty() ? QString("(server default)") : model) << Qt::endl;
    qout << "Endpoints: " << llmService->endpointCount() << Qt::endl;
    qout << "Messages:  " << agent->transcript().size() << "/" << agent->transcript().maxMessages()
         << Qt::endl;
    qout << "Project:   " << lspManager->rootPath() << Qt::endl;
    qout << "Context:   "
         << (agent->projectContextFile().isEmpty() ? QString("(none)") : agent->projectContextFile())
         << Qt::endl;

    QStringList tools;
    for (const QString &name : toolRegistry->toolNames()) {
        const QCodeTool *tool = toolRegistry->getTool(name);
        tools.append(tool && !modeGate->check(name, tool->isMutating()).allowed ? name + "*" : name);
    }
    qout << "Tools:     " << tools.join(", ") << Qt::endl;
    if (modeGate->mode() == QCodeMode::Plan) {
        qout << "           (* denied in plan mode)" << Qt::endl;
    }
}

void QCodeCliWorker::setupReadline(const QString &projectPath)
{
    readline = new QCodeReadline(this);
    readline->setHistoryFile(QDir(projectPath).filePath(".qcode/history"));

    readline->setCompletionCallback([](const QString &input, int &contextLen) -> QStringList {
        static const QStringList commands
            = {"/plan",
               "/execute",
               "/mode",
               "/model",
               "/status",
               "/clear",
               "/save",
               "/load",
               "/sessions",
               "/help",
               "/quit",
               "/exit"};

        const QString trimmed = input.trimmed().toLower();
        QStringList   completions;
        if (trimmed.startsWith('/') && !trimmed.contains(' ')) {
            for (const QString &command : commands) {
                if (command.startsWith(trimmed)) {
                    completions.append(command);
                }
            }
        }
        contextLen = static_cast<int>(trimmed.length());
        return completions;
    });
}

void QCodeCliWorker::printHelp()
{
    qout << "Commands:" << Qt::endl;
    qout << "  /plan          - Switch to plan mode (read-only tools)" << Qt::endl;
    qout << "  /execute       - Switch to execute mode (all tools)" << Qt::endl;
    qout << "  /mode          - Toggle between plan and execute" << Qt::endl;
    qout << "  /model <name>  - Use another model (no name shows the current one)" << Qt::endl;
    qout << "  /status        - Show mode, model, history usage and tools" << Qt::endl;
    qout << "  /clear         - Clear conversation history" << Qt::endl;
    qout << "  /save <name>   - Save the conversation to .qcode/sessions/<name>.json" << Qt::endl;
    qout << "  /load <name>   - Restore a saved conversation" << Qt::endl;
    qout << "  /sessions      - List saved conversations" << Qt::endl;
    qout << "  /quit, /exit   - Exit" << Qt::endl;
    qout << Qt::endl;
    qout << "Keyboard shortcuts:" << Qt::endl;
    qout << "  Up/Down        - Browse history" << Qt::endl;
    qout << "  Ctrl+R         - Search history" << Qt::endl;
    qout << "  Tab            - Complete a command" << Qt::endl;
    qout << "  Ctrl+L         - Clear screen" << Qt::endl;
    qout << Qt::endl;
    qout << "Anything else is sent to the agent. Ctrl-C aborts the current run." << Qt::endl;
}

bool QCodeCliWorker::handleCommand(const QString &input)
{
    const QString command  = input.section(' ', 0, 0).toLower();
    const QString argument = input.section(' ', 1).trimmed();

    if (command == "/quit" || command == "/exit") {
        return false;
    }
    if (command == "/plan") {
        modeGate->setMode(QCodeMode::Plan);
        qout << "Mode: plan" << Qt::endl;
    } else if (command == "/execute") {
        modeGate->setMode(QCodeMode::Execute);
        qout << "Mode: execute" << Qt::endl;
    } else if (command == "/mode") {
        qout << "Mode: " << qcodeModeName(modeGate->toggle()) << Qt::endl;
    } else if (command == "/model") {
        if (!argument.isEmpty()) {
            llmService->setModel(argument);
        }
        const QString model = llmService->model();
        qout << "Model: " << (model.isEmpty() ? QString("(server default)") : model) << Qt::endl;
    } else if (command == "/status") {
        printStatus();
    } else if (command == "/sessions") {
        listSessions();
    } else if (command == "/clear") {
        agent->clearHistory();
        qout << "History cleared." << Qt::endl;
    } else if (command == "/save" || command == "/load") {
        if (argument.isEmpty()) {
            qerr << "Usage: " << command << " <name>" << Qt::endl;
        } else if (command == "/save") {
            saveTranscript(argument);
        } else {
            loadTranscript(argument);
        }
    } else if (command == "/help") {
        printHelp();
    } else {
        qerr << "Unknown command: " << command << " (try /help)" << Qt::endl;
    }
    return true;
}

int QCodeCliWorker::run(const QStringList &appArguments)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("main", "Terminal coding agent with language server tools."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {{"d", "project"},
         QCoreApplication::translate("main", "The path to the project directory."),
         "project directory"},
        {{"m", "mode"},
         QCoreApplication::translate("main", "Initial mode: plan or execute."),
         "mode"},
        {"model", QCoreApplication::translate("main", "LLM model name."), "model"},
        {{"q", "query"},
         QCoreApplication::translate("main", "Single query mode (non-interactive)."),
         "query"},
        {"init-config",
         QCoreApplication::translate("main", "Write a template .qcode.yml into the project.")},
        {{"v", "verbose"}, QCoreApplication::translate("main", "Print agent progress.")},
    });

    parser.process(appArguments);

    QString projectPath = parser.isSet("project") ? parser.value("project") : QDir::currentPath();
    projectPath         = QDir(projectPath).absolutePath();
    if (!QFileInfo(projectPath).isDir()) {
        qerr << "Error: project directory does not exist: " << projectPath << Qt::endl;
        return 1;
    }

    if (parser.isSet("init-config")) {
        const QString path = QDir(projectPath).filePath(QCodeConfig::CONFIG_FILE_PROJECT);
        if (!QCodeConfig::createTemplateConfig(path)) {
            qerr << "Error: cannot write " << path << Qt::endl;
            return 1;
        }
        qout << "Wrote " << path << Qt::endl;
        return 0;
    }

    config = new QCodeConfig(this, projectPath);
    if (parser.isSet("model")) {
        config->setValue("llm.model", parser.value("model"));
    }

    setupAgent(projectPath);
    setupSignalHandler();

    if (!llmService->hasEndpoint()) {
        qerr << "Error: no LLM endpoint configured (set llm.url or QCODE_API_URL)" << Qt::endl;
        return 1;
    }

    if (parser.isSet("query")) {
        return runQuery(parser.value("query")) ? 0 : 1;
    }

    QTextStream qin(stdin);
    const bool  interactive = ::isatty(STDIN_FILENO) != 0;

    if (interactive) {
        setupReadline(projectPath);
        qout << "QCode - terminal coding agent (" << qcodeModeName(modeGate->mode()) << " mode)"
             << Qt::endl;
        qout << "Type /help for commands, /quit to exit" << Qt::endl << Qt::endl;
    }

    while (true) {
        QString input;
        if (interactive) {
            input = readline->readLine(modeGate->mode() == QCodeMode::Plan ? "plan> " : "qcode> ");
            if (readline->isEof()) {
                qout << Qt::endl << "Goodbye!" << Qt::endl;
                break;
            }
        } else {
            input = qin.readLine();
            if (input.isNull()) {
                break;
            }
        }

        input = input.trimmed();
        if (input.isEmpty()) {
            continue;
        }
        if (input.startsWith('/')) {
            if (!handleCommand(input)) {
                break;
            }
            continue;
        }

        runQuery(input);
    }

    return 0;
}
