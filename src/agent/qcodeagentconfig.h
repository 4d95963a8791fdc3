// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODEAGENTCONFIG_H
#define QCODEAGENTCONFIG_H

#include "agent/qcodemode.h"

#include <QString>

class QCodeConfig;

/**
 * @brief Backoff schedule for transient backend failures
 */
struct QCodeRetryPolicy
{
    /* Total attempts per backend round-trip, including the first */
    int maxAttempts = 3;

    /* Delay after attempt i (0-based) is min(initialDelayMs * multiplier^i, maxDelayMs) */
    int    initialDelayMs = 1000;
    double multiplier     = 2.0;
    int    maxDelayMs     = 10000;

    /**
     * @brief Delay to wait after a failed attempt
     * @param attempt 0-based index of the attempt that failed
     * @return Delay in milliseconds
     */
    int delayForAttempt(int attempt) const;
};

/**
 * @brief Configuration structure for QCodeAgent
 * @details Holds the agent's limits, LLM parameters, retry schedule and
 *          tool settings. fromConfig() maps the YAML keys onto it.
 */
struct QCodeAgentConfig
{
    /* Transcript window, in messages */
    int maxMessages = 100;

    /* Backend round-trips per operator turn */
    int maxIterations = 50;

    /* Wall-clock limit per operator turn, 0 disables it */
    int maxTurnSeconds = 0;

    QCodeMode initialMode = QCodeMode::Execute;

    /* LLM temperature parameter (0.0-1.0) */
    double temperature = 0.2;

    /* Read-only tools run concurrently up to this many at a time */
    int maxParallelTools = 4;

    QCodeRetryPolicy retry;

    /* Default timeout of the bash tool, seconds */
    int bashTimeoutSeconds = 120;

    /* LSP request deadline and diagnostics settle window, milliseconds */
    int lspRequestTimeoutMs    = 10000;
    int lspDiagnosticsSettleMs = 500;

    /* Enable verbose output */
    bool verbose = true;

    /* System prompt for the agent */
    QString systemPrompt = R"(You are QCode, a coding assistant working inside the user's project.

## Tools

Call tools through the function-calling interface when it is available. Otherwise output a
JSON block like this, one block per call:
```json
{"tool": "tool_name", "params": {"param1": "value1"}}
```

- read, glob, grep: inspect files. Paths are relative to the project root.
- write, edit: change files inside the project root.
- bash: run a shell command with a timeout.
- git_status, git_diff, git_log, git_add, git_commit: work with the repository.
- lsp_definition, lsp_references, lsp_diagnostics: ask the language server about code.
  Lines and columns are 1-based.
- set_mode: switch to plan mode when you only need to investigate.

## Modes

In plan mode only read-only tools are available. A denied call returns "PermissionDenied";
do not retry it, describe the change you would make instead.

## Guidelines
1. Read before you write. Keep edits minimal.
2. Several read-only calls in one reply run in parallel.
3. If a tool fails, explain the error and try to fix it.
4. Finish with a short summary of what you did.)";

    /**
     * @brief Build a configuration from loaded settings
     * @details Keys that are missing or invalid keep their defaults.
     * @param config Loaded configuration, may be nullptr
     */
    static QCodeAgentConfig fromConfig(const QCodeConfig *config);
};

#endif // QCODEAGENTCONFIG_H
