// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/qcodeagentconfig.h"
#include "common/qcodeconfig.h"

#include <cmath>
#include <QDebug>

int QCodeRetryPolicy::delayForAttempt(int attempt) const
{
    const double delay = static_cast<double>(initialDelayMs)
                         * std::pow(multiplier, static_cast<double>(qMax(0, attempt)));
    if (!std::isfinite(delay) || delay >= static_cast<double>(maxDelayMs)) {
        return maxDelayMs;
    }
    return qMax(0, static_cast<int>(delay));
}

namespace {

void readInt(const QCodeConfig *config, const QString &key, int minimum, int &target)
{
    if (!config->hasKey(key)) {
        return;
    }
    bool      ok    = false;
    const int value = config->getValue(key).trimmed().toInt(&ok);
    if (ok && value >= minimum) {
        target = value;
    } else {
        qWarning() << "Ignoring invalid value for" << key << ":" << config->getValue(key);
    }
}

void readDouble(const QCodeConfig *config, const QString &key, double minimum, double &target)
{
    if (!config->hasKey(key)) {
        return;
    }
    bool         ok    = false;
    const double value = config->getValue(key).trimmed().toDouble(&ok);
    if (ok && value >= minimum) {
        target = value;
    } else {
        qWarning() << "Ignoring invalid value for" << key << ":" << config->getValue(key);
    }
}

} // namespace

QCodeAgentConfig QCodeAgentConfig::fromConfig(const QCodeConfig *config)
{
    QCodeAgentConfig result;
    if (!config) {
        return result;
    }

    readInt(config, "agent.max_messages", 1, result.maxMessages);
    readInt(config, "agent.max_iterations", 1, result.maxIterations);
    readInt(config, "agent.max_turn_seconds", 0, result.maxTurnSeconds);
    readInt(config, "agent.max_parallel_tools", 1, result.maxParallelTools);
    readDouble(config, "agent.temperature", 0.0, result.temperature);

    if (config->hasKey("agent.initial_mode")) {
        bool            ok   = false;
        const QCodeMode mode = qcodeParseMode(config->getValue("agent.initial_mode"), &ok);
        if (ok) {
            result.initialMode = mode;
        } else {
            qWarning() << "Ignoring invalid agent.initial_mode:"
                       << config->getValue("agent.initial_mode");
        }
    }

    if (config->hasKey("agent.system_prompt")) {
        result.systemPrompt = config->getValue("agent.system_prompt");
    }
    if (config->hasKey("agent.verbose")) {
        const QString verbose = config->getValue("agent.verbose").trimmed().toLower();
        result.verbose        = verbose == "true" || verbose == "1" || verbose == "yes";
    }

    readInt(config, "retry.max_attempts", 1, result.retry.maxAttempts);
    readInt(config, "retry.initial_delay_ms", 0, result.retry.initialDelayMs);
    readDouble(config, "retry.multiplier", 1.0, result.retry.multiplier);
    readInt(config, "retry.max_delay_ms", 0, result.retry.maxDelayMs);

    readInt(config, "tools.bash_timeout", 1, result.bashTimeoutSeconds);
    readInt(config, "lsp.request_timeout_ms", 1, result.lspRequestTimeoutMs);
    readInt(config, "lsp.diagnostics_settle_ms", 0, result.lspDiagnosticsSettleMs);

    return result;
}
