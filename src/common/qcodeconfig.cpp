// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "common/qcodeconfig.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProcessEnvironment>
#include <QStringList>
#include <QTextStream>

#include <yaml-cpp/yaml.h>

const QString QCodeConfig::CONFIG_FILE_SYSTEM  = "/etc/qcode/qcode.yml";
const QString QCodeConfig::CONFIG_FILE_USER    = ".config/qcode/qcode.yml";
const QString QCodeConfig::CONFIG_FILE_PROJECT = ".qcode.yml";

QCodeConfig::QCodeConfig(QObject *parent, const QString &projectPath, bool loadFiles)
    : QObject(parent)
    , projectPath(projectPath)
    , loadFiles(loadFiles)
{
    loadConfig();
}

QCodeConfig::~QCodeConfig() = default;

void QCodeConfig::setProjectPath(const QString &projectPath)
{
    if (this->projectPath != projectPath) {
        this->projectPath = projectPath;
        loadConfig();
    }
}

QString QCodeConfig::getProjectPath() const
{
    return projectPath;
}

void QCodeConfig::loadConfig()
{
    configValues.clear();

    if (loadFiles) {
        const QString userConfigPath = QDir::home().absoluteFilePath(CONFIG_FILE_USER);
        if (!QFile::exists(userConfigPath)) {
            createTemplateConfig(userConfigPath);
        }

#ifdef Q_OS_LINUX
        loadFromYamlFile(CONFIG_FILE_SYSTEM);
#endif
        loadFromYamlFile(userConfigPath);
    }

    loadFromProjectYaml();

    /* Environment variables - highest priority */
    loadFromEnvironment();
}

void QCodeConfig::loadFromEnvironment()
{
    const QProcessEnvironment env = QProcessEnvironment::systemEnvironment();

    const QMap<QString, QString> envVars
        = {{"QCODE_API_URL", "llm.url"},
           {"QCODE_API_KEY", "llm.key"},
           {"QCODE_MODEL", "llm.model"},
           {"QCODE_AGENT_INITIAL_MODE", "agent.initial_mode"},
           {"QCODE_AGENT_MAX_MESSAGES", "agent.max_messages"},
           {"QCODE_AGENT_MAX_ITERATIONS", "agent.max_iterations"},
           {"QCODE_AGENT_TEMPERATURE", "agent.temperature"},
           {"QCODE_AGENT_SYSTEM_PROMPT", "agent.system_prompt"}};

    for (auto iter = envVars.constBegin(); iter != envVars.constEnd(); ++iter) {
        if (env.contains(iter.key())) {
            setValue(iter.value(), env.value(iter.key()));
        }
    }
}

void QCodeConfig::loadFromProjectYaml()
{
    if (projectPath.isEmpty()) {
        return;
    }

    loadFromYamlFile(QDir(projectPath).filePath(CONFIG_FILE_PROJECT));
}

bool QCodeConfig::loadFromYamlFile(const QString &filePath, bool override)
{
    if (!QFile::exists(filePath)) {
        return true;
    }

    try {
        YAML::Node root = YAML::LoadFile(filePath.toStdString());
        if (root.IsMap()) {
            flattenNode(QString(), root, override);
        }
    } catch (const YAML::Exception &e) {
        qWarning() << "Failed to load config from" << filePath << ":" << e.what();
        return false;
    }

    return true;
}

void QCodeConfig::flattenNode(const QString &prefix, const YAML::Node &node, bool override)
{
    for (const auto &item : node) {
        const QString name = QString::fromStdString(item.first.as<std::string>());
        const QString key  = prefix.isEmpty() ? name : prefix + "." + name;

        if (item.second.IsScalar()) {
            if (override || !hasKey(key)) {
                setValue(key, QString::fromStdString(item.second.as<std::string>()));
            }
        } else if (item.second.IsMap()) {
            flattenNode(key, item.second, override);
        } else if (item.second.IsSequence()) {
            /* Sequences of scalars are stored space-separated, e.g. lsp.python.args */
            QStringList parts;
            for (const auto &element : item.second) {
                if (element.IsScalar()) {
                    parts.append(QString::fromStdString(element.as<std::string>()));
                }
            }
            if (override || !hasKey(key)) {
                setValue(key, parts.join(' '));
            }
        }
    }
}

QString QCodeConfig::getValue(const QString &key, const QString &defaultValue) const
{
    return configValues.value(key, defaultValue);
}

void QCodeConfig::setValue(const QString &key, const QString &value)
{
    configValues[key] = value;
}

bool QCodeConfig::hasKey(const QString &key) const
{
    return configValues.contains(key);
}

QMap<QString, QString> QCodeConfig::getAllValues() const
{
    return configValues;
}

bool QCodeConfig::createTemplateConfig(const QString &filePath)
{
    const QFileInfo fileInfo(filePath);
    const QDir      directory = fileInfo.dir();

    if (!directory.exists() && !directory.mkpath(".")) {
        qWarning() << "Failed to create directory for config file:" << directory.path();
        return false;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "Failed to create template config file:" << filePath;
        return false;
    }

    QTextStream out(&file);

    out << "# QCode Configuration File\n";
    out << "# Uncomment and modify the settings below as needed.\n\n";

    out << "# llm:\n";
    out << "#   url: http://localhost:11434/v1/chat/completions\n";
    out << "#   model: qwen2.5-coder\n";
    out << "#   key:                      # optional for local servers\n";
    out << "#   timeout: 300000           # per request, milliseconds\n\n";

    out << "# retry:\n";
    out << "#   max_attempts: 3\n";
    out << "#   initial_delay_ms: 1000\n";
    out << "#   multiplier: 2.0\n";
    out << "#   max_delay_ms: 10000\n\n";

    out << "# agent:\n";
    out << "#   initial_mode: execute     # plan | execute\n";
    out << "#   max_messages: 100         # transcript window\n";
    out << "#   max_iterations: 50        # backend round-trips per turn\n";
    out << "#   max_turn_seconds: 0       # wall-clock limit per turn, 0 = off\n";
    out << "#   max_parallel_tools: 4\n";
    out << "#   temperature: 0.2\n\n";

    out << "# tools:\n";
    out << "#   bash_timeout: 120         # seconds\n\n";

    out << "# lsp:\n";
    out << "#   request_timeout_ms: 10000\n";
    out << "#   diagnostics_settle_ms: 500\n";
    out << "#   rust:\n";
    out << "#     command: rust-analyzer\n";
    out << "#   python:\n";
    out << "#     command: pyright-langserver\n";
    out << "#     args: [--stdio]\n";

    file.close();

    qDebug() << "Created template config file:" << filePath;
    return true;
}
