// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODECONFIG_H
#define QCODECONFIG_H

#include <QMap>
#include <QObject>
#include <QString>

namespace YAML {
class Node;
}

/**
 * @brief The QCodeConfig class provides layered key/value configuration
 * @details Values are loaded from YAML files and the environment. Later sources override
 *          earlier ones:
 *          1. System-wide: /etc/qcode/qcode.yml (Linux only)
 *          2. User: ~/.config/qcode/qcode.yml
 *          3. Project: <project>/.qcode.yml
 *          4. Environment variables (QCODE_*)
 *          Nested YAML maps are flattened into dotted keys such as "lsp.rust.command".
 */
class QCodeConfig : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructor
     * @param parent Parent object
     * @param projectPath Project root used for the project-level file, may be empty
     * @param loadFiles Load the system and user files, tests pass false
     */
    explicit QCodeConfig(
        QObject *parent = nullptr, const QString &projectPath = QString(), bool loadFiles = true);

    ~QCodeConfig() override;

    /**
     * @brief Set the project root and reload the configuration
     * @param projectPath Project root directory
     */
    void setProjectPath(const QString &projectPath);

    QString getProjectPath() const;

    /**
     * @brief Reload configuration from all sources
     */
    void loadConfig();

    /**
     * @brief Load values from a YAML file
     * @param filePath Path to the YAML file
     * @param override Whether to override existing values
     * @return false if the file exists but could not be parsed
     */
    bool loadFromYamlFile(const QString &filePath, bool override = true);

    /**
     * @brief Get a configuration value
     * @param key Dotted key
     * @param defaultValue Value returned when the key is not set
     */
    QString getValue(const QString &key, const QString &defaultValue = QString()) const;

    void setValue(const QString &key, const QString &value);
    bool hasKey(const QString &key) const;

    QMap<QString, QString> getAllValues() const;

    /**
     * @brief Write a commented template configuration file
     * @param filePath Destination path
     * @return true on success
     */
    static bool createTemplateConfig(const QString &filePath);

    static const QString CONFIG_FILE_SYSTEM;
    static const QString CONFIG_FILE_USER;
    static const QString CONFIG_FILE_PROJECT;

private:
    QMap<QString, QString> configValues;
    QString                projectPath;
    bool                   loadFiles = true;

    void loadFromEnvironment();
    void loadFromProjectYaml();
    void flattenNode(const QString &prefix, const YAML::Node &node, bool override);
};

#endif // QCODECONFIG_H
