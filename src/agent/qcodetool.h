// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODETOOL_H
#define QCODETOOL_H

#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <QMap>
#include <QObject>
#include <QReadWriteLock>
#include <QString>
#include <QStringList>

using json = nlohmann::json;

class QCodeModeGate;

/**
 * @brief Failure categories reported back to the model
 */
enum class QCodeToolErrorKind : std::uint8_t {
    None,
    MalformedToolCall,
    UnknownTool,
    InvalidArguments,
    Timeout,
    IoError,
    NonZeroExit,
    ProcessError,
    LspUnavailable,
    LspSessionLost,
    LspProtocolError,
    Cancelled
};

/**
 * @brief Get the display name of an error kind
 * @param kind Error kind
 * @return Name such as "UnknownTool"
 */
QString qcodeToolErrorKindName(QCodeToolErrorKind kind);

/**
 * @brief Outcome of one tool request
 * @details Exactly one result is produced per request. Content is the payload on
 *          success, the denial reason, or the error message.
 */
struct QCodeToolResult
{
    enum class Outcome : std::uint8_t { Success, Denied, Error };

    QString            callId;
    QString            toolName;
    Outcome            outcome   = Outcome::Success;
    QCodeToolErrorKind errorKind = QCodeToolErrorKind::None;
    QString            content;

    bool isSuccess() const { return outcome == Outcome::Success; }

    /**
     * @brief Render the result as transcript text
     * @return Payload, "PermissionDenied: <reason>" or "Error [<Kind>]: <message>"
     */
    QString toMessageContent() const;

    static QCodeToolResult success(const QString &content);
    static QCodeToolResult denied(const QString &reason);
    static QCodeToolResult error(QCodeToolErrorKind kind, const QString &message);
};

/**
 * @brief Base class for all agent tools
 * @details Abstract base class that defines the interface for tools
 *          that can be called by the QCodeAgent during LLM interactions.
 *          execute() may be called from worker threads; read-only tools must be
 *          safe to run concurrently with each other.
 */
class QCodeTool : public QObject
{
    Q_OBJECT

public:
    explicit QCodeTool(QObject *parent = nullptr);
    ~QCodeTool() override;

    /**
     * @brief Get the tool name
     * @return Tool name used for function calling
     */
    virtual QString getName() const = 0;

    /**
     * @brief Get the tool description
     * @return Human-readable description of what the tool does
     */
    virtual QString getDescription() const = 0;

    /**
     * @brief Get the JSON Schema for tool parameters
     * @return JSON Schema describing the tool's parameters
     */
    virtual json getParametersSchema() const = 0;

    /**
     * @brief Whether the tool has side effects
     * @details Mutating tools are denied in plan mode and run alone during dispatch.
     */
    virtual bool isMutating() const = 0;

    /**
     * @brief Execute the tool with validated arguments
     * @param arguments JSON object matching getParametersSchema()
     * @return Tool result, callId and toolName are filled by the dispatcher
     */
    virtual QCodeToolResult execute(const json &arguments) = 0;

    /**
     * @brief Abort a running execution
     * @details Called from another thread. Subclasses that block must override to
     *          release their wait, and should call the base implementation.
     */
    virtual void abort();

    void resetAbort();
    bool isAborted() const;

    /**
     * @brief Get the tool definition in OpenAI function format
     * @return JSON object in OpenAI tool format
     */
    json getDefinition() const;

protected:
    std::atomic<bool> abortRequested{false};
};

/**
 * @brief Status returned by QCodeToolRegistry::registerTool()
 */
enum class QCodeRegistryStatus : std::uint8_t { Registered, DuplicateTool, InvalidSchema, NullTool };

/**
 * @brief Registry for managing available tools
 * @details Name-keyed table of tools. Lookups take a read lock and may run from any
 *          thread. Tools are registered once and never replaced.
 */
class QCodeToolRegistry : public QObject
{
    Q_OBJECT

public:
    explicit QCodeToolRegistry(QObject *parent = nullptr);
    ~QCodeToolRegistry() override;

    /**
     * @brief Register a tool with the registry
     * @details The registry does not take ownership; use the QObject parent for that.
     * @param tool Tool to register
     * @return Registered, or the reason it was rejected
     */
    QCodeRegistryStatus registerTool(QCodeTool *tool);

    /**
     * @brief Get a tool by name
     * @return Tool, or nullptr if not found
     */
    QCodeTool *getTool(const QString &name) const;

    bool hasTool(const QString &name) const;

    /**
     * @brief Get tool definitions for the LLM
     * @param gate When set, tools denied in its current mode are left out
     * @return JSON array of tool definitions in OpenAI format
     */
    json getToolDefinitions(const QCodeModeGate *gate = nullptr) const;

    int         count() const;
    QStringList toolNames() const;

    /**
     * @brief Abort every registered tool
     */
    void abortAll();

    /**
     * @brief Clear the abort flag of every registered tool
     */
    void resetAbortAll();

    /**
     * @brief Check a parameters schema at registration time
     * @return Empty string if valid, otherwise the problem
     */
    static QString validateSchema(const json &schema);

    /**
     * @brief Check call arguments against a parameters schema
     * @details Checks required properties and primitive property types.
     * @return Empty string if valid, otherwise the first problem found
     */
    static QString validateArguments(const json &schema, const json &arguments);

private:
    mutable QReadWriteLock     lock;
    QMap<QString, QCodeTool *> tools_;
};

#endif // QCODETOOL_H
