// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/qcodetool.h"
#include "agent/qcodemode.h"

#include <cmath>

#include <QDebug>
#include <QReadLocker>
#include <QWriteLocker>

QString qcodeToolErrorKindName(QCodeToolErrorKind kind)
{
    switch (kind) {
    case QCodeToolErrorKind::None:
        return "None";
    case QCodeToolErrorKind::MalformedToolCall:
        return "MalformedToolCall";
    case QCodeToolErrorKind::UnknownTool:
        return "UnknownTool";
    case QCodeToolErrorKind::InvalidArguments:
        return "InvalidArguments";
    case QCodeToolErrorKind::Timeout:
        return "Timeout";
    case QCodeToolErrorKind::IoError:
        return "IoError";
    case QCodeToolErrorKind::NonZeroExit:
        return "NonZeroExit";
    case QCodeToolErrorKind::ProcessError:
        return "ProcessError";
    case QCodeToolErrorKind::LspUnavailable:
        return "LspUnavailable";
    case QCodeToolErrorKind::LspSessionLost:
        return "LspSessionLost";
    case QCodeToolErrorKind::LspProtocolError:
        return "LspProtocolError";
    case QCodeToolErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

/* QCodeToolResult Implementation */

QString QCodeToolResult::toMessageContent() const
{
    switch (outcome) {
    case Outcome::Denied:
        return QString("PermissionDenied: %1").arg(content);
    case Outcome::Error:
        return QString("Error [%1]: %2").arg(qcodeToolErrorKindName(errorKind), content);
    case Outcome::Success:
    default:
        return content;
    }
}

QCodeToolResult QCodeToolResult::success(const QString &content)
{
    QCodeToolResult result;
    result.content = content;
    return result;
}

QCodeToolResult QCodeToolResult::denied(const QString &reason)
{
    QCodeToolResult result;
    result.outcome = Outcome::Denied;
    result.content = reason;
    return result;
}

QCodeToolResult QCodeToolResult::error(QCodeToolErrorKind kind, const QString &message)
{
    QCodeToolResult result;
    result.outcome   = Outcome::Error;
    result.errorKind = kind;
    result.content   = message;
    return result;
}

/* QCodeTool Implementation */

QCodeTool::QCodeTool(QObject *parent)
    : QObject(parent)
{}

QCodeTool::~QCodeTool() = default;

void QCodeTool::abort()
{
    abortRequested = true;
}

void QCodeTool::resetAbort()
{
    abortRequested = false;
}

bool QCodeTool::isAborted() const
{
    return abortRequested.load();
}

json QCodeTool::getDefinition() const
{
    return {
        {"type", "function"},
        {"function",
         {{"name", getName().toStdString()},
          {"description", getDescription().toStdString()},
          {"parameters", getParametersSchema()}}}};
}

/* QCodeToolRegistry Implementation */

QCodeToolRegistry::QCodeToolRegistry(QObject *parent)
    : QObject(parent)
{}

QCodeToolRegistry::~QCodeToolRegistry() = default;

QCodeRegistryStatus QCodeToolRegistry::registerTool(QCodeTool *tool)
{
    if (!tool) {
        return QCodeRegistryStatus::NullTool;
    }

    const QString schemaError = validateSchema(tool->getParametersSchema());
    if (!schemaError.isEmpty()) {
        qWarning() << "Rejected tool" << tool->getName() << ":" << schemaError;
        return QCodeRegistryStatus::InvalidSchema;
    }

    QWriteLocker locker(&lock);
    const QString name = tool->getName();
    if (tools_.contains(name)) {
        qWarning() << "Rejected duplicate tool" << name;
        return QCodeRegistryStatus::DuplicateTool;
    }

    tools_.insert(name, tool);
    return QCodeRegistryStatus::Registered;
}

QCodeTool *QCodeToolRegistry::getTool(const QString &name) const
{
    QReadLocker locker(&lock);
    return tools_.value(name, nullptr);
}

bool QCodeToolRegistry::hasTool(const QString &name) const
{
    QReadLocker locker(&lock);
    return tools_.contains(name);
}

json QCodeToolRegistry::getToolDefinitions(const QCodeModeGate *gate) const
{
    QReadLocker locker(&lock);
    json        definitions = json::array();
    for (auto it = tools_.constBegin(); it != tools_.constEnd(); ++it) {
        if (gate && !gate->check(it.key(), it.value()->isMutating()).allowed) {
            continue;
        }
        definitions.push_back(it.value()->getDefinition());
    }
    return definitions;
}

int QCodeToolRegistry::count() const
{
    QReadLocker locker(&lock);
    return static_cast<int>(tools_.size());
}

QStringList QCodeToolRegistry::toolNames() const
{
    QReadLocker locker(&lock);
    return tools_.keys();
}

void QCodeToolRegistry::abortAll()
{
    QReadLocker locker(&lock);
    for (auto *tool : tools_) {
        tool->abort();
    }
}

void QCodeToolRegistry::resetAbortAll()
{
    QReadLocker locker(&lock);
    for (auto *tool : tools_) {
        tool->resetAbort();
    }
}

QString QCodeToolRegistry::validateSchema(const json &schema)
{
    if (!schema.is_object()) {
        return "schema is not an object";
    }
    if (!schema.contains("type") || schema["type"] != "object") {
        return "schema type must be \"object\"";
    }
    if (!schema.contains("properties") || !schema["properties"].is_object()) {
        return "schema has no properties object";
    }

    if (schema.contains("required")) {
        const json &required = schema["required"];
        if (!required.is_array()) {
            return "required is not an array";
        }
        for (const auto &name : required) {
            if (!name.is_string()) {
                return "required entry is not a string";
            }
            if (!schema["properties"].contains(name.get<std::string>())) {
                return QString("required property '%1' is not declared")
                    .arg(QString::fromStdString(name.get<std::string>()));
            }
        }
    }

    return QString();
}

namespace {

bool matchesType(const std::string &type, const json &value)
{
    if (type == "string") {
        return value.is_string();
    }
    if (type == "integer") {
        if (value.is_number_float()) {
            const double number = value.get<double>();
            return std::isfinite(number) && std::floor(number) == number;
        }
        return value.is_number_integer();
    }
    if (type == "number") {
        return value.is_number();
    }
    if (type == "boolean") {
        return value.is_boolean();
    }
    if (type == "object") {
        return value.is_object();
    }
    if (type == "array") {
        return value.is_array();
    }
    if (type == "null") {
        return value.is_null();
    }
    /* Unknown type keywords are not enforced */
    return true;
}

} // namespace

QString QCodeToolRegistry::validateArguments(const json &schema, const json &arguments)
{
    if (!arguments.is_object()) {
        return "arguments must be a JSON object";
    }

    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto &name : schema["required"]) {
            if (name.is_string() && !arguments.contains(name.get<std::string>())) {
                return QString("missing required parameter '%1'")
                    .arg(QString::fromStdString(name.get<std::string>()));
            }
        }
    }

    if (!schema.contains("properties") || !schema["properties"].is_object()) {
        return QString();
    }

    const json &properties = schema["properties"];
    for (auto it = arguments.begin(); it != arguments.end(); ++it) {
        if (!properties.contains(it.key())) {
            continue;
        }
        const json &property = properties[it.key()];
        if (!property.is_object() || !property.contains("type") || !property["type"].is_string()) {
            continue;
        }
        const std::string type = property["type"].get<std::string>();
        if (!matchesType(type, it.value())) {
            return QString("parameter '%1' must be of type %2")
                .arg(QString::fromStdString(it.key()), QString::fromStdString(type));
        }
    }

    return QString();
}
