// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODEMODE_H
#define QCODEMODE_H

#include <atomic>
#include <cstdint>
#include <QObject>
#include <QString>

/**
 * @brief Agent operating mode
 */
enum class QCodeMode : std::uint8_t {
    Plan,   /* Read-only: mutating tools are denied */
    Execute /* All tools are allowed */
};

/**
 * @brief Get the lowercase name of a mode
 * @param mode Mode value
 * @return "plan" or "execute"
 */
QString qcodeModeName(QCodeMode mode);

/**
 * @brief Parse a mode name
 * @details Accepts "plan", "execute" and "exec", case-insensitive.
 * @param text Mode name
 * @param ok Set to false when the text is not a mode name
 * @return Parsed mode, Execute on failure
 */
QCodeMode qcodeParseMode(const QString &text, bool *ok = nullptr);

/**
 * @brief Result of a permission check
 */
struct QCodePermission
{
    bool    allowed = true;
    QString reason; /* Set when denied */
};

/**
 * @brief Shared mode cell consulted before every tool execution
 * @details The mode is stored atomically. Any thread may read or change it at any time,
 *          and each check() sees the latest value.
 */
class QCodeModeGate : public QObject
{
    Q_OBJECT

public:
    explicit QCodeModeGate(QObject *parent = nullptr, QCodeMode initialMode = QCodeMode::Execute);
    ~QCodeModeGate() override;

    QCodeMode mode() const;

    /**
     * @brief Set the current mode
     * @details Emits modeChanged() only when the mode actually changes.
     * @param mode New mode
     */
    void setMode(QCodeMode mode);

    /**
     * @brief Switch between plan and execute
     * @return The new mode
     */
    QCodeMode toggle();

    /**
     * @brief Decide whether a tool may run in the current mode
     * @param toolName Tool name, used in the denial reason
     * @param mutating Whether the tool has side effects
     * @return Permission with a reason when denied
     */
    QCodePermission check(const QString &toolName, bool mutating) const;

signals:
    void modeChanged(QCodeMode mode);

private:
    std::atomic<QCodeMode> currentMode;
};

#endif // QCODEMODE_H
