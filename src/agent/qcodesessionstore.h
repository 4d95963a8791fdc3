// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODESESSIONSTORE_H
#define QCODESESSIONSTORE_H

#include <nlohmann/json.hpp>
#include <QDateTime>
#include <QList>
#include <QString>

using json = nlohmann::json;

/**
 * @brief One saved conversation on disk
 */
struct QCodeSavedSession
{
    QString   name;
    QString   filePath;
    QDateTime savedAt;
    int       messageCount = -1; /* -1 if the file is not a message array */
};

/**
 * @brief Saved conversations of a project
 * @details Conversations are stored as the JSON message array produced by
 *          QCodeAgent::getMessages(), one file per name in a single directory. A name that
 *          contains a path separator or ends in ".json" is used as a file path instead.
 */
class QCodeSessionStore
{
public:
    /**
     * @brief Constructor
     * @param directory Directory holding <name>.json files, created on first save
     */
    explicit QCodeSessionStore(const QString &directory);

    QString directory() const;

    /**
     * @brief Resolve a session name to a file path
     * @param name Session name or file path
     * @return Absolute file path, empty if the name is empty
     */
    QString pathFor(const QString &name) const;

    /**
     * @brief Write a conversation atomically
     * @param name Session name or file path
     * @param messages Message array
     * @param errorMessage Receives the reason on failure, can be nullptr
     * @return true on success
     */
    bool save(const QString &name, const json &messages, QString *errorMessage = nullptr) const;

    /**
     * @brief Read a conversation
     * @param name Session name or file path
     * @param messages Receives the message array, unchanged on failure
     * @param errorMessage Receives the reason on failure, can be nullptr
     * @return true if the file holds a JSON array
     */
    bool load(const QString &name, json &messages, QString *errorMessage = nullptr) const;

    /**
     * @brief List the saved conversations, newest first
     */
    QList<QCodeSavedSession> list() const;

private:
    QString root;
};

#endif // QCODESESSIONSTORE_H
