// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODELSPFRAMING_H
#define QCODELSPFRAMING_H

#include <nlohmann/json.hpp>
#include <QByteArray>
#include <QList>
#include <QString>

using json = nlohmann::json;

/**
 * @brief Content-Length framing used by the language server protocol
 */
class QCodeLspFraming
{
public:
    /**
     * @brief Frame a message
     * @return "Content-Length: N\r\n\r\n" followed by the UTF-8 body
     */
    static QByteArray encode(const json &message);
};

/**
 * @brief Incremental decoder for a Content-Length framed stream
 * @details Bytes may arrive in arbitrary chunks. Extra headers are ignored and any
 *          text before a header (server log lines) is skipped.
 */
class QCodeLspFrameDecoder
{
public:
    /**
     * @brief Append received bytes and decode every complete frame
     */
    void feed(const QByteArray &bytes);

    /**
     * @brief Take the decoded messages, oldest first
     */
    QList<json> takeMessages();

    /**
     * @brief Whether a frame was malformed since the last clearError()
     */
    bool    hasError() const;
    QString errorString() const;
    void    clearError();

    /**
     * @brief Bytes buffered but not yet decoded
     */
    int bufferedSize() const;

    void reset();

private:
    QByteArray  buffer;
    QList<json> messages;
    bool        error = false;
    QString     errorText;

    bool decodeOne();
    void setError(const QString &text);
};

#endif // QCODELSPFRAMING_H
