// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/lsp/qcodelspframing.h"

#include <QDebug>

namespace {

const QByteArray kContentLength = "content-length:";
const QByteArray kHeaderEnd     = "\r\n\r\n";

} // namespace

QByteArray QCodeLspFraming::encode(const json &message)
{
    const QByteArray body = QByteArray::fromStdString(message.dump());
    return "Content-Length: " + QByteArray::number(body.size()) + "\r\n\r\n" + body;
}

void QCodeLspFrameDecoder::feed(const QByteArray &bytes)
{
    buffer.append(bytes);
    while (decodeOne()) {
    }
}

QList<json> QCodeLspFrameDecoder::takeMessages()
{
    QList<json> result;
    result.swap(messages);
    return result;
}

bool QCodeLspFrameDecoder::hasError() const
{
    return error;
}

QString QCodeLspFrameDecoder::errorString() const
{
    return errorText;
}

void QCodeLspFrameDecoder::clearError()
{
    error = false;
    errorText.clear();
}

int QCodeLspFrameDecoder::bufferedSize() const
{
    return static_cast<int>(buffer.size());
}

void QCodeLspFrameDecoder::reset()
{
    buffer.clear();
    messages.clear();
    clearError();
}

void QCodeLspFrameDecoder::setError(const QString &text)
{
    error     = true;
    errorText = text;
    qWarning() << "LSP framing error:" << text;
}

bool QCodeLspFrameDecoder::decodeOne()
{
    const QByteArray lower = buffer.toLower();
    const int        start = static_cast<int>(lower.indexOf(kContentLength));

    if (start < 0) {
        /* Drop complete lines that cannot start a header, keep a possible partial one */
        const int lastNewline = static_cast<int>(buffer.lastIndexOf('\n'));
        if (lastNewline >= 0) {
            buffer.remove(0, lastNewline + 1);
        }
        return false;
    }

    if (start > 0) {
        buffer.remove(0, start);
        return true;
    }

    const int headerEnd = static_cast<int>(buffer.indexOf(kHeaderEnd));
    if (headerEnd < 0) {
        return false;
    }

    int                     length  = -1;
    const QList<QByteArray> headers = buffer.left(headerEnd).split('\n');
    for (const QByteArray &rawLine : headers) {
        const QByteArray line = rawLine.trimmed();
        if (line.toLower().startsWith(kContentLength)) {
            bool ok = false;
            length  = line.mid(kContentLength.size()).trimmed().toInt(&ok);
            if (!ok) {
                length = -1;
            }
        }
    }

    if (length < 0) {
        setError("invalid Content-Length header");
        buffer.remove(0, headerEnd + kHeaderEnd.size());
        return true;
    }

    const int bodyStart = headerEnd + static_cast<int>(kHeaderEnd.size());
    if (buffer.size() < bodyStart + length) {
        return false;
    }

    const QByteArray body = buffer.mid(bodyStart, length);
    buffer.remove(0, bodyStart + length);

    try {
        messages.append(json::parse(body.toStdString()));
    } catch (const json::parse_error &e) {
        setError(QString("message body is not JSON: %1").arg(e.what()));
    }

    return true;
}
