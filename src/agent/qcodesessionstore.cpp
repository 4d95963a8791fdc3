// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "agent/qcodesessionstore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace {

void setError(QString *errorMessage, const QString &text)
{
    if (errorMessage) {
        *errorMessage = text;
    }
}

} // namespace

QCodeSessionStore::QCodeSessionStore(const QString &directory)
    : root(QDir(directory).absolutePath())
{}

QString QCodeSessionStore::directory() const
{
    return root;
}

QString QCodeSessionStore::pathFor(const QString &name) const
{
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty()) {
        return QString();
    }
    if (trimmed.contains('/') || trimmed.endsWith(".json", Qt::CaseInsensitive)) {
        return QFileInfo(trimmed).absoluteFilePath();
    }
    return QDir(root).filePath(trimmed + ".json");
}

bool QCodeSessionStore::save(const QString &name, const json &messages, QString *errorMessage) const
{
    const QString path = pathFor(name);
    if (path.isEmpty()) {
        setError(errorMessage, "session name is empty");
        return false;
    }
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        setError(errorMessage, QString("cannot create %1").arg(QFileInfo(path).absolutePath()));
        return false;
    }

    QSaveFile        file(path);
    const QByteArray data = QByteArray::fromStdString(messages.dump(2));
    if (!file.open(QIODevice::WriteOnly) || file.write(data) != data.size() || !file.commit()) {
        setError(errorMessage, QString("cannot write %1: %2").arg(path, file.errorString()));
        return false;
    }
    return true;
}

bool QCodeSessionStore::load(const QString &name, json &messages, QString *errorMessage) const
{
    const QString path = pathFor(name);
    if (path.isEmpty()) {
        setError(errorMessage, "session name is empty");
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorMessage, QString("cannot read %1: %2").arg(path, file.errorString()));
        return false;
    }

    json data;
    try {
        data = json::parse(file.readAll().toStdString());
    } catch (const json::parse_error &e) {
        setError(errorMessage, QString("%1 is not valid JSON: %2").arg(path, e.what()));
        return false;
    }
    if (!data.is_array()) {
        setError(errorMessage, QString("%1 is not a saved conversation").arg(path));
        return false;
    }

    messages = data;
    return true;
}

QList<QCodeSavedSession> QCodeSessionStore::list() const
{
    QList<QCodeSavedSession> sessions;

    const QFileInfoList files
        = QDir(root).entryInfoList({"*.json"}, QDir::Files | QDir::Readable, QDir::Time);
    for (const QFileInfo &info : files) {
        QCodeSavedSession session;
        session.name     = info.completeBaseName();
        session.filePath = info.absoluteFilePath();
        session.savedAt  = info.lastModified();

        QFile file(info.absoluteFilePath());
        if (file.open(QIODevice::ReadOnly)) {
            const json data = json::parse(file.readAll().toStdString(), nullptr, false);
            if (data.is_array()) {
                session.messageCount = static_cast<int>(data.size());
            }
        } else {
            qWarning() << "Cannot read saved session" << info.absoluteFilePath();
        }
        sessions.append(session);
    }
    return sessions;
}
