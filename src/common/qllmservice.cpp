// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "common/qllmservice.h"

#include <QDebug>
#include <QEventLoop>
#include <QMutexLocker>
#include <QNetworkProxy>
#include <QNetworkProxyFactory>
#include <QNetworkRequest>
#include <QRandomGenerator>
#include <QTimer>

QLLMService::QLLMService(QObject *parent, QCodeConfig *config)
    : QObject(parent)
    , networkManager(new QNetworkAccessManager(this))
    , config(config)
{
    loadConfigSettings();
    setupNetworkProxy();
}

QLLMService::~QLLMService() = default;

void QLLMService::setConfig(QCodeConfig *config)
{
    this->config = config;
    loadConfigSettings();
    setupNetworkProxy();
}

QCodeConfig *QLLMService::getConfig()
{
    return config;
}

/* Endpoint management */

void QLLMService::addEndpoint(const LLMEndpoint &endpoint)
{
    endpoints.append(endpoint);
}

void QLLMService::clearEndpoints()
{
    endpoints.clear();
    currentEndpoint = 0;
}

int QLLMService::endpointCount() const
{
    return static_cast<int>(endpoints.size());
}

bool QLLMService::hasEndpoint() const
{
    return !endpoints.isEmpty();
}

void QLLMService::setFallbackStrategy(LLMFallbackStrategy strategy)
{
    fallbackStrategy = strategy;
}

void QLLMService::setModel(const QString &model)
{
    modelOverride = model.trimmed();
}

QString QLLMService::model() const
{
    if (!modelOverride.isEmpty()) {
        return modelOverride;
    }
    return endpoints.isEmpty() ? QString() : endpoints.first().model;
}

/* Requests */

QCodeBackendReply QLLMService::complete(const json &messages, const json &tools, double temperature)
{
    abortRequested = false;

    if (!hasEndpoint()) {
        QCodeBackendReply reply;
        reply.status       = QCodeBackendStatus::Fatal;
        reply.errorMessage = "No LLM endpoint configured";
        return reply;
    }

    QCodeBackendReply lastReply;
    const int         maxAttempts = static_cast<int>(endpoints.size());
    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        LLMEndpoint endpoint = selectEndpoint();
        json        payload  = buildRequestPayload(
            messages, tools, temperature, modelOverride.isEmpty() ? endpoint.model : modelOverride);

        lastReply = sendToEndpoint(endpoint, payload);
        if (lastReply.isOk() || lastReply.status == QCodeBackendStatus::Aborted) {
            return lastReply;
        }

        qWarning() << "Endpoint" << endpoint.name << "failed:" << lastReply.errorMessage;
        advanceEndpoint();
    }

    return lastReply;
}

void QLLMService::abort()
{
    abortRequested = true;

    /* The reply lives on this object's thread, so abort it there */
    QMetaObject::invokeMethod(
        this,
        [this]() {
            QMutexLocker locker(&replyMutex);
            if (currentReply) {
                currentReply->abort();
            }
        },
        Qt::QueuedConnection);
}

QCodeBackendStatus QLLMService::classifyError(QNetworkReply::NetworkError error, int httpStatus)
{
    if (httpStatus >= 500 && httpStatus < 600) {
        return QCodeBackendStatus::Transient;
    }
    if (httpStatus >= 400 && httpStatus < 500) {
        return QCodeBackendStatus::Fatal;
    }

    switch (error) {
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::TimeoutError:
    case QNetworkReply::OperationCanceledError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::UnknownNetworkError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyConnectionClosedError:
    case QNetworkReply::ProxyTimeoutError:
    case QNetworkReply::InternalServerError:
    case QNetworkReply::ServiceUnavailableError:
    case QNetworkReply::UnknownServerError:
        return QCodeBackendStatus::Transient;
    default:
        return QCodeBackendStatus::Fatal;
    }
}

/* Private methods */

void QLLMService::loadConfigSettings()
{
    endpoints.clear();
    currentEndpoint = 0;

    if (!config) {
        return;
    }

    /* Load from llm.url, llm.key, llm.model */
    QString url   = config->getValue("llm.url", "http://localhost:11434/v1/chat/completions");
    QString key   = config->getValue("llm.key");
    QString model = config->getValue("llm.model");

    if (!url.isEmpty()) {
        LLMEndpoint endpoint;
        endpoint.name  = "primary";
        endpoint.url   = QUrl(url);
        endpoint.key   = key;
        endpoint.model = model;

        QString timeoutStr = config->getValue("llm.timeout");
        if (!timeoutStr.isEmpty()) {
            bool ok      = false;
            int  timeout = timeoutStr.toInt(&ok);
            if (ok && timeout > 0) {
                endpoint.timeout = timeout;
            }
        }

        endpoints.append(endpoint);
    }

    /* Optional secondary endpoint for fallback */
    QString fallbackUrl = config->getValue("llm.fallback_url");
    if (!fallbackUrl.isEmpty()) {
        LLMEndpoint endpoint;
        endpoint.name    = "fallback";
        endpoint.url     = QUrl(fallbackUrl);
        endpoint.key     = config->getValue("llm.fallback_key", key);
        endpoint.model   = config->getValue("llm.fallback_model", model);
        endpoint.timeout = endpoints.isEmpty() ? endpoint.timeout : endpoints.first().timeout;
        endpoints.append(endpoint);
    }

    QString fallbackStr = config->getValue("llm.fallback", "sequential").toLower();
    if (fallbackStr == "random") {
        fallbackStrategy = LLMFallbackStrategy::Random;
    } else if (fallbackStr == "round-robin" || fallbackStr == "roundrobin") {
        fallbackStrategy = LLMFallbackStrategy::RoundRobin;
    } else {
        fallbackStrategy = LLMFallbackStrategy::Sequential;
    }
}

void QLLMService::setupNetworkProxy()
{
    if (!networkManager) {
        return;
    }

    /* Local inference servers are reached directly unless configured otherwise */
    QString proxyType = config ? config->getValue("proxy.type", "none").toLower() : "none";

    QNetworkProxy proxy;

    if (proxyType == "socks5" || proxyType == "http") {
        const bool socks = proxyType == "socks5";
        proxy.setType(socks ? QNetworkProxy::Socks5Proxy : QNetworkProxy::HttpProxy);
        proxy.setHostName(config->getValue("proxy.host", "127.0.0.1"));
        proxy.setPort(config->getValue("proxy.port", socks ? "1080" : "8080").toUShort());

        QString user = config->getValue("proxy.user");
        if (!user.isEmpty()) {
            proxy.setUser(user);
            proxy.setPassword(config->getValue("proxy.password"));
        }
    } else if (proxyType == "system") {
        QNetworkProxyFactory::setUseSystemConfiguration(true);
        networkManager->setProxy(QNetworkProxy::DefaultProxy);
        return;
    } else {
        proxy.setType(QNetworkProxy::NoProxy);
    }

    networkManager->setProxy(proxy);
}

LLMEndpoint QLLMService::selectEndpoint()
{
    if (endpoints.isEmpty()) {
        return {};
    }

    switch (fallbackStrategy) {
    case LLMFallbackStrategy::Random: {
        auto index = QRandomGenerator::global()->bounded(static_cast<int>(endpoints.size()));
        return endpoints.at(index);
    }
    case LLMFallbackStrategy::RoundRobin:
    case LLMFallbackStrategy::Sequential:
    default:
        return endpoints.at(currentEndpoint % endpoints.size());
    }
}

void QLLMService::advanceEndpoint()
{
    if (!endpoints.isEmpty()) {
        currentEndpoint = (currentEndpoint + 1) % static_cast<int>(endpoints.size());
    }
}

QNetworkRequest QLLMService::prepareRequest(const LLMEndpoint &endpoint) const
{
    QNetworkRequest request(endpoint.url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    if (!endpoint.key.isEmpty()) {
        request.setRawHeader("Authorization", ("Bearer " + endpoint.key).toUtf8());
    }

    return request;
}

json QLLMService::buildRequestPayload(
    const json &messages, const json &tools, double temperature, const QString &model) const
{
    json payload;
    payload["messages"]    = messages;
    payload["temperature"] = temperature;
    payload["stream"]      = false;

    if (!model.isEmpty()) {
        payload["model"] = model.toStdString();
    }

    if (tools.is_array() && !tools.empty()) {
        payload["tools"] = tools;
    }

    return payload;
}

QCodeBackendReply QLLMService::sendToEndpoint(const LLMEndpoint &endpoint, const json &payload)
{
    QNetworkRequest request = prepareRequest(endpoint);

    QEventLoop     loop;
    QNetworkReply *reply = networkManager->post(request, QByteArray::fromStdString(payload.dump()));
    {
        QMutexLocker locker(&replyMutex);
        currentReply = reply;
    }

    /* abort() may have been called before the reply existed */
    if (abortRequested) {
        reply->abort();
    }

    bool   timedOut = false;
    QTimer timer;
    timer.setSingleShot(true);
    connect(&timer, &QTimer::timeout, reply, [reply, &timedOut]() {
        timedOut = true;
        reply->abort();
    });
    timer.start(endpoint.timeout);

    connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }

    timer.stop();
    {
        QMutexLocker locker(&replyMutex);
        currentReply = nullptr;
    }

    QCodeBackendReply result;
    result.httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

    if (abortRequested && !timedOut) {
        result.status       = QCodeBackendStatus::Aborted;
        result.errorMessage = "Request aborted";
        reply->deleteLater();
        return result;
    }

    if (reply->error() != QNetworkReply::NoError) {
        QNetworkReply::NetworkError error = timedOut ? QNetworkReply::TimeoutError
                                                     : reply->error();
        result.status       = classifyError(error, result.httpStatus);
        result.errorMessage = timedOut ? QString("Request timeout after %1 ms").arg(endpoint.timeout)
                                       : reply->errorString();
        qWarning() << "LLM API request failed:" << result.errorMessage;
        reply->deleteLater();
        return result;
    }

    const QByteArray body = reply->readAll();
    reply->deleteLater();

    result            = parseResponseBody(body);
    result.httpStatus = result.httpStatus == 0 ? 200 : result.httpStatus;
    return result;
}

QCodeBackendReply QLLMService::parseResponseBody(const QByteArray &body)
{
    QCodeBackendReply result;

    try {
        json response = json::parse(body.toStdString());

        if (response.contains("error")) {
            result.status       = QCodeBackendStatus::Fatal;
            result.errorMessage = QString::fromStdString(
                response["error"].is_string() ? response["error"].get<std::string>()
                                              : response["error"].dump());
            return result;
        }

        if (!response.contains("choices") || !response["choices"].is_array()
            || response["choices"].empty() || !response["choices"][0].contains("message")) {
            result.status       = QCodeBackendStatus::Fatal;
            result.errorMessage = "Invalid response from LLM: no choices";
            return result;
        }

        result.status  = QCodeBackendStatus::Ok;
        result.message = response["choices"][0]["message"];
    } catch (const json::parse_error &e) {
        result.status       = QCodeBackendStatus::Fatal;
        result.errorMessage = QString("JSON parse error: %1").arg(e.what());
        qWarning() << "JSON parse error:" << e.what();
    }

    return result;
}
