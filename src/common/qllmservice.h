// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QLLMSERVICE_H
#define QLLMSERVICE_H

#include "common/qcodebackend.h"
#include "common/qcodeconfig.h"

#include <atomic>
#include <nlohmann/json.hpp>
#include <QList>
#include <QMutex>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QUrl>

using json = nlohmann::json;

/**
 * @brief LLM endpoint configuration
 * @details Holds configuration for a single LLM API endpoint
 */
struct LLMEndpoint
{
    QString name;             /* Endpoint name for identification */
    QUrl    url;              /* API endpoint URL */
    QString key;              /* API key (optional for local services) */
    QString model;            /* Model name to use */
    int     timeout = 300000; /* Request timeout in milliseconds */
};

/**
 * @brief Fallback strategy for multiple endpoints
 */
enum class LLMFallbackStrategy : std::uint8_t {
    Sequential, /* Try endpoints in order */
    Random,     /* Try endpoints in random order */
    RoundRobin  /* Rotate through endpoints */
};

/**
 * @brief The QLLMService class talks to the local inference backend
 * @details Uses the OpenAI Chat Completions format, which Ollama, llama.cpp server and
 *          vLLM all expose. Each call is synchronous from the caller's point of view and
 *          runs a local event loop while the request is in flight. Failures are classified
 *          so the agent can decide whether to retry.
 */
class QLLMService : public QObject, public QCodeBackend
{
    Q_OBJECT

public:
    /**
     * @brief Constructor for QLLMService
     * @param parent Parent object
     * @param config Configuration manager, can be nullptr
     */
    explicit QLLMService(QObject *parent = nullptr, QCodeConfig *config = nullptr);

    /**
     * @brief Destructor for QLLMService
     */
    ~QLLMService() override;

    /**
     * @brief Set the configuration manager
     * @param config Configuration manager, can be nullptr
     */
    void setConfig(QCodeConfig *config);

    /**
     * @brief Get the configuration manager
     * @return Pointer to the current configuration manager
     */
    QCodeConfig *getConfig();

    /* Endpoint management */

    void addEndpoint(const LLMEndpoint &endpoint);
    void clearEndpoints();
    int  endpointCount() const;
    bool hasEndpoint() const;
    void setFallbackStrategy(LLMFallbackStrategy strategy);

    /**
     * @brief Override the model for every endpoint
     * @param model Model name, empty to go back to each endpoint's configured model
     */
    void setModel(const QString &model);

    /**
     * @brief Get the model the next request will use
     * @return The override if set, otherwise the model of the first endpoint
     */
    QString model() const;

    /**
     * @brief Send chat completion with tool definitions
     * @details Tries each configured endpoint once according to the fallback strategy.
     *          The first successful reply wins. If every endpoint fails, the classification
     *          of the last failure is returned.
     * @param messages Conversation history in OpenAI format
     * @param tools Tool definitions in OpenAI format (optional)
     * @param temperature Temperature parameter (0.0-1.0)
     * @return Classified reply carrying the assistant message on success
     */
    QCodeBackendReply complete(
        const json &messages, const json &tools, double temperature) override;

    /**
     * @brief Abort the request in flight
     * @details Thread-safe. The pending complete() call returns with status Aborted.
     */
    void abort() override;

    /**
     * @brief Classify a network failure
     * @param error Error reported by QNetworkReply
     * @param httpStatus HTTP status code, 0 if none was received
     * @return Transient for connection, timeout and 5xx failures, Fatal otherwise
     */
    static QCodeBackendStatus classifyError(QNetworkReply::NetworkError error, int httpStatus);

private:
    QNetworkAccessManager *networkManager = nullptr;
    QCodeConfig           *config         = nullptr;
    QList<LLMEndpoint>     endpoints;
    int                    currentEndpoint  = 0;
    LLMFallbackStrategy    fallbackStrategy = LLMFallbackStrategy::Sequential;
    QString                modelOverride;

    /* In-flight request, aborted by abort() */
    QPointer<QNetworkReply> currentReply;
    QMutex                  replyMutex;
    std::atomic<bool>       abortRequested{false};

    void loadConfigSettings();
    void setupNetworkProxy();

    LLMEndpoint selectEndpoint();
    void        advanceEndpoint();

    QNetworkRequest prepareRequest(const LLMEndpoint &endpoint) const;

    /**
     * @brief Build the request payload (OpenAI Chat Completions format)
     */
    json buildRequestPayload(
        const json &messages, const json &tools, double temperature, const QString &model) const;

    /**
     * @brief Send one request to one endpoint and wait for it
     */
    QCodeBackendReply sendToEndpoint(const LLMEndpoint &endpoint, const json &payload);

    /**
     * @brief Extract the assistant message from a completed reply body
     */
    static QCodeBackendReply parseResponseBody(const QByteArray &body);
};

#endif // QLLMSERVICE_H
