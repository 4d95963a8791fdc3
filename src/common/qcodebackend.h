// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QCODEBACKEND_H
#define QCODEBACKEND_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <QString>

using json = nlohmann::json;

/**
 * @brief Classification of one backend round-trip
 */
enum class QCodeBackendStatus : std::uint8_t {
    Ok,        /* Assistant message received */
    Transient, /* Connection failure, timeout or 5xx: worth retrying */
    Fatal,     /* Client error or unusable body: retrying will not help */
    Aborted    /* Cancelled by the operator */
};

/**
 * @brief Result of a single chat completion request
 */
struct QCodeBackendReply
{
    QCodeBackendStatus status = QCodeBackendStatus::Fatal;
    json               message;    /* Assistant message (OpenAI format) when status is Ok */
    QString            errorMessage;
    int                httpStatus = 0;

    bool isOk() const { return status == QCodeBackendStatus::Ok; }
};

/**
 * @brief Inference backend used by the conversation manager
 * @details Transport and authentication are the implementation's concern. The agent only
 *          relies on request/response semantics and on the transient/fatal classification
 *          to drive its retry policy.
 */
class QCodeBackend
{
public:
    virtual ~QCodeBackend() = default;

    /**
     * @brief Send the transcript and tool list, wait for the assistant reply
     * @param messages Conversation in OpenAI chat format
     * @param tools Tool definitions in OpenAI function format
     * @param temperature Sampling temperature
     * @return Classified reply
     */
    virtual QCodeBackendReply complete(const json &messages, const json &tools, double temperature)
        = 0;

    /**
     * @brief Abort the request in flight, if any
     * @details Must be safe to call from any thread.
     */
    virtual void abort() = 0;
};

#endif // QCODEBACKEND_H
