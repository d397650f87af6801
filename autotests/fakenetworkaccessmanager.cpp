/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fakenetworkaccessmanager.h"

#include <QDebug>
#include <QTimer>

#include <cstring>
#include <utility>

FakeResponse FakeResponse::json(int httpStatus, const QByteArray &body)
{
    FakeResponse response;
    response.httpStatus = httpStatus;
    response.body = body;
    response.headers.append(qMakePair(QByteArrayLiteral("Content-Type"), QByteArrayLiteral("application/json")));
    return response;
}

FakeResponse FakeResponse::held()
{
    FakeResponse response;
    response.hold = true;
    return response;
}

FakeResponse FakeResponse::networkFailure(QNetworkReply::NetworkError error)
{
    FakeResponse response;
    response.httpStatus = 0;
    response.error = error;
    return response;
}

FakeReply::FakeReply(const QNetworkRequest &request, const FakeResponse &response, const std::function<void()> &onAbort, QObject *parent)
    : QNetworkReply(parent)
    , m_response(response)
    , m_onAbort(onAbort)
{
    setRequest(request);
    setUrl(request.url());
    if (m_response.httpStatus > 0) {
        setAttribute(QNetworkRequest::HttpStatusCodeAttribute, m_response.httpStatus);
    }
    for (const auto &header : std::as_const(m_response.headers)) {
        setRawHeader(header.first, header.second);
    }
    open(QIODevice::ReadOnly | QIODevice::Unbuffered);

    if (!m_response.hold) {
        QTimer::singleShot(0, this, &FakeReply::finishReply);
    }
}

void FakeReply::abort()
{
    if (m_done) {
        return;
    }
    m_done = true;
    m_response.body.clear();

    setError(QNetworkReply::OperationCanceledError, QStringLiteral("Operation canceled"));
    setFinished(true);
    if (m_onAbort) {
        m_onAbort();
    }
    Q_EMIT errorOccurred(QNetworkReply::OperationCanceledError);
    Q_EMIT finished();
}

qint64 FakeReply::bytesAvailable() const
{
    return m_response.body.size() - m_offset + QNetworkReply::bytesAvailable();
}

bool FakeReply::isSequential() const
{
    return true;
}

qint64 FakeReply::readData(char *data, qint64 maxSize)
{
    const qint64 available = m_response.body.size() - m_offset;
    if (available <= 0) {
        return -1;
    }
    const qint64 count = qMin(maxSize, available);
    std::memcpy(data, m_response.body.constData() + m_offset, static_cast<size_t>(count));
    m_offset += count;
    return count;
}

void FakeReply::finishReply()
{
    if (m_done) {
        return;
    }
    m_done = true;

    if (m_response.error != QNetworkReply::NoError) {
        setError(m_response.error, QStringLiteral("Scripted network error %1").arg(static_cast<int>(m_response.error)));
        Q_EMIT errorOccurred(m_response.error);
    } else if (m_response.httpStatus >= 400) {
        // What QNetworkAccessManager reports for HTTP error statuses
        setError(QNetworkReply::UnknownContentError, QStringLiteral("HTTP status %1").arg(m_response.httpStatus));
        Q_EMIT errorOccurred(QNetworkReply::UnknownContentError);
    }

    setFinished(true);
    Q_EMIT metaDataChanged();
    Q_EMIT readyRead();
    Q_EMIT finished();
}

FakeNetworkAccessManager::FakeNetworkAccessManager(QObject *parent)
    : QNetworkAccessManager(parent)
{
}

void FakeNetworkAccessManager::enqueue(const FakeResponse &response)
{
    m_queue.enqueue(response);
}

void FakeNetworkAccessManager::setHandler(const Handler &handler)
{
    m_handler = handler;
}

QList<RecordedRequest> FakeNetworkAccessManager::requests() const
{
    return m_requests;
}

QList<RecordedRequest> FakeNetworkAccessManager::requests(const QByteArray &verb) const
{
    QList<RecordedRequest> matching;
    for (const RecordedRequest &request : m_requests) {
        if (request.verb == verb) {
            matching.append(request);
        }
    }
    return matching;
}

int FakeNetworkAccessManager::requestCount() const
{
    return static_cast<int>(m_requests.size());
}

int FakeNetworkAccessManager::abortedCount() const
{
    return m_abortedCount;
}

QNetworkReply *FakeNetworkAccessManager::createRequest(Operation op, const QNetworkRequest &request, QIODevice *outgoingData)
{
    RecordedRequest recorded;
    recorded.verb = verbFor(op, request);
    recorded.url = request.url();
    recorded.request = request;
    if (outgoingData) {
        recorded.body = outgoingData->readAll();
    }
    m_requests.append(recorded);

    FakeResponse response;
    if (m_handler) {
        response = m_handler(recorded);
    } else if (!m_queue.isEmpty()) {
        response = m_queue.dequeue();
    } else {
        qWarning() << "Unscripted request" << recorded.verb << recorded.url;
        response = FakeResponse::json(500, QByteArrayLiteral("{\"error\":{\"code\":\"unscripted\",\"message\":\"No scripted reply\"}}"));
    }

    return new FakeReply(
        request,
        response,
        [this]() {
            ++m_abortedCount;
        },
        this);
}

QByteArray FakeNetworkAccessManager::verbFor(Operation op, const QNetworkRequest &request)
{
    switch (op) {
    case HeadOperation:
        return QByteArrayLiteral("HEAD");
    case GetOperation:
        return QByteArrayLiteral("GET");
    case PutOperation:
        return QByteArrayLiteral("PUT");
    case PostOperation:
        return QByteArrayLiteral("POST");
    case DeleteOperation:
        return QByteArrayLiteral("DELETE");
    case CustomOperation:
        return request.attribute(QNetworkRequest::CustomVerbAttribute).toByteArray();
    case UnknownOperation:
        break;
    }
    return QByteArray();
}
