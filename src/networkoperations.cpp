/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "networkoperations.h"
#include "clouddrivedebug.h"

#include <QNetworkAccessManager>

#include <utility>

using namespace CloudDrive;

QByteArray Response::rawHeader(const QByteArray &name) const
{
    for (const auto &header : headers) {
        if (header.first.compare(name, Qt::CaseInsensitive) == 0) {
            return header.second;
        }
    }
    return QByteArray();
}

Response Response::fromReply(QNetworkReply *reply, const QString &path)
{
    Response response;
    response.url = reply->url();
    response.path = path;
    response.httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.networkError = reply->error();
    if (response.networkError != QNetworkReply::NoError) {
        response.errorString = reply->errorString();
    }
    response.headers = reply->rawHeaderPairs();
    response.body = reply->readAll();
    return response;
}

QNetworkReply *CloudDrive::sendRequest(QNetworkAccessManager *network, const Request &request)
{
    const QByteArray verb = request.verb.toUpper();
    if (verb == "GET") {
        return network->get(request.request);
    }
    if (verb == "POST") {
        return network->post(request.request, request.body);
    }
    if (verb == "PUT") {
        return network->put(request.request, request.body);
    }
    if (verb == "DELETE" && request.body.isEmpty()) {
        return network->deleteResource(request.request);
    }
    return network->sendCustomRequest(request.request, verb, request.body);
}

std::optional<Error> CloudDrive::responseError(const Response &response, const ErrorMapper &errorMapper)
{
    if (response.httpStatus >= 400) {
        Error error;
        if (errorMapper) {
            error = errorMapper(response.httpStatus, response.body, response.path);
        }
        if (!error.isError()) {
            error.kind = Error::ProviderReportedError;
        }
        if (error.httpStatus == 0) {
            error.httpStatus = response.httpStatus;
        }
        if (error.errorMessage.isEmpty()) {
            error.errorMessage = response.errorString.isEmpty() ? QString::fromUtf8(response.body) : response.errorString;
        }
        if (error.path.isEmpty()) {
            error.path = response.path;
        }
        error.url = response.url;
        qCWarning(CLOUDDRIVE) << "Request failed" << response.url << response.httpStatus << error.errorMessage
                              << "requestId:" << QString::fromUtf8(response.rawHeader(QByteArrayLiteral("request-id")));
        return error;
    }

    if (response.networkError != QNetworkReply::NoError) {
        Error error(Error::TransportFailure, response.errorString, response.httpStatus);
        error.path = response.path;
        error.url = response.url;
        qCWarning(CLOUDDRIVE) << "Transport failure" << response.url << response.networkError << response.errorString;
        return error;
    }

    return std::nullopt;
}

NetworkOperations::NetworkOperations(QNetworkAccessManager *network)
    : m_network(network)
{
}

NetworkOperations::~NetworkOperations()
{
    abortAll();
}

quint64 NetworkOperations::send(const Request &request, Completion completion)
{
    const quint64 id = m_nextId++;
    QNetworkReply *reply = sendRequest(m_network, request);
    m_replies.insert(id, reply);

    const QString path = request.path;
    QObject::connect(reply, &QNetworkReply::finished, reply, [this, id, reply, path, completion]() {
        if (!m_replies.remove(id)) {
            return;
        }
        const Response response = Response::fromReply(reply, path);
        reply->deleteLater();
        completion(response);
    });

    return id;
}

void NetworkOperations::abort(quint64 id)
{
    const QPointer<QNetworkReply> reply = m_replies.take(id);
    abortReply(reply);
}

void NetworkOperations::abortAll()
{
    // abort() emits finished() synchronously, so empty the table first
    const auto replies = std::exchange(m_replies, {});
    for (const auto &reply : replies) {
        abortReply(reply);
    }
}

bool NetworkOperations::isPending(quint64 id) const
{
    return m_replies.contains(id);
}

int NetworkOperations::pendingCount() const
{
    return static_cast<int>(m_replies.size());
}

QNetworkAccessManager *NetworkOperations::network() const
{
    return m_network.data();
}

void NetworkOperations::abortReply(QNetworkReply *reply)
{
    if (!reply) {
        return;
    }
    qCDebug(CLOUDDRIVE) << "Aborting" << reply->url();
    reply->disconnect();
    reply->abort();
    reply->deleteLater();
}
