/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "clouddrivetypes.h"

#include <QHash>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>

#include <functional>
#include <optional>

namespace CloudDrive
{
struct Request {
    QByteArray verb = QByteArrayLiteral("GET");
    QNetworkRequest request;
    QByteArray body;
    // Logical remote path, handed to ErrorMapper for diagnostics
    QString path;
};

struct Response {
    QUrl url;
    QString path;
    int httpStatus = 0;
    QNetworkReply::NetworkError networkError = QNetworkReply::NoError;
    QString errorString;
    QByteArray body;
    QList<QNetworkReply::RawHeaderPair> headers;

    QByteArray rawHeader(const QByteArray &name) const;

    static Response fromReply(QNetworkReply *reply, const QString &path = QString());
};

/**
 * Issues @p request on @p network using the verb it names.
 * The caller owns the returned reply.
 */
QNetworkReply *sendRequest(QNetworkAccessManager *network, const Request &request);

/**
 * Classifies a finished response. HTTP error statuses go through
 * @p errorMapper, network failures without a status become TransportFailure.
 * @return The error, or nothing if the response can be parsed.
 */
std::optional<Error> responseError(const Response &response, const ErrorMapper &errorMapper);

/**
 * In-flight requests of one component, keyed by a per-operation identifier.
 *
 * The entry of an operation is removed before its completion runs, so a
 * completion may freely start the next operation or destroy the owner.
 * Destroying the registry aborts whatever is still pending without running
 * any completion.
 */
class NetworkOperations
{
public:
    using Completion = std::function<void(const Response &response)>;

    explicit NetworkOperations(QNetworkAccessManager *network);
    ~NetworkOperations();

    [[nodiscard]] quint64 send(const Request &request, Completion completion);

    /**
     * Drops operation @p id. Its completion never runs.
     */
    void abort(quint64 id);
    void abortAll();

    bool isPending(quint64 id) const;
    int pendingCount() const;

    // nullptr once the network access manager was destroyed
    QNetworkAccessManager *network() const;

private:
    Q_DISABLE_COPY(NetworkOperations)

    static void abortReply(QNetworkReply *reply);

    QPointer<QNetworkAccessManager> m_network;
    quint64 m_nextId = 1;
    QHash<quint64, QPointer<QNetworkReply>> m_replies;
};
}
