/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QList>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPair>
#include <QQueue>

#include <functional>

struct FakeResponse {
    int httpStatus = 200;
    QByteArray body;
    QNetworkReply::NetworkError error = QNetworkReply::NoError;
    QList<QPair<QByteArray, QByteArray>> headers;
    // Never finishes on its own, only through abort()
    bool hold = false;

    static FakeResponse json(int httpStatus, const QByteArray &body);
    static FakeResponse held();
    static FakeResponse networkFailure(QNetworkReply::NetworkError error = QNetworkReply::HostNotFoundError);
};

struct RecordedRequest {
    QByteArray verb;
    QUrl url;
    QNetworkRequest request;
    QByteArray body;
};

class FakeReply : public QNetworkReply
{
    Q_OBJECT
public:
    FakeReply(const QNetworkRequest &request, const FakeResponse &response, const std::function<void()> &onAbort, QObject *parent);

    void abort() override;
    qint64 bytesAvailable() const override;
    bool isSequential() const override;

protected:
    qint64 readData(char *data, qint64 maxSize) override;

private:
    void finishReply();

    FakeResponse m_response;
    // Called directly, since the code under test disconnects aborted replies
    std::function<void()> m_onAbort;
    qint64 m_offset = 0;
    bool m_done = false;
};

/**
 * Serves scripted replies instead of touching the network. Replies come from
 * the handler if one is set, otherwise from the queue in FIFO order. Every
 * request is recorded.
 */
class FakeNetworkAccessManager : public QNetworkAccessManager
{
    Q_OBJECT
public:
    using Handler = std::function<FakeResponse(const RecordedRequest &request)>;

    explicit FakeNetworkAccessManager(QObject *parent = nullptr);

    void enqueue(const FakeResponse &response);
    void setHandler(const Handler &handler);

    QList<RecordedRequest> requests() const;
    QList<RecordedRequest> requests(const QByteArray &verb) const;
    int requestCount() const;
    int abortedCount() const;

protected:
    QNetworkReply *createRequest(Operation op, const QNetworkRequest &request, QIODevice *outgoingData) override;

private:
    static QByteArray verbFor(Operation op, const QNetworkRequest &request);

    Handler m_handler;
    QQueue<FakeResponse> m_queue;
    QList<RecordedRequest> m_requests;
    int m_abortedCount = 0;
};
