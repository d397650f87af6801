/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "../src/paginator.h"
#include "fakenetworkaccessmanager.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTest>
#include <QUrlQuery>

#include <memory>

using namespace CloudDrive;

Q_DECLARE_METATYPE(CloudDrive::Error::Kind)

namespace
{
std::optional<Request> requestForToken(const PageToken &token)
{
    QUrl url(QStringLiteral("https://drive.example/list"));
    if (token) {
        QUrlQuery query;
        query.addQueryItem(QStringLiteral("token"), *token);
        url.setQuery(query);
    }

    Request request;
    request.request = QNetworkRequest(url);
    request.path = QStringLiteral("/photos");
    return request;
}

PageResult<QString> parsePage(const Response &response)
{
    PageResult<QString> page;
    const QJsonObject root = QJsonDocument::fromJson(response.body).object();
    if (!root.value(QStringLiteral("items")).isArray()) {
        page.error = Error(Error::BadServerResponse, QStringLiteral("no items"), response.httpStatus);
        return page;
    }

    const QJsonArray items = root.value(QStringLiteral("items")).toArray();
    for (const QJsonValue &item : items) {
        page.items.append(item.toString());
    }
    if (root.contains(QStringLiteral("next"))) {
        page.nextToken = root.value(QStringLiteral("next")).toString();
    }
    return page;
}

FakeResponse pageResponse(const QStringList &items, const QString &next = QString())
{
    QJsonObject root;
    root.insert(QStringLiteral("items"), QJsonArray::fromStringList(items));
    if (!next.isEmpty()) {
        root.insert(QStringLiteral("next"), next);
    }
    return FakeResponse::json(200, QJsonDocument(root).toJson(QJsonDocument::Compact));
}

QString tokenOf(const RecordedRequest &request)
{
    return QUrlQuery(request.url).queryItemValue(QStringLiteral("token"));
}

Error mapError(int httpStatus, const QByteArray &body, const QString &path)
{
    Q_UNUSED(body)
    Error error(Error::ProviderReportedError, QStringLiteral("mapped: %1").arg(httpStatus), httpStatus);
    error.path = path;
    return error;
}
}

class PaginatorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void testThreePageListing();
    void testTokenSequences_data();
    void testTokenSequences();
    void testHttpErrorKeepsEarlierPages();
    void testUnparseablePageKeepsEarlierPages();
    void testTransportFailure();
    void testEmptyListing();
    void testMissingRequestEndsListing();
    void testMissingFirstRequestCompletesImmediately();
    void testAbortDropsInFlightRequest();
    void testDestroyWhileRunning();
    void testSecondRunIsRefusedWhileRunning();
    void testRunAgainAfterCompletion();

private:
    std::unique_ptr<Paginator<QString>> createPaginator(const Paginator<QString>::RequestBuilder &builder = requestForToken);
    void run();

    std::unique_ptr<FakeNetworkAccessManager> m_network;
    std::unique_ptr<Paginator<QString>> m_paginator;
    std::optional<PageResult<QString>> m_result;
    int m_completions = 0;
};

QTEST_GUILESS_MAIN(PaginatorTest)

void PaginatorTest::init()
{
    m_network = std::make_unique<FakeNetworkAccessManager>();
    m_paginator = createPaginator();
    m_result.reset();
    m_completions = 0;
}

void PaginatorTest::cleanup()
{
    m_paginator.reset();
    m_network.reset();
}

std::unique_ptr<Paginator<QString>> PaginatorTest::createPaginator(const Paginator<QString>::RequestBuilder &builder)
{
    return std::make_unique<Paginator<QString>>(m_network.get(), builder, parsePage, mapError);
}

void PaginatorTest::run()
{
    m_paginator->runToCompletion([this](const PageResult<QString> &result) {
        m_result = result;
        ++m_completions;
    });
}

void PaginatorTest::testThreePageListing()
{
    m_network->setHandler([](const RecordedRequest &request) {
        const QString token = tokenOf(request);
        if (token.isEmpty()) {
            return pageResponse({QStringLiteral("a"), QStringLiteral("b")}, QStringLiteral("A"));
        }
        if (token == QLatin1String("A")) {
            return pageResponse({QStringLiteral("c"), QStringLiteral("d")}, QStringLiteral("B"));
        }
        return pageResponse({QStringLiteral("e")});
    });

    run();
    QVERIFY(m_paginator->isRunning());
    QTRY_VERIFY(m_result.has_value());

    QVERIFY(!m_paginator->isRunning());
    QCOMPARE(m_result->error.kind, Error::NoError);
    QCOMPARE(m_result->items, QStringList({QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c"), QStringLiteral("d"), QStringLiteral("e")}));
    QCOMPARE(m_paginator->pageCount(), 3);
    QCOMPARE(m_completions, 1);

    const QList<RecordedRequest> requests = m_network->requests();
    QCOMPARE(requests.size(), 3);
    QVERIFY(!requests.at(0).url.hasQuery());
    QCOMPARE(tokenOf(requests.at(1)), QStringLiteral("A"));
    QCOMPARE(tokenOf(requests.at(2)), QStringLiteral("B"));
}

void PaginatorTest::testTokenSequences_data()
{
    // Page n answers with nextTokens[n] as its next token, empty meaning last page
    QTest::addColumn<QStringList>("nextTokens");
    QTest::addColumn<int>("expectedRequests");
    QTest::addColumn<Error::Kind>("expectedError");

    QTest::newRow("single page") << QStringList({QString()}) << 1 << Error::NoError;
    QTest::newRow("four pages") << QStringList({QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("C"), QString()}) << 4 << Error::NoError;
    QTest::newRow("same token twice") << QStringList({QStringLiteral("A"), QStringLiteral("A")}) << 2 << Error::PaginationProtocolError;
    QTest::newRow("cycle back to first token") << QStringList({QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("A")}) << 3
                                               << Error::PaginationProtocolError;
    QTest::newRow("cycle back to later token") << QStringList({QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("C"), QStringLiteral("B")}) << 4
                                               << Error::PaginationProtocolError;
}

void PaginatorTest::testTokenSequences()
{
    QFETCH(QStringList, nextTokens);
    QFETCH(int, expectedRequests);
    QFETCH(Error::Kind, expectedError);

    int served = 0;
    m_network->setHandler([&served, nextTokens](const RecordedRequest &) {
        const int page = served++;
        return pageResponse({QStringLiteral("item%1").arg(page)}, nextTokens.value(page));
    });

    run();
    QTRY_VERIFY(m_result.has_value());

    QCOMPARE(m_result->error.kind, expectedError);
    QCOMPARE(m_network->requestCount(), expectedRequests);
    // Items of every page received are kept, even when the run failed
    QCOMPARE(m_result->items.size(), expectedRequests);
    QCOMPARE(m_result->items.first(), QStringLiteral("item0"));
    QCOMPARE(m_completions, 1);
}

void PaginatorTest::testHttpErrorKeepsEarlierPages()
{
    m_network->enqueue(pageResponse({QStringLiteral("a"), QStringLiteral("b")}, QStringLiteral("A")));
    m_network->enqueue(FakeResponse::json(500, QByteArrayLiteral("{\"error\":\"boom\"}")));

    run();
    QTRY_VERIFY(m_result.has_value());

    QCOMPARE(m_result->error.kind, Error::ProviderReportedError);
    QCOMPARE(m_result->error.httpStatus, 500);
    QCOMPARE(m_result->error.errorMessage, QStringLiteral("mapped: 500"));
    QCOMPARE(m_result->error.path, QStringLiteral("/photos"));
    QCOMPARE(m_result->items, QStringList({QStringLiteral("a"), QStringLiteral("b")}));
    QCOMPARE(m_network->requestCount(), 2);
}

void PaginatorTest::testUnparseablePageKeepsEarlierPages()
{
    m_network->enqueue(pageResponse({QStringLiteral("a")}, QStringLiteral("A")));
    m_network->enqueue(FakeResponse::json(200, QByteArrayLiteral("<html>maintenance</html>")));

    run();
    QTRY_VERIFY(m_result.has_value());

    QCOMPARE(m_result->error.kind, Error::BadServerResponse);
    QCOMPARE(m_result->items, QStringList({QStringLiteral("a")}));
}

void PaginatorTest::testTransportFailure()
{
    m_network->enqueue(FakeResponse::networkFailure());

    run();
    QTRY_VERIFY(m_result.has_value());

    QCOMPARE(m_result->error.kind, Error::TransportFailure);
    QCOMPARE(m_result->error.url, QUrl(QStringLiteral("https://drive.example/list")));
    QVERIFY(m_result->items.isEmpty());
}

void PaginatorTest::testEmptyListing()
{
    m_network->enqueue(pageResponse({}));

    run();
    QTRY_VERIFY(m_result.has_value());

    QCOMPARE(m_result->error.kind, Error::NoError);
    QVERIFY(m_result->items.isEmpty());
    QCOMPARE(m_network->requestCount(), 1);
}

void PaginatorTest::testMissingRequestEndsListing()
{
    m_paginator = createPaginator([](const PageToken &token) -> std::optional<Request> {
        if (token) {
            return std::nullopt;
        }
        return requestForToken(token);
    });
    m_network->enqueue(pageResponse({QStringLiteral("a"), QStringLiteral("b")}, QStringLiteral("A")));

    run();
    QTRY_VERIFY(m_result.has_value());

    QCOMPARE(m_result->error.kind, Error::NoError);
    QCOMPARE(m_result->items, QStringList({QStringLiteral("a"), QStringLiteral("b")}));
    QCOMPARE(m_network->requestCount(), 1);
}

void PaginatorTest::testMissingFirstRequestCompletesImmediately()
{
    m_paginator = createPaginator([](const PageToken &) -> std::optional<Request> {
        return std::nullopt;
    });

    run();

    QVERIFY(m_result.has_value());
    QVERIFY(!m_paginator->isRunning());
    QCOMPARE(m_result->error.kind, Error::NoError);
    QVERIFY(m_result->items.isEmpty());
    QCOMPARE(m_network->requestCount(), 0);
}

void PaginatorTest::testAbortDropsInFlightRequest()
{
    m_network->enqueue(pageResponse({QStringLiteral("a")}, QStringLiteral("A")));
    m_network->enqueue(FakeResponse::held());

    run();
    QTRY_COMPARE(m_network->requestCount(), 2);
    QVERIFY(!m_result.has_value());

    m_paginator->abort();

    QVERIFY(m_result.has_value());
    QCOMPARE(m_result->error.kind, Error::Cancelled);
    QCOMPARE(m_result->items, QStringList({QStringLiteral("a")}));
    QCOMPARE(m_network->abortedCount(), 1);

    // A second abort has nothing left to report
    m_paginator->abort();
    QTest::qWait(10);
    QCOMPARE(m_completions, 1);
}

void PaginatorTest::testDestroyWhileRunning()
{
    m_network->enqueue(FakeResponse::held());

    run();
    QTRY_COMPARE(m_network->requestCount(), 1);

    m_paginator.reset();
    QTest::qWait(10);

    QCOMPARE(m_network->abortedCount(), 1);
    QCOMPARE(m_completions, 0);
}

void PaginatorTest::testSecondRunIsRefusedWhileRunning()
{
    m_network->enqueue(pageResponse({QStringLiteral("a")}));

    run();

    std::optional<PageResult<QString>> refused;
    QTest::ignoreMessage(QtWarningMsg, "Paginator is already running");
    m_paginator->runToCompletion([&refused](const PageResult<QString> &result) {
        refused = result;
    });

    // Refused synchronously, the active run is untouched
    QVERIFY(refused.has_value());
    QCOMPARE(refused->error.kind, Error::Unsupported);
    QVERIFY(refused->items.isEmpty());
    QVERIFY(m_paginator->isRunning());

    QTRY_VERIFY(m_result.has_value());
    QTest::qWait(10);
    QCOMPARE(m_completions, 1);
    QCOMPARE(m_result->error.kind, Error::NoError);
    QCOMPARE(m_result->items, QStringList({QStringLiteral("a")}));
    QCOMPARE(m_network->requestCount(), 1);
}

void PaginatorTest::testRunAgainAfterCompletion()
{
    m_network->enqueue(pageResponse({QStringLiteral("a")}, QStringLiteral("A")));
    m_network->enqueue(pageResponse({QStringLiteral("b")}));
    m_network->enqueue(pageResponse({QStringLiteral("c")}, QStringLiteral("A")));
    m_network->enqueue(pageResponse({QStringLiteral("d")}));

    run();
    QTRY_COMPARE(m_completions, 1);
    QCOMPARE(m_result->items, QStringList({QStringLiteral("a"), QStringLiteral("b")}));

    // Tokens seen by the previous run do not count against the new one
    run();
    QTRY_COMPARE(m_completions, 2);
    QCOMPARE(m_result->error.kind, Error::NoError);
    QCOMPARE(m_result->items, QStringList({QStringLiteral("c"), QStringLiteral("d")}));
}

#include "paginatortest.moc"
