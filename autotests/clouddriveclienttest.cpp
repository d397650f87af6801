/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "../src/boxadapter.h"
#include "../src/clouddriveclient.h"
#include "../src/onedriveadapter.h"
#include "fakenetworkaccessmanager.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSignalSpy>
#include <QTemporaryFile>
#include <QTest>
#include <QUrlQuery>

#include <memory>
#include <optional>

using namespace CloudDrive;

namespace
{
const QString UploadUrl = QStringLiteral("https://sn3302.up.1drv.com/up/fe6987415ace7X4e1eF866337");

QString nextLink(const QString &skipToken)
{
    return QStringLiteral("https://graph.microsoft.com/v1.0/me/drive/root:/Photos:/children?$skiptoken=%1").arg(skipToken);
}

FakeResponse graphPage(const QStringList &names, const QString &next = QString())
{
    QJsonArray values;
    for (const QString &name : names) {
        QJsonObject item;
        item.insert(QStringLiteral("id"), QStringLiteral("id-%1").arg(name));
        item.insert(QStringLiteral("name"), name);
        item.insert(QStringLiteral("size"), 10);
        item.insert(QStringLiteral("file"), QJsonObject());
        values.append(item);
    }

    QJsonObject root;
    root.insert(QStringLiteral("value"), values);
    if (!next.isEmpty()) {
        root.insert(QStringLiteral("@odata.nextLink"), next);
    }
    return FakeResponse::json(200, QJsonDocument(root).toJson(QJsonDocument::Compact));
}

FakeResponse graphListing(const RecordedRequest &request)
{
    const QString skipToken = QUrlQuery(request.url).queryItemValue(QStringLiteral("$skiptoken"));
    if (skipToken.isEmpty()) {
        return graphPage({QStringLiteral("a.jpg"), QStringLiteral("b.jpg")}, nextLink(QStringLiteral("A")));
    }
    if (skipToken == QLatin1String("A")) {
        return graphPage({QStringLiteral("c.jpg"), QStringLiteral("d.jpg")}, nextLink(QStringLiteral("B")));
    }
    return graphPage({QStringLiteral("e.jpg")});
}

// Behaves like the Graph upload endpoints: every fragment but the last is
// answered with the next expected range, the last one with the new item.
FakeResponse graphUpload(const RecordedRequest &request)
{
    if (request.verb == "POST") {
        return FakeResponse::json(200, QStringLiteral("{\"uploadUrl\":\"%1\"}").arg(UploadUrl).toUtf8());
    }
    if (request.verb == "DELETE") {
        return FakeResponse::json(204, QByteArray());
    }

    const QByteArray contentRange = request.request.rawHeader(QByteArrayLiteral("Content-Range"));
    const QList<QByteArray> rangeAndTotal = contentRange.mid(6).split('/');
    const qint64 last = rangeAndTotal.value(0).split('-').value(1).toLongLong();
    const qint64 total = rangeAndTotal.value(1).toLongLong();
    if (last + 1 == total) {
        return FakeResponse::json(201, QByteArrayLiteral("{\"id\":\"01NEWITEM\",\"name\":\"upload.bin\"}"));
    }
    return FakeResponse::json(202, QStringLiteral("{\"nextExpectedRanges\":[\"%1-\"]}").arg(last + 1).toUtf8());
}
}

class CloudDriveClientTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void testCreatesOwnNetworkAccessManager();
    void testListAll();
    void testListAllFailure();
    void testListAllAsync();
    void testUploadData();
    void testUploadFile();
    void testUploadMissingFile();
    void testUploadEmptyData();
    void testUnsupportedUpload();
    void testDestroyClientWithActiveUpload();
    void testDestroyClientAfterUploadFinished();

private:
    std::unique_ptr<FakeNetworkAccessManager> m_network;
};

QTEST_GUILESS_MAIN(CloudDriveClientTest)

void CloudDriveClientTest::init()
{
    m_network = std::make_unique<FakeNetworkAccessManager>();
}

void CloudDriveClientTest::cleanup()
{
    m_network.reset();
}

void CloudDriveClientTest::testCreatesOwnNetworkAccessManager()
{
    Client client(std::make_unique<OneDriveAdapter>(QStringLiteral("secret")));

    QVERIFY(client.network());
    QVERIFY(client.network()->parent() == &client);
    QCOMPARE(client.adapter()->name(), QStringLiteral("OneDrive"));
    QVERIFY(client.supportsListing());
    QVERIFY(client.supportsUpload());
}

void CloudDriveClientTest::testListAll()
{
    m_network->setHandler(graphListing);
    Client client(std::make_unique<OneDriveAdapter>(QStringLiteral("secret")), m_network.get());

    const ListResult result = client.listAll(QStringLiteral("Photos"));

    QVERIFY(result.success);
    QVERIFY(!result.error.isError());
    QCOMPARE(result.items.size(), 5);
    QCOMPARE(result.items.first().name, QStringLiteral("a.jpg"));
    QCOMPARE(result.items.last().name, QStringLiteral("e.jpg"));
    QCOMPARE(m_network->requestCount(), 3);
    QCOMPARE(m_network->requests().at(0).url.path(), QStringLiteral("/v1.0/me/drive/root:/Photos:/children"));
    QCOMPARE(m_network->requests().at(2).url, QUrl(nextLink(QStringLiteral("B"))));
}

void CloudDriveClientTest::testListAllFailure()
{
    m_network->enqueue(graphPage({QStringLiteral("a.jpg")}, nextLink(QStringLiteral("A"))));
    m_network->enqueue(FakeResponse::json(401, QByteArrayLiteral("{\"error\":{\"code\":\"InvalidAuthenticationToken\",\"message\":\"Access token has expired.\"}}")));
    Client client(std::make_unique<OneDriveAdapter>(QStringLiteral("expired")), m_network.get());

    const ListResult result = client.listAll(QStringLiteral("Photos"));

    QVERIFY(!result.success);
    QCOMPARE(result.error.kind, Error::ProviderReportedError);
    QCOMPARE(result.error.httpStatus, 401);
    QCOMPARE(result.error.errorMessage, QStringLiteral("InvalidAuthenticationToken: Access token has expired."));
    QCOMPARE(result.items.size(), 1);
}

void CloudDriveClientTest::testListAllAsync()
{
    m_network->setHandler(graphListing);
    Client client(std::make_unique<OneDriveAdapter>(QStringLiteral("secret")), m_network.get());

    std::optional<PageResult<DriveItem>> result;
    Error error(Error::Unsupported, QStringLiteral("not reset"));
    ListingHandle listing = client.listAllAsync(
        QStringLiteral("Photos"),
        [&result](const PageResult<DriveItem> &page) {
            result = page;
        },
        &error);

    QVERIFY(listing);
    QVERIFY(!error.isError());
    QVERIFY(listing->isRunning());

    QTRY_VERIFY(result.has_value());
    QCOMPARE(result->items.size(), 5);
    QCOMPARE(listing->pageCount(), 3);
}

void CloudDriveClientTest::testUploadData()
{
    m_network->setHandler(graphUpload);
    OneDriveSettings settings;
    settings.fragmentSize = OneDriveAdapter::FragmentGranularity;
    Client client(std::make_unique<OneDriveAdapter>(QStringLiteral("secret"), settings), m_network.get());

    // Two full 320 KiB fragments and a short one
    const QByteArray data(2 * OneDriveAdapter::FragmentGranularity + 1000, 'q');
    Error error;
    UploadHandle upload = client.uploadData(QStringLiteral("/Backups/upload.bin"), data, UploadOptions(), &error);
    QVERIFY(upload);
    QVERIFY(!error.isError());

    QSignalSpy completedSpy(upload.get(), &ChunkedUploadSession::completed);
    QSignalSpy failedSpy(upload.get(), &ChunkedUploadSession::failed);
    QTRY_COMPARE(completedSpy.count(), 1);
    QCOMPARE(failedSpy.count(), 0);

    QCOMPARE(upload->completionId(), QStringLiteral("01NEWITEM"));
    QCOMPARE(upload->uploadedSoFar(), qint64(data.size()));

    const QList<RecordedRequest> posts = m_network->requests(QByteArrayLiteral("POST"));
    QCOMPARE(posts.size(), 1);
    QCOMPARE(posts.first().url.path(), QStringLiteral("/v1.0/me/drive/root:/Backups/upload.bin:/createUploadSession"));

    const QList<RecordedRequest> puts = m_network->requests(QByteArrayLiteral("PUT"));
    QCOMPARE(puts.size(), 3);
    QCOMPARE(puts.at(0).request.rawHeader(QByteArrayLiteral("Content-Range")), QByteArrayLiteral("bytes 0-327679/656360"));
    QCOMPARE(puts.at(1).request.rawHeader(QByteArrayLiteral("Content-Range")), QByteArrayLiteral("bytes 327680-655359/656360"));
    QCOMPARE(puts.at(2).request.rawHeader(QByteArrayLiteral("Content-Range")), QByteArrayLiteral("bytes 655360-656359/656360"));
    for (const RecordedRequest &put : puts) {
        QCOMPARE(put.url, QUrl(UploadUrl));
        QVERIFY(!put.request.hasRawHeader(QByteArrayLiteral("Authorization")));
    }
}

void CloudDriveClientTest::testUploadFile()
{
    m_network->setHandler(graphUpload);
    Client client(std::make_unique<OneDriveAdapter>(QStringLiteral("secret")), m_network.get());

    QTemporaryFile file;
    QVERIFY(file.open());
    const QByteArray contents(1000, 'f');
    QVERIFY(file.write(contents) == contents.size());
    QVERIFY(file.flush());

    UploadHandle upload = client.uploadFile(QStringLiteral("notes.txt"), file.fileName());
    QVERIFY(upload);
    QCOMPARE(upload->totalSize(), 1000);

    QSignalSpy completedSpy(upload.get(), &ChunkedUploadSession::completed);
    QTRY_COMPARE(completedSpy.count(), 1);

    const QList<RecordedRequest> puts = m_network->requests(QByteArrayLiteral("PUT"));
    QCOMPARE(puts.size(), 1);
    QCOMPARE(puts.first().body, contents);
}

void CloudDriveClientTest::testUploadMissingFile()
{
    Client client(std::make_unique<OneDriveAdapter>(QStringLiteral("secret")), m_network.get());

    Error error;
    UploadHandle upload = client.uploadFile(QStringLiteral("notes.txt"), QStringLiteral("/nonexistent/notes.txt"), UploadOptions(), &error);

    QVERIFY(!upload);
    QCOMPARE(error.kind, Error::DataSourceFailure);
    QCOMPARE(error.path, QStringLiteral("notes.txt"));
    QCOMPARE(m_network->requestCount(), 0);
}

void CloudDriveClientTest::testUploadEmptyData()
{
    Client client(std::make_unique<OneDriveAdapter>(QStringLiteral("secret")), m_network.get());

    Error error;
    UploadHandle upload = client.uploadData(QStringLiteral("empty.txt"), QByteArray(), UploadOptions(), &error);

    QVERIFY(!upload);
    QCOMPARE(error.kind, Error::Unsupported);
    QTest::qWait(10);
    QCOMPARE(m_network->requestCount(), 0);
}

void CloudDriveClientTest::testUnsupportedUpload()
{
    Client client(std::make_unique<BoxAdapter>(QStringLiteral("secret")), m_network.get());
    QVERIFY(client.supportsListing());
    QVERIFY(!client.supportsUpload());

    Error error;
    UploadHandle upload = client.uploadData(QStringLiteral("report.pdf"), QByteArrayLiteral("data"), UploadOptions(), &error);

    QVERIFY(!upload);
    QCOMPARE(error.kind, Error::Unsupported);
    QVERIFY(error.errorMessage.contains(QStringLiteral("Box")));
    QTest::qWait(10);
    QCOMPARE(m_network->requestCount(), 0);
}

void CloudDriveClientTest::testDestroyClientWithActiveUpload()
{
    m_network->setHandler([](const RecordedRequest &request) {
        if (request.verb == "PUT") {
            return FakeResponse::held();
        }
        return graphUpload(request);
    });
    auto client = std::make_unique<Client>(std::make_unique<OneDriveAdapter>(QStringLiteral("secret")), m_network.get());

    UploadHandle upload = client->uploadData(QStringLiteral("/Backups/upload.bin"), QByteArray(1000, 'q'));
    QVERIFY(upload);
    QSignalSpy completedSpy(upload.get(), &ChunkedUploadSession::completed);
    QSignalSpy failedSpy(upload.get(), &ChunkedUploadSession::failed);

    QTRY_COMPARE(upload->state(), ChunkedUploadSession::State::PartInFlight);
    client.reset();

    // Cancelled while the adapter still existed
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(0).value<Error>().kind, Error::Cancelled);
    QCOMPARE(upload->state(), ChunkedUploadSession::State::Cancelled);
    QCOMPARE(m_network->abortedCount(), 1);

    const QList<RecordedRequest> deletes = m_network->requests(QByteArrayLiteral("DELETE"));
    QCOMPARE(deletes.size(), 1);
    QCOMPARE(deletes.first().url, QUrl(UploadUrl));

    upload.reset();
    QTest::qWait(10);
    QCOMPARE(completedSpy.count(), 0);
    QCOMPARE(m_network->requests(QByteArrayLiteral("DELETE")).size(), 1);
    QCOMPARE(m_network->requests(QByteArrayLiteral("PUT")).size(), 1);
}

void CloudDriveClientTest::testDestroyClientAfterUploadFinished()
{
    m_network->setHandler(graphUpload);
    auto client = std::make_unique<Client>(std::make_unique<OneDriveAdapter>(QStringLiteral("secret")), m_network.get());

    UploadHandle finished = client->uploadData(QStringLiteral("first.bin"), QByteArray(10, 'a'));
    QVERIFY(finished);
    QSignalSpy completedSpy(finished.get(), &ChunkedUploadSession::completed);
    QTRY_COMPARE(completedSpy.count(), 1);

    // Released before the client, nothing left to cancel
    UploadHandle released = client->uploadData(QStringLiteral("second.bin"), QByteArray(10, 'b'));
    QVERIFY(released);
    released.reset();

    QSignalSpy failedSpy(finished.get(), &ChunkedUploadSession::failed);
    const int requests = m_network->requestCount();
    client.reset();
    QTest::qWait(10);

    QCOMPARE(failedSpy.count(), 0);
    QCOMPARE(finished->state(), ChunkedUploadSession::State::Completed);
    QCOMPARE(m_network->requestCount(), requests);
}

#include "clouddriveclienttest.moc"
