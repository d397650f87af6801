/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "../src/boxadapter.h"
#include "../src/googledriveadapter.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QTest>
#include <QUrlQuery>

using namespace CloudDrive;

Q_DECLARE_METATYPE(CloudDrive::PageToken)

namespace
{
Response jsonResponse(const QByteArray &body)
{
    Response response;
    response.url = QUrl(QStringLiteral("https://api.example/list"));
    response.httpStatus = 200;
    response.body = body;
    return response;
}
}

class ListingAdaptersTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testBoxCapabilities();
    void testBoxListRequest_data();
    void testBoxListRequest();
    void testBoxNextOffset_data();
    void testBoxNextOffset();
    void testBoxSkipsIncompleteEntries();
    void testBoxListingWithoutEntries();
    void testBoxParseItem();
    void testBoxMapServerError();

    void testGoogleDriveCapabilities();
    void testGoogleDriveListRequest();
    void testGoogleDriveListRequestWithToken();
    void testGoogleDriveParseListResponse();
    void testGoogleDriveLastPage();
    void testGoogleDriveListingWithoutFiles();
    void testGoogleDriveParseItem();
    void testGoogleDriveMapServerError();
};

QTEST_GUILESS_MAIN(ListingAdaptersTest)

void ListingAdaptersTest::testBoxCapabilities()
{
    BoxAdapter adapter(QStringLiteral("token"));
    QCOMPARE(adapter.name(), QStringLiteral("Box"));
    QVERIFY(adapter.listingAdapter());
    QVERIFY(!adapter.uploadAdapter());
}

void ListingAdaptersTest::testBoxListRequest_data()
{
    QTest::addColumn<QString>("rootPath");
    QTest::addColumn<PageToken>("cursor");
    QTest::addColumn<QString>("expectedPath");
    QTest::addColumn<QString>("expectedOffset");

    QTest::newRow("root folder") << QString() << PageToken() << QStringLiteral("/2.0/folders/0/items") << QString();
    QTest::newRow("slash is root") << QStringLiteral("/") << PageToken() << QStringLiteral("/2.0/folders/0/items") << QString();
    QTest::newRow("folder id") << QStringLiteral("11446498") << PageToken() << QStringLiteral("/2.0/folders/11446498/items") << QString();
    QTest::newRow("later page") << QStringLiteral("11446498") << PageToken(QStringLiteral("2000")) << QStringLiteral("/2.0/folders/11446498/items")
                                << QStringLiteral("2000");
}

void ListingAdaptersTest::testBoxListRequest()
{
    QFETCH(QString, rootPath);
    QFETCH(PageToken, cursor);
    QFETCH(QString, expectedPath);
    QFETCH(QString, expectedOffset);

    BoxAdapter adapter(QStringLiteral("secret"));
    const std::optional<Request> request = adapter.buildListRequest(rootPath, cursor);
    QVERIFY(request);

    const QUrl url = request->request.url();
    const QUrlQuery query(url);
    QCOMPARE(url.host(), QStringLiteral("api.box.com"));
    QCOMPARE(url.path(), expectedPath);
    QCOMPARE(query.queryItemValue(QStringLiteral("limit")), QStringLiteral("1000"));
    QCOMPARE(query.queryItemValue(QStringLiteral("offset")), expectedOffset);
    QVERIFY(query.queryItemValue(QStringLiteral("fields")).contains(QStringLiteral("sha1")));
    QCOMPARE(request->request.rawHeader(QByteArrayLiteral("Authorization")), QByteArrayLiteral("Bearer secret"));
}

void ListingAdaptersTest::testBoxNextOffset_data()
{
    QTest::addColumn<QByteArray>("body");
    QTest::addColumn<int>("expectedItems");
    QTest::addColumn<PageToken>("expectedToken");

    QTest::newRow("first of three pages") << QByteArray(R"({"total_count":5,"offset":0,"limit":2,"entries":[
            {"type":"file","id":"1","name":"a"},{"type":"file","id":"2","name":"b"}]})")
                                          << 2 << PageToken(QStringLiteral("2"));
    QTest::newRow("middle page") << QByteArray(R"({"total_count":5,"offset":2,"limit":2,"entries":[
            {"type":"file","id":"3","name":"c"},{"type":"file","id":"4","name":"d"}]})")
                                 << 2 << PageToken(QStringLiteral("4"));
    QTest::newRow("last page") << QByteArray(R"({"total_count":5,"offset":4,"limit":2,"entries":[{"type":"file","id":"5","name":"e"}]})") << 1
                               << PageToken();
    QTest::newRow("empty folder") << QByteArray(R"({"total_count":0,"offset":0,"entries":[]})") << 0 << PageToken();
    QTest::newRow("empty page before total") << QByteArray(R"({"total_count":10,"offset":6,"entries":[]})") << 0 << PageToken();
}

void ListingAdaptersTest::testBoxNextOffset()
{
    QFETCH(QByteArray, body);
    QFETCH(int, expectedItems);
    QFETCH(PageToken, expectedToken);

    BoxAdapter adapter(QStringLiteral("secret"));
    const PageResult<DriveItem> page = adapter.parseListResponse(jsonResponse(body));

    QVERIFY(!page.error.isError());
    QCOMPARE(page.items.size(), expectedItems);
    QCOMPARE(page.nextToken, expectedToken);
}

void ListingAdaptersTest::testBoxSkipsIncompleteEntries()
{
    BoxAdapter adapter(QStringLiteral("secret"));
    const QByteArray body = R"({"total_count":5,"offset":0,"entries":[
        {"type":"file","id":"1","name":"a"},
        {"type":"file","id":"2"},
        {"type":"folder","name":"nameless"}
    ]})";

    const PageResult<DriveItem> page = adapter.parseListResponse(jsonResponse(body));

    QVERIFY(!page.error.isError());
    QCOMPARE(page.items.size(), 1);
    QCOMPARE(page.items.first().id, QStringLiteral("1"));
    // The offset still advances past the skipped entries
    QCOMPARE(page.nextToken, PageToken(QStringLiteral("3")));
}

void ListingAdaptersTest::testBoxListingWithoutEntries()
{
    BoxAdapter adapter(QStringLiteral("secret"));

    const PageResult<DriveItem> page = adapter.parseListResponse(jsonResponse(QByteArrayLiteral("{\"total_count\":3}")));

    QCOMPARE(page.error.kind, Error::BadServerResponse);
    QVERIFY(!page.nextToken);
}

void ListingAdaptersTest::testBoxParseItem()
{
    const QByteArray json = R"({
        "type": "file",
        "id": "12345",
        "name": "contract.pdf",
        "size": 629644,
        "etag": "1",
        "sha1": "85136C79CBF9FE36BB9D05D0639C70C265C18D37",
        "created_at": "2012-12-12T10:53:43-08:00",
        "modified_at": "2012-12-12T11:04:26-08:00",
        "parent": {"type": "folder", "id": "11446498"}
    })";

    const DriveItem file = BoxAdapter::parseItem(QJsonDocument::fromJson(json).object());
    QCOMPARE(file.id, QStringLiteral("12345"));
    QCOMPARE(file.size, 629644);
    QCOMPARE(file.etag, QStringLiteral("1"));
    QCOMPARE(file.hash, QStringLiteral("85136C79CBF9FE36BB9D05D0639C70C265C18D37"));
    QCOMPARE(file.parentId, QStringLiteral("11446498"));
    QCOMPARE(file.created, QDateTime::fromString(QStringLiteral("2012-12-12T18:53:43Z"), Qt::ISODate));
    QVERIFY(!file.isFolder);

    const DriveItem folder = BoxAdapter::parseItem(QJsonDocument::fromJson(R"({"type":"folder","id":"7","name":"Archive"})").object());
    QVERIFY(folder.isFolder);
    QCOMPARE(folder.mimeType, QStringLiteral("inode/directory"));
    QCOMPARE(folder.size, -1);
}

void ListingAdaptersTest::testBoxMapServerError()
{
    BoxAdapter adapter(QStringLiteral("secret"));
    const QByteArray body = R"({"type":"error","status":404,"code":"not_found","message":"Item not found"})";

    const Error error = adapter.mapServerError(404, body, QStringLiteral("42"));

    QCOMPARE(error.kind, Error::ProviderReportedError);
    QCOMPARE(error.httpStatus, 404);
    QCOMPARE(error.errorMessage, QStringLiteral("Item not found"));
    QCOMPARE(error.path, QStringLiteral("42"));
}

void ListingAdaptersTest::testGoogleDriveCapabilities()
{
    GoogleDriveAdapter adapter(QStringLiteral("token"));
    QCOMPARE(adapter.name(), QStringLiteral("GoogleDrive"));
    QVERIFY(adapter.listingAdapter());
    QVERIFY(!adapter.uploadAdapter());
}

void ListingAdaptersTest::testGoogleDriveListRequest()
{
    GoogleDriveSettings settings;
    settings.pageSize = 25;
    GoogleDriveAdapter adapter(QStringLiteral("secret"), settings);

    const std::optional<Request> request = adapter.buildListRequest(QString(), std::nullopt);
    QVERIFY(request);

    const QUrl url = request->request.url();
    const QUrlQuery query(url);
    QCOMPARE(url.host(), QStringLiteral("www.googleapis.com"));
    QCOMPARE(url.path(), QStringLiteral("/drive/v3/files"));
    QCOMPARE(query.queryItemValue(QStringLiteral("q"), QUrl::FullyDecoded), QStringLiteral("'root' in parents and trashed = false"));
    QCOMPARE(query.queryItemValue(QStringLiteral("pageSize")), QStringLiteral("25"));
    QVERIFY(query.queryItemValue(QStringLiteral("fields")).startsWith(QStringLiteral("nextPageToken,files(")));
    QVERIFY(!query.hasQueryItem(QStringLiteral("pageToken")));
    QCOMPARE(request->request.rawHeader(QByteArrayLiteral("Authorization")), QByteArrayLiteral("Bearer secret"));
    QCOMPARE(request->path, QStringLiteral("root"));
}

void ListingAdaptersTest::testGoogleDriveListRequestWithToken()
{
    GoogleDriveAdapter adapter(QStringLiteral("secret"));

    const std::optional<Request> request = adapter.buildListRequest(QStringLiteral("1AbCdEf"), QStringLiteral("~!!~AI9FV7Q"));
    QVERIFY(request);

    const QUrlQuery query(request->request.url());
    QCOMPARE(query.queryItemValue(QStringLiteral("q"), QUrl::FullyDecoded), QStringLiteral("'1AbCdEf' in parents and trashed = false"));
    QCOMPARE(query.queryItemValue(QStringLiteral("pageToken"), QUrl::FullyDecoded), QStringLiteral("~!!~AI9FV7Q"));
}

void ListingAdaptersTest::testGoogleDriveParseListResponse()
{
    GoogleDriveAdapter adapter(QStringLiteral("secret"));
    const QByteArray body = R"({
        "nextPageToken": "~!!~AI9FV7Q",
        "files": [
            {"id": "1", "name": "notes.txt", "mimeType": "text/plain", "size": "42"},
            {"id": "2", "name": "Projects", "mimeType": "application/vnd.google-apps.folder"}
        ]
    })";

    const PageResult<DriveItem> page = adapter.parseListResponse(jsonResponse(body));

    QVERIFY(!page.error.isError());
    QCOMPARE(page.items.size(), 2);
    QCOMPARE(page.items.at(0).size, 42);
    QVERIFY(page.items.at(1).isFolder);
    QCOMPARE(page.nextToken, PageToken(QStringLiteral("~!!~AI9FV7Q")));
}

void ListingAdaptersTest::testGoogleDriveLastPage()
{
    GoogleDriveAdapter adapter(QStringLiteral("secret"));

    const PageResult<DriveItem> page = adapter.parseListResponse(jsonResponse(R"({"files":[{"id":"1","name":"a"}]})"));

    QVERIFY(!page.error.isError());
    QCOMPARE(page.items.size(), 1);
    QVERIFY(!page.nextToken);
}

void ListingAdaptersTest::testGoogleDriveListingWithoutFiles()
{
    GoogleDriveAdapter adapter(QStringLiteral("secret"));

    const PageResult<DriveItem> page = adapter.parseListResponse(jsonResponse(R"({"kind":"drive#fileList"})"));

    QCOMPARE(page.error.kind, Error::BadServerResponse);
}

void ListingAdaptersTest::testGoogleDriveParseItem()
{
    const QByteArray json = R"({
        "id": "1ZdR3L3qP4Bkq8noWLJHSr_iBau0DNT4Kli4SxNc2YEo",
        "name": "budget.xlsx",
        "mimeType": "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
        "size": "8196",
        "md5Checksum": "d41d8cd98f00b204e9800998ecf8427e",
        "createdTime": "2023-01-05T08:00:00.000Z",
        "modifiedTime": "2023-01-06T09:30:00.000Z",
        "parents": ["0AF1kq"]
    })";

    const DriveItem item = GoogleDriveAdapter::parseItem(QJsonDocument::fromJson(json).object());

    QCOMPARE(item.name, QStringLiteral("budget.xlsx"));
    QCOMPARE(item.size, 8196);
    QCOMPARE(item.hash, QStringLiteral("d41d8cd98f00b204e9800998ecf8427e"));
    QCOMPARE(item.parentId, QStringLiteral("0AF1kq"));
    QVERIFY(item.lastModified.isValid());
    QVERIFY(!item.isFolder);

    // Native documents have no size
    const DriveItem doc = GoogleDriveAdapter::parseItem(QJsonDocument::fromJson(R"({"id":"3","name":"Plan","mimeType":"application/vnd.google-apps.document"})").object());
    QCOMPARE(doc.size, -1);
}

void ListingAdaptersTest::testGoogleDriveMapServerError()
{
    GoogleDriveAdapter adapter(QStringLiteral("secret"));
    const QByteArray body = R"({"error":{"code":404,"message":"File not found: 1AbCdEf.","errors":[]}})";

    const Error error = adapter.errorMapper()(404, body, QStringLiteral("1AbCdEf"));

    QCOMPARE(error.kind, Error::ProviderReportedError);
    QCOMPARE(error.errorMessage, QStringLiteral("File not found: 1AbCdEf."));
}

#include "listingadapterstest.moc"
