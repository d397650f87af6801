/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "../src/onedriveadapter.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QTest>
#include <QTimeZone>
#include <QUrlQuery>

using namespace CloudDrive;

namespace
{
Response jsonResponse(int httpStatus, const QByteArray &body)
{
    Response response;
    response.url = QUrl(QStringLiteral("https://graph.microsoft.com/v1.0/me/drive/root/children"));
    response.httpStatus = httpStatus;
    response.body = body;
    return response;
}

UploadTarget uploadTarget(qint64 totalSize, qint64 partSize)
{
    UploadTarget target;
    target.totalSize = totalSize;
    target.partSize = partSize;
    target.sessionHandle = QStringLiteral("https://sn3302.up.1drv.com/up/fe6987415ace7X4e1eF866337");
    return target;
}
}

class OneDriveAdapterTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testCapabilities();
    void testParseFileItem();
    void testParseFolderItem();
    void testListRequest_data();
    void testListRequest();
    void testListRequestFollowsNextLink();
    void testListRequestRejectsRelativeNextLink();
    void testParseListResponse();
    void testParseLastListPage();
    void testParseListResponseWithoutValue();
    void testCreateSessionRequest_data();
    void testCreateSessionRequest();
    void testParseCreateSessionResponse();
    void testFragmentSize_data();
    void testFragmentSize();
    void testPartRequest();
    void testParseExpectedRange_data();
    void testParseExpectedRange();
    void testParsePartResponse();
    void testParseFinalPartResponse();
    void testParseFinalPartWithoutItem();
    void testParseMalformedExpectedRange();
    void testCancelRequest();
    void testMapServerError();
    void testMapServerErrorWithoutJson();
};

QTEST_GUILESS_MAIN(OneDriveAdapterTest)

void OneDriveAdapterTest::testCapabilities()
{
    OneDriveAdapter adapter(QStringLiteral("token"));
    QCOMPARE(adapter.name(), QStringLiteral("OneDrive"));
    QVERIFY(adapter.listingAdapter());
    QVERIFY(adapter.uploadAdapter());
}

void OneDriveAdapterTest::testParseFileItem()
{
    const QByteArray json = R"({
        "id": "01BYE5RZ6QN3ZWBTUFOFD3GSPGOHDJD36K",
        "name": "report.pdf",
        "size": 35212,
        "eTag": "aMDFCWUU1UlpWUU",
        "createdDateTime": "2024-03-01T10:00:00Z",
        "lastModifiedDateTime": "2024-03-02T11:30:00Z",
        "@microsoft.graph.downloadUrl": "https://public.dm.files.1drv.com/y4mreport",
        "parentReference": {"id": "01BYE5RZ4XPA", "driveId": "b!drive"},
        "file": {"mimeType": "application/pdf", "hashes": {"quickXorHash": "xor=", "sha1Hash": "A1B2C3"}}
    })";

    const DriveItem item = OneDriveAdapter::parseItem(QJsonDocument::fromJson(json).object());

    QCOMPARE(item.id, QStringLiteral("01BYE5RZ6QN3ZWBTUFOFD3GSPGOHDJD36K"));
    QCOMPARE(item.name, QStringLiteral("report.pdf"));
    QCOMPARE(item.size, 35212);
    QCOMPARE(item.etag, QStringLiteral("aMDFCWUU1UlpWUU"));
    QCOMPARE(item.created, QDateTime(QDate(2024, 3, 1), QTime(10, 0), QTimeZone::UTC));
    QCOMPARE(item.lastModified, QDateTime(QDate(2024, 3, 2), QTime(11, 30), QTimeZone::UTC));
    QCOMPARE(item.downloadUrl, QStringLiteral("https://public.dm.files.1drv.com/y4mreport"));
    QCOMPARE(item.parentId, QStringLiteral("01BYE5RZ4XPA"));
    QCOMPARE(item.driveId, QStringLiteral("b!drive"));
    QCOMPARE(item.mimeType, QStringLiteral("application/pdf"));
    QCOMPARE(item.hash, QStringLiteral("A1B2C3"));
    QVERIFY(!item.isFolder);
}

void OneDriveAdapterTest::testParseFolderItem()
{
    const QByteArray json = R"({"id": "F1", "name": "Photos", "folder": {"childCount": 4}})";

    const DriveItem item = OneDriveAdapter::parseItem(QJsonDocument::fromJson(json).object());

    QVERIFY(item.isFolder);
    QCOMPARE(item.mimeType, QStringLiteral("inode/directory"));
    QCOMPARE(item.size, -1);
    QVERIFY(item.hash.isEmpty());
}

void OneDriveAdapterTest::testListRequest_data()
{
    QTest::addColumn<QString>("rootPath");
    QTest::addColumn<QString>("expectedPath");

    QTest::newRow("empty path") << QString() << QStringLiteral("/v1.0/me/drive/root/children");
    QTest::newRow("root") << QStringLiteral("/") << QStringLiteral("/v1.0/me/drive/root/children");
    QTest::newRow("folder") << QStringLiteral("Documents") << QStringLiteral("/v1.0/me/drive/root:/Documents:/children");
    QTest::newRow("slashes trimmed") << QStringLiteral("/Documents/Taxes/") << QStringLiteral("/v1.0/me/drive/root:/Documents/Taxes:/children");
    QTest::newRow("spaces") << QStringLiteral("My Files") << QStringLiteral("/v1.0/me/drive/root:/My Files:/children");
}

void OneDriveAdapterTest::testListRequest()
{
    QFETCH(QString, rootPath);
    QFETCH(QString, expectedPath);

    OneDriveSettings settings;
    settings.pageSize = 50;
    OneDriveAdapter adapter(QStringLiteral("secret"), settings);

    const std::optional<Request> request = adapter.buildListRequest(rootPath, std::nullopt);
    QVERIFY(request);

    const QUrl url = request->request.url();
    QCOMPARE(request->verb, QByteArrayLiteral("GET"));
    QCOMPARE(url.host(), QStringLiteral("graph.microsoft.com"));
    QCOMPARE(url.path(), expectedPath);
    QCOMPARE(QUrlQuery(url).queryItemValue(QStringLiteral("$top")), QStringLiteral("50"));
    QVERIFY(QUrlQuery(url).hasQueryItem(QStringLiteral("$select")));
    QCOMPARE(request->request.rawHeader(QByteArrayLiteral("Authorization")), QByteArrayLiteral("Bearer secret"));
    QCOMPARE(request->path, rootPath);
}

void OneDriveAdapterTest::testListRequestFollowsNextLink()
{
    OneDriveAdapter adapter(QStringLiteral("secret"));
    const QString nextLink = QStringLiteral("https://graph.microsoft.com/v1.0/me/drive/root/children?$top=200&$skiptoken=ABC");

    const std::optional<Request> request = adapter.buildListRequest(QStringLiteral("Documents"), nextLink);
    QVERIFY(request);

    QCOMPARE(request->request.url(), QUrl(nextLink));
    QCOMPARE(request->request.rawHeader(QByteArrayLiteral("Authorization")), QByteArrayLiteral("Bearer secret"));
}

void OneDriveAdapterTest::testListRequestRejectsRelativeNextLink()
{
    OneDriveAdapter adapter(QStringLiteral("secret"));

    QVERIFY(!adapter.buildListRequest(QString(), QStringLiteral("skiptoken=ABC")));
}

void OneDriveAdapterTest::testParseListResponse()
{
    OneDriveAdapter adapter(QStringLiteral("secret"));
    const QByteArray body = R"({
        "value": [
            {"id": "1", "name": "a.txt", "size": 3, "file": {}},
            {"id": "2", "name": "b", "folder": {}}
        ],
        "@odata.nextLink": "https://graph.microsoft.com/v1.0/me/drive/root/children?$skiptoken=X"
    })";

    const PageResult<DriveItem> page = adapter.parseListResponse(jsonResponse(200, body));

    QVERIFY(!page.error.isError());
    QCOMPARE(page.items.size(), 2);
    QCOMPARE(page.items.at(0).name, QStringLiteral("a.txt"));
    QVERIFY(page.items.at(1).isFolder);
    QCOMPARE(page.nextToken, PageToken(QStringLiteral("https://graph.microsoft.com/v1.0/me/drive/root/children?$skiptoken=X")));
}

void OneDriveAdapterTest::testParseLastListPage()
{
    OneDriveAdapter adapter(QStringLiteral("secret"));

    const PageResult<DriveItem> page = adapter.parseListResponse(jsonResponse(200, QByteArrayLiteral("{\"value\":[]}")));

    QVERIFY(!page.error.isError());
    QVERIFY(page.items.isEmpty());
    QVERIFY(!page.nextToken);
}

void OneDriveAdapterTest::testParseListResponseWithoutValue()
{
    OneDriveAdapter adapter(QStringLiteral("secret"));

    const PageResult<DriveItem> page = adapter.parseListResponse(jsonResponse(200, QByteArrayLiteral("{\"items\":[]}")));

    QCOMPARE(page.error.kind, Error::BadServerResponse);
    QCOMPARE(page.error.url, QUrl(QStringLiteral("https://graph.microsoft.com/v1.0/me/drive/root/children")));
}

void OneDriveAdapterTest::testCreateSessionRequest_data()
{
    QTest::addColumn<bool>("overwrite");
    QTest::addColumn<QString>("expectedBehavior");

    QTest::newRow("replace") << true << QStringLiteral("replace");
    QTest::newRow("fail") << false << QStringLiteral("fail");
}

void OneDriveAdapterTest::testCreateSessionRequest()
{
    QFETCH(bool, overwrite);
    QFETCH(QString, expectedBehavior);

    OneDriveAdapter adapter(QStringLiteral("secret"));
    UploadOptions options;
    options.overwrite = overwrite;

    const Request request = adapter.buildCreateSessionRequest(QStringLiteral("/Documents/report.pdf"), 250, options);

    QCOMPARE(request.verb, QByteArrayLiteral("POST"));
    QCOMPARE(request.request.url().path(), QStringLiteral("/v1.0/me/drive/root:/Documents/report.pdf:/createUploadSession"));
    QCOMPARE(request.request.rawHeader(QByteArrayLiteral("Authorization")), QByteArrayLiteral("Bearer secret"));
    QCOMPARE(request.path, QStringLiteral("/Documents/report.pdf"));

    const QJsonObject item = QJsonDocument::fromJson(request.body).object().value(QStringLiteral("item")).toObject();
    QCOMPARE(item.value(QStringLiteral("@microsoft.graph.conflictBehavior")).toString(), expectedBehavior);
}

void OneDriveAdapterTest::testParseCreateSessionResponse()
{
    OneDriveAdapter adapter(QStringLiteral("secret"));
    const QByteArray body = R"({
        "uploadUrl": "https://sn3302.up.1drv.com/up/fe6987415ace7X4e1eF866337",
        "expirationDateTime": "2024-03-02T11:30:00Z"
    })";

    const SessionResult session = adapter.parseCreateSessionResponse(jsonResponse(200, body));

    QVERIFY(!session.error.isError());
    QCOMPARE(session.sessionHandle, QStringLiteral("https://sn3302.up.1drv.com/up/fe6987415ace7X4e1eF866337"));
    QCOMPARE(session.partSize, 10 * 1024 * 1024);

    const SessionResult broken = adapter.parseCreateSessionResponse(jsonResponse(200, QByteArrayLiteral("{}")));
    QCOMPARE(broken.error.kind, Error::BadServerResponse);
    QVERIFY(broken.sessionHandle.isEmpty());
}

void OneDriveAdapterTest::testFragmentSize_data()
{
    QTest::addColumn<qint64>("configured");
    QTest::addColumn<qint64>("expected");

    QTest::newRow("default") << qint64(10 * 1024 * 1024) << qint64(10 * 1024 * 1024);
    QTest::newRow("rounded down") << qint64(1000000) << qint64(983040);
    QTest::newRow("below granularity") << qint64(1000) << OneDriveAdapter::FragmentGranularity;
    QTest::newRow("zero") << qint64(0) << OneDriveAdapter::FragmentGranularity;
}

void OneDriveAdapterTest::testFragmentSize()
{
    QFETCH(qint64, configured);
    QFETCH(qint64, expected);

    OneDriveSettings settings;
    settings.fragmentSize = configured;
    OneDriveAdapter adapter(QStringLiteral("secret"), settings);

    QCOMPARE(adapter.fragmentSize(), expected);
    QCOMPARE(adapter.fragmentSize() % OneDriveAdapter::FragmentGranularity, 0);
}

void OneDriveAdapterTest::testPartRequest()
{
    OneDriveAdapter adapter(QStringLiteral("secret"));
    const UploadTarget target = uploadTarget(250, 100);
    const QByteArray data(50, 'z');

    const Request request = adapter.buildPartRequest(target, TransferRange{200, 250}, data);

    QCOMPARE(request.verb, QByteArrayLiteral("PUT"));
    QCOMPARE(request.request.url(), QUrl(target.sessionHandle));
    QCOMPARE(request.request.rawHeader(QByteArrayLiteral("Content-Range")), QByteArrayLiteral("bytes 200-249/250"));
    QCOMPARE(request.request.header(QNetworkRequest::ContentLengthHeader).toLongLong(), 50);
    // The upload URL carries its own credentials
    QVERIFY(!request.request.hasRawHeader(QByteArrayLiteral("Authorization")));
    QCOMPARE(request.body, data);
}

void OneDriveAdapterTest::testParseExpectedRange_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<bool>("valid");
    QTest::addColumn<qint64>("lower");
    QTest::addColumn<qint64>("upper");

    // Total size 1000, part size 100
    QTest::newRow("open ended") << QStringLiteral("26-") << true << qint64(26) << qint64(126);
    QTest::newRow("closed inside part") << QStringLiteral("26-99") << true << qint64(26) << qint64(100);
    QTest::newRow("closed beyond part") << QStringLiteral("26-500") << true << qint64(26) << qint64(126);
    QTest::newRow("open ended tail") << QStringLiteral("950-") << true << qint64(950) << qint64(1000);
    QTest::newRow("single byte") << QStringLiteral("999-999") << true << qint64(999) << qint64(1000);
    QTest::newRow("not a range") << QStringLiteral("abc") << false << qint64(0) << qint64(0);
    QTest::newRow("no lower bound") << QStringLiteral("-5") << false << qint64(0) << qint64(0);
    QTest::newRow("past the end") << QStringLiteral("1000-") << false << qint64(0) << qint64(0);
    QTest::newRow("reversed") << QStringLiteral("50-40") << false << qint64(0) << qint64(0);
    QTest::newRow("garbage end") << QStringLiteral("50-x") << false << qint64(0) << qint64(0);
}

void OneDriveAdapterTest::testParseExpectedRange()
{
    QFETCH(QString, text);
    QFETCH(bool, valid);
    QFETCH(qint64, lower);
    QFETCH(qint64, upper);

    const std::optional<TransferRange> range = OneDriveAdapter::parseExpectedRange(text, uploadTarget(1000, 100));

    QCOMPARE(range.has_value(), valid);
    if (valid) {
        QCOMPARE(range->lowerBound, lower);
        QCOMPARE(range->upperBound, upper);
    }
}

void OneDriveAdapterTest::testParsePartResponse()
{
    OneDriveAdapter adapter(QStringLiteral("secret"));
    const UploadTarget target = uploadTarget(250, 100);

    const PartResult accepted = adapter.parsePartResponse(jsonResponse(202, R"({"expirationDateTime":"2024-03-02T11:30:00Z","nextExpectedRanges":["100-"]})"), target);
    QVERIFY(!accepted.error.isError());
    QVERIFY(accepted.completionId.isEmpty());
    QCOMPARE(accepted.continuationRange, std::optional<TransferRange>(TransferRange{100, 200}));

    const PartResult noRanges = adapter.parsePartResponse(jsonResponse(202, QByteArrayLiteral("{}")), target);
    QVERIFY(!noRanges.error.isError());
    QVERIFY(!noRanges.continuationRange);
    QVERIFY(noRanges.completionId.isEmpty());
}

void OneDriveAdapterTest::testParseFinalPartResponse()
{
    OneDriveAdapter adapter(QStringLiteral("secret"));

    const PartResult created = adapter.parsePartResponse(jsonResponse(201, R"({"id":"01BYE5RZ6Q","name":"report.pdf","size":250})"), uploadTarget(250, 100));
    QVERIFY(!created.error.isError());
    QCOMPARE(created.completionId, QStringLiteral("01BYE5RZ6Q"));
    QVERIFY(!created.continuationRange);

    const PartResult replaced = adapter.parsePartResponse(jsonResponse(200, R"({"id":"01BYE5RZ7R"})"), uploadTarget(250, 100));
    QCOMPARE(replaced.completionId, QStringLiteral("01BYE5RZ7R"));
}

void OneDriveAdapterTest::testParseFinalPartWithoutItem()
{
    OneDriveAdapter adapter(QStringLiteral("secret"));

    const PartResult result = adapter.parsePartResponse(jsonResponse(201, QByteArrayLiteral("{}")), uploadTarget(250, 100));

    QCOMPARE(result.error.kind, Error::BadServerResponse);
}

void OneDriveAdapterTest::testParseMalformedExpectedRange()
{
    OneDriveAdapter adapter(QStringLiteral("secret"));

    const PartResult result = adapter.parsePartResponse(jsonResponse(202, R"({"nextExpectedRanges":["soon"]})"), uploadTarget(250, 100));

    QCOMPARE(result.error.kind, Error::BadServerResponse);
    QVERIFY(result.error.errorMessage.contains(QStringLiteral("soon")));
}

void OneDriveAdapterTest::testCancelRequest()
{
    OneDriveAdapter adapter(QStringLiteral("secret"));
    const QString handle = uploadTarget(250, 100).sessionHandle;

    const Request request = adapter.buildCancelRequest(handle);

    QCOMPARE(request.verb, QByteArrayLiteral("DELETE"));
    QCOMPARE(request.request.url(), QUrl(handle));
}

void OneDriveAdapterTest::testMapServerError()
{
    OneDriveAdapter adapter(QStringLiteral("secret"));
    const QByteArray body = R"({"error":{"code":"itemNotFound","message":"The resource could not be found."}})";

    const Error error = adapter.errorMapper()(404, body, QStringLiteral("/missing"));

    QCOMPARE(error.kind, Error::ProviderReportedError);
    QCOMPARE(error.httpStatus, 404);
    QCOMPARE(error.errorMessage, QStringLiteral("itemNotFound: The resource could not be found."));
    QCOMPARE(error.path, QStringLiteral("/missing"));
}

void OneDriveAdapterTest::testMapServerErrorWithoutJson()
{
    OneDriveAdapter adapter(QStringLiteral("secret"));

    const Error error = adapter.mapServerError(502, QByteArrayLiteral("  Bad Gateway\n"), QString());

    QCOMPARE(error.kind, Error::ProviderReportedError);
    QCOMPARE(error.errorMessage, QStringLiteral("Bad Gateway"));
}

#include "onedriveadaptertest.moc"
