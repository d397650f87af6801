/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "../src/chunkeduploadsession.h"
#include "../src/dataprovider.h"
#include "../src/provideradapter.h"
#include "fakenetworkaccessmanager.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSignalSpy>
#include <QTest>

#include <functional>
#include <memory>

using namespace CloudDrive;

namespace
{
const QString SessionHandle = QStringLiteral("https://upload.example/sessions/S1");

struct PartUpload {
    TransferRange range;
    qint64 total = 0;
    QByteArray body;
};

PartUpload parsePartUpload(const RecordedRequest &request)
{
    // "bytes 100-199/250"
    PartUpload part;
    const QByteArray header = request.request.rawHeader(QByteArrayLiteral("Content-Range"));
    const QList<QByteArray> rangeAndTotal = header.mid(6).split('/');
    const QList<QByteArray> bounds = rangeAndTotal.value(0).split('-');
    part.range.lowerBound = bounds.value(0).toLongLong();
    part.range.upperBound = bounds.value(1).toLongLong() + 1;
    part.total = rangeAndTotal.value(1).toLongLong();
    part.body = request.body;
    return part;
}

QByteArray toJson(const QJsonObject &object)
{
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

FakeResponse sessionCreated(qint64 partSize)
{
    QJsonObject root;
    root.insert(QStringLiteral("session"), SessionHandle);
    root.insert(QStringLiteral("partSize"), partSize);
    return FakeResponse::json(200, toJson(root));
}

FakeResponse partAccepted()
{
    return FakeResponse::json(202, QByteArrayLiteral("{}"));
}

FakeResponse uploadDone()
{
    return FakeResponse::json(201, QByteArrayLiteral("{\"id\":\"file-1\"}"));
}

FakeResponse continueWith(qint64 lower, qint64 upper, qint64 partSize = 0)
{
    QJsonObject root;
    root.insert(QStringLiteral("next"), QJsonArray({lower, upper}));
    if (partSize > 0) {
        root.insert(QStringLiteral("partSize"), partSize);
    }
    return FakeResponse::json(202, toJson(root));
}

/**
 * A minimal create / put / delete protocol: the session carries the part size,
 * part answers may carry a continuation range and an item id on completion.
 */
class ScriptedUploadAdapter : public UploadAdapter
{
public:
    Request buildCreateSessionRequest(const QString &targetPath, qint64 totalSize, const UploadOptions &options) override
    {
        QJsonObject root;
        root.insert(QStringLiteral("path"), targetPath);
        root.insert(QStringLiteral("size"), totalSize);
        root.insert(QStringLiteral("overwrite"), options.overwrite);

        Request request;
        request.verb = QByteArrayLiteral("POST");
        request.request = QNetworkRequest(QUrl(QStringLiteral("https://upload.example/sessions")));
        request.body = toJson(root);
        request.path = targetPath;
        return request;
    }

    SessionResult parseCreateSessionResponse(const Response &response) override
    {
        SessionResult result;
        const QJsonObject root = QJsonDocument::fromJson(response.body).object();
        result.sessionHandle = root.value(QStringLiteral("session")).toString();
        result.partSize = root.value(QStringLiteral("partSize")).toVariant().toLongLong();
        if (result.sessionHandle.isEmpty()) {
            result.error = Error(Error::BadServerResponse, QStringLiteral("no session"), response.httpStatus);
        }
        return result;
    }

    Request buildPartRequest(const UploadTarget &target, const TransferRange &range, const QByteArray &data) override
    {
        Request request;
        request.verb = QByteArrayLiteral("PUT");
        request.request = QNetworkRequest(QUrl(target.sessionHandle));
        request.request.setRawHeader(QByteArrayLiteral("Content-Range"), range.toContentRange(target.totalSize));
        request.body = data;
        return request;
    }

    PartResult parsePartResponse(const Response &response, const UploadTarget &target) override
    {
        Q_UNUSED(target)

        PartResult result;
        QJsonParseError parseError;
        const QJsonDocument document = QJsonDocument::fromJson(response.body, &parseError);
        if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
            result.error = Error(Error::BadServerResponse, QStringLiteral("unparseable part response"), response.httpStatus);
            return result;
        }

        const QJsonObject root = document.object();
        result.completionId = root.value(QStringLiteral("id")).toString();

        const QJsonArray next = root.value(QStringLiteral("next")).toArray();
        if (next.size() == 2) {
            result.continuationRange = TransferRange{next.at(0).toVariant().toLongLong(), next.at(1).toVariant().toLongLong()};
        }
        if (root.contains(QStringLiteral("partSize"))) {
            result.partSize = root.value(QStringLiteral("partSize")).toVariant().toLongLong();
        }
        return result;
    }

    Request buildCancelRequest(const QString &sessionHandle) override
    {
        Request request;
        request.verb = QByteArrayLiteral("DELETE");
        request.request = QNetworkRequest(QUrl(sessionHandle));
        return request;
    }
};

Error mapError(int httpStatus, const QByteArray &body, const QString &path)
{
    Error error(Error::ProviderReportedError, QJsonDocument::fromJson(body).object().value(QStringLiteral("message")).toString(), httpStatus);
    error.path = path;
    return error;
}

QByteArray payload(qint64 size)
{
    QByteArray data;
    data.reserve(size);
    for (qint64 i = 0; i < size; ++i) {
        data.append(static_cast<char>('a' + i % 26));
    }
    return data;
}
}

class ChunkedUploadTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void testUploadInThreeParts();
    void testPartsTileThePayload_data();
    void testPartsTileThePayload();
    void testServerContinuationOverridesLocalRange();
    void testContinuationRevisesPartSize();
    void testInvalidContinuationFails();
    void testContinuationWithoutProgressFails_data();
    void testContinuationWithoutProgressFails();
    void testEmptyPayloadIsRejected();
    void testMissingDataProviderIsRejected();
    void testCancelWhilePartInFlight();
    void testCancelBeforeSessionExists();
    void testCancelAfterCompletionIsNoop();
    void testCancelFromPartUploadedSlot();
    void testDestroyWhilePartInFlight();
    void testDataProviderFailure();
    void testShortReadIsRejected();
    void testCreateSessionHttpError();
    void testPartHttpError();
    void testPartTransportFailure();
    void testUnparseablePartResponse();
    void testFailedSessionDeleteIsIgnored();
    void testSessionWithoutHandle();
    void testLastPartAcceptedWithoutCompletion();

private:
    void serveUpload(qint64 partSize, const std::function<FakeResponse(const PartUpload &part)> &onPart = {});
    [[nodiscard]] std::unique_ptr<ChunkedUploadSession> startUpload(const QByteArray &data, Error *error = nullptr);
    [[nodiscard]] std::unique_ptr<ChunkedUploadSession> startUpload(const DataProvider &provider, qint64 totalSize, Error *error = nullptr);
    QList<PartUpload> partUploads() const;

    std::unique_ptr<FakeNetworkAccessManager> m_network;
    ScriptedUploadAdapter m_adapter;
};

QTEST_GUILESS_MAIN(ChunkedUploadTest)

void ChunkedUploadTest::init()
{
    m_network = std::make_unique<FakeNetworkAccessManager>();
}

void ChunkedUploadTest::cleanup()
{
    m_network.reset();
}

void ChunkedUploadTest::serveUpload(qint64 partSize, const std::function<FakeResponse(const PartUpload &part)> &onPart)
{
    m_network->setHandler([partSize, onPart](const RecordedRequest &request) {
        if (request.verb == "POST") {
            return sessionCreated(partSize);
        }
        if (request.verb == "DELETE") {
            return FakeResponse::json(204, QByteArray());
        }

        const PartUpload part = parsePartUpload(request);
        if (onPart) {
            return onPart(part);
        }
        return part.range.upperBound == part.total ? uploadDone() : partAccepted();
    });
}

std::unique_ptr<ChunkedUploadSession> ChunkedUploadTest::startUpload(const QByteArray &data, Error *error)
{
    return startUpload(bufferDataProvider(data), data.size(), error);
}

std::unique_ptr<ChunkedUploadSession> ChunkedUploadTest::startUpload(const DataProvider &provider, qint64 totalSize, Error *error)
{
    return ChunkedUploadSession::start(m_network.get(), &m_adapter, mapError, QStringLiteral("/Documents/report.pdf"), provider, totalSize, UploadOptions(), error);
}

QList<PartUpload> ChunkedUploadTest::partUploads() const
{
    QList<PartUpload> parts;
    const QList<RecordedRequest> puts = m_network->requests(QByteArrayLiteral("PUT"));
    for (const RecordedRequest &request : puts) {
        parts.append(parsePartUpload(request));
    }
    return parts;
}

void ChunkedUploadTest::testUploadInThreeParts()
{
    serveUpload(100);
    const QByteArray data = payload(250);

    Error error;
    auto session = startUpload(data, &error);
    QVERIFY(session);
    QCOMPARE(error.kind, Error::NoError);

    QSignalSpy partSpy(session.get(), &ChunkedUploadSession::partUploaded);
    QSignalSpy progressSpy(session.get(), &ChunkedUploadSession::progress);
    QSignalSpy completedSpy(session.get(), &ChunkedUploadSession::completed);
    QSignalSpy failedSpy(session.get(), &ChunkedUploadSession::failed);

    // Nothing goes out before the event loop runs
    QCOMPARE(m_network->requestCount(), 0);
    QCOMPARE(session->state(), ChunkedUploadSession::State::Idle);

    QTRY_COMPARE(completedSpy.count(), 1);
    QCOMPARE(failedSpy.count(), 0);

    QCOMPARE(partSpy.count(), 3);
    QCOMPARE(partSpy.at(0).at(0).value<TransferRange>(), (TransferRange{0, 100}));
    QCOMPARE(partSpy.at(1).at(0).value<TransferRange>(), (TransferRange{100, 200}));
    QCOMPARE(partSpy.at(2).at(0).value<TransferRange>(), (TransferRange{200, 250}));

    QCOMPARE(progressSpy.count(), 3);
    const QList<qint64> expectedProgress = {100, 200, 250};
    for (int i = 0; i < progressSpy.count(); ++i) {
        QCOMPARE(progressSpy.at(i).at(0).toLongLong(), expectedProgress.at(i));
        QCOMPARE(progressSpy.at(i).at(1).toLongLong(), 250);
    }

    const QList<PartUpload> parts = partUploads();
    QCOMPARE(parts.size(), 3);
    QCOMPARE(m_network->requests(QByteArrayLiteral("PUT")).at(0).request.rawHeader(QByteArrayLiteral("Content-Range")), QByteArrayLiteral("bytes 0-99/250"));
    QCOMPARE(m_network->requests(QByteArrayLiteral("PUT")).at(2).request.rawHeader(QByteArrayLiteral("Content-Range")), QByteArrayLiteral("bytes 200-249/250"));
    QCOMPARE(parts.at(0).body + parts.at(1).body + parts.at(2).body, data);

    QCOMPARE(m_network->requests(QByteArrayLiteral("POST")).size(), 1);
    QCOMPARE(m_network->requests(QByteArrayLiteral("DELETE")).size(), 0);

    QCOMPARE(session->state(), ChunkedUploadSession::State::Completed);
    QVERIFY(session->isFinished());
    QCOMPARE(session->completionId(), QStringLiteral("file-1"));
    QCOMPARE(session->uploadedSoFar(), 250);
    QCOMPARE(session->partSize(), 100);
    QVERIFY(!session->currentRange());
    QVERIFY(!session->error().isError());
}

void ChunkedUploadTest::testPartsTileThePayload_data()
{
    QTest::addColumn<qint64>("totalSize");
    QTest::addColumn<qint64>("partSize");
    QTest::addColumn<int>("expectedParts");

    QTest::newRow("one byte") << qint64(1) << qint64(100) << 1;
    QTest::newRow("exactly one part") << qint64(100) << qint64(100) << 1;
    QTest::newRow("one byte over") << qint64(101) << qint64(100) << 2;
    QTest::newRow("exact multiple") << qint64(300) << qint64(100) << 3;
    QTest::newRow("small parts") << qint64(1000) << qint64(7) << 143;
    QTest::newRow("part larger than payload") << qint64(250) << qint64(1000) << 1;
}

void ChunkedUploadTest::testPartsTileThePayload()
{
    QFETCH(qint64, totalSize);
    QFETCH(qint64, partSize);
    QFETCH(int, expectedParts);

    serveUpload(partSize);
    const QByteArray data = payload(totalSize);

    auto session = startUpload(data);
    QVERIFY(session);
    QSignalSpy completedSpy(session.get(), &ChunkedUploadSession::completed);
    QTRY_COMPARE(completedSpy.count(), 1);

    const QList<PartUpload> parts = partUploads();
    QCOMPARE(parts.size(), expectedParts);

    qint64 expectedLower = 0;
    QByteArray uploaded;
    for (const PartUpload &part : parts) {
        QCOMPARE(part.range.lowerBound, expectedLower);
        QVERIFY(part.range.length() > 0);
        QVERIFY(part.range.length() <= partSize);
        QCOMPARE(part.total, totalSize);
        expectedLower = part.range.upperBound;
        uploaded += part.body;
    }
    QCOMPARE(expectedLower, totalSize);
    QCOMPARE(uploaded, data);
}

void ChunkedUploadTest::testServerContinuationOverridesLocalRange()
{
    serveUpload(100, [](const PartUpload &part) {
        if (part.range.lowerBound == 0) {
            // Only the first half of the part was persisted
            return continueWith(50, 150);
        }
        return part.range.upperBound == part.total ? uploadDone() : partAccepted();
    });
    const QByteArray data = payload(250);

    auto session = startUpload(data);
    QVERIFY(session);
    QSignalSpy progressSpy(session.get(), &ChunkedUploadSession::progress);
    QSignalSpy completedSpy(session.get(), &ChunkedUploadSession::completed);
    QTRY_COMPARE(completedSpy.count(), 1);

    const QList<PartUpload> parts = partUploads();
    QCOMPARE(parts.size(), 3);
    QCOMPARE(parts.at(0).range, (TransferRange{0, 100}));
    QCOMPARE(parts.at(1).range, (TransferRange{50, 150}));
    QCOMPARE(parts.at(1).body, data.mid(50, 100));
    QCOMPARE(parts.at(2).range, (TransferRange{150, 250}));

    QCOMPARE(progressSpy.count(), 3);
    QCOMPARE(progressSpy.at(0).at(0).toLongLong(), 50);
    QCOMPARE(progressSpy.at(1).at(0).toLongLong(), 150);
    QCOMPARE(progressSpy.at(2).at(0).toLongLong(), 250);
}

void ChunkedUploadTest::testContinuationRevisesPartSize()
{
    serveUpload(100, [](const PartUpload &part) {
        if (part.range.lowerBound == 0) {
            return continueWith(100, 160, 60);
        }
        return part.range.upperBound == part.total ? uploadDone() : partAccepted();
    });

    auto session = startUpload(payload(250));
    QVERIFY(session);
    QSignalSpy completedSpy(session.get(), &ChunkedUploadSession::completed);
    QTRY_COMPARE(completedSpy.count(), 1);

    const QList<PartUpload> parts = partUploads();
    QCOMPARE(parts.size(), 4);
    QCOMPARE(parts.at(1).range, (TransferRange{100, 160}));
    QCOMPARE(parts.at(2).range, (TransferRange{160, 220}));
    QCOMPARE(parts.at(3).range, (TransferRange{220, 250}));
    QCOMPARE(session->partSize(), 60);
}

void ChunkedUploadTest::testInvalidContinuationFails()
{
    serveUpload(100, [](const PartUpload &) {
        return continueWith(200, 300);
    });

    auto session = startUpload(payload(250));
    QVERIFY(session);
    QSignalSpy completedSpy(session.get(), &ChunkedUploadSession::completed);
    QSignalSpy failedSpy(session.get(), &ChunkedUploadSession::failed);
    QTRY_COMPARE(failedSpy.count(), 1);

    const Error error = failedSpy.at(0).at(0).value<Error>();
    QCOMPARE(error.kind, Error::BadServerResponse);
    QCOMPARE(error.range, std::optional<TransferRange>(TransferRange{0, 100}));
    QCOMPARE(completedSpy.count(), 0);
    QCOMPARE(m_network->requests(QByteArrayLiteral("PUT")).size(), 1);
    QCOMPARE(session->state(), ChunkedUploadSession::State::Failed);
}

void ChunkedUploadTest::testContinuationWithoutProgressFails_data()
{
    QTest::addColumn<qint64>("answeredLower");
    QTest::addColumn<qint64>("nextLower");
    QTest::addColumn<qint64>("nextUpper");
    QTest::addColumn<int>("expectedPuts");

    QTest::newRow("repeats the part") << qint64(0) << qint64(0) << qint64(100) << 1;
    QTest::newRow("repeats a later part") << qint64(100) << qint64(100) << qint64(200) << 2;
    QTest::newRow("moves backwards") << qint64(100) << qint64(50) << qint64(150) << 2;
    QTest::newRow("restarts from zero") << qint64(200) << qint64(0) << qint64(100) << 3;
}

void ChunkedUploadTest::testContinuationWithoutProgressFails()
{
    QFETCH(qint64, answeredLower);
    QFETCH(qint64, nextLower);
    QFETCH(qint64, nextUpper);
    QFETCH(int, expectedPuts);

    serveUpload(100, [answeredLower, nextLower, nextUpper](const PartUpload &part) {
        if (part.range.lowerBound == answeredLower) {
            return continueWith(nextLower, nextUpper);
        }
        return part.range.upperBound == part.total ? uploadDone() : partAccepted();
    });

    auto session = startUpload(payload(250));
    QVERIFY(session);
    QSignalSpy completedSpy(session.get(), &ChunkedUploadSession::completed);
    QSignalSpy failedSpy(session.get(), &ChunkedUploadSession::failed);
    QTRY_COMPARE(failedSpy.count(), 1);
    QTest::qWait(10);

    const Error error = failedSpy.at(0).at(0).value<Error>();
    QCOMPARE(error.kind, Error::BadServerResponse);
    QCOMPARE(error.url, QUrl(SessionHandle));
    QCOMPARE(error.range, std::optional<TransferRange>(TransferRange{answeredLower, qMin<qint64>(answeredLower + 100, 250)}));
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(completedSpy.count(), 0);
    QCOMPARE(m_network->requests(QByteArrayLiteral("PUT")).size(), expectedPuts);
    QCOMPARE(session->state(), ChunkedUploadSession::State::Failed);
}

void ChunkedUploadTest::testEmptyPayloadIsRejected()
{
    serveUpload(100);

    Error error;
    auto session = startUpload(QByteArray(), &error);

    QVERIFY(!session);
    QCOMPARE(error.kind, Error::Unsupported);
    QCOMPARE(error.path, QStringLiteral("/Documents/report.pdf"));

    QTest::qWait(10);
    QCOMPARE(m_network->requestCount(), 0);
}

void ChunkedUploadTest::testMissingDataProviderIsRejected()
{
    Error error;
    auto session = startUpload(DataProvider(), 250, &error);

    QVERIFY(!session);
    QCOMPARE(error.kind, Error::DataSourceFailure);
    QTest::qWait(10);
    QCOMPARE(m_network->requestCount(), 0);
}

void ChunkedUploadTest::testCancelWhilePartInFlight()
{
    serveUpload(100, [](const PartUpload &part) {
        if (part.range.lowerBound == 100) {
            return FakeResponse::held();
        }
        return partAccepted();
    });

    auto session = startUpload(payload(250));
    QVERIFY(session);
    QSignalSpy completedSpy(session.get(), &ChunkedUploadSession::completed);
    QSignalSpy failedSpy(session.get(), &ChunkedUploadSession::failed);

    QTRY_COMPARE(m_network->requests(QByteArrayLiteral("PUT")).size(), 2);
    QCOMPARE(session->state(), ChunkedUploadSession::State::PartInFlight);
    QCOMPARE(session->currentRange(), std::optional<TransferRange>(TransferRange{100, 200}));

    session->cancel();

    QCOMPARE(failedSpy.count(), 1);
    const Error error = failedSpy.at(0).at(0).value<Error>();
    QCOMPARE(error.kind, Error::Cancelled);
    QCOMPARE(error.range, std::optional<TransferRange>(TransferRange{100, 200}));
    QCOMPARE(session->state(), ChunkedUploadSession::State::Cancelled);
    QCOMPARE(session->uploadedSoFar(), 100);
    QCOMPARE(m_network->abortedCount(), 1);

    const QList<RecordedRequest> deletes = m_network->requests(QByteArrayLiteral("DELETE"));
    QCOMPARE(deletes.size(), 1);
    QCOMPARE(deletes.at(0).url, QUrl(SessionHandle));

    session->cancel();
    QTest::qWait(10);
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(completedSpy.count(), 0);
    QCOMPARE(m_network->requests(QByteArrayLiteral("PUT")).size(), 2);
    QCOMPARE(m_network->requests(QByteArrayLiteral("DELETE")).size(), 1);
}

void ChunkedUploadTest::testCancelBeforeSessionExists()
{
    serveUpload(100);

    auto session = startUpload(payload(250));
    QVERIFY(session);
    QSignalSpy failedSpy(session.get(), &ChunkedUploadSession::failed);

    session->cancel();
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(0).value<Error>().kind, Error::Cancelled);

    QTest::qWait(10);
    QCOMPARE(m_network->requestCount(), 0);
    QCOMPARE(failedSpy.count(), 1);
}

void ChunkedUploadTest::testCancelAfterCompletionIsNoop()
{
    serveUpload(100);

    auto session = startUpload(payload(150));
    QVERIFY(session);
    QSignalSpy completedSpy(session.get(), &ChunkedUploadSession::completed);
    QSignalSpy failedSpy(session.get(), &ChunkedUploadSession::failed);
    QTRY_COMPARE(completedSpy.count(), 1);

    const int requests = m_network->requestCount();
    session->cancel();
    QTest::qWait(10);

    QCOMPARE(failedSpy.count(), 0);
    QCOMPARE(session->state(), ChunkedUploadSession::State::Completed);
    QCOMPARE(m_network->requestCount(), requests);
}

void ChunkedUploadTest::testCancelFromPartUploadedSlot()
{
    serveUpload(100);

    auto session = startUpload(payload(250));
    QVERIFY(session);
    ChunkedUploadSession *raw = session.get();
    connect(raw, &ChunkedUploadSession::partUploaded, raw, [raw]() {
        raw->cancel();
    });
    QSignalSpy progressSpy(raw, &ChunkedUploadSession::progress);
    QSignalSpy completedSpy(raw, &ChunkedUploadSession::completed);
    QSignalSpy failedSpy(raw, &ChunkedUploadSession::failed);

    QTRY_COMPARE(failedSpy.count(), 1);
    QTest::qWait(10);

    QCOMPARE(failedSpy.at(0).at(0).value<Error>().kind, Error::Cancelled);
    QCOMPARE(completedSpy.count(), 0);
    QCOMPARE(progressSpy.count(), 0);
    QCOMPARE(m_network->requests(QByteArrayLiteral("PUT")).size(), 1);
    QCOMPARE(m_network->requests(QByteArrayLiteral("DELETE")).size(), 1);
}

void ChunkedUploadTest::testDestroyWhilePartInFlight()
{
    serveUpload(100, [](const PartUpload &) {
        return FakeResponse::held();
    });

    auto session = startUpload(payload(250));
    QVERIFY(session);
    int terminalSignals = 0;
    connect(session.get(), &ChunkedUploadSession::completed, this, [&terminalSignals]() {
        ++terminalSignals;
    });
    connect(session.get(), &ChunkedUploadSession::failed, this, [&terminalSignals]() {
        ++terminalSignals;
    });

    QTRY_COMPARE(m_network->requests(QByteArrayLiteral("PUT")).size(), 1);
    session.reset();
    QTest::qWait(10);

    QCOMPARE(terminalSignals, 0);
    QCOMPARE(m_network->abortedCount(), 1);
    QCOMPARE(m_network->requests(QByteArrayLiteral("DELETE")).size(), 1);
}

void ChunkedUploadTest::testDataProviderFailure()
{
    serveUpload(100);
    const QByteArray data = payload(250);

    auto session = startUpload(
        [data](const TransferRange &range) {
            DataResult result;
            if (range.lowerBound >= 100) {
                result.errorMessage = QStringLiteral("disk went away");
                return result;
            }
            result.data = data.mid(range.lowerBound, range.length());
            result.success = true;
            return result;
        },
        data.size());
    QVERIFY(session);
    QSignalSpy failedSpy(session.get(), &ChunkedUploadSession::failed);
    QTRY_COMPARE(failedSpy.count(), 1);

    const Error error = failedSpy.at(0).at(0).value<Error>();
    QCOMPARE(error.kind, Error::DataSourceFailure);
    QCOMPARE(error.errorMessage, QStringLiteral("disk went away"));
    QCOMPARE(error.range, std::optional<TransferRange>(TransferRange{100, 200}));
    QCOMPARE(session->uploadedSoFar(), 100);
    QCOMPARE(m_network->requests(QByteArrayLiteral("PUT")).size(), 1);
}

void ChunkedUploadTest::testShortReadIsRejected()
{
    serveUpload(100);

    auto session = startUpload(
        [](const TransferRange &range) {
            DataResult result;
            result.data = QByteArray(range.length() - 1, 'x');
            result.success = true;
            return result;
        },
        250);
    QVERIFY(session);
    QSignalSpy failedSpy(session.get(), &ChunkedUploadSession::failed);
    QTRY_COMPARE(failedSpy.count(), 1);

    QCOMPARE(failedSpy.at(0).at(0).value<Error>().kind, Error::DataSourceFailure);
    QCOMPARE(m_network->requests(QByteArrayLiteral("PUT")).size(), 0);
}

void ChunkedUploadTest::testCreateSessionHttpError()
{
    m_network->enqueue(FakeResponse::json(403, QByteArrayLiteral("{\"message\":\"quota exceeded\"}")));

    auto session = startUpload(payload(250));
    QVERIFY(session);
    QSignalSpy completedSpy(session.get(), &ChunkedUploadSession::completed);
    QSignalSpy failedSpy(session.get(), &ChunkedUploadSession::failed);
    QTRY_COMPARE(failedSpy.count(), 1);

    const Error error = failedSpy.at(0).at(0).value<Error>();
    QCOMPARE(error.kind, Error::ProviderReportedError);
    QCOMPARE(error.httpStatus, 403);
    QCOMPARE(error.errorMessage, QStringLiteral("quota exceeded"));
    QCOMPARE(error.path, QStringLiteral("/Documents/report.pdf"));
    QCOMPARE(completedSpy.count(), 0);
    QCOMPARE(m_network->requestCount(), 1);
}

void ChunkedUploadTest::testPartHttpError()
{
    serveUpload(100, [](const PartUpload &part) {
        if (part.range.lowerBound == 100) {
            return FakeResponse::json(500, QByteArrayLiteral("{\"message\":\"backend\"}"));
        }
        return partAccepted();
    });

    auto session = startUpload(payload(250));
    QVERIFY(session);
    QSignalSpy failedSpy(session.get(), &ChunkedUploadSession::failed);
    QTRY_COMPARE(failedSpy.count(), 1);

    const Error error = failedSpy.at(0).at(0).value<Error>();
    QCOMPARE(error.kind, Error::ProviderReportedError);
    QCOMPARE(error.httpStatus, 500);
    QCOMPARE(error.range, std::optional<TransferRange>(TransferRange{100, 200}));
    QCOMPARE(session->uploadedSoFar(), 100);
    QCOMPARE(session->error().httpStatus, 500);
}

void ChunkedUploadTest::testPartTransportFailure()
{
    serveUpload(100, [](const PartUpload &part) {
        if (part.range.lowerBound == 100) {
            return FakeResponse::networkFailure(QNetworkReply::RemoteHostClosedError);
        }
        return partAccepted();
    });

    auto session = startUpload(payload(250));
    QVERIFY(session);
    QSignalSpy completedSpy(session.get(), &ChunkedUploadSession::completed);
    QSignalSpy failedSpy(session.get(), &ChunkedUploadSession::failed);
    QTRY_COMPARE(failedSpy.count(), 1);

    const Error error = failedSpy.at(0).at(0).value<Error>();
    QCOMPARE(error.kind, Error::TransportFailure);
    QCOMPARE(error.httpStatus, 0);
    QCOMPARE(error.url, QUrl(SessionHandle));
    QCOMPARE(error.path, QStringLiteral("/Documents/report.pdf"));
    QCOMPARE(error.range, std::optional<TransferRange>(TransferRange{100, 200}));
    QVERIFY(!error.errorMessage.isEmpty());
    QCOMPARE(completedSpy.count(), 0);
    QCOMPARE(session->uploadedSoFar(), 100);
    QCOMPARE(m_network->requests(QByteArrayLiteral("PUT")).size(), 2);
    QCOMPARE(m_network->requests(QByteArrayLiteral("DELETE")).size(), 0);
}

void ChunkedUploadTest::testUnparseablePartResponse()
{
    serveUpload(100, [](const PartUpload &part) {
        if (part.range.lowerBound == 100) {
            return FakeResponse::json(202, QByteArrayLiteral("<html>Bad Gateway</html>"));
        }
        return partAccepted();
    });

    auto session = startUpload(payload(250));
    QVERIFY(session);
    QSignalSpy completedSpy(session.get(), &ChunkedUploadSession::completed);
    QSignalSpy failedSpy(session.get(), &ChunkedUploadSession::failed);
    QTRY_COMPARE(failedSpy.count(), 1);

    const Error error = failedSpy.at(0).at(0).value<Error>();
    QCOMPARE(error.kind, Error::BadServerResponse);
    QCOMPARE(error.url, QUrl(SessionHandle));
    QCOMPARE(error.range, std::optional<TransferRange>(TransferRange{100, 200}));
    QCOMPARE(error.path, QStringLiteral("/Documents/report.pdf"));
    QCOMPARE(completedSpy.count(), 0);
    QCOMPARE(m_network->requests(QByteArrayLiteral("PUT")).size(), 2);
}

void ChunkedUploadTest::testFailedSessionDeleteIsIgnored()
{
    m_network->setHandler([](const RecordedRequest &request) {
        if (request.verb == "POST") {
            return sessionCreated(100);
        }
        if (request.verb == "DELETE") {
            return FakeResponse::json(500, QByteArrayLiteral("{\"message\":\"cannot delete\"}"));
        }
        return FakeResponse::held();
    });

    auto session = startUpload(payload(250));
    QVERIFY(session);
    QSignalSpy completedSpy(session.get(), &ChunkedUploadSession::completed);
    QSignalSpy failedSpy(session.get(), &ChunkedUploadSession::failed);

    QTRY_COMPARE(m_network->requests(QByteArrayLiteral("PUT")).size(), 1);
    session->cancel();
    QCOMPARE(failedSpy.count(), 1);

    // Let the DELETE fail
    QTRY_COMPARE(m_network->requests(QByteArrayLiteral("DELETE")).size(), 1);
    QTest::qWait(10);

    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(completedSpy.count(), 0);
    QCOMPARE(failedSpy.at(0).at(0).value<Error>().kind, Error::Cancelled);
    QCOMPARE(session->state(), ChunkedUploadSession::State::Cancelled);
    QCOMPARE(session->error().kind, Error::Cancelled);
}

void ChunkedUploadTest::testSessionWithoutHandle()
{
    m_network->enqueue(FakeResponse::json(200, QByteArrayLiteral("{}")));

    auto session = startUpload(payload(250));
    QVERIFY(session);
    QSignalSpy failedSpy(session.get(), &ChunkedUploadSession::failed);
    QTRY_COMPARE(failedSpy.count(), 1);

    QCOMPARE(failedSpy.at(0).at(0).value<Error>().kind, Error::BadServerResponse);
    QCOMPARE(m_network->requests(QByteArrayLiteral("PUT")).size(), 0);
}

void ChunkedUploadTest::testLastPartAcceptedWithoutCompletion()
{
    serveUpload(100, [](const PartUpload &) {
        return partAccepted();
    });

    auto session = startUpload(payload(250));
    QVERIFY(session);
    QSignalSpy completedSpy(session.get(), &ChunkedUploadSession::completed);
    QSignalSpy failedSpy(session.get(), &ChunkedUploadSession::failed);
    QTRY_COMPARE(failedSpy.count(), 1);

    const Error error = failedSpy.at(0).at(0).value<Error>();
    QCOMPARE(error.kind, Error::BadServerResponse);
    QCOMPARE(error.range, std::optional<TransferRange>(TransferRange{200, 250}));
    QCOMPARE(completedSpy.count(), 0);
    QCOMPARE(m_network->requests(QByteArrayLiteral("PUT")).size(), 3);
}

#include "chunkeduploadtest.moc"
