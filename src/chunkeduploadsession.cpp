/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "chunkeduploadsession.h"
#include "clouddrivedebug.h"
#include "provideradapter.h"

#include <QNetworkAccessManager>
#include <QPointer>

#include <utility>

using namespace CloudDrive;

std::unique_ptr<ChunkedUploadSession> ChunkedUploadSession::start(QNetworkAccessManager *network,
                                                                  UploadAdapter *adapter,
                                                                  const ErrorMapper &errorMapper,
                                                                  const QString &targetPath,
                                                                  const DataProvider &dataProvider,
                                                                  qint64 totalSize,
                                                                  const UploadOptions &options,
                                                                  Error *error)
{
    auto reject = [&](Error::Kind kind, const QString &message) -> std::unique_ptr<ChunkedUploadSession> {
        qCWarning(CLOUDDRIVE) << "Not uploading" << targetPath << "-" << message;
        if (error) {
            *error = Error(kind, message);
            error->path = targetPath;
        }
        return nullptr;
    };

    if (totalSize <= 0) {
        return reject(Error::Unsupported, QStringLiteral("Uploads need at least one byte of data"));
    }
    if (!network || !adapter) {
        return reject(Error::Unsupported, QStringLiteral("Chunked uploads are not supported by this provider"));
    }
    if (!dataProvider) {
        return reject(Error::DataSourceFailure, QStringLiteral("Missing upload data source"));
    }

    std::unique_ptr<ChunkedUploadSession> session(new ChunkedUploadSession(network, adapter, errorMapper, targetPath, dataProvider, totalSize, options));
    ChunkedUploadSession *raw = session.get();
    QMetaObject::invokeMethod(
        raw,
        [raw]() {
            raw->createSession();
        },
        Qt::QueuedConnection);

    if (error) {
        *error = Error();
    }
    return session;
}

ChunkedUploadSession::ChunkedUploadSession(QNetworkAccessManager *network,
                                           UploadAdapter *adapter,
                                           const ErrorMapper &errorMapper,
                                           const QString &targetPath,
                                           const DataProvider &dataProvider,
                                           qint64 totalSize,
                                           const UploadOptions &options)
    : QObject(nullptr)
    , m_operations(network)
    , m_adapter(adapter)
    , m_errorMapper(errorMapper)
    , m_targetPath(targetPath)
    , m_dataProvider(dataProvider)
    , m_options(options)
{
    m_upload.target.totalSize = totalSize;
}

ChunkedUploadSession::~ChunkedUploadSession()
{
    if (!isFinished()) {
        qCDebug(CLOUDDRIVE) << "Upload of" << m_targetPath << "destroyed while active";
        teardown();
    }
}

void ChunkedUploadSession::cancel()
{
    if (isFinished()) {
        return;
    }

    qCDebug(CLOUDDRIVE) << "Cancelling upload of" << m_targetPath << "after" << m_upload.uploadedSoFar << "bytes";
    teardown();

    Error error(Error::Cancelled, QStringLiteral("Upload of %1 was cancelled").arg(m_targetPath));
    error.path = m_targetPath;
    error.range = m_upload.currentRange;

    m_state = State::Cancelled;
    m_upload.currentRange.reset();
    m_error = error;
    Q_EMIT failed(m_error);
}

ChunkedUploadSession::State ChunkedUploadSession::state() const
{
    return m_state;
}

bool ChunkedUploadSession::isFinished() const
{
    return m_state == State::Completed || m_state == State::Failed || m_state == State::Cancelled;
}

QString ChunkedUploadSession::targetPath() const
{
    return m_targetPath;
}

qint64 ChunkedUploadSession::totalSize() const
{
    return m_upload.target.totalSize;
}

qint64 ChunkedUploadSession::partSize() const
{
    return m_upload.target.partSize;
}

qint64 ChunkedUploadSession::uploadedSoFar() const
{
    return m_upload.uploadedSoFar;
}

std::optional<TransferRange> ChunkedUploadSession::currentRange() const
{
    return m_upload.currentRange;
}

QString ChunkedUploadSession::completionId() const
{
    return m_completionId;
}

Error ChunkedUploadSession::error() const
{
    return m_error;
}

void ChunkedUploadSession::createSession()
{
    // Cancelled before the event loop got here
    if (m_state != State::Idle) {
        return;
    }

    qCDebug(CLOUDDRIVE) << "Creating upload session for" << m_targetPath << "of" << m_upload.target.totalSize << "bytes";

    Request request = m_adapter->buildCreateSessionRequest(m_targetPath, m_upload.target.totalSize, m_options);
    if (request.path.isEmpty()) {
        request.path = m_targetPath;
    }
    m_pendingOperation = m_operations.send(request, [this](const Response &response) {
        onSessionCreated(response);
    });
}

void ChunkedUploadSession::onSessionCreated(const Response &response)
{
    m_pendingOperation = 0;

    if (std::optional<Error> error = responseError(response, m_errorMapper)) {
        fail(*error);
        return;
    }

    const SessionResult session = m_adapter->parseCreateSessionResponse(response);
    if (session.error.isError()) {
        Error error = session.error;
        if (error.url.isEmpty()) {
            error.url = response.url;
        }
        fail(error);
        return;
    }

    if (session.sessionHandle.isEmpty() || session.partSize <= 0) {
        Error error(Error::BadServerResponse, QStringLiteral("Upload session response carries no session handle or part size"), response.httpStatus);
        error.url = response.url;
        fail(error);
        return;
    }

    m_upload.target.sessionHandle = session.sessionHandle;
    m_upload.target.partSize = qMin(session.partSize, m_upload.target.totalSize);
    m_state = State::SessionCreated;

    qCDebug(CLOUDDRIVE) << "Upload session created for" << m_targetPath << "part size" << m_upload.target.partSize;

    uploadPart(TransferRange{0, m_upload.target.partSize});
}

void ChunkedUploadSession::uploadPart(const TransferRange &range)
{
    const DataResult data = m_dataProvider(range);
    if (!data.success || data.data.size() != range.length()) {
        const QString message = data.success
            ? QStringLiteral("Data source returned %1 bytes instead of %2").arg(data.data.size()).arg(range.length())
            : data.errorMessage;
        Error error(Error::DataSourceFailure, message);
        error.range = range;
        fail(error);
        return;
    }

    m_upload.currentRange = range;
    m_state = State::PartInFlight;

    Request request = m_adapter->buildPartRequest(m_upload.target, range, data.data);
    if (request.path.isEmpty()) {
        request.path = m_targetPath;
    }

    qCDebug(CLOUDDRIVE) << "Uploading part" << range << "of" << m_upload.target.totalSize << "for" << m_targetPath;
    m_pendingOperation = m_operations.send(request, [this, range](const Response &response) {
        onPartUploaded(range, response);
    });
}

void ChunkedUploadSession::onPartUploaded(const TransferRange &range, const Response &response)
{
    m_pendingOperation = 0;

    if (std::optional<Error> error = responseError(response, m_errorMapper)) {
        error->range = range;
        fail(*error);
        return;
    }

    const PartResult part = m_adapter->parsePartResponse(response, m_upload.target);
    if (part.error.isError()) {
        Error error = part.error;
        if (error.url.isEmpty()) {
            error.url = response.url;
        }
        if (!error.range) {
            error.range = range;
        }
        fail(error);
        return;
    }

    if (!part.completionId.isEmpty()) {
        m_upload.uploadedSoFar = m_upload.target.totalSize;
        if (reportPart(range)) {
            complete(part.completionId);
        }
        return;
    }

    if (part.continuationRange) {
        const TransferRange next = *part.continuationRange;
        if (!next.isValidFor(m_upload.target.totalSize)) {
            Error error(Error::BadServerResponse,
                        QStringLiteral("Server asked for the invalid range [%1, %2) of %3 bytes")
                            .arg(next.lowerBound)
                            .arg(next.upperBound)
                            .arg(m_upload.target.totalSize),
                        response.httpStatus);
            error.url = response.url;
            error.range = range;
            fail(error);
            return;
        }

        // Sending the same bytes again would be a retry
        if (next.lowerBound <= range.lowerBound) {
            Error error(Error::BadServerResponse,
                        QStringLiteral("Server asked for [%1, %2) after [%3, %4), which makes no progress")
                            .arg(next.lowerBound)
                            .arg(next.upperBound)
                            .arg(range.lowerBound)
                            .arg(range.upperBound),
                        response.httpStatus);
            error.url = response.url;
            error.range = range;
            fail(error);
            return;
        }

        if (part.partSize && *part.partSize > 0) {
            m_upload.target.partSize = qMin(*part.partSize, m_upload.target.totalSize);
        }

        const std::optional<TransferRange> local = nextLocalRange(range);
        if (!local || *local != next) {
            qCDebug(CLOUDDRIVE) << "Server continuation" << next << "replaces the computed range for" << m_targetPath;
        }

        // The server knows what it persisted, so trust its offset over ours
        m_upload.uploadedSoFar = next.lowerBound;
        if (reportPart(range)) {
            uploadPart(next);
        }
        return;
    }

    m_upload.uploadedSoFar += range.length();
    if (!reportPart(range)) {
        return;
    }

    const std::optional<TransferRange> next = nextLocalRange(range);
    if (!next) {
        Error error(Error::BadServerResponse, QStringLiteral("Server accepted the last part without completing the upload"), response.httpStatus);
        error.url = response.url;
        error.range = range;
        fail(error);
        return;
    }

    uploadPart(*next);
}

std::optional<TransferRange> ChunkedUploadSession::nextLocalRange(const TransferRange &previous) const
{
    const qint64 lower = previous.upperBound;
    if (lower >= m_upload.target.totalSize) {
        return std::nullopt;
    }
    return TransferRange{lower, qMin(lower + m_upload.target.partSize, m_upload.target.totalSize)};
}

bool ChunkedUploadSession::reportPart(const TransferRange &range)
{
    // Slots may cancel or even delete the session
    const QPointer<ChunkedUploadSession> guard(this);

    Q_EMIT partUploaded(range);
    if (!guard || isFinished()) {
        return false;
    }

    Q_EMIT progress(m_upload.uploadedSoFar, m_upload.target.totalSize);
    return guard && !isFinished();
}

void ChunkedUploadSession::complete(const QString &completionId)
{
    m_state = State::Completed;
    m_completionId = completionId;
    m_upload.currentRange.reset();

    qCDebug(CLOUDDRIVE) << "Upload of" << m_targetPath << "completed as" << completionId;
    Q_EMIT completed();
}

void ChunkedUploadSession::fail(Error error)
{
    if (error.path.isEmpty()) {
        error.path = m_targetPath;
    }

    m_state = State::Failed;
    m_upload.currentRange.reset();
    m_error = error;

    qCWarning(CLOUDDRIVE) << "Upload of" << m_targetPath << "failed after" << m_upload.uploadedSoFar << "bytes:" << m_error;
    Q_EMIT failed(m_error);
}

void ChunkedUploadSession::teardown()
{
    m_upload.cancelled = true;
    m_operations.abort(std::exchange(m_pendingOperation, 0));

    const QString sessionHandle = m_upload.target.sessionHandle;
    if (sessionHandle.isEmpty()) {
        return;
    }

    QNetworkAccessManager *network = m_operations.network();
    if (!network) {
        qCDebug(CLOUDDRIVE) << "Network gone, leaving the upload session of" << m_targetPath << "to expire";
        return;
    }

    // Fire and forget, the cancellation itself already happened
    const Request request = m_adapter->buildCancelRequest(sessionHandle);
    QNetworkReply *reply = sendRequest(network, request);
    const QString targetPath = m_targetPath;
    connect(reply, &QNetworkReply::finished, reply, [reply, targetPath]() {
        if (reply->error() != QNetworkReply::NoError) {
            qCDebug(CLOUDDRIVE) << "Could not discard the upload session of" << targetPath << reply->errorString();
        }
        reply->deleteLater();
    });
}
