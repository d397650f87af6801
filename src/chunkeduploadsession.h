/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "clouddrivetypes.h"
#include "networkoperations.h"

#include <QObject>

#include <memory>
#include <optional>

class QNetworkAccessManager;

namespace CloudDrive
{
class UploadAdapter;

/**
 * One resumable upload against a create-session / PUT-part / complete
 * protocol.
 *
 * Parts are sent strictly one after another. The first part is
 * [0, min(partSize, totalSize)), each following one starts where the previous
 * one ended, unless the server answers with a continuation range, which is
 * then used as is for the next part.
 *
 * Exactly one of completed() and failed() is emitted per upload; a
 * cancellation is reported through failed() with Error::Cancelled.
 *
 * The session lives as long as the handle returned by start(). Destroying an
 * active session aborts it without emitting anything. The adapter must
 * outlive any active session; Client cancels its uploads before it lets go
 * of its adapter. Once the network access manager is gone the remote session
 * is left to expire.
 */
class ChunkedUploadSession : public QObject
{
    Q_OBJECT
public:
    enum class State {
        Idle,
        SessionCreated,
        PartInFlight,
        Completed,
        Failed,
        Cancelled,
    };
    Q_ENUM(State)

    ~ChunkedUploadSession() override;

    /**
     * Creates an upload of @p totalSize bytes to @p targetPath. The remote
     * session is created once control returns to the event loop, so signals
     * can be connected to the returned handle first.
     *
     * @return nullptr if the upload cannot start (for instance an empty
     * payload), in which case @p error, if given, says why. No request is
     * made in that case.
     */
    [[nodiscard]] static std::unique_ptr<ChunkedUploadSession> start(QNetworkAccessManager *network,
                                                                     UploadAdapter *adapter,
                                                                     const ErrorMapper &errorMapper,
                                                                     const QString &targetPath,
                                                                     const DataProvider &dataProvider,
                                                                     qint64 totalSize,
                                                                     const UploadOptions &options = UploadOptions(),
                                                                     Error *error = nullptr);

    /**
     * Aborts the upload. The in-flight request is cancelled and the remote
     * session, if one exists, is deleted on a best-effort basis.
     * Does nothing once the upload finished.
     */
    void cancel();

    State state() const;
    bool isFinished() const;

    QString targetPath() const;
    qint64 totalSize() const;
    qint64 partSize() const;
    qint64 uploadedSoFar() const;
    std::optional<TransferRange> currentRange() const;
    QString completionId() const;
    Error error() const;

Q_SIGNALS:
    void progress(qint64 bytesUploaded, qint64 totalBytes);
    void partUploaded(const CloudDrive::TransferRange &range);
    void completed();
    void failed(const CloudDrive::Error &error);

private:
    ChunkedUploadSession(QNetworkAccessManager *network,
                         UploadAdapter *adapter,
                         const ErrorMapper &errorMapper,
                         const QString &targetPath,
                         const DataProvider &dataProvider,
                         qint64 totalSize,
                         const UploadOptions &options);

    void createSession();
    void onSessionCreated(const Response &response);
    void uploadPart(const TransferRange &range);
    void onPartUploaded(const TransferRange &range, const Response &response);

    std::optional<TransferRange> nextLocalRange(const TransferRange &previous) const;
    [[nodiscard]] bool reportPart(const TransferRange &range);

    void complete(const QString &completionId);
    void fail(Error error);
    void teardown();

    NetworkOperations m_operations;
    UploadAdapter *m_adapter;
    ErrorMapper m_errorMapper;
    QString m_targetPath;
    DataProvider m_dataProvider;
    UploadOptions m_options;

    UploadState m_upload;
    State m_state = State::Idle;
    quint64 m_pendingOperation = 0;
    QString m_completionId;
    Error m_error;
};
}
