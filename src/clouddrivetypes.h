/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QUrl>

#include <functional>
#include <optional>

class QDebug;

namespace CloudDrive
{
/**
 * Server page cursor. Empty means "first page". Numeric offsets are carried
 * as their decimal representation; only the adapter interprets the value.
 */
using PageToken = std::optional<QString>;

/**
 * Half-open byte range [lowerBound, upperBound) of one upload part.
 */
struct TransferRange {
    qint64 lowerBound = 0;
    qint64 upperBound = 0;

    qint64 length() const
    {
        return upperBound - lowerBound;
    }

    bool isValidFor(qint64 totalSize) const
    {
        return lowerBound >= 0 && lowerBound < upperBound && upperBound <= totalSize;
    }

    /**
     * @return The value of a Content-Range header for this range, e.g.
     * "bytes 0-99/250". HTTP ranges are inclusive.
     */
    QByteArray toContentRange(qint64 totalSize) const;

    bool operator==(const TransferRange &other) const
    {
        return lowerBound == other.lowerBound && upperBound == other.upperBound;
    }
    bool operator!=(const TransferRange &other) const
    {
        return !(*this == other);
    }
};

struct Error {
    enum Kind {
        NoError,
        BadServerResponse,
        TransportFailure,
        ProviderReportedError,
        PaginationProtocolError,
        DataSourceFailure,
        Cancelled,
        Unsupported,
    };

    Kind kind = NoError;
    int httpStatus = 0;
    QString errorMessage;
    QString path;
    QUrl url;
    std::optional<TransferRange> range;

    Error() = default;
    Error(Kind kind, const QString &errorMessage, int httpStatus = 0);

    bool isError() const
    {
        return kind != NoError;
    }

    static QString kindName(Kind kind);
    QString toString() const;
};

struct DriveItem {
    QString id;
    QString name;
    QString parentId;
    QString driveId;
    QString mimeType;
    QString downloadUrl;
    QString etag;
    QString hash;
    bool isFolder = false;
    qint64 size = -1;
    QDateTime lastModified;
    QDateTime created;
};

template<typename T>
struct PageResult {
    QList<T> items;
    PageToken nextToken;
    Error error;
};

struct UploadTarget {
    qint64 totalSize = 0;
    qint64 partSize = 0;
    QString sessionHandle;
};

struct UploadState {
    UploadTarget target;
    qint64 uploadedSoFar = 0;
    std::optional<TransferRange> currentRange;
    bool cancelled = false;
};

struct UploadOptions {
    QString mimeType;
    bool overwrite = true;
};

struct DataResult {
    bool success = false;
    QString errorMessage;
    QByteArray data;
};

/**
 * Produces the bytes of one part. Implementations must return exactly
 * range.length() bytes on success.
 */
using DataProvider = std::function<DataResult(const TransferRange &range)>;

/**
 * Turns an HTTP error status and body into an Error. Implemented by the
 * provider adapter; the core never looks at error bodies itself.
 */
using ErrorMapper = std::function<Error(int httpStatus, const QByteArray &body, const QString &path)>;
}

QDebug operator<<(QDebug debug, const CloudDrive::TransferRange &range);
QDebug operator<<(QDebug debug, const CloudDrive::Error &error);

Q_DECLARE_METATYPE(CloudDrive::TransferRange)
Q_DECLARE_METATYPE(CloudDrive::Error)
