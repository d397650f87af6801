/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "clouddrivetypes.h"

#include <QDebug>

using namespace CloudDrive;

QByteArray TransferRange::toContentRange(qint64 totalSize) const
{
    return QByteArrayLiteral("bytes ") + QByteArray::number(lowerBound) + '-' + QByteArray::number(upperBound - 1) + '/' + QByteArray::number(totalSize);
}

Error::Error(Kind kind, const QString &errorMessage, int httpStatus)
    : kind(kind)
    , httpStatus(httpStatus)
    , errorMessage(errorMessage)
{
}

QString Error::kindName(Kind kind)
{
    switch (kind) {
    case NoError:
        return QStringLiteral("NoError");
    case BadServerResponse:
        return QStringLiteral("BadServerResponse");
    case TransportFailure:
        return QStringLiteral("TransportFailure");
    case ProviderReportedError:
        return QStringLiteral("ProviderReportedError");
    case PaginationProtocolError:
        return QStringLiteral("PaginationProtocolError");
    case DataSourceFailure:
        return QStringLiteral("DataSourceFailure");
    case Cancelled:
        return QStringLiteral("Cancelled");
    case Unsupported:
        return QStringLiteral("Unsupported");
    }
    return QString();
}

QString Error::toString() const
{
    if (!isError()) {
        return kindName(kind);
    }

    QString text = kindName(kind);
    if (httpStatus > 0) {
        text += QStringLiteral(" (HTTP %1)").arg(httpStatus);
    }
    if (!errorMessage.isEmpty()) {
        text += QStringLiteral(": ") + errorMessage;
    }
    if (!path.isEmpty()) {
        text += QStringLiteral(" [path: %1]").arg(path);
    }
    if (!url.isEmpty()) {
        text += QStringLiteral(" [url: %1]").arg(url.toDisplayString());
    }
    if (range) {
        text += QStringLiteral(" [range: %1-%2)").arg(range->lowerBound).arg(range->upperBound);
    }
    return text;
}

QDebug operator<<(QDebug debug, const TransferRange &range)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << '[' << range.lowerBound << ", " << range.upperBound << ')';
    return debug;
}

QDebug operator<<(QDebug debug, const Error &error)
{
    QDebugStateSaver saver(debug);
    debug.noquote() << error.toString();
    return debug;
}
