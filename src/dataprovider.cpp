/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "dataprovider.h"
#include "clouddrivedebug.h"

#include <QFile>

namespace CloudDrive
{
DataProvider bufferDataProvider(const QByteArray &data)
{
    return [data](const TransferRange &range) {
        DataResult result;
        if (range.lowerBound < 0 || range.lowerBound >= range.upperBound || range.upperBound > data.size()) {
            result.errorMessage = QStringLiteral("Range [%1, %2) is outside of the %3 byte buffer").arg(range.lowerBound).arg(range.upperBound).arg(data.size());
            return result;
        }

        result.data = data.mid(range.lowerBound, range.length());
        result.success = true;
        return result;
    };
}

DataProvider fileDataProvider(const QString &filePath)
{
    return [filePath](const TransferRange &range) {
        DataResult result;

        QFile file(filePath);
        if (!file.open(QIODevice::ReadOnly)) {
            result.errorMessage = QStringLiteral("Failed to open %1: %2").arg(filePath, file.errorString());
            qCWarning(CLOUDDRIVE) << result.errorMessage;
            return result;
        }

        if (range.lowerBound < 0 || range.upperBound > file.size() || !file.seek(range.lowerBound)) {
            result.errorMessage = QStringLiteral("Cannot seek to offset %1 of %2").arg(range.lowerBound).arg(filePath);
            qCWarning(CLOUDDRIVE) << result.errorMessage;
            return result;
        }

        result.data = file.read(range.length());
        if (result.data.size() != range.length()) {
            result.errorMessage = QStringLiteral("Short read of %1: got %2 of %3 bytes").arg(filePath).arg(result.data.size()).arg(range.length());
            qCWarning(CLOUDDRIVE) << result.errorMessage;
            result.data.clear();
            return result;
        }

        result.success = true;
        return result;
    };
}
}
