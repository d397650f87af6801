/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "provideradapter.h"

#include <QJsonObject>
#include <QUrl>

namespace CloudDrive
{
struct GoogleDriveSettings {
    QUrl apiUrl = QUrl(QStringLiteral("https://www.googleapis.com/drive/v3"));
    int pageSize = 100;
};

/**
 * Google Drive v3 folder listings, paged by nextPageToken. Paths are folder
 * ids; an empty path lists "root".
 */
class GoogleDriveAdapter : public ProviderAdapter, public ListingAdapter
{
public:
    static const QString FolderMimeType;

    explicit GoogleDriveAdapter(const QString &accessToken, const GoogleDriveSettings &settings = GoogleDriveSettings());

    QString name() const override;
    ListingAdapter *listingAdapter() override;
    Error mapServerError(int httpStatus, const QByteArray &body, const QString &path) const override;

    std::optional<Request> buildListRequest(const QString &rootPath, const PageToken &cursor) override;
    PageResult<DriveItem> parseListResponse(const Response &response) override;

    static DriveItem parseItem(const QJsonObject &object);

private:
    QString m_accessToken;
    GoogleDriveSettings m_settings;
};
}
