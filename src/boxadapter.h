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
struct BoxSettings {
    QUrl apiUrl = QUrl(QStringLiteral("https://api.box.com/2.0"));
    int pageSize = 1000;
};

/**
 * Box folder listings. Box pages by numeric offset; paths are folder ids,
 * "0" (or an empty path) being the root folder.
 *
 * There is no upload adapter. Box upload sessions do assign the part size
 * (part_size in the session response), but they end with a separate commit
 * carrying the SHA-1 digest of the file and the list of uploaded parts, which
 * the create / part / complete flow of ChunkedUploadSession has no step for.
 * uploadAdapter() therefore stays nullptr and Client reports Unsupported.
 */
class BoxAdapter : public ProviderAdapter, public ListingAdapter
{
public:
    explicit BoxAdapter(const QString &accessToken, const BoxSettings &settings = BoxSettings());

    QString name() const override;
    ListingAdapter *listingAdapter() override;
    Error mapServerError(int httpStatus, const QByteArray &body, const QString &path) const override;

    std::optional<Request> buildListRequest(const QString &rootPath, const PageToken &cursor) override;
    PageResult<DriveItem> parseListResponse(const Response &response) override;

    static DriveItem parseItem(const QJsonObject &object);

private:
    QString m_accessToken;
    BoxSettings m_settings;
};
}
