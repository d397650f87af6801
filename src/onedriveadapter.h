/*
 * SPDX-FileCopyrightText: 2024 KDE Contributors
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
struct OneDriveSettings {
    QUrl apiUrl = QUrl(QStringLiteral("https://graph.microsoft.com"));
    int pageSize = 200;
    // Rounded down to a multiple of 320 KiB, as Graph requires
    qint64 fragmentSize = 10 * 1024 * 1024;
};

/**
 * Microsoft Graph (OneDrive personal drive).
 *
 * Listing pages are chained through @odata.nextLink, which is used verbatim
 * as the next request URL. Uploads use createUploadSession; the upload URL
 * is the session handle.
 */
class OneDriveAdapter : public ProviderAdapter, public ListingAdapter, public UploadAdapter
{
public:
    static constexpr qint64 FragmentGranularity = 320 * 1024;

    explicit OneDriveAdapter(const QString &accessToken, const OneDriveSettings &settings = OneDriveSettings());

    QString name() const override;
    ListingAdapter *listingAdapter() override;
    UploadAdapter *uploadAdapter() override;
    Error mapServerError(int httpStatus, const QByteArray &body, const QString &path) const override;

    std::optional<Request> buildListRequest(const QString &rootPath, const PageToken &cursor) override;
    PageResult<DriveItem> parseListResponse(const Response &response) override;

    Request buildCreateSessionRequest(const QString &targetPath, qint64 totalSize, const UploadOptions &options) override;
    SessionResult parseCreateSessionResponse(const Response &response) override;
    Request buildPartRequest(const UploadTarget &target, const TransferRange &range, const QByteArray &data) override;
    PartResult parsePartResponse(const Response &response, const UploadTarget &target) override;
    Request buildCancelRequest(const QString &sessionHandle) override;

    void setAccessToken(const QString &accessToken);
    qint64 fragmentSize() const;

    /**
     * Parses one entry of nextExpectedRanges ("26-" or "26-99", inclusive)
     * into a range of at most one part.
     */
    static std::optional<TransferRange> parseExpectedRange(const QString &text, const UploadTarget &target);

    static DriveItem parseItem(const QJsonObject &object);

private:
    [[nodiscard]] QNetworkRequest buildRequest(const QUrl &url) const;
    [[nodiscard]] QUrl itemPathUrl(const QString &relativePath, const QString &suffix) const;

    QString m_accessToken;
    OneDriveSettings m_settings;
};
}
