/*
 * SPDX-FileCopyrightText: 2024 KDE Contributors
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "chunkeduploadsession.h"
#include "clouddrivetypes.h"
#include "paginator.h"
#include "provideradapter.h"

#include <QList>
#include <QObject>
#include <QPointer>

#include <memory>

class QNetworkAccessManager;

namespace CloudDrive
{
struct ListResult {
    bool success = false;
    Error error;
    // Also filled on failure, with the items of the pages read before it
    QList<DriveItem> items;
};

using UploadHandle = std::unique_ptr<ChunkedUploadSession>;
using ListingHandle = std::unique_ptr<Paginator<DriveItem>>;

class Client : public QObject
{
    Q_OBJECT
public:
    /**
     * @param network The network access manager to use. If nullptr, the
     * client creates its own.
     */
    explicit Client(std::unique_ptr<ProviderAdapter> adapter, QNetworkAccessManager *network = nullptr, QObject *parent = nullptr);
    ~Client() override;

    ProviderAdapter *adapter() const;
    QNetworkAccessManager *network() const;

    [[nodiscard]] bool supportsListing() const;
    [[nodiscard]] bool supportsUpload() const;

    /**
     * Lists everything below @p rootPath, following all pages. Blocks in a
     * local event loop until the listing ends.
     */
    [[nodiscard]] ListResult listAll(const QString &rootPath);

    /**
     * Starts the same listing without blocking. @p completion runs once the
     * last page arrived or the listing failed.
     *
     * @return nullptr if the provider cannot list, with @p error set.
     */
    [[nodiscard]] ListingHandle listAllAsync(const QString &rootPath, const Paginator<DriveItem>::Completion &completion, Error *error = nullptr);

    /**
     * Starts a chunked upload. The caller owns the returned session; if the
     * client is destroyed first, the session is cancelled and reports
     * Error::Cancelled.
     *
     * @return nullptr if the upload cannot start, with @p error set.
     */
    [[nodiscard]] UploadHandle upload(const QString &targetPath,
                                      const DataProvider &dataProvider,
                                      qint64 totalSize,
                                      const UploadOptions &options = UploadOptions(),
                                      Error *error = nullptr);
    [[nodiscard]] UploadHandle uploadData(const QString &targetPath, const QByteArray &data, const UploadOptions &options = UploadOptions(), Error *error = nullptr);
    [[nodiscard]] UploadHandle uploadFile(const QString &targetPath, const QString &localFile, const UploadOptions &options = UploadOptions(), Error *error = nullptr);

private:
    [[nodiscard]] Error unsupported(const QString &capability, const QString &path) const;

    std::unique_ptr<ProviderAdapter> m_adapter;
    QNetworkAccessManager *m_network;
    // Sessions still refer to m_adapter and m_network
    QList<QPointer<ChunkedUploadSession>> m_uploads;
};
}
