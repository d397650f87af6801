/*
 * SPDX-FileCopyrightText: 2024 KDE Contributors
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "clouddriveclient.h"
#include "clouddrivedebug.h"
#include "clouddriveversion.h"
#include "dataprovider.h"

#include <QEventLoop>
#include <QFileInfo>
#include <QNetworkAccessManager>

#include <utility>

using namespace CloudDrive;

Client::Client(std::unique_ptr<ProviderAdapter> adapter, QNetworkAccessManager *network, QObject *parent)
    : QObject(parent)
    , m_adapter(std::move(adapter))
    , m_network(network ? network : new QNetworkAccessManager(this))
{
    qCDebug(CLOUDDRIVE) << "clouddrive" << CLOUDDRIVE_VERSION_STRING << "client for" << (m_adapter ? m_adapter->name() : QStringLiteral("no provider"));
}

Client::~Client()
{
    const QList<QPointer<ChunkedUploadSession>> uploads = std::exchange(m_uploads, {});
    for (const QPointer<ChunkedUploadSession> &upload : uploads) {
        if (upload && !upload->isFinished()) {
            qCDebug(CLOUDDRIVE) << "Client going away, cancelling upload of" << upload->targetPath();
            upload->cancel();
        }
    }
}

ProviderAdapter *Client::adapter() const
{
    return m_adapter.get();
}

QNetworkAccessManager *Client::network() const
{
    return m_network;
}

bool Client::supportsListing() const
{
    return m_adapter && m_adapter->listingAdapter();
}

bool Client::supportsUpload() const
{
    return m_adapter && m_adapter->uploadAdapter();
}

ListResult Client::listAll(const QString &rootPath)
{
    ListResult result;
    bool finished = false;

    QEventLoop loop;
    ListingHandle paginator = listAllAsync(
        rootPath,
        [&](const PageResult<DriveItem> &page) {
            result.items = page.items;
            result.error = page.error;
            finished = true;
            loop.quit();
        },
        &result.error);

    if (!paginator) {
        return result;
    }

    // The completion may already have run if no request could be built
    if (!finished) {
        loop.exec();
    }

    result.success = !result.error.isError();
    return result;
}

ListingHandle Client::listAllAsync(const QString &rootPath, const Paginator<DriveItem>::Completion &completion, Error *error)
{
    ListingAdapter *listing = m_adapter ? m_adapter->listingAdapter() : nullptr;
    if (!listing) {
        if (error) {
            *error = unsupported(QStringLiteral("Listing"), rootPath);
        }
        return nullptr;
    }

    if (error) {
        *error = Error();
    }

    auto paginator = std::make_unique<Paginator<DriveItem>>(
        m_network,
        [listing, rootPath](const PageToken &token) {
            return listing->buildListRequest(rootPath, token);
        },
        [listing](const Response &response) {
            return listing->parseListResponse(response);
        },
        m_adapter->errorMapper());

    qCDebug(CLOUDDRIVE) << "Listing" << rootPath << "on" << m_adapter->name();
    paginator->runToCompletion(completion);
    return paginator;
}

UploadHandle Client::upload(const QString &targetPath, const DataProvider &dataProvider, qint64 totalSize, const UploadOptions &options, Error *error)
{
    UploadAdapter *uploader = m_adapter ? m_adapter->uploadAdapter() : nullptr;
    if (!uploader) {
        const Error reason = unsupported(QStringLiteral("Chunked upload"), targetPath);
        qCWarning(CLOUDDRIVE) << reason;
        if (error) {
            *error = reason;
        }
        return nullptr;
    }

    UploadHandle session = ChunkedUploadSession::start(m_network, uploader, m_adapter->errorMapper(), targetPath, dataProvider, totalSize, options, error);
    if (session) {
        m_uploads.removeAll(QPointer<ChunkedUploadSession>());
        m_uploads.append(session.get());
    }
    return session;
}

UploadHandle Client::uploadData(const QString &targetPath, const QByteArray &data, const UploadOptions &options, Error *error)
{
    return upload(targetPath, bufferDataProvider(data), data.size(), options, error);
}

UploadHandle Client::uploadFile(const QString &targetPath, const QString &localFile, const UploadOptions &options, Error *error)
{
    const QFileInfo info(localFile);
    if (!info.isFile() || !info.isReadable()) {
        qCWarning(CLOUDDRIVE) << "Cannot upload" << localFile << "- not a readable file";
        if (error) {
            *error = Error(Error::DataSourceFailure, QStringLiteral("%1 is not a readable file").arg(localFile));
            error->path = targetPath;
        }
        return nullptr;
    }

    return upload(targetPath, fileDataProvider(localFile), info.size(), options, error);
}

Error Client::unsupported(const QString &capability, const QString &path) const
{
    const QString provider = m_adapter ? m_adapter->name() : QStringLiteral("this client");
    Error error(Error::Unsupported, QStringLiteral("%1 is not supported by %2").arg(capability, provider));
    error.path = path;
    return error;
}
