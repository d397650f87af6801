/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "googledriveadapter.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkRequest>
#include <QUrlQuery>

using namespace CloudDrive;

const QString GoogleDriveAdapter::FolderMimeType = QStringLiteral("application/vnd.google-apps.folder");

GoogleDriveAdapter::GoogleDriveAdapter(const QString &accessToken, const GoogleDriveSettings &settings)
    : m_accessToken(accessToken)
    , m_settings(settings)
{
}

QString GoogleDriveAdapter::name() const
{
    return QStringLiteral("GoogleDrive");
}

ListingAdapter *GoogleDriveAdapter::listingAdapter()
{
    return this;
}

Error GoogleDriveAdapter::mapServerError(int httpStatus, const QByteArray &body, const QString &path) const
{
    Error error(Error::ProviderReportedError, QString(), httpStatus);
    error.path = path;

    const QJsonObject errorObj = QJsonDocument::fromJson(body).object().value(QStringLiteral("error")).toObject();
    error.errorMessage = errorObj.value(QStringLiteral("message")).toString();
    if (error.errorMessage.isEmpty()) {
        error.errorMessage = QString::fromUtf8(body).trimmed();
    }
    return error;
}

std::optional<Request> GoogleDriveAdapter::buildListRequest(const QString &rootPath, const PageToken &cursor)
{
    QString folderId = rootPath.trimmed();
    folderId.remove(QLatin1Char('/'));
    if (folderId.isEmpty()) {
        folderId = QStringLiteral("root");
    }

    QUrl url = m_settings.apiUrl;
    url.setPath(url.path() + QStringLiteral("/files"));

    QUrlQuery query;
    query.addQueryItem(QStringLiteral("q"), QStringLiteral("'%1' in parents and trashed = false").arg(folderId));
    query.addQueryItem(QStringLiteral("fields"), QStringLiteral("nextPageToken,files(id,name,size,md5Checksum,createdTime,modifiedTime,mimeType,parents)"));
    query.addQueryItem(QStringLiteral("pageSize"), QString::number(m_settings.pageSize));
    if (cursor) {
        query.addQueryItem(QStringLiteral("pageToken"), *cursor);
    }
    url.setQuery(query);

    QNetworkRequest networkRequest(url);
    networkRequest.setRawHeader("Authorization", "Bearer " + m_accessToken.toUtf8());

    Request request;
    request.request = networkRequest;
    request.path = folderId;
    return request;
}

PageResult<DriveItem> GoogleDriveAdapter::parseListResponse(const Response &response)
{
    PageResult<DriveItem> result;

    QJsonParseError parseError;
    const QJsonObject root = QJsonDocument::fromJson(response.body, &parseError).object();
    if (parseError.error != QJsonParseError::NoError || !root.value(QStringLiteral("files")).isArray()) {
        result.error = Error(Error::BadServerResponse, QStringLiteral("Google Drive listing carries no files array"), response.httpStatus);
        result.error.url = response.url;
        result.error.path = response.path;
        return result;
    }

    const QJsonArray files = root.value(QStringLiteral("files")).toArray();
    for (const QJsonValue &file : files) {
        result.items.append(parseItem(file.toObject()));
    }

    const QString nextPageToken = root.value(QStringLiteral("nextPageToken")).toString();
    if (!nextPageToken.isEmpty()) {
        result.nextToken = nextPageToken;
    }
    return result;
}

DriveItem GoogleDriveAdapter::parseItem(const QJsonObject &object)
{
    DriveItem item;
    item.id = object.value(QStringLiteral("id")).toString();
    item.name = object.value(QStringLiteral("name")).toString();
    item.mimeType = object.value(QStringLiteral("mimeType")).toString();
    item.isFolder = item.mimeType == FolderMimeType;
    // Drive v3 sends sizes as strings
    bool ok = false;
    const qint64 size = object.value(QStringLiteral("size")).toString().toLongLong(&ok);
    item.size = ok ? size : -1;
    item.hash = object.value(QStringLiteral("md5Checksum")).toString();
    item.created = QDateTime::fromString(object.value(QStringLiteral("createdTime")).toString(), Qt::ISODate);
    item.lastModified = QDateTime::fromString(object.value(QStringLiteral("modifiedTime")).toString(), Qt::ISODate);
    const QJsonArray parents = object.value(QStringLiteral("parents")).toArray();
    if (!parents.isEmpty()) {
        item.parentId = parents.first().toString();
    }
    return item;
}
