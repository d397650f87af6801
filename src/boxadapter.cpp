/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "boxadapter.h"
#include "clouddrivedebug.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkRequest>
#include <QUrlQuery>

using namespace CloudDrive;

BoxAdapter::BoxAdapter(const QString &accessToken, const BoxSettings &settings)
    : m_accessToken(accessToken)
    , m_settings(settings)
{
}

QString BoxAdapter::name() const
{
    return QStringLiteral("Box");
}

ListingAdapter *BoxAdapter::listingAdapter()
{
    return this;
}

Error BoxAdapter::mapServerError(int httpStatus, const QByteArray &body, const QString &path) const
{
    Error error(Error::ProviderReportedError, QString(), httpStatus);
    error.path = path;

    const QJsonObject root = QJsonDocument::fromJson(body).object();
    error.errorMessage = root.value(QStringLiteral("message")).toString();
    if (error.errorMessage.isEmpty()) {
        error.errorMessage = QString::fromUtf8(body).trimmed();
    }
    return error;
}

std::optional<Request> BoxAdapter::buildListRequest(const QString &rootPath, const PageToken &cursor)
{
    QString folderId = rootPath.trimmed();
    folderId.remove(QLatin1Char('/'));
    if (folderId.isEmpty()) {
        folderId = QStringLiteral("0");
    }

    QUrl url = m_settings.apiUrl;
    url.setPath(url.path() + QStringLiteral("/folders/%1/items").arg(folderId));

    QUrlQuery query;
    query.addQueryItem(QStringLiteral("fields"), QStringLiteral("id,type,name,size,etag,sha1,created_at,modified_at,parent"));
    query.addQueryItem(QStringLiteral("limit"), QString::number(m_settings.pageSize));
    if (cursor) {
        query.addQueryItem(QStringLiteral("offset"), *cursor);
    }
    url.setQuery(query);

    QNetworkRequest networkRequest(url);
    networkRequest.setRawHeader("Authorization", "Bearer " + m_accessToken.toUtf8());

    Request request;
    request.request = networkRequest;
    request.path = folderId;
    return request;
}

PageResult<DriveItem> BoxAdapter::parseListResponse(const Response &response)
{
    PageResult<DriveItem> result;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(response.body, &parseError);
    const QJsonObject root = doc.object();
    if (parseError.error != QJsonParseError::NoError || !root.value(QStringLiteral("entries")).isArray()) {
        result.error = Error(Error::BadServerResponse, QStringLiteral("Box listing carries no entries array"), response.httpStatus);
        result.error.url = response.url;
        result.error.path = response.path;
        return result;
    }

    const QJsonArray entries = root.value(QStringLiteral("entries")).toArray();
    for (const QJsonValue &entry : entries) {
        const DriveItem item = parseItem(entry.toObject());
        if (item.id.isEmpty() || item.name.isEmpty()) {
            qCDebug(CLOUDDRIVE) << "Skipping Box entry without id or name";
            continue;
        }
        result.items.append(item);
    }

    // Box reports the offset of this page, not of the next one
    const qint64 offset = root.value(QStringLiteral("offset")).toVariant().toLongLong();
    const qint64 totalCount = root.value(QStringLiteral("total_count")).toVariant().toLongLong();
    const qint64 nextOffset = offset + entries.size();
    if (!entries.isEmpty() && nextOffset < totalCount) {
        result.nextToken = QString::number(nextOffset);
    }
    return result;
}

DriveItem BoxAdapter::parseItem(const QJsonObject &object)
{
    DriveItem item;
    item.id = object.value(QStringLiteral("id")).toString();
    item.name = object.value(QStringLiteral("name")).toString();
    item.isFolder = object.value(QStringLiteral("type")).toString() == QLatin1String("folder");
    item.size = object.contains(QStringLiteral("size")) ? object.value(QStringLiteral("size")).toVariant().toLongLong() : -1;
    item.etag = object.value(QStringLiteral("etag")).toString();
    item.hash = object.value(QStringLiteral("sha1")).toString();
    item.created = QDateTime::fromString(object.value(QStringLiteral("created_at")).toString(), Qt::ISODate);
    item.lastModified = QDateTime::fromString(object.value(QStringLiteral("modified_at")).toString(), Qt::ISODate);
    item.parentId = object.value(QStringLiteral("parent")).toObject().value(QStringLiteral("id")).toString();
    if (item.isFolder) {
        item.mimeType = QStringLiteral("inode/directory");
    }
    return item;
}
