/*
 * SPDX-FileCopyrightText: 2024 KDE Contributors
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "onedriveadapter.h"
#include "clouddrivedebug.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkRequest>
#include <QUrlQuery>

using namespace CloudDrive;

namespace
{
const QString SelectFields = QStringLiteral("id,name,size,parentReference,folder,file,eTag,createdDateTime,lastModifiedDateTime,@microsoft.graph.downloadUrl");

QString cleanPath(const QString &path)
{
    QString cleaned = path.trimmed();
    while (cleaned.startsWith(QLatin1Char('/'))) {
        cleaned.remove(0, 1);
    }
    while (cleaned.endsWith(QLatin1Char('/'))) {
        cleaned.chop(1);
    }
    return cleaned;
}

Error badResponse(const Response &response, const QString &message)
{
    Error error(Error::BadServerResponse, message, response.httpStatus);
    error.url = response.url;
    error.path = response.path;
    return error;
}

QJsonObject parseObject(const Response &response, bool *ok)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(response.body, &parseError);
    *ok = parseError.error == QJsonParseError::NoError && doc.isObject();
    return doc.object();
}
} // namespace

OneDriveAdapter::OneDriveAdapter(const QString &accessToken, const OneDriveSettings &settings)
    : m_accessToken(accessToken)
    , m_settings(settings)
{
}

QString OneDriveAdapter::name() const
{
    return QStringLiteral("OneDrive");
}

ListingAdapter *OneDriveAdapter::listingAdapter()
{
    return this;
}

UploadAdapter *OneDriveAdapter::uploadAdapter()
{
    return this;
}

Error OneDriveAdapter::mapServerError(int httpStatus, const QByteArray &body, const QString &path) const
{
    Error error(Error::ProviderReportedError, QString(), httpStatus);
    error.path = path;

    const QJsonObject errorObj = QJsonDocument::fromJson(body).object().value(QStringLiteral("error")).toObject();
    const QString code = errorObj.value(QStringLiteral("code")).toString();
    const QString message = errorObj.value(QStringLiteral("message")).toString();
    if (!message.isEmpty()) {
        error.errorMessage = code.isEmpty() ? message : QStringLiteral("%1: %2").arg(code, message);
    } else {
        error.errorMessage = QString::fromUtf8(body).trimmed();
    }
    return error;
}

std::optional<Request> OneDriveAdapter::buildListRequest(const QString &rootPath, const PageToken &cursor)
{
    QUrl url;
    if (cursor) {
        url = QUrl(*cursor);
        if (!url.isValid() || url.isRelative()) {
            qCWarning(CLOUDDRIVE) << "Graph nextLink is not a usable URL:" << *cursor;
            return std::nullopt;
        }
    } else {
        url = itemPathUrl(rootPath, QStringLiteral("children"));

        QUrlQuery query;
        query.addQueryItem(QStringLiteral("$top"), QString::number(m_settings.pageSize));
        query.addQueryItem(QStringLiteral("$select"), SelectFields);
        url.setQuery(query);
    }

    Request request;
    request.request = buildRequest(url);
    request.path = rootPath;
    return request;
}

PageResult<DriveItem> OneDriveAdapter::parseListResponse(const Response &response)
{
    PageResult<DriveItem> result;

    bool ok = false;
    const QJsonObject root = parseObject(response, &ok);
    if (!ok || !root.value(QStringLiteral("value")).isArray()) {
        result.error = badResponse(response, QStringLiteral("Graph listing carries no value array"));
        return result;
    }

    const QJsonArray values = root.value(QStringLiteral("value")).toArray();
    for (const QJsonValue &value : values) {
        result.items.append(parseItem(value.toObject()));
    }

    const QString nextLink = root.value(QStringLiteral("@odata.nextLink")).toString();
    if (!nextLink.isEmpty()) {
        result.nextToken = nextLink;
    }
    return result;
}

Request OneDriveAdapter::buildCreateSessionRequest(const QString &targetPath, qint64 totalSize, const UploadOptions &options)
{
    Q_UNUSED(totalSize)

    QJsonObject item;
    item.insert(QStringLiteral("@microsoft.graph.conflictBehavior"), options.overwrite ? QStringLiteral("replace") : QStringLiteral("fail"));
    QJsonObject payload;
    payload.insert(QStringLiteral("item"), item);

    Request request;
    request.verb = QByteArrayLiteral("POST");
    request.request = buildRequest(itemPathUrl(targetPath, QStringLiteral("createUploadSession")));
    request.body = QJsonDocument(payload).toJson(QJsonDocument::Compact);
    request.path = targetPath;
    return request;
}

SessionResult OneDriveAdapter::parseCreateSessionResponse(const Response &response)
{
    SessionResult result;

    bool ok = false;
    const QJsonObject root = parseObject(response, &ok);
    const QString uploadUrl = root.value(QStringLiteral("uploadUrl")).toString();
    if (!ok || uploadUrl.isEmpty()) {
        result.error = badResponse(response, QStringLiteral("Graph upload session carries no uploadUrl"));
        return result;
    }

    // Graph lets the client pick the fragment size
    result.sessionHandle = uploadUrl;
    result.partSize = fragmentSize();
    return result;
}

Request OneDriveAdapter::buildPartRequest(const UploadTarget &target, const TransferRange &range, const QByteArray &data)
{
    // The upload URL is pre-authenticated; Graph rejects an Authorization header on it.
    QNetworkRequest networkRequest{QUrl(target.sessionHandle)};
    networkRequest.setAttribute(QNetworkRequest::Http2AllowedAttribute, false);
    networkRequest.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/octet-stream"));
    networkRequest.setHeader(QNetworkRequest::ContentLengthHeader, data.size());
    networkRequest.setRawHeader(QByteArrayLiteral("Content-Range"), range.toContentRange(target.totalSize));

    Request request;
    request.verb = QByteArrayLiteral("PUT");
    request.request = networkRequest;
    request.body = data;
    return request;
}

PartResult OneDriveAdapter::parsePartResponse(const Response &response, const UploadTarget &target)
{
    PartResult result;

    bool ok = false;
    const QJsonObject root = parseObject(response, &ok);
    if (!ok) {
        result.error = badResponse(response, QStringLiteral("Graph returned an unparseable upload fragment response"));
        return result;
    }

    if (response.httpStatus == 200 || response.httpStatus == 201) {
        const QString id = root.value(QStringLiteral("id")).toString();
        if (id.isEmpty()) {
            result.error = badResponse(response, QStringLiteral("Graph finished the upload without returning the item"));
            return result;
        }
        result.completionId = id;
        return result;
    }

    const QJsonArray ranges = root.value(QStringLiteral("nextExpectedRanges")).toArray();
    if (ranges.isEmpty()) {
        return result;
    }

    const QString firstRange = ranges.first().toString();
    result.continuationRange = parseExpectedRange(firstRange, target);
    if (!result.continuationRange) {
        result.error = badResponse(response, QStringLiteral("Graph sent the malformed expected range \"%1\"").arg(firstRange));
    }
    return result;
}

Request OneDriveAdapter::buildCancelRequest(const QString &sessionHandle)
{
    Request request;
    request.verb = QByteArrayLiteral("DELETE");
    request.request = QNetworkRequest(QUrl(sessionHandle));
    return request;
}

void OneDriveAdapter::setAccessToken(const QString &accessToken)
{
    m_accessToken = accessToken;
}

qint64 OneDriveAdapter::fragmentSize() const
{
    return qMax(FragmentGranularity, m_settings.fragmentSize - m_settings.fragmentSize % FragmentGranularity);
}

std::optional<TransferRange> OneDriveAdapter::parseExpectedRange(const QString &text, const UploadTarget &target)
{
    const qsizetype separator = text.indexOf(QLatin1Char('-'));
    if (separator <= 0) {
        return std::nullopt;
    }

    bool ok = false;
    const qint64 lower = text.left(separator).toLongLong(&ok);
    if (!ok || lower < 0 || lower >= target.totalSize) {
        return std::nullopt;
    }

    qint64 upper = lower + target.partSize;
    const QString upperText = text.mid(separator + 1);
    if (!upperText.isEmpty()) {
        const qint64 last = upperText.toLongLong(&ok);
        if (!ok || last < lower) {
            return std::nullopt;
        }
        upper = qMin(upper, last + 1);
    }

    return TransferRange{lower, qMin(upper, target.totalSize)};
}

DriveItem OneDriveAdapter::parseItem(const QJsonObject &object)
{
    DriveItem item;
    item.id = object.value(QStringLiteral("id")).toString();
    item.name = object.value(QStringLiteral("name")).toString();
    item.size = static_cast<qint64>(object.value(QStringLiteral("size")).toDouble(-1));
    item.etag = object.value(QStringLiteral("eTag")).toString();
    item.lastModified = QDateTime::fromString(object.value(QStringLiteral("lastModifiedDateTime")).toString(), Qt::ISODate);
    item.created = QDateTime::fromString(object.value(QStringLiteral("createdDateTime")).toString(), Qt::ISODate);
    item.isFolder = object.contains(QStringLiteral("folder"));
    item.downloadUrl = object.value(QStringLiteral("@microsoft.graph.downloadUrl")).toString();

    const QJsonObject parent = object.value(QStringLiteral("parentReference")).toObject();
    item.parentId = parent.value(QStringLiteral("id")).toString();
    item.driveId = parent.value(QStringLiteral("driveId")).toString();

    const QJsonObject fileObj = object.value(QStringLiteral("file")).toObject();
    if (!fileObj.isEmpty()) {
        item.mimeType = fileObj.value(QStringLiteral("mimeType")).toString();
        const QJsonObject hashes = fileObj.value(QStringLiteral("hashes")).toObject();
        item.hash = hashes.value(QStringLiteral("sha1Hash")).toString();
        if (item.hash.isEmpty()) {
            item.hash = hashes.value(QStringLiteral("quickXorHash")).toString();
        }
    } else if (item.isFolder) {
        item.mimeType = QStringLiteral("inode/directory");
    }

    return item;
}

QNetworkRequest OneDriveAdapter::buildRequest(const QUrl &url) const
{
    QNetworkRequest request(url);
    // Microsoft Graph occasionally breaks newer HTTP/2 sessions, so stick to HTTP/1.1.
    request.setAttribute(QNetworkRequest::Http2AllowedAttribute, false);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setRawHeader("Authorization", "Bearer " + m_accessToken.toUtf8());
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    return request;
}

QUrl OneDriveAdapter::itemPathUrl(const QString &relativePath, const QString &suffix) const
{
    QUrl url = m_settings.apiUrl;
    const QString cleanedPath = cleanPath(relativePath);
    if (cleanedPath.isEmpty()) {
        url.setPath(QStringLiteral("/v1.0/me/drive/root/%1").arg(suffix));
    } else {
        url.setPath(QStringLiteral("/v1.0/me/drive/root:/%1:/%2").arg(cleanedPath, suffix), QUrl::DecodedMode);
    }
    return url;
}
