/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "clouddrivetypes.h"
#include "networkoperations.h"

#include <optional>

namespace CloudDrive
{
struct SessionResult {
    Error error;
    QString sessionHandle;
    qint64 partSize = 0;
};

/**
 * Outcome of one part upload. With no error set, exactly one of these holds:
 * completionId is set (upload done), continuationRange is set (server asks
 * for that range next), or neither (part accepted, continue locally).
 */
struct PartResult {
    Error error;
    QString completionId;
    std::optional<TransferRange> continuationRange;
    // Only honoured together with a continuation range
    std::optional<qint64> partSize;
};

class ListingAdapter
{
public:
    virtual ~ListingAdapter();

    /**
     * @return The request for the page at @p cursor below @p rootPath, or
     * nothing when no request can be built.
     */
    virtual std::optional<Request> buildListRequest(const QString &rootPath, const PageToken &cursor) = 0;

    virtual PageResult<DriveItem> parseListResponse(const Response &response) = 0;
};

class UploadAdapter
{
public:
    virtual ~UploadAdapter();

    virtual Request buildCreateSessionRequest(const QString &targetPath, qint64 totalSize, const UploadOptions &options) = 0;
    virtual SessionResult parseCreateSessionResponse(const Response &response) = 0;

    virtual Request buildPartRequest(const UploadTarget &target, const TransferRange &range, const QByteArray &data) = 0;
    virtual PartResult parsePartResponse(const Response &response, const UploadTarget &target) = 0;

    /**
     * Used for best-effort teardown of a cancelled session.
     */
    virtual Request buildCancelRequest(const QString &sessionHandle) = 0;
};

/**
 * The capabilities one remote service offers. A provider returns nullptr
 * for what it does not support.
 */
class ProviderAdapter
{
public:
    virtual ~ProviderAdapter();

    virtual QString name() const = 0;

    virtual ListingAdapter *listingAdapter()
    {
        return nullptr;
    }

    virtual UploadAdapter *uploadAdapter()
    {
        return nullptr;
    }

    /**
     * Maps an HTTP error status and its body to an Error.
     * The default reports the body text as a ProviderReportedError.
     */
    virtual Error mapServerError(int httpStatus, const QByteArray &body, const QString &path) const;

    ErrorMapper errorMapper() const;
};
}
