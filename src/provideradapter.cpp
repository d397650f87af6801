/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "provideradapter.h"

using namespace CloudDrive;

ListingAdapter::~ListingAdapter() = default;

UploadAdapter::~UploadAdapter() = default;

ProviderAdapter::~ProviderAdapter() = default;

Error ProviderAdapter::mapServerError(int httpStatus, const QByteArray &body, const QString &path) const
{
    Error error(Error::ProviderReportedError, QString::fromUtf8(body).trimmed(), httpStatus);
    error.path = path;
    return error;
}

ErrorMapper ProviderAdapter::errorMapper() const
{
    return [this](int httpStatus, const QByteArray &body, const QString &path) {
        return mapServerError(httpStatus, body, path);
    };
}
