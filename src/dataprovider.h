/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "clouddrivetypes.h"

namespace CloudDrive
{
/**
 * Serves parts of an in-memory buffer.
 */
DataProvider bufferDataProvider(const QByteArray &data);

/**
 * Serves parts of the local file at @p filePath. The file is opened for every
 * part, so it does not stay open between parts.
 */
DataProvider fileDataProvider(const QString &filePath);
}
