/*
 * resourcepath.cpp — Resolve resource references inside a book
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "resourcepath.h"

#include <QDir>
#include <QFileInfo>

QString resolveResourcePath(const QString &currentDocumentPath, const QString &relativePath)
{
    if (relativePath.isEmpty())
        return currentDocumentPath;
    if (!QFileInfo(relativePath).isRelative())
        return QDir::cleanPath(relativePath);

    const int slash = currentDocumentPath.lastIndexOf(QLatin1Char('/'));
    if (slash < 0)
        return QDir::cleanPath(relativePath);

    const QString baseDir = currentDocumentPath.left(slash + 1);
    return QDir::cleanPath(baseDir + relativePath);
}
