/*
 * resourcepath.h — Resolve resource references inside a book
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_RESOURCEPATH_H
#define TERMREADER_RESOURCEPATH_H

#include <QString>

// Resolve a reference found in a chapter (an image src, a link target)
// against the chapter's own path inside the book:
//   "/aaa/bbb/book.html" + "../ccc.png" -> "/aaa/ccc.png"
// The last segment of currentDocumentPath is the document itself, not a
// directory. Relative bases stay relative; absolute references are only
// normalized.
QString resolveResourcePath(const QString &currentDocumentPath, const QString &relativePath);

#endif // TERMREADER_RESOURCEPATH_H
