/*
 * textwrapper.h — Greedy monospace word wrapping
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_TEXTWRAPPER_H
#define TERMREADER_TEXTWRAPPER_H

#include <QString>
#include <QStringList>

namespace TextWrap {

// Terminal columns taken by text: one per code point, so a surrogate
// pair counts once.
int columnCount(const QString &text);

// Wrap a single paragraph into lines of at most `width` code points.
// Surrogate pairs are never split.
//
// Tabs expand to 8-column stops and every other whitespace character
// becomes a plain space. Whitespace is dropped at both ends of every
// line, except for leading whitespace of the first line. Words wider than
// a line are split, preferably after a hyphen. Hyphenated words
// ("well-known") may break after the hyphen.
//
// Returns an empty list for empty or all-blank text. A width below 1
// is treated as 1.
QStringList wrap(const QString &text, int width);

// Split on author line breaks (\n, \r\n, \r, \v, \f, U+2028 ...) without a
// trailing empty element for text ending in a break.
QStringList splitLines(const QString &text);

} // namespace TextWrap

#endif // TERMREADER_TEXTWRAPPER_H
