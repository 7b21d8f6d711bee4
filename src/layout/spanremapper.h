/*
 * spanremapper.h — Paragraph marks → wrapped-line spans
 *
 * Marks are recorded against unwrapped paragraphs. Once a paragraph has
 * been wrapped, its spans have to be translated into (line, column, count)
 * triples against the wrapped lines before they can become formatting.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_SPANREMAPPER_H
#define TERMREADER_SPANREMAPPER_H

#include <QList>
#include <QMap>
#include <QStringList>

#include "textmodel.h"

namespace SpanRemapper {

// Convert closed marks into per-paragraph spans. Marks without an end
// are skipped; a mark covering several paragraphs yields one span each.
QList<TextModel::TextSpan> markToSpans(const QList<TextModel::TextMark> &marks,
                                       const QStringList &paragraphs);

// Locate `span` (columns in the unwrapped paragraph) inside `wrappedLines`.
// Every wrapped line is assumed to have swallowed one separator character.
// Rows of the result are offset by `lineAdjustment`, and `leftAdjustment`
// is added to each column to account for a prefix the caller puts in
// front of every wrapped line.
QList<TextModel::TextSpan> adjustWrappedSpans(const QStringList &wrappedLines,
                                              const TextModel::TextSpan &span,
                                              int lineAdjustment = 0,
                                              int leftAdjustment = 0);

// Spans keyed by row, in input order within each row.
QMap<int, QList<TextModel::TextSpan>> groupSpansByRow(const QList<TextModel::TextSpan> &spans);

} // namespace SpanRemapper

#endif // TERMREADER_SPANREMAPPER_H
