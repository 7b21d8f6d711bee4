/*
 * spanremapper.cpp — Paragraph marks → wrapped-line spans
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "spanremapper.h"

using TextModel::CharPos;
using TextModel::TextMark;
using TextModel::TextSpan;

namespace SpanRemapper {

static int paragraphLength(const QStringList &paragraphs, int row)
{
    if (row < 0 || row >= paragraphs.size())
        return 0;
    return static_cast<int>(paragraphs[row].size());
}

QList<TextSpan> markToSpans(const QList<TextMark> &marks, const QStringList &paragraphs)
{
    QList<TextSpan> spans;

    for (const TextMark &mark : marks) {
        if (!mark.isValid())
            continue;

        const CharPos start = mark.start;
        const CharPos end = *mark.end;

        if (start.row == end.row) {
            spans.append(TextSpan{start, end.col - start.col});
            continue;
        }

        spans.append(TextSpan{start, paragraphLength(paragraphs, start.row) - start.col});
        for (int row = start.row + 1; row < end.row; ++row)
            spans.append(TextSpan{CharPos{row, 0}, paragraphLength(paragraphs, row)});
        spans.append(TextSpan{CharPos{end.row, 0}, end.col});
    }

    return spans;
}

QList<TextSpan> adjustWrappedSpans(const QStringList &wrappedLines, const TextSpan &span,
                                   int lineAdjustment, int leftAdjustment)
{
    QList<TextSpan> spans;

    const int start = span.start.col;
    const int end = start + span.nLetters;
    int prev = 0;

    for (int n = 0; n < wrappedLines.size(); ++n) {
        const int lineLength = static_cast<int>(wrappedLines[n].size()) + 1;
        const int current = prev + lineLength;
        const int row = lineAdjustment + n;

        const bool startsHere = start >= prev && start < current;
        const bool endsHere = end >= prev && end < current;

        if (startsHere && endsHere) {
            spans.append(TextSpan{CharPos{row, start - prev + leftAdjustment}, span.nLetters});
        } else if (startsHere) {
            spans.append(TextSpan{CharPos{row, start - prev + leftAdjustment}, current - start - 1});
        } else if (endsHere) {
            spans.append(TextSpan{CharPos{row, leftAdjustment}, end - prev + 1});
        } else if (prev >= start && prev < end && current >= start && current < end) {
            // Line lies entirely inside the span
            spans.append(TextSpan{CharPos{row, leftAdjustment}, lineLength - 1});
        } else if (prev > end) {
            break;
        }

        prev = current;
    }

    return spans;
}

QMap<int, QList<TextSpan>> groupSpansByRow(const QList<TextSpan> &spans)
{
    QMap<int, QList<TextSpan>> rows;
    for (const TextSpan &span : spans)
        rows[span.start.row].append(span);
    return rows;
}

} // namespace SpanRemapper
