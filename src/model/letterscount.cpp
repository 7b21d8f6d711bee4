/*
 * letterscount.cpp — Book-wide letter statistics for reading progress
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "letterscount.h"
#include "htmllayout.h"

#include <QtGlobal>

int countLetters(const QStringList &lines)
{
    int letters = 0;
    for (const QString &line : lines) {
        for (const QChar c : line) {
            if (!c.isSpace())
                ++letters;
        }
    }
    return letters;
}

LettersCount countBookLetters(const QStringList &chapters)
{
    LettersCount counts;
    for (const QString &html : chapters) {
        counts.cumulative.append(counts.all);
        counts.all += countLetters(HtmlLayout::parseParagraphs(html));
    }
    return counts;
}

std::optional<qreal> readingProgress(const LettersCount &counts, int contentIndex,
                                     const QStringList &lines, int visibleEnd)
{
    if (counts.all == 0 || contentIndex < 0 || contentIndex >= counts.cumulative.size())
        return std::nullopt;

    const int end = qBound(0, visibleEnd, static_cast<int>(lines.size()));
    const int read = counts.cumulative[contentIndex] + countLetters(lines.mid(0, end));
    return qreal(read) / counts.all;
}
