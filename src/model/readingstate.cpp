/*
 * readingstate.cpp — Reading position and paging arithmetic
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "readingstate.h"

#include <QtGlobal>

namespace Reading {

static int totalLines(const QList<int> &linesPerContent)
{
    int total = 0;
    for (int lines : linesPerContent)
        total += lines;
    return total;
}

ReadingState toRelativeState(const ReadingState &absolute, const QList<int> &linesPerContent)
{
    ReadingState relative = absolute;
    if (linesPerContent.isEmpty())
        return relative;

    const int total = totalLines(linesPerContent);

    int index = 0;
    int before = 0; // lines of the chapters preceding index
    while (index < linesPerContent.size() - 1 && before + linesPerContent[index] <= absolute.row) {
        before += linesPerContent[index];
        ++index;
    }

    relative.contentIndex = index;
    relative.row = absolute.row - before;
    if (absolute.relativePercent && total > 0)
        relative.relativePercent = *absolute.relativePercent - qreal(before) / total;

    return relative;
}

ReadingState toAbsoluteState(const ReadingState &relative, const QList<int> &linesPerContent)
{
    ReadingState absolute = relative;

    int before = 0;
    const int chapters = qMin(relative.contentIndex, static_cast<int>(linesPerContent.size()));
    for (int i = 0; i < chapters; ++i)
        before += linesPerContent[i];

    absolute.contentIndex = 0;
    absolute.row = relative.row + before;

    const int total = totalLines(linesPerContent);
    if (relative.relativePercent && total > 0)
        absolute.relativePercent = qreal(absolute.row) / total;
    else
        absolute.relativePercent.reset();

    return absolute;
}

int findCurrentTocIndex(const QList<BookLayout::TocEntry> &tocEntries,
                        const QHash<QString, int> &sectionRows,
                        int contentIndex, int row)
{
    int current = 0;
    for (int n = 0; n < tocEntries.size(); ++n) {
        const BookLayout::TocEntry &entry = tocEntries[n];
        if (entry.contentIndex <= contentIndex && row >= sectionRows.value(entry.section, 0))
            current = n;
    }
    return current;
}

int pageUp(int row, int windowHeight, int count)
{
    const int distance = windowHeight * count;
    return row >= distance ? row - distance : 0;
}

int pageDown(int row, int totalLines, int windowHeight, int count)
{
    const int distance = windowHeight * count;
    if (row + distance <= totalLines - windowHeight)
        return row + distance;
    return pageEnd(totalLines, windowHeight);
}

int pageEnd(int totalLines, int windowHeight)
{
    return qMax(totalLines - windowHeight, 0);
}

} // namespace Reading
