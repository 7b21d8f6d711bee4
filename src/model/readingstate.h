/*
 * readingstate.h — Reading position and paging arithmetic
 *
 * A reading position is a row inside one chapter. In seamless mode the
 * whole book is a single line space (content index 0) and positions are
 * converted back and forth with the per-chapter line counts.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_READINGSTATE_H
#define TERMREADER_READINGSTATE_H

#include <QHash>
#include <QList>
#include <QString>

#include <optional>

#include "booklayout.h"

namespace Reading {

struct ReadingState {
    int contentIndex = 0;
    int textWidth = 0;
    int row = 0;
    std::optional<qreal> relativePercent; // fraction of the line space read
    QString section;                      // pending jump target, if any

    bool operator==(const ReadingState &o) const
    {
        return contentIndex == o.contentIndex && textWidth == o.textWidth && row == o.row
            && relativePercent == o.relativePercent && section == o.section;
    }
};

// Absolute (whole book) row -> chapter and row inside it. Rows past the
// end of the book land in the last chapter.
ReadingState toRelativeState(const ReadingState &absolute, const QList<int> &linesPerContent);

// Chapter row -> absolute row in the seamless line space.
ReadingState toAbsoluteState(const ReadingState &relative, const QList<int> &linesPerContent);

// Index of the TOC entry the reader is currently in: the last entry not
// in a later chapter whose section starts at or before row. Entries with
// an unknown section start at row 0.
int findCurrentTocIndex(const QList<BookLayout::TocEntry> &tocEntries,
                        const QHash<QString, int> &sectionRows,
                        int contentIndex, int row);

// First row of the page `count` pages back, never before the start.
int pageUp(int row, int windowHeight, int count = 1);
// First row of the page `count` pages on, never past the last full page.
int pageDown(int row, int totalLines, int windowHeight, int count = 1);
// First row of the last full page.
int pageEnd(int totalLines, int windowHeight);

} // namespace Reading

#endif // TERMREADER_READINGSTATE_H
