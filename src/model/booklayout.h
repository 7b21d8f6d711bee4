/*
 * booklayout.h — Seamless layout of a whole book
 *
 * Lays every chapter out at the same width into one continuous line
 * space, so that scrolling never stops at chapter boundaries. The table
 * of contents is rewritten to point into that single space.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_BOOKLAYOUT_H
#define TERMREADER_BOOKLAYOUT_H

#include <QList>
#include <QString>
#include <QStringList>

#include "textmodel.h"

namespace BookLayout {

struct TocEntry {
    QString label;
    int contentIndex = 0;
    QString section; // empty: start of the chapter

    bool operator==(const TocEntry &o) const
    {
        return label == o.label && contentIndex == o.contentIndex && section == o.section;
    }
};

struct Result {
    TextModel::TextStructure structure;
    QList<TocEntry> tocEntries; // all pointing at content index 0
    QList<int> linesPerContent; // line count of each chapter, in order
    bool valid = true;
    QString errorMessage;       // non-empty if invalid
};

// chapters holds the HTML of each chapter in reading order. textWidth
// must be positive.
Result layoutChapters(const QStringList &chapters, int textWidth,
                      const QList<TocEntry> &tocEntries,
                      const TextModel::StyleAttributes &attributes = {});

} // namespace BookLayout

#endif // TERMREADER_BOOKLAYOUT_H
