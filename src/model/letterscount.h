/*
 * letterscount.h — Book-wide letter statistics for reading progress
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_LETTERSCOUNT_H
#define TERMREADER_LETTERSCOUNT_H

#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

struct LettersCount {
    int all = 0;            // non-whitespace characters in the whole book
    QList<int> cumulative;  // letters of all chapters before each chapter
};

// Non-whitespace characters of a list of lines or paragraphs.
int countLetters(const QStringList &lines);

// chapters holds the HTML of each chapter in reading order. Every
// chapter is parsed without layout.
LettersCount countBookLetters(const QStringList &chapters);

// Fraction of the book read once rows [0, visibleEnd) of the chapter at
// contentIndex (laid out as lines) have been on screen. Empty when the
// book has no letters or contentIndex is out of range.
std::optional<qreal> readingProgress(const LettersCount &counts, int contentIndex,
                                     const QStringList &lines, int visibleEnd);

#endif // TERMREADER_LETTERSCOUNT_H
