/*
 * textmodel.h — Position, mark and span value types for laid-out text
 *
 * Defines the coordinates shared by the markup collector (paragraph space)
 * and the structured text builder (wrapped line space), plus the final
 * TextStructure handed to the pagination layer.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_TEXTMODEL_H
#define TERMREADER_TEXTMODEL_H

#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

namespace TextModel {

// --- Positions ---

// Character position inside an ordered sequence of lines.
//   {"Lorem ipsum dolor sit amet,",     // row 0
//    "consectetur adipiscing elit."}    // row 1
//        ^ CharPos{1, 3}
struct CharPos {
    int row = 0;
    int col = 0;

    bool operator==(const CharPos &o) const { return row == o.row && col == o.col; }
    bool operator!=(const CharPos &o) const { return !(*this == o); }
};

// Interval of marked text, inclusive on both sides, possibly spanning
// several rows. An unterminated tag (<i> without </i>) leaves end empty.
struct TextMark {
    CharPos start;
    std::optional<CharPos> end;

    bool isValid() const
    {
        if (!end)
            return false;
        if (start.row == end->row)
            return start.col <= end->col;
        return start.row < end->row;
    }

    bool operator==(const TextMark &o) const { return start == o.start && end == o.end; }
};

// Like TextMark but confined to the row of its start position.
struct TextSpan {
    CharPos start;
    int nLetters = 0;

    bool operator==(const TextSpan &o) const
    {
        return start == o.start && nLetters == o.nLetters;
    }
    bool operator!=(const TextSpan &o) const { return !(*this == o); }
};

// --- Styling ---

// Terminal attributes understood by the renderer.
enum class StyleAttr {
    Normal,
    Bold,
    Italic,
    Underline,
};

// Italic falls back to underline, then to no attribute at all, on
// terminals that lack the former.
StyleAttr italicAttribute(bool hasItalic, bool hasUnderline);

struct StyleAttributes {
    StyleAttr bold = StyleAttr::Bold;
    StyleAttr italic = StyleAttr::Italic;
};

struct InlineStyle {
    int row = 0;
    int col = 0;
    int nLetters = 0;
    StyleAttr attr = StyleAttr::Normal;

    bool operator==(const InlineStyle &o) const
    {
        return row == o.row && col == o.col && nLetters == o.nLetters && attr == o.attr;
    }
};

// --- Output ---

// How one chapter is displayed at one text width. Rebuilt, never patched,
// when the width or chapter changes.
struct TextStructure {
    QStringList textLines;
    QHash<int, QString> imageMaps;   // line number -> image path inside the book
    QHash<QString, int> sectionRows; // section id -> line number
    QList<InlineStyle> formatting;
};

// Concatenate two adjacent chapters laid out with consecutive starting
// lines. Keys of the maps are unique across chapters by construction.
TextStructure mergeTextStructures(const TextStructure &first,
                                  const TextStructure &second);

} // namespace TextModel

#endif // TERMREADER_TEXTMODEL_H
