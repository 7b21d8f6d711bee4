/*
 * structuredtextbuilder.h — Parsed chapter → wrapped TextStructure
 *
 * Lays the paragraphs of one chapter out at a fixed column width, one
 * role at a time (headings centered, quotes indented, list items
 * bulleted, preformatted text re-wrapped line by line, images replaced by
 * a centered placeholder), and carries section anchors, image locations
 * and italic/bold marks over to final line numbers.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_STRUCTUREDTEXTBUILDER_H
#define TERMREADER_STRUCTUREDTEXTBUILDER_H

#include <QString>
#include <QStringList>

#include "markupcollector.h"
#include "textmodel.h"

class StructuredTextBuilder
{
public:
    StructuredTextBuilder() = default;

    // textWidth must be positive; startingLine offsets every row of the
    // result (image lines, section rows, formatting) for concatenation.
    TextModel::TextStructure build(const Markup::ParsedChapter &chapter,
                                   int textWidth,
                                   int startingLine = 0,
                                   const TextModel::StyleAttributes &attributes = {});

    // Center text in width columns. Text as wide as the width or wider
    // is returned unchanged.
    static QString center(const QString &text, int width);
    static int centerOffset(int length, int width);

    static const QString chapterEndMarker;

private:
    // Lines of one paragraph before prefixing, plus the columns the
    // emitted lines are shifted by.
    struct Block {
        QStringList wrapped;
        int leftAdjustment = 0;
    };

    Block emitParagraph(int paragraph, const Markup::ParsedChapter &chapter);
    void remapSpans(const QList<TextModel::TextSpan> &spans, const Block &block,
                    int blockStart, TextModel::StyleAttr attr);

    int innerWidth(int reserved) const;
    int prefixWidth() const;
    int currentRow() const;
    void appendStyledLine(const QString &line, TextModel::StyleAttr attr);

    TextModel::TextStructure m_result;
    TextModel::StyleAttributes m_attributes;
    int m_width = 1;
    int m_startingLine = 0;
};

#endif // TERMREADER_STRUCTUREDTEXTBUILDER_H
