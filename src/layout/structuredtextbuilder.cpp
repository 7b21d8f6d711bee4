/*
 * structuredtextbuilder.cpp — Parsed chapter → wrapped TextStructure
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "structuredtextbuilder.h"
#include "spanremapper.h"
#include "textwrapper.h"

#include <QHash>
#include <QtGlobal>

#include <utility>

using Markup::ParagraphRole;
using Markup::ParsedChapter;
using TextModel::InlineStyle;
using TextModel::StyleAttr;
using TextModel::TextSpan;
using TextModel::TextStructure;

const QString StructuredTextBuilder::chapterEndMarker = QStringLiteral("***");

static const QString kIndent = QStringLiteral("   ");
static const QString kBullet = QStringLiteral(" - ");
static constexpr int kPrefixWidth = 3;

int StructuredTextBuilder::centerOffset(int length, int width)
{
    const int margin = width - length;
    if (margin <= 0)
        return 0;
    return margin / 2 + (margin & width & 1);
}

QString StructuredTextBuilder::center(const QString &text, int width)
{
    const int length = TextWrap::columnCount(text);
    const int margin = width - length;
    if (margin <= 0)
        return text;

    const int left = centerOffset(length, width);
    return QString(left, QLatin1Char(' ')) + text + QString(margin - left, QLatin1Char(' '));
}

int StructuredTextBuilder::innerWidth(int reserved) const
{
    return qMax(m_width - reserved, 1);
}

// Shrinks on pages too narrow for the full prefix plus one column
int StructuredTextBuilder::prefixWidth() const
{
    return qBound(0, m_width - 1, kPrefixWidth);
}

int StructuredTextBuilder::currentRow() const
{
    return m_startingLine + static_cast<int>(m_result.textLines.size());
}

void StructuredTextBuilder::appendStyledLine(const QString &line, StyleAttr attr)
{
    m_result.formatting.append(InlineStyle{currentRow(), 0, static_cast<int>(line.size()), attr});
    m_result.textLines.append(line);
}

TextStructure StructuredTextBuilder::build(const ParsedChapter &chapter, int textWidth,
                                           int startingLine,
                                           const TextModel::StyleAttributes &attributes)
{
    m_result = TextStructure{};
    m_attributes = attributes;
    m_width = qMax(textWidth, 1);
    m_startingLine = startingLine;

    const auto italicGroups = SpanRemapper::groupSpansByRow(
        SpanRemapper::markToSpans(chapter.italicMarks, chapter.paragraphs));
    const auto boldGroups = SpanRemapper::groupSpansByRow(
        SpanRemapper::markToSpans(chapter.boldMarks, chapter.paragraphs));

    QHash<int, QStringList> anchorsByParagraph;
    for (auto it = chapter.sections.cbegin(); it != chapter.sections.cend(); ++it)
        anchorsByParagraph[it.value()].append(it.key());

    for (int n = 0; n < chapter.paragraphs.size(); ++n) {
        const int blockStart = static_cast<int>(m_result.textLines.size());

        for (const QString &id : anchorsByParagraph.value(n))
            m_result.sectionRows.insert(id, m_startingLine + blockStart);

        const Block block = emitParagraph(n, chapter);

        remapSpans(italicGroups.value(n), block, blockStart, m_attributes.italic);
        remapSpans(boldGroups.value(n), block, blockStart, m_attributes.bold);
    }

    m_result.textLines.append(center(chapterEndMarker, m_width));

    TextStructure result = std::move(m_result);
    m_result = TextStructure{};
    return result;
}

StructuredTextBuilder::Block StructuredTextBuilder::emitParagraph(int paragraph,
                                                                  const ParsedChapter &chapter)
{
    const QString &text = chapter.paragraphs[paragraph];
    const int prefix = prefixWidth();
    const QString indent = kIndent.left(prefix);
    const QString bullet = kBullet.left(prefix);
    Block block;

    switch (chapter.roleOf(paragraph)) {
    case ParagraphRole::Heading:
        // Never wrapped, even when wider than the page
        block.wrapped = {text};
        block.leftAdjustment = centerOffset(TextWrap::columnCount(text), m_width);
        appendStyledLine(center(text, m_width), m_attributes.bold);
        break;

    case ParagraphRole::Indent:
        block.wrapped = TextWrap::wrap(text, innerWidth(prefix));
        block.leftAdjustment = prefix;
        for (const QString &line : std::as_const(block.wrapped))
            m_result.textLines.append(indent + line);
        break;

    case ParagraphRole::Bullet:
        block.wrapped = TextWrap::wrap(text, innerWidth(prefix));
        block.leftAdjustment = prefix;
        for (int i = 0; i < block.wrapped.size(); ++i)
            m_result.textLines.append((i == 0 ? bullet : indent) + block.wrapped[i]);
        break;

    case ParagraphRole::Preformatted:
        // Author line breaks survive, blank lines included
        for (const QString &sourceLine : TextWrap::splitLines(text)) {
            const QStringList pieces = TextWrap::wrap(sourceLine, innerWidth(prefix + kPrefixWidth));
            if (pieces.isEmpty()) {
                block.wrapped.append(QString());
                m_result.textLines.append(QString());
                continue;
            }
            for (const QString &piece : pieces) {
                block.wrapped.append(piece);
                m_result.textLines.append(indent + piece);
            }
        }
        block.leftAdjustment = prefix;
        break;

    case ParagraphRole::Image:
        m_result.imageMaps.insert(currentRow(), chapter.imagePaths.value(paragraph));
        block.wrapped = {text};
        block.leftAdjustment = centerOffset(TextWrap::columnCount(text), m_width);
        appendStyledLine(center(text, m_width), m_attributes.bold);
        break;

    case ParagraphRole::Plain:
        block.wrapped = TextWrap::wrap(text, m_width);
        m_result.textLines.append(block.wrapped);
        break;
    }

    // Paragraph separator
    block.wrapped.append(QString());
    m_result.textLines.append(QString());

    return block;
}

void StructuredTextBuilder::remapSpans(const QList<TextSpan> &spans, const Block &block,
                                       int blockStart, StyleAttr attr)
{
    for (const TextSpan &span : spans) {
        const QList<TextSpan> wrapped = SpanRemapper::adjustWrappedSpans(
            block.wrapped, span, blockStart, block.leftAdjustment);
        for (const TextSpan &piece : wrapped) {
            m_result.formatting.append(InlineStyle{m_startingLine + piece.start.row,
                                                   piece.start.col, piece.nLetters, attr});
        }
    }
}
