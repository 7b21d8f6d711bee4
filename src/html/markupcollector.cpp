/*
 * markupcollector.cpp — Markup events → logical paragraphs
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "markupcollector.h"
#include "tagclassifier.h"

#include <QUrl>

#include <utility>

using TextModel::CharPos;
using TextModel::TextMark;

namespace Markup {

const QString MarkupCollector::imagePlaceholder = QStringLiteral("[IMAGE]");

ParagraphRole ParsedChapter::roleOf(int paragraph) const
{
    if (headings.contains(paragraph))
        return ParagraphRole::Heading;
    if (indents.contains(paragraph))
        return ParagraphRole::Indent;
    if (bullets.contains(paragraph))
        return ParagraphRole::Bullet;
    if (preformatted.contains(paragraph))
        return ParagraphRole::Preformatted;
    if (images.contains(paragraph))
        return ParagraphRole::Image;
    return ParagraphRole::Plain;
}

static QString leftStripped(const QString &text)
{
    int i = 0;
    while (i < text.size() && text[i].isSpace())
        ++i;
    return text.mid(i);
}

// Every whitespace run becomes a single space.
static QString collapseWhitespace(const QString &text)
{
    QString result;
    result.reserve(text.size());
    bool inSpace = false;
    for (const QChar c : text) {
        if (c.isSpace()) {
            if (!inSpace)
                result.append(QLatin1Char(' '));
            inSpace = true;
        } else {
            result.append(c);
            inSpace = false;
        }
    }
    return result;
}

MarkupCollector::MarkupCollector(const QSet<QString> &sectionIds)
    : m_sectionIds(sectionIds)
{
}

CharPos MarkupCollector::currentPos() const
{
    return CharPos{currentIndex(), static_cast<int>(m_current.size())};
}

void MarkupCollector::newParagraph(const QString &initial)
{
    m_paragraphs.append(m_current);
    m_current = initial;
}

// --- Tag handlers ---

void MarkupCollector::startTag(const QString &name, const Attributes &attributes)
{
    switch (classifyTag(name)) {
    case TagClass::Heading:
        m_inHeading = true;
        break;
    case TagClass::Indent:
        m_inIndent = true;
        break;
    case TagClass::Preformatted:
        m_inPre = true;
        break;
    case TagClass::Bullet:
        m_inBullet = true;
        break;
    case TagClass::Hidden:
        ++m_hiddenDepth;
        break;
    case TagClass::Superscript:
        m_current += QLatin1String("^{");
        break;
    case TagClass::Subscript:
        m_current += QLatin1String("_{");
        break;
    case TagClass::Image:
        startImage(name, attributes);
        break;
    case TagClass::Italic:
        openMark(m_chapter.italicMarks);
        break;
    case TagClass::Bold:
        openMark(m_chapter.boldMarks);
        break;
    case TagClass::LineBreak:
        newParagraph();
        break;
    case TagClass::Paragraph:
    case TagClass::Other:
        break;
    }

    recordSection(attributes);
}

void MarkupCollector::endTag(const QString &name)
{
    switch (classifyTag(name)) {
    case TagClass::Heading:
        newParagraph();
        newParagraph();
        m_inHeading = false;
        break;
    case TagClass::Paragraph:
        newParagraph();
        break;
    case TagClass::Hidden:
        // <style> inside <head> must not reveal the rest of the head
        if (m_hiddenDepth > 0)
            --m_hiddenDepth;
        break;
    case TagClass::Indent:
        if (!m_current.isEmpty())
            newParagraph();
        m_inIndent = false;
        break;
    case TagClass::Preformatted:
        if (!m_current.isEmpty())
            newParagraph();
        m_inPre = false;
        break;
    case TagClass::Bullet:
        if (!m_current.isEmpty())
            newParagraph();
        m_inBullet = false;
        break;
    case TagClass::Superscript:
    case TagClass::Subscript:
        m_current += QLatin1Char('}');
        break;
    case TagClass::Image:
        // Close the placeholder block; images without a source left none
        if (m_inImage)
            newParagraph();
        m_inImage = false;
        break;
    case TagClass::Italic:
        closeMark(m_chapter.italicMarks);
        break;
    case TagClass::Bold:
        closeMark(m_chapter.boldMarks);
        break;
    case TagClass::LineBreak:
    case TagClass::Other:
        break;
    }
}

void MarkupCollector::characters(const QString &text)
{
    if (text.isEmpty() || m_hiddenDepth > 0)
        return;

    const QString raw = m_current.isEmpty() ? leftStripped(text) : text;
    m_current += m_inPre ? raw : collapseWhitespace(raw);

    const int index = currentIndex();
    if (m_inHeading)
        m_chapter.headings.insert(index);
    else if (m_inBullet)
        m_chapter.bullets.insert(index);
    else if (m_inIndent)
        m_chapter.indents.insert(index);
    else if (m_inPre)
        m_chapter.preformatted.insert(index);
}

ParsedChapter MarkupCollector::finish()
{
    m_paragraphs.append(m_current);
    m_current.clear();

    ParsedChapter chapter = std::move(m_chapter);
    chapter.paragraphs = std::move(m_paragraphs);

    m_chapter = ParsedChapter{};
    m_paragraphs.clear();
    m_inHeading = m_inIndent = m_inBullet = m_inPre = m_inImage = false;
    m_hiddenDepth = 0;

    return chapter;
}

// --- Helpers ---

// Only one open mark per kind: a nested <i> inside an open <i> is
// dropped until the outer one closes.
void MarkupCollector::openMark(QList<TextMark> &marks)
{
    if (!marks.isEmpty() && !marks.last().isValid())
        return;

    TextMark mark;
    mark.start = currentPos();
    marks.append(mark);
}

void MarkupCollector::closeMark(QList<TextMark> &marks)
{
    if (marks.isEmpty())
        return;
    marks.last().end = currentPos();
}

void MarkupCollector::startImage(const QString &name, const Attributes &attributes)
{
    // <img src=...> in HTML, <image xlink:href=...> inside SVG
    const bool isImg = !name.endsWith(QLatin1String("image"), Qt::CaseInsensitive);
    for (const Attribute &attr : attributes) {
        const bool matches = isImg ? attr.name == QLatin1String("src")
                                   : attr.name.endsWith(QLatin1String("href"));
        if (!matches)
            continue;

        newParagraph(imagePlaceholder);
        const int index = currentIndex();
        m_chapter.images.insert(index);
        m_chapter.imagePaths.insert(index, QUrl::fromPercentEncoding(attr.value.toUtf8()));
        m_inImage = true;
        break;
    }
}

void MarkupCollector::recordSection(const Attributes &attributes)
{
    if (m_sectionIds.isEmpty())
        return;

    for (const Attribute &attr : attributes) {
        if (attr.name == QLatin1String("id") && m_sectionIds.contains(attr.value))
            m_chapter.sections.insert(attr.value, currentIndex());
    }
}

} // namespace Markup
