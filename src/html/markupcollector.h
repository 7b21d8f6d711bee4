/*
 * markupcollector.h — Markup events → logical paragraphs
 *
 * Linearizes the tag/text event stream of one chapter into paragraph
 * strings, classifies each paragraph's role (heading, indented block,
 * list item, preformatted, image placeholder) and records italic/bold
 * marks, image locations and section anchors in paragraph coordinates.
 *
 * One collector serves exactly one parse; finish() hands the result over.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_MARKUPCOLLECTOR_H
#define TERMREADER_MARKUPCOLLECTOR_H

#include <QHash>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>

#include "markuphandler.h"
#include "textmodel.h"

namespace Markup {

// Layout role of a paragraph, in the order the builder checks them.
enum class ParagraphRole {
    Heading,
    Indent,
    Bullet,
    Preformatted,
    Image,
    Plain,
};

struct ParsedChapter {
    QStringList paragraphs;

    // Role sets, keyed by paragraph index
    QSet<int> headings;
    QSet<int> indents;
    QSet<int> bullets;
    QSet<int> preformatted;
    QSet<int> images;

    QList<TextModel::TextMark> italicMarks;
    QList<TextModel::TextMark> boldMarks;

    QHash<int, QString> imagePaths; // paragraph index -> image path
    QHash<QString, int> sections;   // section id -> paragraph index

    // First matching role wins.
    ParagraphRole roleOf(int paragraph) const;
};

class MarkupCollector : public MarkupHandler
{
public:
    explicit MarkupCollector(const QSet<QString> &sectionIds = {});

    void startTag(const QString &name, const Attributes &attributes) override;
    void endTag(const QString &name) override;
    void characters(const QString &text) override;

    // Flushes the current paragraph and moves the collected state out.
    ParsedChapter finish();

    static const QString imagePlaceholder;

private:
    int currentIndex() const { return static_cast<int>(m_paragraphs.size()); }
    TextModel::CharPos currentPos() const;
    void newParagraph(const QString &initial = QString());

    void openMark(QList<TextModel::TextMark> &marks);
    void closeMark(QList<TextModel::TextMark> &marks);
    void startImage(const QString &name, const Attributes &attributes);
    void recordSection(const Attributes &attributes);

    QSet<QString> m_sectionIds;

    // Finished paragraphs plus the one still being filled
    QStringList m_paragraphs;
    QString m_current;

    ParsedChapter m_chapter;

    bool m_inHeading = false;
    bool m_inIndent = false;
    bool m_inBullet = false;
    bool m_inPre = false;
    bool m_inImage = false;
    int m_hiddenDepth = 0; // open script/style/head elements
};

} // namespace Markup

#endif // TERMREADER_MARKUPCOLLECTOR_H
