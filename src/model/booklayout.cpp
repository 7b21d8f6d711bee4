/*
 * booklayout.cpp — Seamless layout of a whole book
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "booklayout.h"
#include "htmllayout.h"

#include <QHash>
#include <QSet>
#include <QUuid>

namespace BookLayout {

Result layoutChapters(const QStringList &chapters, int textWidth,
                      const QList<TocEntry> &tocEntries,
                      const TextModel::StyleAttributes &attributes)
{
    Result result;

    if (textWidth <= 0) {
        result.valid = false;
        result.errorMessage = QStringLiteral("Invalid text width: %1").arg(textWidth);
        return result;
    }

    QSet<QString> sectionIds;
    for (const TocEntry &entry : tocEntries) {
        if (!entry.section.isEmpty())
            sectionIds.insert(entry.section);
    }

    // Chapter starts for TOC entries without an anchor of their own
    QHash<QString, int> generatedRows;
    int startingLine = 0;

    for (int n = 0; n < chapters.size(); ++n) {
        HtmlLayout::Options options;
        options.textWidth = textWidth;
        options.sectionIds = sectionIds;
        options.startingLine = startingLine;
        options.attributes = attributes;

        const HtmlLayout::Result chapter = HtmlLayout::parseHtml(chapters[n], options);
        if (!chapter.valid) {
            result.valid = false;
            result.errorMessage = chapter.errorMessage;
            return result;
        }

        const TextModel::TextStructure &structure = chapter.structure();
        const int lineCount = static_cast<int>(structure.textLines.size());
        result.linesPerContent.append(lineCount);

        for (const TocEntry &entry : tocEntries) {
            if (entry.contentIndex != n)
                continue;
            if (!entry.section.isEmpty()) {
                result.tocEntries.append(TocEntry{entry.label, 0, entry.section});
                continue;
            }
            const QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
            result.tocEntries.append(TocEntry{entry.label, 0, id});
            generatedRows.insert(id, startingLine);
        }

        result.structure = TextModel::mergeTextStructures(result.structure, structure);
        startingLine += lineCount;
    }

    for (auto it = generatedRows.cbegin(); it != generatedRows.cend(); ++it)
        result.structure.sectionRows.insert(it.key(), it.value());

    return result;
}

} // namespace BookLayout
