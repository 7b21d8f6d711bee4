/*
 * htmllayout.h — HTML chapter → terminal text lines
 *
 * Public entry point of the layout core: tokenizes one chapter with
 * HtmlSaxReader, collects paragraphs with MarkupCollector and lays them out
 * with StructuredTextBuilder. Holds no state between calls.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_HTMLLAYOUT_H
#define TERMREADER_HTMLLAYOUT_H

#include <QSet>
#include <QString>
#include <QStringList>

#include <variant>

#include "textmodel.h"

namespace HtmlLayout {

struct Options {
    int textWidth = 0;         // 0: paragraphs only, no layout
    QSet<QString> sectionIds;  // anchors to report in sectionRows
    int startingLine = 0;
    TextModel::StyleAttributes attributes;
};

struct Result {
    bool valid = true;
    QString errorMessage;      // non-empty if invalid

    // Paragraphs in no-layout mode, the laid out chapter otherwise
    std::variant<QStringList, TextModel::TextStructure> content;

    bool hasLayout() const
    {
        return std::holds_alternative<TextModel::TextStructure>(content);
    }
    const QStringList &paragraphs() const { return std::get<QStringList>(content); }
    const TextModel::TextStructure &structure() const
    {
        return std::get<TextModel::TextStructure>(content);
    }
};

// Negative widths are rejected. Malformed markup never is.
Result parseHtml(const QString &html, const Options &options = {});

// Shorthand for the no-layout mode.
QStringList parseParagraphs(const QString &html);

} // namespace HtmlLayout

#endif // TERMREADER_HTMLLAYOUT_H
