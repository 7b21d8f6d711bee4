/*
 * htmllayout.cpp — HTML chapter → terminal text lines
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "htmllayout.h"
#include "htmlsaxreader.h"
#include "markupcollector.h"
#include "structuredtextbuilder.h"

namespace HtmlLayout {

static Markup::ParsedChapter collect(const QString &html, const QSet<QString> &sectionIds)
{
    Markup::MarkupCollector collector(sectionIds);
    Markup::HtmlSaxReader reader;

    if (!reader.parse(html, &collector)) {
        // Same as a document without content
        Markup::ParsedChapter empty;
        empty.paragraphs.append(QString());
        return empty;
    }
    return collector.finish();
}

Result parseHtml(const QString &html, const Options &options)
{
    Result result;

    if (options.textWidth < 0) {
        result.valid = false;
        result.errorMessage = QStringLiteral("Invalid text width: %1").arg(options.textWidth);
        return result;
    }

    const Markup::ParsedChapter chapter = collect(html, options.sectionIds);

    if (options.textWidth == 0) {
        result.content = chapter.paragraphs;
        return result;
    }

    StructuredTextBuilder builder;
    result.content = builder.build(chapter, options.textWidth, options.startingLine,
                                   options.attributes);
    return result;
}

QStringList parseParagraphs(const QString &html)
{
    return collect(html, {}).paragraphs;
}

} // namespace HtmlLayout
