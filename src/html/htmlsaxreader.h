/*
 * htmlsaxreader.h — libxml2 HTML SAX tokenizer
 *
 * Feeds a chapter document to libxml2's tolerant HTML push parser and
 * forwards element and text events to a Markup::MarkupHandler. Broken
 * markup (unclosed tags, stray end tags, unknown elements) never stops
 * the event stream.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_HTMLSAXREADER_H
#define TERMREADER_HTMLSAXREADER_H

#include <QByteArray>
#include <QString>

#include <libxml/HTMLparser.h>

#include "markuphandler.h"

namespace Markup {

class HtmlSaxReader
{
public:
    HtmlSaxReader() = default;

    // Returns false only if libxml2 could not create a parser context;
    // the handler then received no events at all.
    bool parse(const QString &html, MarkupHandler *handler);

private:
    // libxml2 static callbacks
    static void sStartElement(void *ctx, const xmlChar *name, const xmlChar **atts);
    static void sEndElement(void *ctx, const xmlChar *name);
    static void sCharacters(void *ctx, const xmlChar *ch, int len);

    // Instance handlers
    void startElement(const xmlChar *name, const xmlChar **atts);
    void endElement(const xmlChar *name);
    void onCharacters(const xmlChar *ch, int len);

    // libxml2 may split one text run over several callbacks
    void flushText();

    MarkupHandler *m_handler = nullptr;
    QByteArray m_pendingText; // UTF-8
};

} // namespace Markup

#endif // TERMREADER_HTMLSAXREADER_H
