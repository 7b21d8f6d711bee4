/*
 * htmlsaxreader.cpp — libxml2 HTML SAX tokenizer
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "htmlsaxreader.h"

#include <QByteArray>
#include <QDebug>

#include <cstring>

namespace Markup {

static QString fromXmlChar(const xmlChar *s)
{
    return QString::fromUtf8(reinterpret_cast<const char *>(s));
}

// Broken ebook markup is the norm; diagnostics go nowhere.
static void silentDiagnostic(void * /*ctx*/, const char * /*msg*/, ...)
{
}

bool HtmlSaxReader::parse(const QString &html, MarkupHandler *handler)
{
    m_handler = handler;
    m_pendingText.clear();

    htmlSAXHandler sax;
    std::memset(&sax, 0, sizeof(sax));
    sax.startElement = &HtmlSaxReader::sStartElement;
    sax.endElement = &HtmlSaxReader::sEndElement;
    sax.characters = &HtmlSaxReader::sCharacters;
    // script/style bodies arrive as CDATA; blanks between blocks as
    // ignorable whitespace. Both are plain text to the collector.
    sax.cdataBlock = &HtmlSaxReader::sCharacters;
    sax.ignorableWhitespace = &HtmlSaxReader::sCharacters;
    sax.warning = &silentDiagnostic;
    sax.error = &silentDiagnostic;
    sax.fatalError = &silentDiagnostic;

    htmlParserCtxtPtr ctxt = htmlCreatePushParserCtxt(
        &sax, this, nullptr, 0, nullptr, XML_CHAR_ENCODING_UTF8);
    if (!ctxt) {
        qWarning() << "HtmlSaxReader: failed to create libxml2 parser context";
        m_handler = nullptr;
        return false;
    }

    // The text was decoded before it reached us; a <meta charset> must
    // not switch the decoder again.
    htmlCtxtUseOptions(ctxt, HTML_PARSE_RECOVER | HTML_PARSE_NOERROR
                                 | HTML_PARSE_NOWARNING | HTML_PARSE_NONET
                                 | HTML_PARSE_IGNORE_ENC);

    const QByteArray utf8 = html.toUtf8();
    if (!utf8.isEmpty())
        htmlParseChunk(ctxt, utf8.constData(), static_cast<int>(utf8.size()), 0);
    htmlParseChunk(ctxt, nullptr, 0, 1);
    htmlFreeParserCtxt(ctxt);

    flushText();

    m_handler = nullptr;
    return true;
}

// --- libxml2 static callbacks ---

void HtmlSaxReader::sStartElement(void *ctx, const xmlChar *name, const xmlChar **atts)
{ static_cast<HtmlSaxReader *>(ctx)->startElement(name, atts); }
void HtmlSaxReader::sEndElement(void *ctx, const xmlChar *name)
{ static_cast<HtmlSaxReader *>(ctx)->endElement(name); }
void HtmlSaxReader::sCharacters(void *ctx, const xmlChar *ch, int len)
{ static_cast<HtmlSaxReader *>(ctx)->onCharacters(ch, len); }

// --- Instance handlers ---

void HtmlSaxReader::startElement(const xmlChar *name, const xmlChar **atts)
{
    flushText();

    Attributes attributes;
    if (atts) {
        // name/value pairs, NULL-terminated; a bare attribute has no value
        for (int i = 0; atts[i]; i += 2) {
            Attribute attr;
            attr.name = fromXmlChar(atts[i]).toLower();
            if (atts[i + 1])
                attr.value = fromXmlChar(atts[i + 1]);
            attributes.append(attr);
        }
    }

    m_handler->startTag(fromXmlChar(name).toLower(), attributes);
}

void HtmlSaxReader::endElement(const xmlChar *name)
{
    flushText();
    m_handler->endTag(fromXmlChar(name).toLower());
}

void HtmlSaxReader::onCharacters(const xmlChar *ch, int len)
{
    if (len <= 0)
        return;
    m_pendingText.append(reinterpret_cast<const char *>(ch), len);
}

void HtmlSaxReader::flushText()
{
    if (m_pendingText.isEmpty() || !m_handler)
        return;

    const QString text = QString::fromUtf8(m_pendingText);
    m_pendingText.clear();
    m_handler->characters(text);
}

} // namespace Markup
