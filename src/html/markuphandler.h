/*
 * markuphandler.h — Receiver interface for tokenized markup events
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_MARKUPHANDLER_H
#define TERMREADER_MARKUPHANDLER_H

#include <QList>
#include <QString>

namespace Markup {

struct Attribute {
    QString name;  // lower-cased, prefix kept ("xlink:href")
    QString value; // entities already decoded
};

using Attributes = QList<Attribute>;

class MarkupHandler
{
public:
    virtual ~MarkupHandler() = default;

    virtual void startTag(const QString &name, const Attributes &attributes) = 0;
    virtual void endTag(const QString &name) = 0;
    // One call per uninterrupted text run between two tags.
    virtual void characters(const QString &text) = 0;
};

} // namespace Markup

#endif // TERMREADER_MARKUPHANDLER_H
