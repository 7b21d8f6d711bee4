/*
 * tagclassifier.cpp — Map HTML tag names to the handful of classes the
 * collector cares about
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tagclassifier.h"

#include <QHash>
#include <QString>

namespace Markup {

static const QHash<QString, TagClass> &tagTable()
{
    static const QHash<QString, TagClass> table = {
        {QStringLiteral("p"), TagClass::Paragraph},
        {QStringLiteral("div"), TagClass::Paragraph},
        {QStringLiteral("q"), TagClass::Indent},
        {QStringLiteral("dt"), TagClass::Indent},
        {QStringLiteral("dd"), TagClass::Indent},
        {QStringLiteral("blockquote"), TagClass::Indent},
        {QStringLiteral("pre"), TagClass::Preformatted},
        {QStringLiteral("li"), TagClass::Bullet},
        {QStringLiteral("script"), TagClass::Hidden},
        {QStringLiteral("style"), TagClass::Hidden},
        {QStringLiteral("head"), TagClass::Hidden},
        {QStringLiteral("sup"), TagClass::Superscript},
        {QStringLiteral("sub"), TagClass::Subscript},
        {QStringLiteral("img"), TagClass::Image},
        {QStringLiteral("image"), TagClass::Image},
        {QStringLiteral("i"), TagClass::Italic},
        {QStringLiteral("em"), TagClass::Italic},
        {QStringLiteral("b"), TagClass::Bold},
        {QStringLiteral("strong"), TagClass::Bold},
        {QStringLiteral("br"), TagClass::LineBreak},
    };
    return table;
}

TagClass classifyTag(QStringView name)
{
    const qsizetype colon = name.lastIndexOf(QLatin1Char(':'));
    if (colon >= 0)
        name = name.mid(colon + 1);

    const QString tag = name.toString().toLower();

    // h1 .. h6
    if (tag.size() == 2 && tag[0] == QLatin1Char('h')
        && tag[1] >= QLatin1Char('1') && tag[1] <= QLatin1Char('6'))
        return TagClass::Heading;

    return tagTable().value(tag, TagClass::Other);
}

} // namespace Markup
